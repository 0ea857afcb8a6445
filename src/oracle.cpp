// =============================================================================
// oracle.cpp - Price Feed Normalization and Staleness Checks
// =============================================================================

#include "dsc/oracle.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"

namespace dsc {

// =============================================================================
// MockV3Aggregator
// =============================================================================

MockV3Aggregator::MockV3Aggregator(const Address& address, uint8_t decimals,
                                   const I256& initial_answer, Clock clock)
    : address_(address),
      decimals_(decimals),
      clock_(clock ? std::move(clock) : Clock(system_clock_seconds)) {
    update_answer(initial_answer);
}

void MockV3Aggregator::update_answer(const I256& answer) {
    uint64_t now = clock_();
    latest_.round_id += 1;
    latest_.answer = answer;
    latest_.started_at = now;
    latest_.updated_at = now;
    latest_.answered_in_round = latest_.round_id;
}

void MockV3Aggregator::update_round_data(uint64_t round_id, const I256& answer,
                                         uint64_t timestamp, uint64_t started_at) {
    latest_.round_id = round_id;
    latest_.answer = answer;
    latest_.started_at = started_at;
    latest_.updated_at = timestamp;
    latest_.answered_in_round = round_id;
}

// =============================================================================
// DSCOracle
// =============================================================================

DSCOracle::DSCOracle(uint64_t max_staleness, Clock clock)
    : max_staleness_(max_staleness),
      clock_(clock ? std::move(clock) : Clock(system_clock_seconds)) {}

void DSCOracle::register_feed(const Address& token, std::shared_ptr<IPriceFeed> feed) {
    if (!feed) {
        throw InvalidInputError("DSCOracle: null price feed for " + addresses::to_hex(token),
                                errors::INVALID_ADDRESS);
    }
    feeds_[token] = std::move(feed);
}

bool DSCOracle::has_feed(const Address& token) const {
    return feeds_.find(token) != feeds_.end();
}

std::shared_ptr<IPriceFeed> DSCOracle::feed(const Address& token) const {
    auto it = feeds_.find(token);
    return (it != feeds_.end()) ? it->second : nullptr;
}

const IPriceFeed& DSCOracle::require_feed(const Address& token) const {
    auto it = feeds_.find(token);
    if (it == feeds_.end()) {
        throw UnregisteredAssetError(token);
    }
    return *it->second;
}

RoundData DSCOracle::stale_checked_latest_round_data(const IPriceFeed& feed) const {
    RoundData round = feed.latest_round_data();

    uint64_t now = clock_();
    if (round.updated_at == 0 || round.answered_in_round < round.round_id) {
        throw StalePriceError(round.updated_at, now);
    }
    // A round stamped in the future is not stale
    if (now > round.updated_at && now - round.updated_at > max_staleness_) {
        throw StalePriceError(round.updated_at, now);
    }
    return round;
}

U256 DSCOracle::price(const Address& token) const {
    const IPriceFeed& source = require_feed(token);

    if (source.decimals() != constants::FEED_DECIMALS) {
        throw InvalidPriceError("DSCOracle: unsupported feed precision " +
                                std::to_string(source.decimals()) + " for " +
                                addresses::to_hex(token));
    }

    RoundData round = stale_checked_latest_round_data(source);
    if (round.answer <= 0) {
        throw InvalidPriceError("DSCOracle: non-positive price " + round.answer.str() +
                                " for " + addresses::to_hex(token));
    }

    return x18::mul(U256(round.answer), constants::ADDITIONAL_FEED_PRECISION);
}

U256 DSCOracle::usd_value(const Address& token, const U256& amount) const {
    return x18::mul_div(price(token), amount, constants::PRECISION);
}

U256 DSCOracle::token_amount_from_usd(const Address& token, const U256& usd_amount_in_wei) const {
    return x18::mul_div(usd_amount_in_wei, constants::PRECISION, price(token));
}

} // namespace dsc
