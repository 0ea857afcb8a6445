#ifndef DSC_ORACLE_HPP
#define DSC_ORACLE_HPP

#include <map>
#include <memory>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Round Data (Chainlink AggregatorV3 layout)
// =============================================================================

struct RoundData {
    uint64_t round_id;
    I256 answer;                 // Price scaled by the feed's decimals()
    uint64_t started_at;
    uint64_t updated_at;
    uint64_t answered_in_round;
};

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual const Address& address() const = 0;
    virtual uint8_t decimals() const = 0;
    virtual std::string description() const = 0;

    virtual RoundData latest_round_data() const = 0;
};

// Settable feed for tests, local deployments and the CLI
class MockV3Aggregator : public IPriceFeed {
public:
    MockV3Aggregator(const Address& address, uint8_t decimals, const I256& initial_answer,
                     Clock clock = {});

    const Address& address() const override { return address_; }
    uint8_t decimals() const override { return decimals_; }
    std::string description() const override { return "v0.6/tests/MockV3Aggregator.sol"; }

    RoundData latest_round_data() const override { return latest_; }

    // New round stamped with the clock's current time
    void update_answer(const I256& answer);

    // Full control over the round, for staleness tests
    void update_round_data(uint64_t round_id, const I256& answer,
                           uint64_t timestamp, uint64_t started_at);

private:
    Address address_;
    uint8_t decimals_;
    Clock clock_;
    RoundData latest_{};
};

// =============================================================================
// DSCOracle - normalizes feed readings into 18-decimal USD prices
//
// usd_value = price * ADDITIONAL_FEED_PRECISION * amount / PRECISION
// token_amount_from_usd = usd * PRECISION / (price * ADDITIONAL_FEED_PRECISION)
//
// Every read goes through the staleness check: rounds older than
// max_staleness seconds, unanswered rounds and non-positive answers are
// rejected.
// =============================================================================

class DSCOracle {
public:
    explicit DSCOracle(uint64_t max_staleness = constants::ORACLE_TIMEOUT, Clock clock = {});
    ~DSCOracle() = default;

    // Non-copyable
    DSCOracle(const DSCOracle&) = delete;
    DSCOracle& operator=(const DSCOracle&) = delete;

    // =========================================================================
    // Feed Registry (populated once at engine construction)
    // =========================================================================

    void register_feed(const Address& token, std::shared_ptr<IPriceFeed> feed);
    bool has_feed(const Address& token) const;
    std::shared_ptr<IPriceFeed> feed(const Address& token) const;

    // =========================================================================
    // Price Queries
    // =========================================================================

    // Latest round after the staleness check
    RoundData stale_checked_latest_round_data(const IPriceFeed& feed) const;

    // Feed answer scaled to 18 decimals; never zero
    U256 price(const Address& token) const;

    U256 usd_value(const Address& token, const U256& amount) const;
    U256 token_amount_from_usd(const Address& token, const U256& usd_amount_in_wei) const;

    uint64_t max_staleness() const { return max_staleness_; }

private:
    std::map<Address, std::shared_ptr<IPriceFeed>> feeds_;
    uint64_t max_staleness_;
    Clock clock_;

    const IPriceFeed& require_feed(const Address& token) const;
};

} // namespace dsc

#endif // DSC_ORACLE_HPP
