// =============================================================================
// engine.cpp - DSCEngine Facade
// =============================================================================

#include "dsc/engine.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"
#include "dsc/log.hpp"

#include <fmt/format.h>

#include <exception>
#include <set>
#include <string>
#include <type_traits>

namespace dsc {

namespace {

std::vector<Address> validated_assets(const std::vector<std::shared_ptr<IERC20>>& tokens,
                                      const std::vector<std::shared_ptr<IPriceFeed>>& feeds,
                                      const std::shared_ptr<IStableToken>& dsc) {
    if (tokens.size() != feeds.size()) {
        throw LengthMismatchError(tokens.size(), feeds.size());
    }
    if (!dsc) {
        throw InvalidInputError("DSCEngine: null stable token", errors::INVALID_ADDRESS);
    }

    std::vector<Address> assets;
    std::set<Address> seen;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i] || addresses::is_zero(tokens[i]->address())) {
            throw InvalidInputError("DSCEngine: zero collateral token address",
                                    errors::INVALID_ADDRESS);
        }
        if (!feeds[i]) {
            throw InvalidInputError("DSCEngine: null price feed for " +
                                    addresses::to_hex(tokens[i]->address()),
                                    errors::INVALID_ADDRESS);
        }
        if (!seen.insert(tokens[i]->address()).second) {
            throw InvalidInputError("DSCEngine: duplicate collateral token " +
                                    addresses::to_hex(tokens[i]->address()),
                                    errors::INVALID_ADDRESS);
        }
        assets.push_back(tokens[i]->address());
    }
    return assets;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

DSCEngine::DSCEngine(const std::vector<std::shared_ptr<IERC20>>& collateral_tokens,
                     const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds,
                     std::shared_ptr<IStableToken> dsc,
                     EngineOptions options)
    : address_(options.address)
    , dsc_(std::move(dsc))
    , oracle_(options.max_staleness, options.clock)
    , collateral_(validated_assets(collateral_tokens, price_feeds, dsc_))
    , solvency_(collateral_, debt_, oracle_)
    , positions_(EngineContext{address_, collateral_, debt_, oracle_, solvency_, tokens_, *dsc_})
    , liquidations_(EngineContext{address_, collateral_, debt_, oracle_, solvency_, tokens_, *dsc_},
                    positions_) {
    for (size_t i = 0; i < collateral_tokens.size(); ++i) {
        tokens_[collateral_tokens[i]->address()] = collateral_tokens[i];
        oracle_.register_feed(collateral_tokens[i]->address(), price_feeds[i]);
    }

    log::logger()->info("DSCEngine {} deployed with {} collateral assets, stable token {}",
                        addresses::to_hex(address_), collateral_tokens.size(),
                        addresses::to_hex(dsc_->address()));
}

// =============================================================================
// Operation Scope
// =============================================================================

void DSCEngine::execute(const char* operation, const std::function<void(Journal&)>& body) {
    if (entered_by_.load() == std::this_thread::get_id()) {
        log::logger()->warn("{} rejected: reentrant call", operation);
        total_reverts_.fetch_add(1, std::memory_order_relaxed);
        throw ReentrancyError();
    }

    std::unique_lock lock(mutex_);
    if (halted_.load()) {
        log::logger()->warn("{} rejected: engine halted", operation);
        total_reverts_.fetch_add(1, std::memory_order_relaxed);
        throw EngineHaltedError();
    }
    entered_by_.store(std::this_thread::get_id());

    Journal journal;
    try {
        body(journal);
    } catch (const EngineError& e) {
        std::string what = fmt::format("[{}] {}", errors::name(e.code()), e.what());
        abort_operation(journal, operation, what.c_str());
        throw;
    } catch (const std::exception& e) {
        abort_operation(journal, operation, e.what());
        throw;
    } catch (...) {
        abort_operation(journal, operation, "unknown error");
        throw;
    }

    // Listeners run with the guard still held; a throwing listener does not
    // undo the committed operation
    std::vector<EngineEvent> events = journal.commit();
    try {
        dispatch(events);
    } catch (...) {
        entered_by_.store(std::thread::id{});
        throw;
    }
    entered_by_.store(std::thread::id{});

    log::logger()->debug("{} committed ({} events)", operation, events.size());
}

void DSCEngine::abort_operation(Journal& journal, const char* operation, const char* what) {
    size_t undo = journal.pending_undo();
    size_t failed = journal.rollback();
    entered_by_.store(std::thread::id{});
    total_reverts_.fetch_add(1, std::memory_order_relaxed);
    log::logger()->warn("{} reverted: {} ({} effects undone)", operation, what, undo - failed);

    if (failed > 0) {
        halted_.store(true);
        log::logger()->critical("{}: {} of {} effects could not be undone, engine halted",
                                operation, failed, undo);
    }
}

void DSCEngine::dispatch(const std::vector<EngineEvent>& events) {
    if (!listener_) return;

    for (const auto& event : events) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, CollateralDeposited>) {
                listener_->on_collateral_deposited(e);
            } else {
                listener_->on_collateral_redeemed(e);
            }
        }, event);
    }
}

void DSCEngine::set_listener(EngineListener* listener) {
    if (entered_by_.load() == std::this_thread::get_id()) {
        throw ReentrancyError();
    }
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

// =============================================================================
// Positions
// =============================================================================

void DSCEngine::deposit_collateral(const Address& user, const Address& token,
                                   const U256& amount) {
    execute("deposit_collateral", [&](Journal& journal) {
        positions_.deposit_collateral(journal, user, token, amount);
    });
    total_deposits_.fetch_add(1, std::memory_order_relaxed);
}

void DSCEngine::deposit_collateral_and_mint_dsc(const Address& user, const Address& token,
                                                const U256& amount_collateral,
                                                const U256& amount_dsc_to_mint) {
    execute("deposit_collateral_and_mint_dsc", [&](Journal& journal) {
        positions_.deposit_collateral_and_mint_dsc(journal, user, token,
                                                   amount_collateral, amount_dsc_to_mint);
    });
    total_deposits_.fetch_add(1, std::memory_order_relaxed);
    total_mints_.fetch_add(1, std::memory_order_relaxed);
}

void DSCEngine::redeem_collateral(const Address& user, const Address& token,
                                  const U256& amount) {
    execute("redeem_collateral", [&](Journal& journal) {
        positions_.redeem_collateral(journal, user, token, amount);
    });
    total_redemptions_.fetch_add(1, std::memory_order_relaxed);
}

void DSCEngine::redeem_collateral_for_dsc(const Address& user, const Address& token,
                                          const U256& amount_collateral,
                                          const U256& amount_dsc_to_burn) {
    execute("redeem_collateral_for_dsc", [&](Journal& journal) {
        positions_.redeem_collateral_for_dsc(journal, user, token,
                                             amount_collateral, amount_dsc_to_burn);
    });
    total_burns_.fetch_add(1, std::memory_order_relaxed);
    total_redemptions_.fetch_add(1, std::memory_order_relaxed);
}

void DSCEngine::mint_dsc(const Address& user, const U256& amount) {
    execute("mint_dsc", [&](Journal& journal) {
        positions_.mint_dsc(journal, user, amount);
    });
    total_mints_.fetch_add(1, std::memory_order_relaxed);
}

void DSCEngine::burn_dsc(const Address& user, const U256& amount) {
    execute("burn_dsc", [&](Journal& journal) {
        positions_.burn_dsc(journal, user, amount);
    });
    total_burns_.fetch_add(1, std::memory_order_relaxed);
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult DSCEngine::liquidate(const Address& liquidator, const Address& token,
                                       const Address& user, const U256& debt_to_cover) {
    LiquidationResult result{};
    execute("liquidate", [&](Journal& journal) {
        result = liquidations_.liquidate(journal, liquidator, token, user, debt_to_cover);
    });
    total_liquidations_.fetch_add(1, std::memory_order_relaxed);

    log::logger()->info("liquidated {}: {} DSC covered by {}, {} {} paid out, health factor {} -> {}",
                        addresses::to_hex(user),
                        x18::format_units(result.debt_covered, constants::DSC_DECIMALS),
                        addresses::to_hex(liquidator),
                        x18::format_units(result.payout.total, tokens_.at(token)->decimals()),
                        addresses::to_hex(token),
                        x18::format_health_factor(result.starting_health_factor),
                        x18::format_health_factor(result.ending_health_factor));
    return result;
}

LiquidationQuote DSCEngine::liquidation_quote(const Address& token,
                                              const U256& debt_to_cover) const {
    return read([&] { return liquidations_.quote(token, debt_to_cover); });
}

// =============================================================================
// Queries
// =============================================================================

U256 DSCEngine::health_factor(const Address& user) const {
    return read([&] { return solvency_.health_factor(user); });
}

AccountInformation DSCEngine::account_information(const Address& user) const {
    return read([&] { return solvency_.account_information(user); });
}

U256 DSCEngine::account_collateral_value(const Address& user) const {
    return read([&] { return solvency_.account_collateral_value(user); });
}

U256 DSCEngine::collateral_balance(const Address& user, const Address& token) const {
    return read([&] { return collateral_.balance(user, token); });
}

U256 DSCEngine::usd_value(const Address& token, const U256& amount) const {
    return oracle_.usd_value(token, amount);
}

U256 DSCEngine::token_amount_from_usd(const Address& token, const U256& usd_amount_in_wei) const {
    return oracle_.token_amount_from_usd(token, usd_amount_in_wei);
}

std::vector<Address> DSCEngine::collateral_tokens() const {
    return collateral_.assets();
}

std::shared_ptr<IPriceFeed> DSCEngine::collateral_price_feed(const Address& token) const {
    return oracle_.feed(token);
}

U256 DSCEngine::total_collateral(const Address& token) const {
    return read([&] { return collateral_.total(token); });
}

U256 DSCEngine::total_debt() const {
    return read([&] { return debt_.total(); });
}

DSCEngine::Stats DSCEngine::get_stats() const {
    return Stats{
        total_deposits_.load(),
        total_redemptions_.load(),
        total_mints_.load(),
        total_burns_.load(),
        total_liquidations_.load(),
        total_reverts_.load()
    };
}

} // namespace dsc
