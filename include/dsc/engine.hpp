#ifndef DSC_ENGINE_HPP
#define DSC_ENGINE_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "types.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "liquidation.hpp"
#include "oracle.hpp"
#include "position.hpp"
#include "solvency.hpp"
#include "token.hpp"

namespace dsc {

struct EngineOptions {
    Address address = addresses::DSC_ENGINE;               // custody identity on the tokens
    uint64_t max_staleness = constants::ORACLE_TIMEOUT;    // seconds
    Clock clock;                                           // empty = system clock
};

// =============================================================================
// DSCEngine - collateralized stablecoin engine
//
// Users lock collateral, mint DSC against it, burn DSC and redeem
// collateral; undercollateralized positions can be liquidated by anyone.
// Every position must keep health factor >= 1e18, i.e. 200% collateral.
//
// Each mutating call runs under an exclusive lock with a Journal; any
// failure rolls back ledger and token effects before the error propagates.
// A call made from inside a running operation (token or listener callback)
// throws ReentrancyError.
//
// If an inverse itself fails during rollback (a token refusing to return
// funds) the engine halts: ledgers and custody can no longer be trusted to
// agree, so every later mutating call throws EngineHaltedError. Queries
// keep working.
// =============================================================================

class DSCEngine {
public:
    // Throws LengthMismatchError or InvalidInputError (zero/duplicate token,
    // null feed or null stable token)
    DSCEngine(const std::vector<std::shared_ptr<IERC20>>& collateral_tokens,
              const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds,
              std::shared_ptr<IStableToken> dsc,
              EngineOptions options = {});
    ~DSCEngine() = default;

    // Non-copyable
    DSCEngine(const DSCEngine&) = delete;
    DSCEngine& operator=(const DSCEngine&) = delete;

    // =========================================================================
    // Positions
    // =========================================================================

    void deposit_collateral(const Address& user, const Address& token, const U256& amount);

    void deposit_collateral_and_mint_dsc(const Address& user, const Address& token,
                                         const U256& amount_collateral,
                                         const U256& amount_dsc_to_mint);

    void redeem_collateral(const Address& user, const Address& token, const U256& amount);

    void redeem_collateral_for_dsc(const Address& user, const Address& token,
                                   const U256& amount_collateral,
                                   const U256& amount_dsc_to_burn);

    void mint_dsc(const Address& user, const U256& amount);

    void burn_dsc(const Address& user, const U256& amount);

    // =========================================================================
    // Liquidation
    // =========================================================================

    LiquidationResult liquidate(const Address& liquidator, const Address& token,
                                const Address& user, const U256& debt_to_cover);

    LiquidationQuote liquidation_quote(const Address& token, const U256& debt_to_cover) const;

    // =========================================================================
    // Queries
    // =========================================================================

    U256 health_factor(const Address& user) const;
    AccountInformation account_information(const Address& user) const;
    U256 account_collateral_value(const Address& user) const;
    U256 collateral_balance(const Address& user, const Address& token) const;

    U256 usd_value(const Address& token, const U256& amount) const;
    U256 token_amount_from_usd(const Address& token, const U256& usd_amount_in_wei) const;

    std::vector<Address> collateral_tokens() const;
    std::shared_ptr<IPriceFeed> collateral_price_feed(const Address& token) const;
    std::shared_ptr<IStableToken> dsc() const { return dsc_; }
    const Address& address() const { return address_; }

    U256 total_collateral(const Address& token) const;
    U256 total_debt() const;

    static U256 calculate_health_factor(const U256& total_dsc_minted,
                                        const U256& collateral_value_in_usd) {
        return SolvencyCalculator::calculate_health_factor(total_dsc_minted,
                                                           collateral_value_in_usd);
    }

    // Constants
    static U256 precision() { return constants::PRECISION; }
    static U256 additional_feed_precision() { return constants::ADDITIONAL_FEED_PRECISION; }
    static uint64_t liquidation_threshold() { return constants::LIQUIDATION_THRESHOLD; }
    static uint64_t liquidation_bonus() { return constants::LIQUIDATION_BONUS; }
    static uint64_t liquidation_precision() { return constants::LIQUIDATION_PRECISION; }
    static U256 min_health_factor() { return constants::MIN_HEALTH_FACTOR; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_redemptions;
        uint64_t total_mints;
        uint64_t total_burns;
        uint64_t total_liquidations;
        uint64_t total_reverts;
    };
    Stats get_stats() const;

    bool halted() const { return halted_.load(); }

    // Event listener registration (nullptr to detach)
    void set_listener(EngineListener* listener);

private:
    Address address_;
    std::shared_ptr<IStableToken> dsc_;
    std::map<Address, std::shared_ptr<IERC20>> tokens_;

    DSCOracle oracle_;
    CollateralLedger collateral_;
    DebtLedger debt_;
    SolvencyCalculator solvency_;
    PositionEngine positions_;
    LiquidationEngine liquidations_;

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> entered_by_{};
    std::atomic<bool> halted_{false};

    EngineListener* listener_{nullptr};

    // Statistics
    std::atomic<uint64_t> total_deposits_{0};
    std::atomic<uint64_t> total_redemptions_{0};
    std::atomic<uint64_t> total_mints_{0};
    std::atomic<uint64_t> total_burns_{0};
    std::atomic<uint64_t> total_liquidations_{0};
    std::atomic<uint64_t> total_reverts_{0};

    // Runs body as one all-or-nothing operation and delivers its events
    void execute(const char* operation, const std::function<void(Journal&)>& body);
    void abort_operation(Journal& journal, const char* operation, const char* what);
    void dispatch(const std::vector<EngineEvent>& events);

    // Queries from inside a running operation skip the lock the operation holds
    template <typename Fn>
    auto read(Fn&& fn) const {
        if (entered_by_.load() == std::this_thread::get_id()) {
            return fn();
        }
        std::shared_lock lock(mutex_);
        return fn();
    }
};

} // namespace dsc

#endif // DSC_ENGINE_HPP
