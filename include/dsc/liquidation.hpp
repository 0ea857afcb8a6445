#ifndef DSC_LIQUIDATION_HPP
#define DSC_LIQUIDATION_HPP

#include "types.hpp"
#include "journal.hpp"
#include "position.hpp"

namespace dsc {

// Collateral a liquidator receives for covering a given amount of debt
struct LiquidationQuote {
    U256 token_amount;           // debt_to_cover converted at the current price
    U256 bonus;                  // token_amount * LIQUIDATION_BONUS / LIQUIDATION_PRECISION
    U256 total;                  // token_amount + bonus
};

struct LiquidationResult {
    Address user;
    Address liquidator;
    Address token;
    U256 debt_covered;
    LiquidationQuote payout;
    U256 starting_health_factor;
    U256 ending_health_factor;
};

// =============================================================================
// LiquidationEngine - third-party repayment of an undercollateralized position
//
// The liquidator burns their own DSC against the target's debt and receives
// the equivalent collateral plus a 10% bonus. Preconditions, in order:
//   debt_to_cover > 0, token registered, target health factor below minimum,
//   payout covered by the target's position.
// Postconditions: target health factor strictly improved, liquidator
// still solvent.
// =============================================================================

class LiquidationEngine {
public:
    LiquidationEngine(EngineContext context, PositionEngine& positions);

    // Non-copyable
    LiquidationEngine(const LiquidationEngine&) = delete;
    LiquidationEngine& operator=(const LiquidationEngine&) = delete;

    LiquidationResult liquidate(Journal& journal, const Address& liquidator,
                                const Address& token, const Address& user,
                                const U256& debt_to_cover);

    // Price a liquidation without touching any state
    LiquidationQuote quote(const Address& token, const U256& debt_to_cover) const;

private:
    EngineContext ctx_;
    PositionEngine& positions_;
};

} // namespace dsc

#endif // DSC_LIQUIDATION_HPP
