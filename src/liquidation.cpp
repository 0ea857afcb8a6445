// =============================================================================
// liquidation.cpp - Liquidation Flow
// =============================================================================

#include "dsc/liquidation.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"

namespace dsc {

LiquidationEngine::LiquidationEngine(EngineContext context, PositionEngine& positions)
    : ctx_(context), positions_(positions) {}

LiquidationQuote LiquidationEngine::quote(const Address& token,
                                          const U256& debt_to_cover) const {
    LiquidationQuote q;
    q.token_amount = ctx_.oracle.token_amount_from_usd(token, debt_to_cover);
    q.bonus = x18::mul_div(q.token_amount, U256(constants::LIQUIDATION_BONUS),
                           U256(constants::LIQUIDATION_PRECISION));
    q.total = x18::add(q.token_amount, q.bonus);
    return q;
}

LiquidationResult LiquidationEngine::liquidate(Journal& journal, const Address& liquidator,
                                               const Address& token, const Address& user,
                                               const U256& debt_to_cover) {
    require_more_than_zero(debt_to_cover);
    if (!ctx_.collateral.is_registered(token)) {
        throw UnregisteredAssetError(token);
    }

    U256 starting = ctx_.solvency.health_factor(user);
    if (starting >= constants::MIN_HEALTH_FACTOR) {
        throw HealthFactorOkError(starting);
    }

    LiquidationQuote payout = quote(token, debt_to_cover);
    U256 available = ctx_.collateral.balance(user, token);
    if (payout.total > available) {
        throw ExternalTransferUnderfundedError(payout.total, available);
    }

    positions_.move_collateral_out(journal, token, payout.total, user, liquidator);
    positions_.burn_on_behalf(journal, debt_to_cover, user, liquidator);

    U256 ending = ctx_.solvency.health_factor(user);
    if (ending <= starting) {
        throw HealthFactorNotImprovedError(starting, ending);
    }
    positions_.revert_if_health_factor_is_broken(liquidator);

    return LiquidationResult{
        user,
        liquidator,
        token,
        debt_to_cover,
        payout,
        starting,
        ending
    };
}

} // namespace dsc
