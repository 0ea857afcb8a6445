// =============================================================================
// solvency.cpp - Health Factor Computation
// =============================================================================

#include "dsc/solvency.hpp"
#include "dsc/fixed_point.hpp"

namespace dsc {

SolvencyCalculator::SolvencyCalculator(const CollateralLedger& collateral,
                                       const DebtLedger& debt,
                                       const DSCOracle& oracle)
    : collateral_(collateral), debt_(debt), oracle_(oracle) {}

U256 SolvencyCalculator::account_collateral_value(const Address& user) const {
    U256 total = 0;
    for (const auto& token : collateral_.assets()) {
        U256 amount = collateral_.balance(user, token);
        total = x18::add(total, oracle_.usd_value(token, amount));
    }
    return total;
}

AccountInformation SolvencyCalculator::account_information(const Address& user) const {
    return AccountInformation{
        debt_.debt(user),
        account_collateral_value(user)
    };
}

U256 SolvencyCalculator::health_factor(const Address& user) const {
    AccountInformation info = account_information(user);
    return calculate_health_factor(info.total_dsc_minted, info.collateral_value_in_usd);
}

bool SolvencyCalculator::is_healthy(const Address& user) const {
    return health_factor(user) >= constants::MIN_HEALTH_FACTOR;
}

U256 SolvencyCalculator::calculate_health_factor(const U256& total_dsc_minted,
                                                 const U256& collateral_value_in_usd) {
    if (total_dsc_minted == 0) {
        return U256_MAX;
    }
    U256 adjusted = x18::mul_div(collateral_value_in_usd,
                                 U256(constants::LIQUIDATION_THRESHOLD),
                                 U256(constants::LIQUIDATION_PRECISION));
    return x18::mul_div(adjusted, constants::PRECISION, total_dsc_minted);
}

} // namespace dsc
