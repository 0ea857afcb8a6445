#ifndef DSC_SOLVENCY_HPP
#define DSC_SOLVENCY_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "oracle.hpp"

namespace dsc {

struct AccountInformation {
    U256 total_dsc_minted;
    U256 collateral_value_in_usd;
};

// =============================================================================
// SolvencyCalculator - the sole arbiter of "is this position safe"
//
// health factor = (collateralUsd * THRESHOLD / LIQUIDATION_PRECISION)
//                 * PRECISION / debt
// U256_MAX when debt is zero. >= MIN_HEALTH_FACTOR is solvent.
// =============================================================================

class SolvencyCalculator {
public:
    SolvencyCalculator(const CollateralLedger& collateral, const DebtLedger& debt,
                       const DSCOracle& oracle);

    // Sum of usd_value over every registered asset, in registration order
    U256 account_collateral_value(const Address& user) const;

    AccountInformation account_information(const Address& user) const;

    U256 health_factor(const Address& user) const;

    bool is_healthy(const Address& user) const;

    // Pure function of the two derived numbers
    static U256 calculate_health_factor(const U256& total_dsc_minted,
                                        const U256& collateral_value_in_usd);

private:
    const CollateralLedger& collateral_;
    const DebtLedger& debt_;
    const DSCOracle& oracle_;
};

} // namespace dsc

#endif // DSC_SOLVENCY_HPP
