#ifndef DSC_POSITION_HPP
#define DSC_POSITION_HPP

#include <map>
#include <memory>

#include "types.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "solvency.hpp"
#include "token.hpp"

namespace dsc {

// =============================================================================
// EngineContext - the state every engine operation works against
//
// Owned by DSCEngine; PositionEngine and LiquidationEngine hold references.
// =============================================================================

struct EngineContext {
    Address self;                                            // custody identity
    CollateralLedger& collateral;
    DebtLedger& debt;
    const DSCOracle& oracle;
    const SolvencyCalculator& solvency;
    const std::map<Address, std::shared_ptr<IERC20>>& tokens;
    IStableToken& dsc;
};

// =============================================================================
// PositionEngine - actor-initiated collateral and debt movements
//
// Order inside each operation: amount > 0, asset registered, ledger effect,
// token interaction, solvency assertion. Every effect is journaled so a
// failing step unwinds the whole operation.
// =============================================================================

class PositionEngine {
public:
    explicit PositionEngine(EngineContext context);

    // Non-copyable
    PositionEngine(const PositionEngine&) = delete;
    PositionEngine& operator=(const PositionEngine&) = delete;

    void deposit_collateral(Journal& journal, const Address& user,
                            const Address& token, const U256& amount);

    void redeem_collateral(Journal& journal, const Address& user,
                           const Address& token, const U256& amount);

    void mint_dsc(Journal& journal, const Address& user, const U256& amount);

    void burn_dsc(Journal& journal, const Address& user, const U256& amount);

    // deposit, then mint
    void deposit_collateral_and_mint_dsc(Journal& journal, const Address& user,
                                         const Address& token, const U256& amount_collateral,
                                         const U256& amount_dsc_to_mint);

    // burn, then redeem; the redeem's solvency check sees the reduced debt
    void redeem_collateral_for_dsc(Journal& journal, const Address& user,
                                   const Address& token, const U256& amount_collateral,
                                   const U256& amount_dsc_to_burn);

    // =========================================================================
    // Primitives shared with LiquidationEngine
    // =========================================================================

    // Ledger decrease for `from`, payout of the token to `to`
    void move_collateral_out(Journal& journal, const Address& token, const U256& amount,
                             const Address& from, const Address& to);

    // Debt decrease for `on_behalf_of`, DSC pulled from `dsc_from` and burned
    void burn_on_behalf(Journal& journal, const U256& amount,
                        const Address& on_behalf_of, const Address& dsc_from);

    // Throws HealthFactorBelowThresholdError
    void revert_if_health_factor_is_broken(const Address& user) const;

private:
    EngineContext ctx_;

    IERC20& erc20(const Address& token) const;
    void require_allowed_token(const Address& token) const;

    // Stable token calls; refusals become MintFailedError / TransferFailedError
    void mint_stable(const Address& to, const U256& amount);
    void burn_stable(const U256& amount);
};

// Throws InvalidInputError when amount is zero
void require_more_than_zero(const U256& amount);

} // namespace dsc

#endif // DSC_POSITION_HPP
