// =============================================================================
// position.cpp - Deposit, Redeem, Mint and Burn
// =============================================================================

#include "dsc/position.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"
#include "dsc/log.hpp"

namespace dsc {

void require_more_than_zero(const U256& amount) {
    if (amount == 0) {
        throw InvalidInputError("DSCEngine: needs more than zero");
    }
}

PositionEngine::PositionEngine(EngineContext context) : ctx_(context) {}

// =============================================================================
// Collateral
// =============================================================================

void PositionEngine::deposit_collateral(Journal& journal, const Address& user,
                                        const Address& token, const U256& amount) {
    require_more_than_zero(amount);
    require_allowed_token(token);

    ctx_.collateral.deposit(user, token, amount);
    journal.record("collateral.deposit", [this, user, token, amount] {
        ctx_.collateral.withdraw(user, token, amount);
    });
    journal.emit(CollateralDeposited{user, token, amount});

    IERC20& erc = erc20(token);
    if (!erc.transfer_from(ctx_.self, user, ctx_.self, amount)) {
        throw TransferFailedError(token);
    }
    journal.record("token.pull", [this, &erc, user, amount] {
        if (!erc.transfer(ctx_.self, user, amount)) {
            throw TransferFailedError(erc.address());
        }
    });
}

void PositionEngine::redeem_collateral(Journal& journal, const Address& user,
                                       const Address& token, const U256& amount) {
    require_more_than_zero(amount);
    require_allowed_token(token);

    move_collateral_out(journal, token, amount, user, user);
    revert_if_health_factor_is_broken(user);
}

void PositionEngine::move_collateral_out(Journal& journal, const Address& token,
                                         const U256& amount, const Address& from,
                                         const Address& to) {
    ctx_.collateral.withdraw(from, token, amount);
    journal.record("collateral.withdraw", [this, from, token, amount] {
        ctx_.collateral.deposit(from, token, amount);
    });
    journal.emit(CollateralRedeemed{from, to, token, amount});

    IERC20& erc = erc20(token);
    if (!erc.transfer(ctx_.self, to, amount)) {
        throw TransferFailedError(token);
    }
    journal.record("token.payout", [this, &erc, to, amount] {
        if (!erc.transfer_from(ctx_.self, to, ctx_.self, amount)) {
            throw TransferFailedError(erc.address());
        }
    });
}

// =============================================================================
// Debt
// =============================================================================

void PositionEngine::mint_dsc(Journal& journal, const Address& user, const U256& amount) {
    require_more_than_zero(amount);

    ctx_.debt.increase(user, amount);
    journal.record("debt.increase", [this, user, amount] {
        ctx_.debt.decrease(user, amount);
    });

    revert_if_health_factor_is_broken(user);

    mint_stable(user, amount);
    journal.record("dsc.mint", [this, user, amount] {
        if (!ctx_.dsc.transfer_from(ctx_.self, user, ctx_.self, amount)) {
            throw TransferFailedError(ctx_.dsc.address());
        }
        burn_stable(amount);
    });
}

void PositionEngine::burn_dsc(Journal& journal, const Address& user, const U256& amount) {
    require_more_than_zero(amount);

    U256 debt = ctx_.debt.debt(user);
    if (amount > debt) {
        throw BurnExceedsDebtError(amount, debt);
    }

    burn_on_behalf(journal, amount, user, user);
    // Burning only raises the ratio; kept so every mutation ends on the check
    revert_if_health_factor_is_broken(user);
}

void PositionEngine::burn_on_behalf(Journal& journal, const U256& amount,
                                    const Address& on_behalf_of, const Address& dsc_from) {
    ctx_.debt.decrease(on_behalf_of, amount);
    journal.record("debt.decrease", [this, on_behalf_of, amount] {
        ctx_.debt.increase(on_behalf_of, amount);
    });

    if (!ctx_.dsc.transfer_from(ctx_.self, dsc_from, ctx_.self, amount)) {
        throw TransferFailedError(ctx_.dsc.address());
    }
    journal.record("dsc.pull", [this, dsc_from, amount] {
        if (!ctx_.dsc.transfer(ctx_.self, dsc_from, amount)) {
            throw TransferFailedError(ctx_.dsc.address());
        }
    });

    burn_stable(amount);
    journal.record("dsc.burn", [this, amount] {
        mint_stable(ctx_.self, amount);
    });
}

// =============================================================================
// Composite Flows
// =============================================================================

void PositionEngine::deposit_collateral_and_mint_dsc(Journal& journal, const Address& user,
                                                     const Address& token,
                                                     const U256& amount_collateral,
                                                     const U256& amount_dsc_to_mint) {
    deposit_collateral(journal, user, token, amount_collateral);
    mint_dsc(journal, user, amount_dsc_to_mint);
}

void PositionEngine::redeem_collateral_for_dsc(Journal& journal, const Address& user,
                                               const Address& token,
                                               const U256& amount_collateral,
                                               const U256& amount_dsc_to_burn) {
    burn_dsc(journal, user, amount_dsc_to_burn);
    redeem_collateral(journal, user, token, amount_collateral);
}

// =============================================================================
// Checks
// =============================================================================

void PositionEngine::revert_if_health_factor_is_broken(const Address& user) const {
    U256 hf = ctx_.solvency.health_factor(user);
    if (hf < constants::MIN_HEALTH_FACTOR) {
        log::logger()->debug("health factor of {} would be {}", addresses::to_hex(user),
                             x18::format_health_factor(hf));
        throw HealthFactorBelowThresholdError(hf);
    }
}

// The stable token may refuse by returning false or by throwing TokenError;
// both surface as engine errors
void PositionEngine::mint_stable(const Address& to, const U256& amount) {
    bool minted = false;
    try {
        minted = ctx_.dsc.mint(ctx_.self, to, amount);
    } catch (const TokenError& e) {
        log::logger()->debug("stable token refused mint: {}", e.what());
    }
    if (!minted) {
        throw MintFailedError();
    }
}

void PositionEngine::burn_stable(const U256& amount) {
    try {
        ctx_.dsc.burn(ctx_.self, amount);
    } catch (const TokenError& e) {
        log::logger()->debug("stable token refused burn: {}", e.what());
        throw TransferFailedError(ctx_.dsc.address());
    }
}

IERC20& PositionEngine::erc20(const Address& token) const {
    auto it = ctx_.tokens.find(token);
    if (it == ctx_.tokens.end()) {
        throw UnregisteredAssetError(token);
    }
    return *it->second;
}

void PositionEngine::require_allowed_token(const Address& token) const {
    if (!ctx_.collateral.is_registered(token)) {
        throw UnregisteredAssetError(token);
    }
}

} // namespace dsc
