// =============================================================================
// ledger.cpp - Collateral and Debt Ledgers
// =============================================================================

#include "dsc/ledger.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"

#include <algorithm>

namespace dsc {

// =============================================================================
// CollateralLedger
// =============================================================================

CollateralLedger::CollateralLedger(std::vector<Address> registered_assets)
    : assets_(std::move(registered_assets)) {
    for (const auto& token : assets_) {
        totals_[token] = 0;
    }
}

void CollateralLedger::deposit(const Address& user, const Address& token, const U256& amount) {
    if (amount == 0) {
        throw InvalidInputError("CollateralLedger: deposit amount must be more than zero");
    }
    if (!is_registered(token)) {
        throw UnregisteredAssetError(token);
    }

    // Compute both sums before writing so an overflow leaves no partial update
    U256& position = positions_[user][token];
    U256 new_position = x18::add(position, amount);
    U256 new_total = x18::add(totals_[token], amount);

    position = new_position;
    totals_[token] = new_total;
}

void CollateralLedger::withdraw(const Address& user, const Address& token, const U256& amount) {
    if (amount == 0) {
        throw InvalidInputError("CollateralLedger: withdraw amount must be more than zero");
    }

    U256 available = balance(user, token);
    if (amount > available) {
        throw InsufficientCollateralError(amount, available);
    }

    positions_[user][token] = available - amount;
    totals_[token] -= amount;
}

U256 CollateralLedger::balance(const Address& user, const Address& token) const {
    auto user_it = positions_.find(user);
    if (user_it == positions_.end()) return 0;

    auto it = user_it->second.find(token);
    return (it != user_it->second.end()) ? it->second : U256(0);
}

U256 CollateralLedger::total(const Address& token) const {
    auto it = totals_.find(token);
    return (it != totals_.end()) ? it->second : U256(0);
}

bool CollateralLedger::is_registered(const Address& token) const {
    return std::find(assets_.begin(), assets_.end(), token) != assets_.end();
}

std::vector<Address> CollateralLedger::users() const {
    std::vector<Address> result;
    for (const auto& [user, tokens] : positions_) {
        bool open = std::any_of(tokens.begin(), tokens.end(),
                                [](const auto& entry) { return entry.second != 0; });
        if (open) {
            result.push_back(user);
        }
    }
    return result;
}

// =============================================================================
// DebtLedger
// =============================================================================

void DebtLedger::increase(const Address& user, const U256& amount) {
    if (amount == 0) {
        throw InvalidInputError("DebtLedger: mint amount must be more than zero");
    }

    U256& minted = minted_[user];
    U256 new_minted = x18::add(minted, amount);
    U256 new_total = x18::add(total_, amount);

    minted = new_minted;
    total_ = new_total;
}

void DebtLedger::decrease(const Address& user, const U256& amount) {
    if (amount == 0) {
        throw InvalidInputError("DebtLedger: burn amount must be more than zero");
    }

    U256 available = debt(user);
    if (amount > available) {
        throw DebtUnderflowError(amount, available);
    }

    minted_[user] = available - amount;
    total_ -= amount;
}

U256 DebtLedger::debt(const Address& user) const {
    auto it = minted_.find(user);
    return (it != minted_.end()) ? it->second : U256(0);
}

} // namespace dsc
