// =============================================================================
// token.cpp - Reference Collateral Token and Stable Coin
// =============================================================================

#include "dsc/token.hpp"
#include "dsc/fixed_point.hpp"

namespace dsc {

// =============================================================================
// BalanceTable
// =============================================================================

U256 BalanceTable::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : U256(0);
}

bool BalanceTable::move(const Address& from, const Address& to, const U256& amount) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    balances_[to] = x18::add(balances_[to], amount);
    return true;
}

void BalanceTable::credit(const Address& to, const U256& amount) {
    total_supply_ = x18::add(total_supply_, amount);
    balances_[to] = x18::add(balances_[to], amount);
}

bool BalanceTable::debit(const Address& from, const U256& amount) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    total_supply_ -= amount;
    return true;
}

// =============================================================================
// ERC20Mock
// =============================================================================

ERC20Mock::ERC20Mock(const Address& address, std::string symbol, uint8_t decimals)
    : address_(address), symbol_(std::move(symbol)), decimals_(decimals) {}

bool ERC20Mock::transfer(const Address& sender, const Address& to, const U256& amount) {
    if (fail_transfers_ || addresses::is_zero(to)) {
        return false;
    }
    return balances_.move(sender, to, amount);
}

bool ERC20Mock::transfer_from(const Address& spender, const Address& from,
                              const Address& to, const U256& amount) {
    (void)spender;  // Allowances are not modelled
    if (fail_transfers_ || addresses::is_zero(to)) {
        return false;
    }
    return balances_.move(from, to, amount);
}

void ERC20Mock::mint(const Address& to, const U256& amount) {
    balances_.credit(to, amount);
}

// =============================================================================
// StableCoin
// =============================================================================

StableCoin::StableCoin(const Address& address, const Address& owner)
    : address_(address), owner_(owner) {
    if (addresses::is_zero(owner)) {
        throw TokenError("DecentralizedStableCoin: owner is the zero address");
    }
}

bool StableCoin::transfer(const Address& sender, const Address& to, const U256& amount) {
    if (addresses::is_zero(to)) {
        return false;
    }
    return balances_.move(sender, to, amount);
}

bool StableCoin::transfer_from(const Address& spender, const Address& from,
                               const Address& to, const U256& amount) {
    (void)spender;
    if (addresses::is_zero(to)) {
        return false;
    }
    return balances_.move(from, to, amount);
}

bool StableCoin::mint(const Address& caller, const Address& to, const U256& amount) {
    only_owner(caller);
    if (addresses::is_zero(to)) {
        throw TokenError("DecentralizedStableCoin: not zero address");
    }
    if (amount == 0) {
        throw TokenError("DecentralizedStableCoin: must be more than zero");
    }
    balances_.credit(to, amount);
    return true;
}

void StableCoin::burn(const Address& caller, const U256& amount) {
    only_owner(caller);
    if (amount == 0) {
        throw TokenError("DecentralizedStableCoin: must be more than zero");
    }
    if (!balances_.debit(caller, amount)) {
        throw TokenError("DecentralizedStableCoin: burn amount exceeds balance");
    }
}

void StableCoin::transfer_ownership(const Address& caller, const Address& new_owner) {
    only_owner(caller);
    if (addresses::is_zero(new_owner)) {
        throw TokenError("DecentralizedStableCoin: new owner is the zero address");
    }
    owner_ = new_owner;
}

void StableCoin::only_owner(const Address& caller) const {
    if (caller != owner_) {
        throw TokenError("Ownable: caller is not the owner " + addresses::to_hex(caller));
    }
}

} // namespace dsc
