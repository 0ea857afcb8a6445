#ifndef DSC_TOKEN_HPP
#define DSC_TOKEN_HPP

#include <map>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Token Interfaces (external collaborators of the engine)
//
// The engine acts as a normal account on these tokens: `sender`/`spender` is
// the caller's identity, the way msg.sender is on-chain. A false return is a
// refusal the engine turns into TransferFailed/MintFailed.
// =============================================================================

class IERC20 {
public:
    virtual ~IERC20() = default;

    virtual const Address& address() const = 0;
    virtual std::string symbol() const = 0;
    virtual uint8_t decimals() const = 0;

    virtual U256 total_supply() const = 0;
    virtual U256 balance_of(const Address& account) const = 0;

    // Move `amount` out of the sender's own balance
    virtual bool transfer(const Address& sender, const Address& to, const U256& amount) = 0;

    // Move `amount` out of `from` on behalf of `spender`
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, const U256& amount) = 0;
};

// The stable unit: mintable and burnable by its owner only
class IStableToken : public IERC20 {
public:
    virtual bool mint(const Address& caller, const Address& to, const U256& amount) = 0;

    // Destroy `amount` from the caller's balance; throws on refusal
    virtual void burn(const Address& caller, const U256& amount) = 0;
};

// =============================================================================
// TokenError - raised by the reference tokens on misuse
// =============================================================================

class TokenError : public std::runtime_error {
public:
    explicit TokenError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// BalanceTable - fungible balances shared by the reference tokens
// =============================================================================

class BalanceTable {
public:
    U256 total_supply() const { return total_supply_; }
    U256 balance_of(const Address& account) const;

    bool move(const Address& from, const Address& to, const U256& amount);
    void credit(const Address& to, const U256& amount);
    bool debit(const Address& from, const U256& amount);

private:
    std::map<Address, U256> balances_;
    U256 total_supply_ = 0;
};

// =============================================================================
// ERC20Mock - freely mintable collateral token
// =============================================================================

class ERC20Mock : public IERC20 {
public:
    ERC20Mock(const Address& address, std::string symbol, uint8_t decimals = 18);

    const Address& address() const override { return address_; }
    std::string symbol() const override { return symbol_; }
    uint8_t decimals() const override { return decimals_; }

    U256 total_supply() const override { return balances_.total_supply(); }
    U256 balance_of(const Address& account) const override { return balances_.balance_of(account); }

    bool transfer(const Address& sender, const Address& to, const U256& amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const U256& amount) override;

    // Faucet
    void mint(const Address& to, const U256& amount);

    // Make every transfer/transfer_from report failure without moving funds
    void set_fail_transfers(bool fail) { fail_transfers_ = fail; }

private:
    Address address_;
    std::string symbol_;
    uint8_t decimals_;
    BalanceTable balances_;
    bool fail_transfers_ = false;
};

// =============================================================================
// StableCoin - the "Decentralized Stable Coin" (DSC)
//
// Owner-gated mint/burn. Ownership is handed to the engine at deployment.
// =============================================================================

class StableCoin : public IStableToken {
public:
    StableCoin(const Address& address, const Address& owner);

    const Address& address() const override { return address_; }
    std::string symbol() const override { return "DSC"; }
    uint8_t decimals() const override { return constants::DSC_DECIMALS; }

    U256 total_supply() const override { return balances_.total_supply(); }
    U256 balance_of(const Address& account) const override { return balances_.balance_of(account); }

    bool transfer(const Address& sender, const Address& to, const U256& amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const U256& amount) override;

    // Throws TokenError if caller is not the owner, `to` is zero or amount is 0
    bool mint(const Address& caller, const Address& to, const U256& amount) override;

    // Throws TokenError if caller is not the owner, amount is 0 or exceeds balance
    void burn(const Address& caller, const U256& amount) override;

    const Address& owner() const { return owner_; }
    void transfer_ownership(const Address& caller, const Address& new_owner);

private:
    Address address_;
    Address owner_;
    BalanceTable balances_;

    void only_owner(const Address& caller) const;
};

} // namespace dsc

#endif // DSC_TOKEN_HPP
