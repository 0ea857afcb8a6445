#ifndef DSC_LEDGER_HPP
#define DSC_LEDGER_HPP

#include <map>
#include <vector>

#include "types.hpp"

namespace dsc {

// =============================================================================
// CollateralLedger - per-user, per-asset deposited amounts
//
// No solvency awareness: callers decide whether a movement is allowed.
// The registered asset list is fixed at construction.
// =============================================================================

class CollateralLedger {
public:
    explicit CollateralLedger(std::vector<Address> registered_assets);

    // Throws InvalidInputError (zero amount) or UnregisteredAssetError
    void deposit(const Address& user, const Address& token, const U256& amount);

    // Throws InvalidInputError or InsufficientCollateralError
    void withdraw(const Address& user, const Address& token, const U256& amount);

    U256 balance(const Address& user, const Address& token) const;

    // Sum of every user's position in `token`
    U256 total(const Address& token) const;

    bool is_registered(const Address& token) const;
    const std::vector<Address>& assets() const { return assets_; }

    // Users with a non-zero position, in address order
    std::vector<Address> users() const;

private:
    std::vector<Address> assets_;
    std::map<Address, std::map<Address, U256>> positions_;  // user -> token -> amount
    std::map<Address, U256> totals_;                         // token -> amount
};

// =============================================================================
// DebtLedger - per-user minted DSC
// =============================================================================

class DebtLedger {
public:
    // Throws InvalidInputError on zero amount
    void increase(const Address& user, const U256& amount);

    // Throws InvalidInputError or DebtUnderflowError(requested, available)
    void decrease(const Address& user, const U256& amount);

    U256 debt(const Address& user) const;
    U256 total() const { return total_; }

private:
    std::map<Address, U256> minted_;
    U256 total_ = 0;
};

} // namespace dsc

#endif // DSC_LEDGER_HPP
