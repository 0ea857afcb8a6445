#ifndef DSC_ERRORS_HPP
#define DSC_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// EngineError - base of every failure the engine reports
//
// Each failure aborts the current operation with full rollback. code() maps
// to the errors:: table so callers can switch on it without RTTI.
// =============================================================================

class EngineError : public std::runtime_error {
public:
    EngineError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// Zero amount, zero address or duplicate registration
class InvalidInputError : public EngineError {
public:
    explicit InvalidInputError(const std::string& msg, int32_t code = errors::INVALID_AMOUNT)
        : EngineError(code, msg) {}
};

class UnregisteredAssetError : public EngineError {
public:
    explicit UnregisteredAssetError(const Address& token);

    const Address& token() const noexcept { return token_; }

private:
    Address token_;
};

class LengthMismatchError : public EngineError {
public:
    LengthMismatchError(size_t tokens, size_t feeds);
};

class InsufficientCollateralError : public EngineError {
public:
    InsufficientCollateralError(const U256& requested, const U256& available);

    const U256& requested() const noexcept { return requested_; }
    const U256& available() const noexcept { return available_; }

private:
    U256 requested_;
    U256 available_;
};

class DebtUnderflowError : public EngineError {
public:
    DebtUnderflowError(const U256& requested, const U256& available);

    const U256& requested() const noexcept { return requested_; }
    const U256& available() const noexcept { return available_; }

private:
    U256 requested_;
    U256 available_;
};

class BurnExceedsDebtError : public EngineError {
public:
    BurnExceedsDebtError(const U256& requested, const U256& available);

    const U256& requested() const noexcept { return requested_; }
    const U256& available() const noexcept { return available_; }

private:
    U256 requested_;
    U256 available_;
};

class HealthFactorBelowThresholdError : public EngineError {
public:
    explicit HealthFactorBelowThresholdError(const U256& health_factor);

    const U256& health_factor() const noexcept { return health_factor_; }

private:
    U256 health_factor_;
};

class HealthFactorOkError : public EngineError {
public:
    explicit HealthFactorOkError(const U256& health_factor);
};

class HealthFactorNotImprovedError : public EngineError {
public:
    HealthFactorNotImprovedError(const U256& before, const U256& after);
};

class MintFailedError : public EngineError {
public:
    MintFailedError() : EngineError(errors::MINT_FAILED, "DSCEngine: mint failed") {}
};

class TransferFailedError : public EngineError {
public:
    explicit TransferFailedError(const Address& token);
};

// Liquidation payout (covered amount + bonus) exceeds the target's collateral
class ExternalTransferUnderfundedError : public EngineError {
public:
    ExternalTransferUnderfundedError(const U256& payout, const U256& available);

    const U256& payout() const noexcept { return payout_; }
    const U256& available() const noexcept { return available_; }

private:
    U256 payout_;
    U256 available_;
};

class InvalidPriceError : public EngineError {
public:
    explicit InvalidPriceError(const std::string& msg)
        : EngineError(errors::INVALID_PRICE, msg) {}
};

class StalePriceError : public EngineError {
public:
    StalePriceError(uint64_t updated_at, uint64_t now);
};

class ArithmeticOverflowError : public EngineError {
public:
    explicit ArithmeticOverflowError(const std::string& msg)
        : EngineError(errors::ARITHMETIC_OVERFLOW, msg) {}
};

class ReentrancyError : public EngineError {
public:
    ReentrancyError() : EngineError(errors::REENTRANCY, "DSCEngine: reentrant call") {}
};

// A rollback could not be completed; ledgers and custody may disagree
class EngineHaltedError : public EngineError {
public:
    EngineHaltedError()
        : EngineError(errors::ENGINE_HALTED, "DSCEngine: halted after an incomplete rollback") {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& msg)
        : EngineError(errors::INVALID_CONFIG, msg) {}
};

} // namespace dsc

#endif // DSC_ERRORS_HPP
