// =============================================================================
// errors.cpp - Engine Error Messages
// =============================================================================

#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"

#include <fmt/format.h>

namespace dsc {

UnregisteredAssetError::UnregisteredAssetError(const Address& token)
    : EngineError(errors::TOKEN_NOT_ALLOWED,
                  fmt::format("DSCEngine: token not allowed {}", addresses::to_hex(token))),
      token_(token) {}

LengthMismatchError::LengthMismatchError(size_t tokens, size_t feeds)
    : EngineError(errors::LENGTH_MISMATCH,
                  fmt::format("DSCEngine: token addresses and price feed addresses must be "
                              "same length ({} != {})", tokens, feeds)) {}

InsufficientCollateralError::InsufficientCollateralError(const U256& requested,
                                                         const U256& available)
    : EngineError(errors::INSUFFICIENT_COLLATERAL,
                  fmt::format("DSCEngine: insufficient collateral (requested {}, available {})",
                              x18::to_string(requested), x18::to_string(available))),
      requested_(requested),
      available_(available) {}

DebtUnderflowError::DebtUnderflowError(const U256& requested, const U256& available)
    : EngineError(errors::DEBT_UNDERFLOW,
                  fmt::format("DSCEngine: debt underflow (requested {}, available {})",
                              x18::to_string(requested), x18::to_string(available))),
      requested_(requested),
      available_(available) {}

BurnExceedsDebtError::BurnExceedsDebtError(const U256& requested, const U256& available)
    : EngineError(errors::BURN_EXCEEDS_DEBT,
                  fmt::format("DSCEngine: burn amount exceeds debt (requested {}, debt {})",
                              x18::to_string(requested), x18::to_string(available))),
      requested_(requested),
      available_(available) {}

HealthFactorBelowThresholdError::HealthFactorBelowThresholdError(const U256& health_factor)
    : EngineError(errors::BREAKS_HEALTH_FACTOR,
                  fmt::format("DSCEngine: breaks health factor ({})",
                              x18::format_health_factor(health_factor))),
      health_factor_(health_factor) {}

HealthFactorOkError::HealthFactorOkError(const U256& health_factor)
    : EngineError(errors::HEALTH_FACTOR_OK,
                  fmt::format("DSCEngine: health factor ok ({})",
                              x18::format_health_factor(health_factor))) {}

HealthFactorNotImprovedError::HealthFactorNotImprovedError(const U256& before, const U256& after)
    : EngineError(errors::HEALTH_FACTOR_NOT_IMPROVED,
                  fmt::format("DSCEngine: health factor not improved ({} -> {})",
                              x18::format_health_factor(before),
                              x18::format_health_factor(after))) {}

TransferFailedError::TransferFailedError(const Address& token)
    : EngineError(errors::TRANSFER_FAILED,
                  fmt::format("DSCEngine: transfer failed for {}", addresses::to_hex(token))) {}

ExternalTransferUnderfundedError::ExternalTransferUnderfundedError(const U256& payout,
                                                                   const U256& available)
    : EngineError(errors::LIQUIDATION_UNDERFUNDED,
                  fmt::format("DSCEngine: liquidation payout {} exceeds collateral {}",
                              x18::to_string(payout), x18::to_string(available))),
      payout_(payout),
      available_(available) {}

StalePriceError::StalePriceError(uint64_t updated_at, uint64_t now)
    : EngineError(errors::PRICE_STALE,
                  fmt::format("OracleLib: stale price (updated at {}, now {})", updated_at, now)) {}

} // namespace dsc
