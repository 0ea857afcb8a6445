#ifndef DSC_TYPES_HPP
#define DSC_TYPES_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace dsc {

// =============================================================================
// Addresses (EVM 20-byte identities for actors, tokens and feeds)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Default custody identity of the engine itself
constexpr Address DSC_ENGINE = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xd5,0xce};

// Build an address whose low 8 bytes hold `id` (test actors, mock tokens)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex digits; throws std::invalid_argument
Address from_hex(std::string_view hex);

// Lowercase "0x"-prefixed hex
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// 256-bit Checked Integers
//
// Every ledger amount, USD value and fixed-point intermediate is a U256.
// Overflow, negative unsigned results and division by zero raise instead of
// wrapping.
// =============================================================================

using U256 = boost::multiprecision::checked_uint256_t;
using I256 = boost::multiprecision::checked_int256_t;

inline const U256 U256_MAX = std::numeric_limits<U256>::max();

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {

inline const U256 PRECISION{1000000000000000000ULL};          // 1e18
inline const U256 ADDITIONAL_FEED_PRECISION{10000000000ULL};  // 1e10
inline const U256 MIN_HEALTH_FACTOR{1000000000000000000ULL};  // 1.0

constexpr uint64_t LIQUIDATION_THRESHOLD = 50;   // 50% overcollateralized
constexpr uint64_t LIQUIDATION_BONUS = 10;       // 10% bonus to liquidators
constexpr uint64_t LIQUIDATION_PRECISION = 100;

constexpr uint8_t FEED_DECIMALS = 8;
constexpr uint8_t DSC_DECIMALS = 18;
constexpr uint64_t ORACLE_TIMEOUT = 3 * 60 * 60;  // 3 hours in seconds

} // namespace constants

// =============================================================================
// Time
// =============================================================================

// Seconds since epoch; injectable so feeds and staleness checks are testable
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INVALID_ADDRESS = -2;
constexpr int32_t LENGTH_MISMATCH = -3;
constexpr int32_t TOKEN_NOT_ALLOWED = -6;
constexpr int32_t INSUFFICIENT_COLLATERAL = -10;
constexpr int32_t DEBT_UNDERFLOW = -11;
constexpr int32_t BURN_EXCEEDS_DEBT = -12;
constexpr int32_t BREAKS_HEALTH_FACTOR = -13;
constexpr int32_t HEALTH_FACTOR_OK = -15;
constexpr int32_t HEALTH_FACTOR_NOT_IMPROVED = -16;
constexpr int32_t LIQUIDATION_UNDERFUNDED = -17;
constexpr int32_t PRICE_STALE = -20;
constexpr int32_t INVALID_PRICE = -22;
constexpr int32_t TRANSFER_FAILED = -25;
constexpr int32_t MINT_FAILED = -26;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t ARITHMETIC_OVERFLOW = -31;
constexpr int32_t ENGINE_HALTED = -32;
constexpr int32_t INVALID_CONFIG = -40;

// Symbolic name of a code ("BREAKS_HEALTH_FACTOR"), "UNKNOWN" otherwise
const char* name(int32_t code);
} // namespace errors

} // namespace dsc

#endif // DSC_TYPES_HPP
