// =============================================================================
// types.cpp - Addresses, Clock, Error Codes
// =============================================================================

#include "dsc/types.hpp"
#include <chrono>
#include <stdexcept>

namespace dsc {

namespace addresses {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must be 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + 2 * addr.size());
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case INVALID_ADDRESS: return "INVALID_ADDRESS";
        case LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case TOKEN_NOT_ALLOWED: return "TOKEN_NOT_ALLOWED";
        case INSUFFICIENT_COLLATERAL: return "INSUFFICIENT_COLLATERAL";
        case DEBT_UNDERFLOW: return "DEBT_UNDERFLOW";
        case BURN_EXCEEDS_DEBT: return "BURN_EXCEEDS_DEBT";
        case BREAKS_HEALTH_FACTOR: return "BREAKS_HEALTH_FACTOR";
        case HEALTH_FACTOR_OK: return "HEALTH_FACTOR_OK";
        case HEALTH_FACTOR_NOT_IMPROVED: return "HEALTH_FACTOR_NOT_IMPROVED";
        case LIQUIDATION_UNDERFUNDED: return "LIQUIDATION_UNDERFUNDED";
        case PRICE_STALE: return "PRICE_STALE";
        case INVALID_PRICE: return "INVALID_PRICE";
        case TRANSFER_FAILED: return "TRANSFER_FAILED";
        case MINT_FAILED: return "MINT_FAILED";
        case REENTRANCY: return "REENTRANCY";
        case ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ENGINE_HALTED: return "ENGINE_HALTED";
        case INVALID_CONFIG: return "INVALID_CONFIG";
        default: return "UNKNOWN";
    }
}

} // namespace errors

} // namespace dsc
