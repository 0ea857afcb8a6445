// =============================================================================
// fixed_point.cpp - Checked X18 Arithmetic
// =============================================================================

#include "dsc/fixed_point.hpp"
#include "dsc/errors.hpp"

#include <stdexcept>

namespace dsc {
namespace x18 {

namespace {

// boost reports checked-integer failures as overflow_error (overflow,
// division by zero) or range_error (negative unsigned result)
template <typename Op>
U256 checked(const char* what, Op op) {
    try {
        return op();
    } catch (const std::overflow_error& e) {
        throw ArithmeticOverflowError(std::string(what) + ": " + e.what());
    } catch (const std::range_error& e) {
        throw ArithmeticOverflowError(std::string(what) + ": " + e.what());
    }
}

U256 pow10(unsigned exponent) {
    return checked("pow10", [exponent] {
        U256 result = 1;
        for (unsigned i = 0; i < exponent; ++i) {
            result *= 10u;
        }
        return result;
    });
}

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

U256 add(const U256& a, const U256& b) {
    return checked("x18::add", [&] { return U256(a + b); });
}

U256 sub(const U256& a, const U256& b) {
    if (b > a) {
        throw ArithmeticOverflowError("x18::sub: " + to_string(a) + " - " + to_string(b));
    }
    return U256(a - b);
}

U256 mul(const U256& a, const U256& b) {
    return checked("x18::mul", [&] { return U256(a * b); });
}

U256 div(const U256& a, const U256& b) {
    if (b == 0) {
        throw ArithmeticOverflowError("x18::div: division by zero");
    }
    return U256(a / b);
}

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    return div(mul(a, b), denominator);
}

U256 from_int(uint64_t whole) {
    return mul(U256(whole), constants::PRECISION);
}

U256 from_string(std::string_view digits) {
    if (!all_digits(digits)) {
        throw std::invalid_argument("not a base-10 integer: '" + std::string(digits) + "'");
    }
    return checked("x18::from_string", [&] { return U256(std::string(digits)); });
}

std::string to_string(const U256& v) {
    return v.str();
}

U256 parse_units(std::string_view text, unsigned decimals) {
    std::string_view whole = text;
    std::string_view fraction;

    auto dot = text.find('.');
    if (dot != std::string_view::npos) {
        whole = text.substr(0, dot);
        fraction = text.substr(dot + 1);
        if (!fraction.empty() && !all_digits(fraction)) {
            throw std::invalid_argument("invalid fractional part: '" + std::string(text) + "'");
        }
        if (whole.empty()) {
            whole = "0";
        }
    }
    if (!all_digits(whole)) {
        throw std::invalid_argument("invalid amount: '" + std::string(text) + "'");
    }
    if (fraction.size() > decimals) {
        throw std::invalid_argument("too many decimals in '" + std::string(text) + "'");
    }

    U256 scaled = mul(from_string(whole), pow10(decimals));
    if (!fraction.empty()) {
        U256 frac = mul(from_string(fraction), pow10(decimals - static_cast<unsigned>(fraction.size())));
        scaled = add(scaled, frac);
    }
    return scaled;
}

std::string format_units(const U256& v, unsigned decimals) {
    std::string digits = v.str();
    if (decimals == 0) return digits;

    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);

    auto last = fraction.find_last_not_of('0');
    if (last == std::string::npos) return whole;
    fraction.erase(last + 1);
    return whole + "." + fraction;
}

std::string format_health_factor(const U256& hf) {
    if (hf == U256_MAX) return "max";
    return format_units(hf, constants::DSC_DECIMALS);
}

} // namespace x18
} // namespace dsc
