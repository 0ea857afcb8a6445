#ifndef DSC_FIXED_POINT_HPP
#define DSC_FIXED_POINT_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Checked Fixed-Point Arithmetic (X18 = 18 decimal places)
//
// Thin wrappers over the checked U256 operators that report failures as
// ArithmeticOverflowError. Division always truncates toward zero.
// =============================================================================

namespace x18 {

U256 add(const U256& a, const U256& b);
U256 sub(const U256& a, const U256& b);
U256 mul(const U256& a, const U256& b);
U256 div(const U256& a, const U256& b);

// (a * b) / denominator; the product itself must fit in 256 bits
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// whole * 1e18
U256 from_int(uint64_t whole);

// Plain base-10 integer, e.g. "15000000000000000000000"
U256 from_string(std::string_view digits);
std::string to_string(const U256& v);

// Human decimal to scaled integer: parse_units("0.1", 18) == 1e17.
// Rejects signs, exponents and more fractional digits than `decimals`.
U256 parse_units(std::string_view text, unsigned decimals);

// Scaled integer to human decimal without trailing zeros: "1.5", "3000"
std::string format_units(const U256& v, unsigned decimals);

// Ratio as a decimal string, "max" for the infinite health factor
std::string format_health_factor(const U256& hf);

} // namespace x18

} // namespace dsc

#endif // DSC_FIXED_POINT_HPP
