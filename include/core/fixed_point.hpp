#pragma once

#include <cstdint>
#include <string>

namespace perpx {

// Unsigned fixed point with 18 implied decimals.
using U128   = unsigned __int128;
using Amount = U128;

constexpr Amount   kPriceScale     = 1000000000000000000ULL; // 1e18
constexpr uint32_t kBpsDenominator = 10000;
constexpr Amount   kMaxAmount      = ~Amount{0};

// n whole units, e.g. units(2000) == 2000e18
constexpr Amount units(uint64_t n) {
    return static_cast<Amount>(n) * kPriceScale;
}

// Parse a non-negative decimal string ("2000", "0.25") into fixed point.
// Digits beyond the 18th decimal are truncated. Throws std::invalid_argument.
Amount parse_amount(const std::string& text);

// Raw integer representation.
std::string to_string(Amount value);

// Decimal representation with trailing zeros trimmed, e.g. "2000.5".
std::string format_amount(Amount value);

// value * bps / 10000, truncating. Split on the quotient so that any value
// works for bps <= 10000.
constexpr Amount apply_bps(Amount value, uint32_t bps) {
    return value / kBpsDenominator * bps + value % kBpsDenominator * bps / kBpsDenominator;
}

// a * b / denominator with a 256-bit intermediate, truncating.
// Throws std::overflow_error if the result does not fit or denominator is 0.
Amount mul_div(Amount a, Amount b, Amount denominator);

double to_double(Amount value);

} // namespace perpx
