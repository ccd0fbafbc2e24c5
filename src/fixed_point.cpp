#include "core/fixed_point.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace perpx {

namespace {

constexpr int kDecimals = 18;

void accumulate_digit(Amount& acc, char c, const std::string& text) {
    constexpr Amount kMax = std::numeric_limits<Amount>::max();
    Amount digit = static_cast<Amount>(c - '0');
    if (acc > (kMax - digit) / 10) {
        throw std::invalid_argument("amount out of range: " + text);
    }
    acc = acc * 10 + digit;
}

} // namespace

Amount parse_amount(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }

    Amount whole = 0;
    Amount frac = 0;
    int frac_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_point) throw std::invalid_argument("malformed amount: " + text);
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("malformed amount: " + text);
        }
        seen_digit = true;
        if (!seen_point) {
            accumulate_digit(whole, c, text);
        } else if (frac_digits < kDecimals) {
            accumulate_digit(frac, c, text);
            ++frac_digits;
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("malformed amount: " + text);
    }

    for (int i = frac_digits; i < kDecimals; ++i) {
        frac *= 10;
    }

    if (whole > (std::numeric_limits<Amount>::max() - frac) / kPriceScale) {
        throw std::invalid_argument("amount out of range: " + text);
    }
    return whole * kPriceScale + frac;
}

std::string to_string(Amount value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string format_amount(Amount value) {
    std::string out = to_string(value / kPriceScale);

    Amount frac = value % kPriceScale;
    if (frac == 0) return out;

    std::string digits = to_string(frac);
    digits.insert(0, kDecimals - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    return out + "." + digits;
}

Amount mul_div(Amount a, Amount b, Amount denominator) {
    if (denominator == 0) {
        throw std::overflow_error("mul_div: division by zero");
    }

    // 128x128 -> 256 schoolbook multiply on 64-bit limbs.
    constexpr Amount kLow64 = (static_cast<Amount>(1) << 64) - 1;
    Amount a0 = a & kLow64, a1 = a >> 64;
    Amount b0 = b & kLow64, b1 = b >> 64;

    Amount p00 = a0 * b0;
    Amount p01 = a0 * b1;
    Amount p10 = a1 * b0;
    Amount p11 = a1 * b1;

    Amount mid = (p00 >> 64) + (p01 & kLow64) + (p10 & kLow64);
    Amount lo  = (mid << 64) | (p00 & kLow64);
    Amount hi  = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);

    if (hi >= denominator) {
        throw std::overflow_error("mul_div: result exceeds 128 bits");
    }

    // Restoring division of (hi:lo) by denominator; hi is the running remainder.
    Amount quotient = 0;
    Amount rem = hi;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((lo >> i) & 1);
        quotient <<= 1;
        if (carry || rem >= denominator) {
            rem -= denominator;
            quotient |= 1;
        }
    }
    return quotient;
}

double to_double(Amount value) {
    return static_cast<double>(value / kPriceScale)
         + static_cast<double>(value % kPriceScale) / static_cast<double>(kPriceScale);
}

} // namespace perpx
