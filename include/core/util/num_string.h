/**
 * @file num_string.h
 * @brief Helpers for canonical numeric strings as sent by venues.
 *
 * Precision is always read from the decimal string itself; values are never
 * round-tripped through binary floating point to infer it.
 */

#pragma once

#include "core/errors.h"
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <cctype>

namespace quantgate::util {

inline std::string trim_trailing_zeros(std::string value) {
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        auto last = value.find_last_not_of('0');
        if (last != std::string::npos) {
            value.erase(last + 1);
        }
        if (!value.empty() && value.back() == '.') {
            value.pop_back();
        }
    }
    if (value.empty()) return std::string{"0"};
    return value;
}

/**
 * @brief True for [+-]digits[.digits][e[+-]digits] with at least one digit.
 */
inline bool is_decimal_string(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    bool digits = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    }
    if (!digits) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        bool exp_digits = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; exp_digits = true; }
        if (!exp_digits) return false;
    }
    return i == s.size();
}

// Decimal exponents beyond this magnitude are rejected as out of range.
inline constexpr int kMaxDecimalExponent = 1000;

/**
 * @brief Parse the text after 'e'/'E' of a decimal string.
 * @return nullopt when the exponent is not an integer or exceeds kMaxDecimalExponent
 */
inline std::optional<int> parse_exponent(std::string_view text) {
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value > kMaxDecimalExponent || value < -kMaxDecimalExponent) return std::nullopt;
    return value;
}

/**
 * @brief Number of significant digits after the decimal point.
 *
 * "0.01000000" -> 2, "1.00000000" -> 0, "10" -> 0, "1e-8" -> 8.
 * Caller must pass a valid decimal string (see is_decimal_string).
 * @throws OutOfRangeError when the exponent is out of range
 */
inline int precision_from_str(std::string_view s) {
    int exponent = 0;
    auto epos = s.find_first_of("eE");
    std::string_view mantissa = s;
    if (epos != std::string_view::npos) {
        auto parsed = parse_exponent(s.substr(epos + 1));
        if (!parsed) {
            throw OutOfRangeError("exponent of '" + std::string(s) + "' is out of range");
        }
        exponent = *parsed;
        mantissa = s.substr(0, epos);
    }
    int decimals = 0;
    auto dot = mantissa.find('.');
    if (dot != std::string_view::npos) {
        auto frac = mantissa.substr(dot + 1);
        auto last = frac.find_last_not_of('0');
        decimals = (last == std::string_view::npos) ? 0 : static_cast<int>(last + 1);
    }
    int precision = decimals - exponent;
    return precision < 0 ? 0 : precision;
}

} // namespace quantgate::util
