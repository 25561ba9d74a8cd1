/**
 * @file fixed_point.cpp
 */

#include "model/fixed_point.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include <limits>

namespace quantgate::model {

namespace detail {

namespace {

constexpr int64_t kPow10[] = {
    1LL, 10LL, 100LL, 1000LL, 10000LL, 100000LL, 1000000LL, 10000000LL, 100000000LL, 1000000000LL,
};

} // namespace

void parse_fixed(std::string_view s, int64_t& raw, int& precision) {
    if (!util::is_decimal_string(s)) {
        throw InvalidArgumentError("invalid decimal string '" + std::string(s) + "'");
    }
    bool negative = false;
    std::size_t i = 0;
    if (s[i] == '+' || s[i] == '-') {
        negative = (s[i] == '-');
        ++i;
    }
    std::string_view body = s.substr(i);

    int exponent = 0;
    std::string_view mantissa = body;
    if (auto epos = body.find_first_of("eE"); epos != std::string_view::npos) {
        auto parsed = util::parse_exponent(body.substr(epos + 1));
        if (!parsed) {
            throw OutOfRangeError("exponent of '" + std::string(s) + "' is out of range");
        }
        exponent = *parsed;
        mantissa = body.substr(0, epos);
    }

    std::string digits;
    int frac_len = 0;
    if (auto dot = mantissa.find('.'); dot == std::string_view::npos) {
        digits.assign(mantissa.begin(), mantissa.end());
    } else {
        digits.assign(mantissa.begin(), mantissa.begin() + static_cast<std::ptrdiff_t>(dot));
        digits.append(mantissa.substr(dot + 1));
        frac_len = static_cast<int>(mantissa.size() - dot - 1);
    }

    int scale = frac_len - exponent;
    while (scale > kFixedPrecision && !digits.empty() && digits.back() == '0') {
        digits.pop_back();
        --scale;
    }
    if (scale > kFixedPrecision) {
        throw OutOfRangeError("precision of '" + std::string(s) + "' exceeds " +
                              std::to_string(kFixedPrecision));
    }

    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t acc = 0;
    auto push = [&](unsigned d) {
        if (acc > (limit - d) / 10) {
            throw OutOfRangeError("'" + std::string(s) + "' exceeds fixed-point range");
        }
        acc = acc * 10 + d;
    };
    for (char c : digits) push(static_cast<unsigned>(c - '0'));
    for (int k = scale; k < kFixedPrecision; ++k) push(0);

    raw = negative ? -static_cast<int64_t>(acc) : static_cast<int64_t>(acc);
    precision = scale < 0 ? 0 : scale;
}

std::string format_fixed(int64_t raw, int precision) {
    const bool negative = raw < 0;
    const uint64_t abs = negative ? (~static_cast<uint64_t>(raw) + 1) : static_cast<uint64_t>(raw);
    const uint64_t int_part = abs / static_cast<uint64_t>(kFixedScalar);
    const uint64_t frac_part = abs % static_cast<uint64_t>(kFixedScalar);

    std::string out;
    if (negative && abs != 0) out.push_back('-');
    out += std::to_string(int_part);
    if (precision > 0) {
        std::string frac = std::to_string(frac_part);
        frac.insert(frac.begin(), static_cast<std::size_t>(kFixedPrecision) - frac.size(), '0');
        out.push_back('.');
        out.append(frac, 0, static_cast<std::size_t>(precision > kFixedPrecision ? kFixedPrecision : precision));
    }
    return out;
}

int64_t round_raw(int64_t raw, int precision) {
    if (precision < 0) {
        throw InvalidArgumentError("negative precision " + std::to_string(precision));
    }
    if (precision > kFixedPrecision) {
        throw OutOfRangeError("precision " + std::to_string(precision) + " exceeds " +
                              std::to_string(kFixedPrecision));
    }
    const int64_t unit = kPow10[kFixedPrecision - precision];
    if (unit == 1) return raw;
    int64_t q = raw / unit;
    const int64_t r = raw % unit;
    const int64_t abs_r = r < 0 ? -r : r;
    if (abs_r * 2 >= unit) q += (raw < 0 ? -1 : 1);
    return q * unit;
}

} // namespace detail

void QuantityTag::validate(int64_t raw, std::string_view s) {
    if (raw < 0) {
        throw OutOfRangeError("quantity '" + std::string(s) + "' is negative");
    }
}

} // namespace quantgate::model
