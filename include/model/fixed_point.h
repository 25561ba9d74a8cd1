/**
 * @file fixed_point.h
 * @brief Exact decimal fixed-point values (Price, Quantity, Decimal).
 *
 * Values are stored as a signed 64-bit integer scaled by 10^9 together with
 * the display precision taken from the source string. Two values are equal
 * when both raw value and precision match.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace quantgate::model {

inline constexpr int kFixedPrecision = 9;
inline constexpr int64_t kFixedScalar = 1'000'000'000;

// Largest magnitude representable at kFixedPrecision.
inline constexpr double kFixedMax = 9223372036.0;

namespace detail {

// Parse a decimal string into raw/precision. Throws InvalidArgumentError on
// malformed input and OutOfRangeError on overflow or precision > 9.
void parse_fixed(std::string_view s, int64_t& raw, int& precision);

// Render raw/precision with exactly `precision` fractional digits.
std::string format_fixed(int64_t raw, int precision);

// Round raw (at scale 10^9) to `precision` digits, half away from zero.
int64_t round_raw(int64_t raw, int precision);

} // namespace detail

template <typename Tag>
class FixedPoint {
public:
    FixedPoint() = default;

    static FixedPoint from_str(std::string_view s) {
        FixedPoint v;
        detail::parse_fixed(s, v.raw_, v.precision_);
        Tag::validate(v.raw_, s);
        return v;
    }

    // Parse and re-express at the given precision (rounding if required).
    static FixedPoint from_str(std::string_view s, int precision) {
        return from_str(s).with_precision(precision);
    }

    static FixedPoint from_raw(int64_t raw, int precision) {
        FixedPoint v;
        v.raw_ = detail::round_raw(raw, precision);
        v.precision_ = precision;
        return v;
    }

    static FixedPoint zero(int precision = 0) { return from_raw(0, precision); }

    FixedPoint with_precision(int precision) const { return from_raw(raw_, precision); }

    // Value divided by 100, keeping two extra digits where precision allows.
    FixedPoint percent_to_ratio() const {
        const int precision = precision_ + 2 > kFixedPrecision ? kFixedPrecision : precision_ + 2;
        return from_raw(raw_ / 100, precision);
    }

    // Same value at the smallest precision that represents it exactly.
    FixedPoint normalized() const {
        int precision = precision_;
        while (precision > 0 && detail::round_raw(raw_, precision - 1) == raw_) --precision;
        return from_raw(raw_, precision);
    }

    int64_t raw() const { return raw_; }
    int precision() const { return precision_; }
    bool is_zero() const { return raw_ == 0; }
    bool is_positive() const { return raw_ > 0; }
    double as_double() const { return static_cast<double>(raw_) / static_cast<double>(kFixedScalar); }
    std::string to_string() const { return detail::format_fixed(raw_, precision_); }

    bool operator==(const FixedPoint& o) const { return raw_ == o.raw_ && precision_ == o.precision_; }
    bool operator!=(const FixedPoint& o) const { return !(*this == o); }
    bool operator<(const FixedPoint& o) const { return raw_ < o.raw_; }
    bool operator>(const FixedPoint& o) const { return raw_ > o.raw_; }
    bool operator<=(const FixedPoint& o) const { return raw_ <= o.raw_; }
    bool operator>=(const FixedPoint& o) const { return raw_ >= o.raw_; }

private:
    int64_t raw_{0};
    int precision_{0};
};

struct PriceTag {
    static void validate(int64_t, std::string_view) {}
};

struct QuantityTag {
    // Quantities are never negative.
    static void validate(int64_t raw, std::string_view s);
};

struct DecimalTag {
    static void validate(int64_t, std::string_view) {}
};

using Price = FixedPoint<PriceTag>;
using Quantity = FixedPoint<QuantityTag>;
using Decimal = FixedPoint<DecimalTag>;

} // namespace quantgate::model
