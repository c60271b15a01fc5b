/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include "dimtol/contract.hpp"
#include "dimtol/decimal.hpp"
#include "dimtol/error.hpp"
#include "dimtol/format_spec.hpp"
#include "dimtol/unit.hpp"

namespace dimtol {

template<typename Rep>
struct fixed_traits;

template<>
struct fixed_traits<std::int16_t> {
    static constexpr std::string_view name = "F16";
};

template<>
struct fixed_traits<std::int32_t> {
    static constexpr std::string_view name = "F32";
};

template<>
struct fixed_traits<std::int64_t> {
    static constexpr std::string_view name = "F64";
};

namespace detail {

// Two's-complement wrapping arithmetic without signed overflow UB.
template<typename Rep>
constexpr Rep wrap(std::uint64_t bits) {
    return static_cast<Rep>(static_cast<std::make_unsigned_t<Rep>>(bits));
}

template<typename Rep>
constexpr std::uint64_t bits_of(Rep v) {
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
}

template<typename Rep>
constexpr Rep wrapping_add(Rep a, Rep b) { return wrap<Rep>(bits_of(a) + bits_of(b)); }

template<typename Rep>
constexpr Rep wrapping_sub(Rep a, Rep b) { return wrap<Rep>(bits_of(a) - bits_of(b)); }

template<typename Rep>
constexpr Rep wrapping_mul(Rep a, Rep b) { return wrap<Rep>(bits_of(a) * bits_of(b)); }

template<typename Rep>
constexpr Rep wrapping_neg(Rep a) { return wrap<Rep>(0 - bits_of(a)); }

template<typename Rep>
constexpr Rep wrapping_div(Rep a, Rep b) {
    DIMTOL_EXPECTS(b != 0, "division by zero");
    if (b == -1) return wrapping_neg(a);
    return static_cast<Rep>(a / b);
}

template<typename Rep>
constexpr Rep wrap_wide(decimal::wide_t v) {
    return wrap<Rep>(static_cast<std::uint64_t>(static_cast<unsigned __int128>(v)));
}

template<typename Rep, typename Int>
constexpr bool fits(Int v) {
    if constexpr (std::is_signed_v<Int>) {
        return static_cast<std::int64_t>(v) >= std::numeric_limits<Rep>::min() &&
               static_cast<std::int64_t>(v) <= std::numeric_limits<Rep>::max();
    } else {
        return static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<Rep>::max());
    }
}

constexpr bool fits_wide(decimal::wide_t v, std::int64_t lo, std::int64_t hi) {
    return v >= lo && v <= hi;
}

} // namespace detail

/**
 * Exact length stored as a signed count of ticks (1/10 um).
 *
 *  * 10      = 1 um
 *  * 10'000  = 1 mm
 *
 * Template parameters:
 * - Rep: backing integer (int16_t, int32_t, int64_t)
 *
 * Same-width operators wrap like the backing integer. Checked conversions
 * (parse, checked_from, checked_from_mm) throw overflow_error. Conversions
 * that trust the caller (from_mm, raw numbers in tolerance builders,
 * cross-width operators) treat overflow as a contract violation.
 */
template<typename Rep>
class fixed_point {
public:
    static_assert(std::is_same_v<Rep, std::int16_t> || std::is_same_v<Rep, std::int32_t> ||
                  std::is_same_v<Rep, std::int64_t>, "Unsupported backing type");

    using rep = Rep;
    using bytes_type = std::array<std::uint8_t, sizeof(Rep)>;
    static constexpr std::string_view type_name = fixed_traits<Rep>::name;

    static const fixed_point ONE;   // 1 mm
    static const fixed_point ZERO;
    static const fixed_point MIN;
    static const fixed_point MAX;

    // Constructors
    constexpr fixed_point() : ticks_(0) {}

    // Widening is implicit and always exact.
    template<typename Other, typename = std::enable_if_t<(sizeof(Other) < sizeof(Rep))>>
    constexpr fixed_point(fixed_point<Other> narrower) : ticks_(narrower.ticks()) {}

    // Factory methods
    static constexpr fixed_point from_raw(Rep raw) {
        fixed_point f;
        f.ticks_ = raw;
        return f;
    }

    // Millimeters. Out-of-range input is a contract violation.
    static fixed_point from_mm(double mm) {
        auto ticks = scale_mm(mm);
        DIMTOL_EXPECTS(ticks.has_value(), fmt::format("{} overflow, {} mm is beyond the limits of this type", type_name, mm));
        return from_raw(*ticks);
    }

    // Millimeters. Throws overflow_error for out-of-range or NaN input.
    static fixed_point checked_from_mm(double mm) {
        auto ticks = scale_mm(mm);
        if (!ticks) {
            throw overflow_error(fmt::format("{} mm is too big for {}", mm, type_name));
        }
        return from_raw(*ticks);
    }

    // Raw ticks of any integer type. Throws overflow_error when out of range.
    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    static fixed_point checked_from(Int raw) {
        if (!detail::fits<Rep>(raw)) {
            throw overflow_error(fmt::format("{} is too big for {}", raw, type_name));
        }
        return from_raw(static_cast<Rep>(raw));
    }

    // Narrowing (or same width) conversion. Throws overflow_error when out of range.
    template<typename Other>
    static fixed_point checked_from(fixed_point<Other> other) {
        if (!detail::fits<Rep>(other.ticks())) {
            throw overflow_error(fmt::format("{} ({} ticks) does not fit into {}",
                                             other.type_name, other.ticks(), type_name));
        }
        return from_raw(static_cast<Rep>(other.ticks()));
    }

    template<typename Other>
    static std::optional<fixed_point> try_narrow(fixed_point<Other> other) {
        if (!detail::fits<Rep>(other.ticks())) return std::nullopt;
        return from_raw(static_cast<Rep>(other.ticks()));
    }

    // Unit multiplier as a length, e.g. units::MM -> 1 mm.
    static fixed_point from_unit(const unit& u) {
        DIMTOL_EXPECTS(detail::fits<Rep>(u.multiply()), fmt::format("unit out of scope for {}", type_name));
        return from_raw(static_cast<Rep>(u.multiply()));
    }

    // Parses millimeters. Throws parse_error or overflow_error.
    static fixed_point parse(std::string_view text) {
        std::int64_t ticks = decimal::parse_ticks(text, type_name);
        if (!detail::fits<Rep>(ticks)) {
            throw overflow_error(fmt::format("'{}' is too big for {}", decimal::trim(text), type_name));
        }
        return from_raw(static_cast<Rep>(ticks));
    }

    static std::optional<fixed_point> try_parse(std::string_view text) {
        try {
            return parse(text);
        } catch (const error&) {
            return std::nullopt;
        }
    }

    static constexpr fixed_point from_be_bytes(const bytes_type& bytes) {
        std::uint64_t bits = 0;
        for (std::size_t i = 0; i < sizeof(Rep); ++i) bits = (bits << 8) | bytes[i];
        return from_raw(detail::wrap<Rep>(bits));
    }

    static constexpr fixed_point from_le_bytes(const bytes_type& bytes) {
        std::uint64_t bits = 0;
        for (std::size_t i = sizeof(Rep); i-- > 0;) bits = (bits << 8) | bytes[i];
        return from_raw(detail::wrap<Rep>(bits));
    }

    static fixed_point from_ne_bytes(const bytes_type& bytes) {
        Rep raw;
        std::memcpy(&raw, bytes.data(), sizeof(Rep));
        return from_raw(raw);
    }

    // Conversions
    constexpr Rep ticks() const { return ticks_; }
    constexpr std::int64_t as_i64() const { return ticks_; }

    // Millimeters
    double as_f64() const {
        return static_cast<double>(ticks_) / static_cast<double>(decimal::ticks_per_mm);
    }

    double as_unit(const unit& u) const {
        return static_cast<double>(ticks_) / static_cast<double>(u.multiply());
    }

    constexpr bytes_type to_be_bytes() const {
        bytes_type out{};
        auto bits = detail::bits_of(ticks_);
        for (std::size_t i = sizeof(Rep); i-- > 0;) {
            out[i] = static_cast<std::uint8_t>(bits & 0xff);
            bits >>= 8;
        }
        return out;
    }

    constexpr bytes_type to_le_bytes() const {
        bytes_type out{};
        auto bits = detail::bits_of(ticks_);
        for (std::size_t i = 0; i < sizeof(Rep); ++i) {
            out[i] = static_cast<std::uint8_t>(bits & 0xff);
            bits >>= 8;
        }
        return out;
    }

    bytes_type to_ne_bytes() const {
        bytes_type out{};
        std::memcpy(out.data(), &ticks_, sizeof(Rep));
        return out;
    }

    // Rounds to the nearest multiple of 'u', halves away from zero.
    fixed_point round(const unit& u) const {
        return from_wide(decimal::round_to_multiple(ticks_, u.multiply()), "round");
    }

    // Largest multiple of 'u' that is less than or equal to this value.
    fixed_point floor(const unit& u) const {
        return from_wide(decimal::floor_to_multiple(ticks_, u.multiply()), "floor");
    }

    constexpr fixed_point abs() const {
        return ticks_ < 0 ? from_raw(detail::wrapping_neg(ticks_)) : *this;
    }

    constexpr fixed_point abs_diff(fixed_point other) const {
        return from_raw(detail::wrapping_sub(ticks_, other.ticks_)).abs();
    }

    // -1, 0 or +1 ticks.
    constexpr fixed_point signum() const {
        return from_raw(static_cast<Rep>(is_negative() ? -1 : (is_positive() ? 1 : 0)));
    }

    constexpr bool is_negative() const { return ticks_ < 0; }
    constexpr bool is_positive() const { return ticks_ > 0; }
    constexpr bool is_zero() const { return ticks_ == 0; }

    // String representation
    std::string to_string() const { return to_string(format_spec{}); }

    std::string to_string(const format_spec& spec) const {
        auto sign = spec.sign_plus ? decimal::sign_style::always : decimal::sign_style::negative_only;
        if (spec.alternate) return decimal::format_raw(ticks_, sign);
        int p = resolve_precision(spec);
        if (p < 0) p = decimal::auto_precision(ticks_);
        return decimal::format_ticks(ticks_, p, sign);
    }

    std::string to_string(int precision) const {
        format_spec spec;
        spec.precision = precision;
        return to_string(spec);
    }

    // F64(12.5000)
    std::string debug_string() const {
        return fmt::format("{}({})", type_name, decimal::format_ticks(ticks_, decimal::max_precision));
    }

    // Arithmetic operators
    constexpr fixed_point operator+(fixed_point other) const {
        return from_raw(detail::wrapping_add(ticks_, other.ticks_));
    }

    constexpr fixed_point operator-(fixed_point other) const {
        return from_raw(detail::wrapping_sub(ticks_, other.ticks_));
    }

    // Both operands in mm: (a * b) / 1 mm, 128-bit intermediate.
    constexpr fixed_point operator*(fixed_point other) const {
        decimal::wide_t wide = static_cast<decimal::wide_t>(ticks_) * other.ticks_;
        return from_raw(detail::wrap_wide<Rep>(wide / decimal::ticks_per_mm));
    }

    constexpr fixed_point operator/(fixed_point other) const {
        DIMTOL_EXPECTS(other.ticks_ != 0, "division by zero");
        decimal::wide_t wide = static_cast<decimal::wide_t>(ticks_) * decimal::ticks_per_mm;
        return from_raw(detail::wrap_wide<Rep>(wide / other.ticks_));
    }

    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    constexpr fixed_point operator*(Int factor) const {
        return from_raw(detail::wrapping_mul(ticks_, static_cast<Rep>(factor)));
    }

    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    constexpr fixed_point operator/(Int divisor) const {
        return from_raw(detail::wrapping_div(ticks_, static_cast<Rep>(divisor)));
    }

    // Raw ticks; the addend has to fit the backing type.
    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    constexpr fixed_point operator+(Int ticks) const {
        DIMTOL_EXPECTS(detail::fits<Rep>(ticks), "addend out of scope");
        return from_raw(detail::wrapping_add(ticks_, static_cast<Rep>(ticks)));
    }

    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    constexpr fixed_point operator-(Int ticks) const {
        DIMTOL_EXPECTS(detail::fits<Rep>(ticks), "subtrahend out of scope");
        return from_raw(detail::wrapping_sub(ticks_, static_cast<Rep>(ticks)));
    }

    // Assignment operators
    fixed_point& operator+=(fixed_point other) {
        ticks_ = detail::wrapping_add(ticks_, other.ticks_);
        return *this;
    }

    fixed_point& operator-=(fixed_point other) {
        ticks_ = detail::wrapping_sub(ticks_, other.ticks_);
        return *this;
    }

    fixed_point& operator*=(fixed_point other) {
        *this = *this * other;
        return *this;
    }

    fixed_point& operator/=(fixed_point other) {
        *this = *this / other;
        return *this;
    }

    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    fixed_point& operator*=(Int factor) {
        *this = *this * factor;
        return *this;
    }

    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    fixed_point& operator/=(Int divisor) {
        *this = *this / divisor;
        return *this;
    }

    // Comparison operators
    constexpr bool operator==(fixed_point other) const { return ticks_ == other.ticks_; }
    constexpr bool operator!=(fixed_point other) const { return ticks_ != other.ticks_; }
    constexpr bool operator<(fixed_point other) const { return ticks_ < other.ticks_; }
    constexpr bool operator<=(fixed_point other) const { return ticks_ <= other.ticks_; }
    constexpr bool operator>(fixed_point other) const { return ticks_ > other.ticks_; }
    constexpr bool operator>=(fixed_point other) const { return ticks_ >= other.ticks_; }

    // Unary operators
    constexpr fixed_point operator-() const { return from_raw(detail::wrapping_neg(ticks_)); }
    constexpr fixed_point operator+() const { return *this; }

private:
    static std::optional<Rep> scale_mm(double mm) {
        double scaled = mm * static_cast<double>(decimal::ticks_per_mm);
        if (!(scaled > static_cast<double>(std::numeric_limits<Rep>::min()) - 1.0 &&
              scaled < static_cast<double>(std::numeric_limits<Rep>::max()) + 1.0)) {
            return std::nullopt;
        }
        double ticks = std::trunc(scaled);
        if (ticks < static_cast<double>(std::numeric_limits<Rep>::min()) ||
            ticks >= -static_cast<double>(std::numeric_limits<Rep>::min())) {
            return std::nullopt;
        }
        return static_cast<Rep>(ticks);
    }

    static fixed_point from_wide(decimal::wide_t v, const char* op) {
        DIMTOL_EXPECTS(detail::fits_wide(v, std::numeric_limits<Rep>::min(), std::numeric_limits<Rep>::max()),
                       fmt::format("{} overflows {}", op, type_name));
        return from_raw(static_cast<Rep>(v));
    }

    Rep ticks_;
};

template<typename Rep>
constexpr fixed_point<Rep> fixed_point<Rep>::ONE = fixed_point<Rep>::from_raw(static_cast<Rep>(decimal::ticks_per_mm));

template<typename Rep>
constexpr fixed_point<Rep> fixed_point<Rep>::ZERO = fixed_point<Rep>::from_raw(0);

template<typename Rep>
constexpr fixed_point<Rep> fixed_point<Rep>::MIN = fixed_point<Rep>::from_raw(std::numeric_limits<Rep>::min());

template<typename Rep>
constexpr fixed_point<Rep> fixed_point<Rep>::MAX = fixed_point<Rep>::from_raw(std::numeric_limits<Rep>::max());

// Common fixed-point widths
using F16 = fixed_point<std::int16_t>;  // +/- 3.2767 mm
using F32 = fixed_point<std::int32_t>;  // +/- 214.7483647 m
using F64 = fixed_point<std::int64_t>;

template<typename Int, typename Rep, typename = std::enable_if_t<std::is_integral_v<Int>>>
constexpr fixed_point<Rep> operator*(Int factor, fixed_point<Rep> f) {
    return f * factor;
}

// Cross-width arithmetic widens the narrower operand; overflow of the
// wider result is a contract violation.
template<typename A, typename B, typename = std::enable_if_t<sizeof(A) != sizeof(B)>>
fixed_point<std::conditional_t<(sizeof(A) > sizeof(B)), A, B>>
operator+(fixed_point<A> a, fixed_point<B> b) {
    using W = std::conditional_t<(sizeof(A) > sizeof(B)), A, B>;
    decimal::wide_t sum = static_cast<decimal::wide_t>(a.ticks()) + b.ticks();
    DIMTOL_EXPECTS(detail::fits_wide(sum, std::numeric_limits<W>::min(), std::numeric_limits<W>::max()),
                   "addend out of scope");
    return fixed_point<W>::from_raw(static_cast<W>(sum));
}

template<typename A, typename B, typename = std::enable_if_t<sizeof(A) != sizeof(B)>>
fixed_point<std::conditional_t<(sizeof(A) > sizeof(B)), A, B>>
operator-(fixed_point<A> a, fixed_point<B> b) {
    using W = std::conditional_t<(sizeof(A) > sizeof(B)), A, B>;
    decimal::wide_t diff = static_cast<decimal::wide_t>(a.ticks()) - b.ticks();
    DIMTOL_EXPECTS(detail::fits_wide(diff, std::numeric_limits<W>::min(), std::numeric_limits<W>::max()),
                   "minuend out of scope");
    return fixed_point<W>::from_raw(static_cast<W>(diff));
}

// Sum of a range of fixed-point (or tolerance) values.
template<typename Range>
auto sum(const Range& values) -> std::decay_t<decltype(*std::begin(values))> {
    using value_type = std::decay_t<decltype(*std::begin(values))>;
    value_type total = value_type::ZERO;
    for (const auto& v : values) total += v;
    return total;
}

namespace detail {

template<typename T>
struct is_fixed_point : std::false_type {};

template<typename Rep>
struct is_fixed_point<fixed_point<Rep>> : std::true_type {};

/**
 * Converts a builder argument into 'F': fixed-point values of any width,
 * raw integer ticks or double millimeters. Values that do not fit are a
 * contract violation.
 */
template<typename F, typename Arg>
F to_fixed(const Arg& arg) {
    if constexpr (is_fixed_point<Arg>::value) {
        DIMTOL_EXPECTS(fits<typename F::rep>(arg.ticks()),
                       fmt::format("{} does not fit into {}", arg.debug_string(), F::type_name));
        return F::from_raw(static_cast<typename F::rep>(arg.ticks()));
    } else if constexpr (std::is_floating_point_v<Arg>) {
        return F::from_mm(static_cast<double>(arg));
    } else {
        static_assert(std::is_integral_v<Arg>, "expected a fixed-point value, an integer or a double");
        DIMTOL_EXPECTS(fits<typename F::rep>(arg), fmt::format("{} ticks do not fit into {}", arg, F::type_name));
        return F::from_raw(static_cast<typename F::rep>(arg));
    }
}

} // namespace detail

} // namespace dimtol

namespace std {

template<typename Rep>
struct hash<dimtol::fixed_point<Rep>> {
    std::size_t operator()(const dimtol::fixed_point<Rep>& f) const noexcept {
        return std::hash<Rep>{}(f.ticks());
    }
};

} // namespace std
