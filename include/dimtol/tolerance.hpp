/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "dimtol/contract.hpp"
#include "dimtol/decimal.hpp"
#include "dimtol/error.hpp"
#include "dimtol/fixed_point.hpp"
#include "dimtol/format_spec.hpp"

namespace dimtol {

template<typename V, typename T>
struct tolerance_traits;

template<>
struct tolerance_traits<F32, F16> {
    static constexpr std::string_view name = "TNarrow";
};

template<>
struct tolerance_traits<F64, F32> {
    static constexpr std::string_view name = "TWide";
};

namespace detail {

// Splits "12.5 +0.3/-0.2", "12;0.4;-1" or "12 +/-0.4" into number tokens.
std::vector<std::string> split_tolerance_text(std::string_view text);

} // namespace detail

/**
 * A nominal length with an asymmetric deviation range.
 *
 * Template parameters:
 * - V: fixed-point type of the nominal value
 * - T: fixed-point type of the deviations, half the width of V
 *
 * Invariant: plus >= minus. Builders check it as a contract; parsing and
 * structured input report a parse_error instead.
 *
 * The allowed range is [value + minus, value + plus].
 */
template<typename V, typename T>
class tolerance {
public:
    static_assert(sizeof(typename V::rep) == 2 * sizeof(typename T::rep),
                  "value width must be twice the deviation width");

    using value_type = V;
    using deviation_type = T;
    using bytes_type = std::array<std::uint8_t, sizeof(typename V::rep) + 2 * sizeof(typename T::rep)>;
    static constexpr std::string_view type_name = tolerance_traits<V, T>::name;

    static const tolerance ZERO;

    constexpr tolerance() : value_(), plus_(), minus_() {}

    tolerance(V value, T plus, T minus) : value_(value), plus_(plus), minus_(minus) {
        DIMTOL_EXPECTS(plus >= minus, fmt::format("{}: plus ({}) has to be bigger than minus ({})",
                                                  type_name, plus.to_string(), minus.to_string()));
    }

    // Widening from a narrower tolerance type is exact.
    template<typename V2, typename T2,
             typename = std::enable_if_t<(sizeof(typename V2::rep) < sizeof(typename V::rep)) &&
                                         (sizeof(typename T2::rep) < sizeof(typename T::rep))>>
    constexpr tolerance(const tolerance<V2, T2>& narrower)
        : value_(narrower.value()), plus_(narrower.plus()), minus_(narrower.minus()) {}

    /**
     * Asymmetric builder. Each argument may be a fixed-point value, raw
     * integer ticks or a double in mm:
     *
     *   TWide::make(100.0, 0.05, -0.2)
     *   TWide::make(1'000'000, 500, -2'000)
     */
    template<typename A, typename P, typename M>
    static tolerance make(const A& value, const P& plus, const M& minus) {
        return tolerance(detail::to_fixed<V>(value), detail::to_fixed<T>(plus), detail::to_fixed<T>(minus));
    }

    // Value only, no deviation.
    template<typename A>
    static tolerance make(const A& value) {
        return tolerance(unchecked{}, detail::to_fixed<V>(value), T::ZERO, T::ZERO);
    }

    // Symmetric builder: make(value, tol, -tol).
    template<typename A, typename B>
    static tolerance with_sym(const A& value, const B& tol) {
        T t = detail::to_fixed<T>(tol);
        return tolerance(detail::to_fixed<V>(value), t, -t);
    }

    // Narrowing conversion between tolerance widths. Throws overflow_error.
    template<typename V2, typename T2>
    static tolerance checked_from(const tolerance<V2, T2>& other) {
        return tolerance(unchecked{}, V::checked_from(other.value()), T::checked_from(other.plus()),
                         T::checked_from(other.minus()));
    }

    /**
     * Builds from 1 to 3 raw tick counts:
     *  * {value}               no deviation
     *  * {value, tol}          symmetric
     *  * {value, plus, minus}  asymmetric
     *
     * Throws overflow_error for values out of range and parse_error for a
     * wrong count or plus < minus.
     */
    static tolerance from_ticks(const std::vector<std::int64_t>& ticks) {
        switch (ticks.size()) {
            case 1:
                return tolerance(unchecked{}, V::checked_from(ticks[0]), T::ZERO, T::ZERO);
            case 2: {
                T plus = T::checked_from(ticks[1]);
                T minus = T::checked_from(-static_cast<std::int64_t>(plus.ticks()));
                return checked(V::checked_from(ticks[0]), plus, minus);
            }
            case 3:
                return checked(V::checked_from(ticks[0]), T::checked_from(ticks[1]), T::checked_from(ticks[2]));
            default:
                throw parse_error(fmt::format("{} needs 1 to 3 numbers, got {}", type_name, ticks.size()));
        }
    }

    /**
     * Builds from optional parts: a missing minus mirrors plus, missing
     * plus and minus mean no deviation. The value is required.
     */
    static tolerance from_parts(std::optional<V> value, std::optional<T> plus, std::optional<T> minus) {
        if (!value) throw parse_error(fmt::format("{} needs a value", type_name));
        if (!plus) {
            if (minus) throw parse_error(fmt::format("{} has a minus but no plus", type_name));
            return tolerance(unchecked{}, *value, T::ZERO, T::ZERO);
        }
        if (!minus) {
            minus = T::checked_from(-static_cast<std::int64_t>(plus->ticks()));
        }
        return checked(*value, *plus, *minus);
    }

    /**
     * Parses up to three mm numbers separated by blanks, '/', ';', "+/-"
     * or "+-". One number is a plain value, two a symmetric tolerance,
     * three value, plus and minus:
     *
     *   "12 .4 -1", "12/.4/-1", "12;0.4; -1"   -> 12 +0.4/-1
     *   "12.0 0.4", "12.0 +-0.4"               -> 12 +/-0.4
     */
    static tolerance parse(std::string_view text) {
        std::vector<std::string> parts = detail::split_tolerance_text(text);
        if (parts.empty()) {
            throw parse_error(fmt::format("cannot parse an empty string into {}", type_name));
        }
        if (parts.size() > 3) {
            throw parse_error(fmt::format("{} not parsable from '{}', found {} numbers", type_name, text, parts.size()));
        }
        std::vector<std::int64_t> ticks;
        ticks.reserve(parts.size());
        for (const auto& part : parts) {
            try {
                ticks.push_back(decimal::parse_ticks(part, type_name));
            } catch (const parse_error&) {
                throw parse_error(fmt::format("{} not parsable from '{}'", type_name, text));
            }
        }
        return from_ticks(ticks);
    }

    static std::optional<tolerance> try_parse(std::string_view text) {
        try {
            return parse(text);
        } catch (const error&) {
            return std::nullopt;
        }
    }

    // Throws parse_error when the decoded plus is below minus.
    static tolerance from_be_bytes(const bytes_type& bytes) {
        return from_bytes(bytes, [](const auto& b, auto tag) { return decltype(tag)::from_be_bytes(b); });
    }

    static tolerance from_le_bytes(const bytes_type& bytes) {
        return from_bytes(bytes, [](const auto& b, auto tag) { return decltype(tag)::from_le_bytes(b); });
    }

    static tolerance from_ne_bytes(const bytes_type& bytes) {
        return from_bytes(bytes, [](const auto& b, auto tag) { return decltype(tag)::from_ne_bytes(b); });
    }

    constexpr V value() const { return value_; }
    constexpr T plus() const { return plus_; }
    constexpr T minus() const { return minus_; }

    // Same value, new deviation.
    template<typename P, typename M>
    tolerance narrow(const P& plus, const M& minus) const {
        return tolerance(value_, detail::to_fixed<T>(plus), detail::to_fixed<T>(minus));
    }

    template<typename B>
    tolerance narrow_sym(const B& tol) const {
        T t = detail::to_fixed<T>(tol);
        return tolerance(value_, t, -t);
    }

    // Maximum allowed value.
    V upper_limit() const { return value_ + plus_; }

    // Minimum allowed value.
    V lower_limit() const { return value_ + minus_; }

    // True if this range lies within 'other'.
    bool is_inside_of(const tolerance& other) const {
        return lower_limit() >= other.lower_limit() && upper_limit() <= other.upper_limit();
    }

    // True if this range contains 'other'.
    bool enfold(const tolerance& other) const {
        return lower_limit() <= other.lower_limit() && upper_limit() >= other.upper_limit();
    }

    bool enfold(V point) const {
        return lower_limit() <= point && upper_limit() >= point;
    }

    /**
     * Swaps and negates plus and minus, negates the value.
     * Used when measuring back in the opposite direction.
     */
    constexpr tolerance invert() const {
        return tolerance(unchecked{}, -value_, -minus_, -plus_);
    }

    constexpr tolerance operator!() const { return invert(); }

    // Mm of the nominal value; the deviation is dropped.
    double as_f64() const { return value_.as_f64(); }

    // value, plus, minus in mm.
    std::array<double, 3> to_floats() const {
        return {value_.as_f64(), plus_.as_f64(), minus_.as_f64()};
    }

    bytes_type to_be_bytes() const {
        return to_bytes([](auto f) { return f.to_be_bytes(); });
    }

    bytes_type to_le_bytes() const {
        return to_bytes([](auto f) { return f.to_le_bytes(); });
    }

    bytes_type to_ne_bytes() const {
        return to_bytes([](auto f) { return f.to_ne_bytes(); });
    }

    std::string to_string() const { return to_string(format_spec{}); }

    std::string to_string(int precision) const {
        format_spec spec;
        spec.precision = precision;
        return to_string(spec);
    }

    /**
     * "value +plus/-minus", or "value +/-tol" when plus == -minus.
     * Without a precision each part uses its minimal digit count.
     * The alternate form prints raw ticks and is never compacted.
     */
    std::string to_string(const format_spec& spec) const {
        using decimal::sign_style;
        sign_style value_sign = spec.sign_plus ? sign_style::always : sign_style::negative_only;
        if (spec.alternate) {
            return fmt::format("{} {}/{}", decimal::format_raw(value_.as_i64(), value_sign),
                               decimal::format_raw(plus_.as_i64(), sign_style::always),
                               decimal::format_raw(minus_.as_i64(), sign_style::minus_on_zero));
        }
        int precision = resolve_precision(spec);
        auto part = [precision](std::int64_t ticks, sign_style sign) {
            return decimal::format_ticks(ticks, precision < 0 ? decimal::auto_precision(ticks) : precision, sign);
        };
        // Compare the deviations as they will be printed.
        auto shown = [precision](std::int64_t ticks) -> decimal::wide_t {
            return precision < 0 ? ticks : decimal::round_to_multiple(ticks, decimal::precision_step(precision));
        };
        std::string value = part(value_.as_i64(), value_sign);
        if (shown(plus_.as_i64()) == -shown(minus_.as_i64())) {
            return fmt::format("{} +/-{}", value, part(plus_.as_i64(), sign_style::negative_only));
        }
        return fmt::format("{} {}/{}", value, part(plus_.as_i64(), sign_style::always),
                           part(minus_.as_i64(), sign_style::minus_on_zero));
    }

    // TWide(2.0000 +0.0050 -0.0100)
    std::string debug_string() const {
        using decimal::sign_style;
        return fmt::format("{}({} {} {})", type_name, decimal::format_ticks(value_.as_i64(), decimal::max_precision),
                           decimal::format_ticks(plus_.as_i64(), decimal::max_precision, sign_style::always),
                           decimal::format_ticks(minus_.as_i64(), decimal::max_precision, sign_style::always));
    }

    // Deviations accumulate.
    constexpr tolerance operator+(const tolerance& other) const {
        return tolerance(unchecked{}, value_ + other.value_, plus_ + other.plus_, minus_ + other.minus_);
    }

    // Worst case: the other's minus widens our plus and vice versa.
    constexpr tolerance operator-(const tolerance& other) const {
        return tolerance(unchecked{}, value_ - other.value_, plus_ - other.minus_, minus_ - other.plus_);
    }

    // Shifts the nominal value only.
    constexpr tolerance operator+(V offset) const {
        return tolerance(unchecked{}, value_ + offset, plus_, minus_);
    }

    constexpr tolerance operator-(V offset) const {
        return tolerance(unchecked{}, value_ - offset, plus_, minus_);
    }

    // Scales all parts; a negative factor would flip plus and minus.
    template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    tolerance operator*(Int factor) const {
        if constexpr (std::is_signed_v<Int>) {
            DIMTOL_EXPECTS(factor >= 0, fmt::format("{} can not be multiplied by a negative factor", type_name));
        }
        return tolerance(unchecked{}, value_ * factor, plus_ * factor, minus_ * factor);
    }

    tolerance& operator+=(const tolerance& other) {
        *this = *this + other;
        return *this;
    }

    tolerance& operator-=(const tolerance& other) {
        *this = *this - other;
        return *this;
    }

    /**
     * Defines the order by comparing:
     * 1. value
     * 2. minus
     * 3. plus
     */
    constexpr bool operator<(const tolerance& other) const { return key() < other.key(); }
    constexpr bool operator<=(const tolerance& other) const { return key() <= other.key(); }
    constexpr bool operator>(const tolerance& other) const { return key() > other.key(); }
    constexpr bool operator>=(const tolerance& other) const { return key() >= other.key(); }
    constexpr bool operator==(const tolerance& other) const { return key() == other.key(); }
    constexpr bool operator!=(const tolerance& other) const { return key() != other.key(); }

private:
    struct unchecked {};

    constexpr tolerance(unchecked, V value, T plus, T minus) : value_(value), plus_(plus), minus_(minus) {}

    static tolerance checked(V value, T plus, T minus) {
        if (plus < minus) {
            throw parse_error(fmt::format("{}: plus ({}) is below minus ({})", type_name, plus.to_string(),
                                          minus.to_string()));
        }
        return tolerance(unchecked{}, value, plus, minus);
    }

    constexpr std::tuple<typename V::rep, typename T::rep, typename T::rep> key() const {
        return {value_.ticks(), minus_.ticks(), plus_.ticks()};
    }

    template<typename Encode>
    bytes_type to_bytes(Encode encode) const {
        bytes_type out{};
        auto v = encode(value_);
        auto p = encode(plus_);
        auto m = encode(minus_);
        std::memcpy(out.data(), v.data(), v.size());
        std::memcpy(out.data() + v.size(), p.data(), p.size());
        std::memcpy(out.data() + v.size() + p.size(), m.data(), m.size());
        return out;
    }

    template<typename Decode>
    static tolerance from_bytes(const bytes_type& bytes, Decode decode) {
        typename V::bytes_type v{};
        typename T::bytes_type p{};
        typename T::bytes_type m{};
        std::memcpy(v.data(), bytes.data(), v.size());
        std::memcpy(p.data(), bytes.data() + v.size(), p.size());
        std::memcpy(m.data(), bytes.data() + v.size() + p.size(), m.size());
        return checked(decode(v, V{}), decode(p, T{}), decode(m, T{}));
    }

    V value_;
    T plus_;
    T minus_;
};

template<typename V, typename T>
constexpr tolerance<V, T> tolerance<V, T>::ZERO = tolerance<V, T>();

// Common tolerance widths
using TNarrow = tolerance<F32, F16>;  // 64 bit
using TWide = tolerance<F64, F32>;    // 128 bit

} // namespace dimtol

namespace std {

template<typename V, typename T>
struct hash<dimtol::tolerance<V, T>> {
    std::size_t operator()(const dimtol::tolerance<V, T>& t) const noexcept {
        std::size_t h = std::hash<V>{}(t.value());
        h ^= std::hash<T>{}(t.plus()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<T>{}(t.minus()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
