/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "dimtol/decimal.hpp"
#include "dimtol/error.hpp"
#include "dimtol/fixed_point.hpp"
#include "dimtol/tolerance.hpp"

namespace dimtol {

using json = nlohmann::json;

namespace detail {

// Looks up 'name' or its one-letter abbreviation in a JSON object.
const json* find_field(const json& obj, std::string_view name, std::string_view abbrev);

bool is_blank_string(const json& j);

} // namespace detail

/**
 * Reads a fixed-point value from JSON:
 *  * integer  raw ticks
 *  * float    millimeters
 *  * string   millimeters, parsed like F64::parse
 *
 * Throws parse_error for other JSON types and overflow_error for values
 * out of range.
 */
template<typename F>
F fixed_from_json(const json& j) {
    if (j.is_number_unsigned()) return F::checked_from(j.get<std::uint64_t>());
    if (j.is_number_integer()) return F::checked_from(j.get<std::int64_t>());
    if (j.is_number_float()) return F::checked_from_mm(j.get<double>());
    if (j.is_string()) return F::parse(j.get_ref<const std::string&>());
    throw parse_error(fmt::format("{} expects a number or a string, got {}", F::type_name, j.type_name()));
}

// Empty (or blank) string means zero.
template<typename F>
F fixed_or_zero(const json& j) {
    if (detail::is_blank_string(j)) return F::ZERO;
    return fixed_from_json<F>(j);
}

// Empty (or blank) string and null mean absent.
template<typename F>
std::optional<F> optional_fixed(const json& j) {
    if (j.is_null() || detail::is_blank_string(j)) return std::nullopt;
    return fixed_from_json<F>(j);
}

/**
 * Reads a tolerance from JSON. Forms are tried in this order:
 *  1. object  {"value", "plus", "minus"} or {"v", "p", "m"}; a missing
 *             minus mirrors plus, missing plus and minus mean zero
 *  2. array   [value], [value, tol] (symmetric) or [value, plus, minus]
 *  3. string  "12.5 +0.3/-0.2", see tolerance::parse
 *  4. number  value only
 */
template<typename Tol>
Tol tolerance_from_json(const json& j) {
    using V = typename Tol::value_type;
    using T = typename Tol::deviation_type;
    if (j.is_object()) {
        auto field = [&j](std::string_view name, std::string_view abbrev, auto tag) {
            using F = decltype(tag);
            const json* f = detail::find_field(j, name, abbrev);
            return f ? optional_fixed<F>(*f) : std::optional<F>{};
        };
        return Tol::from_parts(field("value", "v", V{}), field("plus", "p", T{}), field("minus", "m", T{}));
    }
    if (j.is_array()) {
        if (j.empty() || j.size() > 3) {
            throw parse_error(fmt::format("{} needs 1 to 3 array elements, got {}", Tol::type_name, j.size()));
        }
        std::optional<T> plus;
        std::optional<T> minus;
        if (j.size() > 1) plus = fixed_from_json<T>(j[1]);
        if (j.size() > 2) minus = fixed_from_json<T>(j[2]);
        return Tol::from_parts(fixed_from_json<V>(j[0]), plus, minus);
    }
    if (j.is_string()) return Tol::parse(j.get_ref<const std::string&>());
    if (j.is_number()) return Tol::from_parts(fixed_from_json<V>(j), std::nullopt, std::nullopt);
    throw parse_error(fmt::format("{} not parsable from JSON {}", Tol::type_name, j.type_name()));
}

// null means absent, every other input follows tolerance_from_json.
template<typename Tol>
std::optional<Tol> optional_tolerance(const json& j) {
    if (j.is_null()) return std::nullopt;
    return tolerance_from_json<Tol>(j);
}

/**
 * Types that serialize as a single tolerance string ("10.0 +/-0.1").
 * Implemented for every tolerance width and for std::optional of one.
 */
template<typename X>
struct tolerance_string : std::false_type {};

template<typename V, typename T>
struct tolerance_string<tolerance<V, T>> : std::true_type {
    static json encode(const tolerance<V, T>& t) { return t.to_string(); }
};

template<typename V, typename T>
struct tolerance_string<std::optional<tolerance<V, T>>> : std::true_type {
    static json encode(const std::optional<tolerance<V, T>>& t) {
        return t ? json(t->to_string()) : json(nullptr);
    }
};

template<typename X>
json to_string_json(const X& x) {
    static_assert(tolerance_string<X>::value, "not a tolerance type");
    return tolerance_string<X>::encode(x);
}

// {"value": 10.0, "plus": 0.1, "minus": -0.1} in mm.
template<typename V, typename T>
json to_float_struct(const tolerance<V, T>& t) {
    return json{{"value", t.value().as_f64()}, {"plus", t.plus().as_f64()}, {"minus", t.minus().as_f64()}};
}

// [10.0, 0.1, -0.1] in mm.
template<typename V, typename T>
json to_float_seq(const tolerance<V, T>& t) {
    return json::array({t.value().as_f64(), t.plus().as_f64(), t.minus().as_f64()});
}

// nlohmann::json ADL hooks
template<typename Rep>
void to_json(json& j, const fixed_point<Rep>& f) {
    j = f.as_i64();
}

template<typename Rep>
void from_json(const json& j, fixed_point<Rep>& f) {
    f = fixed_from_json<fixed_point<Rep>>(j);
}

template<typename V, typename T>
void to_json(json& j, const tolerance<V, T>& t) {
    j = json{{"value", t.value().as_i64()}, {"plus", t.plus().as_i64()}, {"minus", t.minus().as_i64()}};
}

template<typename V, typename T>
void from_json(const json& j, tolerance<V, T>& t) {
    t = tolerance_from_json<tolerance<V, T>>(j);
}

} // namespace dimtol
