/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <fmt/format.h>

#include "dimtol/fixed_point.hpp"
#include "dimtol/format_spec.hpp"
#include "dimtol/tolerance.hpp"

// {fmt} support:
//   fmt::format("{}", F64::from_mm(12.5))     -> "12.5"
//   fmt::format("{:.2}", ...)                 -> "12.50"
//   fmt::format("{:#}", ...)                  -> "125000"
//   fmt::format("{:+.1}", ...)                -> "+12.5"

namespace dimtol::detail {

// Accepts "[+][#][.N]".
template<typename ParseContext>
constexpr auto parse_format_spec(ParseContext& ctx, format_spec& spec) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    auto end = ctx.end();
    if (it != end && *it == '+') {
        spec.sign_plus = true;
        ++it;
    }
    if (it != end && *it == '#') {
        spec.alternate = true;
        ++it;
    }
    if (it != end && *it == '.') {
        ++it;
        if (it == end || *it < '0' || *it > '9') throw fmt::format_error("missing precision");
        int precision = 0;
        while (it != end && *it >= '0' && *it <= '9') {
            precision = precision * 10 + (*it - '0');
            ++it;
        }
        spec.precision = precision;
    }
    if (it != end && *it != '}') throw fmt::format_error("invalid format specifier for a length");
    return it;
}

} // namespace dimtol::detail

namespace fmt {

template<typename Rep>
struct formatter<dimtol::fixed_point<Rep>> {
    dimtol::format_spec spec;

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        return dimtol::detail::parse_format_spec(ctx, spec);
    }

    template<typename FormatContext>
    auto format(const dimtol::fixed_point<Rep>& value, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", value.to_string(spec));
    }
};

template<typename V, typename T>
struct formatter<dimtol::tolerance<V, T>> {
    dimtol::format_spec spec;

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        return dimtol::detail::parse_format_spec(ctx, spec);
    }

    template<typename FormatContext>
    auto format(const dimtol::tolerance<V, T>& value, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", value.to_string(spec));
    }
};

} // namespace fmt
