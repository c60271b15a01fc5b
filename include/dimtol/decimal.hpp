/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dimtol::decimal {

/**
 * Text <-> tick conversion shared by every fixed-point width and by the
 * tolerance types. A tick is 1/10 um, so four fractional millimeter digits
 * map one to one onto ticks.
 */

inline constexpr int max_precision = 4;
inline constexpr std::int64_t ticks_per_mm = 10'000;

using wide_t = __int128_t;

enum class sign_style {
    negative_only, // "-" for negative values, nothing otherwise
    always,        // "+" for zero and positive values
    minus_on_zero  // like 'always' but zero is shown as "-0"
};

// Strips leading and trailing blanks (space, tab, CR, LF).
std::string_view trim(std::string_view text);

/**
 * Parses "[sign] int ['.' frac]" in millimeters into ticks.
 * The fraction is right-padded or truncated to exactly 4 digits.
 * 'type_name' only appears in error messages.
 *
 * Throws parse_error for empty or non-numeric input and overflow_error
 * when the magnitude exceeds 64 bit.
 */
std::int64_t parse_ticks(std::string_view text, std::string_view type_name);

// Fewest fractional digits (1..4) that show 'ticks' without loss.
int auto_precision(std::int64_t ticks);

// Rounds to the nearest multiple of 'multiple', ties away from zero.
wide_t round_to_multiple(wide_t ticks, std::int64_t multiple);

// Floors to a multiple of 'multiple' (toward negative infinity).
wide_t floor_to_multiple(wide_t ticks, std::int64_t multiple);

// Tick step shown by 'precision' (0..4) digits: 10^(4 - precision).
std::int64_t precision_step(int precision);

// Millimeter rendering with 'precision' (0..4) fractional digits.
std::string format_ticks(std::int64_t ticks, int precision, sign_style sign = sign_style::negative_only);

// Raw tick rendering used by the alternate form.
std::string format_raw(std::int64_t ticks, sign_style sign = sign_style::negative_only);

} // namespace dimtol::decimal
