/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/decimal.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include "dimtol/contract.hpp"
#include "dimtol/error.hpp"

namespace dimtol::decimal {

namespace {

using uwide_t = unsigned __int128;

constexpr uwide_t kMaxPositive = static_cast<uwide_t>(std::numeric_limits<std::int64_t>::max());
constexpr uwide_t kMaxNegative = kMaxPositive + 1;

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Accumulates decimal digits; stops early once the value cannot fit 64 bit.
uwide_t digits_to_int(std::string_view digits, std::string_view input, std::string_view type_name) {
    uwide_t v = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw parse_error(fmt::format(
                "found '{}' (a non-numerical literal) in '{}', cannot parse it into {}",
                c, input, type_name));
        }
        if (v <= kMaxNegative) v = v * 10 + static_cast<uwide_t>(c - '0');
    }
    return v;
}

std::string magnitude_digits(uwide_t mag) {
    std::string s;
    do {
        s.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    } while (mag != 0);
    std::reverse(s.begin(), s.end());
    return s;
}

const char* sign_prefix(bool negative, bool zero, sign_style sign) {
    if (negative) return "-";
    switch (sign) {
        case sign_style::always:
            return "+";
        case sign_style::minus_on_zero:
            return zero ? "-" : "+";
        case sign_style::negative_only:
            break;
    }
    return "";
}

} // namespace

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_blank(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_blank(text.back())) text.remove_suffix(1);
    return text;
}

std::int64_t parse_ticks(std::string_view text, std::string_view type_name) {
    std::string_view value = trim(text);
    if (value.empty()) {
        throw parse_error(fmt::format("cannot parse an empty string into {}", type_name));
    }

    std::string_view base = value;
    std::string_view fraction;
    auto dot = value.find('.');
    if (dot != std::string_view::npos) {
        base = value.substr(0, dot);
        fraction = value.substr(dot + 1);
    }

    bool negative = false;
    if (!base.empty() && (base.front() == '-' || base.front() == '+')) {
        negative = base.front() == '-';
        base.remove_prefix(1);
    }
    if (base.empty() && fraction.empty()) {
        throw parse_error(fmt::format("no digits in '{}', cannot parse it into {}", value, type_name));
    }

    uwide_t integral = digits_to_int(base, value, type_name);
    std::string frac_digits(fraction.substr(0, std::min<std::size_t>(fraction.size(), max_precision)));
    // digits past the fourth are dropped, but must still be digits
    digits_to_int(fraction, value, type_name);
    frac_digits.resize(max_precision, '0');
    uwide_t frac = digits_to_int(frac_digits, value, type_name);

    uwide_t limit = negative ? kMaxNegative : kMaxPositive;
    if (integral > limit / ticks_per_mm || integral * ticks_per_mm + frac > limit) {
        throw overflow_error(fmt::format("'{}' is too big for {}", value, type_name));
    }
    wide_t ticks = static_cast<wide_t>(integral * ticks_per_mm + frac);
    return static_cast<std::int64_t>(negative ? -ticks : ticks);
}

int auto_precision(std::int64_t ticks) {
    if (ticks % 1000 == 0) return 1;
    if (ticks % 100 == 0) return 2;
    if (ticks % 10 == 0) return 3;
    return 4;
}

wide_t round_to_multiple(wide_t ticks, std::int64_t multiple) {
    DIMTOL_EXPECTS(multiple >= 0, "rounding unit must not be negative");
    if (multiple == 0) return ticks;
    wide_t clip = ticks % multiple;
    if (clip == 0) return ticks;
    wide_t twice = clip < 0 ? -2 * clip : 2 * clip;
    if (twice < multiple) return ticks - clip;
    return clip < 0 ? ticks - clip - multiple : ticks - clip + multiple;
}

wide_t floor_to_multiple(wide_t ticks, std::int64_t multiple) {
    DIMTOL_EXPECTS(multiple >= 0, "floor unit must not be negative");
    if (multiple == 0) return ticks;
    wide_t clip = ticks % multiple;
    if (clip == 0) return ticks;
    return ticks < 0 ? ticks - clip - multiple : ticks - clip;
}

std::int64_t precision_step(int precision) {
    DIMTOL_EXPECTS(precision >= 0 && precision <= max_precision, "precision must be within 0..4");
    std::int64_t step = 1;
    for (int i = precision; i < max_precision; ++i) step *= 10;
    return step;
}

std::string format_ticks(std::int64_t ticks, int precision, sign_style sign) {
    DIMTOL_EXPECTS(precision >= 0 && precision <= max_precision, "precision must be within 0..4");
    wide_t rounded = round_to_multiple(ticks, precision_step(precision));

    bool negative = rounded < 0;
    uwide_t mag = static_cast<uwide_t>(negative ? -rounded : rounded);
    std::string digits = magnitude_digits(mag);
    if (digits.size() < max_precision + 1) {
        digits.insert(0, max_precision + 1 - digits.size(), '0');
    }
    std::string integral = digits.substr(0, digits.size() - max_precision);
    std::string fraction = digits.substr(digits.size() - max_precision, precision);

    std::string out = sign_prefix(negative, mag == 0, sign);
    out += integral;
    if (precision > 0) {
        out += '.';
        out += fraction;
    }
    return out;
}

std::string format_raw(std::int64_t ticks, sign_style sign) {
    if (ticks < 0) return fmt::format("{}", ticks);
    return fmt::format("{}{}", sign_prefix(false, ticks == 0, sign), ticks);
}

} // namespace dimtol::decimal
