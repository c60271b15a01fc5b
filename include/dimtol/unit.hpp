/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "dimtol/contract.hpp"

namespace dimtol {

/**
 * Length unit expressed as a multiple of the base tick (1/10 um).
 * Used to round, floor and convert fixed-point lengths.
 */
class unit {
public:
    constexpr explicit unit(std::int64_t multiply) : multiply_(multiply) {}

    constexpr std::int64_t multiply() const { return multiply_; }

    // Ten to the power of p ticks. potency(4) is one millimeter.
    static constexpr unit potency(unsigned p) {
        DIMTOL_EXPECTS(p <= 18, "unit potency beyond 10^18 does not fit 64 bit");
        std::int64_t m = 1;
        while (p--) m *= 10;
        return unit(m);
    }

    constexpr unit operator*(std::int64_t factor) const { return unit(multiply_ * factor); }

    constexpr bool operator==(const unit& other) const { return multiply_ == other.multiply_; }
    constexpr bool operator!=(const unit& other) const { return multiply_ != other.multiply_; }
    constexpr bool operator<(const unit& other) const { return multiply_ < other.multiply_; }
    constexpr bool operator<=(const unit& other) const { return multiply_ <= other.multiply_; }
    constexpr bool operator>(const unit& other) const { return multiply_ > other.multiply_; }
    constexpr bool operator>=(const unit& other) const { return multiply_ >= other.multiply_; }

private:
    std::int64_t multiply_;
};

// n * unit yields the number of ticks.
template<typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
constexpr std::int64_t operator*(Int n, const unit& u) {
    return static_cast<std::int64_t>(n) * u.multiply();
}

namespace units {

inline constexpr unit MY{10};                        // micrometer
inline constexpr unit MM{1'000 * MY.multiply()};     // millimeter
inline constexpr unit CM{10 * MM.multiply()};        // centimeter
inline constexpr unit INCH{25'400 * MY.multiply()};  // 25.4 mm
inline constexpr unit FT{12 * INCH.multiply()};      // foot
inline constexpr unit YD{3 * FT.multiply()};         // yard
inline constexpr unit METER{1'000 * MM.multiply()};
inline constexpr unit KM{1'000 * METER.multiply()};
inline constexpr unit MILE{1'760 * YD.multiply()};   // 1609.344 m

} // namespace units

// Looks up a unit by its usual symbol ("um", "mm", "cm", "in", "ft", "yd",
// "m", "km", "mi"). Unknown names yield std::nullopt.
std::optional<unit> unit_from_name(std::string_view name);

} // namespace dimtol
