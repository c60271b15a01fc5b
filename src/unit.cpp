/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/unit.hpp"

#include <array>
#include <utility>

namespace dimtol {

namespace {

constexpr std::array<std::pair<std::string_view, unit>, 10> kUnitNames{{
    {"um", units::MY},
    {"my", units::MY},
    {"mm", units::MM},
    {"cm", units::CM},
    {"in", units::INCH},
    {"ft", units::FT},
    {"yd", units::YD},
    {"m", units::METER},
    {"km", units::KM},
    {"mi", units::MILE},
}};

} // namespace

std::optional<unit> unit_from_name(std::string_view name) {
    for (const auto& [key, u] : kUnitNames) {
        if (key == name) return u;
    }
    return std::nullopt;
}

} // namespace dimtol
