/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/json.hpp"

namespace dimtol::detail {

const json* find_field(const json& obj, std::string_view name, std::string_view abbrev) {
    auto it = obj.find(std::string(name));
    if (it != obj.end()) return &*it;
    it = obj.find(std::string(abbrev));
    if (it != obj.end()) return &*it;
    return nullptr;
}

bool is_blank_string(const json& j) {
    return j.is_string() && decimal::trim(j.get_ref<const std::string&>()).empty();
}

} // namespace dimtol::detail
