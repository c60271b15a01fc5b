/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/tolerance.hpp"

#include <sstream>

namespace dimtol::detail {

namespace {

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::vector<std::string> split_tolerance_text(std::string_view text) {
    std::string normalized(text);
    replace_all(normalized, "+/-", " ");
    replace_all(normalized, "+-", " ");
    replace_all(normalized, "/", " ");
    replace_all(normalized, ";", " ");

    std::vector<std::string> parts;
    std::istringstream iss(normalized);
    std::string part;
    while (iss >> part) parts.push_back(part);
    return parts;
}

} // namespace dimtol::detail
