/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/error.hpp"

namespace dimtol {

std::string_view to_string(error_kind kind) {
    switch (kind) {
        case error_kind::parse:
            return "ParseError";
        case error_kind::overflow:
            return "Overflow";
    }
    return "Unknown";
}

} // namespace dimtol
