/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string_view>

namespace dimtol {

/**
 * Reports a broken precondition and terminates the process.
 * Used for programmer errors only (plus < minus, out-of-range raw
 * construction, division by zero). Never returns.
 */
[[noreturn]] void contract_violation(std::string_view what);

} // namespace dimtol

#define DIMTOL_EXPECTS(cond, msg)                 \
    do {                                          \
        if (!(cond)) ::dimtol::contract_violation(msg); \
    } while (0)
