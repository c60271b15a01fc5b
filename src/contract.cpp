/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "dimtol/contract.hpp"

#include <cstdlib>

#include <fmt/core.h>

#include "dimtol/logging/logger.hpp"

namespace dimtol {

void contract_violation(std::string_view what) {
    logging::sink().error(fmt::format("contract violation: {}", what));
    std::abort();
}

} // namespace dimtol
