/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dimtol {

enum class error_kind {
    parse,
    overflow
};

std::string_view to_string(error_kind kind);

/**
 * Base of all recoverable failures raised by the library.
 * The message is the text shown to the user.
 */
class error : public std::runtime_error {
public:
    error(error_kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

// Malformed textual or structured input.
class parse_error : public error {
public:
    explicit parse_error(const std::string& message)
        : error(error_kind::parse, message) {}
};

// Value not representable in the target width.
class overflow_error : public error {
public:
    explicit overflow_error(const std::string& message)
        : error(error_kind::overflow, message) {}
};

} // namespace dimtol
