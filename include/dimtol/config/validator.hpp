#pragma once

#include <optional>
#include <string>

#include <dimtol/format_spec.hpp>

namespace dimtol::config {

// Accepts "auto" (empty result) or a non-negative digit count. Returns error in 'err' if invalid.
bool parse_precision(const std::string& text, std::optional<int>& out, std::string& err);

// Accepts "clamp" or "reject".
bool parse_policy(const std::string& text, precision_policy& out, std::string& err);

// Accepts true/false, 1/0, yes/no, on/off.
bool parse_flag(const std::string& text, bool& out, std::string& err);

} // namespace dimtol::config
