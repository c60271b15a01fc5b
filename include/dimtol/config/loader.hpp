#pragma once

#include <string>
#include <vector>

#include <dimtol/config/types.hpp>

namespace dimtol::config {

// Read configuration from file (JSON or key=value). Returns list of validation errors (empty if ok).
std::vector<std::string> load_from_file(FormatConfig& cfg, const std::string& path);

// Same as load_from_file for text already in memory.
std::vector<std::string> load_from_text(FormatConfig& cfg, const std::string& text);

// Apply DIMTOL_* environment variables (PRECISION, ALTERNATE, SIGN_PLUS, PRECISION_POLICY)
// on top of current cfg. Returns list of errors for malformed values.
std::vector<std::string> apply_env_overrides(FormatConfig& cfg);

// Validate final config (precision range under the reject policy). Returns list of errors.
std::vector<std::string> validate_final(const FormatConfig& cfg);

} // namespace dimtol::config
