#pragma once

#include <optional>

#include <dimtol/format_spec.hpp>

namespace dimtol::config {

struct FormatConfig {
    std::optional<int> precision;  // empty: minimal digits per value
    bool alternate{false};         // raw ticks
    bool sign_plus{false};
    precision_policy policy{precision_policy::clamp};
};

// Rendering options for to_string / fmt.
format_spec to_format_spec(const FormatConfig& cfg);

} // namespace dimtol::config
