#include <dimtol/config/validator.hpp>

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace dimtol::config {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_precision(const std::string& text, std::optional<int>& out, std::string& err) {
    std::string t = lower(text);
    if (t.empty()) { err = "precision is empty"; return false; }
    if (t == "auto") { out.reset(); return true; }
    if (!std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = fmt::format("precision must be 'auto' or digits, got '{}'", text); return false; }
    if (t.size() > 2) { err = fmt::format("precision '{}' out of range", text); return false; }
    out = std::stoi(t);
    return true;
}

bool parse_policy(const std::string& text, precision_policy& out, std::string& err) {
    std::string t = lower(text);
    if (t == "clamp") { out = precision_policy::clamp; return true; }
    if (t == "reject") { out = precision_policy::reject; return true; }
    err = fmt::format("precision_policy must be 'clamp' or 'reject', got '{}'", text);
    return false;
}

bool parse_flag(const std::string& text, bool& out, std::string& err) {
    std::string t = lower(text);
    if (t == "true" || t == "1" || t == "yes" || t == "on") { out = true; return true; }
    if (t == "false" || t == "0" || t == "no" || t == "off") { out = false; return true; }
    err = fmt::format("expected a boolean, got '{}'", text);
    return false;
}

} // namespace dimtol::config
