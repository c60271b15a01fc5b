#include <dimtol/config/loader.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <dimtol/config/validator.hpp>
#include <dimtol/decimal.hpp>

namespace dimtol::config {

format_spec to_format_spec(const FormatConfig& cfg) {
    format_spec spec;
    spec.precision = cfg.precision.value_or(-1);
    spec.alternate = cfg.alternate;
    spec.sign_plus = cfg.sign_plus;
    spec.policy = cfg.policy;
    return spec;
}

static void apply_entry(FormatConfig& cfg, const std::string& key, const std::string& val,
                        std::vector<std::string>& errs) {
    std::string e;
    if (key == "precision") {
        if (!parse_precision(val, cfg.precision, e)) errs.push_back(e);
    } else if (key == "alternate") {
        if (!parse_flag(val, cfg.alternate, e)) errs.push_back(fmt::format("'alternate': {}", e));
    } else if (key == "sign_plus") {
        if (!parse_flag(val, cfg.sign_plus, e)) errs.push_back(fmt::format("'sign_plus': {}", e));
    } else if (key == "precision_policy") {
        if (!parse_policy(val, cfg.policy, e)) errs.push_back(e);
    } else {
        errs.push_back(fmt::format("unknown key '{}'", key));
    }
}

static void load_key_value(FormatConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key(decimal::trim(std::string_view(line).substr(0, eq)));
        std::string val(decimal::trim(std::string_view(line).substr(eq + 1)));
        apply_entry(cfg, key, val, errs);
    }
}

static void load_json(FormatConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        FormatConfig next = cfg;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& v = it.value();
            if (it.key() == "precision" && v.is_number_unsigned()) {
                auto precision = v.get<std::uint64_t>();
                if (precision > 99) {
                    errs.push_back(fmt::format("precision '{}' out of range", precision));
                } else {
                    next.precision = static_cast<int>(precision);
                }
            } else if ((it.key() == "alternate" || it.key() == "sign_plus") && !v.is_boolean()) {
                errs.push_back(fmt::format("'{}' must be boolean", it.key()));
            } else if (v.is_boolean()) {
                apply_entry(next, it.key(), v.get<bool>() ? "true" : "false", errs);
            } else if (v.is_string()) {
                apply_entry(next, it.key(), v.get<std::string>(), errs);
            } else {
                errs.push_back(fmt::format("'{}' has an unsupported type", it.key()));
            }
        }
        if (errs.empty()) cfg = next;
    } catch (const std::exception& ex) {
        errs.push_back(fmt::format("failed to read format config: {}", ex.what()));
    }
}

std::vector<std::string> load_from_text(FormatConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        load_json(cfg, text, errs);
    } else {
        load_key_value(cfg, text, errs);
    }
    return errs;
}

std::vector<std::string> load_from_file(FormatConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(FormatConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("DIMTOL_PRECISION")) apply_entry(cfg, "precision", v, errs);
    if (const char* v = std::getenv("DIMTOL_ALTERNATE")) apply_entry(cfg, "alternate", v, errs);
    if (const char* v = std::getenv("DIMTOL_SIGN_PLUS")) apply_entry(cfg, "sign_plus", v, errs);
    if (const char* v = std::getenv("DIMTOL_PRECISION_POLICY")) apply_entry(cfg, "precision_policy", v, errs);
    return errs;
}

std::vector<std::string> validate_final(const FormatConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.precision && *cfg.precision < 0) errs.push_back("precision must not be negative");
    if (cfg.precision && *cfg.precision > decimal::max_precision && cfg.policy == precision_policy::reject) {
        errs.push_back(fmt::format("precision {} exceeds {} digits and precision_policy is 'reject'",
                                   *cfg.precision, decimal::max_precision));
    }
    return errs;
}

} // namespace dimtol::config
