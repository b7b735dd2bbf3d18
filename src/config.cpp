#include "config.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <cstdlib>

using json = nlohmann::json;

namespace callroute {

namespace {

/// Non-negative integer field into a size_t; anything else keeps the default
void read_size(const json& section, const char* key, size_t& out) {
    if (section.contains(key) && section[key].is_number_integer() && section[key].get<long long>() >= 0) {
        out = static_cast<size_t>(section[key].get<long long>());
    }
}

void apply_env_overrides(Config& cfg) {
    if (const char* env = std::getenv("CALLROUTE_ENVIRONMENT")) {
        if (*env != '\0') {
            cfg.truth_export.environment = env;
        }
    }
    if (const char* level = std::getenv("CALLROUTE_LOG_LEVEL")) {
        if (*level != '\0') {
            cfg.logging.level = level;
        }
    }
}

} // namespace

ShadowPolicy parse_shadow_policy(const std::string& name) {
    std::string n = utils::normalize_phrase(name);
    if (n == "keep_first") return ShadowPolicy::KeepFirst;
    if (n == "reject") return ShadowPolicy::Reject;
    if (n != "warn") {
        Logger::warn("Unknown shadow_policy \"" + name + "\", using warn");
    }
    return ShadowPolicy::Warn;
}

const char* shadow_policy_name(ShadowPolicy policy) {
    switch (policy) {
        case ShadowPolicy::KeepFirst: return "keep_first";
        case ShadowPolicy::Warn: return "warn";
        case ShadowPolicy::Reject: return "reject";
    }
    return "warn";
}

Config Config::from_json(const json& j) {
    Config cfg;
    if (!j.is_object()) {
        return cfg;
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"].get<std::string>();
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"].get<std::string>();
    }

    if (j.contains("compiler") && j["compiler"].is_object()) {
        const auto& c = j["compiler"];
        read_size(c, "min_trigger_length", cfg.compiler.min_trigger_length);
        read_size(c, "word_min_length", cfg.compiler.word_min_length);
        read_size(c, "contains_min_length", cfg.compiler.contains_min_length);
        read_size(c, "max_candidates", cfg.compiler.max_candidates);
        read_size(c, "max_regex_length", cfg.compiler.max_regex_length);
        if (cfg.compiler.min_trigger_length < kMinTriggerLength) {
            Logger::warn("compiler.min_trigger_length below " + std::to_string(kMinTriggerLength)
                + ", using " + std::to_string(kMinTriggerLength));
            cfg.compiler.min_trigger_length = kMinTriggerLength;
        }
        if (cfg.compiler.max_candidates == 0 || cfg.compiler.max_candidates > kMaxCandidates) {
            Logger::warn("compiler.max_candidates must be 1.." + std::to_string(kMaxCandidates)
                + ", using " + std::to_string(kMaxCandidates));
            cfg.compiler.max_candidates = kMaxCandidates;
        }
        if (c.contains("shadow_policy") && c["shadow_policy"].is_string())
            cfg.compiler.shadow_policy = parse_shadow_policy(c["shadow_policy"].get<std::string>());
    }

    if (j.contains("truth_export") && j["truth_export"].is_object()) {
        const auto& t = j["truth_export"];
        if (t.contains("environment") && t["environment"].is_string())
            cfg.truth_export.environment = t["environment"].get<std::string>();
        if (t.contains("allow_degraded") && t["allow_degraded"].is_boolean())
            cfg.truth_export.allow_degraded = t["allow_degraded"].get<bool>();
        if (t.contains("wiring_report_url") && t["wiring_report_url"].is_string())
            cfg.truth_export.wiring_report_url = t["wiring_report_url"].get<std::string>();
        if (t.contains("wiring_timeout_ms") && t["wiring_timeout_ms"].is_number_integer()
            && t["wiring_timeout_ms"].get<int>() > 0)
            cfg.truth_export.wiring_timeout_ms = t["wiring_timeout_ms"].get<int>();
    }

    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file " + path + ". Using defaults.");
        apply_env_overrides(cfg);
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config " + path + ": " + std::string(e.what()));
        apply_env_overrides(cfg);
        return cfg;
    }

    cfg = from_json(j);
    apply_env_overrides(cfg);
    Logger::info("Loaded config from " + path + " (environment=" + cfg.truth_export.environment
        + ", shadow_policy=" + shadow_policy_name(cfg.compiler.shadow_policy) + ")");
    return cfg;
}

json Config::to_json() const {
    json j;
    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;
    j["compiler"]["min_trigger_length"] = compiler.min_trigger_length;
    j["compiler"]["word_min_length"] = compiler.word_min_length;
    j["compiler"]["contains_min_length"] = compiler.contains_min_length;
    j["compiler"]["max_candidates"] = compiler.max_candidates;
    j["compiler"]["max_regex_length"] = compiler.max_regex_length;
    j["compiler"]["shadow_policy"] = shadow_policy_name(compiler.shadow_policy);
    j["truth_export"]["environment"] = truth_export.environment;
    j["truth_export"]["allow_degraded"] = truth_export.allow_degraded;
    j["truth_export"]["wiring_report_url"] = truth_export.wiring_report_url;
    j["truth_export"]["wiring_timeout_ms"] = truth_export.wiring_timeout_ms;
    return j;
}

} // namespace callroute
