#pragma once

#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace callroute {

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

/// What the pool compiler does when two active scenarios claim the same literal trigger.
/// Every policy records the conflict in CompiledPool::conflicts.
enum class ShadowPolicy {
    KeepFirst,  ///< First registration wins silently
    Warn,       ///< First registration wins, each conflict is logged
    Reject      ///< The later scenario is left out of the pool
};

ShadowPolicy parse_shadow_policy(const std::string& name);
const char* shadow_policy_name(ShadowPolicy policy);

/// Hard bounds that config may tighten but never relax
constexpr size_t kMinTriggerLength = 2;
constexpr size_t kMaxCandidates = 20;

struct CompilerConfig {
    size_t min_trigger_length = kMinTriggerLength;  ///< Shorter normalized triggers are dropped; never below 2
    size_t word_min_length = 3;        ///< Tokens shorter than this never enter the word index
    size_t contains_min_length = 5;    ///< Shortest trigger eligible for containment matching
    size_t max_candidates = kMaxCandidates;  ///< Upper bound on word-index candidates; never above 20
    size_t max_regex_length = 512;     ///< Longer regex triggers are dropped
    ShadowPolicy shadow_policy = ShadowPolicy::Warn;
};

struct TruthExportConfig {
    std::string environment = "development";
    bool allow_degraded = false;
    std::string wiring_report_url;     ///< Empty = no HTTP wiring source
    int wiring_timeout_ms = 3000;
};

struct Config {
    LoggingConfig logging;
    CompilerConfig compiler;
    TruthExportConfig truth_export;

    /// Load from a JSON file. Missing file or parse errors log and return defaults.
    /// CALLROUTE_ENVIRONMENT and CALLROUTE_LOG_LEVEL override file values.
    static Config load_from_file(const std::string& path);

    /// Apply a parsed JSON document onto defaults (no environment overrides).
    static Config from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace callroute
