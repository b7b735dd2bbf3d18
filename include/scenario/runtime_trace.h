#pragma once

#include "scenario/runtime_spec.h"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace callroute {
namespace scenario {

/// How the external selection stage picked the spec
struct MatchInfo {
    std::string company_id;
    std::string method = "unknown";
    double confidence = 0.0;
    int tier = 0;
    std::string reply_type = "quick";
    int reply_index = 0;
};

struct Timings {
    double match_ms = 0.0;
    double render_ms = 0.0;
    double tts_ms = 0.0;
    double total_ms = 0.0;
};

/// Flat per-turn record for the structured log
struct RuntimeTrace {
    std::string company_id;
    std::string template_id;
    std::string scenario_id_matched;   ///< "fallback" when no spec was chosen
    std::string scenario_name_matched;
    std::string match_method;
    double match_confidence = 0.0;
    int match_tier = 0;
    std::string reply_type;
    int reply_index = 0;
    std::vector<std::string> applied_settings;
    Timings latency;
    Needs needs_evaluated;
    int64_t timestamp_ms = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Settings that fire for this spec
 *
 * Tier 0 entries always; then one per set Needs flag, tier 1 -> tier 2 ->
 * tier 3. Returns {"fallback"} when spec is null.
 */
std::vector<std::string> applied_settings(const RuntimeSpec* spec);

RuntimeTrace build_trace(const RuntimeSpec* spec, const MatchInfo& match, const Timings& timings);

/// Emit the trace as one JSON log line
void log_trace(const RuntimeTrace& trace);

} // namespace scenario
} // namespace callroute
