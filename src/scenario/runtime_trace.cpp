#include "scenario/runtime_trace.h"
#include "logger.h"
#include <chrono>

using json = nlohmann::json;

namespace callroute {
namespace scenario {

std::vector<std::string> applied_settings(const RuntimeSpec* spec) {
    if (!spec) {
        return {"fallback"};
    }

    std::vector<std::string> applied = {
        "replySelection",
        "placeholderRendering",
        "structureEnforcement"
    };

    const Needs& n = spec->needs;

    // Tier 1
    if (n.name_variant) applied.push_back("nameVariant");
    if (n.tts_override) applied.push_back("ttsOverride");
    if (n.timed_follow_up) applied.push_back("timedFollowUp");
    if (n.silence_policy) applied.push_back("silencePolicy");
    if (n.entity_validation) applied.push_back("entityValidation");
    if (n.preconditions) applied.push_back("preconditions");

    // Tier 2
    if (n.action_hooks) applied.push_back("actionHooks");
    if (n.effects) applied.push_back("effects");
    if (n.dynamic_variables) applied.push_back("dynamicVariables");
    if (n.entity_capture) applied.push_back("entityCapture");

    // Tier 3
    if (n.llm_rewrite) applied.push_back("llmRewrite");

    return applied;
}

RuntimeTrace build_trace(const RuntimeSpec* spec, const MatchInfo& match, const Timings& timings) {
    RuntimeTrace trace;
    trace.company_id = match.company_id;
    if (spec) {
        trace.template_id = spec->template_id;
        trace.scenario_id_matched = spec->id;
        trace.scenario_name_matched = spec->name;
        trace.needs_evaluated = spec->needs;
    } else {
        trace.scenario_id_matched = "fallback";
    }
    trace.match_method = match.method;
    trace.match_confidence = match.confidence;
    trace.match_tier = match.tier;
    trace.reply_type = match.reply_type;
    trace.reply_index = match.reply_index;
    trace.applied_settings = applied_settings(spec);
    trace.latency = timings;
    trace.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return trace;
}

json RuntimeTrace::to_json() const {
    auto or_null = [](const std::string& s) { return s.empty() ? json(nullptr) : json(s); };
    return json{
        {"companyId", or_null(company_id)},
        {"templateId", or_null(template_id)},
        {"scenarioIdMatched", scenario_id_matched},
        {"scenarioNameMatched", or_null(scenario_name_matched)},
        {"matchMethod", match_method},
        {"matchConfidence", match_confidence},
        {"matchTier", match_tier},
        {"replyType", reply_type},
        {"replyIndex", reply_index},
        {"appliedSettings", applied_settings},
        {"latencyBreakdownMs", {
            {"match", latency.match_ms},
            {"render", latency.render_ms},
            {"tts", latency.tts_ms},
            {"total", latency.total_ms}
        }},
        {"needsEvaluated", needs_evaluated.to_json()},
        {"timestamp", timestamp_ms}
    };
}

void log_trace(const RuntimeTrace& trace) {
    LOG_TRACE_RECORD(trace.scenario_id_matched, trace.to_json().dump(-1, ' ', false, json::error_handler_t::replace));
}

} // namespace scenario
} // namespace callroute
