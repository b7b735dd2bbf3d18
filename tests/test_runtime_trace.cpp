/**
 * Runtime trace tests.
 * Asserts:
 * - Tier 0 settings always apply; needs flags append in tier order.
 * - A turn with no spec is recorded under the "fallback" sentinel.
 * - JSON field names match the trace log schema.
 *
 * Run from build dir: ./test_runtime_trace
 */

#include "scenario/runtime_trace.h"
#include "scenario/scenario_compiler.h"
#include "logger.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace callroute;
using namespace callroute::scenario;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- No spec ---
    std::vector<std::string> fallback = applied_settings(nullptr);
    ASSERT(fallback.size() == 1 && fallback[0] == "fallback");

    MatchInfo miss;
    miss.company_id = "c1";
    RuntimeTrace miss_trace = build_trace(nullptr, miss, Timings{});
    ASSERT(miss_trace.scenario_id_matched == "fallback");
    ASSERT(miss_trace.match_method == "unknown");
    ASSERT(miss_trace.reply_type == "quick");
    json miss_json = miss_trace.to_json();
    ASSERT(miss_json["scenarioIdMatched"] == "fallback");
    ASSERT(miss_json["scenarioNameMatched"].is_null());
    ASSERT(miss_json["templateId"].is_null());
    ASSERT(miss_json["companyId"] == "c1");

    // --- Plain spec: tier 0 only ---
    RawScenario plain;
    plain.scenario_id = "s-hours";
    plain.name = "Hours";
    plain.triggers = {"what are your hours"};
    RuntimeSpec plain_spec = compile_scenario(plain);
    std::vector<std::string> tier0 = applied_settings(&plain_spec);
    ASSERT(tier0.size() == 3);
    ASSERT(tier0[0] == "replySelection");
    ASSERT(tier0[1] == "placeholderRendering");
    ASSERT(tier0[2] == "structureEnforcement");

    // --- All tiers, in order ---
    RawScenario rich = RawScenario::from_json(json::parse(R"({
        "scenarioId": "s-rich",
        "name": "Rich",
        "quickReplies": ["Hi {name}"],
        "ttsOverride": {"voice": "warm"},
        "timedFollowUp": {"enabled": true},
        "silencePolicy": {"enabled": true},
        "entityValidation": {"phone": "us"},
        "preconditions": [{"slot": "zip"}],
        "actionHooks": ["notify"],
        "effects": [{"tag": "vip"}],
        "dynamicVariables": {"eta": "30m"},
        "entityCapture": ["zip"],
        "replyStrategy": "LLM_CONTEXT"
    })"));
    CompileOptions options;
    options.template_id = "tpl-1";
    RuntimeSpec rich_spec = compile_scenario(rich, options);
    std::vector<std::string> all = applied_settings(&rich_spec);
    std::vector<std::string> expected = {
        "replySelection", "placeholderRendering", "structureEnforcement",
        "nameVariant", "ttsOverride", "timedFollowUp", "silencePolicy", "entityValidation", "preconditions",
        "actionHooks", "effects", "dynamicVariables", "entityCapture",
        "llmRewrite"
    };
    ASSERT(all == expected);

    // --- Full trace ---
    MatchInfo hit;
    hit.company_id = "c1";
    hit.method = "exact";
    hit.confidence = 0.92;
    hit.tier = 1;
    hit.reply_type = "full";
    hit.reply_index = 2;
    Timings timings{1.5, 0.4, 12.0, 14.2};
    RuntimeTrace trace = build_trace(&rich_spec, hit, timings);
    ASSERT(trace.template_id == "tpl-1");
    ASSERT(trace.scenario_id_matched == "s-rich");
    ASSERT(trace.scenario_name_matched == "Rich");
    ASSERT(trace.needs_evaluated.llm_rewrite);
    ASSERT(trace.timestamp_ms > 0);

    json j = trace.to_json();
    ASSERT(j["templateId"] == "tpl-1");
    ASSERT(j["matchMethod"] == "exact");
    ASSERT(j["matchConfidence"] == 0.92);
    ASSERT(j["matchTier"] == 1);
    ASSERT(j["replyType"] == "full");
    ASSERT(j["replyIndex"] == 2);
    ASSERT(j["appliedSettings"].size() == expected.size());
    ASSERT(j["latencyBreakdownMs"]["match"] == 1.5);
    ASSERT(j["latencyBreakdownMs"]["total"] == 14.2);
    ASSERT(j["needsEvaluated"]["nameVariant"] == true);
    ASSERT(j["needsEvaluated"]["llmRewrite"] == true);
    ASSERT(j.contains("timestamp"));

    // Logging a trace must not throw, even with a non-UTF-8 caller id
    log_trace(trace);
    MatchInfo garbled = hit;
    garbled.company_id = std::string("c\xc3");
    bool logged = true;
    try {
        log_trace(build_trace(nullptr, garbled, Timings{}));
    } catch (const std::exception&) {
        logged = false;
    }
    ASSERT(logged);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All runtime trace tests passed.\n";
    return 0;
}
