/**
 * Scenario compiler tests.
 * Asserts:
 * - Defaults fill every missing field; compile is idempotent apart from compileTimeMs.
 * - Trigger lists are lower-cased, trimmed and filtered by length.
 * - Bad or backtracking-prone regex triggers are dropped, never fatal.
 * - Needs flags follow the fields they guard.
 *
 * Run from build dir: ./test_scenario_compiler
 */

#include "scenario/scenario_compiler.h"
#include "scenario/raw_scenario.h"
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using namespace callroute;
using namespace callroute::scenario;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static json without_timing(const RuntimeSpec& spec) {
    json j = spec.to_json();
    j["meta"].erase("compileTimeMs");
    return j;
}

int main() {
    // --- Concrete example: "no heat" emergency ---
    RawScenario heat = RawScenario::from_json(json::parse(R"({
        "scenarioId": "s-heat",
        "name": "No Heat",
        "triggers": ["no heat", "furnace broken"],
        "scenarioType": "EMERGENCY",
        "quickReplies": ["I'm sorry to hear that, let's get someone out."]
    })"));
    RuntimeSpec heat_spec = compile_scenario(heat);
    ASSERT(heat_spec.id == "s-heat");
    ASSERT(heat_spec.scenario_type == ScenarioType::Emergency);
    ASSERT(!heat_spec.needs.name_variant);
    ASSERT(heat_spec.triggers.normalized.size() == 2);
    ASSERT(heat_spec.triggers.normalized[0] == "no heat");
    ASSERT(heat_spec.triggers.normalized[1] == "furnace broken");
    ASSERT(heat_spec.meta.trigger_count == 2);
    ASSERT(heat_spec.meta.reply_count == 1);
    ASSERT(heat_spec.is_active);
    ASSERT(heat_spec.status == "live");

    // --- Defaults ---
    RuntimeSpec empty = compile_scenario(RawScenario{});
    ASSERT(empty.name == "Unnamed Scenario");
    ASSERT(!empty.id.empty());
    ASSERT(empty.priority == 50);
    ASSERT(empty.min_confidence == 0.6);
    ASSERT(empty.cooldown_seconds == 0);
    ASSERT(empty.scenario_type == ScenarioType::Faq);
    ASSERT(empty.behavior == "calm_professional");
    ASSERT(empty.channel == "any");
    ASSERT(empty.handoff_policy == "low_confidence");
    ASSERT(empty.replies.strategy == ReplyStrategy::Auto);
    ASSERT(empty.follow_up.mode == FollowUpMode::None);
    ASSERT(empty.wiring.action_type == ActionType::ReplyOnly);
    ASSERT(empty.triggers.normalized.empty());

    // Synthesized id is deterministic
    ASSERT(compile_scenario(RawScenario{}).id == empty.id);

    // --- Idempotence ---
    CompileOptions pinned;
    pinned.template_id = "tpl-hvac";
    pinned.category_name = "Heating";
    pinned.compiled_at_ms = 1700000000000;
    RuntimeSpec a = compile_scenario(heat, pinned);
    RuntimeSpec b = compile_scenario(heat, pinned);
    ASSERT(without_timing(a) == without_timing(b));
    ASSERT(a.template_id == "tpl-hvac");
    ASSERT(a.category_name == "Heating");
    ASSERT(a.meta.compiled_at_ms == 1700000000000);

    // --- Normalization ---
    RawScenario messy;
    messy.scenario_id = "s-messy";
    messy.triggers = {"  Water LEAK ", "a", "", "Burst Pipe"};
    messy.negative_triggers = {" NOT a leak "};
    RuntimeSpec messy_spec = compile_scenario(messy);
    ASSERT(messy_spec.triggers.normalized.size() == 2);
    ASSERT(messy_spec.triggers.normalized[0] == "water leak");
    ASSERT(messy_spec.triggers.normalized[1] == "burst pipe");
    ASSERT(messy_spec.triggers.original.size() == 4);
    ASSERT(messy_spec.triggers.negative.size() == 1 && messy_spec.triggers.negative[0] == "not a leak");
    ASSERT(messy_spec.meta.trigger_count == 4);

    // A lower configured floor still drops one-character triggers
    CompilerConfig lax;
    lax.min_trigger_length = 1;
    RuntimeSpec lax_spec = compile_scenario(messy, {}, lax);
    ASSERT(lax_spec.triggers.normalized.size() == 2);

    // --- Status and activity ---
    RawScenario draft;
    draft.status = "draft";
    ASSERT(!compile_scenario(draft).is_active);
    RawScenario disabled;
    disabled.is_active = false;
    ASSERT(!compile_scenario(disabled).is_active);
    RawScenario live;
    live.status = "live";
    live.is_active = true;
    ASSERT(compile_scenario(live).is_active);

    // --- Regex triggers ---
    ASSERT(is_backtracking_prone("(a+)+"));
    ASSERT(is_backtracking_prone("(\\w*)*"));
    ASSERT(is_backtracking_prone("((ab)+)+"));
    ASSERT(!is_backtracking_prone("no (heat|hot water)"));
    ASSERT(!is_backtracking_prone("\\bleak(ing|s)?\\b"));
    ASSERT(!is_backtracking_prone("[(+)]+"));

    ASSERT(compile_regex_trigger("furnace (is )?out").has_value());
    ASSERT(!compile_regex_trigger("(unclosed").has_value());
    ASSERT(!compile_regex_trigger("").has_value());
    ASSERT(!compile_regex_trigger("(a+)+$").has_value());
    ASSERT(!compile_regex_trigger(std::string(600, 'a'), 512).has_value());

    RawScenario with_regex;
    with_regex.regex_triggers = {"no (heat|hot water)", "(x+)+y", "[bad"};
    RuntimeSpec regex_spec = compile_scenario(with_regex);
    ASSERT(regex_spec.triggers.regex.size() == 1);
    ASSERT(regex_spec.triggers.regex[0].source == "no (heat|hot water)");
    ASSERT(std::regex_search("There is NO HEAT upstairs", regex_spec.triggers.regex[0].pattern));

    // --- Needs flags ---
    RawScenario rich = RawScenario::from_json(json::parse(R"({
        "scenarioId": "s-rich",
        "quickReplies": [{"text": "Thanks {name}!", "weight": 2}],
        "quickReplies_noName": ["Thanks!"],
        "ttsOverride": {"rate": 1.1},
        "timedFollowUp": {"enabled": true, "delaySeconds": 10},
        "silencePolicy": {"enabled": false},
        "entityValidation": {},
        "preconditions": [{"slot": "address"}],
        "actionHooks": [],
        "effects": [{"set": "urgent"}],
        "dynamicVariables": {"tech": "on_call"},
        "entityCapture": ["phone"],
        "replyStrategy": "LLM_WRAP"
    })"));
    RuntimeSpec rich_spec = compile_scenario(rich);
    ASSERT(rich_spec.needs.name_variant);
    ASSERT(rich_spec.needs.tts_override);
    ASSERT(rich_spec.needs.timed_follow_up);
    ASSERT(!rich_spec.needs.silence_policy);
    ASSERT(!rich_spec.needs.entity_validation);
    ASSERT(rich_spec.needs.preconditions);
    ASSERT(!rich_spec.needs.action_hooks);
    ASSERT(rich_spec.needs.effects);
    ASSERT(rich_spec.needs.dynamic_variables);
    ASSERT(rich_spec.needs.entity_capture);
    ASSERT(rich_spec.needs.llm_rewrite);
    ASSERT(rich_spec.meta.has_no_name_variants);
    ASSERT(rich_spec.replies.quick.size() == 1);
    ASSERT(rich_spec.replies.quick[0].weight && *rich_spec.replies.quick[0].weight == 2);

    // --- Unknown enum tags survive as labels ---
    RawScenario odd;
    odd.reply_strategy = "whisper_mode";
    odd.action_type = "page_oncall";
    odd.scenario_type = "galactic";
    RuntimeSpec odd_spec = compile_scenario(odd);
    ASSERT(odd_spec.replies.strategy == ReplyStrategy::Unknown);
    ASSERT(odd_spec.replies.strategy_label == "WHISPER_MODE");
    ASSERT(odd_spec.wiring.action_type == ActionType::Unknown);
    ASSERT(odd_spec.wiring.action_label == "PAGE_ONCALL");
    ASSERT(odd_spec.scenario_type == ScenarioType::Faq);

    // --- Lenient parsing ---
    RawScenario wrong_types = RawScenario::from_json(json::parse(R"({
        "_id": {"$oid": "64f0c0ffee"},
        "name": 42,
        "triggers": "not an array",
        "priority": "high"
    })"));
    ASSERT(wrong_types.scenario_id == "64f0c0ffee");
    ASSERT(wrong_types.name.empty());
    ASSERT(wrong_types.triggers.empty());
    ASSERT(!wrong_types.priority.has_value());
    ASSERT(RawScenario::from_json(json::array()).scenario_id.empty());

    // --- Missing id gets a stable synthesized one ---
    RawScenario anon = RawScenario::from_json(json::parse(R"({"name": "Anon", "triggers": ["hello there"]})"));
    RuntimeSpec anon_a = compile_scenario(anon);
    RuntimeSpec anon_b = compile_scenario(anon);
    ASSERT(anon_a.id.rfind("scenario_", 0) == 0);
    ASSERT(anon_a.id == anon_b.id);
    anon.triggers.push_back("hi");
    ASSERT(compile_scenario(anon).id != anon_a.id);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All scenario compiler tests passed.\n";
    return 0;
}
