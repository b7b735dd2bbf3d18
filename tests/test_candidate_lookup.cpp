/**
 * Candidate lookup tests.
 * Asserts:
 * - An input equal to a trigger is always an exact match.
 * - Containment scans triggers of five or more characters in registration order.
 * - Word-index candidates are ranked by matched tokens and capped at twenty.
 * - Inactive scenarios never surface.
 *
 * Run from build dir: ./test_candidate_lookup
 */

#include "scenario/candidate_lookup.h"
#include "scenario/pool_compiler.h"
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace callroute;
using namespace callroute::scenario;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static RawScenario make_scenario(const std::string& id, std::vector<std::string> triggers, bool active = true) {
    RawScenario r;
    r.scenario_id = id;
    r.triggers = std::move(triggers);
    r.is_active = active;
    return r;
}

static bool has_candidate(const LookupResult& result, const std::string& id) {
    for (const auto& c : result.candidates) {
        if (c->id == id) return true;
    }
    return false;
}

int main() {
    // --- Concrete example: exact "no heat" on a single-scenario pool ---
    RawScenario heat = make_scenario("s-heat", {"no heat", "furnace broken"});
    heat.scenario_type = "EMERGENCY";
    heat.quick_replies = {Reply{"I'm sorry to hear that, let's get someone out.", std::nullopt}};
    CompiledPool heat_pool = compile_pool({heat});

    LookupResult exact = lookup("no heat", heat_pool);
    ASSERT(exact.method == LookupMethod::Exact);
    ASSERT(exact.exact_match != nullptr);
    ASSERT(exact.exact_match->id == "s-heat");
    ASSERT(exact.candidates.size() == 1);
    ASSERT(exact.to_json()["method"] == "exact");
    ASSERT(exact.to_json()["exactMatch"] == "s-heat");

    // Input is normalized before matching
    LookupResult shouted = lookup("  NO HEAT ", heat_pool);
    ASSERT(shouted.method == LookupMethod::Exact);

    // --- Exact beats fuzzy, for every trigger ---
    std::vector<RawScenario> raw = {
        make_scenario("s-heat", {"no heat", "furnace broken", "heater not working"}),
        make_scenario("s-leak", {"water leak", "leak under sink"}),
        make_scenario("s-ac", {"ac not cooling", "air conditioner broken"}),
        make_scenario("s-hours", {"hours", "are you open"}),
        make_scenario("s-old", {"broken promo", "old heater"}, false)
    };
    CompiledPool pool = compile_pool(raw);
    for (const auto& spec : pool.specs) {
        for (const auto& trigger : spec->triggers.normalized) {
            LookupResult r = lookup(trigger, pool);
            ASSERT(r.method == LookupMethod::Exact);
            ASSERT(r.exact_match && r.exact_match->id == spec->id);
        }
    }

    // --- Containment ---
    LookupResult contained = lookup("hi there, I think I have a water leak in the basement", pool);
    ASSERT(contained.method == LookupMethod::Contains);
    ASSERT(contained.exact_match == nullptr);
    ASSERT(contained.candidates.size() == 1);
    ASSERT(contained.candidates[0]->id == "s-leak");

    // Several contained triggers: the first registered wins
    LookupResult first_registered = lookup("no heat and what are your hours", pool);
    ASSERT(first_registered.method == LookupMethod::Contains);
    ASSERT(first_registered.candidates[0]->id == "s-heat");

    // Triggers below contains_min_length are skipped
    LookupLimits strict;
    strict.contains_min_length = 8;
    LookupResult too_short = lookup("call me about your hours please", pool, strict);
    ASSERT(too_short.method == LookupMethod::WordIndex);

    // --- Word index ranking ---
    LookupResult ranked = lookup("my heater is broken and not working", pool);
    ASSERT(ranked.method == LookupMethod::WordIndex);
    ASSERT(!ranked.candidates.empty());
    // s-heat matches heater/broken/not/working; s-ac matches broken/not
    ASSERT(ranked.candidates[0]->id == "s-heat");
    ASSERT(has_candidate(ranked, "s-ac"));
    ASSERT(!has_candidate(ranked, "s-old"));

    // No overlap yields an empty word-index result, never an error
    LookupResult nothing = lookup("zebra xylophone", pool);
    ASSERT(nothing.method == LookupMethod::WordIndex);
    ASSERT(nothing.candidates.empty());
    ASSERT(nothing.to_json()["exactMatch"].is_null());

    // --- Inactive exclusion ---
    LookupResult inactive_exact = lookup("old heater", pool);
    ASSERT(inactive_exact.method != LookupMethod::Exact);
    ASSERT(!has_candidate(inactive_exact, "s-old"));
    LookupResult inactive_promo = lookup("broken promo", pool);
    ASSERT(!has_candidate(inactive_promo, "s-old"));

    // --- Candidate bound ---
    std::vector<RawScenario> crowd;
    for (int i = 0; i < 60; ++i) {
        crowd.push_back(make_scenario("s-" + std::to_string(i),
            {"furnace issue number" + std::to_string(i)}));
    }
    CompiledPool big = compile_pool(crowd);
    LookupResult capped = lookup("my furnace has an issue", big);
    ASSERT(capped.method == LookupMethod::WordIndex);
    ASSERT(capped.candidates.size() == 20);
    // Equal scores keep registration order
    ASSERT(capped.candidates[0]->id == "s-0");
    ASSERT(capped.candidates[19]->id == "s-19");

    LookupLimits five;
    five.max_candidates = 5;
    ASSERT(lookup("furnace issue", big, five).candidates.size() <= 5);

    CompilerConfig cfg;
    cfg.max_candidates = 7;
    ASSERT(LookupLimits::from_config(cfg).max_candidates == 7);

    // A wider limit never lifts the 20-candidate cap
    LookupLimits wide;
    wide.max_candidates = 50;
    ASSERT(lookup("my furnace has an issue", big, wide).candidates.size() == 20);
    cfg.max_candidates = 50;
    ASSERT(LookupLimits::from_config(cfg).max_candidates == 20);
    ASSERT(lookup("my furnace has an issue", big, LookupLimits::from_config(cfg)).candidates.size() == 20);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All candidate lookup tests passed.\n";
    return 0;
}
