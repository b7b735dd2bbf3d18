#pragma once

#include "errors.h"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace callroute {
namespace scenario {

/// One reply entry. Admin records store either a bare string or {text, weight}.
struct Reply {
    std::string text;
    std::optional<double> weight;

    nlohmann::json to_json() const;
};

/**
 * @brief Scenario record as persisted by the admin layer
 *
 * Read-only input to the compiler. Parsing is lenient: every field is
 * optional and a value of the wrong JSON type is treated as absent, so
 * from_json() never fails on a JSON object.
 */
struct RawScenario {
    // Identity
    std::string scenario_id;
    std::string name;
    std::optional<std::string> status;   ///< draft | live | archived
    std::optional<bool> is_active;

    // Classification
    std::optional<std::string> scenario_type;
    std::optional<double> priority;
    std::optional<double> min_confidence;
    std::optional<double> cooldown_seconds;

    // Trigger material
    std::vector<std::string> triggers;
    std::vector<std::string> regex_triggers;
    std::vector<std::string> negative_triggers;
    std::vector<std::string> example_phrases;
    std::vector<std::string> negative_example_phrases;

    // Reply material
    std::vector<Reply> quick_replies;
    std::vector<Reply> full_replies;
    std::vector<Reply> quick_replies_no_name;
    std::vector<Reply> full_replies_no_name;
    std::optional<std::string> reply_strategy;

    // Follow-up
    std::optional<std::string> follow_up_mode;
    std::optional<std::string> follow_up_question_text;
    std::optional<std::string> follow_up_funnel;
    std::optional<std::string> transfer_target;

    // Wiring hints
    std::optional<std::string> action_type;
    std::optional<std::string> flow_id;
    bool booking_intent = false;
    std::vector<std::string> required_slots;
    bool stop_routing = false;

    // Behavioral hints
    std::optional<std::string> behavior;
    std::optional<std::string> channel;
    std::optional<std::string> handoff_policy;

    // Tier 2 / tier 3 settings, kept as untyped JSON
    nlohmann::json preconditions = nlohmann::json::array();
    nlohmann::json entity_capture = nlohmann::json::array();
    nlohmann::json entity_validation = nlohmann::json::object();
    nlohmann::json dynamic_variables = nlohmann::json::object();
    nlohmann::json action_hooks = nlohmann::json::array();
    nlohmann::json effects = nlohmann::json::array();
    nlohmann::json tts_override = nlohmann::json::object();
    nlohmann::json timed_follow_up = nlohmann::json::object();
    nlohmann::json silence_policy = nlohmann::json::object();

    /// Lenient parse. A non-object input yields an empty record.
    static RawScenario from_json(const nlohmann::json& j);
};

/**
 * @brief Load scenario records from a JSON file
 *
 * Accepts either a top-level array or an object with a "scenarios" array.
 * Non-object entries are skipped with a warning.
 */
Result<std::vector<RawScenario>> load_scenarios_file(const std::string& path);

} // namespace scenario
} // namespace callroute
