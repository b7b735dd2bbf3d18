#include "scenario/raw_scenario.h"
#include "logger.h"
#include <fstream>

using json = nlohmann::json;

namespace callroute {
namespace scenario {

namespace {

std::optional<std::string> read_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<double> read_number(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

bool read_true(const json& j, const char* key) {
    return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

/// Keeps the string entries of an array; anything else is dropped
std::vector<std::string> read_string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) {
        return out;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::vector<Reply> read_replies(const json& j, const char* key) {
    std::vector<Reply> out;
    if (!j.contains(key) || !j[key].is_array()) {
        return out;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(Reply{item.get<std::string>(), std::nullopt});
        } else if (item.is_object() && item.contains("text") && item["text"].is_string()) {
            Reply reply;
            reply.text = item["text"].get<std::string>();
            if (item.contains("weight") && item["weight"].is_number()) {
                reply.weight = item["weight"].get<double>();
            }
            out.push_back(std::move(reply));
        }
    }
    return out;
}

json read_array(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key];
    }
    return json::array();
}

json read_object(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return json::object();
}

} // namespace

json Reply::to_json() const {
    if (!weight) {
        return text;
    }
    return json{{"text", text}, {"weight", *weight}};
}

RawScenario RawScenario::from_json(const json& j) {
    RawScenario r;
    if (!j.is_object()) {
        return r;
    }

    if (auto id = read_string(j, "scenarioId")) {
        r.scenario_id = *id;
    } else if (auto oid = read_string(j, "_id")) {
        r.scenario_id = *oid;
    } else if (j.contains("_id") && j["_id"].is_object()) {
        // Extended JSON export: {"_id": {"$oid": "..."}}
        if (auto ext = read_string(j["_id"], "$oid")) {
            r.scenario_id = *ext;
        }
    }
    r.name = read_string(j, "name").value_or("");
    r.status = read_string(j, "status");
    if (j.contains("isActive") && j["isActive"].is_boolean()) {
        r.is_active = j["isActive"].get<bool>();
    }

    r.scenario_type = read_string(j, "scenarioType");
    r.priority = read_number(j, "priority");
    r.min_confidence = read_number(j, "minConfidence");
    r.cooldown_seconds = read_number(j, "cooldownSeconds");

    r.triggers = read_string_list(j, "triggers");
    r.regex_triggers = read_string_list(j, "regexTriggers");
    r.negative_triggers = read_string_list(j, "negativeTriggers");
    r.example_phrases = read_string_list(j, "exampleUserPhrases");
    r.negative_example_phrases = read_string_list(j, "negativeUserPhrases");

    r.quick_replies = read_replies(j, "quickReplies");
    r.full_replies = read_replies(j, "fullReplies");
    r.quick_replies_no_name = read_replies(j, "quickReplies_noName");
    r.full_replies_no_name = read_replies(j, "fullReplies_noName");
    r.reply_strategy = read_string(j, "replyStrategy");

    r.follow_up_mode = read_string(j, "followUpMode");
    r.follow_up_question_text = read_string(j, "followUpQuestionText");
    r.follow_up_funnel = read_string(j, "followUpFunnel");
    r.transfer_target = read_string(j, "transferTarget");

    r.action_type = read_string(j, "actionType");
    r.flow_id = read_string(j, "flowId");
    r.booking_intent = read_true(j, "bookingIntent");
    r.required_slots = read_string_list(j, "requiredSlots");
    r.stop_routing = read_true(j, "stopRouting");

    r.behavior = read_string(j, "behavior");
    r.channel = read_string(j, "channel");
    r.handoff_policy = read_string(j, "handoffPolicy");

    r.preconditions = read_array(j, "preconditions");
    r.entity_capture = read_array(j, "entityCapture");
    r.entity_validation = read_object(j, "entityValidation");
    r.dynamic_variables = read_object(j, "dynamicVariables");
    r.action_hooks = read_array(j, "actionHooks");
    r.effects = read_array(j, "effects");
    r.tts_override = read_object(j, "ttsOverride");
    r.timed_follow_up = read_object(j, "timedFollowUp");
    r.silence_policy = read_object(j, "silencePolicy");

    return r;
}

Result<std::vector<RawScenario>> load_scenarios_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open scenario file: " + path);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + std::string(e.what()));
    }

    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object() && doc.contains("scenarios") && doc["scenarios"].is_array()) {
        list = &doc["scenarios"];
    } else {
        return make_invalid_input_error(path + ": expected an array or {\"scenarios\": [...]}");
    }

    std::vector<RawScenario> scenarios;
    scenarios.reserve(list->size());
    size_t index = 0;
    for (const auto& entry : *list) {
        if (!entry.is_object()) {
            Logger::warn("Skipping non-object scenario entry #" + std::to_string(index) + " in " + path);
        } else {
            scenarios.push_back(RawScenario::from_json(entry));
        }
        ++index;
    }
    return scenarios;
}

} // namespace scenario
} // namespace callroute
