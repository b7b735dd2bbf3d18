#include "scenario/scenario_compiler.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <cstdio>

namespace callroute {
namespace scenario {

namespace {

/// Lower-case, trim, keep entries of at least min_length characters
std::vector<std::string> normalize_list(const std::vector<std::string>& items, size_t min_length) {
    std::vector<std::string> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        std::string n = utils::normalize_phrase(item);
        if (n.size() >= min_length) {
            out.push_back(std::move(n));
        }
    }
    return out;
}

std::vector<Reply> normalize_replies(const std::vector<Reply>& replies) {
    std::vector<Reply> out;
    out.reserve(replies.size());
    for (const auto& r : replies) {
        if (!utils::is_empty_or_whitespace(r.text)) {
            out.push_back(r);
        }
    }
    return out;
}

bool non_empty(const nlohmann::json& value) {
    return (value.is_array() || value.is_object()) && !value.empty();
}

/// Object with "enabled": true
bool enabled(const nlohmann::json& value) {
    return value.is_object() && value.contains("enabled")
        && value["enabled"].is_boolean() && value["enabled"].get<bool>();
}

/// FNV-1a over name and triggers, prefixed "scenario_"
std::string synthesize_id(const RawScenario& raw) {
    uint32_t hash = 2166136261u;
    auto mix = [&hash](const std::string& s) {
        for (unsigned char c : s) {
            hash ^= c;
            hash *= 16777619u;
        }
        hash ^= 0xff;
        hash *= 16777619u;
    };
    mix(raw.name);
    for (const auto& t : raw.triggers) {
        mix(t);
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", hash);
    return std::string("scenario_") + buf;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

bool is_backtracking_prone(const std::string& pattern) {
    // One entry per open group: whether its body contains a quantifier
    std::vector<bool> groups;
    bool in_class = false;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        switch (c) {
            case '[':
                in_class = true;
                break;
            case '(':
                groups.push_back(false);
                break;
            case ')': {
                if (groups.empty()) {
                    break;  // unbalanced, std::regex rejects it
                }
                const bool inner = groups.back();
                groups.pop_back();
                const bool quantified = i + 1 < pattern.size()
                    && (pattern[i + 1] == '*' || pattern[i + 1] == '+' || pattern[i + 1] == '{');
                if (inner && quantified) {
                    return true;
                }
                if ((inner || quantified) && !groups.empty()) {
                    groups.back() = true;
                }
                break;
            }
            case '*':
            case '+':
            case '{':
                if (!groups.empty()) {
                    groups.back() = true;
                }
                break;
            default:
                break;
        }
    }
    return false;
}

std::optional<CompiledRegex> compile_regex_trigger(const std::string& pattern, size_t max_length) {
    if (utils::is_empty_or_whitespace(pattern)) {
        return std::nullopt;
    }
    if (pattern.size() > max_length) {
        LOG_WARN("[Compiler] Regex trigger too long (" + std::to_string(pattern.size())
            + " > " + std::to_string(max_length) + "), dropped");
        return std::nullopt;
    }
    if (is_backtracking_prone(pattern)) {
        LOG_WARN("[Compiler] Regex trigger has nested quantifiers, dropped: " + pattern);
        return std::nullopt;
    }
    try {
        return CompiledRegex{pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase)};
    } catch (const std::regex_error& e) {
        LOG_WARN("[Compiler] Invalid regex trigger \"" + pattern + "\": " + e.what());
        return std::nullopt;
    }
}

bool has_name_placeholder(const std::vector<Reply>& replies) {
    for (const auto& r : replies) {
        if (utils::contains_ignore_case(r.text, "{name}")) {
            return true;
        }
    }
    return false;
}

RuntimeSpec compile_scenario(const RawScenario& raw, const CompileOptions& options,
                             const CompilerConfig& config) {
    const auto start = std::chrono::steady_clock::now();

    RuntimeSpec spec;

    // Identity
    spec.id = raw.scenario_id.empty() ? synthesize_id(raw) : raw.scenario_id;
    spec.name = raw.name.empty() ? "Unnamed Scenario" : raw.name;
    spec.template_id = options.template_id;
    spec.category_name = options.category_name;

    // An absent status counts as live; draft and archived never route
    spec.status = raw.status.value_or("live");
    spec.is_active = raw.is_active.value_or(true) && spec.status == "live";

    spec.scenario_type = parse_scenario_type(raw.scenario_type.value_or(""));
    spec.priority = raw.priority.value_or(50);
    spec.min_confidence = raw.min_confidence.value_or(0.6);
    spec.cooldown_seconds = raw.cooldown_seconds.value_or(0);

    // Triggers
    const size_t min_length = std::max(config.min_trigger_length, kMinTriggerLength);
    spec.triggers.original = raw.triggers;
    spec.triggers.normalized = normalize_list(raw.triggers, min_length);
    for (const auto& pattern : raw.regex_triggers) {
        if (auto compiled = compile_regex_trigger(pattern, config.max_regex_length)) {
            spec.triggers.regex.push_back(std::move(*compiled));
        }
    }
    spec.triggers.negative = normalize_list(raw.negative_triggers, min_length);
    spec.triggers.examples = normalize_list(raw.example_phrases, min_length);
    spec.triggers.negative_examples = normalize_list(raw.negative_example_phrases, min_length);

    // Replies
    spec.replies.quick = normalize_replies(raw.quick_replies);
    spec.replies.full = normalize_replies(raw.full_replies);
    spec.replies.quick_no_name = normalize_replies(raw.quick_replies_no_name);
    spec.replies.full_no_name = normalize_replies(raw.full_replies_no_name);
    spec.replies.strategy = parse_reply_strategy(raw.reply_strategy.value_or(""));
    spec.replies.strategy_label = spec.replies.strategy == ReplyStrategy::Unknown
        ? utils::to_upper_copy(*raw.reply_strategy)
        : reply_strategy_name(spec.replies.strategy);

    // Follow-up
    spec.follow_up.mode = parse_follow_up_mode(raw.follow_up_mode.value_or(""));
    spec.follow_up.mode_label = spec.follow_up.mode == FollowUpMode::Unknown
        ? utils::to_upper_copy(*raw.follow_up_mode)
        : follow_up_mode_name(spec.follow_up.mode);
    spec.follow_up.question_text = raw.follow_up_question_text;
    spec.follow_up.funnel = raw.follow_up_funnel;
    spec.follow_up.transfer_target = raw.transfer_target;

    // Wiring
    spec.wiring.action_type = parse_action_type(raw.action_type.value_or(""));
    spec.wiring.action_label = spec.wiring.action_type == ActionType::Unknown
        ? utils::to_upper_copy(*raw.action_type)
        : action_type_name(spec.wiring.action_type);
    spec.wiring.flow_id = raw.flow_id;
    spec.wiring.booking_intent = raw.booking_intent;
    spec.wiring.required_slots = raw.required_slots;
    spec.wiring.stop_routing = raw.stop_routing;

    // Behavior
    spec.behavior = raw.behavior.value_or("calm_professional");
    spec.channel = raw.channel.value_or("any");
    spec.handoff_policy = raw.handoff_policy.value_or("low_confidence");

    // Needs flags. Each one reads only the field whose data it guards.
    spec.needs.name_variant = has_name_placeholder(raw.quick_replies) || has_name_placeholder(raw.full_replies);
    spec.needs.tts_override = non_empty(raw.tts_override);
    spec.needs.timed_follow_up = enabled(raw.timed_follow_up);
    spec.needs.silence_policy = enabled(raw.silence_policy);
    spec.needs.entity_validation = non_empty(raw.entity_validation);
    spec.needs.preconditions = non_empty(raw.preconditions);
    spec.needs.action_hooks = non_empty(raw.action_hooks);
    spec.needs.effects = non_empty(raw.effects);
    spec.needs.dynamic_variables = non_empty(raw.dynamic_variables);
    spec.needs.entity_capture = non_empty(raw.entity_capture);
    spec.needs.llm_rewrite = spec.replies.strategy == ReplyStrategy::LlmWrap
        || spec.replies.strategy == ReplyStrategy::LlmContext;

    // Raw payload for tier 2 readers
    spec.raw.preconditions = raw.preconditions;
    spec.raw.entity_capture = raw.entity_capture;
    spec.raw.entity_validation = raw.entity_validation;
    spec.raw.dynamic_variables = raw.dynamic_variables;
    spec.raw.action_hooks = raw.action_hooks;
    spec.raw.effects = raw.effects;
    spec.raw.tts_override = raw.tts_override;
    spec.raw.timed_follow_up = raw.timed_follow_up;
    spec.raw.silence_policy = raw.silence_policy;

    // Meta
    spec.meta.compiled_at_ms = options.compiled_at_ms ? *options.compiled_at_ms : now_ms();
    spec.meta.trigger_count = raw.triggers.size();
    spec.meta.reply_count = raw.quick_replies.size() + raw.full_replies.size();
    spec.meta.has_no_name_variants = !raw.quick_replies_no_name.empty() || !raw.full_replies_no_name.empty();
    spec.meta.compile_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    return spec;
}

} // namespace scenario
} // namespace callroute
