#include "scenario/pool_compiler.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <sstream>

using json = nlohmann::json;

namespace callroute {
namespace scenario {

bool ExactIndex::insert(const std::string& key, SpecPtr spec) {
    auto result = map_.emplace(key, std::move(spec));
    if (result.second) {
        keys_.push_back(key);
    }
    return result.second;
}

SpecPtr ExactIndex::find(const std::string& key) const {
    auto it = map_.find(key);
    return it != map_.end() ? it->second : nullptr;
}

void WordIndex::append(const std::string& key, const SpecPtr& spec) {
    buckets_[key].push_back(spec);
}

void WordIndex::append_unique(const std::string& key, const SpecPtr& spec) {
    auto& bucket = buckets_[key];
    if (std::find(bucket.begin(), bucket.end(), spec) == bucket.end()) {
        bucket.push_back(spec);
    }
}

const std::vector<SpecPtr>* WordIndex::find(const std::string& key) const {
    auto it = buckets_.find(key);
    return it != buckets_.end() ? &it->second : nullptr;
}

json TriggerConflict::to_json() const {
    return json{
        {"trigger", trigger},
        {"winnerId", winner_id},
        {"shadowedId", shadowed_id},
        {"rejected", rejected}
    };
}

json PoolStats::to_json() const {
    return json{
        {"totalScenarios", total_scenarios},
        {"activeScenarios", active_scenarios},
        {"inactiveScenarios", inactive_scenarios},
        {"rejectedScenarios", rejected_scenarios},
        {"totalTriggers", total_triggers},
        {"totalReplies", total_replies},
        {"exactIndexSize", exact_index_size},
        {"wordIndexSize", word_index_size},
        {"conflictCount", conflict_count},
        {"compileTimeMs", compile_time_ms}
    };
}

namespace {

/// Conflicts this spec would create against the current exact index.
/// Runs before the spec is indexed, so any existing owner is another scenario.
std::vector<TriggerConflict> find_conflicts(const ExactIndex& index, const RuntimeSpec& spec) {
    std::vector<TriggerConflict> conflicts;
    std::vector<std::string> seen;
    for (const auto& trigger : spec.triggers.normalized) {
        if (std::find(seen.begin(), seen.end(), trigger) != seen.end()) {
            continue;
        }
        seen.push_back(trigger);
        if (SpecPtr owner = index.find(trigger)) {
            conflicts.push_back(TriggerConflict{trigger, owner->id, spec.id, false});
        }
    }
    return conflicts;
}

} // namespace

CompiledPool compile_pool(const std::vector<RawScenario>& scenarios,
                          const CompileOptions& options,
                          const CompilerConfig& config) {
    const auto start = std::chrono::steady_clock::now();

    CompileOptions pool_options = options;
    if (!pool_options.compiled_at_ms) {
        pool_options.compiled_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    CompiledPool pool;
    pool.template_id = options.template_id;
    pool.stats.total_scenarios = scenarios.size();

    for (const auto& raw : scenarios) {
        auto spec = std::make_shared<const RuntimeSpec>(compile_scenario(raw, pool_options, config));

        if (!spec->is_active) {
            pool.inactive.push_back(spec);
            pool.stats.inactive_scenarios++;
            continue;
        }

        std::vector<TriggerConflict> conflicts = find_conflicts(pool.exact_index, *spec);
        if (!conflicts.empty()) {
            const bool reject = config.shadow_policy == ShadowPolicy::Reject;
            for (auto& c : conflicts) {
                c.rejected = reject;
                if (config.shadow_policy != ShadowPolicy::KeepFirst) {
                    LOG_WARN("[Compiler] Trigger \"" + c.trigger + "\" of " + c.shadowed_id
                        + (reject ? " rejected: already owned by " : " shadowed by ") + c.winner_id);
                }
                pool.conflicts.push_back(std::move(c));
            }
            pool.stats.conflict_count += conflicts.size();
            if (reject) {
                pool.stats.rejected_scenarios++;
                continue;
            }
        }

        pool.specs.push_back(spec);
        pool.stats.active_scenarios++;
        pool.stats.total_triggers += spec->triggers.normalized.size();
        pool.stats.total_replies += spec->meta.reply_count;

        for (const auto& trigger : spec->triggers.normalized) {
            pool.exact_index.insert(trigger, spec);
            pool.word_index.append(trigger, spec);

            for (const auto& word : utils::split_words(trigger, config.word_min_length)) {
                pool.word_index.append_unique(WordIndex::word_key(word), spec);
            }
        }
    }

    pool.stats.exact_index_size = pool.exact_index.size();
    pool.stats.word_index_size = pool.word_index.size();
    pool.stats.compile_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::ostringstream oss;
    oss << "Scenario pool compiled template=" << (pool.template_id.empty() ? "-" : pool.template_id)
        << " scenarios=" << pool.stats.total_scenarios
        << " active=" << pool.stats.active_scenarios
        << " inactive=" << pool.stats.inactive_scenarios
        << " triggers=" << pool.stats.total_triggers
        << " exactIndex=" << pool.stats.exact_index_size
        << " wordIndex=" << pool.stats.word_index_size
        << " conflicts=" << pool.stats.conflict_count
        << " compileTimeMs=" << pool.stats.compile_time_ms;
    LOG_COMPILER(oss.str());

    return pool;
}

} // namespace scenario
} // namespace callroute
