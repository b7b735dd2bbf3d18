#pragma once

#include "config.h"
#include "scenario/runtime_spec.h"
#include "scenario/scenario_compiler.h"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace callroute {
namespace scenario {

using SpecPtr = std::shared_ptr<const RuntimeSpec>;

/**
 * @brief Normalized trigger -> the one scenario that owns it
 *
 * First writer wins. Keys are remembered in insertion order so
 * containment scans are deterministic.
 */
class ExactIndex {
public:
    /// Returns false (and leaves the index unchanged) if the key is already owned
    bool insert(const std::string& key, SpecPtr spec);

    SpecPtr find(const std::string& key) const;
    bool contains(const std::string& key) const { return map_.count(key) > 0; }

    const std::vector<std::string>& keys() const { return keys_; }
    size_t size() const { return map_.size(); }

private:
    std::unordered_map<std::string, SpecPtr> map_;
    std::vector<std::string> keys_;
};

/**
 * @brief Token and trigger buckets for fuzzy candidate generation
 *
 * Two key families share the map: the literal trigger (one entry per
 * registration, duplicates kept) and "word:<token>" (deduplicated).
 */
class WordIndex {
public:
    static std::string word_key(const std::string& token) { return "word:" + token; }

    void append(const std::string& key, const SpecPtr& spec);
    void append_unique(const std::string& key, const SpecPtr& spec);

    /// nullptr when the key has no bucket
    const std::vector<SpecPtr>* find(const std::string& key) const;
    bool contains(const std::string& key) const { return buckets_.count(key) > 0; }
    size_t size() const { return buckets_.size(); }

private:
    std::unordered_map<std::string, std::vector<SpecPtr>> buckets_;
};

/// Two active scenarios registering the same literal trigger
struct TriggerConflict {
    std::string trigger;
    std::string winner_id;
    std::string shadowed_id;
    bool rejected = false;  ///< True when ShadowPolicy::Reject dropped the later scenario

    nlohmann::json to_json() const;
};

struct PoolStats {
    size_t total_scenarios = 0;
    size_t active_scenarios = 0;
    size_t inactive_scenarios = 0;
    size_t rejected_scenarios = 0;
    size_t total_triggers = 0;
    size_t total_replies = 0;
    size_t exact_index_size = 0;
    size_t word_index_size = 0;
    size_t conflict_count = 0;
    double compile_time_ms = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Everything a lookup needs, built in one pass
 *
 * Published as std::shared_ptr<const CompiledPool>; never modified after
 * compile_pool() returns.
 */
struct CompiledPool {
    uint64_t version = 0;          ///< Set by PoolStore on publish
    std::string template_id;
    std::vector<SpecPtr> specs;    ///< Active, indexed
    std::vector<SpecPtr> inactive; ///< Compiled for audit only, never indexed
    ExactIndex exact_index;
    WordIndex word_index;
    std::vector<TriggerConflict> conflicts;
    PoolStats stats;
};

/**
 * @brief Compile raw scenarios and index the active ones
 *
 * All specs in the pool share one compiled_at timestamp. Exact-index
 * conflicts are recorded and handled per config.shadow_policy.
 */
CompiledPool compile_pool(const std::vector<RawScenario>& scenarios,
                          const CompileOptions& options = {},
                          const CompilerConfig& config = {});

} // namespace scenario
} // namespace callroute
