#pragma once

#include "config.h"
#include "scenario/pool_compiler.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace callroute {
namespace scenario {

enum class LookupMethod {
    Exact,      ///< Input equals a trigger
    Contains,   ///< Input contains a trigger of contains_min_length or more
    WordIndex   ///< Token overlap, possibly empty
};

const char* lookup_method_name(LookupMethod method);

struct LookupLimits {
    size_t contains_min_length = 5;
    size_t word_min_length = 3;
    size_t max_candidates = kMaxCandidates;  ///< Values above kMaxCandidates are treated as kMaxCandidates

    static LookupLimits from_config(const CompilerConfig& config);
};

struct LookupResult {
    SpecPtr exact_match;             ///< Set only for LookupMethod::Exact
    std::vector<SpecPtr> candidates; ///< At most max_candidates, best first
    LookupMethod method = LookupMethod::WordIndex;

    nlohmann::json to_json() const;
};

/**
 * @brief Narrow a pool down to a short candidate list for one utterance
 *
 * Exact match, then containment over exact-index keys in registration
 * order, then word-index overlap ranked by matched-token count. Reads the
 * indices only; safe to call concurrently on a published pool.
 */
LookupResult lookup(const std::string& input,
                    const ExactIndex& exact_index,
                    const WordIndex& word_index,
                    const LookupLimits& limits = {});

LookupResult lookup(const std::string& input, const CompiledPool& pool,
                    const LookupLimits& limits = {});

} // namespace scenario
} // namespace callroute
