#include "scenario/candidate_lookup.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <unordered_map>

using json = nlohmann::json;

namespace callroute {
namespace scenario {

const char* lookup_method_name(LookupMethod method) {
    switch (method) {
        case LookupMethod::Exact: return "exact";
        case LookupMethod::Contains: return "contains";
        case LookupMethod::WordIndex: return "word_index";
    }
    return "word_index";
}

LookupLimits LookupLimits::from_config(const CompilerConfig& config) {
    LookupLimits limits;
    limits.contains_min_length = config.contains_min_length;
    limits.word_min_length = config.word_min_length;
    limits.max_candidates = std::min(config.max_candidates, kMaxCandidates);
    return limits;
}

json LookupResult::to_json() const {
    json ids = json::array();
    for (const auto& c : candidates) {
        ids.push_back(c->id);
    }
    return json{
        {"exactMatch", exact_match ? json(exact_match->id) : json(nullptr)},
        {"candidates", ids},
        {"method", lookup_method_name(method)}
    };
}

LookupResult lookup(const std::string& input,
                    const ExactIndex& exact_index,
                    const WordIndex& word_index,
                    const LookupLimits& limits) {
    LookupResult result;
    const std::string normalized = utils::normalize_phrase(input);

    // 1. Exact
    if (SpecPtr spec = exact_index.find(normalized)) {
        result.exact_match = spec;
        result.candidates.push_back(spec);
        result.method = LookupMethod::Exact;
        return result;
    }

    // 2. Containment. Linear in distinct triggers.
    for (const auto& trigger : exact_index.keys()) {
        if (trigger.size() >= limits.contains_min_length
            && normalized.find(trigger) != std::string::npos) {
            result.candidates.push_back(exact_index.find(trigger));
            result.method = LookupMethod::Contains;
            return result;
        }
    }

    // 3. Word overlap
    std::vector<SpecPtr> order;
    std::unordered_map<const RuntimeSpec*, size_t> scores;
    for (const auto& word : utils::split_words(normalized, limits.word_min_length)) {
        const auto* bucket = word_index.find(WordIndex::word_key(word));
        if (!bucket) {
            continue;
        }
        for (const auto& spec : *bucket) {
            auto it = scores.find(spec.get());
            if (it == scores.end()) {
                scores.emplace(spec.get(), 1);
                order.push_back(spec);
            } else {
                it->second++;
            }
        }
    }

    std::stable_sort(order.begin(), order.end(),
        [&scores](const SpecPtr& a, const SpecPtr& b) {
            return scores.at(a.get()) > scores.at(b.get());
        });
    const size_t cap = std::min(limits.max_candidates, kMaxCandidates);
    if (order.size() > cap) {
        order.resize(cap);
    }

    result.candidates = std::move(order);
    result.method = LookupMethod::WordIndex;
    LOG_LOOKUP("word_index candidates=" + std::to_string(result.candidates.size()));
    return result;
}

LookupResult lookup(const std::string& input, const CompiledPool& pool, const LookupLimits& limits) {
    return lookup(input, pool.exact_index, pool.word_index, limits);
}

} // namespace scenario
} // namespace callroute
