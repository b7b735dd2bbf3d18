#include "scenario/pool_store.h"
#include "logger.h"

namespace callroute {
namespace scenario {

uint64_t PoolStore::reserve_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_version_++;
}

PoolPtr PoolStore::publish(CompiledPool pool) {
    return publish(std::move(pool), reserve_version());
}

PoolPtr PoolStore::publish(CompiledPool pool, uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = pools_.find(pool.template_id);
    if (existing != pools_.end() && existing->second->version > version) {
        LOG_WARN("[Compiler] Discarding stale pool template=" + pool.template_id
            + " version=" + std::to_string(version)
            + " current=" + std::to_string(existing->second->version));
        return existing->second;
    }
    pool.version = version;
    auto snapshot = std::make_shared<const CompiledPool>(std::move(pool));
    pools_[snapshot->template_id] = snapshot;
    LOG_COMPILER("Published pool template=" + (snapshot->template_id.empty() ? std::string("-") : snapshot->template_id)
        + " version=" + std::to_string(snapshot->version));
    return snapshot;
}

PoolPtr PoolStore::rebuild(const std::vector<RawScenario>& scenarios,
                           const CompileOptions& options,
                           const CompilerConfig& config) {
    // Version is fixed before compiling so a slower, older rebuild cannot win
    const uint64_t version = reserve_version();
    CompiledPool pool = compile_pool(scenarios, options, config);
    return publish(std::move(pool), version);
}

PoolPtr PoolStore::current(const std::string& template_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(template_id);
    return it != pools_.end() ? it->second : nullptr;
}

bool PoolStore::remove(const std::string& template_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.erase(template_id) > 0;
}

std::vector<std::string> PoolStore::template_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(pools_.size());
    for (const auto& entry : pools_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace scenario
} // namespace callroute
