#pragma once

#include "config.h"
#include "scenario/pool_compiler.h"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace callroute {
namespace scenario {

using PoolPtr = std::shared_ptr<const CompiledPool>;

/**
 * @brief Published pool snapshots, one per template
 *
 * Writers compile off to the side and swap the pointer under a short lock.
 * Readers hold the returned snapshot for a whole turn; a concurrent publish
 * never changes what they see.
 */
class PoolStore {
public:
    PoolStore() = default;

    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    /// Take ownership of a compiled pool, stamp the next version and make it current
    PoolPtr publish(CompiledPool pool);

    /**
     * @brief Publish under a version taken with reserve_version() before compiling
     *
     * If the template already holds a snapshot with a higher version, the
     * pool is stale: it is discarded and the newer snapshot is returned.
     */
    PoolPtr publish(CompiledPool pool, uint64_t version);

    /// Claim the version for a compile that is about to start
    uint64_t reserve_version();

    /// Reserve, compile, publish; keyed by options.template_id
    PoolPtr rebuild(const std::vector<RawScenario>& scenarios,
                    const CompileOptions& options,
                    const CompilerConfig& config = {});

    /// nullptr when nothing has been published for the template
    PoolPtr current(const std::string& template_id) const;

    /// Drop the template's snapshot. Readers holding it keep it alive.
    bool remove(const std::string& template_id);

    std::vector<std::string> template_ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PoolPtr> pools_;
    uint64_t next_version_ = 1;
};

} // namespace scenario
} // namespace callroute
