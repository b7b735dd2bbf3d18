#pragma once

#include "config.h"
#include "flow/flow_graph.h"
#include "truth/wiring_report.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace callroute {
namespace truth {

constexpr const char* kTruthBundleSchema = "TRUTH_BUNDLE_V1";

/// Ordered worst-last: an export only ever moves right
enum class Integrity {
    Complete,
    Degraded,
    Invalid,
    Failed
};

const char* integrity_name(Integrity integrity);

/// Raise `current` to `floor` if it is less severe
Integrity downgrade(Integrity current, Integrity floor);

struct ExportOptions {
    std::optional<std::string> company_id;
    std::optional<nlohmann::json> company;   ///< Company document; required for a COMPLETE production export
    std::string environment;                 ///< Empty = TruthExportConfig::environment
    std::optional<bool> allow_degraded;      ///< Unset = TruthExportConfig::allow_degraded
};

struct BundleValidation {
    bool valid = true;
    std::vector<std::string> errors;

    nlohmann::json to_json() const;
};

/// Signals a runtime turn reports about the path it took
struct RuntimeState {
    std::optional<std::string> match_source;
    std::optional<std::string> checkpoint;
    std::optional<std::string> branch_taken;

    nlohmann::json to_json() const;
};

struct PathCheck {
    bool in_tree = false;
    std::optional<std::string> flow_node_id;
    std::optional<nlohmann::json> warning;   ///< OUT_OF_TREE_PATH record when !in_tree

    nlohmann::json to_json() const;
};

/**
 * @brief Builds and checks the auditable snapshot of the flow graph
 *
 * The graph must outlive the exporter. The wiring source may be null, in
 * which case every export is at best DEGRADED.
 */
class TruthBundleExporter {
public:
    TruthBundleExporter(const flow::FlowGraph& graph,
                        std::shared_ptr<WiringReportSource> wiring_source,
                        const TruthExportConfig& config = {});
    ~TruthBundleExporter();

    TruthBundleExporter(const TruthBundleExporter&) = delete;
    TruthBundleExporter& operator=(const TruthBundleExporter&) = delete;

    /**
     * @brief Assemble a bundle, or an error envelope when integrity gates fail
     *
     * Never throws for bad input: a missing company id yields an INVALID
     * envelope, and a non-COMPLETE export without allow_degraded yields a
     * FAILED envelope with no flow tree.
     */
    nlohmann::json generate(const ExportOptions& options) const;

    /// Schema tag, required sections, recomputed hash, recorded graph defects
    static BundleValidation validate(const nlohmann::json& bundle);

    /// Hash over everything except meta; how generate() fills meta.hash
    static Result<std::string> compute_hash(const nlohmann::json& bundle);

    /// matchSource, then checkpoint, then branchTaken special cases
    std::optional<std::string> resolve_flow_node_id(const RuntimeState& state) const;

    PathCheck check_path_in_tree(const RuntimeState& state) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace truth
} // namespace callroute
