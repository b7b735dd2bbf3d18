#pragma once

#include "flow/predicate.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace callroute {
namespace flow {

enum class NodeType {
    Entry,     ///< Turn start
    Guard,     ///< Validation or gating check
    Detector,  ///< Intent or pattern detection
    Decision,  ///< Branching point
    Action,    ///< Something that happens
    Router,    ///< Hands off to a subsystem
    Exit       ///< Turn end
};

const char* node_type_name(NodeType type);

struct FlowNode {
    std::string id;
    std::string label;
    NodeType type = NodeType::Action;
    std::string description;
    std::string checkpoint;
    std::optional<std::string> match_source;
    std::vector<std::string> config_paths;
    std::optional<std::string> code_location;
    std::optional<std::string> tier;
    std::optional<std::string> note;

    nlohmann::json to_json() const;
};

/**
 * @brief Directed transition with its declared condition
 *
 * `when` is kept verbatim. FlowGraph parses it on construction; a condition
 * that does not parse leaves `predicate` empty and sets `predicate_error`.
 */
struct FlowEdge {
    std::string id;
    std::string from;
    std::string to;
    std::string when = "always";
    std::optional<Predicate> predicate;
    std::string predicate_error;

    nlohmann::json to_json() const;
};

/// Runtime tags (checkpoints, match sources, log patterns) that identify a node
struct RuntimeBinding {
    std::string node_id;
    std::vector<std::string> checkpoints;
    std::vector<std::string> match_sources;
    std::vector<std::string> code_patterns;
    std::vector<std::string> events;
    std::optional<std::string> note;

    nlohmann::json to_json() const;
};

struct FlowDefinition {
    std::string version;
    std::string entry_node_id;
    std::string exit_node_id;
    std::vector<FlowNode> nodes;
    std::vector<FlowEdge> edges;
    std::vector<RuntimeBinding> bindings;
};

struct MalformedPredicate {
    std::string edge_id;
    std::string when;
    std::string error;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable declaration of the per-turn routing graph
 *
 * Queries and validators are reads over data fixed at construction, so a
 * single instance can be shared across threads without locking.
 */
class FlowGraph {
public:
    explicit FlowGraph(FlowDefinition definition);

    const std::string& version() const { return def_.version; }
    const std::string& entry_node_id() const { return def_.entry_node_id; }
    const std::string& exit_node_id() const { return def_.exit_node_id; }
    const std::vector<FlowNode>& nodes() const { return def_.nodes; }
    const std::vector<FlowEdge>& edges() const { return def_.edges; }
    const std::vector<RuntimeBinding>& bindings() const { return def_.bindings; }

    /// nullptr when no node has this id
    const FlowNode* get_node(const std::string& id) const;
    std::vector<const FlowEdge*> get_edges_from(const std::string& id) const;
    std::vector<const FlowEdge*> get_edges_to(const std::string& id) const;

    /// First binding listing the tag wins, in declaration order
    const FlowNode* find_node_by_match_source(const std::string& match_source) const;
    const FlowNode* find_node_by_checkpoint(const std::string& checkpoint) const;

    bool is_match_source_in_tree(const std::string& match_source) const;

    /// Distinct match sources across all bindings, first-seen order
    std::vector<std::string> valid_match_sources() const;

    // Validators

    /// Breadth-first from the entry node; ids never visited, in declaration order
    std::vector<std::string> find_unreachable_nodes() const;

    /// Edges whose from or to names a node that does not exist
    std::vector<FlowEdge> find_invalid_edges() const;

    std::vector<MalformedPredicate> find_malformed_predicates() const;

    /// Nodes no runtime binding points at; the runtime can never report them
    std::vector<std::string> find_unbound_nodes() const;

    std::vector<std::string> nodes_without_incoming() const;
    std::vector<std::string> terminal_nodes() const;

    // Export

    nlohmann::json export_flow_tree(const std::string& generated_at) const;
    nlohmann::json export_runtime_bindings() const;

private:
    FlowDefinition def_;
    std::unordered_map<std::string, size_t> node_index_;
};

} // namespace flow
} // namespace callroute
