#include "flow/flow_graph.h"
#include "logger.h"
#include <algorithm>
#include <deque>
#include <unordered_set>

using json = nlohmann::json;

namespace callroute {
namespace flow {

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Entry: return "entry";
        case NodeType::Guard: return "guard";
        case NodeType::Detector: return "detector";
        case NodeType::Decision: return "decision";
        case NodeType::Action: return "action";
        case NodeType::Router: return "router";
        case NodeType::Exit: return "exit";
    }
    return "action";
}

json FlowNode::to_json() const {
    json j{
        {"id", id},
        {"label", label},
        {"type", node_type_name(type)},
        {"description", description},
        {"checkpoint", checkpoint},
        {"configPaths", config_paths}
    };
    if (match_source) j["matchSource"] = *match_source;
    if (code_location) j["codeLocation"] = *code_location;
    if (tier) j["tier"] = *tier;
    if (note) j["note"] = *note;
    return j;
}

json FlowEdge::to_json() const {
    return json{
        {"id", id},
        {"from", from},
        {"to", to},
        {"when", when},
        {"whenAst", predicate ? predicate->to_json() : json(nullptr)}
    };
}

json RuntimeBinding::to_json() const {
    json j{
        {"nodeId", node_id},
        {"checkpoints", checkpoints},
        {"matchSources", match_sources},
        {"codePatterns", code_patterns},
        {"events", events}
    };
    if (note) j["note"] = *note;
    return j;
}

json MalformedPredicate::to_json() const {
    return json{{"edgeId", edge_id}, {"when", when}, {"error", error}};
}

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

FlowGraph::FlowGraph(FlowDefinition definition) : def_(std::move(definition)) {
    for (size_t i = 0; i < def_.nodes.size(); ++i) {
        if (!node_index_.emplace(def_.nodes[i].id, i).second) {
            LOG_WARN("[Flow] Duplicate node id " + def_.nodes[i].id + ", keeping first");
        }
    }

    for (auto& edge : def_.edges) {
        auto parsed = parse_predicate(edge.when);
        if (parsed.is_ok()) {
            edge.predicate = parsed.value();
            edge.predicate_error.clear();
        } else {
            edge.predicate.reset();
            edge.predicate_error = parsed.error().message;
        }
    }
}

const FlowNode* FlowGraph::get_node(const std::string& id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &def_.nodes[it->second] : nullptr;
}

std::vector<const FlowEdge*> FlowGraph::get_edges_from(const std::string& id) const {
    std::vector<const FlowEdge*> out;
    for (const auto& edge : def_.edges) {
        if (edge.from == id) out.push_back(&edge);
    }
    return out;
}

std::vector<const FlowEdge*> FlowGraph::get_edges_to(const std::string& id) const {
    std::vector<const FlowEdge*> out;
    for (const auto& edge : def_.edges) {
        if (edge.to == id) out.push_back(&edge);
    }
    return out;
}

const FlowNode* FlowGraph::find_node_by_match_source(const std::string& match_source) const {
    for (const auto& binding : def_.bindings) {
        if (contains(binding.match_sources, match_source)) {
            return get_node(binding.node_id);
        }
    }
    return nullptr;
}

const FlowNode* FlowGraph::find_node_by_checkpoint(const std::string& checkpoint) const {
    for (const auto& binding : def_.bindings) {
        if (contains(binding.checkpoints, checkpoint)) {
            return get_node(binding.node_id);
        }
    }
    return nullptr;
}

bool FlowGraph::is_match_source_in_tree(const std::string& match_source) const {
    for (const auto& binding : def_.bindings) {
        if (contains(binding.match_sources, match_source)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> FlowGraph::valid_match_sources() const {
    std::vector<std::string> sources;
    for (const auto& binding : def_.bindings) {
        for (const auto& source : binding.match_sources) {
            if (!contains(sources, source)) sources.push_back(source);
        }
    }
    return sources;
}

std::vector<std::string> FlowGraph::find_unreachable_nodes() const {
    std::unordered_set<std::string> visited;
    std::deque<std::string> queue;
    queue.push_back(def_.entry_node_id);

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }
        for (const auto& edge : def_.edges) {
            if (edge.from == current && visited.count(edge.to) == 0) {
                queue.push_back(edge.to);
            }
        }
    }

    std::vector<std::string> unreachable;
    for (const auto& node : def_.nodes) {
        if (visited.count(node.id) == 0) unreachable.push_back(node.id);
    }
    return unreachable;
}

std::vector<FlowEdge> FlowGraph::find_invalid_edges() const {
    std::vector<FlowEdge> invalid;
    for (const auto& edge : def_.edges) {
        if (!get_node(edge.from) || !get_node(edge.to)) {
            invalid.push_back(edge);
        }
    }
    return invalid;
}

std::vector<MalformedPredicate> FlowGraph::find_malformed_predicates() const {
    std::vector<MalformedPredicate> malformed;
    for (const auto& edge : def_.edges) {
        if (!edge.predicate) {
            malformed.push_back(MalformedPredicate{edge.id, edge.when, edge.predicate_error});
        }
    }
    return malformed;
}

std::vector<std::string> FlowGraph::find_unbound_nodes() const {
    std::unordered_set<std::string> bound;
    for (const auto& binding : def_.bindings) {
        bound.insert(binding.node_id);
    }
    std::vector<std::string> unbound;
    for (const auto& node : def_.nodes) {
        if (bound.count(node.id) == 0) unbound.push_back(node.id);
    }
    return unbound;
}

std::vector<std::string> FlowGraph::nodes_without_incoming() const {
    std::unordered_set<std::string> targets;
    for (const auto& edge : def_.edges) {
        targets.insert(edge.to);
    }
    std::vector<std::string> roots;
    for (const auto& node : def_.nodes) {
        if (targets.count(node.id) == 0) roots.push_back(node.id);
    }
    return roots;
}

std::vector<std::string> FlowGraph::terminal_nodes() const {
    std::unordered_set<std::string> sources;
    for (const auto& edge : def_.edges) {
        sources.insert(edge.from);
    }
    std::vector<std::string> terminals;
    for (const auto& node : def_.nodes) {
        if (sources.count(node.id) == 0) terminals.push_back(node.id);
    }
    return terminals;
}

json FlowGraph::export_flow_tree(const std::string& generated_at) const {
    json nodes = json::array();
    for (const auto& node : def_.nodes) {
        nodes.push_back(node.to_json());
    }
    json edges = json::array();
    for (const auto& edge : def_.edges) {
        edges.push_back(edge.to_json());
    }
    return json{
        {"version", def_.version},
        {"generatedAt", generated_at},
        {"nodes", nodes},
        {"edges", edges},
        {"entryNodeId", def_.entry_node_id},
        {"exitNodeId", def_.exit_node_id},
        {"nodeCount", def_.nodes.size()},
        {"edgeCount", def_.edges.size()}
    };
}

json FlowGraph::export_runtime_bindings() const {
    json out = json::array();
    for (const auto& binding : def_.bindings) {
        out.push_back(binding.to_json());
    }
    return out;
}

} // namespace flow
} // namespace callroute
