/**
 * Flow graph tests.
 * Asserts:
 * - The shipped declaration is well-formed: no unreachable nodes, no invalid edges,
 *   one root (the entry), at least one terminal, every node bound.
 * - An edge to a nonexistent node is reported as invalid.
 * - Binding lookups resolve match sources and checkpoints to nodes.
 *
 * Run from build dir: ./test_flow_graph
 */

#include "flow/flow_graph.h"
#include "flow/flow_tree_definition.h"
#include "logger.h"
#include <algorithm>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using namespace callroute;
using namespace callroute::flow;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    const FlowGraph& graph = default_flow_graph();

    // --- Declaration ---
    ASSERT(graph.version() == "1.0.1");
    ASSERT(graph.entry_node_id() == "node.callStart");
    ASSERT(graph.exit_node_id() == "node.turnEnd");
    ASSERT(graph.nodes().size() == 18);
    ASSERT(graph.edges().size() == 28);
    ASSERT(graph.bindings().size() == 18);

    // --- Well-formedness ---
    ASSERT(graph.find_unreachable_nodes().empty());
    ASSERT(graph.find_invalid_edges().empty());
    ASSERT(graph.find_malformed_predicates().empty());
    ASSERT(graph.find_unbound_nodes().empty());

    std::vector<std::string> roots = graph.nodes_without_incoming();
    ASSERT(roots.size() == 1 && roots[0] == "node.callStart");
    std::vector<std::string> terminals = graph.terminal_nodes();
    ASSERT(!terminals.empty());
    ASSERT(contains(terminals, "node.turnEnd"));

    // --- Queries ---
    const FlowNode* runner = graph.get_node("node.bookingRunner");
    ASSERT(runner != nullptr);
    ASSERT(runner->type == NodeType::Router);
    ASSERT(runner->match_source && *runner->match_source == "BOOKING_SNAP");
    ASSERT(graph.get_node("node.nope") == nullptr);

    auto from_guard = graph.get_edges_from("node.emptyUtteranceGuard");
    ASSERT(from_guard.size() == 2);
    ASSERT(from_guard[0]->id == "edge.2a");
    ASSERT(from_guard[1]->to == "node.slotExtraction");

    auto into_turn_end = graph.get_edges_to("node.turnEnd");
    ASSERT(into_turn_end.size() == 8);

    const FlowNode* by_source = graph.find_node_by_match_source("BOOKING_FLOW_RUNNER");
    ASSERT(by_source && by_source->id == "node.bookingRunner");
    ASSERT(graph.find_node_by_match_source("STATE_MACHINE")->id == "node.scenarioResponse");
    ASSERT(graph.find_node_by_match_source("TIER3_FALLBACK")->id == "node.llmFallback");
    ASSERT(graph.find_node_by_match_source("MYSTERY") == nullptr);

    ASSERT(graph.find_node_by_checkpoint("CHECKPOINT_9e")->id == "node.llmFallback");
    ASSERT(graph.find_node_by_checkpoint("TWIML_SENT")->id == "node.turnEnd");
    ASSERT(graph.find_node_by_checkpoint("CHECKPOINT_V92_CLARIFY")->id == "node.discoveryClarification");
    ASSERT(graph.find_node_by_checkpoint("CHECKPOINT_404") == nullptr);

    ASSERT(graph.is_match_source_in_tree("SCENARIO_MATCHED"));
    ASSERT(!graph.is_match_source_in_tree("LEGACY_KEYWORD"));

    std::vector<std::string> sources = graph.valid_match_sources();
    ASSERT(contains(sources, "SILENCE_HANDLER"));
    ASSERT(contains(sources, "RULE_BASED"));
    ASSERT(contains(sources, "META_INTENT_TIER1"));
    // BOOKING_COMPLETE is listed once
    ASSERT(std::count(sources.begin(), sources.end(), "BOOKING_COMPLETE") == 1);

    // --- Invalid edge ---
    FlowDefinition broken = default_flow_definition();
    FlowEdge dangling;
    dangling.id = "edge.99";
    dangling.from = "node.scenarioMatcher";
    dangling.to = "node.doesNotExist";
    broken.edges.push_back(dangling);
    FlowGraph broken_graph(broken);
    auto invalid = broken_graph.find_invalid_edges();
    ASSERT(invalid.size() == 1);
    ASSERT(invalid[0].id == "edge.99");
    // The unknown target is visited by the traversal but is not a declared node
    ASSERT(broken_graph.find_unreachable_nodes().empty());

    // --- Unreachable node ---
    FlowDefinition island = default_flow_definition();
    FlowNode orphan;
    orphan.id = "node.orphan";
    orphan.label = "Orphan";
    island.nodes.push_back(orphan);
    FlowGraph island_graph(island);
    auto unreachable = island_graph.find_unreachable_nodes();
    ASSERT(unreachable.size() == 1 && unreachable[0] == "node.orphan");
    ASSERT(contains(island_graph.find_unbound_nodes(), "node.orphan"));
    ASSERT(island_graph.nodes_without_incoming().size() == 2);

    // --- Malformed predicate ---
    FlowDefinition sloppy = default_flow_definition();
    sloppy.edges[0].when = "isEmpty ||";
    FlowGraph sloppy_graph(sloppy);
    auto malformed = sloppy_graph.find_malformed_predicates();
    ASSERT(malformed.size() == 1);
    ASSERT(malformed[0].edge_id == "edge.1");
    ASSERT(!malformed[0].error.empty());

    // --- Export ---
    json tree = graph.export_flow_tree("2026-01-01T00:00:00.000Z");
    ASSERT(tree["version"] == "1.0.1");
    ASSERT(tree["generatedAt"] == "2026-01-01T00:00:00.000Z");
    ASSERT(tree["nodeCount"] == 18);
    ASSERT(tree["edgeCount"] == 28);
    ASSERT(tree["entryNodeId"] == "node.callStart");
    ASSERT(tree["exitNodeId"] == "node.turnEnd");
    ASSERT(tree["nodes"][0]["type"] == "entry");
    ASSERT(tree["edges"][0]["whenAst"]["kind"] == "always");
    ASSERT(tree["edges"][4]["when"] == "bookingModeLocked === true");
    ASSERT(tree["edges"][4]["whenAst"]["op"] == "===");

    json bindings = graph.export_runtime_bindings();
    ASSERT(bindings.is_array() && bindings.size() == 18);
    ASSERT(bindings[0]["nodeId"] == "node.callStart");
    ASSERT(bindings[1].contains("note"));

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All flow graph tests passed.\n";
    return 0;
}
