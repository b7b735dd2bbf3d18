#pragma once

#include "flow/flow_graph.h"

namespace callroute {
namespace flow {

constexpr const char* kFlowTreeVersion = "1.0.1";
constexpr const char* kEntryNodeId = "node.callStart";
constexpr const char* kExitNodeId = "node.turnEnd";

/// The shipped turn-routing declaration
FlowDefinition default_flow_definition();

/// Graph over default_flow_definition(); built once, shared read-only
const FlowGraph& default_flow_graph();

} // namespace flow
} // namespace callroute
