#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bridge_graph module

#include <cstdint>

namespace bridge_graph {

using NodeId = std::int64_t;

struct NodeLayout;
struct GraphNode;
struct Link;
struct GraphViolation;
class WorkflowGraph;

} // namespace bridge_graph
