#pragma once

/// @file validation.hpp
/// @brief Catalog-aware checks over nodes, links and whole graphs

#include "fwd.hpp"
#include "graph.hpp"
#include <bridge_engine/catalog/catalog.hpp>

namespace bridge_graph {

/// Class resolves, every widget is declared and has the shape of its kind.
/// Range and choice constraints are not checked here.
[[nodiscard]] GraphResult<void> check_node(const GraphNode& node, const bridge_catalog::Catalog& catalog);

/// Endpoints exist, slots in range, output type assignable to input type
[[nodiscard]] GraphResult<void> check_link(
    const WorkflowGraph& graph,
    const Link& link,
    const bridge_catalog::Catalog& catalog);

/// Slot indices in range for the given classes, and type compatibility
[[nodiscard]] GraphResult<void> check_link_slots(
    const bridge_catalog::NodeDefinition& source_def,
    std::size_t source_slot,
    const bridge_catalog::NodeDefinition& target_def,
    std::size_t target_slot);

/// Every node and every link of the graph
[[nodiscard]] GraphResult<void> validate_graph(const WorkflowGraph& graph, const bridge_catalog::Catalog& catalog);

} // namespace bridge_graph
