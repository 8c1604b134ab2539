#pragma once

/// @file apply.hpp
/// @brief Validated application of one operation to a graph
///
/// The compiler runs this against its virtual graph and the executor
/// against its working copy, so both stages enforce the same rules.

#include "operation.hpp"
#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/graph/graph.hpp>

#include <map>
#include <string>

namespace bridge_ops {

/// Validate `op` against the current state of `graph` and apply it.
/// On failure the graph is left as it was before the call.
///
/// AddNode fills unset widgets from their declared defaults and fails
/// with MissingWidget when a required widget has neither a value nor a
/// default. Optional widgets without a default stay unset.
[[nodiscard]] bridge_graph::GraphResult<void> apply_operation(
    bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    const Operation& op);

/// Widget map an AddNode of `def` would commit: explicit values checked
/// and normalized, then defaults for the rest
[[nodiscard]] bridge_graph::GraphResult<std::map<std::string, bridge_catalog::Value>> complete_widgets(
    const bridge_catalog::NodeDefinition& def,
    const std::map<std::string, bridge_catalog::Value>& explicit_values);

} // namespace bridge_ops
