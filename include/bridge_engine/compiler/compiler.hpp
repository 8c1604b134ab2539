#pragma once

/// @file compiler.hpp
/// @brief Change brief to validated operation list
///
/// Brief keys:
///   plan_summary      free text, copied into the summary
///   nodes_to_delete   node references
///   nodes_to_add      {placeholder_id | id, type, widgets, title, inputs, outputs}
///   nodes_to_update   {target, widgets}
///   connect           [{from: {node, slot | output_name}, to: {node, slot | input_name}}]
///   disconnect        same shape as connect
///
/// Node references are NODE_<k> placeholders, EXISTING_<id>, integers,
/// numeric strings, "title:<text>" or {"title": "<text>"}.
///
/// Operations are emitted as removals, disconnects, additions, widget
/// updates, then connects, and each one is validated against a
/// VirtualGraph before it is accepted. Compilation is pure: the caller's
/// graph is never modified.

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/core/error.hpp>
#include <bridge_engine/graph/graph.hpp>
#include <bridge_engine/ops/operation.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace bridge_compiler {

/// Successful compilation
struct CompileOutput {
    bridge_ops::OperationList operations;
    std::string summary;  // Human readable, not authoritative
};

/// Compile brief text (the JSON object is extracted first)
[[nodiscard]] bridge_core::Result<CompileOutput> compile(
    std::string_view brief,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog);

/// Compile an already extracted brief object
[[nodiscard]] bridge_core::Result<CompileOutput> compile_brief(
    const nlohmann::json& brief,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog);

} // namespace bridge_compiler
