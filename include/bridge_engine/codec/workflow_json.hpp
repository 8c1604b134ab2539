#pragma once

/// @file workflow_json.hpp
/// @brief Native workflow document (nodes / links / widgets_values) import and export

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/core/error.hpp>
#include <bridge_engine/graph/graph.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace bridge_codec {

/// Version written to exported documents
inline constexpr double k_native_version = 0.4;

/// Import a native workflow document. Applies the same checks as decode();
/// positions, sizes and colors are kept as NodeLayout.
[[nodiscard]] bridge_core::Result<bridge_graph::WorkflowGraph> import_workflow(
    const nlohmann::json& doc,
    const bridge_catalog::Catalog& catalog);

/// Parse and import native workflow text
[[nodiscard]] bridge_core::Result<bridge_graph::WorkflowGraph> parse_workflow(
    std::string_view text,
    const bridge_catalog::Catalog& catalog);

/// Export to a native workflow document. Link ids are assigned 1..n in
/// canonical link order; nodes without layout are placed on a grid.
[[nodiscard]] bridge_core::Result<nlohmann::json> export_workflow(
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog);

} // namespace bridge_codec
