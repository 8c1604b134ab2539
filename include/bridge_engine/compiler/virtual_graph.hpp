#pragma once

/// @file virtual_graph.hpp
/// @brief Private working snapshot used while compiling a brief

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/graph/graph.hpp>
#include <bridge_engine/ops/operation.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace bridge_compiler {

/// Copy of the caller's graph that accepted operations are applied to.
/// Discarded after compilation; the caller's graph is never touched.
class VirtualGraph {
public:
    VirtualGraph(const bridge_graph::WorkflowGraph& base, const bridge_catalog::Catalog& catalog);

    /// Validate and apply one operation against the current state
    [[nodiscard]] bridge_graph::GraphResult<void> apply(const bridge_ops::Operation& op);

    [[nodiscard]] const bridge_graph::WorkflowGraph& state() const noexcept { return m_graph; }

    // -------------------------------------------------------------------------
    // Id allocation
    // -------------------------------------------------------------------------

    /// Keep an explicitly requested id out of allocation
    void reserve_id(bridge_graph::NodeId id) { m_reserved.insert(id); }

    [[nodiscard]] bool is_reserved(bridge_graph::NodeId id) const {
        return m_reserved.count(id) != 0;
    }

    /// Next id above the base graph's highest id that is not reserved
    [[nodiscard]] bridge_graph::NodeId allocate_id();

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    /// Title a reference can match: metadata title, else display name, else class
    [[nodiscard]] std::string effective_title(const bridge_graph::GraphNode& node) const;

    /// Current node ids whose effective title equals `title`
    [[nodiscard]] std::vector<bridge_graph::NodeId> find_by_title(std::string_view title) const;

private:
    bridge_graph::WorkflowGraph m_graph;
    const bridge_catalog::Catalog& m_catalog;
    bridge_graph::NodeId m_next_id;
    std::set<bridge_graph::NodeId> m_reserved;
};

} // namespace bridge_compiler
