#pragma once

/// @file graph.hpp
/// @brief Workflow graph: nodes, links and workflow metadata

#include "fwd.hpp"
#include <bridge_engine/catalog/value.hpp>
#include <bridge_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bridge_graph {

// =============================================================================
// Graph Errors
// =============================================================================

/// Structural rule violated by a graph mutation or check
struct GraphViolation {
    bridge_core::Rule rule = bridge_core::Rule::Malformed;
    std::string message;
    std::string field;
};

template<typename T>
using GraphResult = bridge_core::Result<T, GraphViolation>;

/// Helper for creating a failed GraphResult
template<typename T = void>
GraphResult<T> violation(bridge_core::Rule rule, std::string message, std::string field = {}) {
    return GraphResult<T>(GraphViolation{rule, std::move(message), std::move(field)});
}

// =============================================================================
// Nodes
// =============================================================================

/// Presentation fields carried only by the native workflow form
struct NodeLayout {
    std::array<double, 2> pos{0.0, 0.0};
    std::array<double, 2> size{0.0, 0.0};
    nlohmann::json extra = nlohmann::json::object();  // color, bgcolor, flags, order, mode

    bool operator==(const NodeLayout& other) const = default;
};

/// Node instance in a workflow graph
struct GraphNode {
    NodeId id = 0;
    std::string class_name;
    std::map<std::string, bridge_catalog::Value> widgets;
    nlohmann::json metadata = nlohmann::json::object();  // title, notes, properties; never interpreted
    std::optional<NodeLayout> layout;

    /// Title from metadata (empty if none)
    [[nodiscard]] std::string title() const;

    /// Same id, class, widgets and metadata (layout ignored)
    [[nodiscard]] bool logically_equal(const GraphNode& other) const;

    bool operator==(const GraphNode& other) const = default;
};

// =============================================================================
// Links
// =============================================================================

/// Link between an output slot and an input slot, identified by its 4-tuple
struct Link {
    NodeId source = 0;
    std::size_t source_slot = 0;
    NodeId target = 0;
    std::size_t target_slot = 0;

    auto operator<=>(const Link& other) const = default;
};

/// Render as "src.slot->dst.slot"
[[nodiscard]] std::string to_string(const Link& link);

// =============================================================================
// WorkflowGraph
// =============================================================================

/// Container of nodes and links.
///
/// Enforces the structural invariants on its own: unique positive node ids,
/// unique links, both endpoints present, one link per input slot, and
/// cascading link removal with a node. Catalog-dependent checks (class,
/// slot range, type compatibility, widgets) live in validation.hpp.
class WorkflowGraph {
public:
    WorkflowGraph() = default;

    // -------------------------------------------------------------------------
    // Nodes
    // -------------------------------------------------------------------------

    /// Add a node (DuplicateNode if the id is taken)
    GraphResult<void> add_node(GraphNode node);

    /// Remove a node and every link touching it; returns the removed links
    GraphResult<std::vector<Link>> remove_node(NodeId id);

    [[nodiscard]] GraphNode* find_node(NodeId id);
    [[nodiscard]] const GraphNode* find_node(NodeId id) const;

    [[nodiscard]] bool has_node(NodeId id) const {
        return m_nodes.find(id) != m_nodes.end();
    }

    /// Nodes ordered by id
    [[nodiscard]] const std::map<NodeId, GraphNode>& nodes() const noexcept { return m_nodes; }

    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }

    /// Highest node id (0 when empty)
    [[nodiscard]] NodeId max_node_id() const noexcept;

    // -------------------------------------------------------------------------
    // Links
    // -------------------------------------------------------------------------

    /// Add a link (UnknownNode, DuplicateLink or InputOccupied)
    GraphResult<void> add_link(const Link& link);

    /// Remove a link (LinkNotFound)
    GraphResult<void> remove_link(const Link& link);

    [[nodiscard]] bool has_link(const Link& link) const {
        return m_links.find(link) != m_links.end();
    }

    /// Links ordered by 4-tuple
    [[nodiscard]] const std::set<Link>& links() const noexcept { return m_links; }

    [[nodiscard]] std::size_t link_count() const noexcept { return m_links.size(); }

    /// Link feeding an input slot, if any
    [[nodiscard]] std::optional<Link> incoming_link(NodeId target, std::size_t target_slot) const;

    /// Links touching a node, in canonical order
    [[nodiscard]] std::vector<Link> links_of(NodeId id) const;

    // -------------------------------------------------------------------------
    // Metadata
    // -------------------------------------------------------------------------

    [[nodiscard]] nlohmann::json& metadata() noexcept { return m_metadata; }
    [[nodiscard]] const nlohmann::json& metadata() const noexcept { return m_metadata; }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    /// Same nodes (ignoring layout), links and metadata
    [[nodiscard]] bool logically_equal(const WorkflowGraph& other) const;

    /// Full structural comparison, layout included
    bool operator==(const WorkflowGraph& other) const = default;

private:
    std::map<NodeId, GraphNode> m_nodes;
    std::set<Link> m_links;
    nlohmann::json m_metadata = nlohmann::json::object();
};

} // namespace bridge_graph
