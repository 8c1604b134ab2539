/// @file graph.cpp
/// @brief WorkflowGraph implementation

#include <bridge_engine/graph/graph.hpp>

#include <fmt/format.h>

namespace bridge_graph {

using bridge_core::Rule;

// =============================================================================
// GraphNode
// =============================================================================

std::string GraphNode::title() const {
    if (metadata.is_object()) {
        auto it = metadata.find("title");
        if (it != metadata.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

bool GraphNode::logically_equal(const GraphNode& other) const {
    return id == other.id &&
           class_name == other.class_name &&
           widgets == other.widgets &&
           metadata == other.metadata;
}

std::string to_string(const Link& link) {
    return fmt::format("{}.{}->{}.{}", link.source, link.source_slot, link.target, link.target_slot);
}

// =============================================================================
// WorkflowGraph - Nodes
// =============================================================================

GraphResult<void> WorkflowGraph::add_node(GraphNode node) {
    if (node.id <= 0) {
        return violation(Rule::Malformed, fmt::format("Node id {} is not positive", node.id), "id");
    }
    if (has_node(node.id)) {
        return violation(Rule::DuplicateNode, fmt::format("Node id {} already exists", node.id), "id");
    }

    NodeId id = node.id;
    m_nodes.emplace(id, std::move(node));
    return {};
}

GraphResult<std::vector<Link>> WorkflowGraph::remove_node(NodeId id) {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return violation<std::vector<Link>>(Rule::UnknownNode, fmt::format("Node {} does not exist", id), "id");
    }

    // Remove all connections
    std::vector<Link> removed = links_of(id);
    for (const auto& link : removed) {
        m_links.erase(link);
    }

    m_nodes.erase(it);
    return removed;
}

GraphNode* WorkflowGraph::find_node(NodeId id) {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? &it->second : nullptr;
}

const GraphNode* WorkflowGraph::find_node(NodeId id) const {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? &it->second : nullptr;
}

NodeId WorkflowGraph::max_node_id() const noexcept {
    return m_nodes.empty() ? 0 : m_nodes.rbegin()->first;
}

// =============================================================================
// WorkflowGraph - Links
// =============================================================================

GraphResult<void> WorkflowGraph::add_link(const Link& link) {
    if (!has_node(link.source)) {
        return violation(Rule::UnknownNode, fmt::format("Source node {} does not exist", link.source), "from");
    }
    if (!has_node(link.target)) {
        return violation(Rule::UnknownNode, fmt::format("Target node {} does not exist", link.target), "to");
    }
    if (has_link(link)) {
        return violation(Rule::DuplicateLink, fmt::format("Link {} already exists", to_string(link)));
    }
    if (auto existing = incoming_link(link.target, link.target_slot)) {
        return violation(Rule::InputOccupied,
            fmt::format("Input {}.{} is already fed by {}", link.target, link.target_slot, to_string(*existing)),
            "to");
    }

    m_links.insert(link);
    return {};
}

GraphResult<void> WorkflowGraph::remove_link(const Link& link) {
    if (m_links.erase(link) == 0) {
        return violation(Rule::LinkNotFound, fmt::format("Link {} does not exist", to_string(link)));
    }
    return {};
}

std::optional<Link> WorkflowGraph::incoming_link(NodeId target, std::size_t target_slot) const {
    for (const auto& link : m_links) {
        if (link.target == target && link.target_slot == target_slot) {
            return link;
        }
    }
    return std::nullopt;
}

std::vector<Link> WorkflowGraph::links_of(NodeId id) const {
    std::vector<Link> result;
    for (const auto& link : m_links) {
        if (link.source == id || link.target == id) {
            result.push_back(link);
        }
    }
    return result;
}

// =============================================================================
// WorkflowGraph - Comparison
// =============================================================================

bool WorkflowGraph::logically_equal(const WorkflowGraph& other) const {
    if (m_nodes.size() != other.m_nodes.size() || m_links != other.m_links || m_metadata != other.m_metadata) {
        return false;
    }

    auto a = m_nodes.begin();
    auto b = other.m_nodes.begin();
    for (; a != m_nodes.end(); ++a, ++b) {
        if (!a->second.logically_equal(b->second)) {
            return false;
        }
    }
    return true;
}

} // namespace bridge_graph
