/// @file virtual_graph.cpp
/// @brief VirtualGraph implementation

#include <bridge_engine/compiler/virtual_graph.hpp>
#include <bridge_engine/ops/apply.hpp>

namespace bridge_compiler {

VirtualGraph::VirtualGraph(const bridge_graph::WorkflowGraph& base, const bridge_catalog::Catalog& catalog)
    : m_graph(base)
    , m_catalog(catalog)
    , m_next_id(base.max_node_id() + 1) {}

bridge_graph::GraphResult<void> VirtualGraph::apply(const bridge_ops::Operation& op) {
    return bridge_ops::apply_operation(m_graph, m_catalog, op);
}

bridge_graph::NodeId VirtualGraph::allocate_id() {
    while (m_reserved.count(m_next_id) != 0 || m_graph.has_node(m_next_id)) {
        ++m_next_id;
    }
    m_reserved.insert(m_next_id);
    return m_next_id++;
}

std::string VirtualGraph::effective_title(const bridge_graph::GraphNode& node) const {
    auto title = node.title();
    if (!title.empty()) {
        return title;
    }
    if (const auto* def = m_catalog.find(node.class_name); def && !def->display_name().empty()) {
        return def->display_name();
    }
    return node.class_name;
}

std::vector<bridge_graph::NodeId> VirtualGraph::find_by_title(std::string_view title) const {
    std::vector<bridge_graph::NodeId> matches;
    for (const auto& [id, node] : m_graph.nodes()) {
        if (effective_title(node) == title) {
            matches.push_back(id);
        }
    }
    return matches;
}

} // namespace bridge_compiler
