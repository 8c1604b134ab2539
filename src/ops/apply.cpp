/// @file apply.cpp
/// @brief Validated application of one operation to a graph

#include <bridge_engine/ops/apply.hpp>
#include <bridge_engine/graph/validation.hpp>

#include <fmt/format.h>

namespace bridge_ops {

using bridge_core::Rule;
using bridge_graph::GraphResult;
using bridge_graph::violation;
using WidgetMap = std::map<std::string, bridge_catalog::Value>;

namespace {

GraphResult<bridge_catalog::Value> checked_value(
    const bridge_catalog::NodeDefinition& def,
    const std::string& widget,
    const bridge_catalog::Value& value)
{
    const auto* decl = def.find_widget(widget);
    if (!decl) {
        return violation<bridge_catalog::Value>(Rule::UnknownWidget,
            fmt::format("{} has no widget '{}'", def.class_name(), widget), widget);
    }
    if (auto problem = decl->check(value)) {
        return violation<bridge_catalog::Value>(problem->rule, problem->message, widget);
    }
    return decl->normalize(value);
}

const bridge_catalog::NodeDefinition* definition_of(
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    bridge_graph::NodeId id)
{
    const auto* node = graph.find_node(id);
    return node ? catalog.find(node->class_name) : nullptr;
}

GraphResult<void> apply_add(bridge_graph::WorkflowGraph& graph, const bridge_catalog::Catalog& catalog, const AddNode& op) {
    const auto* def = catalog.find(op.class_name);
    if (!def) {
        return violation(Rule::UnknownClass, fmt::format("Unknown node class '{}'", op.class_name), "class");
    }
    if (op.id <= 0) {
        return violation(Rule::Malformed, fmt::format("Node id must be positive, got {}", op.id), "id");
    }
    if (graph.has_node(op.id)) {
        return violation(Rule::DuplicateNode, fmt::format("Node id {} is already in use", op.id), "id");
    }

    auto widgets = complete_widgets(*def, op.widgets);
    if (!widgets) {
        return GraphResult<void>(widgets.error());
    }

    bridge_graph::GraphNode node;
    node.id = op.id;
    node.class_name = op.class_name;
    node.widgets = std::move(widgets).value();
    node.metadata = op.metadata.is_object() ? op.metadata : nlohmann::json::object();
    return graph.add_node(std::move(node));
}

GraphResult<void> apply_set_widget(bridge_graph::WorkflowGraph& graph, const bridge_catalog::Catalog& catalog, const SetWidget& op) {
    auto* node = graph.find_node(op.node);
    if (!node) {
        return violation(Rule::UnknownNode, fmt::format("Node {} does not exist", op.node), "node");
    }
    const auto* def = catalog.find(node->class_name);
    if (!def) {
        return violation(Rule::UnknownClass,
            fmt::format("Node {} has unknown class '{}'", op.node, node->class_name), "class");
    }

    auto value = checked_value(*def, op.widget, op.value);
    if (!value) {
        return GraphResult<void>(value.error());
    }
    node->widgets[op.widget] = std::move(value).value();
    return {};
}

/// Endpoint and slot checks shared by Connect and Disconnect
GraphResult<void> check_endpoints(
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    const bridge_graph::Link& link)
{
    if (!graph.has_node(link.source)) {
        return violation(Rule::UnknownNode, fmt::format("Source node {} does not exist", link.source), "from");
    }
    if (!graph.has_node(link.target)) {
        return violation(Rule::UnknownNode, fmt::format("Target node {} does not exist", link.target), "to");
    }

    const auto* source_def = definition_of(graph, catalog, link.source);
    const auto* target_def = definition_of(graph, catalog, link.target);
    if (!source_def || !target_def) {
        return violation(Rule::UnknownClass,
            fmt::format("Link {} touches a node of unknown class", bridge_graph::to_string(link)), "class");
    }
    return bridge_graph::check_link_slots(*source_def, link.source_slot, *target_def, link.target_slot);
}

GraphResult<void> apply_connect(bridge_graph::WorkflowGraph& graph, const bridge_catalog::Catalog& catalog, const Connect& op) {
    if (auto checked = check_endpoints(graph, catalog, op.link); !checked) {
        return checked;
    }
    return graph.add_link(op.link);
}

GraphResult<void> apply_disconnect(bridge_graph::WorkflowGraph& graph, const bridge_catalog::Catalog& catalog, const Disconnect& op) {
    if (graph.has_link(op.link)) {
        return graph.remove_link(op.link);
    }
    if (auto checked = check_endpoints(graph, catalog, op.link); !checked) {
        return checked;
    }
    return graph.remove_link(op.link);
}

} // anonymous namespace

GraphResult<WidgetMap> complete_widgets(const bridge_catalog::NodeDefinition& def, const WidgetMap& explicit_values) {
    WidgetMap out;

    for (const auto& [name, value] : explicit_values) {
        auto checked = checked_value(def, name, value);
        if (!checked) {
            return GraphResult<WidgetMap>(checked.error());
        }
        out.emplace(name, std::move(checked).value());
    }

    for (const auto& decl : def.widgets()) {
        if (out.count(decl.name) != 0) {
            continue;
        }
        if (decl.default_value) {
            out.emplace(decl.name, decl.normalize(*decl.default_value));
        } else if (!decl.optional) {
            return violation<WidgetMap>(Rule::MissingWidget,
                fmt::format("{} widget '{}' has no value and no default", def.class_name(), decl.name), decl.name);
        }
    }

    return out;
}

GraphResult<void> apply_operation(
    bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    const Operation& op)
{
    return op.visit(overloaded{
        [&](const AddNode& add) { return apply_add(graph, catalog, add); },
        [&](const RemoveNode& remove) -> GraphResult<void> {
            auto removed = graph.remove_node(remove.id);
            if (!removed) {
                return GraphResult<void>(removed.error());
            }
            return {};
        },
        [&](const Connect& connect) { return apply_connect(graph, catalog, connect); },
        [&](const Disconnect& disconnect) { return apply_disconnect(graph, catalog, disconnect); },
        [&](const SetWidget& set) { return apply_set_widget(graph, catalog, set); },
    });
}

} // namespace bridge_ops
