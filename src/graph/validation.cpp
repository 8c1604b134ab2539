/// @file validation.cpp
/// @brief Catalog-aware graph checks

#include <bridge_engine/graph/validation.hpp>

#include <fmt/format.h>

namespace bridge_graph {

using bridge_core::Rule;

GraphResult<void> check_node(const GraphNode& node, const bridge_catalog::Catalog& catalog) {
    const auto* def = catalog.find(node.class_name);
    if (!def) {
        return violation(Rule::UnknownClass,
            fmt::format("Node {} has unknown class '{}'", node.id, node.class_name), "class");
    }

    for (const auto& [name, value] : node.widgets) {
        const auto* widget = def->find_widget(name);
        if (!widget) {
            return violation(Rule::UnknownWidget,
                fmt::format("Node {} ({}) has undeclared widget '{}'", node.id, node.class_name, name), name);
        }
        if (!bridge_catalog::value_matches_widget_kind(value, widget->kind)) {
            return violation(Rule::WidgetType,
                fmt::format("Node {} widget '{}' expects {}, got {}", node.id, name,
                    bridge_catalog::widget_kind_name(widget->kind), value.type_name()), name);
        }
        // Float widgets hold Float values
        if (widget->kind == bridge_catalog::WidgetKind::Float && value.is_int()) {
            return violation(Rule::WidgetType,
                fmt::format("Node {} widget '{}' holds int {}; FLOAT widgets store floats",
                    node.id, name, value.as_int()), name);
        }
    }

    return {};
}

GraphResult<void> check_link_slots(
    const bridge_catalog::NodeDefinition& source_def,
    std::size_t source_slot,
    const bridge_catalog::NodeDefinition& target_def,
    std::size_t target_slot)
{
    if (source_slot >= source_def.outputs().size()) {
        return violation(Rule::SlotOutOfRange,
            fmt::format("Output slot {} out of range for {} ({} outputs)",
                source_slot, source_def.class_name(), source_def.outputs().size()), "from");
    }
    if (target_slot >= target_def.inputs().size()) {
        return violation(Rule::SlotOutOfRange,
            fmt::format("Input slot {} out of range for {} ({} inputs)",
                target_slot, target_def.class_name(), target_def.inputs().size()), "to");
    }

    const auto& out = source_def.outputs()[source_slot];
    const auto& in = target_def.inputs()[target_slot];
    if (!bridge_catalog::types_compatible(out.type, in.type)) {
        return violation(Rule::TypeMismatch,
            fmt::format("{}.{} produces {} but {}.{} accepts {}",
                source_def.class_name(), out.name, out.type, target_def.class_name(), in.name, in.type));
    }

    return {};
}

GraphResult<void> check_link(
    const WorkflowGraph& graph,
    const Link& link,
    const bridge_catalog::Catalog& catalog)
{
    const auto* source = graph.find_node(link.source);
    const auto* target = graph.find_node(link.target);
    if (!source || !target) {
        return violation(Rule::DanglingLink,
            fmt::format("Link {} references a missing node", to_string(link)));
    }

    const auto* source_def = catalog.find(source->class_name);
    if (!source_def) {
        return violation(Rule::UnknownClass,
            fmt::format("Node {} has unknown class '{}'", source->id, source->class_name), "class");
    }
    const auto* target_def = catalog.find(target->class_name);
    if (!target_def) {
        return violation(Rule::UnknownClass,
            fmt::format("Node {} has unknown class '{}'", target->id, target->class_name), "class");
    }

    return check_link_slots(*source_def, link.source_slot, *target_def, link.target_slot);
}

GraphResult<void> validate_graph(const WorkflowGraph& graph, const bridge_catalog::Catalog& catalog) {
    for (const auto& [id, node] : graph.nodes()) {
        if (auto checked = check_node(node, catalog); !checked) {
            return checked;
        }
    }

    for (const auto& link : graph.links()) {
        if (auto checked = check_link(graph, link, catalog); !checked) {
            return checked;
        }
    }

    return {};
}

} // namespace bridge_graph
