/// @file workflow_json.cpp
/// @brief Native workflow document import and export

#include <bridge_engine/codec/workflow_json.hpp>
#include <bridge_engine/core/log.hpp>
#include <bridge_engine/graph/validation.hpp>

#include <fmt/format.h>

#include <array>
#include <map>
#include <optional>

namespace bridge_codec {

using bridge_core::FormatError;
using bridge_core::Rule;
using bridge_graph::GraphNode;
using bridge_graph::Link;
using bridge_graph::NodeId;
using bridge_graph::WorkflowGraph;

namespace {

/// Node keys that carry structure or layout rather than metadata
constexpr std::array<std::string_view, 13> k_structural_keys = {
    "id", "type", "pos", "size", "flags", "order", "mode",
    "inputs", "outputs", "widgets_values", "color", "bgcolor", "shape",
};

/// Node keys kept in NodeLayout::extra
constexpr std::array<std::string_view, 6> k_layout_extra_keys = {
    "flags", "order", "mode", "color", "bgcolor", "shape",
};

/// Document keys rebuilt on export
constexpr std::array<std::string_view, 5> k_document_keys = {
    "nodes", "links", "last_node_id", "last_link_id", "version",
};

template<std::size_t N>
bool is_one_of(const std::string& key, const std::array<std::string_view, N>& keys) {
    for (auto k : keys) {
        if (k == key) return true;
    }
    return false;
}

bridge_core::Error malformed(const std::string& what, std::string field = {}) {
    return FormatError::violation(Rule::Malformed, "Malformed workflow: " + what, std::move(field));
}

std::array<double, 2> read_pair(const nlohmann::json& j) {
    std::array<double, 2> out{0.0, 0.0};
    if (j.is_array() && j.size() >= 2 && j[0].is_number() && j[1].is_number()) {
        out = {j[0].get<double>(), j[1].get<double>()};
    } else if (j.is_object()) {
        // Older documents store size as {"0": w, "1": h}
        if (j.contains("0") && j["0"].is_number()) out[0] = j["0"].get<double>();
        if (j.contains("1") && j["1"].is_number()) out[1] = j["1"].get<double>();
    }
    return out;
}

bridge_core::Result<GraphNode> import_node(const nlohmann::json& j, const bridge_catalog::Catalog& catalog) {
    if (!j.is_object()) {
        return bridge_core::Err<GraphNode>(malformed("node is not an object"));
    }
    if (!j.contains("id") || !j["id"].is_number_integer()) {
        return bridge_core::Err<GraphNode>(malformed("node without integer id", "id"));
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return bridge_core::Err<GraphNode>(malformed("node without type", "type"));
    }

    GraphNode node;
    node.id = j["id"].get<NodeId>();
    node.class_name = j["type"].get<std::string>();

    const auto* def = catalog.find(node.class_name);
    if (!def) {
        return bridge_core::Err<GraphNode>(FormatError::violation(Rule::UnknownClass,
            fmt::format("Node {} has unknown class '{}'", node.id, node.class_name), "type"));
    }

    // Widgets: positional array in declaration order, or an object keyed by name
    if (j.contains("widgets_values")) {
        const auto& values = j["widgets_values"];
        auto assign = [&](const bridge_catalog::WidgetDecl& decl, const nlohmann::json& raw) -> bridge_core::Result<void> {
            if (raw.is_null()) {
                return bridge_core::Ok();
            }
            auto value = bridge_catalog::value_from_json(raw);
            if (!value || !bridge_catalog::value_matches_widget_kind(*value, decl.kind)) {
                return bridge_core::Err(FormatError::violation(Rule::WidgetType,
                    fmt::format("Node {} widget '{}' expects {}, got {}", node.id, decl.name,
                        bridge_catalog::widget_kind_name(decl.kind), raw.dump()), decl.name));
            }
            node.widgets.emplace(decl.name, decl.normalize(std::move(value).value()));
            return bridge_core::Ok();
        };

        if (values.is_array()) {
            if (values.size() > def->widgets().size()) {
                return bridge_core::Err<GraphNode>(FormatError::violation(Rule::Malformed,
                    fmt::format("{} declares {} widgets, node {} has {}",
                        def->class_name(), def->widgets().size(), node.id, values.size()), "widgets_values"));
            }
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (auto assigned = assign(def->widgets()[i], values[i]); !assigned) {
                    return bridge_core::Err<GraphNode>(assigned.error());
                }
            }
        } else if (values.is_object()) {
            for (auto it = values.begin(); it != values.end(); ++it) {
                const auto* decl = def->find_widget(it.key());
                if (!decl) {
                    return bridge_core::Err<GraphNode>(FormatError::violation(Rule::UnknownWidget,
                        fmt::format("{} has no widget '{}'", def->class_name(), it.key()), it.key()));
                }
                if (auto assigned = assign(*decl, it.value()); !assigned) {
                    return bridge_core::Err<GraphNode>(assigned.error());
                }
            }
        } else if (!values.is_null()) {
            return bridge_core::Err<GraphNode>(malformed("widgets_values is neither array nor object", "widgets_values"));
        }
    }

    // Layout
    bridge_graph::NodeLayout layout;
    if (j.contains("pos")) layout.pos = read_pair(j["pos"]);
    if (j.contains("size")) layout.size = read_pair(j["size"]);
    for (auto key : k_layout_extra_keys) {
        std::string k(key);
        if (j.contains(k)) layout.extra[k] = j[k];
    }
    node.layout = std::move(layout);

    // Everything else is opaque metadata (title, properties, notes, ...)
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_one_of(it.key(), k_structural_keys)) {
            node.metadata[it.key()] = it.value();
        }
    }

    return node;
}

/// Map a native slot index to a catalog slot index through the slot name
template<typename Slots>
std::optional<std::size_t> resolve_slot(
    const nlohmann::json& node_json,
    const char* key,
    std::size_t native_index,
    const Slots& declared)
{
    if (node_json.contains(key) && node_json[key].is_array()) {
        const auto& slots = node_json[key];
        if (native_index < slots.size() && slots[native_index].contains("name") &&
            slots[native_index]["name"].is_string()) {
            auto name = slots[native_index]["name"].get<std::string>();
            for (std::size_t i = 0; i < declared.size(); ++i) {
                if (declared[i].name == name) return i;
            }
            return std::nullopt;
        }
    }
    return native_index;
}

struct NativeLink {
    NodeId source = 0;
    std::size_t source_slot = 0;
    NodeId target = 0;
    std::size_t target_slot = 0;
    std::string type;
};

bridge_core::Result<NativeLink> read_link(const nlohmann::json& j) {
    auto as_index = [](const nlohmann::json& v) -> std::optional<std::int64_t> {
        if (v.is_number_integer()) return v.get<std::int64_t>();
        return std::nullopt;
    };

    std::optional<std::int64_t> src, src_slot, dst, dst_slot;
    std::string type;

    if (j.is_array() && j.size() >= 5) {
        src = as_index(j[1]);
        src_slot = as_index(j[2]);
        dst = as_index(j[3]);
        dst_slot = as_index(j[4]);
        if (j.size() > 5 && j[5].is_string()) type = j[5].get<std::string>();
    } else if (j.is_object()) {
        if (j.contains("origin_id")) src = as_index(j["origin_id"]);
        if (j.contains("origin_slot")) src_slot = as_index(j["origin_slot"]);
        if (j.contains("target_id")) dst = as_index(j["target_id"]);
        if (j.contains("target_slot")) dst_slot = as_index(j["target_slot"]);
        if (j.contains("type") && j["type"].is_string()) type = j["type"].get<std::string>();
    }

    if (!src || !src_slot || !dst || !dst_slot || *src_slot < 0 || *dst_slot < 0) {
        return bridge_core::Err<NativeLink>(malformed("bad link " + j.dump(), "links"));
    }
    return NativeLink{*src, static_cast<std::size_t>(*src_slot), *dst, static_cast<std::size_t>(*dst_slot), type};
}

} // anonymous namespace

// =============================================================================
// Import
// =============================================================================

bridge_core::Result<WorkflowGraph> import_workflow(const nlohmann::json& doc, const bridge_catalog::Catalog& catalog) {
    if (!doc.is_object()) {
        return bridge_core::Err<WorkflowGraph>(malformed("document is not an object"));
    }
    if (!doc.contains("nodes") || !doc["nodes"].is_array()) {
        return bridge_core::Err<WorkflowGraph>(malformed("missing 'nodes' array", "nodes"));
    }

    WorkflowGraph graph;
    std::map<NodeId, const nlohmann::json*> raw_nodes;

    for (const auto& j : doc["nodes"]) {
        auto node = import_node(j, catalog);
        if (!node) {
            return bridge_core::Err<WorkflowGraph>(node.error());
        }
        NodeId id = node->id;
        if (auto added = graph.add_node(std::move(node).value()); !added) {
            return bridge_core::Err<WorkflowGraph>(
                FormatError::violation(added.error().rule, added.error().message, "nodes"));
        }
        raw_nodes[id] = &j;
    }

    if (doc.contains("links") && !doc["links"].is_null()) {
        if (!doc["links"].is_array()) {
            return bridge_core::Err<WorkflowGraph>(malformed("'links' is not an array", "links"));
        }

        for (const auto& j : doc["links"]) {
            auto native = read_link(j);
            if (!native) {
                return bridge_core::Err<WorkflowGraph>(native.error());
            }

            const auto* source = graph.find_node(native->source);
            const auto* target = graph.find_node(native->target);
            if (!source || !target) {
                return bridge_core::Err<WorkflowGraph>(FormatError::violation(Rule::DanglingLink,
                    fmt::format("Link {} -> {} references a missing node", native->source, native->target), "links"));
            }

            const auto* source_def = catalog.find(source->class_name);
            const auto* target_def = catalog.find(target->class_name);

            auto source_slot = resolve_slot(*raw_nodes[native->source], "outputs", native->source_slot, source_def->outputs());
            auto target_slot = resolve_slot(*raw_nodes[native->target], "inputs", native->target_slot, target_def->inputs());
            if (!source_slot || !target_slot) {
                return bridge_core::Err<WorkflowGraph>(FormatError::violation(Rule::SlotOutOfRange,
                    fmt::format("Link {}.{} -> {}.{} uses a slot the catalog does not declare as a link slot",
                        native->source, native->source_slot, native->target, native->target_slot), "links"));
            }

            Link link{native->source, *source_slot, native->target, *target_slot};
            if (auto checked = bridge_graph::check_link_slots(*source_def, link.source_slot, *target_def, link.target_slot);
                !checked) {
                return bridge_core::Err<WorkflowGraph>(
                    FormatError::violation(checked.error().rule, checked.error().message, "links"));
            }

            const auto& produced = source_def->outputs()[link.source_slot].type;
            if (!native->type.empty() && native->type != bridge_catalog::k_any_type && native->type != produced) {
                return bridge_core::Err<WorkflowGraph>(FormatError::violation(Rule::TypeMismatch,
                    fmt::format("Link {} typed '{}' but the output is '{}'",
                        bridge_graph::to_string(link), native->type, produced), "links"));
            }

            if (auto added = graph.add_link(link); !added) {
                return bridge_core::Err<WorkflowGraph>(
                    FormatError::violation(added.error().rule, added.error().message, "links"));
            }
        }
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!is_one_of(it.key(), k_document_keys)) {
            graph.metadata()[it.key()] = it.value();
        }
    }

    bridge_core::codec_logger()->debug("Imported workflow: {} nodes, {} links", graph.node_count(), graph.link_count());
    return graph;
}

bridge_core::Result<WorkflowGraph> parse_workflow(std::string_view text, const bridge_catalog::Catalog& catalog) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return bridge_core::Err<WorkflowGraph>(FormatError::malformed(e.what()));
    }
    return import_workflow(doc, catalog);
}

// =============================================================================
// Export
// =============================================================================

bridge_core::Result<nlohmann::json> export_workflow(const WorkflowGraph& graph, const bridge_catalog::Catalog& catalog) {
    if (auto valid = bridge_graph::validate_graph(graph, catalog); !valid) {
        return bridge_core::Err<nlohmann::json>(
            FormatError::violation(valid.error().rule, valid.error().message, valid.error().field));
    }

    // Link ids in canonical order
    std::map<Link, std::int64_t> link_ids;
    nlohmann::json links = nlohmann::json::array();
    std::int64_t next_link_id = 1;
    for (const auto& link : graph.links()) {
        const auto* source = graph.find_node(link.source);
        const auto& type = catalog.find(source->class_name)->outputs()[link.source_slot].type;
        link_ids[link] = next_link_id;
        links.push_back({next_link_id, link.source, link.source_slot, link.target, link.target_slot, type});
        ++next_link_id;
    }

    nlohmann::json nodes = nlohmann::json::array();
    std::size_t order = 0;
    for (const auto& [id, node] : graph.nodes()) {
        const auto* def = catalog.find(node.class_name);

        nlohmann::json j = nlohmann::json::object();
        for (auto it = node.metadata.begin(); it != node.metadata.end(); ++it) {
            if (!is_one_of(it.key(), k_structural_keys)) {
                j[it.key()] = it.value();
            }
        }

        j["id"] = id;
        j["type"] = node.class_name;

        if (node.layout) {
            j["pos"] = {node.layout->pos[0], node.layout->pos[1]};
            j["size"] = {node.layout->size[0], node.layout->size[1]};
        } else {
            j["pos"] = {50.0 + static_cast<double>(order % 4) * 350.0, 50.0 + static_cast<double>(order / 4) * 300.0};
            j["size"] = {300.0, 100.0};
        }
        j["flags"] = nlohmann::json::object();
        j["order"] = order;
        j["mode"] = 0;
        if (node.layout) {
            for (auto it = node.layout->extra.begin(); it != node.layout->extra.end(); ++it) {
                j[it.key()] = it.value();
            }
        }

        nlohmann::json inputs = nlohmann::json::array();
        for (std::size_t i = 0; i < def->inputs().size(); ++i) {
            const auto& slot = def->inputs()[i];
            nlohmann::json input = {{"name", slot.name}, {"type", slot.type}, {"link", nullptr}};
            if (auto incoming = graph.incoming_link(id, i)) {
                input["link"] = link_ids[*incoming];
            }
            inputs.push_back(std::move(input));
        }
        j["inputs"] = std::move(inputs);

        nlohmann::json outputs = nlohmann::json::array();
        for (std::size_t i = 0; i < def->outputs().size(); ++i) {
            const auto& slot = def->outputs()[i];
            nlohmann::json out_links = nlohmann::json::array();
            for (const auto& link : graph.links_of(id)) {
                if (link.source == id && link.source_slot == i) {
                    out_links.push_back(link_ids[link]);
                }
            }
            outputs.push_back({{"name", slot.name}, {"type", slot.type}, {"links", std::move(out_links)}, {"slot_index", i}});
        }
        j["outputs"] = std::move(outputs);

        nlohmann::json widgets = nlohmann::json::array();
        for (const auto& decl : def->widgets()) {
            auto it = node.widgets.find(decl.name);
            widgets.push_back(it != node.widgets.end() ? bridge_catalog::to_json(it->second) : nlohmann::json(nullptr));
        }
        j["widgets_values"] = std::move(widgets);

        nodes.push_back(std::move(j));
        ++order;
    }

    nlohmann::json doc = nlohmann::json::object();
    for (auto it = graph.metadata().begin(); it != graph.metadata().end(); ++it) {
        if (!is_one_of(it.key(), k_document_keys)) {
            doc[it.key()] = it.value();
        }
    }
    if (!doc.contains("groups")) doc["groups"] = nlohmann::json::array();
    if (!doc.contains("config")) doc["config"] = nlohmann::json::object();
    if (!doc.contains("extra")) doc["extra"] = nlohmann::json::object();

    doc["last_node_id"] = graph.max_node_id();
    doc["last_link_id"] = next_link_id - 1;
    doc["nodes"] = std::move(nodes);
    doc["links"] = std::move(links);
    doc["version"] = k_native_version;

    bridge_core::codec_logger()->debug("Exported workflow: {} nodes, {} links", graph.node_count(), graph.link_count());
    return doc;
}

} // namespace bridge_codec
