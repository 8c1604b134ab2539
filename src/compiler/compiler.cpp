/// @file compiler.cpp
/// @brief Change brief compilation

#include <bridge_engine/compiler/compiler.hpp>
#include <bridge_engine/compiler/brief.hpp>
#include <bridge_engine/compiler/virtual_graph.hpp>
#include <bridge_engine/core/log.hpp>
#include <bridge_engine/ops/apply.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <charconv>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace bridge_compiler {

using bridge_catalog::NodeDefinition;
using bridge_catalog::Value;
using bridge_core::CompileError;
using bridge_core::Rule;
using bridge_graph::Link;
using bridge_graph::NodeId;
using bridge_ops::Operation;

namespace {

using WidgetList = std::vector<std::pair<std::string, Value>>;

constexpr std::array<const char*, 5> k_edit_sections = {
    "nodes_to_delete", "nodes_to_add", "nodes_to_update", "connect", "disconnect",
};

const nlohmann::json& empty_array() {
    static const nlohmann::json empty = nlohmann::json::array();
    return empty;
}

bridge_core::Error brief_error(Rule rule, const std::string& location, const std::string& message) {
    return CompileError::in_brief(rule, location, message);
}

std::string at(const std::string& location, std::size_t index) {
    return fmt::format("{}[{}]", location, index);
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

std::optional<NodeId> parse_id(std::string_view text) {
    NodeId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return id;
}

// =============================================================================
// Compilation
// =============================================================================

/// State of one compile() call
class Compilation {
public:
    Compilation(const nlohmann::json& brief, const bridge_graph::WorkflowGraph& graph,
                const bridge_catalog::Catalog& catalog)
        : m_brief(brief)
        , m_base(graph)
        , m_catalog(catalog)
        , m_virtual(graph, catalog) {}

    bridge_core::Result<CompileOutput> run();

private:
    bridge_core::Result<void> check_sections();
    bridge_core::Result<void> plan_additions();

    bridge_core::Result<void> emit_removals();
    bridge_core::Result<void> emit_disconnects();
    bridge_core::Result<void> emit_additions();
    bridge_core::Result<void> emit_updates();
    bridge_core::Result<void> emit_connects();

    /// Validate against the virtual graph, then accept
    bridge_core::Result<void> emit(Operation op, const std::string& location);

    /// Emit a Connect unless the same link was already emitted
    bridge_core::Result<void> emit_connect(const Link& link, const std::string& location);

    bridge_core::Result<NodeId> resolve_node(const nlohmann::json& ref, const std::string& location) const;
    bridge_core::Result<NodeId> resolve_title(const std::string& title, const std::string& location) const;

    bridge_core::Result<std::size_t> resolve_output(
        NodeId node, const nlohmann::json& endpoint, const char* name_key, const std::string& location) const;
    bridge_core::Result<std::size_t> resolve_input(
        NodeId node, const nlohmann::json& endpoint, const char* name_key, const std::string& location) const;

    /// {from: {...}, to: {...}} entry of connect / disconnect
    bridge_core::Result<Link> resolve_link(const nlohmann::json& entry, const std::string& location) const;

    /// Null values leave a new node's widget at its default; an update
    /// must give every named widget a value
    bridge_core::Result<WidgetList> read_widgets(
        const NodeDefinition& def, const nlohmann::json& widgets, const std::string& location, bool updating) const;

    [[nodiscard]] const NodeDefinition* definition_of(NodeId id) const;
    [[nodiscard]] const nlohmann::json& section(const char* key) const;

    std::string summarize() const;

    const nlohmann::json& m_brief;
    const bridge_graph::WorkflowGraph& m_base;
    const bridge_catalog::Catalog& m_catalog;
    VirtualGraph m_virtual;

    std::vector<NodeId> m_added_ids;              // Parallel to nodes_to_add
    std::map<std::string, NodeId> m_placeholders;
    std::set<Link> m_connected;
    bridge_ops::OperationList m_operations;
};

const nlohmann::json& Compilation::section(const char* key) const {
    auto it = m_brief.find(key);
    if (it == m_brief.end() || it->is_null()) {
        return empty_array();
    }
    return *it;
}

const NodeDefinition* Compilation::definition_of(NodeId id) const {
    const auto* node = m_virtual.state().find_node(id);
    return node ? m_catalog.find(node->class_name) : nullptr;
}

// -----------------------------------------------------------------------------
// Sections
// -----------------------------------------------------------------------------

bridge_core::Result<void> Compilation::check_sections() {
    if (m_brief.contains("plan_summary") && !m_brief["plan_summary"].is_string() &&
        !m_brief["plan_summary"].is_null()) {
        return bridge_core::Err(brief_error(Rule::Malformed, "plan_summary", "plan_summary must be a string"));
    }

    bool has_edit = false;
    for (const char* key : k_edit_sections) {
        const auto& s = section(key);
        if (!s.is_array()) {
            return bridge_core::Err(brief_error(Rule::Malformed, key, fmt::format("{} must be an array", key)));
        }
        has_edit = has_edit || !s.empty();
    }

    if (!has_edit) {
        return bridge_core::Err(brief_error(Rule::EmptyPlan, "brief", "Brief requests no edit"));
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::plan_additions() {
    const auto& additions = section("nodes_to_add");
    m_added_ids.assign(additions.size(), 0);

    // Explicit ids first, so placeholders never take them
    for (std::size_t i = 0; i < additions.size(); ++i) {
        const auto& entry = additions[i];
        auto location = at("nodes_to_add", i);
        if (!entry.is_object()) {
            return bridge_core::Err(brief_error(Rule::Malformed, location, "Node entry must be an object"));
        }
        if (!entry.contains("type") || !entry["type"].is_string()) {
            return bridge_core::Err(brief_error(Rule::Malformed, location + ".type", "Node entry needs a type"));
        }
        auto class_name = entry["type"].get<std::string>();
        if (!m_catalog.contains(class_name)) {
            return bridge_core::Err(brief_error(Rule::UnknownClass, location + ".type",
                fmt::format("Unknown node class '{}'", class_name)));
        }

        if (entry.contains("id") && !entry["id"].is_null()) {
            if (!entry["id"].is_number_integer() || entry["id"].get<NodeId>() <= 0) {
                return bridge_core::Err(brief_error(Rule::Malformed, location + ".id", "id must be a positive integer"));
            }
            auto id = entry["id"].get<NodeId>();
            if (m_base.has_node(id) || m_virtual.is_reserved(id)) {
                return bridge_core::Err(brief_error(Rule::DuplicateNode, location + ".id",
                    fmt::format("Requested id {} is already in use", id)));
            }
            m_virtual.reserve_id(id);
            m_added_ids[i] = id;
        }
    }

    for (std::size_t i = 0; i < additions.size(); ++i) {
        const auto& entry = additions[i];
        auto location = at("nodes_to_add", i);
        if (m_added_ids[i] == 0) {
            m_added_ids[i] = m_virtual.allocate_id();
        }

        if (entry.contains("placeholder_id") && !entry["placeholder_id"].is_null()) {
            if (!entry["placeholder_id"].is_string()) {
                return bridge_core::Err(brief_error(Rule::Malformed, location + ".placeholder_id",
                    "placeholder_id must be a string"));
            }
            auto placeholder = entry["placeholder_id"].get<std::string>();
            if (!m_placeholders.emplace(placeholder, m_added_ids[i]).second) {
                return bridge_core::Err(brief_error(Rule::DuplicateNode, location + ".placeholder_id",
                    fmt::format("Placeholder '{}' is declared twice", placeholder)));
            }
        }
    }

    return bridge_core::Ok();
}

// -----------------------------------------------------------------------------
// References
// -----------------------------------------------------------------------------

bridge_core::Result<NodeId> Compilation::resolve_title(const std::string& title, const std::string& location) const {
    auto matches = m_virtual.find_by_title(title);
    if (matches.empty()) {
        return bridge_core::Err<NodeId>(brief_error(Rule::UnresolvedReference, location,
            fmt::format("No node titled '{}'", title)));
    }
    if (matches.size() > 1) {
        return bridge_core::Err<NodeId>(brief_error(Rule::AmbiguousReference, location,
            fmt::format("{} nodes are titled '{}' (ids {})", matches.size(), title, fmt::join(matches, ", "))));
    }
    return matches.front();
}

bridge_core::Result<NodeId> Compilation::resolve_node(const nlohmann::json& ref, const std::string& location) const {
    if (ref.is_number_integer()) {
        return ref.get<NodeId>();
    }

    if (ref.is_object()) {
        if (ref.contains("title") && ref["title"].is_string()) {
            return resolve_title(ref["title"].get<std::string>(), location);
        }
        return bridge_core::Err<NodeId>(brief_error(Rule::Malformed, location,
            "Node reference object needs a string title"));
    }

    if (!ref.is_string()) {
        return bridge_core::Err<NodeId>(brief_error(Rule::Malformed, location,
            fmt::format("Node reference must be a string or integer, got {}", ref.dump())));
    }

    auto text = ref.get<std::string>();
    if (auto it = m_placeholders.find(text); it != m_placeholders.end()) {
        return it->second;
    }
    if (starts_with(text, "EXISTING_")) {
        if (auto id = parse_id(std::string_view(text).substr(9))) {
            return *id;
        }
    } else if (starts_with(text, "title:")) {
        return resolve_title(text.substr(6), location);
    } else if (auto id = parse_id(text)) {
        return *id;
    }

    return bridge_core::Err<NodeId>(brief_error(Rule::UnresolvedReference, location,
        fmt::format("Cannot resolve node reference '{}'", text)));
}

bridge_core::Result<std::size_t> Compilation::resolve_output(
    NodeId node, const nlohmann::json& endpoint, const char* name_key, const std::string& location) const
{
    const nlohmann::json* selector = nullptr;
    if (endpoint.contains("slot") && !endpoint["slot"].is_null()) {
        selector = &endpoint["slot"];
    } else if (endpoint.contains(name_key) && !endpoint[name_key].is_null()) {
        selector = &endpoint[name_key];
    }

    if (!selector) {
        return std::size_t{0};
    }
    if (selector->is_number_integer()) {
        auto slot = selector->get<std::int64_t>();
        if (slot < 0) {
            return bridge_core::Err<std::size_t>(brief_error(Rule::SlotOutOfRange, location, "Negative slot index"));
        }
        return static_cast<std::size_t>(slot);
    }
    if (!selector->is_string()) {
        return bridge_core::Err<std::size_t>(brief_error(Rule::Malformed, location, "Slot must be an index or a name"));
    }

    const auto* def = definition_of(node);
    if (!def) {
        return bridge_core::Err<std::size_t>(brief_error(Rule::UnknownNode, location,
            fmt::format("Node {} does not exist", node)));
    }
    auto name = selector->get<std::string>();
    if (auto index = def->output_index(name)) {
        return *index;
    }
    return bridge_core::Err<std::size_t>(brief_error(Rule::UnresolvedReference, location,
        fmt::format("{} has no output named '{}'", def->class_name(), name)));
}

bridge_core::Result<std::size_t> Compilation::resolve_input(
    NodeId node, const nlohmann::json& endpoint, const char* name_key, const std::string& location) const
{
    const nlohmann::json* selector = nullptr;
    if (endpoint.contains("slot") && !endpoint["slot"].is_null()) {
        selector = &endpoint["slot"];
    } else if (endpoint.contains(name_key) && !endpoint[name_key].is_null()) {
        selector = &endpoint[name_key];
    }

    if (!selector) {
        return std::size_t{0};
    }
    if (selector->is_number_integer()) {
        auto slot = selector->get<std::int64_t>();
        if (slot < 0) {
            return bridge_core::Err<std::size_t>(brief_error(Rule::SlotOutOfRange, location, "Negative slot index"));
        }
        return static_cast<std::size_t>(slot);
    }
    if (!selector->is_string()) {
        return bridge_core::Err<std::size_t>(brief_error(Rule::Malformed, location, "Slot must be an index or a name"));
    }

    const auto* def = definition_of(node);
    if (!def) {
        return bridge_core::Err<std::size_t>(brief_error(Rule::UnknownNode, location,
            fmt::format("Node {} does not exist", node)));
    }
    auto name = selector->get<std::string>();
    if (auto index = def->input_index(name)) {
        return *index;
    }
    if (def->find_widget(name)) {
        return bridge_core::Err<std::size_t>(brief_error(Rule::UnresolvedReference, location,
            fmt::format("{}.{} is a widget, not a link input", def->class_name(), name)));
    }
    return bridge_core::Err<std::size_t>(brief_error(Rule::UnresolvedReference, location,
        fmt::format("{} has no input named '{}'", def->class_name(), name)));
}

bridge_core::Result<Link> Compilation::resolve_link(const nlohmann::json& entry, const std::string& location) const {
    if (!entry.is_object() || !entry.contains("from") || !entry.contains("to") ||
        !entry["from"].is_object() || !entry["to"].is_object()) {
        return bridge_core::Err<Link>(brief_error(Rule::Malformed, location, "Link entry needs from and to objects"));
    }
    const auto& from = entry["from"];
    const auto& to = entry["to"];

    if (!from.contains("node") || !to.contains("node")) {
        return bridge_core::Err<Link>(brief_error(Rule::Malformed, location, "Link endpoint needs a node"));
    }

    auto source = resolve_node(from["node"], location + ".from.node");
    if (!source) return bridge_core::Err<Link>(source.error());
    auto target = resolve_node(to["node"], location + ".to.node");
    if (!target) return bridge_core::Err<Link>(target.error());

    auto source_slot = resolve_output(*source, from, "output_name", location + ".from");
    if (!source_slot) return bridge_core::Err<Link>(source_slot.error());
    auto target_slot = resolve_input(*target, to, "input_name", location + ".to");
    if (!target_slot) return bridge_core::Err<Link>(target_slot.error());

    return Link{*source, *source_slot, *target, *target_slot};
}

bridge_core::Result<WidgetList> Compilation::read_widgets(
    const NodeDefinition& def, const nlohmann::json& widgets, const std::string& location, bool updating) const
{
    WidgetList out;
    auto add = [&](const std::string& name, const nlohmann::json& raw, const std::string& where) -> bridge_core::Result<void> {
        if (raw.is_null()) {
            if (updating) {
                return bridge_core::Err(brief_error(Rule::MissingWidget, where,
                    fmt::format("Update of {}.{} gives no value", def.class_name(), name)));
            }
            return bridge_core::Ok();
        }
        auto value = bridge_catalog::value_from_json(raw);
        if (!value) {
            return bridge_core::Err(brief_error(Rule::WidgetType, where, value.error().message()));
        }
        out.emplace_back(name, std::move(value).value());
        return bridge_core::Ok();
    };

    if (widgets.is_null()) {
        return out;
    }
    if (widgets.is_object()) {
        for (auto it = widgets.begin(); it != widgets.end(); ++it) {
            if (auto added = add(it.key(), it.value(), location + "." + it.key()); !added) {
                return bridge_core::Err<WidgetList>(added.error());
            }
        }
        return out;
    }
    if (widgets.is_array()) {
        if (widgets.size() > def.widgets().size()) {
            return bridge_core::Err<WidgetList>(brief_error(Rule::Malformed, location,
                fmt::format("{} values given, {} declares {} widgets", widgets.size(), def.class_name(), def.widgets().size())));
        }
        for (std::size_t i = 0; i < widgets.size(); ++i) {
            if (auto added = add(def.widgets()[i].name, widgets[i], at(location, i)); !added) {
                return bridge_core::Err<WidgetList>(added.error());
            }
        }
        return out;
    }
    return bridge_core::Err<WidgetList>(brief_error(Rule::Malformed, location, "widgets must be an object or an array"));
}

// -----------------------------------------------------------------------------
// Emission
// -----------------------------------------------------------------------------

bridge_core::Result<void> Compilation::emit(Operation op, const std::string& location) {
    std::size_t index = m_operations.size();
    if (auto applied = m_virtual.apply(op); !applied) {
        const auto& v = applied.error();
        auto where = v.field.empty() ? location : location + "." + v.field;
        return bridge_core::Err(CompileError::at_operation(v.rule, index, where,
            fmt::format("{}: {}", bridge_ops::describe(op), v.message)));
    }
    m_operations.push(std::move(op));
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_connect(const Link& link, const std::string& location) {
    if (m_connected.count(link) != 0) {
        return bridge_core::Ok();
    }
    if (auto emitted = emit(bridge_ops::Connect{link}, location); !emitted) {
        return emitted;
    }
    m_connected.insert(link);
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_removals() {
    const auto& removals = section("nodes_to_delete");
    for (std::size_t i = 0; i < removals.size(); ++i) {
        auto location = at("nodes_to_delete", i);
        auto id = resolve_node(removals[i], location);
        if (!id) return bridge_core::Err(id.error());
        if (auto emitted = emit(bridge_ops::RemoveNode{*id}, location); !emitted) {
            return emitted;
        }
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_disconnects() {
    const auto& entries = section("disconnect");
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto location = at("disconnect", i);
        auto link = resolve_link(entries[i], location);
        if (!link) return bridge_core::Err(link.error());
        if (auto emitted = emit(bridge_ops::Disconnect{*link}, location); !emitted) {
            return emitted;
        }
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_additions() {
    const auto& additions = section("nodes_to_add");
    for (std::size_t i = 0; i < additions.size(); ++i) {
        const auto& entry = additions[i];
        auto location = at("nodes_to_add", i);
        const auto* def = m_catalog.find(entry["type"].get<std::string>());

        bridge_ops::AddNode add;
        add.id = m_added_ids[i];
        add.class_name = def->class_name();

        if (entry.contains("widgets")) {
            auto widgets = read_widgets(*def, entry["widgets"], location + ".widgets", false);
            if (!widgets) return bridge_core::Err(widgets.error());
            for (auto& [name, value] : *widgets) {
                add.widgets.insert_or_assign(name, std::move(value));
            }
        }

        // Emit with every widget filled in, so the list replays without the brief
        auto completed = bridge_ops::complete_widgets(*def, add.widgets);
        if (!completed) {
            const auto& v = completed.error();
            return bridge_core::Err(CompileError::at_operation(v.rule, m_operations.size(),
                location + ".widgets." + v.field, fmt::format("{}: {}", bridge_ops::describe(add), v.message)));
        }
        add.widgets = std::move(completed).value();

        if (entry.contains("metadata") && entry["metadata"].is_object()) {
            add.metadata = entry["metadata"];
        }
        if (entry.contains("title") && entry["title"].is_string()) {
            add.metadata["title"] = entry["title"];
        }

        if (auto emitted = emit(std::move(add), location); !emitted) {
            return emitted;
        }
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_updates() {
    const auto& updates = section("nodes_to_update");
    for (std::size_t i = 0; i < updates.size(); ++i) {
        const auto& entry = updates[i];
        auto location = at("nodes_to_update", i);
        if (!entry.is_object() || !entry.contains("target")) {
            return bridge_core::Err(brief_error(Rule::Malformed, location, "Update entry needs a target"));
        }

        auto target = resolve_node(entry["target"], location + ".target");
        if (!target) return bridge_core::Err(target.error());

        const auto* def = definition_of(*target);
        if (!def) {
            return bridge_core::Err(brief_error(Rule::UnknownNode, location + ".target",
                fmt::format("Node {} does not exist", *target)));
        }

        if (!entry.contains("widgets") || entry["widgets"].is_null() || entry["widgets"].empty()) {
            return bridge_core::Err(brief_error(Rule::Malformed, location + ".widgets",
                fmt::format("Update of node {} names no widgets", *target)));
        }
        auto widgets = read_widgets(*def, entry["widgets"], location + ".widgets", true);
        if (!widgets) return bridge_core::Err(widgets.error());

        for (auto& [name, value] : *widgets) {
            if (auto emitted = emit(bridge_ops::SetWidget{*target, name, std::move(value)}, location + ".widgets"); !emitted) {
                return emitted;
            }
        }
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> Compilation::emit_connects() {
    const auto& additions = section("nodes_to_add");
    for (std::size_t i = 0; i < additions.size(); ++i) {
        const auto& entry = additions[i];
        auto location = at("nodes_to_add", i);
        NodeId self = m_added_ids[i];

        const auto& inputs = entry.contains("inputs") && !entry["inputs"].is_null()
            ? entry["inputs"] : empty_array();
        if (!inputs.is_array()) {
            return bridge_core::Err(brief_error(Rule::Malformed, location + ".inputs", "inputs must be an array"));
        }
        for (std::size_t j = 0; j < inputs.size(); ++j) {
            auto where = at(location + ".inputs", j);
            const auto& input = inputs[j];
            if (!input.is_object() || !input.contains("from") || !input["from"].is_object() ||
                !input["from"].contains("node")) {
                return bridge_core::Err(brief_error(Rule::Malformed, where, "Input entry needs from.node"));
            }
            auto target_slot = resolve_input(self, input, "input_name", where);
            if (!target_slot) return bridge_core::Err(target_slot.error());
            auto source = resolve_node(input["from"]["node"], where + ".from.node");
            if (!source) return bridge_core::Err(source.error());
            auto source_slot = resolve_output(*source, input["from"], "output_name", where + ".from");
            if (!source_slot) return bridge_core::Err(source_slot.error());

            if (auto emitted = emit_connect(Link{*source, *source_slot, self, *target_slot}, where); !emitted) {
                return emitted;
            }
        }

        const auto& outputs = entry.contains("outputs") && !entry["outputs"].is_null()
            ? entry["outputs"] : empty_array();
        if (!outputs.is_array()) {
            return bridge_core::Err(brief_error(Rule::Malformed, location + ".outputs", "outputs must be an array"));
        }
        for (std::size_t j = 0; j < outputs.size(); ++j) {
            auto where = at(location + ".outputs", j);
            const auto& output = outputs[j];
            if (!output.is_object() || !output.contains("to") || !output["to"].is_array()) {
                return bridge_core::Err(brief_error(Rule::Malformed, where, "Output entry needs a to array"));
            }
            auto source_slot = resolve_output(self, output, "output_name", where);
            if (!source_slot) return bridge_core::Err(source_slot.error());

            const auto& destinations = output["to"];
            for (std::size_t k = 0; k < destinations.size(); ++k) {
                auto dest_where = at(where + ".to", k);
                const auto& dest = destinations[k];
                if (!dest.is_object() || !dest.contains("node")) {
                    return bridge_core::Err(brief_error(Rule::Malformed, dest_where, "Destination needs a node"));
                }
                auto target = resolve_node(dest["node"], dest_where + ".node");
                if (!target) return bridge_core::Err(target.error());
                auto target_slot = resolve_input(*target, dest, "input_name", dest_where);
                if (!target_slot) return bridge_core::Err(target_slot.error());

                if (auto emitted = emit_connect(Link{self, *source_slot, *target, *target_slot}, dest_where); !emitted) {
                    return emitted;
                }
            }
        }
    }

    const auto& entries = section("connect");
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto location = at("connect", i);
        auto link = resolve_link(entries[i], location);
        if (!link) return bridge_core::Err(link.error());
        if (auto emitted = emit_connect(*link, location); !emitted) {
            return emitted;
        }
    }
    return bridge_core::Ok();
}

// -----------------------------------------------------------------------------
// Driver
// -----------------------------------------------------------------------------

std::string Compilation::summarize() const {
    std::map<bridge_ops::OperationKind, std::size_t> counts;
    for (const auto& op : m_operations) {
        ++counts[op.kind()];
    }

    std::string summary;
    if (m_brief.contains("plan_summary") && m_brief["plan_summary"].is_string()) {
        summary += m_brief["plan_summary"].get<std::string>();
        summary += '\n';
    }
    summary += fmt::format("{} operations: {} add, {} remove, {} set, {} connect, {} disconnect\n",
        m_operations.size(),
        counts[bridge_ops::OperationKind::AddNode],
        counts[bridge_ops::OperationKind::RemoveNode],
        counts[bridge_ops::OperationKind::SetWidget],
        counts[bridge_ops::OperationKind::Connect],
        counts[bridge_ops::OperationKind::Disconnect]);
    for (std::size_t i = 0; i < m_operations.size(); ++i) {
        summary += fmt::format("  {:>3}  {}\n", i, bridge_ops::describe(m_operations[i]));
    }
    return summary;
}

bridge_core::Result<CompileOutput> Compilation::run() {
    using Step = bridge_core::Result<void> (Compilation::*)();
    constexpr std::array<Step, 7> steps = {
        &Compilation::check_sections,
        &Compilation::plan_additions,
        &Compilation::emit_removals,
        &Compilation::emit_disconnects,
        &Compilation::emit_additions,
        &Compilation::emit_updates,
        &Compilation::emit_connects,
    };

    for (auto step : steps) {
        if (auto done = (this->*step)(); !done) {
            return bridge_core::Err<CompileOutput>(done.error());
        }
    }

    if (m_operations.empty()) {
        return bridge_core::Err<CompileOutput>(brief_error(Rule::EmptyPlan, "brief", "Brief compiles to no operation"));
    }
    return CompileOutput{m_operations, summarize()};
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

bridge_core::Result<CompileOutput> compile_brief(
    const nlohmann::json& brief,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog)
{
    if (!brief.is_object()) {
        return bridge_core::Err<CompileOutput>(brief_error(Rule::Malformed, "brief", "Brief must be a JSON object"));
    }

    Compilation compilation(brief, graph, catalog);
    auto result = compilation.run();
    if (!result) {
        bridge_core::compiler_logger()->debug("Compilation rejected: {}", result.error().message());
        return result;
    }

    bridge_core::compiler_logger()->info("Compiled brief into {} operations", result->operations.size());
    return result;
}

bridge_core::Result<CompileOutput> compile(
    std::string_view brief,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog)
{
    BRIDGE_LOG_SCOPE("compile", "compiler");

    auto extracted = extract_brief(brief);
    if (!extracted) {
        return bridge_core::Err<CompileOutput>(extracted.error());
    }
    return compile_brief(*extracted, graph, catalog);
}

} // namespace bridge_compiler
