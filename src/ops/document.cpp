/// @file document.cpp
/// @brief Operation list document serialization

#include <bridge_engine/ops/document.hpp>

#include <fmt/format.h>

#include <optional>
#include <utility>

namespace bridge_ops {

using bridge_core::FormatError;
using bridge_core::Rule;

namespace {

bridge_core::Error bad_field(const std::string& field, const std::string& what) {
    return FormatError::violation(Rule::Malformed, fmt::format("Malformed operation list: {} {}", field, what), field);
}

nlohmann::json endpoint(bridge_graph::NodeId node, std::size_t slot) {
    return nlohmann::json::array({node, slot});
}

bridge_core::Result<bridge_graph::NodeId> read_id(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return bridge_core::Err<bridge_graph::NodeId>(bad_field(key, "must be an integer"));
    }
    return j[key].get<bridge_graph::NodeId>();
}

bridge_core::Result<bridge_graph::Link> read_link(const nlohmann::json& j) {
    auto pair = [&](const char* key) -> std::optional<std::pair<std::int64_t, std::int64_t>> {
        if (!j.contains(key)) return std::nullopt;
        const auto& v = j[key];
        if (!v.is_array() || v.size() != 2 || !v[0].is_number_integer() || !v[1].is_number_integer()) {
            return std::nullopt;
        }
        auto slot = v[1].get<std::int64_t>();
        if (slot < 0) return std::nullopt;
        return std::make_pair(v[0].get<std::int64_t>(), slot);
    };

    auto from = pair("from");
    if (!from) {
        return bridge_core::Err<bridge_graph::Link>(bad_field("from", "must be [node, slot]"));
    }
    auto to = pair("to");
    if (!to) {
        return bridge_core::Err<bridge_graph::Link>(bad_field("to", "must be [node, slot]"));
    }
    return bridge_graph::Link{from->first, static_cast<std::size_t>(from->second),
                              to->first, static_cast<std::size_t>(to->second)};
}

} // anonymous namespace

// =============================================================================
// Writing
// =============================================================================

nlohmann::json to_json(const Operation& op) {
    return op.visit(overloaded{
        [](const AddNode& add) {
            nlohmann::json widgets = nlohmann::json::object();
            for (const auto& [name, value] : add.widgets) {
                widgets[name] = bridge_catalog::to_json(value);
            }
            return nlohmann::json{
                {"op", operation_kind_name(OperationKind::AddNode)},
                {"id", add.id},
                {"class", add.class_name},
                {"widgets", std::move(widgets)},
                {"metadata", add.metadata},
            };
        },
        [](const RemoveNode& remove) {
            return nlohmann::json{
                {"op", operation_kind_name(OperationKind::RemoveNode)},
                {"id", remove.id},
            };
        },
        [](const Connect& connect) {
            return nlohmann::json{
                {"op", operation_kind_name(OperationKind::Connect)},
                {"from", endpoint(connect.link.source, connect.link.source_slot)},
                {"to", endpoint(connect.link.target, connect.link.target_slot)},
            };
        },
        [](const Disconnect& disconnect) {
            return nlohmann::json{
                {"op", operation_kind_name(OperationKind::Disconnect)},
                {"from", endpoint(disconnect.link.source, disconnect.link.source_slot)},
                {"to", endpoint(disconnect.link.target, disconnect.link.target_slot)},
            };
        },
        [](const SetWidget& set) {
            return nlohmann::json{
                {"op", operation_kind_name(OperationKind::SetWidget)},
                {"node", set.node},
                {"widget", set.widget},
                {"value", bridge_catalog::to_json(set.value)},
            };
        },
    });
}

nlohmann::json to_json(const OperationList& list) {
    nlohmann::json operations = nlohmann::json::array();
    for (const auto& op : list) {
        operations.push_back(to_json(op));
    }
    return nlohmann::json{
        {"format", k_oplist_format},
        {"version", k_oplist_version},
        {"operations", std::move(operations)},
    };
}

// =============================================================================
// Reading
// =============================================================================

bridge_core::Result<Operation> operation_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return bridge_core::Err<Operation>(bad_field("operation", "must be an object"));
    }
    if (!j.contains("op") || !j["op"].is_string()) {
        return bridge_core::Err<Operation>(bad_field("op", "must be a string"));
    }
    const auto name = j["op"].get<std::string>();

    if (name == operation_kind_name(OperationKind::AddNode)) {
        auto id = read_id(j, "id");
        if (!id) return bridge_core::Err<Operation>(id.error());
        if (!j.contains("class") || !j["class"].is_string()) {
            return bridge_core::Err<Operation>(bad_field("class", "must be a string"));
        }

        AddNode add;
        add.id = *id;
        add.class_name = j["class"].get<std::string>();

        if (j.contains("widgets") && !j["widgets"].is_null()) {
            if (!j["widgets"].is_object()) {
                return bridge_core::Err<Operation>(bad_field("widgets", "must be an object"));
            }
            for (auto it = j["widgets"].begin(); it != j["widgets"].end(); ++it) {
                auto value = bridge_catalog::value_from_json(it.value());
                if (!value) {
                    return bridge_core::Err<Operation>(bad_field("widgets." + it.key(), value.error().message()));
                }
                add.widgets.emplace(it.key(), std::move(value).value());
            }
        }
        if (j.contains("metadata") && !j["metadata"].is_null()) {
            if (!j["metadata"].is_object()) {
                return bridge_core::Err<Operation>(bad_field("metadata", "must be an object"));
            }
            add.metadata = j["metadata"];
        }
        return Operation(std::move(add));
    }

    if (name == operation_kind_name(OperationKind::RemoveNode)) {
        auto id = read_id(j, "id");
        if (!id) return bridge_core::Err<Operation>(id.error());
        return Operation(RemoveNode{*id});
    }

    if (name == operation_kind_name(OperationKind::Connect) ||
        name == operation_kind_name(OperationKind::Disconnect)) {
        auto link = read_link(j);
        if (!link) return bridge_core::Err<Operation>(link.error());
        if (name == operation_kind_name(OperationKind::Connect)) {
            return Operation(Connect{*link});
        }
        return Operation(Disconnect{*link});
    }

    if (name == operation_kind_name(OperationKind::SetWidget)) {
        auto node = read_id(j, "node");
        if (!node) return bridge_core::Err<Operation>(node.error());
        if (!j.contains("widget") || !j["widget"].is_string()) {
            return bridge_core::Err<Operation>(bad_field("widget", "must be a string"));
        }
        if (!j.contains("value")) {
            return bridge_core::Err<Operation>(bad_field("value", "is missing"));
        }
        auto value = bridge_catalog::value_from_json(j["value"]);
        if (!value) {
            return bridge_core::Err<Operation>(bad_field("value", value.error().message()));
        }
        return Operation(SetWidget{*node, j["widget"].get<std::string>(), std::move(value).value()});
    }

    return bridge_core::Err<Operation>(bad_field("op", fmt::format("has unknown kind '{}'", name)));
}

bridge_core::Result<OperationList> operation_list_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return bridge_core::Err<OperationList>(bad_field("document", "must be an object"));
    }
    if (!doc.contains("format") || doc["format"] != k_oplist_format) {
        return bridge_core::Err<OperationList>(bad_field("format", fmt::format("must be \"{}\"", k_oplist_format)));
    }
    if (!doc.contains("version") || doc["version"] != k_oplist_version) {
        return bridge_core::Err<OperationList>(bad_field("version", fmt::format("must be {}", k_oplist_version)));
    }
    if (!doc.contains("operations") || !doc["operations"].is_array()) {
        return bridge_core::Err<OperationList>(bad_field("operations", "must be an array"));
    }

    OperationList list;
    list.reserve(doc["operations"].size());
    std::size_t index = 0;
    for (const auto& j : doc["operations"]) {
        auto op = operation_from_json(j);
        if (!op) {
            auto err = op.error();
            err.with_context("operation", std::to_string(index));
            return bridge_core::Err<OperationList>(std::move(err));
        }
        list.push(std::move(op).value());
        ++index;
    }
    return list;
}

bridge_core::Result<OperationList> parse_operation_list(std::string_view text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return bridge_core::Err<OperationList>(FormatError::malformed(e.what()));
    }
    return operation_list_from_json(doc);
}

} // namespace bridge_ops
