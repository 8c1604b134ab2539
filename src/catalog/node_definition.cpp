/// @file node_definition.cpp
/// @brief object_info entry parsing and widget value checks

#include <bridge_engine/catalog/node_definition.hpp>

#include <fmt/format.h>

namespace bridge_catalog {

using bridge_core::CatalogError;
using bridge_core::Rule;

const std::vector<std::string>& control_after_generate_choices() {
    static const std::vector<std::string> choices = {"fixed", "increment", "decrement", "randomize"};
    return choices;
}

// =============================================================================
// Widget Checks
// =============================================================================

bool value_matches_widget_kind(const Value& value, WidgetKind kind) {
    if (value.is_array()) {
        return true;
    }
    switch (kind) {
        case WidgetKind::Int: return value.is_int();
        case WidgetKind::Float: return value.is_numeric();
        case WidgetKind::String: return value.is_string();
        case WidgetKind::Bool: return value.is_bool();
        case WidgetKind::Combo: return value.is_string();
        default: return false;
    }
}

std::optional<WidgetViolation> WidgetDecl::check(const Value& value) const {
    if (value.is_array() || !value_matches_widget_kind(value, kind)) {
        return WidgetViolation{Rule::WidgetType,
            fmt::format("Widget '{}' expects {}, got {}", name, widget_kind_name(kind), value.type_name())};
    }

    if (range && value.is_numeric() && !range->check(value.as_numeric())) {
        return WidgetViolation{Rule::WidgetConstraint,
            fmt::format("Widget '{}' value {} outside [{}, {}]", name, to_display_string(value),
                range->min ? fmt::format("{}", *range->min) : std::string("-inf"),
                range->max ? fmt::format("{}", *range->max) : std::string("inf"))};
    }

    if (kind == WidgetKind::Combo && !choices.empty()) {
        const auto& s = value.as_string();
        bool found = false;
        for (const auto& choice : choices) {
            if (choice == s) {
                found = true;
                break;
            }
        }
        if (!found) {
            return WidgetViolation{Rule::WidgetConstraint,
                fmt::format("Widget '{}' value \"{}\" is not one of its {} choices", name, s, choices.size())};
        }
    }

    return std::nullopt;
}

Value WidgetDecl::normalize(Value value) const {
    if (kind == WidgetKind::Float && value.is_int()) {
        return Value(static_cast<double>(value.as_int()));
    }
    return value;
}

// =============================================================================
// NodeDefinition
// =============================================================================

namespace {

std::string choice_text(const nlohmann::ordered_json& item) {
    return item.is_string() ? item.get<std::string>() : item.dump();
}

bridge_core::Result<WidgetDecl> parse_combo(
    const std::string& class_name,
    const std::string& name,
    const nlohmann::ordered_json& values,
    const nlohmann::ordered_json& opts)
{
    std::vector<std::string> choices;
    for (const auto& item : values) {
        choices.push_back(choice_text(item));
    }

    WidgetDecl widget = WidgetDecl::combo(name, std::move(choices));
    if (opts.contains("default")) {
        const auto& def = opts["default"];
        if (!def.is_string() && !def.is_number()) {
            return bridge_core::Err<WidgetDecl>(CatalogError::malformed_entry(
                class_name, "default of combo '" + name + "' is not a choice"));
        }
        widget.default_value = Value(choice_text(def));
    }
    return widget;
}

bridge_core::Result<WidgetDecl> parse_scalar_widget(
    const std::string& class_name,
    const std::string& name,
    WidgetKind kind,
    const nlohmann::ordered_json& opts)
{
    WidgetDecl widget;
    widget.name = name;
    widget.kind = kind;

    if (opts.contains("default")) {
        auto def = value_from_json(opts["default"]);
        if (!def || !value_matches_widget_kind(*def, kind) || def->is_array()) {
            return bridge_core::Err<WidgetDecl>(CatalogError::malformed_entry(
                class_name, fmt::format("default of '{}' is not a {} value", name, widget_kind_name(kind))));
        }
        widget.default_value = widget.normalize(std::move(def).value());
    }

    if (kind == WidgetKind::Int || kind == WidgetKind::Float) {
        NumericRange range;
        if (opts.contains("min") && opts["min"].is_number()) {
            range.min = opts["min"].get<double>();
        }
        if (opts.contains("max") && opts["max"].is_number()) {
            range.max = opts["max"].get<double>();
        }
        if (range.min || range.max) {
            widget.range = range;
        }
    }

    if (kind == WidgetKind::String && opts.contains("multiline") && opts["multiline"].is_boolean()) {
        widget.multiline = opts["multiline"].get<bool>();
    }

    return widget;
}

} // anonymous namespace

bridge_core::Result<NodeDefinition> NodeDefinition::from_json(
    const std::string& class_name,
    const nlohmann::ordered_json& entry)
{
    if (!entry.is_object()) {
        return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(class_name, "entry is not an object"));
    }

    NodeDefinition def(class_name);

    if (entry.contains("display_name") && entry["display_name"].is_string()) {
        def.m_display_name = entry["display_name"].get<std::string>();
    }
    if (entry.contains("category") && entry["category"].is_string()) {
        def.m_category = entry["category"].get<std::string>();
    }

    // Inputs: link slots and widgets share one declaration list
    if (entry.contains("input")) {
        const auto& input = entry["input"];
        if (!input.is_object()) {
            return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(class_name, "'input' is not an object"));
        }

        for (const char* section : {"required", "optional"}) {
            if (!input.contains(section)) {
                continue;
            }
            const auto& fields = input[section];
            if (!fields.is_object()) {
                return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(
                    class_name, fmt::format("'input.{}' is not an object", section)));
            }

            const bool is_optional = std::string_view(section) == "optional";

            for (auto it = fields.begin(); it != fields.end(); ++it) {
                const std::string& name = it.key();
                const auto& spec = it.value();

                if (!spec.is_array() || spec.empty()) {
                    return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(
                        class_name, "input '" + name + "' must be [type, options]"));
                }

                const auto& raw_type = spec[0];
                static const nlohmann::ordered_json k_no_options = nlohmann::ordered_json::object();
                const auto& opts = spec.size() > 1 && spec[1].is_object() ? spec[1] : k_no_options;

                if (raw_type.is_array() ||
                    (raw_type.is_string() && raw_type.get<std::string>() == "COMBO")) {
                    const auto& values = raw_type.is_array()
                        ? raw_type
                        : (opts.contains("options") && opts["options"].is_array()
                               ? opts["options"]
                               : nlohmann::ordered_json::array());
                    auto widget = parse_combo(class_name, name, values, opts);
                    if (!widget) {
                        return bridge_core::Err<NodeDefinition>(widget.error());
                    }
                    widget->optional = is_optional;
                    def.m_widgets.push_back(std::move(widget).value());
                    continue;
                }

                if (!raw_type.is_string()) {
                    return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(
                        class_name, "input '" + name + "' has a non-string type"));
                }

                const std::string type = raw_type.get<std::string>();
                const bool force_input = opts.contains("forceInput") && opts["forceInput"].is_boolean()
                    && opts["forceInput"].get<bool>();
                auto kind = widget_kind_from_type(type);

                if (!kind || force_input) {
                    def.m_inputs.push_back(InputSlot{name, type, is_optional});
                    continue;
                }

                auto widget = parse_scalar_widget(class_name, name, *kind, opts);
                if (!widget) {
                    return bridge_core::Err<NodeDefinition>(widget.error());
                }
                widget->optional = is_optional;
                def.m_widgets.push_back(std::move(widget).value());

                const bool wants_control = opts.contains(k_control_after_generate)
                    && opts[k_control_after_generate].is_boolean()
                    && opts[k_control_after_generate].get<bool>();
                if (wants_control && *kind == WidgetKind::Int) {
                    std::string control_name = k_control_after_generate;
                    if (def.find_widget(control_name) != nullptr) {
                        control_name = name + "_" + control_name;
                    }
                    auto control = WidgetDecl::combo(control_name, control_after_generate_choices());
                    control.optional = is_optional;
                    def.m_widgets.push_back(std::move(control));
                }
            }
        }
    }

    // Outputs
    if (entry.contains("output")) {
        const auto& output = entry["output"];
        if (!output.is_array()) {
            return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(class_name, "'output' is not an array"));
        }

        const nlohmann::ordered_json* names = nullptr;
        if (entry.contains("output_name") && entry["output_name"].is_array()) {
            names = &entry["output_name"];
        }

        for (std::size_t i = 0; i < output.size(); ++i) {
            const auto& out = output[i];
            std::string type;
            if (out.is_string()) {
                type = out.get<std::string>();
            } else if (out.is_array()) {
                // List-typed output (combo passthrough)
                type = !out.empty() && out[0].is_string() ? out[0].get<std::string>() : std::string(k_any_type);
            } else {
                return bridge_core::Err<NodeDefinition>(CatalogError::malformed_entry(
                    class_name, fmt::format("output {} has a non-string type", i)));
            }

            std::string name = type;
            if (names && i < names->size() && (*names)[i].is_string()) {
                name = (*names)[i].get<std::string>();
            }
            def.m_outputs.push_back(OutputSlot{std::move(name), std::move(type)});
        }
    }

    return def;
}

std::optional<std::size_t> NodeDefinition::input_index(const std::string& name) const {
    for (std::size_t i = 0; i < m_inputs.size(); ++i) {
        if (m_inputs[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> NodeDefinition::output_index(const std::string& name) const {
    for (std::size_t i = 0; i < m_outputs.size(); ++i) {
        if (m_outputs[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> NodeDefinition::widget_index(const std::string& name) const {
    for (std::size_t i = 0; i < m_widgets.size(); ++i) {
        if (m_widgets[i].name == name) return i;
    }
    return std::nullopt;
}

const WidgetDecl* NodeDefinition::find_widget(const std::string& name) const {
    auto index = widget_index(name);
    return index ? &m_widgets[*index] : nullptr;
}

} // namespace bridge_catalog
