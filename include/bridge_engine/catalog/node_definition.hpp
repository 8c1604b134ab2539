#pragma once

/// @file node_definition.hpp
/// @brief Node class schema: link slots and widget declarations

#include "fwd.hpp"
#include "types.hpp"
#include "value.hpp"
#include <bridge_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bridge_catalog {

/// Name of the companion widget declared after a seed-like widget
inline constexpr const char* k_control_after_generate = "control_after_generate";

/// Choices of the control_after_generate companion widget
[[nodiscard]] const std::vector<std::string>& control_after_generate_choices();

// =============================================================================
// Widget Declarations
// =============================================================================

/// Numeric range constraint
struct NumericRange {
    std::optional<double> min;
    std::optional<double> max;

    [[nodiscard]] bool check(double value) const {
        if (min && value < *min) return false;
        if (max && value > *max) return false;
        return true;
    }
};

/// Check if a value has the shape a widget kind stores.
/// Array values pass for every kind; they are carried opaquely.
[[nodiscard]] bool value_matches_widget_kind(const Value& value, WidgetKind kind);

/// Rule violation found while checking a widget value
struct WidgetViolation {
    bridge_core::Rule rule;
    std::string message;
};

/// Widget declaration on a node class
struct WidgetDecl {
    std::string name;
    WidgetKind kind = WidgetKind::String;
    std::optional<Value> default_value;
    std::optional<NumericRange> range;
    std::vector<std::string> choices;  // For Combo kind
    bool optional = false;
    bool multiline = false;

    [[nodiscard]] static WidgetDecl integer(std::string name, std::optional<std::int64_t> def = std::nullopt) {
        WidgetDecl w;
        w.name = std::move(name);
        w.kind = WidgetKind::Int;
        if (def) w.default_value = Value(*def);
        return w;
    }

    [[nodiscard]] static WidgetDecl floating(std::string name, std::optional<double> def = std::nullopt) {
        WidgetDecl w;
        w.name = std::move(name);
        w.kind = WidgetKind::Float;
        if (def) w.default_value = Value(*def);
        return w;
    }

    [[nodiscard]] static WidgetDecl string(std::string name, std::optional<std::string> def = std::nullopt) {
        WidgetDecl w;
        w.name = std::move(name);
        w.kind = WidgetKind::String;
        if (def) w.default_value = Value(std::move(*def));
        return w;
    }

    [[nodiscard]] static WidgetDecl boolean(std::string name, std::optional<bool> def = std::nullopt) {
        WidgetDecl w;
        w.name = std::move(name);
        w.kind = WidgetKind::Bool;
        if (def) w.default_value = Value(*def);
        return w;
    }

    [[nodiscard]] static WidgetDecl combo(std::string name, std::vector<std::string> values) {
        WidgetDecl w;
        w.name = std::move(name);
        w.kind = WidgetKind::Combo;
        if (!values.empty()) w.default_value = Value(values.front());
        w.choices = std::move(values);
        return w;
    }

    /// Full check: kind, range and choice membership
    [[nodiscard]] std::optional<WidgetViolation> check(const Value& value) const;

    /// Convert an accepted value to the stored kind (Int -> Float on Float widgets)
    [[nodiscard]] Value normalize(Value value) const;
};

// =============================================================================
// Slots
// =============================================================================

/// Link input slot
struct InputSlot {
    std::string name;
    std::string type;       // Accepted types, comma-separated
    bool optional = false;
};

/// Output slot
struct OutputSlot {
    std::string name;
    std::string type;
};

// =============================================================================
// NodeDefinition
// =============================================================================

/// Immutable schema of one node class
class NodeDefinition {
public:
    NodeDefinition() = default;
    explicit NodeDefinition(std::string class_name) : m_class_name(std::move(class_name)) {}

    /// Parse an object_info entry
    [[nodiscard]] static bridge_core::Result<NodeDefinition> from_json(
        const std::string& class_name, const nlohmann::ordered_json& entry);

    // -------------------------------------------------------------------------
    // Building
    // -------------------------------------------------------------------------

    NodeDefinition& add_input(std::string name, std::string type, bool optional = false) {
        m_inputs.push_back(InputSlot{std::move(name), std::move(type), optional});
        return *this;
    }

    NodeDefinition& add_output(std::string name, std::string type) {
        m_outputs.push_back(OutputSlot{std::move(name), std::move(type)});
        return *this;
    }

    NodeDefinition& add_widget(WidgetDecl widget) {
        m_widgets.push_back(std::move(widget));
        return *this;
    }

    NodeDefinition& set_display_name(std::string name) {
        m_display_name = std::move(name);
        return *this;
    }

    NodeDefinition& set_category(std::string category) {
        m_category = std::move(category);
        return *this;
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& class_name() const noexcept { return m_class_name; }
    [[nodiscard]] const std::string& display_name() const noexcept {
        return m_display_name.empty() ? m_class_name : m_display_name;
    }
    [[nodiscard]] const std::string& category() const noexcept { return m_category; }

    [[nodiscard]] const std::vector<InputSlot>& inputs() const noexcept { return m_inputs; }
    [[nodiscard]] const std::vector<OutputSlot>& outputs() const noexcept { return m_outputs; }
    [[nodiscard]] const std::vector<WidgetDecl>& widgets() const noexcept { return m_widgets; }

    [[nodiscard]] std::optional<std::size_t> input_index(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> output_index(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> widget_index(const std::string& name) const;

    /// Get widget by name (nullptr if not declared)
    [[nodiscard]] const WidgetDecl* find_widget(const std::string& name) const;

private:
    std::string m_class_name;
    std::string m_display_name;
    std::string m_category;
    std::vector<InputSlot> m_inputs;
    std::vector<OutputSlot> m_outputs;
    std::vector<WidgetDecl> m_widgets;
};

} // namespace bridge_catalog
