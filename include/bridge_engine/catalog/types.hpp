#pragma once

/// @file types.hpp
/// @brief Slot types, type shorthands and widget kinds

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bridge_catalog {

// =============================================================================
// Slot Types
// =============================================================================

/// Wildcard slot type
inline constexpr std::string_view k_any_type = "*";

/// Check if an output of type `output_type` may feed an input accepting
/// `input_types` (comma-separated list). `*` on either side matches anything.
[[nodiscard]] bool types_compatible(std::string_view output_type, std::string_view input_types);

/// Compact interchange shorthand for a slot type; unknown types map to themselves
[[nodiscard]] std::string type_shorthand(std::string_view type);

/// Inverse of type_shorthand for the known table; unknown tags map to themselves
[[nodiscard]] std::string expand_type_shorthand(std::string_view tag);

// =============================================================================
// WidgetKind
// =============================================================================

/// Value kind a widget declares
enum class WidgetKind : std::uint8_t {
    Int,
    Float,
    String,
    Bool,
    Combo,
};

/// Get string name for widget kind
[[nodiscard]] inline const char* widget_kind_name(WidgetKind kind) noexcept {
    switch (kind) {
        case WidgetKind::Int: return "INT";
        case WidgetKind::Float: return "FLOAT";
        case WidgetKind::String: return "STRING";
        case WidgetKind::Bool: return "BOOLEAN";
        case WidgetKind::Combo: return "COMBO";
        default: return "UNKNOWN";
    }
}

/// Widget kind for a scalar catalog type name (INT, FLOAT, STRING, BOOLEAN)
[[nodiscard]] std::optional<WidgetKind> widget_kind_from_type(std::string_view type) noexcept;

} // namespace bridge_catalog
