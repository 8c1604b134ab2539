#pragma once

/// @file value.hpp
/// @brief Dynamic widget value type for bridge_catalog

#include "fwd.hpp"
#include <bridge_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bridge_catalog {

// =============================================================================
// ValueType
// =============================================================================

/// Value type discriminator
enum class ValueType : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Array,
};

/// Get string name for value type
[[nodiscard]] inline const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null: return "Null";
        case ValueType::Bool: return "Bool";
        case ValueType::Int: return "Int";
        case ValueType::Float: return "Float";
        case ValueType::String: return "String";
        case ValueType::Array: return "Array";
        default: return "Unknown";
    }
}

// =============================================================================
// Value
// =============================================================================

class Value;

/// Array of values
using ValueArray = std::vector<Value>;

/// Widget value. Int and Float are distinct kinds; equality is structural.
class Value {
public:
    using Variant = std::variant<
        std::monostate,      // Null
        bool,                // Bool
        std::int64_t,        // Int
        double,              // Float
        std::string,         // String
        ValueArray           // Array
    >;

    /// Default constructor creates null
    Value() : m_data(std::monostate{}) {}

    Value(bool v) : m_data(v) {}

    Value(int v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : m_data(v) {}

    Value(double v) : m_data(v) {}

    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string(v)) {}

    Value(ValueArray v) : m_data(std::move(v)) {}

    // -------------------------------------------------------------------------
    // Factory methods
    // -------------------------------------------------------------------------

    [[nodiscard]] static Value null() { return Value{}; }

    [[nodiscard]] static Value array(std::initializer_list<Value> values) {
        return Value(ValueArray(values));
    }

    // -------------------------------------------------------------------------
    // Type checking
    // -------------------------------------------------------------------------

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(m_data.index());
    }

    [[nodiscard]] const char* type_name() const noexcept {
        return value_type_name(type());
    }

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(m_data);
    }

    [[nodiscard]] bool is_bool() const noexcept {
        return std::holds_alternative<bool>(m_data);
    }

    [[nodiscard]] bool is_int() const noexcept {
        return std::holds_alternative<std::int64_t>(m_data);
    }

    [[nodiscard]] bool is_float() const noexcept {
        return std::holds_alternative<double>(m_data);
    }

    /// Check if numeric (int or float)
    [[nodiscard]] bool is_numeric() const noexcept {
        return is_int() || is_float();
    }

    [[nodiscard]] bool is_string() const noexcept {
        return std::holds_alternative<std::string>(m_data);
    }

    [[nodiscard]] bool is_array() const noexcept {
        return std::holds_alternative<ValueArray>(m_data);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// Get as bool (throws if wrong type)
    [[nodiscard]] bool as_bool() const {
        return std::get<bool>(m_data);
    }

    /// Get as int (throws if wrong type)
    [[nodiscard]] std::int64_t as_int() const {
        return std::get<std::int64_t>(m_data);
    }

    /// Get as float (throws if wrong type)
    [[nodiscard]] double as_float() const {
        return std::get<double>(m_data);
    }

    /// Get as numeric (converts int to float if needed)
    [[nodiscard]] double as_numeric() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        return as_float();
    }

    /// Get as string (throws if wrong type)
    [[nodiscard]] const std::string& as_string() const {
        return std::get<std::string>(m_data);
    }

    /// Get as array (throws if wrong type)
    [[nodiscard]] const ValueArray& as_array() const {
        return std::get<ValueArray>(m_data);
    }

    [[nodiscard]] std::optional<std::int64_t> try_int() const noexcept {
        if (auto* p = std::get_if<std::int64_t>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] const std::string* try_string() const noexcept {
        return std::get_if<std::string>(&m_data);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const {
        return m_data == other.m_data;
    }

    bool operator!=(const Value& other) const {
        return m_data != other.m_data;
    }

private:
    Variant m_data;
};

// =============================================================================
// JSON Conversion
// =============================================================================

/// Convert to JSON (Null -> null, Array -> array)
[[nodiscard]] nlohmann::json to_json(const Value& value);

/// Convert from JSON; objects have no Value counterpart
[[nodiscard]] bridge_core::Result<Value> value_from_json(const nlohmann::json& j);
[[nodiscard]] bridge_core::Result<Value> value_from_json(const nlohmann::ordered_json& j);

/// Compact display form used in logs and summaries
[[nodiscard]] std::string to_display_string(const Value& value);

} // namespace bridge_catalog
