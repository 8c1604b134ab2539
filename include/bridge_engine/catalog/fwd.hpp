#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bridge_catalog module

#include <cstdint>

namespace bridge_catalog {

// Values
enum class ValueType : std::uint8_t;
class Value;

// Schema
enum class WidgetKind : std::uint8_t;
struct NumericRange;
struct WidgetDecl;
struct WidgetViolation;
struct InputSlot;
struct OutputSlot;
class NodeDefinition;

// Registry
class Catalog;

} // namespace bridge_catalog
