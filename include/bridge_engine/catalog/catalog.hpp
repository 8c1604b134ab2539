#pragma once

/// @file catalog.hpp
/// @brief Node definition catalog keyed by class name

#include "fwd.hpp"
#include "node_definition.hpp"
#include <bridge_engine/core/error.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bridge_catalog {

/// Read-only mapping from class name to NodeDefinition.
/// Loaded once, then shared by const reference across compile/execute calls.
class Catalog {
public:
    Catalog() = default;

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    /// Build from an object_info document, optionally wrapped in
    /// {"node_definitions": {...}}. Any malformed entry fails the whole load.
    [[nodiscard]] static bridge_core::Result<Catalog> from_json(const nlohmann::ordered_json& doc);

    /// Parse object_info text
    [[nodiscard]] static bridge_core::Result<Catalog> parse(std::string_view text);

    /// Load object_info from a file
    [[nodiscard]] static bridge_core::Result<Catalog> load_file(const std::filesystem::path& path);

    /// Register a definition (fails if the class is already present)
    bridge_core::Result<void> add(NodeDefinition definition);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /// Get definition by class name (nullptr if absent)
    [[nodiscard]] const NodeDefinition* find(std::string_view class_name) const;

    /// Get definition or CatalogError::unknown_class
    [[nodiscard]] bridge_core::Result<const NodeDefinition*> require(const std::string& class_name) const;

    [[nodiscard]] bool contains(std::string_view class_name) const {
        return find(class_name) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_definitions.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_definitions.empty(); }

    /// All class names, sorted
    [[nodiscard]] std::vector<std::string> class_names() const;

private:
    std::map<std::string, NodeDefinition, std::less<>> m_definitions;
};

} // namespace bridge_catalog
