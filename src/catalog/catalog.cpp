/// @file catalog.cpp
/// @brief Catalog loading from object_info documents

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/core/log.hpp>

#include <fstream>
#include <sstream>

namespace bridge_catalog {

using bridge_core::CatalogError;

bridge_core::Result<Catalog> Catalog::from_json(const nlohmann::ordered_json& doc) {
    if (!doc.is_object()) {
        return bridge_core::Err<Catalog>(CatalogError::parse_failed("root is not an object"));
    }

    const nlohmann::ordered_json* defs = &doc;
    if (doc.contains("node_definitions")) {
        defs = &doc["node_definitions"];
        if (!defs->is_object()) {
            return bridge_core::Err<Catalog>(CatalogError::parse_failed("'node_definitions' is not an object"));
        }
    }

    Catalog catalog;
    for (auto it = defs->begin(); it != defs->end(); ++it) {
        auto def = NodeDefinition::from_json(it.key(), it.value());
        if (!def) {
            bridge_core::catalog_logger()->error("{}", def.error().message());
            return bridge_core::Err<Catalog>(def.error());
        }

        auto added = catalog.add(std::move(def).value());
        if (!added) {
            return bridge_core::Err<Catalog>(added.error());
        }
    }

    bridge_core::catalog_logger()->debug("Catalog holds {} node classes", catalog.size());
    return catalog;
}

bridge_core::Result<Catalog> Catalog::parse(std::string_view text) {
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return bridge_core::Err<Catalog>(CatalogError::parse_failed(e.what()));
    }
    return from_json(doc);
}

bridge_core::Result<Catalog> Catalog::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return bridge_core::Err<Catalog>(CatalogError::io_error(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result) {
        bridge_core::catalog_logger()->info("Loaded {} node classes from {}", result->size(), path.string());
    } else {
        result.error().with_context("path", path.string());
    }
    return result;
}

bridge_core::Result<void> Catalog::add(NodeDefinition definition) {
    const std::string name = definition.class_name();
    if (m_definitions.find(name) != m_definitions.end()) {
        return bridge_core::Error{bridge_core::ErrorCode::AlreadyExists, "Class already in catalog: " + name};
    }
    m_definitions.emplace(name, std::move(definition));
    return bridge_core::Ok();
}

const NodeDefinition* Catalog::find(std::string_view class_name) const {
    auto it = m_definitions.find(class_name);
    return it != m_definitions.end() ? &it->second : nullptr;
}

bridge_core::Result<const NodeDefinition*> Catalog::require(const std::string& class_name) const {
    if (const auto* def = find(class_name)) {
        return def;
    }
    return bridge_core::Err<const NodeDefinition*>(CatalogError::unknown_class(class_name));
}

std::vector<std::string> Catalog::class_names() const {
    std::vector<std::string> names;
    names.reserve(m_definitions.size());
    for (const auto& [name, _] : m_definitions) {
        names.push_back(name);
    }
    return names;
}

} // namespace bridge_catalog
