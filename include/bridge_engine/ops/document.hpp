#pragma once

/// @file document.hpp
/// @brief Operation list document ("bridge.oplist") serialization
///
///     {"format": "bridge.oplist", "version": 1, "operations": [
///         {"op": "add_node", "id": 7, "class": "VAEDecode", "widgets": {}, "metadata": {}},
///         {"op": "connect", "from": [5, 0], "to": [7, 0]},
///         {"op": "set_widget", "node": 4, "widget": "steps", "value": 30}]}

#include "operation.hpp"
#include <bridge_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace bridge_ops {

inline constexpr const char* k_oplist_format = "bridge.oplist";
inline constexpr int k_oplist_version = 1;

[[nodiscard]] nlohmann::json to_json(const Operation& op);
[[nodiscard]] nlohmann::json to_json(const OperationList& list);

/// Read one operation; FormatError names the offending field
[[nodiscard]] bridge_core::Result<Operation> operation_from_json(const nlohmann::json& j);

/// Read a full document (format tag and version are checked)
[[nodiscard]] bridge_core::Result<OperationList> operation_list_from_json(const nlohmann::json& doc);

/// Parse document text
[[nodiscard]] bridge_core::Result<OperationList> parse_operation_list(std::string_view text);

} // namespace bridge_ops
