#pragma once

/// @file brief.hpp
/// @brief Locating the JSON object inside change brief text

#include <bridge_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace bridge_compiler {

/// Spans of text that may hold the brief object: the bodies of ```json
/// fences when any exist, otherwise every balanced top-level {...} span
[[nodiscard]] std::vector<std::string_view> brief_candidates(std::string_view text);

/// Extract exactly one JSON object from brief text.
/// No candidate, candidates that disagree, or a candidate that is not
/// valid JSON is a CompileError located at "brief".
[[nodiscard]] bridge_core::Result<nlohmann::json> extract_brief(std::string_view text);

} // namespace bridge_compiler
