/// @file brief.cpp
/// @brief Brief object extraction

#include <bridge_engine/compiler/brief.hpp>
#include <bridge_engine/core/log.hpp>

#include <fmt/format.h>

namespace bridge_compiler {

using bridge_core::CompileError;
using bridge_core::Rule;

namespace {

constexpr std::string_view k_fence_open = "```json";
constexpr std::string_view k_fence_close = "```";

std::vector<std::string_view> fenced_blocks(std::string_view text) {
    std::vector<std::string_view> blocks;
    std::size_t pos = 0;
    while ((pos = text.find(k_fence_open, pos)) != std::string_view::npos) {
        std::size_t body = pos + k_fence_open.size();
        std::size_t end = text.find(k_fence_close, body);
        if (end == std::string_view::npos) {
            blocks.push_back(text.substr(body));
            break;
        }
        blocks.push_back(text.substr(body, end - body));
        pos = end + k_fence_close.size();
    }
    return blocks;
}

/// Top-level {...} spans; braces inside JSON strings are ignored
std::vector<std::string_view> balanced_objects(std::string_view text) {
    std::vector<std::string_view> spans;
    std::size_t depth = 0;
    std::size_t start = 0;
    bool in_string = false;
    bool escaped = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (depth > 0 && in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"' && depth > 0) {
            in_string = true;
        } else if (c == '{') {
            if (depth == 0) start = i;
            ++depth;
        } else if (c == '}' && depth > 0) {
            if (--depth == 0) {
                spans.push_back(text.substr(start, i - start + 1));
            }
        }
    }
    return spans;
}

} // anonymous namespace

std::vector<std::string_view> brief_candidates(std::string_view text) {
    auto fenced = fenced_blocks(text);
    if (!fenced.empty()) {
        return fenced;
    }
    return balanced_objects(text);
}

bridge_core::Result<nlohmann::json> extract_brief(std::string_view text) {
    auto candidates = brief_candidates(text);
    if (candidates.empty()) {
        return bridge_core::Err<nlohmann::json>(
            CompileError::in_brief(Rule::Malformed, "brief", "Brief contains no JSON object"));
    }

    std::vector<nlohmann::json> parsed;
    for (auto candidate : candidates) {
        try {
            parsed.push_back(nlohmann::json::parse(candidate));
        } catch (const nlohmann::json::parse_error& e) {
            return bridge_core::Err<nlohmann::json>(CompileError::in_brief(Rule::Malformed, "brief",
                fmt::format("Brief JSON does not parse: {}", e.what())));
        }
    }

    for (std::size_t i = 1; i < parsed.size(); ++i) {
        if (parsed[i] != parsed[0]) {
            return bridge_core::Err<nlohmann::json>(CompileError::in_brief(Rule::Malformed, "brief",
                fmt::format("Brief contains {} different JSON objects", parsed.size())));
        }
    }

    if (!parsed[0].is_object()) {
        return bridge_core::Err<nlohmann::json>(
            CompileError::in_brief(Rule::Malformed, "brief", "Brief JSON is not an object"));
    }

    bridge_core::compiler_logger()->debug("Extracted brief from {} candidate(s)", candidates.size());
    return std::move(parsed[0]);
}

} // namespace bridge_compiler
