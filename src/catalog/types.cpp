/// @file types.cpp
/// @brief Slot type compatibility and shorthand table

#include <bridge_engine/catalog/types.hpp>

#include <array>
#include <utility>

namespace bridge_catalog {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 18> k_shorthands = {{
    {"MODEL", "M"},
    {"IMAGE", "G"},
    {"CONDITIONING", "C"},
    {"LATENT", "A"},
    {"VAE", "V"},
    {"CLIP", "P"},
    {"STRING", "S"},
    {"INT", "I"},
    {"FLOAT", "F"},
    {"BOOLEAN", "B"},
    {"MASK", "K"},
    {"CONTROL_NET", "T"},
    {"LIST", "L"},
    {"CLIP_VISION", "CV"},
    {"CLIP_VISION_OUTPUT", "CO"},
    {"VOXEL", "VX"},
    {"MESH", "MS"},
    {"*", "*"},
}};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

bool types_compatible(std::string_view output_type, std::string_view input_types) {
    output_type = trim(output_type);
    if (output_type == k_any_type) {
        return true;
    }

    std::size_t start = 0;
    while (start <= input_types.size()) {
        auto comma = input_types.find(',', start);
        auto end = comma == std::string_view::npos ? input_types.size() : comma;
        auto accepted = trim(input_types.substr(start, end - start));

        if (accepted == k_any_type || accepted == output_type) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return false;
}

std::string type_shorthand(std::string_view type) {
    for (const auto& [full, tag] : k_shorthands) {
        if (full == type) {
            return std::string(tag);
        }
    }
    return std::string(type);
}

std::string expand_type_shorthand(std::string_view tag) {
    for (const auto& [full, short_tag] : k_shorthands) {
        if (short_tag == tag) {
            return std::string(full);
        }
    }
    return std::string(tag);
}

std::optional<WidgetKind> widget_kind_from_type(std::string_view type) noexcept {
    if (type == "INT") return WidgetKind::Int;
    if (type == "FLOAT") return WidgetKind::Float;
    if (type == "STRING") return WidgetKind::String;
    if (type == "BOOLEAN") return WidgetKind::Bool;
    return std::nullopt;
}

} // namespace bridge_catalog
