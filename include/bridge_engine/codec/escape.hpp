#pragma once

/// @file escape.hpp
/// @brief Token escaping and widget value text forms for the compact codec

#include <bridge_engine/catalog/types.hpp>
#include <bridge_engine/catalog/value.hpp>
#include <bridge_engine/core/error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace bridge_codec {

/// Token written for a widget without a value
inline constexpr std::string_view k_unset_token = "~";

/// Percent-escape the characters that delimit compact tokens:
/// `%` `;` `|` `~` newline and carriage return. A leading `[` is escaped
/// too so that a raw token starting with `[` is always a JSON array.
[[nodiscard]] std::string escape_token(std::string_view text);

/// Reverse escape_token; any %XX sequence is decoded
[[nodiscard]] bridge_core::Result<std::string> unescape_token(std::string_view token);

/// True when text is well-formed UTF-8 (no overlongs, surrogates or
/// code points above U+10FFFF)
[[nodiscard]] bool is_valid_utf8(std::string_view text);

/// Text form of a widget value
[[nodiscard]] std::string encode_widget_value(const bridge_catalog::Value& value);

/// Parse a widget token according to the declared kind.
/// Returns std::nullopt for the unset token.
[[nodiscard]] bridge_core::Result<std::optional<bridge_catalog::Value>> decode_widget_value(
    std::string_view token, bridge_catalog::WidgetKind kind);

} // namespace bridge_codec
