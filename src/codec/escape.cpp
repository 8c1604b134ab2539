/// @file escape.cpp
/// @brief Compact token escaping and widget value forms

#include <bridge_engine/codec/escape.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdint>

namespace bridge_codec {

using bridge_catalog::Value;
using bridge_catalog::WidgetKind;
using bridge_core::FormatError;
using bridge_core::Rule;

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bridge_core::Error bad_token(WidgetKind kind, std::string_view token) {
    return FormatError::violation(Rule::WidgetType,
        fmt::format("Cannot read \"{}\" as {}", token, bridge_catalog::widget_kind_name(kind)));
}

} // anonymous namespace

std::string escape_token(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
            case '%': out += "%25"; break;
            case ';': out += "%3B"; break;
            case '|': out += "%7C"; break;
            case '~': out += "%7E"; break;
            case '\n': out += "%0A"; break;
            case '\r': out += "%0D"; break;
            case '[':
                if (i == 0) {
                    out += "%5B";
                } else {
                    out += c;
                }
                break;
            default: out += c; break;
        }
    }
    return out;
}

bridge_core::Result<std::string> unescape_token(std::string_view token) {
    std::string out;
    out.reserve(token.size());

    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '%') {
            out += token[i];
            continue;
        }
        if (i + 2 >= token.size()) {
            return bridge_core::Err<std::string>(FormatError::malformed(
                fmt::format("truncated escape in \"{}\"", token)));
        }
        int hi = hex_digit(token[i + 1]);
        int lo = hex_digit(token[i + 2]);
        if (hi < 0 || lo < 0) {
            return bridge_core::Err<std::string>(FormatError::malformed(
                fmt::format("bad escape in \"{}\"", token)));
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return out;
}

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        std::uint32_t code = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (byte & 0x3F);
        }

        static constexpr std::uint32_t k_min_code[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code < k_min_code[length] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string encode_widget_value(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::string(k_unset_token);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            // Shortest representation that reads back to the same double
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return escape_token(v);
        } else {
            // JSON arrays keep their leading '['
            std::string json = bridge_catalog::to_json(Value(v)).dump();
            return "[" + escape_token(std::string_view(json).substr(1));
        }
    }, value.variant());
}

bridge_core::Result<std::optional<Value>> decode_widget_value(std::string_view token, WidgetKind kind) {
    using Decoded = std::optional<Value>;

    if (token == k_unset_token) {
        return Decoded{};
    }

    if (!token.empty() && token.front() == '[') {
        auto text = unescape_token(token);
        if (!text) {
            return bridge_core::Err<Decoded>(text.error());
        }
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(*text);
        } catch (const nlohmann::json::parse_error& e) {
            return bridge_core::Err<Decoded>(FormatError::violation(Rule::WidgetType,
                fmt::format("Array widget value is not JSON: {}", e.what())));
        }
        auto value = bridge_catalog::value_from_json(parsed);
        if (!value) {
            return bridge_core::Err<Decoded>(FormatError::violation(Rule::WidgetType, value.error().message()));
        }
        return Decoded{std::move(value).value()};
    }

    switch (kind) {
        case WidgetKind::Bool:
            if (token == "True") return Decoded{Value(true)};
            if (token == "False") return Decoded{Value(false)};
            return bridge_core::Err<Decoded>(bad_token(kind, token));

        case WidgetKind::Int: {
            std::int64_t v = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
            if (ec != std::errc{} || ptr != token.data() + token.size() || token.empty()) {
                return bridge_core::Err<Decoded>(bad_token(kind, token));
            }
            return Decoded{Value(v)};
        }

        case WidgetKind::Float: {
            double v = 0.0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
            if (ec != std::errc{} || ptr != token.data() + token.size() || token.empty()) {
                return bridge_core::Err<Decoded>(bad_token(kind, token));
            }
            return Decoded{Value(v)};
        }

        case WidgetKind::String:
        case WidgetKind::Combo: {
            auto text = unescape_token(token);
            if (!text) {
                return bridge_core::Err<Decoded>(text.error());
            }
            if (!is_valid_utf8(*text)) {
                return bridge_core::Err<Decoded>(FormatError::violation(Rule::WidgetType,
                    "String widget value is not valid UTF-8"));
            }
            return Decoded{Value(std::move(text).value())};
        }
    }

    return bridge_core::Err<Decoded>(bad_token(kind, token));
}

} // namespace bridge_codec
