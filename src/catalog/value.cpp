/// @file value.cpp
/// @brief Value <-> JSON conversion for bridge_catalog

#include <bridge_engine/catalog/value.hpp>

#include <fmt/format.h>

#include <limits>

namespace bridge_catalog {

namespace {

template<typename Json>
bridge_core::Result<Value> convert(const Json& j) {
    if (j.is_null()) {
        return Value::null();
    }
    if (j.is_boolean()) {
        return Value(j.template get<bool>());
    }
    if (j.is_number_unsigned()) {
        auto u = j.template get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return bridge_core::Err<Value>("Integer out of range: " + j.dump());
        }
        return Value(static_cast<std::int64_t>(u));
    }
    if (j.is_number_integer()) {
        return Value(j.template get<std::int64_t>());
    }
    if (j.is_number_float()) {
        return Value(j.template get<double>());
    }
    if (j.is_string()) {
        return Value(j.template get<std::string>());
    }
    if (j.is_array()) {
        ValueArray items;
        items.reserve(j.size());
        for (const auto& item : j) {
            auto converted = convert(item);
            if (!converted) {
                return converted;
            }
            items.push_back(std::move(converted).value());
        }
        return Value(std::move(items));
    }
    return bridge_core::Err<Value>("Object is not a widget value: " + j.dump());
}

} // anonymous namespace

nlohmann::json to_json(const Value& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : v) {
                arr.push_back(to_json(item));
            }
            return arr;
        } else {
            return v;
        }
    }, value.variant());
}

bridge_core::Result<Value> value_from_json(const nlohmann::json& j) {
    return convert(j);
}

bridge_core::Result<Value> value_from_json(const nlohmann::ordered_json& j) {
    return convert(j);
}

std::string to_display_string(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else {
            return to_json(Value(v)).dump();
        }
    }, value.variant());
}

} // namespace bridge_catalog
