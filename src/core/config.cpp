/// @file config.cpp
/// @brief Configuration system implementation for bridge_core

#include <bridge_engine/core/config.hpp>
#include <bridge_engine/core/log.hpp>

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace bridge_core {

namespace {

/// Infer a typed value from command-line or environment text
ConfigValue infer_value(const std::string& value) {
    if (value == "true" || value == "false") {
        return ConfigValue{value == "true"};
    }

    if (!value.empty()) {
        try {
            std::size_t pos = 0;
            std::int64_t int_val = std::stoll(value, &pos);
            if (pos == value.size()) {
                return ConfigValue{int_val};
            }
        } catch (const std::logic_error&) {
            // Not an integer (invalid_argument / out_of_range)
        }

        try {
            std::size_t pos = 0;
            double float_val = std::stod(value, &pos);
            if (pos == value.size()) {
                return ConfigValue{float_val};
            }
        } catch (const std::logic_error&) {
            // Not a number
        }
    }

    return ConfigValue{value};
}

void flatten_json(const nlohmann::json& node, const std::string& prefix, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            flatten_json(value, key, layer);
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            layer.set(key, ConfigValue{std::move(items)});
        }
    }
}

void flatten_toml(const toml::table& table, const std::string& prefix, ConfigLayer& layer) {
    for (auto&& [k, node] : table) {
        std::string name(k.str());
        std::string key = prefix.empty() ? name : prefix + "." + name;

        if (auto* sub = node.as_table()) {
            flatten_toml(*sub, key, layer);
        } else if (auto* b = node.as_boolean()) {
            layer.set(key, ConfigValue{b->get()});
        } else if (auto* i = node.as_integer()) {
            layer.set(key, ConfigValue{static_cast<std::int64_t>(i->get())});
        } else if (auto* f = node.as_floating_point()) {
            layer.set(key, ConfigValue{f->get()});
        } else if (auto* s = node.as_string()) {
            layer.set(key, ConfigValue{s->get()});
        } else if (auto* arr = node.as_array()) {
            std::vector<std::string> items;
            for (auto& item : *arr) {
                if (auto str = item.value<std::string>()) {
                    items.push_back(*str);
                }
            }
            layer.set(key, ConfigValue{std::move(items)});
        }
    }
}

/// Option name to config key: "log-level" -> "log.level",
/// "codec-include-metadata" -> "codec.include_metadata",
/// "codec.include-metadata" -> "codec.include_metadata"
std::string option_to_key(std::string option) {
    bool has_dot = option.find('.') != std::string::npos;
    for (auto& c : option) {
        if (c != '-') continue;
        if (!has_dot) {
            c = '.';
            has_dot = true;
        } else {
            c = '_';
        }
    }
    return option;
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    // Try to parse from string
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    // Try from int
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = infer_value(*v);
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return *i;
        }
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = infer_value(*v);
        if (auto* d = std::get_if<double>(&parsed)) {
            return *d;
        }
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return static_cast<double>(*i);
        }
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else {
            std::string joined;
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) joined += ",";
                joined += arg[i];
            }
            return joined;
        }
    }, *value);
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::File);
    layer->set(key, std::move(value));
}

// =============================================================================
// File Operations
// =============================================================================

Result<void> ConfigManager::load_json(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::IOError, "Failed to open config file: " + path.string()};
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::ParseError,
            "Invalid JSON in " + path.string() + ": " + e.what()};
    }

    if (!doc.is_object()) {
        return Error{ErrorCode::ParseError, "Config root must be an object: " + path.string()};
    }

    ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::File);
    flatten_json(doc, "", *layer);

    cli_logger()->debug("Loaded {} config keys from {}", layer->size(), path.string());
    return Ok();
}

Result<void> ConfigManager::load_toml(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    toml::table table;
    try {
        table = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Invalid TOML in " << path.string() << ": " << e.description()
            << " (line " << e.source().begin.line << ")";
        return Error{ErrorCode::ParseError, oss.str()};
    }

    ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::File);
    flatten_toml(table, "", *layer);

    cli_logger()->debug("Loaded {} config keys from {}", layer->size(), path.string());
    return Ok();
}

Result<void> ConfigManager::load_file(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }

    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".toml") {
        return load_toml(path, layer_name);
    }
    if (ext == ".json") {
        return load_json(path, layer_name);
    }
    return Error{ErrorCode::InvalidArgument, "Unsupported config format: " + ext};
}

// =============================================================================
// Command Line
// =============================================================================

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    ConfigLayer* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    m_positional.clear();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        // Handle --key=value or --key value
        if (arg.starts_with("--")) {
            std::string key_value = arg.substr(2);
            if (key_value.empty()) {
                return Error{ErrorCode::InvalidArgument, "Empty option name"};
            }
            auto eq_pos = key_value.find('=');

            std::string key;
            std::string value;

            if (eq_pos != std::string::npos) {
                // --key=value format
                key = key_value.substr(0, eq_pos);
                value = key_value.substr(eq_pos + 1);
            } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
                // --key value format
                key = key_value;
                value = args[++i];
            } else {
                // --flag format (boolean true)
                key = key_value;
                value = "true";
            }

            layer->set(option_to_key(key), infer_value(value));
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return Error{ErrorCode::InvalidArgument, "Unknown option: " + arg};
        } else {
            m_positional.push_back(arg);
        }
    }

    return Ok();
}

// =============================================================================
// Environment
// =============================================================================

void ConfigManager::load_environment() {
    ConfigLayer* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"BRIDGE_LOG_LEVEL", config_keys::LOG_LEVEL},
        {"BRIDGE_LOG_DIR", config_keys::LOG_DIRECTORY},
        {"BRIDGE_CATALOG", config_keys::CATALOG_PATH},
    };

    for (const auto& [env_name, config_key] : env_mappings) {
        const char* env_value = std::getenv(env_name.c_str());
        if (env_value != nullptr && *env_value != '\0') {
            layer->set(config_key, infer_value(env_value));
        }
    }
}

// =============================================================================
// Defaults
// =============================================================================

void ConfigManager::setup_defaults() {
    ConfigLayer* layer = find_or_create_layer("defaults", ConfigLayerPriority::Default);

    layer->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    layer->set(config_keys::LOG_FILE, ConfigValue{false});
    layer->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});
    layer->set(config_keys::CATALOG_PATH, ConfigValue{std::string("object_info.json")});
    layer->set(config_keys::CODEC_INCLUDE_METADATA, ConfigValue{true});
    layer->set(config_keys::OUTPUT_PRETTY, ConfigValue{true});
}

BridgeConfig ConfigManager::build_bridge_config() const {
    BridgeConfig config;

    auto level_name = get_string(config_keys::LOG_LEVEL, "info");
    if (auto level = parse_log_level(level_name)) {
        config.log_level = *level;
    } else {
        cli_logger()->warn("Unknown log level '{}', using info", level_name);
    }

    config.log_to_file = get_bool(config_keys::LOG_FILE, false);
    config.log_directory = get_string(config_keys::LOG_DIRECTORY, "logs");
    config.catalog_path = get_string(config_keys::CATALOG_PATH, "");
    config.include_metadata = get_bool(config_keys::CODEC_INCLUDE_METADATA, true);
    config.pretty_output = get_bool(config_keys::OUTPUT_PRETTY, true);

    return config;
}

// =============================================================================
// Internal
// =============================================================================

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Sort by priority (lower value = higher priority)
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

} // namespace bridge_core
