/// @file config.hpp
/// @brief Configuration system for bridge_engine
///
/// Provides layered configuration with:
/// - Default values
/// - Configuration file loading (TOML, JSON)
/// - Environment variables
/// - Command-line argument parsing

#pragma once

#include "fwd.hpp"
#include "error.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bridge_core {

/// Configuration value
using ConfigValue = std::variant<bool, std::int64_t, double, std::string, std::vector<std::string>>;

// =============================================================================
// Config Keys
// =============================================================================

namespace config_keys {
    inline constexpr const char* LOG_LEVEL = "log.level";
    inline constexpr const char* LOG_FILE = "log.file";
    inline constexpr const char* LOG_DIRECTORY = "log.directory";
    inline constexpr const char* CATALOG_PATH = "catalog.path";
    inline constexpr const char* CODEC_INCLUDE_METADATA = "codec.include_metadata";
    inline constexpr const char* OUTPUT_PRETTY = "output.pretty";
    inline constexpr const char* CONFIG_FILE = "config";
} // namespace config_keys

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    File = 0,               ///< Configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::File)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    /// Get all keys
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Resolved Settings
// =============================================================================

/// Settings the command-line front end runs with
struct BridgeConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool log_to_file = false;
    std::string log_directory = "logs";
    std::string catalog_path;
    bool include_metadata = true;
    bool pretty_output = true;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value (from highest priority layer that contains it)
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in specific layer (created on demand)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "file");

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load configuration from JSON file; nested objects become dotted keys
    Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name = "file");

    /// Load configuration from TOML file; nested tables become dotted keys
    Result<void> load_toml(const std::filesystem::path& path, const std::string& layer_name = "file");

    /// Load by extension (.toml or .json)
    Result<void> load_file(const std::filesystem::path& path, const std::string& layer_name = "file");

    // =========================================================================
    // Command Line
    // =========================================================================

    /// Parse command-line arguments (argv[0] skipped)
    Result<void> parse_args(int argc, char** argv);

    /// Parse command-line arguments from vector
    Result<void> parse_args(const std::vector<std::string>& args);

    /// Arguments that were not options, in order
    [[nodiscard]] const std::vector<std::string>& positional() const { return m_positional; }

    // =========================================================================
    // Environment
    // =========================================================================

    /// Load BRIDGE_* environment variables
    void load_environment();

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create layers and fill built-in defaults
    void setup_defaults();

    /// Resolve the merged view into settings
    [[nodiscard]] BridgeConfig build_bridge_config() const;

private:
    [[nodiscard]] ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    std::vector<std::string> m_positional;
    mutable std::mutex m_mutex;
};

} // namespace bridge_core
