// bridge_core Config tests

#include <catch2/catch_test_macros.hpp>
#include <bridge_engine/core/config.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace bridge_core;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

// =============================================================================
// ConfigLayer Tests
// =============================================================================

TEST_CASE("ConfigLayer basics", "[core][config]") {
    ConfigLayer layer("test");

    SECTION("set and get") {
        layer.set("log.level", ConfigValue{std::string("debug")});
        REQUIRE(layer.contains("log.level"));
        auto value = layer.get("log.level");
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::string>(*value) == "debug");
    }

    SECTION("remove and clear") {
        layer.set("a", ConfigValue{true});
        layer.set("b", ConfigValue{std::int64_t{3}});
        REQUIRE(layer.size() == 2);
        REQUIRE(layer.remove("a"));
        REQUIRE_FALSE(layer.remove("a"));
        layer.clear();
        REQUIRE(layer.empty());
    }
}

// =============================================================================
// ConfigManager Tests
// =============================================================================

TEST_CASE("ConfigManager layering", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("defaults") {
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
        REQUIRE(config.get_bool(config_keys::CODEC_INCLUDE_METADATA));
        REQUIRE_FALSE(config.get_bool(config_keys::LOG_FILE, true));
    }

    SECTION("command line wins over file and defaults") {
        config.set(config_keys::LOG_LEVEL, ConfigValue{std::string("warn")});
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "warn");

        std::vector<std::string> args = {"--log.level=debug"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
    }

    SECTION("missing keys fall back") {
        REQUIRE(config.get_int("nope", 5) == 5);
        REQUIRE(config.get_string("nope", "x") == "x");
    }
}

TEST_CASE("ConfigManager parse_args", "[core][config]") {
    ConfigManager config;

    SECTION("positionals are kept in order") {
        std::vector<std::string> args = {"compile", "--catalog.path=info.json", "brief.md", "graph.bz"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.positional() == std::vector<std::string>{"compile", "brief.md", "graph.bz"});
        REQUIRE(config.get_string(config_keys::CATALOG_PATH) == "info.json");
    }

    SECTION("dashed option names map to keys") {
        std::vector<std::string> args = {"--log-level=trace", "--codec-include-metadata=false",
                                         "--output.pretty=false"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "trace");
        REQUIRE_FALSE(config.get_bool(config_keys::CODEC_INCLUDE_METADATA, true));
        REQUIRE_FALSE(config.get_bool(config_keys::OUTPUT_PRETTY, true));
    }

    SECTION("dotted option with dashes") {
        std::vector<std::string> args = {"--codec.include-metadata=false"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.contains(config_keys::CODEC_INCLUDE_METADATA));
        REQUIRE_FALSE(config.get_bool(config_keys::CODEC_INCLUDE_METADATA, true));
    }

    SECTION("bare flag is true") {
        std::vector<std::string> args = {"--log.file"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.get_bool(config_keys::LOG_FILE));
    }

    SECTION("values are typed") {
        std::vector<std::string> args = {"--limits.depth=12", "--limits.ratio=0.5"};
        REQUIRE(config.parse_args(args).is_ok());
        REQUIRE(config.get_int("limits.depth") == 12);
        REQUIRE(config.get_float("limits.ratio") == 0.5);
    }

    SECTION("unknown short option") {
        std::vector<std::string> args = {"-x"};
        auto result = config.parse_args(args);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConfigManager files", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("TOML tables become dotted keys") {
        auto path = write_temp("bridge_config_test.toml",
            "[log]\nlevel = \"warn\"\n\n[catalog]\npath = \"/data/object_info.json\"\n");
        REQUIRE(config.load_file(path).is_ok());
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "warn");
        REQUIRE(config.get_string(config_keys::CATALOG_PATH) == "/data/object_info.json");
        std::filesystem::remove(path);
    }

    SECTION("JSON objects become dotted keys") {
        auto path = write_temp("bridge_config_test.json", R"({"codec": {"include_metadata": false}})");
        REQUIRE(config.load_file(path).is_ok());
        REQUIRE_FALSE(config.get_bool(config_keys::CODEC_INCLUDE_METADATA, true));
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        auto result = config.load_file("/nonexistent/bridge.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("unsupported extension") {
        auto path = write_temp("bridge_config_test.ini", "a=b\n");
        auto result = config.load_file(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        std::filesystem::remove(path);
    }
}

TEST_CASE("BridgeConfig resolution", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    std::vector<std::string> args = {"--log.level=debug", "--catalog.path=info.json", "--output.pretty=false"};
    REQUIRE(config.parse_args(args).is_ok());

    auto settings = config.build_bridge_config();
    REQUIRE(settings.log_level == spdlog::level::debug);
    REQUIRE(settings.catalog_path == "info.json");
    REQUIRE_FALSE(settings.pretty_output);
    REQUIRE(settings.include_metadata);
}
