/// @file main.cpp
/// @brief bridge_cli entry point
///
/// Commands:
/// - encode   native workflow JSON -> compact text
/// - decode   compact text -> native workflow JSON
/// - filter   compact text -> compact text restricted to selected nodes
/// - compile  graph + brief -> operation list document
/// - execute  graph + operation list -> graph
/// - apply    graph + brief -> graph (compile, then execute)
///
/// Graph inputs may be either form; the form is detected from the text and
/// results are written back in the same form.

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/codec/compact.hpp>
#include <bridge_engine/codec/workflow_json.hpp>
#include <bridge_engine/compiler/compiler.hpp>
#include <bridge_engine/core/config.hpp>
#include <bridge_engine/core/log.hpp>
#include <bridge_engine/executor/executor.hpp>
#include <bridge_engine/ops/document.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// =============================================================================
// Files and Forms
// =============================================================================

bridge_core::Result<std::string> read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return bridge_core::Err<std::string>(
            bridge_core::Error(bridge_core::ErrorCode::IOError, "Cannot open " + path.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

bool is_compact(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    return start != std::string::npos && text.compare(start, 3, "BZ|") == 0;
}

/// Graph loaded from either form, remembering which one
struct LoadedGraph {
    bridge_graph::WorkflowGraph graph;
    bool compact = false;
};

bridge_core::Result<LoadedGraph> load_graph(const fs::path& path, const bridge_catalog::Catalog& catalog) {
    auto text = read_text(path);
    if (!text) {
        return bridge_core::Err<LoadedGraph>(text.error());
    }

    bool compact = is_compact(*text);
    auto graph = compact ? bridge_codec::decode(*text, catalog) : bridge_codec::parse_workflow(*text, catalog);
    if (!graph) {
        auto err = graph.error();
        err.with_context("file", path.string());
        return bridge_core::Err<LoadedGraph>(std::move(err));
    }
    return LoadedGraph{std::move(graph).value(), compact};
}

bridge_core::Result<std::string> render_graph(
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    bool compact,
    const bridge_core::BridgeConfig& settings)
{
    if (compact) {
        bridge_codec::EncodeOptions options;
        options.include_metadata = settings.include_metadata;
        return bridge_codec::encode(graph, catalog, options);
    }

    auto doc = bridge_codec::export_workflow(graph, catalog);
    if (!doc) {
        return bridge_core::Err<std::string>(doc.error());
    }
    return doc->dump(settings.pretty_output ? 2 : -1) + "\n";
}

// =============================================================================
// Commands
// =============================================================================

using Args = std::vector<std::string>;

struct Context {
    const bridge_core::BridgeConfig& settings;
    const Args& args;  // Positional arguments after the command name
};

bridge_core::Result<bridge_catalog::Catalog> load_catalog(const bridge_core::BridgeConfig& settings) {
    if (settings.catalog_path.empty()) {
        return bridge_core::Err<bridge_catalog::Catalog>(
            bridge_core::Error(bridge_core::ErrorCode::InvalidArgument, "No catalog configured (--catalog.path)"));
    }
    return bridge_catalog::Catalog::load_file(settings.catalog_path);
}

bridge_core::Result<std::string> cmd_encode(const Context& ctx) {
    auto catalog = load_catalog(ctx.settings);
    if (!catalog) return bridge_core::Err<std::string>(catalog.error());

    auto text = read_text(ctx.args[0]);
    if (!text) return bridge_core::Err<std::string>(text.error());

    auto graph = bridge_codec::parse_workflow(*text, *catalog);
    if (!graph) return bridge_core::Err<std::string>(graph.error());

    return render_graph(*graph, *catalog, true, ctx.settings);
}

bridge_core::Result<std::string> cmd_decode(const Context& ctx) {
    auto catalog = load_catalog(ctx.settings);
    if (!catalog) return bridge_core::Err<std::string>(catalog.error());

    auto text = read_text(ctx.args[0]);
    if (!text) return bridge_core::Err<std::string>(text.error());

    auto graph = bridge_codec::decode(*text, *catalog);
    if (!graph) return bridge_core::Err<std::string>(graph.error());

    return render_graph(*graph, *catalog, false, ctx.settings);
}

bridge_core::Result<std::string> cmd_filter(const Context& ctx) {
    auto text = read_text(ctx.args[0]);
    if (!text) return bridge_core::Err<std::string>(text.error());

    std::string selection;
    for (std::size_t i = 1; i < ctx.args.size(); ++i) {
        selection += ctx.args[i];
        selection += ' ';
    }
    return bridge_codec::filter(*text, bridge_codec::FilterSelectors::parse(selection));
}

bridge_core::Result<bridge_compiler::CompileOutput> compile_from(
    const Context& ctx,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog)
{
    auto brief = read_text(ctx.args[1]);
    if (!brief) return bridge_core::Err<bridge_compiler::CompileOutput>(brief.error());

    auto compiled = bridge_compiler::compile(*brief, graph, catalog);
    if (compiled) {
        std::istringstream lines(compiled->summary);
        for (std::string line; std::getline(lines, line);) {
            bridge_core::cli_logger()->info("{}", line);
        }
    }
    return compiled;
}

bridge_core::Result<std::string> cmd_compile(const Context& ctx) {
    auto catalog = load_catalog(ctx.settings);
    if (!catalog) return bridge_core::Err<std::string>(catalog.error());

    auto loaded = load_graph(ctx.args[0], *catalog);
    if (!loaded) return bridge_core::Err<std::string>(loaded.error());

    auto compiled = compile_from(ctx, loaded->graph, *catalog);
    if (!compiled) return bridge_core::Err<std::string>(compiled.error());

    return bridge_ops::to_json(compiled->operations).dump(ctx.settings.pretty_output ? 2 : -1) + "\n";
}

bridge_core::Result<std::string> cmd_execute(const Context& ctx) {
    auto catalog = load_catalog(ctx.settings);
    if (!catalog) return bridge_core::Err<std::string>(catalog.error());

    auto loaded = load_graph(ctx.args[0], *catalog);
    if (!loaded) return bridge_core::Err<std::string>(loaded.error());

    auto text = read_text(ctx.args[1]);
    if (!text) return bridge_core::Err<std::string>(text.error());

    auto operations = bridge_ops::parse_operation_list(*text);
    if (!operations) return bridge_core::Err<std::string>(operations.error());

    if (auto done = bridge_exec::execute_in_place(*operations, loaded->graph, *catalog); !done) {
        return bridge_core::Err<std::string>(done.error());
    }
    bridge_core::cli_logger()->info("Applied {} operations", operations->size());
    return render_graph(loaded->graph, *catalog, loaded->compact, ctx.settings);
}

bridge_core::Result<std::string> cmd_apply(const Context& ctx) {
    auto catalog = load_catalog(ctx.settings);
    if (!catalog) return bridge_core::Err<std::string>(catalog.error());

    auto loaded = load_graph(ctx.args[0], *catalog);
    if (!loaded) return bridge_core::Err<std::string>(loaded.error());

    auto compiled = compile_from(ctx, loaded->graph, *catalog);
    if (!compiled) return bridge_core::Err<std::string>(compiled.error());

    if (auto done = bridge_exec::execute_in_place(compiled->operations, loaded->graph, *catalog); !done) {
        return bridge_core::Err<std::string>(done.error());
    }
    return render_graph(loaded->graph, *catalog, loaded->compact, ctx.settings);
}

struct Command {
    const char* name;
    std::size_t min_args;
    const char* usage;
    bridge_core::Result<std::string> (*run)(const Context&);
};

constexpr Command k_commands[] = {
    {"encode", 1, "encode WORKFLOW.json", &cmd_encode},
    {"decode", 1, "decode GRAPH.bz", &cmd_decode},
    {"filter", 2, "filter GRAPH.bz SELECTOR...", &cmd_filter},
    {"compile", 2, "compile GRAPH BRIEF", &cmd_compile},
    {"execute", 2, "execute GRAPH OPLIST.json", &cmd_execute},
    {"apply", 2, "apply GRAPH BRIEF", &cmd_apply},
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " COMMAND [ARGS] [OPTIONS]\n"
              << "\n"
              << "Commands:\n";
    for (const auto& command : k_commands) {
        std::cerr << "  " << command.usage << "\n";
    }
    std::cerr << "\n"
              << "Options:\n"
              << "  --catalog.path=FILE            object_info catalog (env BRIDGE_CATALOG)\n"
              << "  --config=FILE                  settings file (.toml or .json)\n"
              << "  --log.level=LEVEL              trace, debug, info, warn, error, off\n"
              << "  --log.file=true                also log to rotating files\n"
              << "  --codec.include-metadata=false drop P: and M: from compact output\n"
              << "  --output.pretty=false          compact JSON output\n"
              << "  --help, -h                     show this help message\n"
              << "  --version                      show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " encode workflow.json --catalog.path=object_info.json\n"
              << "  " << program_name << " apply graph.bz brief.md > edited.bz\n";
}

void print_version() {
    std::cout << "bridge_cli 0.1.0\n"
              << "bridge_engine workflow codec and compiler\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            print_version();
            return 0;
        }
    }

    bridge_core::ConfigManager config;
    config.setup_defaults();

    if (auto parsed = config.parse_args(argc, argv); !parsed) {
        std::cerr << bridge_core::build_error_chain(parsed.error()) << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    config.load_environment();

    if (config.contains(bridge_core::config_keys::CONFIG_FILE)) {
        auto path = config.get_string(bridge_core::config_keys::CONFIG_FILE);
        if (auto loaded = config.load_file(path); !loaded) {
            std::cerr << bridge_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
    }

    auto settings = config.build_bridge_config();

    bridge_core::LogConfig log_config;
    log_config.file_enabled = settings.log_to_file;
    log_config.log_directory = settings.log_directory;
    log_config.level = settings.log_level;
    bridge_core::configure_logging(log_config);

    const auto& positional = config.positional();
    if (positional.empty()) {
        std::cerr << "Error: No command given.\n\n";
        print_usage(argv[0]);
        return 2;
    }

    const Command* command = nullptr;
    for (const auto& candidate : k_commands) {
        if (positional[0] == candidate.name) {
            command = &candidate;
        }
    }
    if (!command) {
        std::cerr << "Unknown command: " << positional[0] << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    Args args(positional.begin() + 1, positional.end());
    if (args.size() < command->min_args) {
        std::cerr << "Usage: " << argv[0] << " " << command->usage << "\n";
        return 2;
    }

    bridge_core::cli_logger()->debug("Running '{}' with catalog {}", command->name, settings.catalog_path);

    auto output = command->run(Context{settings, args});
    if (!output) {
        bridge_core::cli_logger()->error("{} failed", command->name);
        std::cerr << bridge_core::build_error_chain(output.error()) << "\n";
        return 1;
    }

    std::cout << *output;
    return 0;
}
