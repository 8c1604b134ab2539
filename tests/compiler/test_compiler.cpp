// bridge_compiler Compiler tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bridge_engine/compiler/compiler.hpp>
#include <bridge_engine/compiler/virtual_graph.hpp>
#include <bridge_engine/executor/executor.hpp>

#include "../support/fixtures.hpp"

#include <string>
#include <vector>

using namespace bridge_compiler;
using bridge_catalog::Value;
using bridge_core::CompileError;
using bridge_core::Rule;
using bridge_ops::AddNode;
using bridge_ops::Connect;
using bridge_ops::Operation;
using bridge_ops::RemoveNode;
using bridge_ops::SetWidget;
using bridge_test::test_catalog;
using bridge_test::txt2img_graph;

namespace {

CompileOutput compile_ok(const char* brief, const bridge_graph::WorkflowGraph& graph) {
    auto compiled = compile_brief(nlohmann::json::parse(brief), graph, test_catalog());
    if (compiled.is_err()) {
        FAIL(bridge_core::build_error_chain(compiled.error()));
    }
    return std::move(compiled).value();
}

CompileError compile_err(const char* brief, const bridge_graph::WorkflowGraph& graph) {
    auto compiled = compile_brief(nlohmann::json::parse(brief), graph, test_catalog());
    REQUIRE(compiled.is_err());
    const auto* err = compiled.error().as<CompileError>();
    REQUIRE(err != nullptr);
    return *err;
}

/// Fixture graph with the prompt titles stripped
bridge_graph::WorkflowGraph untitled_graph() {
    auto graph = txt2img_graph();
    graph.find_node(2)->metadata = nlohmann::json::object();
    graph.find_node(3)->metadata = nlohmann::json::object();
    return graph;
}

} // namespace

// =============================================================================
// Successful Compilation
// =============================================================================

TEST_CASE("Compile a brief that adds and rewires", "[compiler][compile]") {
    const auto graph = txt2img_graph();
    auto output = compile_ok(R"({
        "plan_summary": "Preview the decoded image and sample longer",
        "nodes_to_add": [{
            "placeholder_id": "NODE_1", "type": "PreviewImage",
            "inputs": [{"input_name": "images", "from": {"node": "EXISTING_6", "output_name": "IMAGE"}}]
        }],
        "nodes_to_update": [
            {"target": "title:Positive", "widgets": {"text": "a cat in a hat"}},
            {"target": 5, "widgets": {"steps": 30}}
        ]
    })", graph);

    const auto& ops = output.operations;
    REQUIRE(ops.size() == 4);
    REQUIRE(ops[0] == Operation(AddNode{8, "PreviewImage", {}, nlohmann::json::object()}));
    REQUIRE(ops[1] == Operation(SetWidget{2, "text", Value("a cat in a hat")}));
    REQUIRE(ops[2] == Operation(SetWidget{5, "steps", Value(30)}));
    REQUIRE(ops[3] == Operation(Connect{{6, 0, 8, 0}}));

    SECTION("caller's graph is untouched") {
        REQUIRE(graph == txt2img_graph());
    }

    SECTION("summary") {
        using Catch::Matchers::ContainsSubstring;
        using Catch::Matchers::StartsWith;
        REQUIRE_THAT(output.summary, StartsWith("Preview the decoded image and sample longer\n"));
        REQUIRE_THAT(output.summary, ContainsSubstring("4 operations: 1 add, 0 remove, 2 set, 1 connect, 0 disconnect"));
        REQUIRE_THAT(output.summary, ContainsSubstring("    0  add_node 8 PreviewImage\n"));
        REQUIRE_THAT(output.summary, ContainsSubstring("    3  connect 6.0->8.0\n"));
    }

    SECTION("the list executes against the same graph") {
        auto executed = bridge_exec::execute(ops, graph, test_catalog());
        REQUIRE(executed.is_ok());
        REQUIRE(executed->has_link({6, 0, 8, 0}));
        REQUIRE(executed->find_node(2)->widgets.at("text") == Value("a cat in a hat"));
    }
}

TEST_CASE("Compile emission order and ids", "[compiler][compile]") {
    const auto graph = txt2img_graph();

    SECTION("removals, disconnects, additions, updates, connects") {
        auto output = compile_ok(R"({
            "connect": [{"from": {"node": 6}, "to": {"node": "NODE_1"}}],
            "nodes_to_update": [{"target": 4, "widgets": {"batch_size": 2}}],
            "nodes_to_add": [{"placeholder_id": "NODE_1", "type": "PreviewImage"}],
            "disconnect": [{"from": {"node": 1, "slot": 2}, "to": {"node": 6, "slot": 1}}],
            "nodes_to_delete": ["EXISTING_7"]
        })", graph);

        const auto& ops = output.operations;
        REQUIRE(ops.size() == 5);
        REQUIRE(ops[0] == Operation(RemoveNode{7}));
        REQUIRE(ops[1].is<bridge_ops::Disconnect>());
        REQUIRE(ops[2].as<AddNode>().id == 8);
        REQUIRE(ops[3] == Operation(SetWidget{4, "batch_size", Value(2)}));
        REQUIRE(ops[4] == Operation(Connect{{6, 0, 8, 0}}));
    }

    SECTION("explicit ids are kept out of placeholder allocation") {
        auto output = compile_ok(R"({"nodes_to_add": [
            {"placeholder_id": "NODE_1", "type": "PreviewImage"},
            {"id": 8, "type": "PreviewImage"}
        ]})", graph);

        REQUIRE(output.operations[0].as<AddNode>().id == 9);
        REQUIRE(output.operations[1].as<AddNode>().id == 8);
    }

    SECTION("forward references between new nodes") {
        auto output = compile_ok(R"({"nodes_to_add": [
            {"placeholder_id": "NODE_A", "type": "VAEDecode", "inputs": [
                {"input_name": "samples", "from": {"node": "EXISTING_5"}},
                {"input_name": "vae", "from": {"node": "NODE_B", "output_name": "VAE"}}
            ]},
            {"placeholder_id": "NODE_B", "type": "CheckpointLoaderSimple",
             "widgets": {"ckpt_name": "sd_xl_base_1.0.safetensors"}}
        ]})", graph);

        const auto& ops = output.operations;
        REQUIRE(ops.size() == 4);
        REQUIRE(ops[0].as<AddNode>().id == 8);
        REQUIRE(ops[1].as<AddNode>().id == 9);
        REQUIRE(ops[1].as<AddNode>().widgets.at("ckpt_name") == Value("sd_xl_base_1.0.safetensors"));
        REQUIRE(ops[2] == Operation(Connect{{5, 0, 8, 0}}));
        REQUIRE(ops[3] == Operation(Connect{{9, 2, 8, 1}}));
    }

    SECTION("outputs fan out to existing inputs") {
        auto output = compile_ok(R"({
            "nodes_to_delete": [6],
            "nodes_to_add": [{"placeholder_id": "NODE_1", "type": "VAEDecode", "title": "Decode",
                "inputs": [{"slot": 0, "from": {"node": 5}}, {"slot": 1, "from": {"node": 1, "slot": 2}}],
                "outputs": [{"output_name": "IMAGE", "to": [{"node": 7, "input_name": "images"}]}]}]
        })", graph);

        const auto& ops = output.operations;
        REQUIRE(ops.size() == 5);
        REQUIRE(ops[1].as<AddNode>().metadata["title"] == "Decode");
        REQUIRE(ops[4] == Operation(Connect{{8, 0, 7, 0}}));
    }

    SECTION("new nodes are found by title") {
        auto output = compile_ok(R"({
            "nodes_to_add": [{"type": "PreviewImage", "title": "Check"}],
            "connect": [{"from": {"node": 6}, "to": {"node": {"title": "Check"}}}]
        })", graph);
        REQUIRE(output.operations[1] == Operation(Connect{{6, 0, 8, 0}}));
    }

    SECTION("duplicate connects are emitted once") {
        auto output = compile_ok(R"({
            "nodes_to_add": [{"placeholder_id": "NODE_1", "type": "PreviewImage",
                "inputs": [{"slot": 0, "from": {"node": 6}}]}],
            "connect": [{"from": {"node": 6}, "to": {"node": "NODE_1"}}]
        })", graph);
        REQUIRE(output.operations.size() == 2);
    }

    SECTION("widgets as a positional array") {
        auto output = compile_ok(R"({"nodes_to_add": [{"type": "EmptyLatentImage", "widgets": [768, 1024]}]})", graph);
        const auto& widgets = output.operations[0].as<AddNode>().widgets;
        REQUIRE(widgets.at("width") == Value(768));
        REQUIRE(widgets.at("height") == Value(1024));
        REQUIRE(widgets.at("batch_size") == Value(1));
    }

    SECTION("brief text with a fence") {
        auto compiled = compile("Plan:\n```json\n{\"nodes_to_delete\": [7]}\n```\n", graph, test_catalog());
        REQUIRE(compiled.is_ok());
        REQUIRE(compiled->operations.size() == 1);
    }
}

// =============================================================================
// Rejections
// =============================================================================

TEST_CASE("Compile rejects invalid briefs", "[compiler][compile]") {
    const auto graph = txt2img_graph();

    SECTION("unknown class") {
        auto err = compile_err(R"({"nodes_to_add": [{"placeholder_id": "NODE_1", "type": "LatentUpscale"}]})", graph);
        REQUIRE(err.rule == Rule::UnknownClass);
        REQUIRE(err.location == "nodes_to_add[0].type");
        REQUIRE_FALSE(err.operation_index.has_value());
    }

    SECTION("slot out of range") {
        auto err = compile_err(R"({"connect": [{"from": {"node": 5, "slot": 3}, "to": {"node": 6, "slot": 0}}]})", graph);
        REQUIRE(err.rule == Rule::SlotOutOfRange);
        REQUIRE(err.location == "connect[0].from");
        REQUIRE(err.operation_index == std::size_t{0});
    }

    SECTION("input already occupied") {
        auto err = compile_err(R"({
            "nodes_to_delete": [7],
            "connect": [{"from": {"node": 4}, "to": {"node": 6, "input_name": "samples"}}]
        })", graph);
        REQUIRE(err.rule == Rule::InputOccupied);
        REQUIRE(err.operation_index == std::size_t{1});
    }

    SECTION("ambiguous title") {
        auto err = compile_err(R"({"nodes_to_update": [
            {"target": "title:CLIP Text Encode (Prompt)", "widgets": {"text": "x"}}]})", untitled_graph());
        REQUIRE(err.rule == Rule::AmbiguousReference);
        REQUIRE(err.location == "nodes_to_update[0].target");
    }

    SECTION("unresolved references") {
        REQUIRE(compile_err(R"({"nodes_to_delete": [{"title": "Upscaler"}]})", graph).rule == Rule::UnresolvedReference);
        REQUIRE(compile_err(R"({"nodes_to_delete": ["NODE_9"]})", graph).rule == Rule::UnresolvedReference);
        REQUIRE(compile_err(R"({"connect": [{"from": {"node": 1, "output_name": "LATENT"}, "to": {"node": 5}}]})",
            graph).rule == Rule::UnresolvedReference);
    }

    SECTION("widget used as a link input") {
        auto err = compile_err(R"({"connect": [{"from": {"node": 1}, "to": {"node": 2, "input_name": "text"}}]})", graph);
        REQUIRE(err.rule == Rule::UnresolvedReference);
        REQUIRE(err.location == "connect[0].to");
    }

    SECTION("missing required widget") {
        auto err = compile_err(R"({"nodes_to_add": [{"type": "CLIPTextEncode"}]})", graph);
        REQUIRE(err.rule == Rule::MissingWidget);
        REQUIRE(err.location == "nodes_to_add[0].widgets.text");
        REQUIRE(err.operation_index == std::size_t{0});
    }

    SECTION("widget outside its range") {
        auto err = compile_err(R"({"nodes_to_update": [{"target": 5, "widgets": {"denoise": 1.5}}]})", graph);
        REQUIRE(err.rule == Rule::WidgetConstraint);
        REQUIRE(err.location == "nodes_to_update[0].widgets.denoise");
    }

    SECTION("update with a null value") {
        auto err = compile_err(R"({"nodes_to_update": [{"target": 5, "widgets": {"steps": null}}]})", graph);
        REQUIRE(err.rule == Rule::MissingWidget);
        REQUIRE(err.location == "nodes_to_update[0].widgets.steps");

        err = compile_err(R"({"nodes_to_update": [{"target": 4, "widgets": [512, null]}]})", graph);
        REQUIRE(err.rule == Rule::MissingWidget);
        REQUIRE(err.location == "nodes_to_update[0].widgets[1]");
    }

    SECTION("update that names no widgets") {
        auto err = compile_err(R"({"nodes_to_update": [{"target": 5}]})", graph);
        REQUIRE(err.rule == Rule::Malformed);
        REQUIRE(err.location == "nodes_to_update[0].widgets");

        err = compile_err(R"({"nodes_to_update": [{"target": 5, "widgets": {}}]})", graph);
        REQUIRE(err.rule == Rule::Malformed);

        err = compile_err(R"({"nodes_to_delete": [7], "nodes_to_update": [{"target": 5, "widgets": null}]})", graph);
        REQUIRE(err.rule == Rule::Malformed);
        REQUIRE_FALSE(err.operation_index.has_value());
    }

    SECTION("explicit id already in use") {
        auto err = compile_err(R"({"nodes_to_add": [{"id": 5, "type": "PreviewImage"}]})", graph);
        REQUIRE(err.rule == Rule::DuplicateNode);
        REQUIRE(err.location == "nodes_to_add[0].id");
    }

    SECTION("placeholder declared twice") {
        auto err = compile_err(R"({"nodes_to_add": [
            {"placeholder_id": "NODE_1", "type": "PreviewImage"},
            {"placeholder_id": "NODE_1", "type": "PreviewImage"}]})", graph);
        REQUIRE(err.rule == Rule::DuplicateNode);
    }

    SECTION("too many positional widgets") {
        auto err = compile_err(R"({"nodes_to_add": [{"type": "EmptyLatentImage", "widgets": [1, 2, 3, 4]}]})", graph);
        REQUIRE(err.rule == Rule::Malformed);
    }

    SECTION("empty plan") {
        REQUIRE(compile_err(R"({"plan_summary": "nothing to do"})", graph).rule == Rule::EmptyPlan);
        REQUIRE(compile_err(R"({"nodes_to_add": [], "connect": null})", graph).rule == Rule::EmptyPlan);
    }

    SECTION("section of the wrong shape") {
        auto err = compile_err(R"({"connect": {"from": 1}})", graph);
        REQUIRE(err.rule == Rule::Malformed);
        REQUIRE(err.location == "connect");
    }

    SECTION("caller's graph is untouched after a rejection") {
        auto copy = graph;
        auto compiled = compile_brief(nlohmann::json::parse(R"({
            "nodes_to_delete": [7], "nodes_to_add": [{"type": "Nope"}]})"), copy, test_catalog());
        REQUIRE(compiled.is_err());
        REQUIRE(copy == graph);
    }
}

// =============================================================================
// VirtualGraph
// =============================================================================

TEST_CASE("VirtualGraph", "[compiler][virtual]") {
    const auto graph = untitled_graph();
    VirtualGraph virt(graph, test_catalog());

    SECTION("effective titles") {
        REQUIRE(virt.effective_title(*graph.find_node(2)) == "CLIP Text Encode (Prompt)");
        REQUIRE(virt.effective_title(*txt2img_graph().find_node(2)) == "Positive");
        REQUIRE(virt.find_by_title("CLIP Text Encode (Prompt)").size() == 2);
        REQUIRE(virt.find_by_title("VAE Decode") == std::vector<bridge_graph::NodeId>{6});
    }

    SECTION("allocation skips reserved ids") {
        virt.reserve_id(8);
        REQUIRE(virt.allocate_id() == 9);
        REQUIRE(virt.allocate_id() == 10);
        REQUIRE(virt.is_reserved(9));
    }

    SECTION("apply changes only the virtual state") {
        REQUIRE(virt.apply(RemoveNode{7}).is_ok());
        REQUIRE_FALSE(virt.state().has_node(7));
        REQUIRE(graph.has_node(7));
    }
}
