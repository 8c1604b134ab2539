// bridge_exec Executor tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bridge_engine/executor/executor.hpp>
#include <bridge_engine/compiler/compiler.hpp>

#include "../support/fixtures.hpp"

using namespace bridge_exec;
using namespace bridge_ops;
using bridge_catalog::Value;
using bridge_core::ExecutionError;
using bridge_core::Rule;
using bridge_test::test_catalog;
using bridge_test::txt2img_graph;

namespace {

/// Five operations; the third connects MODEL into an IMAGE input
OperationList list_with_bad_third() {
    OperationList list;
    list.push(AddNode{8, "PreviewImage", {}, {}});
    list.push(Disconnect{{6, 0, 7, 0}});
    list.push(Connect{{1, 0, 8, 0}});
    list.push(RemoveNode{7});
    list.push(SetWidget{5, "steps", Value(30)});
    return list;
}

OperationList swap_save_for_preview() {
    OperationList list;
    list.push(RemoveNode{7});
    list.push(AddNode{8, "PreviewImage", {}, {}});
    list.push(Connect{{6, 0, 8, 0}});
    return list;
}

} // namespace

// =============================================================================
// execute
// =============================================================================

TEST_CASE("execute commits a valid list", "[executor][execute]") {
    const auto graph = txt2img_graph();
    auto result = execute(swap_save_for_preview(), graph, test_catalog());

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result->has_node(7));
    REQUIRE(result->find_node(8)->class_name == "PreviewImage");
    REQUIRE(result->has_link({6, 0, 8, 0}));
    REQUIRE(graph == txt2img_graph());
}

TEST_CASE("execute rejects at the first failing operation", "[executor][execute]") {
    const auto graph = txt2img_graph();
    auto result = execute(list_with_bad_third(), graph, test_catalog());

    REQUIRE(result.is_err());
    const auto* err = result.error().as<ExecutionError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->operation_index == 2);
    REQUIRE(err->rule == Rule::TypeMismatch);
    REQUIRE_THAT(err->message, Catch::Matchers::StartsWith("connect 1.0->8.0: "));
    REQUIRE_THAT(bridge_core::build_error_chain(result.error()),
        Catch::Matchers::ContainsSubstring("[ExecutionError:TypeMismatch] operation 2"));
    REQUIRE(graph == txt2img_graph());
}

TEST_CASE("execute rejects a connect to a node removed earlier in the list", "[executor][execute]") {
    OperationList list;
    list.push(SetWidget{5, "steps", Value(30)});
    list.push(RemoveNode{7});
    list.push(Connect{{6, 0, 7, 0}});

    const auto graph = txt2img_graph();
    auto result = execute(list, graph, test_catalog());

    REQUIRE(result.is_err());
    const auto* err = result.error().as<ExecutionError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->operation_index == 2);
    REQUIRE(err->rule == Rule::UnknownNode);
    REQUIRE(err->field == "to");
    REQUIRE(graph == txt2img_graph());
    REQUIRE(graph.find_node(5)->widgets.at("steps") == Value(20));
}

TEST_CASE("execute applies cascades before later operations", "[executor][execute]") {
    OperationList list;
    list.push(RemoveNode{5});
    list.push(Connect{{4, 0, 6, 0}});

    auto result = execute(list, txt2img_graph(), test_catalog());
    REQUIRE(result.is_ok());
    REQUIRE(result->incoming_link(6, 0) == bridge_graph::Link{4, 0, 6, 0});
    REQUIRE(result->link_count() == 5);
}

TEST_CASE("execute of an empty list", "[executor][execute]") {
    const auto graph = txt2img_graph();
    auto result = execute(OperationList{}, graph, test_catalog());
    REQUIRE(result.is_ok());
    REQUIRE(*result == graph);
}

TEST_CASE("execute re-validates against the graph it is given", "[executor][execute]") {
    auto compiled = bridge_compiler::compile_brief(nlohmann::json::parse(R"({
        "connect": [{"from": {"node": 6}, "to": {"node": 7}}],
        "disconnect": [{"from": {"node": 6}, "to": {"node": 7}}]
    })"), txt2img_graph(), test_catalog());
    REQUIRE(compiled.is_ok());
    REQUIRE(compiled->operations.size() == 2);

    auto changed = txt2img_graph();
    REQUIRE(changed.remove_link({6, 0, 7, 0}).is_ok());

    auto result = execute(compiled->operations, changed, test_catalog());
    REQUIRE(result.is_err());
    REQUIRE(result.error().as<ExecutionError>()->operation_index == 0);
    REQUIRE(result.error().rule() == Rule::LinkNotFound);
}

// =============================================================================
// execute_in_place
// =============================================================================

TEST_CASE("execute_in_place", "[executor][execute]") {
    auto graph = txt2img_graph();

    SECTION("failure leaves the graph as it was") {
        auto result = execute_in_place(list_with_bad_third(), graph, test_catalog());
        REQUIRE(result.is_err());
        REQUIRE(graph == txt2img_graph());
    }

    SECTION("success replaces the graph") {
        auto result = execute_in_place(swap_save_for_preview(), graph, test_catalog());
        REQUIRE(result.is_ok());
        REQUIRE(graph.has_node(8));
        REQUIRE_FALSE(graph.has_node(7));
    }
}

// =============================================================================
// Execution
// =============================================================================

TEST_CASE("Execution steps", "[executor][execution]") {
    const auto graph = txt2img_graph();

    SECTION("committed after the last step") {
        auto list = swap_save_for_preview();
        Execution execution(list, graph, test_catalog());
        REQUIRE(execution.state() == ExecutionState::Pending);

        REQUIRE(execution.step());
        REQUIRE(execution.position() == 1);
        REQUIRE_FALSE(execution.working().has_node(7));
        REQUIRE(execution.state() == ExecutionState::Pending);

        REQUIRE(execution.step());
        REQUIRE(execution.step());
        REQUIRE(execution.state() == ExecutionState::Committed);
        REQUIRE_FALSE(execution.step());
        REQUIRE(execution.position() == 3);
    }

    SECTION("rejected at the failing step") {
        auto list = list_with_bad_third();
        Execution execution(list, graph, test_catalog());
        execution.run();

        REQUIRE(execution.state() == ExecutionState::Rejected);
        REQUIRE(execution.position() == 2);
        REQUIRE(execution.error().operation_index == 2);
        REQUIRE(execution.error().rule == Rule::TypeMismatch);
        REQUIRE_FALSE(execution.step());
    }

    SECTION("empty list starts committed") {
        OperationList list;
        Execution execution(list, graph, test_catalog());
        REQUIRE(execution.state() == ExecutionState::Committed);
        REQUIRE_FALSE(execution.step());
    }
}
