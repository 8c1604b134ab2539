// bridge_compiler brief extraction tests

#include <catch2/catch_test_macros.hpp>
#include <bridge_engine/compiler/brief.hpp>

using namespace bridge_compiler;
using bridge_core::CompileError;
using bridge_core::Rule;

namespace {

void require_brief_error(std::string_view text) {
    auto brief = extract_brief(text);
    REQUIRE(brief.is_err());
    const auto* err = brief.error().as<CompileError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->rule == Rule::Malformed);
    REQUIRE(err->location == "brief");
    REQUIRE_FALSE(err->operation_index.has_value());
}

} // namespace

// =============================================================================
// Candidates
// =============================================================================

TEST_CASE("Brief candidates", "[compiler][brief]") {
    SECTION("fenced blocks win over loose objects") {
        auto candidates = brief_candidates("See {\"x\": 1}\n```json\n{\"a\": 1}\n```\n");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0] == "\n{\"a\": 1}\n");
    }

    SECTION("balanced top-level objects") {
        auto candidates = brief_candidates(R"(first {"a": {"b": 2}} then {"c": "}"} done)");
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0] == R"({"a": {"b": 2}})");
        REQUIRE(candidates[1] == R"({"c": "}"})");
    }

    SECTION("no object") {
        REQUIRE(brief_candidates("nothing to see").empty());
    }
}

// =============================================================================
// Extraction
// =============================================================================

TEST_CASE("Brief extraction", "[compiler][brief]") {
    SECTION("fenced object surrounded by prose") {
        auto brief = extract_brief("Here is the plan:\n```json\n{\"plan_summary\": \"x\"}\n```\nLet me know.");
        REQUIRE(brief.is_ok());
        REQUIRE((*brief)["plan_summary"] == "x");
    }

    SECTION("loose object with braces inside strings") {
        auto brief = extract_brief(R"(Plan: {"plan_summary": "use {braces}", "connect": []} end)");
        REQUIRE(brief.is_ok());
        REQUIRE((*brief)["plan_summary"] == "use {braces}");
    }

    SECTION("identical candidates are accepted") {
        auto brief = extract_brief(R"({"a": 1} and again {"a": 1})");
        REQUIRE(brief.is_ok());
        REQUIRE((*brief)["a"] == 1);
    }

    SECTION("rejections") {
        require_brief_error("no json here");
        require_brief_error(R"({"a": 1} or {"a": 2})");
        require_brief_error("```json\n{\"a\": \n```");
        require_brief_error("```json\n[1, 2]\n```");
    }
}
