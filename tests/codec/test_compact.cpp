// bridge_codec Compact tests

#include <catch2/catch_test_macros.hpp>
#include <bridge_engine/codec/compact.hpp>

#include "../support/fixtures.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace bridge_codec;
using bridge_catalog::Value;
using bridge_core::FormatError;
using bridge_core::Rule;
using bridge_test::k_txt2img_compact;
using bridge_test::make_node;
using bridge_test::test_catalog;
using bridge_test::txt2img_graph;

namespace {

/// Rule of a failed decode
Rule decode_rule(const std::string& text) {
    auto decoded = decode(text, test_catalog());
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.error().is<FormatError>());
    return decoded.error().as<FormatError>()->rule;
}

} // namespace

// =============================================================================
// Encode
// =============================================================================

TEST_CASE("Compact encode", "[codec][compact]") {
    const auto& catalog = test_catalog();

    SECTION("exact text") {
        auto text = encode(txt2img_graph(), catalog);
        REQUIRE(text.is_ok());
        REQUIRE(*text == k_txt2img_compact);
    }

    SECTION("insertion order does not matter") {
        bridge_graph::WorkflowGraph graph;
        bridge_test::must_add(graph, make_node(6, "VAEDecode"));
        bridge_test::must_add(graph, make_node(4, "EmptyLatentImage", {
            {"batch_size", Value(2)}, {"height", Value(768)}, {"width", Value(512)}}));
        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        REQUIRE(*text == "BZ|v:2|n:2|l:0\nN4:EmptyLatentImage|W:512;768;2\nN6:VAEDecode\n");
    }

    SECTION("unset widgets") {
        bridge_graph::WorkflowGraph graph;
        bridge_test::must_add(graph, make_node(1, "EmptyLatentImage", {{"height", Value(640)}}));
        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        REQUIRE(text->find("N1:EmptyLatentImage|W:~;640;~\n") != std::string::npos);
    }

    SECTION("metadata can be left out") {
        auto graph = txt2img_graph();
        graph.metadata()["workflow_name"] = "cat";
        auto full = encode(graph, catalog);
        REQUIRE(full.is_ok());
        REQUIRE(full->find("|P:") != std::string::npos);
        REQUIRE(full->find("\nM:{\"workflow_name\":\"cat\"}\n") != std::string::npos);

        auto bare = encode(graph, catalog, EncodeOptions{false});
        REQUIRE(bare.is_ok());
        REQUIRE(bare->find("|P:") == std::string::npos);
        REQUIRE(bare->find("M:") == std::string::npos);
    }

    SECTION("int in a float widget is refused") {
        auto graph = txt2img_graph();
        graph.find_node(5)->widgets["cfg"] = Value(7);
        auto text = encode(graph, catalog);
        REQUIRE(text.is_err());
        REQUIRE(text.error().rule() == Rule::WidgetType);

        graph.find_node(5)->widgets["cfg"] = Value(7.0);
        text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        auto decoded = decode(*text, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->find_node(5)->widgets.at("cfg") == Value(7.0));
        REQUIRE(decoded->logically_equal(graph));
    }

    SECTION("invalid graph is refused") {
        auto graph = txt2img_graph();
        graph.find_node(5)->widgets["strength"] = Value(1.0);
        auto text = encode(graph, catalog);
        REQUIRE(text.is_err());
        REQUIRE(text.error().rule() == Rule::UnknownWidget);
    }
}

// =============================================================================
// Decode
// =============================================================================

TEST_CASE("Compact decode", "[codec][compact]") {
    const auto& catalog = test_catalog();

    SECTION("round trip") {
        auto graph = txt2img_graph();
        graph.metadata()["workflow_name"] = "cat";
        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());

        auto decoded = decode(*text, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == graph);
    }

    SECTION("encoding is idempotent") {
        auto decoded = decode(k_txt2img_compact, catalog);
        REQUIRE(decoded.is_ok());
        auto again = encode(*decoded, catalog);
        REQUIRE(again.is_ok());
        REQUIRE(*again == k_txt2img_compact);
    }

    SECTION("float widgets read back as floats") {
        auto decoded = decode(k_txt2img_compact, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->find_node(5)->widgets.at("cfg") == Value(7.5));
        REQUIRE(decoded->find_node(5)->widgets.at("steps") == Value(20));
        REQUIRE(decoded->find_node(2)->title() == "Positive");
    }

    SECTION("CRLF and blank lines") {
        auto decoded = decode("BZ|v:2|n:1|l:0\r\n\r\nN6:VAEDecode\r\n", catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->has_node(6));
    }

    SECTION("unset token") {
        auto decoded = decode("BZ|v:2|n:1|l:0\nN1:EmptyLatentImage|W:~;640;~\n", catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->find_node(1)->widgets.size() == 1);
    }
}

TEST_CASE("Compact decode rejects invalid documents", "[codec][compact]") {
    SECTION("duplicate node id") {
        auto decoded = decode("BZ|v:2|n:2|l:0\nN6:VAEDecode\nN6:PreviewImage\n", test_catalog());
        REQUIRE(decoded.is_err());
        const auto* err = decoded.error().as<FormatError>();
        REQUIRE(err->rule == Rule::DuplicateNode);
        REQUIRE(err->line == 3);
    }

    SECTION("unknown class") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN1:LatentUpscale|W:512\n") == Rule::UnknownClass);
    }

    SECTION("output slot out of range") {
        REQUIRE(decode_rule("BZ|v:2|n:2|l:1\nN6:VAEDecode\nN7:PreviewImage\nL6.1->7.0:G\n") == Rule::SlotOutOfRange);
    }

    SECTION("input slot out of range") {
        REQUIRE(decode_rule("BZ|v:2|n:2|l:1\nN6:VAEDecode\nN7:PreviewImage\nL6.0->7.1:G\n") == Rule::SlotOutOfRange);
    }

    SECTION("incompatible types") {
        REQUIRE(decode_rule("BZ|v:2|n:2|l:1\nN6:VAEDecode\nN8:VAEDecode\nL6.0->8.0:G\n") == Rule::TypeMismatch);
    }

    SECTION("type tag disagrees with the catalog") {
        REQUIRE(decode_rule("BZ|v:2|n:2|l:1\nN6:VAEDecode\nN7:PreviewImage\nL6.0->7.0:A\n") == Rule::TypeMismatch);
    }

    SECTION("link to a missing node") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:1\nN6:VAEDecode\nL6.0->7.0:G\n") == Rule::DanglingLink);
    }

    SECTION("duplicate link") {
        REQUIRE(decode_rule("BZ|v:2|n:2|l:2\nN6:VAEDecode\nN7:PreviewImage\nL6.0->7.0:G\nL6.0->7.0:G\n")
            == Rule::DuplicateLink);
    }

    SECTION("input fed twice") {
        REQUIRE(decode_rule("BZ|v:2|n:3|l:2\nN5:VAEDecode\nN6:VAEDecode\nN7:PreviewImage\n"
                            "L5.0->7.0:G\nL6.0->7.0:G\n") == Rule::InputOccupied);
    }

    SECTION("widget count") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN4:EmptyLatentImage|W:512;512\n") == Rule::Malformed);
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN4:EmptyLatentImage\n") == Rule::Malformed);
    }

    SECTION("widget token of the wrong kind") {
        auto decoded = decode("BZ|v:2|n:1|l:0\nN4:EmptyLatentImage|W:512;tall;1\n", test_catalog());
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().rule() == Rule::WidgetType);
        REQUIRE(decoded.error().get_context("widget") != nullptr);
        REQUIRE(*decoded.error().get_context("widget") == "height");
    }

    SECTION("string widget that is not UTF-8") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN7:SaveImage|W:%FFabc\n") == Rule::WidgetType);
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN7:SaveImage|W:ab\xC3\n") == Rule::WidgetType);
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN7:SaveImage|W:%ED%A0%80\n") == Rule::WidgetType);
    }

    SECTION("class name that is not UTF-8") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN7:Save%C0%AFImage\n") == Rule::Malformed);
    }

    SECTION("header") {
        REQUIRE(decode_rule("") == Rule::Malformed);
        REQUIRE(decode_rule("BZ|v:1|n:0|l:0\n") == Rule::Malformed);
        REQUIRE(decode_rule("N6:VAEDecode\n") == Rule::Malformed);
        REQUIRE(decode_rule("BZ|v:2|n:2|l:0\nN6:VAEDecode\n") == Rule::Malformed);
    }

    SECTION("section order") {
        REQUIRE(decode_rule("BZ|v:2|n:3|l:1\nN6:VAEDecode\nN7:PreviewImage\nL6.0->7.0:G\nN8:PreviewImage\n")
            == Rule::Malformed);
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nM:{}\nN6:VAEDecode\n") == Rule::Malformed);
    }

    SECTION("metadata must be a JSON object") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN6:VAEDecode\nM:[1]\n") == Rule::Malformed);
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN6:VAEDecode|P:{oops\n") == Rule::Malformed);
    }
}

// =============================================================================
// Escaping
// =============================================================================

TEST_CASE("Compact escaping", "[codec][compact]") {
    const auto& catalog = test_catalog();

    SECTION("class names and string widgets survive delimiters") {
        bridge_graph::WorkflowGraph graph;
        bridge_test::must_add(graph, make_node(1, "ShowAny|pysssss", {{"label", Value("a;b|c\n~ 100%")}}));
        bridge_test::must_add(graph, make_node(2, "CLIPTextEncode", {{"text", Value("[masterpiece], cat")}}));

        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        REQUIRE(text->find("N1:ShowAny%7Cpysssss|W:a%3Bb%7Cc%0A%7E 100%25\n") != std::string::npos);
        REQUIRE(text->find("N2:CLIPTextEncode|W:%5Bmasterpiece], cat\n") != std::string::npos);

        auto decoded = decode(*text, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == graph);
    }

    SECTION("array widget values") {
        bridge_graph::WorkflowGraph graph;
        bridge_test::must_add(graph, make_node(1, "CLIPTextEncode", {{"text", Value::array({Value(1), Value("x;y")})}}));

        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        REQUIRE(text->find("|W:[1,\"x%3By\"]\n") != std::string::npos);

        auto decoded = decode(*text, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->find_node(1)->widgets.at("text") == Value::array({Value(1), Value("x;y")}));
    }

    SECTION("multi-byte text survives") {
        bridge_graph::WorkflowGraph graph;
        bridge_test::must_add(graph, make_node(7, "SaveImage", {{"filename_prefix", Value("k\xC3\xB6nig \xE2\x9C\x93 \xF0\x9F\x90\x88")}}));

        auto text = encode(graph, catalog);
        REQUIRE(text.is_ok());
        auto decoded = decode(*text, catalog);
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == graph);
    }

    SECTION("bad escape") {
        REQUIRE(decode_rule("BZ|v:2|n:1|l:0\nN2:CLIPTextEncode|W:50%\n") == Rule::Malformed);
    }
}

// =============================================================================
// Filter
// =============================================================================

TEST_CASE("Compact filter", "[codec][filter]") {
    std::string text(k_txt2img_compact);

    SECTION("by id") {
        auto filtered = filter(text, FilterSelectors::parse("5"));
        REQUIRE(filtered.is_ok());
        REQUIRE(*filtered ==
            "BZ|v:2|n:1|l:5\n"
            "N5:KSampler|W:42;fixed;20;7.5;euler;normal;0.75\n"
            "L1.0->5.0:M\n"
            "L2.0->5.1:C\n"
            "L3.0->5.2:C\n"
            "L4.0->5.3:A\n"
            "L5.0->6.0:A\n");
    }

    SECTION("by class, case-insensitive, mixed with ids") {
        auto selectors = FilterSelectors::parse("vaedecode, 7");
        REQUIRE(selectors.ids == std::vector<std::int64_t>{7});
        REQUIRE(selectors.class_names == std::vector<std::string>{"vaedecode"});

        auto filtered = filter(text, selectors);
        REQUIRE(filtered.is_ok());
        REQUIRE(filtered->starts_with("BZ|v:2|n:2|l:3\nN6:VAEDecode\nN7:SaveImage|W:ComfyUI\n"));
    }

    SECTION("no selectors keeps the document") {
        auto filtered = filter(text, FilterSelectors{});
        REQUIRE(filtered.is_ok());
        REQUIRE(*filtered == text);
    }

    SECTION("no match") {
        auto filtered = filter(text, FilterSelectors::parse("99"));
        REQUIRE(filtered.is_ok());
        REQUIRE(*filtered == "BZ|v:2|n:0|l:0\n");
    }

    SECTION("metadata line is kept") {
        auto filtered = filter(text + "M:{\"a\":1}\n", FilterSelectors::parse("6"));
        REQUIRE(filtered.is_ok());
        REQUIRE(filtered->ends_with("M:{\"a\":1}\n"));
    }

    SECTION("bad header") {
        REQUIRE(filter("hello", FilterSelectors::parse("1")).is_err());
    }
}
