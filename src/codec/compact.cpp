/// @file compact.cpp
/// @brief Compact interchange encoder, decoder and filter

#include <bridge_engine/codec/compact.hpp>
#include <bridge_engine/codec/escape.hpp>
#include <bridge_engine/core/log.hpp>
#include <bridge_engine/graph/validation.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>

namespace bridge_codec {

using bridge_core::FormatError;
using bridge_core::Rule;
using bridge_graph::GraphNode;
using bridge_graph::Link;
using bridge_graph::WorkflowGraph;

namespace {

// =============================================================================
// Text Helpers
// =============================================================================

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

template<typename Int>
std::optional<Int> parse_number(std::string_view text) {
    Int value{};
    if (text.empty()) {
        return std::nullopt;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Physical line with its 1-based number
struct SourceLine {
    std::size_t number;
    std::string_view text;
};

std::vector<SourceLine> split_lines(std::string_view text) {
    std::vector<SourceLine> lines;
    std::size_t number = 0;
    for (auto line : split(text, '\n')) {
        ++number;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            lines.push_back(SourceLine{number, line});
        }
    }
    return lines;
}

// =============================================================================
// Line Grammar
// =============================================================================

struct Header {
    std::size_t nodes = 0;
    std::size_t links = 0;
};

bridge_core::Result<Header> parse_header(const SourceLine& line) {
    auto parts = split(line.text, '|');
    if (parts.size() != 4 || parts[0] != "BZ" ||
        !parts[1].starts_with("v:") || !parts[2].starts_with("n:") || !parts[3].starts_with("l:")) {
        return bridge_core::Err<Header>(FormatError::malformed(
            "expected header 'BZ|v:2|n:<nodes>|l:<links>'", line.number));
    }

    auto version = parse_number<int>(parts[1].substr(2));
    if (!version || *version != k_compact_version) {
        return bridge_core::Err<Header>(FormatError::malformed(
            fmt::format("unsupported version '{}'", parts[1].substr(2)), line.number));
    }

    auto nodes = parse_number<std::size_t>(parts[2].substr(2));
    auto links = parse_number<std::size_t>(parts[3].substr(2));
    if (!nodes || !links) {
        return bridge_core::Err<Header>(FormatError::malformed("bad count in header", line.number));
    }
    return Header{*nodes, *links};
}

/// N<id>:<class> prefix of a node line, split from its fields
struct NodeHead {
    bridge_graph::NodeId id = 0;
    std::string class_name;
    std::vector<std::string_view> fields;
};

bridge_core::Result<NodeHead> parse_node_head(const SourceLine& line) {
    auto colon = line.text.find(':');
    if (colon == std::string_view::npos) {
        return bridge_core::Err<NodeHead>(FormatError::malformed("node line without ':'", line.number));
    }

    auto id = parse_number<bridge_graph::NodeId>(line.text.substr(1, colon - 1));
    if (!id || *id <= 0) {
        return bridge_core::Err<NodeHead>(FormatError::malformed(
            fmt::format("bad node id '{}'", line.text.substr(1, colon - 1)), line.number));
    }

    auto parts = split(line.text.substr(colon + 1), '|');
    auto class_name = unescape_token(parts[0]);
    if (!class_name || class_name->empty() || !is_valid_utf8(*class_name)) {
        return bridge_core::Err<NodeHead>(FormatError::malformed("bad node class", line.number));
    }

    NodeHead head;
    head.id = *id;
    head.class_name = std::move(class_name).value();
    head.fields.assign(parts.begin() + 1, parts.end());
    return head;
}

bridge_core::Result<Link> parse_link_line(const SourceLine& line, std::string* tag) {
    // L<src>.<slot>-><dst>.<slot>:<tag>
    auto body = line.text.substr(1);
    auto arrow = body.find("->");
    auto colon = body.find(':', arrow == std::string_view::npos ? 0 : arrow);
    if (arrow == std::string_view::npos || colon == std::string_view::npos) {
        return bridge_core::Err<Link>(FormatError::malformed("expected 'L<src>.<slot>-><dst>.<slot>:<type>'", line.number));
    }

    auto endpoint = [](std::string_view text) -> std::optional<std::pair<bridge_graph::NodeId, std::size_t>> {
        auto dot = text.find('.');
        if (dot == std::string_view::npos) return std::nullopt;
        auto node = parse_number<bridge_graph::NodeId>(text.substr(0, dot));
        auto slot = parse_number<std::size_t>(text.substr(dot + 1));
        if (!node || !slot) return std::nullopt;
        return std::make_pair(*node, *slot);
    };

    auto src = endpoint(body.substr(0, arrow));
    auto dst = endpoint(body.substr(arrow + 2, colon - arrow - 2));
    if (!src || !dst) {
        return bridge_core::Err<Link>(FormatError::malformed("bad link endpoint", line.number));
    }

    if (tag) {
        *tag = std::string(body.substr(colon + 1));
    }
    return Link{src->first, src->second, dst->first, dst->second};
}

bridge_core::Error from_violation(const bridge_graph::GraphViolation& v, std::size_t line = 0) {
    return FormatError::violation(v.rule, v.message, v.field, line);
}

bridge_core::Error at_line(bridge_core::Error error, std::size_t line) {
    if (const auto* fe = error.as<FormatError>()) {
        FormatError copy = *fe;
        copy.line = line;
        return copy;
    }
    return error;
}

// =============================================================================
// Decoding Steps
// =============================================================================

bridge_core::Result<void> decode_node(
    const SourceLine& line,
    const bridge_catalog::Catalog& catalog,
    WorkflowGraph& graph)
{
    auto head = parse_node_head(line);
    if (!head) {
        return head.error();
    }

    const auto* def = catalog.find(head->class_name);
    if (!def) {
        return bridge_core::Err(FormatError::violation(Rule::UnknownClass,
            fmt::format("Unknown class '{}'", head->class_name), "class", line.number));
    }

    GraphNode node;
    node.id = head->id;
    node.class_name = head->class_name;

    bool seen_widgets = false;
    bool seen_metadata = false;
    for (auto field : head->fields) {
        if (field.starts_with("W:") && !seen_widgets) {
            seen_widgets = true;
            auto tokens = split(field.substr(2), ';');
            if (tokens.size() != def->widgets().size() || def->widgets().empty()) {
                return bridge_core::Err(FormatError::violation(Rule::Malformed,
                    fmt::format("{} declares {} widgets, line has {}",
                        def->class_name(), def->widgets().size(), tokens.size()),
                    "W", line.number));
            }

            for (std::size_t i = 0; i < tokens.size(); ++i) {
                const auto& decl = def->widgets()[i];
                auto value = decode_widget_value(tokens[i], decl.kind);
                if (!value) {
                    auto err = at_line(value.error(), line.number);
                    err.with_context("widget", decl.name);
                    return err;
                }
                if (value->has_value()) {
                    node.widgets.emplace(decl.name, std::move(**value));
                }
            }
        } else if (field.starts_with("P:") && !seen_metadata) {
            seen_metadata = true;
            auto text = unescape_token(field.substr(2));
            if (!text) {
                return at_line(text.error(), line.number);
            }
            try {
                node.metadata = nlohmann::json::parse(*text);
            } catch (const nlohmann::json::parse_error& e) {
                return bridge_core::Err(FormatError::violation(Rule::Malformed,
                    fmt::format("node metadata is not JSON: {}", e.what()), "P", line.number));
            }
            if (!node.metadata.is_object()) {
                return bridge_core::Err(FormatError::violation(Rule::Malformed, "node metadata is not an object", "P", line.number));
            }
        } else {
            return bridge_core::Err(FormatError::malformed(fmt::format("unexpected node field '{}'", field), line.number));
        }
    }

    if (!seen_widgets && !def->widgets().empty()) {
        return bridge_core::Err(FormatError::violation(Rule::Malformed,
            fmt::format("{} declares {} widgets, line has none", def->class_name(), def->widgets().size()),
            "W", line.number));
    }

    if (auto added = graph.add_node(std::move(node)); !added) {
        return from_violation(added.error(), line.number);
    }
    return bridge_core::Ok();
}

bridge_core::Result<void> decode_link(
    const SourceLine& line,
    const bridge_catalog::Catalog& catalog,
    WorkflowGraph& graph)
{
    std::string tag;
    auto link = parse_link_line(line, &tag);
    if (!link) {
        return link.error();
    }

    const auto* source = graph.find_node(link->source);
    const auto* target = graph.find_node(link->target);
    if (!source || !target) {
        return bridge_core::Err(FormatError::violation(Rule::DanglingLink,
            fmt::format("Link {} references a missing node", bridge_graph::to_string(*link)), {}, line.number));
    }

    const auto* source_def = catalog.find(source->class_name);
    const auto* target_def = catalog.find(target->class_name);
    if (auto checked = bridge_graph::check_link_slots(*source_def, link->source_slot, *target_def, link->target_slot);
        !checked) {
        return from_violation(checked.error(), line.number);
    }

    auto expected = bridge_catalog::type_shorthand(source_def->outputs()[link->source_slot].type);
    if (tag != expected) {
        return bridge_core::Err(FormatError::violation(Rule::TypeMismatch,
            fmt::format("Link {} tagged '{}' but the output is '{}'", bridge_graph::to_string(*link), tag, expected),
            "type", line.number));
    }

    if (auto added = graph.add_link(*link); !added) {
        return from_violation(added.error(), line.number);
    }
    return bridge_core::Ok();
}

} // anonymous namespace

// =============================================================================
// Encode
// =============================================================================

bridge_core::Result<std::string> encode(
    const WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    const EncodeOptions& options)
{
    if (auto valid = bridge_graph::validate_graph(graph, catalog); !valid) {
        return bridge_core::Err<std::string>(from_violation(valid.error()));
    }

    std::string out = fmt::format("BZ|v:{}|n:{}|l:{}\n", k_compact_version, graph.node_count(), graph.link_count());

    for (const auto& [id, node] : graph.nodes()) {
        const auto* def = catalog.find(node.class_name);

        out += fmt::format("N{}:{}", id, escape_token(node.class_name));

        if (!def->widgets().empty()) {
            out += "|W:";
            bool first = true;
            for (const auto& decl : def->widgets()) {
                if (!first) out += ';';
                first = false;

                auto it = node.widgets.find(decl.name);
                if (it == node.widgets.end()) {
                    out += k_unset_token;
                } else {
                    out += encode_widget_value(it->second);
                }
            }
        }

        if (options.include_metadata && node.metadata.is_object() && !node.metadata.empty()) {
            out += "|P:";
            out += escape_token(node.metadata.dump());
        }
        out += '\n';
    }

    for (const auto& link : graph.links()) {
        const auto* source = graph.find_node(link.source);
        const auto* def = catalog.find(source->class_name);
        out += fmt::format("L{}.{}->{}.{}:{}\n", link.source, link.source_slot, link.target, link.target_slot,
            bridge_catalog::type_shorthand(def->outputs()[link.source_slot].type));
    }

    if (options.include_metadata && graph.metadata().is_object() && !graph.metadata().empty()) {
        out += "M:";
        out += graph.metadata().dump();
        out += '\n';
    }

    bridge_core::codec_logger()->debug("Encoded {} nodes, {} links into {} bytes",
        graph.node_count(), graph.link_count(), out.size());
    return out;
}

// =============================================================================
// Decode
// =============================================================================

bridge_core::Result<WorkflowGraph> decode(std::string_view text, const bridge_catalog::Catalog& catalog) {
    auto lines = split_lines(text);
    if (lines.empty()) {
        return bridge_core::Err<WorkflowGraph>(FormatError::malformed("empty document"));
    }

    auto header = parse_header(lines.front());
    if (!header) {
        return bridge_core::Err<WorkflowGraph>(header.error());
    }

    enum class Section { Nodes, Links, Metadata };
    Section section = Section::Nodes;

    WorkflowGraph graph;
    std::size_t node_lines = 0;
    std::size_t link_lines = 0;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];

        if (section == Section::Metadata) {
            return bridge_core::Err<WorkflowGraph>(FormatError::malformed("content after metadata line", line.number));
        }

        if (line.text.starts_with("M:")) {
            section = Section::Metadata;
            try {
                graph.metadata() = nlohmann::json::parse(line.text.substr(2));
            } catch (const nlohmann::json::parse_error& e) {
                return bridge_core::Err<WorkflowGraph>(FormatError::malformed(
                    fmt::format("metadata is not JSON: {}", e.what()), line.number));
            }
            if (!graph.metadata().is_object()) {
                return bridge_core::Err<WorkflowGraph>(FormatError::malformed("metadata is not an object", line.number));
            }
        } else if (line.text.front() == 'N') {
            if (section != Section::Nodes) {
                return bridge_core::Err<WorkflowGraph>(FormatError::malformed("node line after links", line.number));
            }
            if (auto decoded = decode_node(line, catalog, graph); !decoded) {
                return bridge_core::Err<WorkflowGraph>(decoded.error());
            }
            ++node_lines;
        } else if (line.text.front() == 'L') {
            section = Section::Links;
            if (auto decoded = decode_link(line, catalog, graph); !decoded) {
                return bridge_core::Err<WorkflowGraph>(decoded.error());
            }
            ++link_lines;
        } else {
            return bridge_core::Err<WorkflowGraph>(FormatError::malformed(
                fmt::format("unrecognised line '{}'", line.text.substr(0, 16)), line.number));
        }
    }

    if (node_lines != header->nodes || link_lines != header->links) {
        return bridge_core::Err<WorkflowGraph>(FormatError::malformed(
            fmt::format("header announces {} nodes and {} links, document has {} and {}",
                header->nodes, header->links, node_lines, link_lines), lines.front().number));
    }

    bridge_core::codec_logger()->debug("Decoded {} nodes, {} links", graph.node_count(), graph.link_count());
    return graph;
}

// =============================================================================
// Filter
// =============================================================================

FilterSelectors FilterSelectors::parse(std::string_view text) {
    FilterSelectors selectors;
    std::string token;

    auto flush = [&]() {
        if (token.empty()) return;
        if (auto id = parse_number<std::int64_t>(token)) {
            selectors.ids.push_back(*id);
        } else {
            selectors.class_names.push_back(token);
        }
        token.clear();
    };

    for (char c : text) {
        if (c == ',' || c == '+' || std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            token += c;
        }
    }
    flush();
    return selectors;
}

bridge_core::Result<std::string> filter(std::string_view text, const FilterSelectors& selectors) {
    auto lines = split_lines(text);
    if (lines.empty()) {
        return bridge_core::Err<std::string>(FormatError::malformed("empty document"));
    }
    if (auto header = parse_header(lines.front()); !header) {
        return bridge_core::Err<std::string>(header.error());
    }
    if (selectors.empty()) {
        return std::string(text);
    }

    std::set<std::int64_t> wanted_ids(selectors.ids.begin(), selectors.ids.end());
    std::set<std::string> wanted_classes;
    for (const auto& name : selectors.class_names) {
        wanted_classes.insert(to_lower(name));
    }

    std::set<std::int64_t> matched;
    std::vector<std::string_view> node_lines;
    std::vector<std::string_view> link_lines;
    std::string_view metadata_line;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.text.starts_with("M:")) {
            metadata_line = line.text;
        } else if (line.text.front() == 'N') {
            auto head = parse_node_head(line);
            if (!head) {
                return bridge_core::Err<std::string>(head.error());
            }
            if (wanted_ids.count(head->id) > 0 || wanted_classes.count(to_lower(head->class_name)) > 0) {
                node_lines.push_back(line.text);
                matched.insert(head->id);
            }
        } else if (line.text.front() == 'L') {
            auto link = parse_link_line(line, nullptr);
            if (!link) {
                return bridge_core::Err<std::string>(link.error());
            }
            if (matched.count(link->source) > 0 || matched.count(link->target) > 0) {
                link_lines.push_back(line.text);
            }
        } else {
            return bridge_core::Err<std::string>(FormatError::malformed(
                fmt::format("unrecognised line '{}'", line.text.substr(0, 16)), line.number));
        }
    }

    std::string out = fmt::format("BZ|v:{}|n:{}|l:{}\n", k_compact_version, node_lines.size(), link_lines.size());
    for (auto line : node_lines) {
        out += line;
        out += '\n';
    }
    for (auto line : link_lines) {
        out += line;
        out += '\n';
    }
    if (!metadata_line.empty()) {
        out += metadata_line;
        out += '\n';
    }

    bridge_core::codec_logger()->debug("Filter kept {} nodes and {} links", node_lines.size(), link_lines.size());
    return out;
}

} // namespace bridge_codec
