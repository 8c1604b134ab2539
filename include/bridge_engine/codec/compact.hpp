#pragma once

/// @file compact.hpp
/// @brief Compact interchange form ("BZ2") of a workflow graph
///
/// Layout of a document:
///
///     BZ|v:2|n:<node count>|l:<link count>
///     N<id>:<class>|W:<v0>;<v1>;...[|P:<escaped metadata json>]
///     L<src>.<slot>-><dst>.<slot>:<type shorthand>
///     M:<workflow metadata json>
///
/// Nodes ascend by id, links by 4-tuple, widget values follow the catalog
/// declaration order and JSON objects are written with sorted keys, so the
/// same logical graph always encodes to the same bytes. Layout is dropped.

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/core/error.hpp>
#include <bridge_engine/graph/graph.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bridge_codec {

/// Format version written in the header
inline constexpr int k_compact_version = 2;

/// Encoding options
struct EncodeOptions {
    bool include_metadata = true;  // P: fields and the M: line
};

/// Encode a graph. Fails with FormatError if the graph breaks a link
/// invariant, references an unknown class or carries an undeclared widget.
[[nodiscard]] bridge_core::Result<std::string> encode(
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog,
    const EncodeOptions& options = {});

/// Decode a document. Fails with FormatError on malformed text, unknown
/// class, duplicate node id, out-of-range slot, duplicate link, link type
/// tag disagreeing with the catalog, or a widget token that does not parse.
[[nodiscard]] bridge_core::Result<bridge_graph::WorkflowGraph> decode(
    std::string_view text,
    const bridge_catalog::Catalog& catalog);

// =============================================================================
// Filtering
// =============================================================================

/// Node selection for filter()
struct FilterSelectors {
    std::vector<std::int64_t> ids;
    std::vector<std::string> class_names;  // Matched case-insensitively

    [[nodiscard]] bool empty() const noexcept { return ids.empty() && class_names.empty(); }

    /// Parse "3, 7 KSampler+VAEDecode": numbers select ids, words select classes
    [[nodiscard]] static FilterSelectors parse(std::string_view text);
};

/// Keep only selected nodes plus every link touching one of them.
/// Works on the text alone; no catalog is needed. The result is focused
/// context, not necessarily a decodable graph (links may reach unselected nodes).
[[nodiscard]] bridge_core::Result<std::string> filter(std::string_view text, const FilterSelectors& selectors);

} // namespace bridge_codec
