#pragma once

/// @file fixtures.hpp
/// @brief Shared catalog and graphs for the bridge_engine tests

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/graph/graph.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bridge_test {

/// Trimmed object_info with the classes the tests use
inline constexpr std::string_view k_object_info = R"json({
  "CheckpointLoaderSimple": {
    "input": {"required": {"ckpt_name": [["v1-5-pruned.safetensors", "sd_xl_base_1.0.safetensors"], {}]}},
    "output": ["MODEL", "CLIP", "VAE"],
    "output_name": ["MODEL", "CLIP", "VAE"],
    "display_name": "Load Checkpoint",
    "category": "loaders"
  },
  "CLIPTextEncode": {
    "input": {"required": {
      "text": ["STRING", {"multiline": true, "dynamicPrompts": true}],
      "clip": ["CLIP"]
    }},
    "output": ["CONDITIONING"],
    "output_name": ["CONDITIONING"],
    "display_name": "CLIP Text Encode (Prompt)",
    "category": "conditioning"
  },
  "EmptyLatentImage": {
    "input": {"required": {
      "width": ["INT", {"default": 512, "min": 16, "max": 16384, "step": 8}],
      "height": ["INT", {"default": 512, "min": 16, "max": 16384, "step": 8}],
      "batch_size": ["INT", {"default": 1, "min": 1, "max": 4096}]
    }},
    "output": ["LATENT"],
    "output_name": ["LATENT"],
    "display_name": "Empty Latent Image",
    "category": "latent"
  },
  "KSampler": {
    "input": {"required": {
      "model": ["MODEL"],
      "seed": ["INT", {"default": 0, "min": 0, "max": 1125899906842624, "control_after_generate": true}],
      "steps": ["INT", {"default": 20, "min": 1, "max": 10000}],
      "cfg": ["FLOAT", {"default": 8.0, "min": 0.0, "max": 100.0, "step": 0.1}],
      "sampler_name": [["euler", "euler_ancestral", "dpmpp_2m"], {}],
      "scheduler": [["normal", "karras"], {}],
      "positive": ["CONDITIONING"],
      "negative": ["CONDITIONING"],
      "latent_image": ["LATENT"],
      "denoise": ["FLOAT", {"default": 1.0, "min": 0.0, "max": 1.0}]
    }},
    "output": ["LATENT"],
    "output_name": ["LATENT"],
    "display_name": "KSampler",
    "category": "sampling"
  },
  "VAEDecode": {
    "input": {"required": {"samples": ["LATENT"], "vae": ["VAE"]}},
    "output": ["IMAGE"],
    "output_name": ["IMAGE"],
    "display_name": "VAE Decode",
    "category": "latent"
  },
  "SaveImage": {
    "input": {"required": {
      "images": ["IMAGE"],
      "filename_prefix": ["STRING", {"default": "ComfyUI"}]
    }},
    "output": [],
    "output_name": [],
    "display_name": "Save Image",
    "category": "image"
  },
  "PreviewImage": {
    "input": {"required": {"images": ["IMAGE"]}},
    "output": [],
    "output_name": [],
    "display_name": "Preview Image",
    "category": "image"
  },
  "LoadImage": {
    "input": {"required": {"image": [["example.png", "photo.jpg"], {"image_upload": true}]}},
    "output": ["IMAGE", "MASK"],
    "output_name": ["IMAGE", "MASK"],
    "display_name": "Load Image",
    "category": "image"
  },
  "ShowAny|pysssss": {
    "input": {
      "required": {"anything": ["*"]},
      "optional": {"preview": ["IMAGE,MASK"], "label": ["STRING", {}]}
    },
    "output": ["*"],
    "output_name": ["output"],
    "display_name": "Show Any",
    "category": "utils"
  }
})json";

/// Catalog parsed from k_object_info
inline const bridge_catalog::Catalog& test_catalog() {
    static const bridge_catalog::Catalog catalog = [] {
        auto parsed = bridge_catalog::Catalog::parse(k_object_info);
        if (!parsed) {
            throw std::runtime_error("test catalog does not parse: " + parsed.error().message());
        }
        return std::move(parsed).value();
    }();
    return catalog;
}

/// Node with widgets and an optional title
inline bridge_graph::GraphNode make_node(
    bridge_graph::NodeId id,
    std::string class_name,
    std::map<std::string, bridge_catalog::Value> widgets = {},
    const std::string& title = {})
{
    bridge_graph::GraphNode node;
    node.id = id;
    node.class_name = std::move(class_name);
    node.widgets = std::move(widgets);
    if (!title.empty()) {
        node.metadata["title"] = title;
    }
    return node;
}

inline void must_add(bridge_graph::WorkflowGraph& graph, bridge_graph::GraphNode node) {
    if (auto added = graph.add_node(std::move(node)); !added) {
        throw std::runtime_error("fixture node rejected: " + added.error().message);
    }
}

inline void must_link(bridge_graph::WorkflowGraph& graph, const bridge_graph::Link& link) {
    if (auto added = graph.add_link(link); !added) {
        throw std::runtime_error("fixture link rejected: " + added.error().message);
    }
}

/// Text-to-image pipeline:
///   1 checkpoint, 2/3 prompts ("Positive"/"Negative"), 4 latent,
///   5 sampler, 6 decode, 7 save
inline bridge_graph::WorkflowGraph txt2img_graph() {
    using bridge_catalog::Value;
    bridge_graph::WorkflowGraph graph;

    must_add(graph, make_node(1, "CheckpointLoaderSimple", {{"ckpt_name", Value("v1-5-pruned.safetensors")}}));
    must_add(graph, make_node(2, "CLIPTextEncode", {{"text", Value("a cat")}}, "Positive"));
    must_add(graph, make_node(3, "CLIPTextEncode", {{"text", Value("blurry")}}, "Negative"));
    must_add(graph, make_node(4, "EmptyLatentImage", {
        {"width", Value(512)}, {"height", Value(512)}, {"batch_size", Value(1)}}));
    must_add(graph, make_node(5, "KSampler", {
        {"seed", Value(42)},
        {"control_after_generate", Value("fixed")},
        {"steps", Value(20)},
        {"cfg", Value(7.5)},
        {"sampler_name", Value("euler")},
        {"scheduler", Value("normal")},
        {"denoise", Value(0.75)}}));
    must_add(graph, make_node(6, "VAEDecode"));
    must_add(graph, make_node(7, "SaveImage", {{"filename_prefix", Value("ComfyUI")}}));

    must_link(graph, {1, 0, 5, 0});
    must_link(graph, {1, 1, 2, 0});
    must_link(graph, {1, 1, 3, 0});
    must_link(graph, {2, 0, 5, 1});
    must_link(graph, {3, 0, 5, 2});
    must_link(graph, {4, 0, 5, 3});
    must_link(graph, {5, 0, 6, 0});
    must_link(graph, {1, 2, 6, 1});
    must_link(graph, {6, 0, 7, 0});
    return graph;
}

/// Compact form of txt2img_graph()
inline constexpr std::string_view k_txt2img_compact =
    "BZ|v:2|n:7|l:9\n"
    "N1:CheckpointLoaderSimple|W:v1-5-pruned.safetensors\n"
    "N2:CLIPTextEncode|W:a cat|P:{\"title\":\"Positive\"}\n"
    "N3:CLIPTextEncode|W:blurry|P:{\"title\":\"Negative\"}\n"
    "N4:EmptyLatentImage|W:512;512;1\n"
    "N5:KSampler|W:42;fixed;20;7.5;euler;normal;0.75\n"
    "N6:VAEDecode\n"
    "N7:SaveImage|W:ComfyUI\n"
    "L1.0->5.0:M\n"
    "L1.1->2.0:P\n"
    "L1.1->3.0:P\n"
    "L1.2->6.1:V\n"
    "L2.0->5.1:C\n"
    "L3.0->5.2:C\n"
    "L4.0->5.3:A\n"
    "L5.0->6.0:A\n"
    "L6.0->7.0:G\n";

} // namespace bridge_test
