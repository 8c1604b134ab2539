/// @file operation.cpp
/// @brief Operation descriptions

#include <bridge_engine/ops/operation.hpp>

#include <fmt/format.h>

namespace bridge_ops {

std::string describe(const Operation& op) {
    return op.visit(overloaded{
        [](const AddNode& add) {
            std::string text = fmt::format("add_node {} {}", add.id, add.class_name);
            if (add.metadata.contains("title") && add.metadata["title"].is_string()) {
                text += fmt::format(" \"{}\"", add.metadata["title"].get<std::string>());
            }
            return text;
        },
        [](const RemoveNode& remove) {
            return fmt::format("remove_node {}", remove.id);
        },
        [](const Connect& connect) {
            return "connect " + bridge_graph::to_string(connect.link);
        },
        [](const Disconnect& disconnect) {
            return "disconnect " + bridge_graph::to_string(disconnect.link);
        },
        [](const SetWidget& set) {
            return fmt::format("set_widget {}.{} = {}", set.node, set.widget,
                bridge_catalog::to_display_string(set.value));
        },
    });
}

} // namespace bridge_ops
