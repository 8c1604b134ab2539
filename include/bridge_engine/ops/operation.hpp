#pragma once

/// @file operation.hpp
/// @brief Graph edit operations and operation lists

#include <bridge_engine/catalog/value.hpp>
#include <bridge_engine/graph/graph.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace bridge_ops {

/// Overload set for exhaustive std::visit
template<typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// =============================================================================
// OperationKind
// =============================================================================

/// Operation type discriminator (matches the variant order)
enum class OperationKind : std::uint8_t {
    AddNode = 0,
    RemoveNode,
    Connect,
    Disconnect,
    SetWidget
};

/// Name used in operation list documents
[[nodiscard]] inline const char* operation_kind_name(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::AddNode: return "add_node";
        case OperationKind::RemoveNode: return "remove_node";
        case OperationKind::Connect: return "connect";
        case OperationKind::Disconnect: return "disconnect";
        case OperationKind::SetWidget: return "set_widget";
        default: return "unknown";
    }
}

// =============================================================================
// Operation kinds
// =============================================================================

/// Create a node with the requested id
struct AddNode {
    bridge_graph::NodeId id = 0;
    std::string class_name;
    std::map<std::string, bridge_catalog::Value> widgets;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const AddNode& other) const = default;
};

/// Remove a node and every link touching it
struct RemoveNode {
    bridge_graph::NodeId id = 0;

    bool operator==(const RemoveNode& other) const = default;
};

/// Add a link
struct Connect {
    bridge_graph::Link link;

    bool operator==(const Connect& other) const = default;
};

/// Remove an existing link
struct Disconnect {
    bridge_graph::Link link;

    bool operator==(const Disconnect& other) const = default;
};

/// Replace one widget value
struct SetWidget {
    bridge_graph::NodeId node = 0;
    std::string widget;
    bridge_catalog::Value value;

    bool operator==(const SetWidget& other) const = default;
};

// =============================================================================
// Operation (variant wrapper)
// =============================================================================

/// One graph edit. Immutable once emitted.
class Operation {
public:
    using Variant = std::variant<
        AddNode,
        RemoveNode,
        Connect,
        Disconnect,
        SetWidget
    >;

    Operation() = default;

    /// Construct from any operation kind
    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Operation>>>
    Operation(T&& op) : m_data(std::forward<T>(op)) {}

    [[nodiscard]] OperationKind kind() const noexcept {
        return static_cast<OperationKind>(m_data.index());
    }

    [[nodiscard]] const char* kind_name() const noexcept {
        return operation_kind_name(kind());
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Get as specific kind (throws if wrong kind)
    template<typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(m_data);
    }

    template<typename T>
    [[nodiscard]] const T* try_as() const noexcept {
        return std::get_if<T>(&m_data);
    }

    template<typename F>
    decltype(auto) visit(F&& visitor) const {
        return std::visit(std::forward<F>(visitor), m_data);
    }

    bool operator==(const Operation& other) const = default;

private:
    Variant m_data;
};

/// One-line human readable form, e.g. "connect 5.0->7.0"
[[nodiscard]] std::string describe(const Operation& op);

// =============================================================================
// OperationList
// =============================================================================

/// Ordered operations; order is significant
class OperationList {
public:
    OperationList() = default;

    void reserve(std::size_t capacity) { m_operations.reserve(capacity); }

    void push(Operation op) { m_operations.push_back(std::move(op)); }

    /// Append another list
    void append(const OperationList& other) {
        m_operations.insert(m_operations.end(), other.m_operations.begin(), other.m_operations.end());
    }

    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return m_operations; }

    [[nodiscard]] const Operation& operator[](std::size_t index) const { return m_operations[index]; }

    [[nodiscard]] std::size_t size() const noexcept { return m_operations.size(); }

    [[nodiscard]] bool empty() const noexcept { return m_operations.empty(); }

    void clear() { m_operations.clear(); }

    [[nodiscard]] auto begin() const noexcept { return m_operations.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_operations.end(); }

    bool operator==(const OperationList& other) const = default;

private:
    std::vector<Operation> m_operations;
};

} // namespace bridge_ops
