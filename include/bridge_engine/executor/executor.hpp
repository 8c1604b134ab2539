#pragma once

/// @file executor.hpp
/// @brief Atomic application of an operation list
///
/// Operations are applied in order to a private working copy, each one
/// re-validated against the live state with the same rules the compiler
/// used. Either every operation applies and the new graph is returned, or
/// the first failure is reported with its index and nothing is committed.
/// The executor never logs.

#include <bridge_engine/catalog/catalog.hpp>
#include <bridge_engine/core/error.hpp>
#include <bridge_engine/graph/graph.hpp>
#include <bridge_engine/ops/operation.hpp>

#include <cstddef>
#include <cstdint>

namespace bridge_exec {

/// Progress of one execution
enum class ExecutionState : std::uint8_t {
    Pending = 0,
    Committed,
    Rejected
};

/// Step-wise executor over one operation list
class Execution {
public:
    Execution(const bridge_ops::OperationList& operations,
              const bridge_graph::WorkflowGraph& graph,
              const bridge_catalog::Catalog& catalog);

    /// Apply the next pending operation.
    /// Returns false once the execution is committed or rejected.
    bool step();

    /// Run every remaining operation
    void run();

    [[nodiscard]] ExecutionState state() const noexcept { return m_state; }

    /// Index of the next operation to apply
    [[nodiscard]] std::size_t position() const noexcept { return m_position; }

    /// Working copy (the committed graph once state() is Committed)
    [[nodiscard]] const bridge_graph::WorkflowGraph& working() const noexcept { return m_working; }

    /// Rejection reason (valid when state() is Rejected)
    [[nodiscard]] const bridge_core::ExecutionError& error() const noexcept { return m_error; }

    /// Move out the working copy
    [[nodiscard]] bridge_graph::WorkflowGraph take() && { return std::move(m_working); }

private:
    const bridge_ops::OperationList& m_operations;
    const bridge_catalog::Catalog& m_catalog;
    bridge_graph::WorkflowGraph m_working;
    std::size_t m_position = 0;
    ExecutionState m_state = ExecutionState::Pending;
    bridge_core::ExecutionError m_error;
};

/// Apply `operations` to a copy of `graph`; `graph` is never touched
[[nodiscard]] bridge_core::Result<bridge_graph::WorkflowGraph> execute(
    const bridge_ops::OperationList& operations,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog);

/// Apply `operations` and swap the result into `graph` on success only
[[nodiscard]] bridge_core::Result<void> execute_in_place(
    const bridge_ops::OperationList& operations,
    bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog);

} // namespace bridge_exec
