/// @file executor.cpp
/// @brief Operation list execution

#include <bridge_engine/executor/executor.hpp>
#include <bridge_engine/ops/apply.hpp>

#include <utility>

namespace bridge_exec {

Execution::Execution(const bridge_ops::OperationList& operations,
                     const bridge_graph::WorkflowGraph& graph,
                     const bridge_catalog::Catalog& catalog)
    : m_operations(operations)
    , m_catalog(catalog)
    , m_working(graph) {
    if (m_operations.empty()) {
        m_state = ExecutionState::Committed;
    }
}

bool Execution::step() {
    if (m_state != ExecutionState::Pending) {
        return false;
    }

    const auto& op = m_operations[m_position];
    if (auto applied = bridge_ops::apply_operation(m_working, m_catalog, op); !applied) {
        const auto& v = applied.error();
        m_error = bridge_core::ExecutionError::at(m_position, v.rule,
            bridge_ops::describe(op) + ": " + v.message, v.field);
        m_state = ExecutionState::Rejected;
        return false;
    }

    ++m_position;
    if (m_position == m_operations.size()) {
        m_state = ExecutionState::Committed;
    }
    return true;
}

void Execution::run() {
    while (step()) {
    }
}

bridge_core::Result<bridge_graph::WorkflowGraph> execute(
    const bridge_ops::OperationList& operations,
    const bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog)
{
    Execution execution(operations, graph, catalog);
    execution.run();

    if (execution.state() == ExecutionState::Rejected) {
        return bridge_core::Err<bridge_graph::WorkflowGraph>(execution.error());
    }
    return std::move(execution).take();
}

bridge_core::Result<void> execute_in_place(
    const bridge_ops::OperationList& operations,
    bridge_graph::WorkflowGraph& graph,
    const bridge_catalog::Catalog& catalog)
{
    auto result = execute(operations, graph, catalog);
    if (!result) {
        return bridge_core::Err(result.error());
    }
    std::swap(graph, result.value());
    return bridge_core::Ok();
}

} // namespace bridge_exec
