/// @file error.cpp
/// @brief Error handling implementation for bridge_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <bridge_engine/core/error.hpp>
#include <sstream>
#include <vector>

namespace bridge_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

std::string format_format_error(const FormatError& err) {
    std::ostringstream oss;
    oss << "[FormatError:" << rule_name(err.rule) << "] " << err.message;

    if (err.line != 0) {
        oss << " (line " << err.line << ")";
    }
    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

std::string format_catalog_error(const CatalogError& err) {
    std::ostringstream oss;
    oss << "[CatalogError] " << err.message;

    if (!err.class_name.empty()) {
        oss << " (class: " << err.class_name << ")";
    }

    return oss.str();
}

std::string format_compile_error(const CompileError& err) {
    std::ostringstream oss;
    oss << "[CompileError:" << rule_name(err.rule) << "] " << err.message;

    if (err.operation_index) {
        oss << " (operation " << *err.operation_index << ")";
    }
    if (!err.location.empty()) {
        oss << " (at " << err.location << ")";
    }

    return oss.str();
}

std::string format_execution_error(const ExecutionError& err) {
    std::ostringstream oss;
    oss << "[ExecutionError:" << rule_name(err.rule) << "] operation "
        << err.operation_index << ": " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, FormatError>) {
            oss << detail::format_format_error(err);
        } else if constexpr (std::is_same_v<T, CatalogError>) {
            oss << detail::format_catalog_error(err);
        } else if constexpr (std::is_same_v<T, CompileError>) {
            oss << detail::format_compile_error(err);
        } else if constexpr (std::is_same_v<T, ExecutionError>) {
            oss << detail::format_execution_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace bridge_core
