#pragma once

/// @file error.hpp
/// @brief Error handling types for bridge_core

#include "fwd.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace bridge_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    FormatError,
    CatalogError,
    CompileError,
    ExecutionError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::FormatError: return "FormatError";
        case ErrorCode::CatalogError: return "CatalogError";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::ExecutionError: return "ExecutionError";
        default: return "Unknown";
    }
}

// =============================================================================
// Rule
// =============================================================================

/// Graph rule violated by an input, an operation or a document.
/// Shared by the codec, the compiler and the executor so that the same
/// violation is reported with the same tag at every stage.
enum class Rule : std::uint8_t {
    Malformed = 0,        // Input does not follow its document format
    UnknownClass,         // Class name not present in the catalog
    UnknownNode,          // Node id not present in the graph
    DuplicateNode,        // Node id already taken
    SlotOutOfRange,       // Slot index beyond the declared slots
    TypeMismatch,         // Output type not assignable to input type
    DuplicateLink,        // Identical link already present
    InputOccupied,        // Destination input already carries a link
    LinkNotFound,         // Disconnect of a link that does not exist
    DanglingLink,         // Link endpoint missing from the graph
    UnknownWidget,        // Widget not declared on the node class
    WidgetType,           // Widget value of the wrong kind
    WidgetConstraint,     // Widget value outside its range or enum
    MissingWidget,        // Widget without value and without default
    UnresolvedReference,  // Brief reference that matches nothing
    AmbiguousReference,   // Brief reference that matches several nodes
    EmptyPlan,            // Brief without any edit
};

/// Get rule name
[[nodiscard]] inline const char* rule_name(Rule rule) noexcept {
    switch (rule) {
        case Rule::Malformed: return "Malformed";
        case Rule::UnknownClass: return "UnknownClass";
        case Rule::UnknownNode: return "UnknownNode";
        case Rule::DuplicateNode: return "DuplicateNode";
        case Rule::SlotOutOfRange: return "SlotOutOfRange";
        case Rule::TypeMismatch: return "TypeMismatch";
        case Rule::DuplicateLink: return "DuplicateLink";
        case Rule::InputOccupied: return "InputOccupied";
        case Rule::LinkNotFound: return "LinkNotFound";
        case Rule::DanglingLink: return "DanglingLink";
        case Rule::UnknownWidget: return "UnknownWidget";
        case Rule::WidgetType: return "WidgetType";
        case Rule::WidgetConstraint: return "WidgetConstraint";
        case Rule::MissingWidget: return "MissingWidget";
        case Rule::UnresolvedReference: return "UnresolvedReference";
        case Rule::AmbiguousReference: return "AmbiguousReference";
        case Rule::EmptyPlan: return "EmptyPlan";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Codec input violates the interchange schema or the link invariant
struct FormatError {
    Rule rule = Rule::Malformed;
    std::string message;
    std::size_t line = 0;   // 1-based line in the source text, 0 if not applicable
    std::string field;      // Offending field or token

    [[nodiscard]] static FormatError malformed(const std::string& what, std::size_t line = 0) {
        return FormatError{Rule::Malformed, "Malformed input: " + what, line, {}};
    }

    [[nodiscard]] static FormatError violation(Rule rule, const std::string& message,
                                               std::string field = {}, std::size_t line = 0) {
        return FormatError{rule, message, line, std::move(field)};
    }
};

/// Catalog entry missing or malformed
struct CatalogError {
    enum class Kind : std::uint8_t {
        MalformedEntry,   // Entry does not follow the object_info shape
        UnknownClass,     // Requested class is absent
        ParseFailed,      // Document is not valid JSON
        IOError,          // Catalog file could not be read
    };

    Kind kind = Kind::MalformedEntry;
    std::string message;
    std::string class_name;

    [[nodiscard]] static CatalogError malformed_entry(const std::string& cls, const std::string& reason) {
        return CatalogError{Kind::MalformedEntry,
            "Malformed catalog entry '" + cls + "': " + reason, cls};
    }

    [[nodiscard]] static CatalogError unknown_class(const std::string& cls) {
        return CatalogError{Kind::UnknownClass, "Class not in catalog: " + cls, cls};
    }

    [[nodiscard]] static CatalogError parse_failed(const std::string& reason) {
        return CatalogError{Kind::ParseFailed, "Catalog parse failed: " + reason, {}};
    }

    [[nodiscard]] static CatalogError io_error(const std::string& path) {
        return CatalogError{Kind::IOError, "Failed to read catalog: " + path, {}};
    }
};

/// Brief cannot be resolved into a fully valid operation list
struct CompileError {
    Rule rule = Rule::Malformed;
    std::string message;
    std::optional<std::size_t> operation_index;  // Index in the emitted list, if an op was formed
    std::string location;                        // Brief path, e.g. "nodes_to_add[1].type"

    [[nodiscard]] static CompileError in_brief(Rule rule, const std::string& location,
                                               const std::string& message) {
        return CompileError{rule, message, std::nullopt, location};
    }

    [[nodiscard]] static CompileError at_operation(Rule rule, std::size_t index,
                                                   const std::string& location,
                                                   const std::string& message) {
        return CompileError{rule, message, index, location};
    }
};

/// Operation failed re-validation against live graph state
struct ExecutionError {
    Rule rule = Rule::Malformed;
    std::size_t operation_index = 0;
    std::string message;
    std::string field;

    [[nodiscard]] static ExecutionError at(std::size_t index, Rule rule,
                                           const std::string& message, std::string field = {}) {
        return ExecutionError{rule, index, message, std::move(field)};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        FormatError,
        CatalogError,
        CompileError,
        ExecutionError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(FormatError err) : m_code(ErrorCode::FormatError), m_error(std::move(err)) {}
    Error(CatalogError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CompileError err) : m_code(ErrorCode::CompileError), m_error(std::move(err)) {}
    Error(ExecutionError err) : m_code(ErrorCode::ExecutionError), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Rule violated, if the error carries one
    [[nodiscard]] std::optional<Rule> rule() const {
        return std::visit([](const auto& err) -> std::optional<Rule> {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, FormatError> ||
                          std::is_same_v<T, CompileError> ||
                          std::is_same_v<T, ExecutionError>) {
                return err.rule;
            } else {
                return std::nullopt;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(CatalogError::Kind kind) {
        switch (kind) {
            case CatalogError::Kind::MalformedEntry: return ErrorCode::CatalogError;
            case CatalogError::Kind::UnknownClass: return ErrorCode::NotFound;
            case CatalogError::Kind::ParseFailed: return ErrorCode::ParseError;
            case CatalogError::Kind::IOError: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with rule, location and context
std::string build_error_chain(const Error& error);

} // namespace bridge_core
