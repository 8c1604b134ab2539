#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bridge_core module

#include <cstdint>

namespace bridge_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
enum class Rule : std::uint8_t;
struct FormatError;
struct CatalogError;
struct CompileError;
struct ExecutionError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace bridge_core
