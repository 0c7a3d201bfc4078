#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for idmap_core module

#include <cstdint>

namespace idmap_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct IdError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

struct Config;

} // namespace idmap_core
