#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for unispace_core module

#include <cstdint>

namespace unispace_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CarrierError;
struct AxiomError;
struct EmbeddingError;
struct ModelError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace unispace_core
