#pragma once

/// @file core.hpp
/// @brief Main include file for unispace_core module
///
/// - **Error Handling**: Result<T> with domain error kinds
/// - **Logging**: spdlog-backed named loggers per subsystem
/// - **Versioning**: library and model format versions

#include "fwd.hpp"
#include "error.hpp"
#include "version.hpp"
#include "log.hpp"
