#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace co::form {

// =============================================================================
// Library Logger
// =============================================================================

// Installs the logger used by the library. Call before the first encode/decode;
// passing nullptr restores spdlog's default logger.
void set_logger(std::shared_ptr<spdlog::logger> logger);

// Installed logger, or spdlog's default logger. The library logs at trace and
// debug level only.
spdlog::logger* logger();

} // namespace co::form

// Include implementation
#include "detail/log_impl.hpp"
