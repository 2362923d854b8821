#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

using Logger = std::shared_ptr<spdlog::logger>;

/// Build a logger with a colored stdout sink and, if file is non-empty,
/// an appending file sink. The logger is not registered with spdlog's
/// global registry; callers pass it to the components that need it.
Logger make_logger(const std::string& name, const std::string& level,
                   const std::string& file = "");

/// Logger that discards everything (default for components and tests)
Logger null_logger();

/// Parse "trace|debug|info|warn|error|critical|off"; unknown -> info
spdlog::level::level_enum parse_log_level(const std::string& level);
