#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace everos::core {

// Initialize logging with colored console output (idempotent)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "debug", "info", "warn", ... Unknown names fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace everos::core
