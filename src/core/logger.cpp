#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace everos::core {

void init_logger() {
    static const char* kLoggerName = "everos";
    if (spdlog::get(kLoggerName)) {
        return;
    }

    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;

    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace everos::core
