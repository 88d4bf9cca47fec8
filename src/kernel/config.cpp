#include "kernel/config.hpp"
#include "core/config.hpp"
#include <algorithm>

namespace everos::kernel {

namespace {

// Negative values are clamped to zero
template <typename T>
T env_unsigned(const std::string& key, T fallback) {
    auto value = core::config::get_env_int(key, static_cast<int64_t>(fallback));
    return static_cast<T>(std::max<int64_t>(value, 0));
}

} // namespace

KernelConfig load_kernel_config() {
    using core::config::get_env_bool;
    using core::config::get_env_or;

    KernelConfig config;
    config.log_level = get_env_or("EVEROS_LOG_LEVEL", config.log_level);
    config.world_tick_ms = env_unsigned("EVEROS_WORLD_TICK_MS", config.world_tick_ms);
    config.default_tick_rate_ms =
        env_unsigned("EVEROS_DEFAULT_TICK_RATE_MS", config.default_tick_rate_ms);

    BusConfig& bus = config.bus;
    bus.max_history = env_unsigned("EVEROS_BUS_MAX_HISTORY", bus.max_history);
    bus.max_dead_letters = env_unsigned("EVEROS_BUS_MAX_DEAD_LETTERS", bus.max_dead_letters);
    bus.max_retries = env_unsigned("EVEROS_BUS_MAX_RETRIES", bus.max_retries);
    bus.default_request_timeout = std::chrono::milliseconds(
        env_unsigned<int64_t>("EVEROS_BUS_REQUEST_TIMEOUT_MS", bus.default_request_timeout.count()));
    bus.emit_dead_letter_events =
        get_env_bool("EVEROS_BUS_DEAD_LETTER_EVENTS", bus.emit_dead_letter_events);

    return config;
}

} // namespace everos::kernel
