#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace everos::kernel {

// Event bus configuration
struct BusConfig {
    size_t max_history = 1000;                  // newest half kept once exceeded
    size_t max_dead_letters = 1000;
    uint32_t max_retries = 3;
    std::chrono::milliseconds default_request_timeout{30000};
    bool emit_dead_letter_events = true;        // publish system:dead_letter on handler failure
};

// Kernel configuration
struct KernelConfig {
    std::string log_level = "info";
    uint32_t world_tick_ms = 1000;              // 0 disables world:tick
    uint32_t default_tick_rate_ms = 1000;
    BusConfig bus;
};

// Read EVEROS_* environment variables over the defaults above
KernelConfig load_kernel_config();

} // namespace everos::kernel
