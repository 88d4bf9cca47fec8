#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include "agents/clock_agent.hpp"
#include "agents/health_monitor_agent.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "kernel/config.hpp"
#include "kernel/kernel.hpp"

namespace {

everos::kernel::Kernel* g_kernel = nullptr;

void handle_signal(int) {
    if (g_kernel) {
        g_kernel->request_stop();
    }
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--help]\n\n"
              << "Runs the everos kernel with the clock and health monitor agents\n"
              << "until SIGINT/SIGTERM. Configuration comes from EVEROS_* environment\n"
              << "variables or a .env file.\n";
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        std::cerr << "Unknown argument: " << argv[i] << "\n";
        print_usage(argv[0]);
        return 2;
    }

    everos::core::init_logger();
    everos::core::config::load_dotenv();

    auto config = everos::kernel::load_kernel_config();
    everos::core::set_log_level(everos::core::parse_log_level(config.log_level));

    everos::kernel::Kernel kernel(config);

    try {
        kernel.agents().register_agent(std::make_shared<everos::agents::ClockAgent>(
            kernel.bus(), config.default_tick_rate_ms));
        kernel.agents().register_agent(std::make_shared<everos::agents::HealthMonitorAgent>(
            kernel.bus(), kernel.agents()));
    } catch (const everos::runtime::RegistryError& e) {
        spdlog::critical("Agent registration failed: {}", e.what());
        return 1;
    }

    g_kernel = &kernel;
    install_signal_handlers();

    kernel.run();

    g_kernel = nullptr;
    return 0;
}
