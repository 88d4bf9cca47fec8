// tests/test_main.cpp
//
// Only translation unit in everos_tests that defines DOCTEST_CONFIG_IMPLEMENT.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>
#include "core/logger.hpp"

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

} // namespace

int main(int argc, char** argv) {
    // Handlers throw on purpose in many cases; keep the log quiet unless asked
    everos::core::init_logger();
    const char* level = std::getenv("EVEROS_TEST_LOG_LEVEL");
    everos::core::set_log_level(level ? everos::core::parse_log_level(level)
                                      : spdlog::level::off);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (env_truthy(std::getenv("CI"))) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);
    return context.run();
}
