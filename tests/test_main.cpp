// tests/test_main.cpp
//
// IMPORTANT:
//   This must be the ONLY translation unit in the test executable that defines
//   DOCTEST_CONFIG_IMPLEMENT. All other test .cpp files just include doctest.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

#include <spdlog/spdlog.h>

#include "core/Log.h"

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0".
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    // Engine logging stays quiet unless DEEPSEA_TEST_LOG is set (then: trace).
    deepsea::logsys::Options logOpts;
    logOpts.level = env_truthy(std::getenv("DEEPSEA_TEST_LOG")) ? spdlog::level::trace
                                                                : spdlog::level::off;
    deepsea::logsys::init(logOpts);

    doctest::Context context;

    // ----- sane defaults (can be overridden by CLI flags) -----
    context.setOption("order-by", "name"); // deterministic ordering
    context.setOption("duration", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();

    spdlog::shutdown();
    return res;
}
