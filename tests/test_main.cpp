// tests/test_main.cpp
//
// Sole owner of DOCTEST_CONFIG_IMPLEMENT in herd_tests; every other test file
// includes doctest plainly.
//
// Environment:
//   HERD_TEST_LOG      logger level for the run ("debug", "info", ...). Default "off":
//                      several suites fail builds on purpose and would flood the report.
//   HERD_TEST_LOG_DIR  when set, also write herd.log into that directory.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include "herd/logging/Log.h"

#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && v[0] != '\0') ? v : nullptr;
}

bool is_ci_run() {
    for (const char* name : { "CI", "GITHUB_ACTIONS" }) {
        const char* v = env_or_null(name);
        if (v && std::strcmp(v, "0") != 0) return true;
    }
    return false;
}

void configure_logging() {
    const char* level = env_or_null("HERD_TEST_LOG");
    herd::logsys::set_level(level ? level : "off");

    if (const char* dir = env_or_null("HERD_TEST_LOG_DIR"))
        herd::logsys::init_file_logs(std::filesystem::path(dir));
}

} // namespace

int main(int argc, char** argv) {
    configure_logging();

    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);
    context.setOption("no-path-filenames", true);
    if (is_ci_run()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Command-line flags win over the defaults above.
    context.applyCommandLine(argc, argv);
    return context.run();
}
