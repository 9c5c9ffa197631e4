#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Validation failures deliberately provoked by the tests log at error level.
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%l] %v");
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
