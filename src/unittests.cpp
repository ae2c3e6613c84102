#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%l] %v");
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
