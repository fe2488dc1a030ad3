#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Many cases exercise failure paths on purpose, keep their expected warnings out of the test output.
    spdlog::set_level(spdlog::level::err);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();
    return res;
}
