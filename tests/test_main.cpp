// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT.
// Other test files include doctest without implementation macros.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    // Keep test output readable; failures are reported by doctest.
    spdlog::set_level(spdlog::level::warn);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.applyCommandLine(argc, argv);

    return context.run();
}
