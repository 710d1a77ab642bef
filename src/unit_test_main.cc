#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <log/log.h>

int main(int argc, char **argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);

    spdlog::set_level(spdlog::level::warn);

    return context.run();
}
