// The only translation unit in eph_tests that provides the doctest implementation and main.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "logging.hpp"

int main(int argc, char **argv)
{
    // fallbacks exercised by the tests log at warn level
    eph_log::init(spdlog::level::err);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.applyCommandLine(argc, argv);

    return context.run();
}
