#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <swarmkad/util/logging.hpp>

int main(int argc, char* argv[])
{
    swarmkad::log::reset_level(swarmkad::log::Level::off);

    return Catch::Session().run(argc, argv);
}
