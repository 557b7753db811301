#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <careful/base/checks.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.h>

namespace careful::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (careful::get_environment_variable("CARGO_CAREFUL_DEBUG").value_or("") == "1")
    {
        careful::Debug::g_debugging = true;
    }

    return Catch::Session().run(argc, argv);
}
