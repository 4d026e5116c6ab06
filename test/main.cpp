#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <spdlog/spdlog.h>
#include <tpie/tpie.h>

#include "biglist/common.hpp"
#include "biglist/log.hpp"

int main(int argc, char** argv) {
    int result = 0;

    tpie::tpie_init();
    {
        // Dirty-state warnings are expected in many tests.
        biglist::log()->set_level(spdlog::level::err);

        result = Catch::Session().run(argc, argv);
    }
    tpie::tpie_finish();
    return result;
}
