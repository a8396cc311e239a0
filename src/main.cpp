// Standard
#include <csignal>
#include <cstdlib>

// Internal
#include "Runner.hpp"
#include "Utility.hpp"

auto main(int argc, const char* const argv[]) -> int {
    signal(SIGSEGV, swalign::helper::crashHandler);

    swalign::Runner::run(argc, argv);

    return EXIT_SUCCESS;
}
