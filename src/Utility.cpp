#include "Utility.hpp"

#include <execinfo.h>
#include <unistd.h>

#include <array>
#include <cstdlib>
#include <iostream>

namespace swalign::helper {

void crashHandler(int sig) {
    constexpr size_t MAX_FRAMES = 10;
    std::array<void*, MAX_FRAMES> array{};
    int size = backtrace(array.data(), MAX_FRAMES);

    std::cerr << "Error: signal " << sig << ":" << '\n';
    backtrace_symbols_fd(array.data(), size, STDERR_FILENO);
    exit(1);
}

}  // namespace swalign::helper
