#pragma once

namespace swalign::helper {

// Prints a short backtrace to stderr and exits.
void crashHandler(int sig);

}  // namespace swalign::helper
