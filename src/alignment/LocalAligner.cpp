#include "LocalAligner.hpp"

// Internal
#include "Errors.hpp"

namespace swalign {

auto LocalAligner::validateConfig(const AlignmentConfig &config) -> AlignmentConfig {
    if (config.penalties.open > 0) {
        throw InvalidPenaltyError("Gap open penalty", config.penalties.open);
    }
    if (config.penalties.extend > 0) {
        throw InvalidPenaltyError("Gap extend penalty", config.penalties.extend);
    }
    return config;
}

}  // namespace swalign
