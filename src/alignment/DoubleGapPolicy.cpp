#include "DoubleGapPolicy.hpp"

// Standard
#include <string>

namespace swalign {

auto operator>>(std::istream &input, DoubleGapPolicy &policy) -> std::istream & {
    std::string token;
    input >> token;

    if (token == "allow") {
        policy = DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION;
    } else if (token == "disallow") {
        policy = DoubleGapPolicy::DISALLOW_ORTHOGONAL_EXTENSION;
    } else {
        input.setstate(std::ios_base::failbit);
    }
    return input;
}

auto operator<<(std::ostream &output, const DoubleGapPolicy policy) -> std::ostream & {
    switch (policy) {
        case DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION:
            return output << "allow";
        case DoubleGapPolicy::DISALLOW_ORTHOGONAL_EXTENSION:
            return output << "disallow";
    }
    return output;
}

}  // namespace swalign
