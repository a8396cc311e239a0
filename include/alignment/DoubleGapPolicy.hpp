#pragma once

// Standard
#include <istream>
#include <ostream>

namespace swalign {

/* Whether a gap in one sequence may directly follow a gap in the other one.
 * ALLOW_ORTHOGONAL_EXTENSION scores the switch like a freshly opened gap,
 * DISALLOW_ORTHOGONAL_EXTENSION requires an aligned symbol pair in between.
 */
enum class DoubleGapPolicy { ALLOW_ORTHOGONAL_EXTENSION, DISALLOW_ORTHOGONAL_EXTENSION };

auto operator>>(std::istream &input, DoubleGapPolicy &policy) -> std::istream &;
auto operator<<(std::ostream &output, DoubleGapPolicy policy) -> std::ostream &;

}  // namespace swalign
