#pragma once

// Standard
#include <concepts>

namespace swalign {

// Affinity lookup for an ordered symbol pair: score(seq1 symbol, seq2 symbol).
template <typename scoring_t>
concept SimilarityScoring = requires(const scoring_t &scoring, char first, char second) {
    { scoring.score(first, second) } -> std::convertible_to<int>;
};

}  // namespace swalign
