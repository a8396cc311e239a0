#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Internal
#include "AlignmentMatrix.hpp"
#include "Constants.hpp"
#include "DoubleGapPolicy.hpp"
#include "Logger.hpp"
#include "SimilarityScoring.hpp"
#include "Traceback.hpp"

namespace swalign {

struct AlignmentConfig {
    GapPenalties penalties{constants::defaultOpenPenalty, constants::defaultExtendPenalty};
    DoubleGapPolicy doubleGapPolicy{DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION};
    // More than one thread selects the wavefront fill.
    size_t threadCount{1};
};

struct AlignmentResult {
    int32_t bestScore{0};
    Coordinate bestCoordinate{0, 0};
    Coordinate beginCoordinate{0, 0};
    std::string topLine;
    std::string matchLine;
    std::string bottomLine;
    std::vector<std::vector<int32_t>> fullScoreMatrix;

    auto operator==(const AlignmentResult &other) const -> bool = default;
};

class LocalAligner {
   public:
    // Throws InvalidPenaltyError for positive penalties.
    explicit LocalAligner(const AlignmentConfig &config)
        : alignmentConfig(validateConfig(config)) {}

    template <SimilarityScoring scoring_t>
    auto align(const scoring_t &scoring, std::string_view seq1,
               std::string_view seq2) const -> AlignmentResult;

    [[nodiscard]] auto config() const -> const AlignmentConfig & { return alignmentConfig; }

   private:
    AlignmentConfig alignmentConfig;

    static auto validateConfig(const AlignmentConfig &config) -> AlignmentConfig;
};

template <SimilarityScoring scoring_t>
auto LocalAligner::align(const scoring_t &scoring, std::string_view seq1,
                         std::string_view seq2) const -> AlignmentResult {
    AlignmentMatrix matrix{seq1, seq2, alignmentConfig.penalties,
                           alignmentConfig.doubleGapPolicy};

    if (seq1.empty() || seq2.empty()) {
        Logger::log(LogLevel::DEBUG, "Empty input sequence, returning empty alignment");
        return {0, {0, 0}, {0, 0}, "", "", "", matrix.scoreMatrix()};
    }

    Logger::log(LogLevel::DEBUG, "Filling ", matrix.rows(), "x", matrix.cols(),
                " alignment matrices");

    if (alignmentConfig.threadCount > 1) {
        matrix.fillMatrixWavefront(scoring, alignmentConfig.threadCount);
    } else {
        matrix.fillMatrix(scoring);
    }

    const Coordinate bestCoordinate = matrix.getMaxCoord();
    const AlignedSequences aligned = Traceback{matrix}.reconstruct(bestCoordinate);

    Logger::log(LogLevel::DEBUG, "Best local alignment ends at ", bestCoordinate.row, ",",
                bestCoordinate.col, " and starts after ", aligned.beginCoordinate.row, ",",
                aligned.beginCoordinate.col);

    return {matrix.getMax(),    bestCoordinate,     aligned.beginCoordinate, aligned.topLine,
            aligned.matchLine, aligned.bottomLine, matrix.scoreMatrix()};
}

// Single call form of LocalAligner::align.
template <SimilarityScoring scoring_t>
auto align(const scoring_t &scoring, std::string_view seq1, std::string_view seq2,
           const int openPenalty, const int extendPenalty,
           const DoubleGapPolicy doubleGapPolicy) -> AlignmentResult {
    const LocalAligner aligner{AlignmentConfig{{openPenalty, extendPenalty}, doubleGapPolicy, 1}};
    return aligner.align(scoring, seq1, seq2);
}

}  // namespace swalign
