#pragma once

// Standard
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// seqan3
#include <seqan3/alignment/matrix/detail/matrix_coordinate.hpp>
#include <seqan3/alignment/matrix/detail/two_dimensional_matrix.hpp>

// Internal
#include "DoubleGapPolicy.hpp"
#include "SimilarityScoring.hpp"

namespace swalign {

/* Origin of a cell value. The first three states also name the matrix they refer to:
 * MATCH -> M/TM, GAP_X -> Ix/TIx, GAP_Y -> Iy/TIy.
 * HALT means the zero floor won and a local alignment starts here.
 */
enum class TraceState : uint8_t { MATCH = 0, GAP_X = 1, GAP_Y = 2, HALT = 3 };

auto operator<<(std::ostream &ostream, TraceState state) -> std::ostream &;

struct Coordinate {
    size_t row;
    size_t col;

    auto operator==(const Coordinate &other) const -> bool = default;
};

inline auto operator<<(std::ostream &ostream, const Coordinate &coordinate) -> std::ostream & {
    return ostream << "(" << coordinate.row << ", " << coordinate.col << ")";
}

struct GapPenalties {
    int open;
    int extend;
};

/* Dynamic programming state of an affine gap local alignment.
 *
 * seq1 spans the columns and seq2 the rows, both shifted by one so that row 0 and column 0
 * form the zero border. Ix holds alignments ending in a gap that consumes a seq2 symbol
 * (vertical move), Iy those ending in a gap that consumes a seq1 symbol (horizontal move).
 * F is the cellwise maximum of M, Ix and Iy.
 */
class AlignmentMatrix {
   public:
    using ScoreMatrix = seqan3::detail::two_dimensional_matrix<int32_t>;
    using TraceMatrix = seqan3::detail::two_dimensional_matrix<TraceState>;

    AlignmentMatrix(std::string_view seq1, std::string_view seq2, GapPenalties penalties,
                    DoubleGapPolicy doubleGapPolicy);

    // Row-major fill. Throws if the scoring misses a symbol pair of the two sequences.
    template <SimilarityScoring scoring_t>
    void fillMatrix(const scoring_t &scoring);

    // Anti-diagonal fill on threadCount OpenMP threads, identical to fillMatrix.
    template <SimilarityScoring scoring_t>
    void fillMatrixWavefront(const scoring_t &scoring, size_t threadCount);

    [[nodiscard]] auto getMax() const -> int32_t;
    [[nodiscard]] auto getMaxCoord() const -> Coordinate;

    // Score in the matrix a state refers to (M, Ix or Iy). HALT reads as zero.
    [[nodiscard]] auto score(TraceState state, size_t row, size_t col) const -> int32_t;
    [[nodiscard]] auto bestScore(size_t row, size_t col) const -> int32_t;
    [[nodiscard]] auto trace(TraceState state, size_t row, size_t col) const -> TraceState;

    [[nodiscard]] auto scoreMatrix() const -> std::vector<std::vector<int32_t>>;

    [[nodiscard]] auto rows() const -> size_t { return rowsN; }
    [[nodiscard]] auto cols() const -> size_t { return colsN; }
    [[nodiscard]] auto isFilled() const -> bool { return filled; }

    [[nodiscard]] auto seq1() const -> const std::string & { return sequence1; }
    [[nodiscard]] auto seq2() const -> const std::string & { return sequence2; }

   private:
    // Terms of one recurrence in tie-break order. An empty term does not take part.
    using Candidates = std::array<std::optional<int32_t>, 4>;

    std::string sequence1;
    std::string sequence2;
    GapPenalties penalties;
    DoubleGapPolicy doubleGapPolicy;

    size_t rowsN;
    size_t colsN;
    bool filled{false};

    std::array<ScoreMatrix, 3> stateScores;
    std::array<TraceMatrix, 3> stateTraces;
    ScoreMatrix bestScores;

    template <SimilarityScoring scoring_t>
    void checkScoringCoverage(const scoring_t &scoring) const;

    void fillCell(size_t row, size_t col, int32_t similarity);

    [[nodiscard]] auto crossGapTerm(int32_t predecessor) const -> std::optional<int32_t>;

    static auto selectBest(const Candidates &candidates) -> std::pair<int32_t, TraceState>;

    static auto coordinate(size_t row, size_t col) -> seqan3::detail::matrix_coordinate {
        return seqan3::detail::matrix_coordinate{seqan3::detail::row_index_type{row},
                                                 seqan3::detail::column_index_type{col}};
    }

    static auto stateIndex(TraceState state) -> size_t { return static_cast<size_t>(state); }
};

template <SimilarityScoring scoring_t>
void AlignmentMatrix::checkScoringCoverage(const scoring_t &scoring) const {
    const std::set<char> symbols1(sequence1.begin(), sequence1.end());
    const std::set<char> symbols2(sequence2.begin(), sequence2.end());

    for (const char symbol1 : symbols1) {
        for (const char symbol2 : symbols2) {
            static_cast<void>(scoring.score(symbol1, symbol2));
        }
    }
}

template <SimilarityScoring scoring_t>
void AlignmentMatrix::fillMatrix(const scoring_t &scoring) {
    checkScoringCoverage(scoring);

    // Every cell reads its upper, left and diagonal neighbours, so rows must go top to bottom
    // and columns left to right.
    for (size_t row = 1; row < rowsN; ++row) {
        for (size_t col = 1; col < colsN; ++col) {
            const int32_t similarity = scoring.score(sequence1[col - 1], sequence2[row - 1]);
            fillCell(row, col, similarity);
        }
    }

    filled = true;
}

template <SimilarityScoring scoring_t>
void AlignmentMatrix::fillMatrixWavefront(const scoring_t &scoring, const size_t threadCount) {
    // Scoring errors cannot leave an OpenMP region, all pairs are checked up front.
    checkScoringCoverage(scoring);

    const auto threads = static_cast<int>(std::max<size_t>(threadCount, 1));
    const auto lastRow = static_cast<std::ptrdiff_t>(rowsN) - 1;
    const auto lastCol = static_cast<std::ptrdiff_t>(colsN) - 1;

    for (std::ptrdiff_t diagonal = 2; diagonal <= lastRow + lastCol; ++diagonal) {
        const std::ptrdiff_t firstDiagonalRow = std::max<std::ptrdiff_t>(1, diagonal - lastCol);
        const std::ptrdiff_t lastDiagonalRow = std::min<std::ptrdiff_t>(lastRow, diagonal - 1);

#pragma omp parallel for num_threads(threads) schedule(static)
        for (std::ptrdiff_t row = firstDiagonalRow; row <= lastDiagonalRow; ++row) {
            const auto cellRow = static_cast<size_t>(row);
            const auto cellCol = static_cast<size_t>(diagonal - row);
            const int32_t similarity =
                scoring.score(sequence1[cellCol - 1], sequence2[cellRow - 1]);
            fillCell(cellRow, cellCol, similarity);
        }
    }

    filled = true;
}

}  // namespace swalign
