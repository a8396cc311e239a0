#include "AlignmentMatrix.hpp"

namespace swalign {

auto operator<<(std::ostream &ostream, const TraceState state) -> std::ostream & {
    switch (state) {
        case TraceState::MATCH:
            return ostream << "MATCH";
        case TraceState::GAP_X:
            return ostream << "GAP_X";
        case TraceState::GAP_Y:
            return ostream << "GAP_Y";
        case TraceState::HALT:
            return ostream << "HALT";
    }
    return ostream;
}

AlignmentMatrix::AlignmentMatrix(std::string_view seq1, std::string_view seq2,
                                 const GapPenalties penalties,
                                 const DoubleGapPolicy doubleGapPolicy)
    : sequence1(seq1),
      sequence2(seq2),
      penalties(penalties),
      doubleGapPolicy(doubleGapPolicy),
      rowsN(seq2.size() + 1),
      colsN(seq1.size() + 1) {
    const seqan3::detail::number_rows numberRows{rowsN};
    const seqan3::detail::number_cols numberCols{colsN};

    for (auto &matrix : stateScores) {
        matrix = ScoreMatrix{numberRows, numberCols};
    }
    for (auto &matrix : stateTraces) {
        matrix = TraceMatrix{numberRows, numberCols};
    }
    bestScores = ScoreMatrix{numberRows, numberCols};
}

void AlignmentMatrix::fillCell(const size_t row, const size_t col, const int32_t similarity) {
    auto &matchScores = stateScores[stateIndex(TraceState::MATCH)];
    auto &gapXScores = stateScores[stateIndex(TraceState::GAP_X)];
    auto &gapYScores = stateScores[stateIndex(TraceState::GAP_Y)];

    const auto diagonal = coordinate(row - 1, col - 1);
    const auto up = coordinate(row - 1, col);
    const auto left = coordinate(row, col - 1);
    const auto current = coordinate(row, col);

    const auto [matchScore, matchOrigin] = selectBest(
        {matchScores[diagonal] + similarity, gapXScores[diagonal] + similarity,
         gapYScores[diagonal] + similarity, 0});

    const auto [gapXScore, gapXOrigin] =
        selectBest({matchScores[up] + penalties.open, gapXScores[up] + penalties.extend,
                    crossGapTerm(gapYScores[up]), 0});

    const auto [gapYScore, gapYOrigin] =
        selectBest({matchScores[left] + penalties.open, crossGapTerm(gapXScores[left]),
                    gapYScores[left] + penalties.extend, 0});

    matchScores[current] = matchScore;
    gapXScores[current] = gapXScore;
    gapYScores[current] = gapYScore;

    stateTraces[stateIndex(TraceState::MATCH)][current] = matchOrigin;
    stateTraces[stateIndex(TraceState::GAP_X)][current] = gapXOrigin;
    stateTraces[stateIndex(TraceState::GAP_Y)][current] = gapYOrigin;

    bestScores[current] = std::max({matchScore, gapXScore, gapYScore});
}

auto AlignmentMatrix::crossGapTerm(const int32_t predecessor) const -> std::optional<int32_t> {
    if (doubleGapPolicy == DoubleGapPolicy::DISALLOW_ORTHOGONAL_EXTENSION) {
        return std::nullopt;
    }
    return predecessor + penalties.open;
}

auto AlignmentMatrix::selectBest(const Candidates &candidates) -> std::pair<int32_t, TraceState> {
    std::optional<int32_t> best;
    size_t origin = stateIndex(TraceState::HALT);

    // Strictly greater keeps the first of equal terms.
    for (size_t index = 0; index < candidates.size(); ++index) {
        const auto &candidate = candidates[index];
        if (candidate.has_value() && (!best.has_value() || candidate.value() > best.value())) {
            best = candidate;
            origin = index;
        }
    }

    return {best.value_or(0), static_cast<TraceState>(origin)};
}

auto AlignmentMatrix::getMax() const -> int32_t {
    return *std::max_element(bestScores.begin(), bestScores.end());
}

auto AlignmentMatrix::getMaxCoord() const -> Coordinate {
    // Row with the highest row maximum first, then the leftmost column of that row.
    size_t bestRow = 0;
    int32_t bestRowMax = bestScore(0, 0);
    for (size_t row = 0; row < rowsN; ++row) {
        for (size_t col = 0; col < colsN; ++col) {
            if (bestScore(row, col) > bestRowMax) {
                bestRowMax = bestScore(row, col);
                bestRow = row;
            }
        }
    }

    size_t bestCol = 0;
    for (size_t col = 0; col < colsN; ++col) {
        if (bestScore(bestRow, col) == bestRowMax) {
            bestCol = col;
            break;
        }
    }

    return {bestRow, bestCol};
}

auto AlignmentMatrix::score(const TraceState state, const size_t row, const size_t col) const
    -> int32_t {
    if (state == TraceState::HALT) {
        return 0;
    }
    return stateScores[stateIndex(state)][coordinate(row, col)];
}

auto AlignmentMatrix::bestScore(const size_t row, const size_t col) const -> int32_t {
    return bestScores[coordinate(row, col)];
}

auto AlignmentMatrix::trace(const TraceState state, const size_t row, const size_t col) const
    -> TraceState {
    if (state == TraceState::HALT) {
        return TraceState::HALT;
    }
    return stateTraces[stateIndex(state)][coordinate(row, col)];
}

auto AlignmentMatrix::scoreMatrix() const -> std::vector<std::vector<int32_t>> {
    std::vector<std::vector<int32_t>> matrix;
    matrix.reserve(rowsN);

    for (size_t row = 0; row < rowsN; ++row) {
        std::vector<int32_t> rowScores;
        rowScores.reserve(colsN);
        for (size_t col = 0; col < colsN; ++col) {
            rowScores.push_back(bestScore(row, col));
        }
        matrix.push_back(std::move(rowScores));
    }

    return matrix;
}

}  // namespace swalign
