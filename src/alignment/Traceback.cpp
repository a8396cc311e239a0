#include "Traceback.hpp"

// Standard
#include <algorithm>
#include <utility>

namespace swalign {

void Traceback::AlignmentBuilder::append(const char top, const char match, const char bottom) {
    topLine.push_back(top);
    matchLine.push_back(match);
    bottomLine.push_back(bottom);
}

void Traceback::AlignmentBuilder::reverse() {
    std::ranges::reverse(topLine);
    std::ranges::reverse(matchLine);
    std::ranges::reverse(bottomLine);
}

auto Traceback::reconstruct() const -> AlignedSequences {
    return reconstruct(matrix.getMaxCoord());
}

auto Traceback::reconstruct(const Coordinate endCoordinate) const -> AlignedSequences {
    if (matrix.seq1().empty() || matrix.seq2().empty()) {
        return {};
    }

    AlignmentBuilder builder;

    const Coordinate haltCoordinate = traceAlignedRegion(builder, endCoordinate);
    completeFront(builder, haltCoordinate);
    builder.reverse();
    completeBack(builder, {endCoordinate.row + 1, endCoordinate.col + 1});

    return {std::move(builder.topLine), std::move(builder.matchLine),
            std::move(builder.bottomLine), haltCoordinate, endCoordinate};
}

auto Traceback::startState(const Coordinate endCoordinate) const -> TraceState {
    const int32_t best = matrix.bestScore(endCoordinate.row, endCoordinate.col);

    for (const TraceState state : {TraceState::MATCH, TraceState::GAP_X, TraceState::GAP_Y}) {
        if (matrix.score(state, endCoordinate.row, endCoordinate.col) == best) {
            return state;
        }
    }
    return TraceState::MATCH;
}

// Appends the aligned region back to front and returns the coordinate the walk halted at.
auto Traceback::traceAlignedRegion(AlignmentBuilder &builder, const Coordinate endCoordinate) const
    -> Coordinate {
    size_t row = endCoordinate.row;
    size_t col = endCoordinate.col;
    TraceState state = startState(endCoordinate);
    int32_t currentScore = matrix.score(state, row, col);

    while (currentScore != 0 && state != TraceState::HALT) {
        const TraceState nextState = matrix.trace(state, row, col);

        switch (state) {
            case TraceState::MATCH: {
                const char symbol1 = seq1Symbol(col);
                const char symbol2 = seq2Symbol(row);
                builder.append(symbol1, symbol1 == symbol2 ? matchSymbol : paddingSymbol,
                               symbol2);
                --row;
                --col;
                break;
            }
            case TraceState::GAP_X:
                builder.append(gapSymbol, paddingSymbol, seq2Symbol(row));
                --row;
                break;
            case TraceState::GAP_Y:
                builder.append(seq1Symbol(col), paddingSymbol, gapSymbol);
                --col;
                break;
            case TraceState::HALT:
                break;
        }

        state = nextState;
        currentScore = matrix.score(state, row, col);
    }

    return {row, col};
}

// Prefixes end up right-aligned once the builder is reversed.
void Traceback::completeFront(AlignmentBuilder &builder, const Coordinate haltCoordinate) const {
    builder.append(contextOpenSymbol, paddingSymbol, contextOpenSymbol);

    size_t row = haltCoordinate.row;
    size_t col = haltCoordinate.col;
    while (row > 0 || col > 0) {
        builder.append(col > 0 ? seq1Symbol(col) : paddingSymbol, paddingSymbol,
                       row > 0 ? seq2Symbol(row) : paddingSymbol);
        row = row > 0 ? row - 1 : 0;
        col = col > 0 ? col - 1 : 0;
    }
}

void Traceback::completeBack(AlignmentBuilder &builder,
                             const Coordinate firstTrailingCoordinate) const {
    builder.append(contextCloseSymbol, paddingSymbol, contextCloseSymbol);

    const size_t lastRow = matrix.seq2().size();
    const size_t lastCol = matrix.seq1().size();

    for (size_t row = firstTrailingCoordinate.row, col = firstTrailingCoordinate.col;
         row <= lastRow || col <= lastCol; ++row, ++col) {
        builder.append(col <= lastCol ? seq1Symbol(col) : paddingSymbol, paddingSymbol,
                       row <= lastRow ? seq2Symbol(row) : paddingSymbol);
    }
}

}  // namespace swalign
