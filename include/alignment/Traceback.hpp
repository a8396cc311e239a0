#pragma once

// Standard
#include <cstddef>
#include <string>

// Internal
#include "AlignmentMatrix.hpp"

namespace swalign {

// Three parallel display lines. Unaligned context is enclosed in '(' and ')'.
struct AlignedSequences {
    std::string topLine;
    std::string matchLine;
    std::string bottomLine;
    Coordinate beginCoordinate{0, 0};
    Coordinate endCoordinate{0, 0};

    [[nodiscard]] auto empty() const -> bool { return topLine.empty(); }
};

/* Rebuilds the best local alignment from a filled AlignmentMatrix.
 *
 * The walk starts at the best cell and follows the traceback matrix of the current state
 * until it reaches HALT or a zero score. The aligned region is then framed by the remaining
 * prefixes and suffixes of both sequences.
 */
class Traceback {
   public:
    explicit Traceback(const AlignmentMatrix &matrix) : matrix(matrix) {}

    [[nodiscard]] auto reconstruct() const -> AlignedSequences;
    [[nodiscard]] auto reconstruct(Coordinate endCoordinate) const -> AlignedSequences;

    [[nodiscard]] auto startState(Coordinate endCoordinate) const -> TraceState;

   private:
    struct AlignmentBuilder {
        std::string topLine;
        std::string matchLine;
        std::string bottomLine;

        void append(char top, char match, char bottom);
        void reverse();
    };

    static constexpr char gapSymbol = '-';
    static constexpr char matchSymbol = '|';
    static constexpr char paddingSymbol = ' ';
    static constexpr char contextOpenSymbol = '(';
    static constexpr char contextCloseSymbol = ')';

    const AlignmentMatrix &matrix;

    auto traceAlignedRegion(AlignmentBuilder &builder, Coordinate endCoordinate) const
        -> Coordinate;
    void completeFront(AlignmentBuilder &builder, Coordinate haltCoordinate) const;
    void completeBack(AlignmentBuilder &builder, Coordinate firstTrailingCoordinate) const;

    [[nodiscard]] auto seq1Symbol(size_t col) const -> char { return matrix.seq1()[col - 1]; }
    [[nodiscard]] auto seq2Symbol(size_t row) const -> char { return matrix.seq2()[row - 1]; }
};

}  // namespace swalign
