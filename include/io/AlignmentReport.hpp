#pragma once

// Standard
#include <ostream>

// Internal
#include "LocalAligner.hpp"
#include "SequenceReader.hpp"

namespace swalign::io {

// Console report: input sequences, labelled score matrix F and the best local alignment.
class AlignmentReport {
   public:
    AlignmentReport(const SequencePair &sequences, const AlignmentResult &result)
        : sequences(sequences), result(result) {}

    void write(std::ostream &output) const;

    void writeSequences(std::ostream &output) const;
    void writeScoreMatrix(std::ostream &output) const;
    void writeAlignment(std::ostream &output) const;

   private:
    const SequencePair &sequences;
    const AlignmentResult &result;
};

inline auto operator<<(std::ostream &output, const AlignmentReport &report) -> std::ostream & {
    report.write(output);
    return output;
}

}  // namespace swalign::io
