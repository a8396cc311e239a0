#include "AlignmentReport.hpp"

// Internal
#include "Constants.hpp"

namespace swalign::io {

namespace rp = constants::report;

void AlignmentReport::write(std::ostream &output) const {
    writeSequences(output);
    writeScoreMatrix(output);
    writeAlignment(output);
}

void AlignmentReport::writeSequences(std::ostream &output) const {
    output << rp::SEQUENCES_HEADER << '\n'
           << rp::SEQUENCE1_LABEL << '\n'
           << sequences.seq1 << '\n'
           << rp::SEQUENCE2_LABEL << '\n'
           << sequences.seq2 << '\n';
}

// Every cell is followed by a tab. The header leaves the label and sentinel columns blank.
void AlignmentReport::writeScoreMatrix(std::ostream &output) const {
    output << rp::SCORE_MATRIX_HEADER << '\n';

    output << rp::columnSeparator << rp::columnSeparator;
    for (const char symbol : sequences.seq1) {
        output << symbol << rp::columnSeparator;
    }
    output << '\n';

    for (size_t row = 0; row < result.fullScoreMatrix.size(); ++row) {
        if (row > 0) {
            output << sequences.seq2[row - 1];
        }
        output << rp::columnSeparator;
        for (const int32_t score : result.fullScoreMatrix[row]) {
            output << score << rp::columnSeparator;
        }
        output << '\n';
    }
}

void AlignmentReport::writeAlignment(std::ostream &output) const {
    output << rp::ALIGNMENT_HEADER << '\n'
           << rp::SCORE_LABEL << result.bestScore << '\n'
           << rp::RESULTS_LABEL << '\n'
           << result.topLine << '\n'
           << result.matchLine << '\n'
           << result.bottomLine << '\n';
}

}  // namespace swalign::io
