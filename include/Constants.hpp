#pragma once
// Standard
#include <cstddef>
#include <string>

namespace swalign::constants {
const std::string GENERAL_DESCRIPTION =
    "SWAlign computes the optimal local alignment of two sequences with affine gap "
    "penalties (Smith-Waterman).\n\nMinimum call: swalign -i <sequence-file> -s "
    "<score-table-file>\nOr run SWAlign with a config file: swalign -c <config-file>\n\n"
    "General Options";
const std::string ALIGNMENT_DESCRIPTION = "Alignment Options";
const std::string OTHER_DESCRIPTION = "Other";

// Alignment defaults
constexpr int defaultOpenPenalty = -2;
constexpr int defaultExtendPenalty = -1;
constexpr int defaultThreadCount = 1;
const std::string defaultLogLevel = "info";
}  // namespace swalign::constants

namespace swalign::constants::report {
const std::string SEQUENCES_HEADER = "-----------\n|Sequences|\n-----------";
const std::string SCORE_MATRIX_HEADER = "--------------\n|Score Matrix|\n--------------";
const std::string ALIGNMENT_HEADER =
    "----------------------\n|Best Local Alignment|\n----------------------";
const std::string SEQUENCE1_LABEL = "sequence1";
const std::string SEQUENCE2_LABEL = "sequence2";
const std::string SCORE_LABEL = "Alignment Score:";
const std::string RESULTS_LABEL = "Alignment Results:";
constexpr char columnSeparator = '\t';
}  // namespace swalign::constants::report

namespace swalign::constants::input {
constexpr char commentPrefix = '#';
constexpr size_t expectedSequenceCount = 2;
}  // namespace swalign::constants::input
