#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "AlignmentReport.hpp"
#include "LocalAligner.hpp"
#include "SimilarityTable.hpp"

using namespace swalign;
using namespace swalign::io;

class AlignmentReportTest : public testing::Test {
   protected:
    const SequencePair sequences{"ACGT", "AGT"};
    const AlignmentResult result =
        align(SimilarityTable::uniform("ACGT", 2, -1), sequences.seq1, sequences.seq2, -1, -1,
              DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION);
};

TEST_F(AlignmentReportTest, WritesSequences) {
    std::ostringstream output;
    AlignmentReport{sequences, result}.writeSequences(output);

    EXPECT_EQ(output.str(),
              "-----------\n|Sequences|\n-----------\n"
              "sequence1\nACGT\n"
              "sequence2\nAGT\n");
}

TEST_F(AlignmentReportTest, WritesLabelledScoreMatrix) {
    std::ostringstream output;
    AlignmentReport{sequences, result}.writeScoreMatrix(output);

    EXPECT_EQ(output.str(),
              "--------------\n|Score Matrix|\n--------------\n"
              "\t\tA\tC\tG\tT\t\n"
              "\t0\t0\t0\t0\t0\t\n"
              "A\t0\t2\t1\t0\t0\t\n"
              "G\t0\t1\t1\t3\t2\t\n"
              "T\t0\t0\t0\t2\t5\t\n");
}

TEST_F(AlignmentReportTest, WritesAlignment) {
    std::ostringstream output;
    AlignmentReport{sequences, result}.writeAlignment(output);

    EXPECT_EQ(output.str(),
              "----------------------\n|Best Local Alignment|\n----------------------\n"
              "Alignment Score:5\n"
              "Alignment Results:\n"
              "(ACGT)\n"
              " | || \n"
              "(A-GT)\n");
}

TEST_F(AlignmentReportTest, StreamOperatorWritesAllSections) {
    std::ostringstream sections;
    const AlignmentReport report{sequences, result};
    report.writeSequences(sections);
    report.writeScoreMatrix(sections);
    report.writeAlignment(sections);

    std::ostringstream streamed;
    streamed << report;

    EXPECT_EQ(streamed.str(), sections.str());
}

TEST(AlignmentReportEmptyTest, EmptySequenceReportsZeroScore) {
    const SequencePair sequences{"", "AC"};
    const AlignmentResult result = align(SimilarityTable::uniform("AC", 1, -1), sequences.seq1,
                                         sequences.seq2, -2, -1,
                                         DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION);

    std::ostringstream output;
    AlignmentReport{sequences, result}.write(output);
    const std::string report = output.str();

    EXPECT_NE(report.find("\t\t\n\t0\t\nA\t0\t\nC\t0\t\n"), std::string::npos);
    EXPECT_NE(report.find("Alignment Score:0\nAlignment Results:\n\n\n\n"), std::string::npos);
}
