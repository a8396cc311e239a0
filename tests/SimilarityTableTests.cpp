#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "AlignmentMatrix.hpp"
#include "Errors.hpp"
#include "SimilarityTable.hpp"
#include "SimilarityTableParser.hpp"

using namespace swalign;
using namespace swalign::io;

TEST(SimilarityTableTest, UniformTable) {
    const SimilarityTable table = SimilarityTable::uniform("ACGT", 2, -1);

    EXPECT_EQ(table.size(), 16U);
    EXPECT_EQ(table.score('A', 'A'), 2);
    EXPECT_EQ(table.score('A', 'C'), -1);
    EXPECT_EQ(table.score('T', 'G'), -1);
    EXPECT_TRUE(table.isSymmetric());
}

TEST(SimilarityTableTest, SetAndFind) {
    SimilarityTable table;
    EXPECT_TRUE(table.empty());

    table.set('A', 'C', 5);
    table.set('A', 'C', 7);

    EXPECT_EQ(table.size(), 1U);
    EXPECT_EQ(table.find('A', 'C'), 7);
    EXPECT_FALSE(table.find('C', 'A').has_value());
    EXPECT_TRUE(table.contains('A', 'C'));
    EXPECT_FALSE(table.contains('C', 'A'));
    EXPECT_FALSE(table.isSymmetric());
}

TEST(SimilarityTableTest, MissingPairThrows) {
    const SimilarityTable table = SimilarityTable::uniform("AC", 1, -1);

    try {
        static_cast<void>(table.score('A', 'U'));
        FAIL() << "Expected MissingScoreError";
    } catch (const MissingScoreError &error) {
        EXPECT_EQ(error.first, 'A');
        EXPECT_EQ(error.second, 'U');
    }
}

TEST(SimilarityTableParserTest, ParsesLabelledTable) {
    std::istringstream input{
        "# simple DNA table\n"
        "\n"
        "   A  C  G  T\n"
        "A  2 -1 -1 -1\n"
        "C -1  2 -1 -1\n"
        "\t# transitions score higher\n"
        "G -1 -1  2  0\n"
        "T -1 -1  0  2\n"};

    const SimilarityTable table = SimilarityTableParser::parse(input);

    EXPECT_EQ(table.size(), 16U);
    EXPECT_EQ(table.score('A', 'A'), 2);
    EXPECT_EQ(table.score('C', 'G'), -1);
    EXPECT_EQ(table.score('G', 'T'), 0);
    EXPECT_TRUE(table.isSymmetric());
}

TEST(SimilarityTableParserTest, RowSymbolIsFirstArgument) {
    std::istringstream input{
        "  A C\n"
        "A 1 5\n"
        "C 9 1\n"};

    const SimilarityTable table = SimilarityTableParser::parse(input);

    EXPECT_EQ(table.score('A', 'C'), 5);
    EXPECT_EQ(table.score('C', 'A'), 9);
    EXPECT_FALSE(table.isSymmetric());
}

TEST(SimilarityTableParserTest, ParsedTableDrivesAlignment) {
    std::istringstream input{
        "  A C\n"
        "A 1 5\n"
        "C 9 1\n"};
    const SimilarityTable table = SimilarityTableParser::parse(input);

    // seq1 symbols select the row, seq2 symbols the column.
    AlignmentMatrix matrix{"A", "C", {-2, -1}, DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION};
    matrix.fillMatrix(table);

    EXPECT_EQ(matrix.getMax(), 5);
}

TEST(SimilarityTableParserTest, RejectsRaggedRow) {
    std::istringstream input{
        "  A C\n"
        "A 1 -1\n"
        "C -1\n"};

    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(input)), ScoreTableFormatError);
}

TEST(SimilarityTableParserTest, RejectsNonIntegerScore) {
    std::istringstream fraction{
        "  A C\n"
        "A 1 0.5\n"
        "C 0 1\n"};
    std::istringstream word{
        "  A C\n"
        "A 1 x\n"
        "C 0 1\n"};

    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(fraction)),
                 ScoreTableFormatError);
    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(word)), ScoreTableFormatError);
}

TEST(SimilarityTableParserTest, RejectsMultiCharacterLabel) {
    std::istringstream input{
        "   A  CG\n"
        "A  1 -1\n"
        "CG -1 1\n"};

    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(input)), ScoreTableFormatError);
}

TEST(SimilarityTableParserTest, RejectsDuplicateLabels) {
    std::istringstream duplicateColumn{
        "  A A\n"
        "A 1 1\n"};
    std::istringstream duplicateRow{
        "  A C\n"
        "A 1 0\n"
        "A 0 1\n"};

    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(duplicateColumn)),
                 ScoreTableFormatError);
    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(duplicateRow)),
                 ScoreTableFormatError);
}

TEST(SimilarityTableParserTest, RejectsEmptyTable) {
    std::istringstream onlyComments{"# nothing here\n\n"};
    std::istringstream onlyHeader{"  A C G T\n"};

    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(onlyComments)),
                 ScoreTableFormatError);
    EXPECT_THROW(static_cast<void>(SimilarityTableParser::parse(onlyHeader)),
                 ScoreTableFormatError);
}

TEST(SimilarityTableParserTest, MissingFileThrows) {
    EXPECT_THROW(
        static_cast<void>(SimilarityTableParser::parseFile("/nonexistent/score_table.txt")),
        std::runtime_error);
}
