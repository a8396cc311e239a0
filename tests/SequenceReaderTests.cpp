#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "Errors.hpp"
#include "SequenceReader.hpp"

using namespace swalign;
using namespace swalign::io;

TEST(SequenceReaderTest, ReadsFirstTwoLines) {
    std::istringstream input{"ACGT\nAGT\nTTTT\n"};

    const SequencePair sequences = SequenceReader::readPlain(input);

    EXPECT_EQ(sequences.seq1, "ACGT");
    EXPECT_EQ(sequences.seq2, "AGT");
}

TEST(SequenceReaderTest, TrimsSurroundingWhitespace) {
    std::istringstream input{"  ACGT \r\n\tAGT\r\n"};

    const SequencePair sequences = SequenceReader::readPlain(input);

    EXPECT_EQ(sequences.seq1, "ACGT");
    EXPECT_EQ(sequences.seq2, "AGT");
}

TEST(SequenceReaderTest, KeepsEmptySecondLine) {
    std::istringstream input{"ACGT\n\n"};

    const SequencePair sequences = SequenceReader::readPlain(input);

    EXPECT_EQ(sequences.seq1, "ACGT");
    EXPECT_TRUE(sequences.seq2.empty());
}

TEST(SequenceReaderTest, RejectsSingleSequence) {
    std::istringstream input{"ACGT"};

    EXPECT_THROW(static_cast<void>(SequenceReader::readPlain(input)), InputFormatError);
}

TEST(SequenceReaderTest, ReadsFasta) {
    std::istringstream input{
        ">first\n"
        "ACGT\n"
        "TTGA\n"
        ">second\n"
        "AGT\n"
        ">third\n"
        "CCCC\n"};

    const SequencePair sequences = SequenceReader::readFasta(input);

    EXPECT_EQ(sequences.seq1, "ACGTTTGA");
    EXPECT_EQ(sequences.seq2, "AGT");
}

TEST(SequenceReaderTest, RejectsFastaWithSingleRecord) {
    std::istringstream input{">only\nACGT\n"};

    EXPECT_THROW(static_cast<void>(SequenceReader::readFasta(input)), InputFormatError);
}

TEST(SequenceReaderTest, RecognisesFastaSuffix) {
    EXPECT_TRUE(SequenceReader::isFastaPath("pair.fa"));
    EXPECT_TRUE(SequenceReader::isFastaPath("pair.fasta"));
    EXPECT_TRUE(SequenceReader::isFastaPath("dir/pair.FNA"));
    EXPECT_TRUE(SequenceReader::isFastaPath("protein.faa"));
    EXPECT_FALSE(SequenceReader::isFastaPath("pair.txt"));
    EXPECT_FALSE(SequenceReader::isFastaPath("pair"));
}

TEST(SequenceReaderTest, ReadDispatchesOnSuffix) {
    const std::filesystem::path directory = std::filesystem::temp_directory_path();
    const std::filesystem::path plainPath = directory / "swalign_reader_test.txt";
    const std::filesystem::path fastaPath = directory / "swalign_reader_test.fasta";

    {
        std::ofstream plain{plainPath};
        plain << "GATTACA\nGACTATA\n";
        std::ofstream fasta{fastaPath};
        fasta << ">a\nGATTACA\n>b\nGACTATA\n";
    }

    const SequencePair plainSequences = SequenceReader::read(plainPath);
    const SequencePair fastaSequences = SequenceReader::read(fastaPath);

    EXPECT_EQ(plainSequences.seq1, "GATTACA");
    EXPECT_EQ(plainSequences.seq2, "GACTATA");
    EXPECT_EQ(fastaSequences.seq1, plainSequences.seq1);
    EXPECT_EQ(fastaSequences.seq2, plainSequences.seq2);

    std::filesystem::remove(plainPath);
    std::filesystem::remove(fastaPath);
}

TEST(SequenceReaderTest, MissingFileThrows) {
    EXPECT_THROW(static_cast<void>(SequenceReader::read("/nonexistent/pair.txt")),
                 std::runtime_error);
}
