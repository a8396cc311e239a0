#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "ParameterParser.hpp"
#include "Runner.hpp"

using namespace swalign;

class RunnerTest : public testing::Test {
   protected:
    std::filesystem::path directory;
    std::filesystem::path sequencesPath;
    std::filesystem::path scoreTablePath;

    void SetUp() override {
        directory = std::filesystem::temp_directory_path() / "swalign_runner_test";
        std::filesystem::create_directories(directory);

        sequencesPath = directory / "pair.fasta";
        scoreTablePath = directory / "dna.txt";

        std::ofstream{sequencesPath} << ">seq1\nACGT\n>seq2\nAGT\n";
        std::ofstream{scoreTablePath} << "# match 2, mismatch -1\n"
                                         "   A  C  G  T\n"
                                         "A  2 -1 -1 -1\n"
                                         "C -1  2 -1 -1\n"
                                         "G -1 -1  2 -1\n"
                                         "T -1 -1 -1  2\n";
    }

    void TearDown() override { std::filesystem::remove_all(directory); }

    static auto parseArguments(const std::vector<std::string> &arguments)
        -> parameters::AlignParameters {
        std::vector<const char *> argv{"swalign"};
        for (const auto &argument : arguments) {
            argv.push_back(argument.c_str());
        }
        return parameters::ParameterParser::getParameters(static_cast<int>(argv.size()),
                                                          argv.data());
    }
};

TEST_F(RunnerTest, WritesReportWithDefaultPenalties) {
    std::ostringstream output;
    Runner::runAlignment(
        parseArguments({"-i", sequencesPath.string(), "-s", scoreTablePath.string()}), output);

    const std::string report = output.str();
    EXPECT_NE(report.find("sequence1\nACGT\nsequence2\nAGT\n"), std::string::npos);
    EXPECT_NE(report.find("T\t0\t0\t0\t0\t4\t\n"), std::string::npos);
    EXPECT_NE(report.find("Alignment Score:4\nAlignment Results:\nAC(GT)\n   || \n A(GT)\n"),
              std::string::npos);
}

TEST_F(RunnerTest, CheaperGapOpeningFindsGappedAlignment) {
    std::ostringstream output;
    Runner::runAlignment(parseArguments({"-i", sequencesPath.string(), "-s",
                                         scoreTablePath.string(), "--opengap=-1", "--threads",
                                         "2"}),
                         output);

    EXPECT_NE(output.str().find("Alignment Score:5\nAlignment Results:\n(ACGT)\n | || \n(A-GT)\n"),
              std::string::npos);
}

using RunnerDeathTest = RunnerTest;

TEST_F(RunnerDeathTest, UncoveredSymbolExits) {
    std::ofstream{sequencesPath} << ">seq1\nACGU\n>seq2\nAGT\n";

    EXPECT_EXIT(
        {
            std::ostringstream output;
            Runner::runAlignment(
                parseArguments({"-i", sequencesPath.string(), "-s", scoreTablePath.string()}),
                output);
        },
        testing::ExitedWithCode(EXIT_FAILURE), "U");
}

TEST_F(RunnerDeathTest, MalformedScoreTableExits) {
    std::ofstream{scoreTablePath} << "  A C\nA 1\n";

    EXPECT_EXIT(
        {
            std::ostringstream output;
            Runner::runAlignment(
                parseArguments({"-i", sequencesPath.string(), "-s", scoreTablePath.string()}),
                output);
        },
        testing::ExitedWithCode(EXIT_FAILURE), "score table");
}
