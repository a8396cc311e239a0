#include "Runner.hpp"

// Standard
#include <iostream>
#include <stdexcept>

// Internal
#include "AlignmentReport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "ParameterParser.hpp"
#include "SimilarityTableParser.hpp"

namespace swalign {

void Runner::run(int argc, const char *const argv[]) {  // NOLINT
    const auto parameters = parameters::ParameterParser::getParameters(argc, argv);

    runAlignment(parameters, std::cout);
}

void Runner::runAlignment(const parameters::AlignParameters &parameters, std::ostream &output) {
    Logger::log(LogLevel::INFO, "Aligning sequences from ", parameters.sequencesPath.string(),
                " with score table ", parameters.scoreTablePath.string());
    Logger::log(LogLevel::INFO, "Gap open penalty ", parameters.openPenalty,
                ", gap extend penalty ", parameters.extendPenalty, ", double gaps ",
                parameters.doubleGapPolicy);

    const SimilarityTable table = loadSimilarityTable(parameters);
    const io::SequencePair sequences = loadSequences(parameters);

    try {
        const LocalAligner aligner{parameters.alignmentConfig()};
        const AlignmentResult result = aligner.align(table, sequences.seq1, sequences.seq2);

        Logger::log(LogLevel::INFO, "Best local alignment score ", result.bestScore, " at ",
                    result.bestCoordinate);

        output << io::AlignmentReport{sequences, result};
    } catch (const ConfigurationError &e) {
        Logger::log(LogLevel::ERROR, "Score table does not cover the input sequences: ",
                    std::string(e.what()));
    } catch (const InvalidPenaltyError &e) {
        Logger::log(LogLevel::ERROR, std::string(e.what()));
    }
}

auto Runner::loadSimilarityTable(const parameters::AlignParameters &parameters)
    -> SimilarityTable {
    try {
        return io::SimilarityTableParser::parseFile(parameters.scoreTablePath);
    } catch (const std::runtime_error &e) {
        Logger::log(LogLevel::ERROR, "Could not read score table: ", std::string(e.what()));
    }
    return {};
}

auto Runner::loadSequences(const parameters::AlignParameters &parameters) -> io::SequencePair {
    try {
        return io::SequenceReader::read(parameters.sequencesPath);
    } catch (const std::exception &e) {
        Logger::log(LogLevel::ERROR, "Could not read sequences: ", std::string(e.what()));
    }
    return {};
}

}  // namespace swalign
