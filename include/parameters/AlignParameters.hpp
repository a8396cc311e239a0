#pragma once

// Standard
#include <climits>
#include <cstddef>
#include <filesystem>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "DoubleGapPolicy.hpp"
#include "LocalAligner.hpp"
#include "Logger.hpp"
#include "ParameterValidator.hpp"

namespace swalign::parameters {

namespace po = boost::program_options;

class AlignParameters {
   public:
    std::filesystem::path sequencesPath;
    std::filesystem::path scoreTablePath;

    int openPenalty;
    int extendPenalty;
    DoubleGapPolicy doubleGapPolicy;

    LogLevel logLevel;
    size_t threadCount;

    AlignParameters(const po::variables_map &params)
        : sequencesPath(ParameterValidator::validateFilePath(params, "input")),
          scoreTablePath(ParameterValidator::validateFilePath(params, "score")),
          openPenalty(ParameterValidator::validateArithmetic(params, "opengap", INT_MIN, 0)),
          extendPenalty(ParameterValidator::validateArithmetic(params, "extgap", INT_MIN, 0)),
          doubleGapPolicy(ParameterValidator::validateOption<DoubleGapPolicy>(params, "doublegap")),
          logLevel(ParameterValidator::validateLogLevel(params, "loglevel")),
          threadCount(ParameterValidator::validateArithmetic(params, "threads", 1, INT_MAX)) {};

    [[nodiscard]] auto alignmentConfig() const -> AlignmentConfig {
        return AlignmentConfig{{openPenalty, extendPenalty}, doubleGapPolicy, threadCount};
    }
};

}  // namespace swalign::parameters
