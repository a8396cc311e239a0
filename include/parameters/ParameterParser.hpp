#pragma once

// Standard
#include <cstdlib>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "AlignParameters.hpp"
#include "Config.hpp"

namespace swalign::parameters {

namespace po = boost::program_options;

class ParameterParser {
   public:
    static auto getParameters(int argc, const char* const argv[]) -> AlignParameters;  // NOLINT

    // Command line values first, then the configuration file fills what is still unset.
    static auto parseParameters(int argc, const char* const argv[]) -> po::variables_map;  // NOLINT

    ParameterParser() = delete;

   private:
    static void insertConfigFileParameters(po::variables_map& params);

    static auto getCommandLineOptions() -> po::options_description;
    static auto getConfigFileOptions() -> po::options_description;

    static auto versionString() -> std::string;
    static void printVersion();
};

}  // namespace swalign::parameters
