#include "ParameterOptions.hpp"

#include <boost/program_options/options_description.hpp>
#include <string>

#include "Constants.hpp"
#include "DoubleGapPolicy.hpp"

namespace swalign::parameters {

namespace cs = constants;

auto ParameterOptions::getGeneralOptions() -> po::options_description {
    po::options_description general(cs::GENERAL_DESCRIPTION);
    general.add_options()("input,i", po::value<std::string>(),
                          "file containing the two sequences to align, one per line or as "
                          "FASTA (.fa, .fasta, .fna, .faa) (required)");
    general.add_options()("score,s", po::value<std::string>(),
                          "similarity score table with symbol labels on both axes (required)");
    general.add_options()("loglevel", po::value<std::string>()->default_value(cs::defaultLogLevel),
                          "log level [debug, info, warning, error] (default: info)");
    general.add_options()("threads,p", po::value<int>()->default_value(cs::defaultThreadCount),
                          "number of threads filling the alignment matrices, values above 1 "
                          "select the anti-diagonal wavefront fill (default: 1)");

    return general;
}

auto ParameterOptions::getAlignmentOptions() -> po::options_description {
    po::options_description alignment(cs::ALIGNMENT_DESCRIPTION);
    alignment.add_options()("opengap,o", po::value<int>()->default_value(cs::defaultOpenPenalty),
                            "penalty for opening a gap, must not be positive (default: -2)");
    alignment.add_options()("extgap,e",
                            po::value<int>()->default_value(cs::defaultExtendPenalty),
                            "penalty for extending a gap, must not be positive (default: -1)");
    alignment.add_options()(
        "doublegap",
        po::value<DoubleGapPolicy>()->default_value(DoubleGapPolicy::ALLOW_ORTHOGONAL_EXTENSION),
        "whether a gap may directly follow a gap in the other sequence [allow, disallow] "
        "(default: allow)");

    return alignment;
}

auto ParameterOptions::getOtherOptions() -> po::options_description {
    po::options_description other(cs::OTHER_DESCRIPTION);
    other.add_options()("version,v", "display the version number");
    other.add_options()("help,h", "display this help message");
    other.add_options()("config,c", po::value<std::string>(),
                        "configuration file that contains the parameters");

    return other;
}

}  // namespace swalign::parameters
