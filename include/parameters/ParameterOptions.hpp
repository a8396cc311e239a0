#pragma once

// Boost
#include <boost/program_options/options_description.hpp>

namespace swalign::parameters {

namespace po = boost::program_options;

class ParameterOptions {
   public:
    ParameterOptions() = delete;
    ParameterOptions(const ParameterOptions &) = default;
    ParameterOptions(ParameterOptions &&) = delete;
    auto operator=(const ParameterOptions &) -> ParameterOptions & = default;
    auto operator=(ParameterOptions &&) -> ParameterOptions & = delete;
    ~ParameterOptions() = delete;

    static auto getGeneralOptions() -> po::options_description;
    static auto getAlignmentOptions() -> po::options_description;
    static auto getOtherOptions() -> po::options_description;
};

}  // namespace swalign::parameters
