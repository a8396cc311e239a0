#include "ParameterParser.hpp"

#include <fstream>
#include <iostream>
#include <string>

#include "Logger.hpp"
#include "ParameterOptions.hpp"

namespace swalign::parameters {

auto ParameterParser::getParameters(int argc, const char *const argv[])  // NOLINT
    -> AlignParameters {
    const auto params = parseParameters(argc, argv);

    return AlignParameters{params};
}

auto ParameterParser::parseParameters(int argc,
                                      const char *const argv[]) -> po::variables_map {  // NOLINT
    const po::options_description commandLineOptions{getCommandLineOptions()};

    po::variables_map params;
    try {
        store(po::command_line_parser(argc, argv).options(commandLineOptions).run(), params);
        notify(params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid command line: ", std::string(e.what()));
    }

    if (params.count("version") != 0U) {
        std::cout << versionString() << std::endl;
        exit(EXIT_SUCCESS);
    }

    if (params.count("help") != 0U) {
        std::cout << commandLineOptions << std::endl;
        exit(EXIT_SUCCESS);
    }

    Logger::setLogLevel(params["loglevel"].as<std::string>());

    printVersion();

    insertConfigFileParameters(params);

    return params;
}

void ParameterParser::insertConfigFileParameters(po::variables_map &params) {
    if (params.count("config") == 0) {
        return;
    }

    const po::options_description configFileOptions{getConfigFileOptions()};

    const std::string configFilePath{params["config"].as<std::string>()};

    std::ifstream configIn{configFilePath};

    if (!configIn) {
        Logger::log(LogLevel::ERROR, "Configuration file could not be opened!");
    }

    try {
        po::store(po::parse_config_file(configIn, configFileOptions), params);
        notify(params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid configuration file ", configFilePath, ": ",
                    std::string(e.what()));
    }

    Logger::setLogLevel(params["loglevel"].as<std::string>());
    Logger::log(LogLevel::DEBUG, "Loaded parameters from configuration file ", configFilePath);
}

auto ParameterParser::getCommandLineOptions() -> po::options_description {
    const po::options_description generalOptions{ParameterOptions::getGeneralOptions()};
    const po::options_description alignmentOptions{ParameterOptions::getAlignmentOptions()};
    const po::options_description otherOptions{ParameterOptions::getOtherOptions()};

    po::options_description commandLineOptions{"Command line options"};

    commandLineOptions.add(generalOptions).add(alignmentOptions).add(otherOptions);

    return commandLineOptions;
}

auto ParameterParser::getConfigFileOptions() -> po::options_description {
    const po::options_description generalOptions{ParameterOptions::getGeneralOptions()};
    const po::options_description alignmentOptions{ParameterOptions::getAlignmentOptions()};

    po::options_description configFileOptions{"Config file options"};

    configFileOptions.add(generalOptions).add(alignmentOptions);

    return configFileOptions;
}

auto ParameterParser::versionString() -> std::string {
    return "SWAlign v" + std::to_string(SWAlign_VERSION_MAJOR) + "." +
           std::to_string(SWAlign_VERSION_MINOR) + "." + std::to_string(SWAlign_VERSION_PATCH) +
           " - " + "Optimal local alignment with affine gap penalties (Smith-Waterman).";
}

void ParameterParser::printVersion() { Logger::log(LogLevel::INFO, versionString()); }

}  // namespace swalign::parameters
