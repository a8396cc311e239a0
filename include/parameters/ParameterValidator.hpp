#pragma once

// Standard
#include <concepts>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <typeinfo>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"

namespace swalign::parameters {

namespace po = boost::program_options;

template <typename T>
concept arithmetic = std::integral<T> or std::floating_point<T>;

// Reads validated values from the parsed options. Invalid values are logged as errors.
struct ParameterValidator {
    template <typename T>
        requires arithmetic<T>
    static auto validateArithmetic(const po::variables_map &params, const std::string &paramName,
                                   const T lowerLimit, const T upperLimit) -> T {
        Logger::log(LogLevel::DEBUG, "Validating ", paramName,
                    " parameter. Type: ", typeid(T).name(), ". Lower limit: ", lowerLimit,
                    ". Upper limit: ", upperLimit, ".");

        T value{};

        try {
            value = params.at(paramName).as<T>();
        } catch (const std::out_of_range &) {
            Logger::log(LogLevel::ERROR, paramName, " is a required parameter.");
        } catch (const boost::bad_any_cast &) {
            Logger::log(LogLevel::ERROR, paramName, " must be a number between ",
                        std::to_string(lowerLimit), " and ", std::to_string(upperLimit));
        } catch (const po::error &e) {
            Logger::log(LogLevel::ERROR, "Unknown error occurred while parsing ", paramName, ". ",
                        std::string(e.what()));
        }

        if (value < lowerLimit || value > upperLimit) {
            Logger::log(LogLevel::ERROR, paramName + " must be a number between " +
                                             std::to_string(lowerLimit) + " and " +
                                             std::to_string(upperLimit) + ", got " +
                                             std::to_string(value));
        }

        return value;
    }

    template <typename T>
    static auto validateOption(const po::variables_map &params, const std::string &paramName)
        -> T {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, paramName, " is a required parameter.");
        }
        return params[paramName].as<T>();
    }

    static auto validateFilePath(const po::variables_map &params,
                                 const std::string &paramName) -> std::filesystem::path {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName,
                        "': a file path is required.");
        }

        const std::string filePathStr = params[paramName].as<std::string>();
        std::filesystem::path filePath = std::filesystem::path(filePathStr);

        if (!std::filesystem::exists(filePath) || std::filesystem::is_directory(filePath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", filePath,
                        " is not a valid file path.");
        }

        return filePath;
    }

    static auto validateLogLevel(const po::variables_map &params,
                                 const std::string &paramName) -> LogLevel {
        const std::string logLevelStr = params[paramName].as<std::string>();
        const auto logLevel = Logger::parseLogLevel(logLevelStr);

        if (!logLevel.has_value()) {
            Logger::log(LogLevel::ERROR, "Invalid log level specified: ", logLevelStr);
            return LogLevel::INFO;
        }
        return logLevel.value();
    }
};

}  // namespace swalign::parameters
