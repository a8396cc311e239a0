#pragma once

// Standard
#include <stdexcept>
#include <string>

namespace swalign {

// A scoring setup that cannot serve the requested alignment.
class ConfigurationError : public std::runtime_error {
   public:
    explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
};

class MissingScoreError : public ConfigurationError {
   public:
    MissingScoreError(char first, char second)
        : ConfigurationError(std::string{"No similarity score defined for symbol pair ("} + first +
                             ", " + second + ")"),
          first(first),
          second(second) {}

    char first;
    char second;
};

class InvalidPenaltyError : public std::invalid_argument {
   public:
    InvalidPenaltyError(const std::string &penaltyName, int value)
        : std::invalid_argument(penaltyName + " must not be positive, got " +
                                std::to_string(value)) {}
};

class ScoreTableFormatError : public std::runtime_error {
   public:
    explicit ScoreTableFormatError(const std::string &message) : std::runtime_error(message) {}
};

class InputFormatError : public std::runtime_error {
   public:
    explicit InputFormatError(const std::string &message) : std::runtime_error(message) {}
};

}  // namespace swalign
