#include "SimilarityTableParser.hpp"

// Standard
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

namespace swalign::io {

auto SimilarityTableParser::parseFile(const std::filesystem::path &path) -> SimilarityTable {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Could not open score table file: " + path.string());
    }

    Logger::log(LogLevel::DEBUG, "Reading score table from ", path.string());
    return parse(input);
}

auto SimilarityTableParser::parse(std::istream &input) -> SimilarityTable {
    std::vector<char> columnSymbols;
    std::set<char> rowSymbols;
    SimilarityTable table;

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (isSkippedLine(line)) {
            continue;
        }

        const std::vector<std::string> tokens = tokenize(line);

        if (columnSymbols.empty()) {
            for (const auto &token : tokens) {
                const char symbol = parseSymbol(token, lineNumber);
                if (std::ranges::find(columnSymbols, symbol) != columnSymbols.end()) {
                    throw ScoreTableFormatError("Duplicate column symbol '" + token +
                                                "' in line " + std::to_string(lineNumber));
                }
                columnSymbols.push_back(symbol);
            }
            continue;
        }

        if (tokens.size() != columnSymbols.size() + 1) {
            throw ScoreTableFormatError(
                "Line " + std::to_string(lineNumber) + " has " + std::to_string(tokens.size()) +
                " fields, expected a row symbol followed by " +
                std::to_string(columnSymbols.size()) + " scores");
        }

        const char rowSymbol = parseSymbol(tokens.front(), lineNumber);
        if (!rowSymbols.insert(rowSymbol).second) {
            throw ScoreTableFormatError("Duplicate row symbol '" + tokens.front() + "' in line " +
                                        std::to_string(lineNumber));
        }

        for (size_t column = 0; column < columnSymbols.size(); ++column) {
            table.set(rowSymbol, columnSymbols[column], parseScore(tokens[column + 1], lineNumber));
        }
    }

    if (columnSymbols.empty() || rowSymbols.empty()) {
        throw ScoreTableFormatError("Score table contains no scores");
    }

    const std::set<char> columnSymbolSet(columnSymbols.begin(), columnSymbols.end());
    if (columnSymbolSet != rowSymbols) {
        Logger::log(LogLevel::WARNING,
                    "Score table row and column symbols differ, the table is not square");
    }

    return table;
}

auto SimilarityTableParser::tokenize(const std::string &line) -> std::vector<std::string> {
    std::istringstream lineStream{line};
    std::vector<std::string> tokens;

    std::string token;
    while (lineStream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

auto SimilarityTableParser::isSkippedLine(const std::string &line) -> bool {
    const auto firstCharacter = line.find_first_not_of(" \t\r");
    return firstCharacter == std::string::npos ||
           line[firstCharacter] == constants::input::commentPrefix;
}

auto SimilarityTableParser::parseSymbol(const std::string &token, const size_t lineNumber)
    -> char {
    if (token.size() != 1) {
        throw ScoreTableFormatError("Symbol label '" + token + "' in line " +
                                    std::to_string(lineNumber) + " is not a single character");
    }
    return token.front();
}

auto SimilarityTableParser::parseScore(const std::string &token, const size_t lineNumber) -> int {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(token, &consumed);
    } catch (const std::invalid_argument &) {
        consumed = 0;
    } catch (const std::out_of_range &) {
        consumed = 0;
    }

    if (consumed == 0 || consumed != token.size()) {
        throw ScoreTableFormatError("Score '" + token + "' in line " +
                                    std::to_string(lineNumber) + " is not an integer");
    }
    return value;
}

}  // namespace swalign::io
