#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

// Internal
#include "SimilarityTable.hpp"

namespace swalign::io {

/* Reads a whitespace delimited score table such as BLOSUM62:
 *
 *      A   C   G   T
 *   A  2  -1  -1  -1
 *   C -1   2  -1  -1
 *   ...
 *
 * The first line lists the column symbols, every further line starts with its row symbol.
 * Blank lines and lines starting with '#' are skipped.
 */
class SimilarityTableParser {
   public:
    SimilarityTableParser() = delete;
    ~SimilarityTableParser() = delete;
    SimilarityTableParser(const SimilarityTableParser &) = delete;
    auto operator=(const SimilarityTableParser &) -> SimilarityTableParser & = delete;
    SimilarityTableParser(SimilarityTableParser &&) = delete;
    auto operator=(SimilarityTableParser &&) -> SimilarityTableParser & = delete;

    static auto parseFile(const std::filesystem::path &path) -> SimilarityTable;
    static auto parse(std::istream &input) -> SimilarityTable;

   private:
    static auto tokenize(const std::string &line) -> std::vector<std::string>;
    static auto isSkippedLine(const std::string &line) -> bool;
    static auto parseSymbol(const std::string &token, size_t lineNumber) -> char;
    static auto parseScore(const std::string &token, size_t lineNumber) -> int;
};

}  // namespace swalign::io
