#pragma once

// Standard
#include <array>
#include <filesystem>
#include <istream>
#include <string>

namespace swalign::io {

struct SequencePair {
    std::string seq1;
    std::string seq2;
};

/* Reads the two sequences to align.
 * Plain text input holds one sequence per line, FASTA input is recognised by its suffix.
 * Only the first two sequences are used.
 */
class SequenceReader {
   public:
    SequenceReader() = delete;
    ~SequenceReader() = delete;
    SequenceReader(const SequenceReader &) = delete;
    auto operator=(const SequenceReader &) -> SequenceReader & = delete;
    SequenceReader(SequenceReader &&) = delete;
    auto operator=(SequenceReader &&) -> SequenceReader & = delete;

    static auto read(const std::filesystem::path &path) -> SequencePair;
    static auto readPlain(std::istream &input) -> SequencePair;
    static auto readFasta(std::istream &input) -> SequencePair;

    static auto isFastaPath(const std::filesystem::path &path) -> bool;

   private:
    static inline const std::array<std::string, 4> fastaSuffixes{".fa", ".fasta", ".fna",
                                                                 ".faa"};

    static auto trim(const std::string &line) -> std::string;
};

}  // namespace swalign::io
