#include "SequenceReader.hpp"

// Standard
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

// seqan3
#include <seqan3/io/sequence_file/input.hpp>
#include <seqan3/utility/type_list/type_list.hpp>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

namespace swalign::io {

namespace {
// Score tables are keyed by arbitrary characters, so FASTA symbols are kept as plain chars.
struct CharSequenceTraits : seqan3::sequence_file_input_default_traits_dna {
    using sequence_alphabet = char;
    using sequence_legal_alphabet = char;
};

using CharSequenceFileInput =
    seqan3::sequence_file_input<CharSequenceTraits, seqan3::fields<seqan3::field::seq>,
                                seqan3::type_list<seqan3::format_fasta>>;

auto toSequencePair(const std::vector<std::string> &sequences) -> SequencePair {
    if (sequences.size() < constants::input::expectedSequenceCount) {
        throw InputFormatError("Expected two sequences, found " +
                               std::to_string(sequences.size()));
    }
    return {sequences[0], sequences[1]};
}
}  // namespace

auto SequenceReader::read(const std::filesystem::path &path) -> SequencePair {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Could not open sequence file: " + path.string());
    }

    if (isFastaPath(path)) {
        Logger::log(LogLevel::DEBUG, "Reading FASTA sequences from ", path.string());
        return readFasta(input);
    }

    Logger::log(LogLevel::DEBUG, "Reading plain sequences from ", path.string());
    return readPlain(input);
}

auto SequenceReader::readPlain(std::istream &input) -> SequencePair {
    std::vector<std::string> sequences;

    std::string line;
    while (sequences.size() < constants::input::expectedSequenceCount &&
           std::getline(input, line)) {
        sequences.push_back(trim(line));
    }

    return toSequencePair(sequences);
}

auto SequenceReader::readFasta(std::istream &input) -> SequencePair {
    CharSequenceFileInput sequenceFile{input, seqan3::format_fasta{}};

    std::vector<std::string> sequences;
    for (const auto &record : sequenceFile) {
        sequences.emplace_back(record.sequence().begin(), record.sequence().end());
        if (sequences.size() == constants::input::expectedSequenceCount) {
            break;
        }
    }

    return toSequencePair(sequences);
}

auto SequenceReader::isFastaPath(const std::filesystem::path &path) -> bool {
    std::string extension = path.extension().string();
    std::ranges::transform(extension, extension.begin(),
                           [](unsigned char character) { return std::tolower(character); });
    return std::ranges::find(fastaSuffixes, extension) != fastaSuffixes.end();
}

auto SequenceReader::trim(const std::string &line) -> std::string {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

}  // namespace swalign::io
