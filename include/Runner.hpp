#pragma once

// Standard
#include <ostream>

// Internal
#include "AlignParameters.hpp"
#include "LocalAligner.hpp"
#include "SequenceReader.hpp"
#include "SimilarityTable.hpp"

namespace swalign {

class Runner {
   public:
    Runner() = delete;
    Runner(const Runner&) = delete;
    Runner(Runner&&) = delete;
    auto operator=(const Runner&) -> Runner& = delete;
    auto operator=(Runner&&) -> Runner& = delete;
    ~Runner() = delete;

    static void run(int argc, const char* const argv[]);  // NOLINT

    // Reads both inputs, aligns them and writes the report.
    static void runAlignment(const parameters::AlignParameters& parameters, std::ostream& output);

   private:
    static auto loadSimilarityTable(const parameters::AlignParameters& parameters)
        -> SimilarityTable;
    static auto loadSequences(const parameters::AlignParameters& parameters) -> io::SequencePair;
};

}  // namespace swalign
