#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

// Internal
#include "SimilarityScoring.hpp"

namespace swalign {

/* Square similarity table keyed by symbol on both axes.
 * score(row, column) throws MissingScoreError for pairs the table does not define.
 */
class SimilarityTable {
   public:
    SimilarityTable() = default;

    static auto uniform(std::string_view alphabet, int matchScore,
                        int mismatchScore) -> SimilarityTable;

    void set(char rowSymbol, char columnSymbol, int value);

    [[nodiscard]] auto score(char rowSymbol, char columnSymbol) const -> int;
    [[nodiscard]] auto find(char rowSymbol, char columnSymbol) const -> std::optional<int>;
    [[nodiscard]] auto contains(char rowSymbol, char columnSymbol) const -> bool;

    [[nodiscard]] auto isSymmetric() const -> bool;
    [[nodiscard]] auto size() const -> size_t { return scores.size(); }
    [[nodiscard]] auto empty() const -> bool { return scores.empty(); }

   private:
    static constexpr auto key(char rowSymbol, char columnSymbol) -> uint16_t {
        return static_cast<uint16_t>((static_cast<uint8_t>(rowSymbol) << 8U) |
                                     static_cast<uint8_t>(columnSymbol));
    }

    std::unordered_map<uint16_t, int> scores;
};

static_assert(SimilarityScoring<SimilarityTable>);

}  // namespace swalign
