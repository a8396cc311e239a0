#include "SimilarityTable.hpp"

// Internal
#include "Errors.hpp"

namespace swalign {

auto SimilarityTable::uniform(std::string_view alphabet, const int matchScore,
                              const int mismatchScore) -> SimilarityTable {
    SimilarityTable table;
    for (const char rowSymbol : alphabet) {
        for (const char columnSymbol : alphabet) {
            table.set(rowSymbol, columnSymbol,
                      rowSymbol == columnSymbol ? matchScore : mismatchScore);
        }
    }
    return table;
}

void SimilarityTable::set(const char rowSymbol, const char columnSymbol, const int value) {
    scores[key(rowSymbol, columnSymbol)] = value;
}

auto SimilarityTable::score(const char rowSymbol, const char columnSymbol) const -> int {
    const auto iterator = scores.find(key(rowSymbol, columnSymbol));
    if (iterator == scores.end()) {
        throw MissingScoreError(rowSymbol, columnSymbol);
    }
    return iterator->second;
}

auto SimilarityTable::find(const char rowSymbol, const char columnSymbol) const
    -> std::optional<int> {
    const auto iterator = scores.find(key(rowSymbol, columnSymbol));
    if (iterator == scores.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

auto SimilarityTable::contains(const char rowSymbol, const char columnSymbol) const -> bool {
    return scores.contains(key(rowSymbol, columnSymbol));
}

auto SimilarityTable::isSymmetric() const -> bool {
    for (const auto &[pairKey, value] : scores) {
        const auto rowSymbol = static_cast<char>(pairKey >> 8U);
        const auto columnSymbol = static_cast<char>(pairKey & 0xFFU);  // NOLINT

        const auto mirrored = find(columnSymbol, rowSymbol);
        if (!mirrored.has_value() || mirrored.value() != value) {
            return false;
        }
    }
    return true;
}

}  // namespace swalign
