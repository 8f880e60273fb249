#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "Common.hpp"

namespace Codebreakers::Frequency {
    // Indexed by letter - 'A', always holds all 26 letters
    using FrequencyTable = std::array<std::size_t, ALPHABET_SIZE>;

    // Only pairs that actually occur are stored
    using Digram = std::pair<char, char>;
    using DigramTable = std::map<Digram, std::size_t>;

    // Normalizes, then counts every letter
    [[nodiscard]] FrequencyTable letters(std::string_view text);

    // Normalizes, then counts overlapping adjacent pairs: "AAA" -> {AA: 2}
    [[nodiscard]] DigramTable digrams(std::string_view text);

    // Lookups that tolerate lowercase, return 0 for anything not counted
    [[nodiscard]] std::size_t count(const FrequencyTable &table, char letter);
    [[nodiscard]] std::size_t count(const DigramTable &table, char first, char second);

    // "A |||" per letter, one line each for A..Z
    [[nodiscard]] std::string histogram(const FrequencyTable &table);

    // 26x26 grid of "XY(nn)" cells, blank count for unseen pairs
    [[nodiscard]] std::string digramGrid(const DigramTable &table);
}
