#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Codebreakers::Transposition {
    // Column indices in read-out order: sorted by key letter, ties keep
    // their left to right position. Key is normalized, throws InvalidKey.
    [[nodiscard]] std::vector<std::size_t> columnOrder(std::string_view key);

    // Inverse of columnOrder; ranks[column] = position of column in the read-out.
    // "BACD" -> {1, 0, 2, 3}
    [[nodiscard]] std::vector<std::size_t> columnRanks(std::string_view key);

    // Write row-major into |key| columns (last row may be short, never padded),
    // read out column by column in key order
    [[nodiscard]] std::string encipher(std::string_view plaintext, std::string_view key);

    // Columns at the first (length % |key|) original positions carry one extra row
    [[nodiscard]] std::string decipher(std::string_view ciphertext, std::string_view key);
}
