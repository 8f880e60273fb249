#include "../include/codebreakers/Transposition.hpp"
#include "../include/codebreakers/Common.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace Codebreakers::Transposition {

    std::vector<std::size_t> columnOrder(std::string_view key_) {
        const std::string key {normalizeKey(key_)};
        std::vector<std::size_t> order(key.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&key](std::size_t lhs, std::size_t rhs) {
            return key[lhs] < key[rhs];
        });
        return order;
    }

    std::vector<std::size_t> columnRanks(std::string_view key) {
        const std::vector<std::size_t> order {columnOrder(key)};
        std::vector<std::size_t> ranks(order.size());
        for (std::size_t rank {0}; rank < order.size(); rank++)
            ranks[order[rank]] = rank;
        return ranks;
    }

    std::string encipher(std::string_view plaintext_, std::string_view key) {
        const std::vector<std::size_t> order {columnOrder(key)};
        const std::string plaintext {normalize(plaintext_)};
        const std::size_t width {order.size()};

        // Cell (row, col) of the grid lives at plaintext[row * width + col]
        std::string result;
        result.reserve(plaintext.size());
        for (const std::size_t &col: order) {
            for (std::size_t idx {col}; idx < plaintext.size(); idx += width)
                result += plaintext[idx];
        }
        return result;
    }

    std::string decipher(std::string_view ciphertext_, std::string_view key) {
        const std::vector<std::size_t> order {columnOrder(key)};
        const std::string ciphertext {normalize(ciphertext_)};
        const std::size_t width {order.size()};
        const std::size_t baseHeight {ciphertext.size() / width}, remainder {ciphertext.size() % width};

        // Cut the ciphertext into columns, visiting them in read-out order
        std::vector<std::string_view> columns(width);
        std::string_view rest {ciphertext};
        for (const std::size_t &col: order) {
            std::size_t height {baseHeight + (col < remainder? 1: 0)};
            if (height > rest.size())
                throw LengthMismatch(std::format(
                    "Ciphertext of length {} does not fill a {} column grid", ciphertext.size(), width));
            columns[col] = rest.substr(0, height);
            rest.remove_prefix(height);
        }

        if (!rest.empty())
            throw LengthMismatch(std::format(
                "{} letters left over after filling a {} column grid", rest.size(), width));

        // Read back row-major
        std::string result;
        result.reserve(ciphertext.size());
        for (std::size_t row {0}; result.size() < ciphertext.size(); row++) {
            for (const std::string_view &column: columns) {
                if (row < column.size())
                    result += column[row];
            }
        }
        return result;
    }
}
