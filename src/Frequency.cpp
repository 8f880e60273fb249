#include "../include/codebreakers/Frequency.hpp"

#include <format>

namespace Codebreakers::Frequency {

    namespace {
        // Uppercase a letter, '\0' for anything else
        constexpr char toUpperLetter(char ch) {
            if (ch >= 'a' && ch <= 'z') return static_cast<char>(ch - 'a' + 'A');
            return ch >= 'A' && ch <= 'Z'? ch: '\0';
        }
    }

    FrequencyTable letters(std::string_view text) {
        FrequencyTable table {};
        for (const char &ch: normalize(text))
            ++table[static_cast<std::size_t>(letterOrd(ch))];
        return table;
    }

    DigramTable digrams(std::string_view text) {
        const std::string normalized {normalize(text)};
        DigramTable table;
        for (std::size_t i {1}; i < normalized.size(); i++)
            ++table[{normalized[i - 1], normalized[i]}];
        return table;
    }

    std::size_t count(const FrequencyTable &table, char letter) {
        char upper {toUpperLetter(letter)};
        return upper == '\0'? 0: table[static_cast<std::size_t>(letterOrd(upper))];
    }

    std::size_t count(const DigramTable &table, char first, char second) {
        auto it {table.find({toUpperLetter(first), toUpperLetter(second)})};
        return it == table.end()? 0: it->second;
    }

    std::string histogram(const FrequencyTable &table) {
        std::string result;
        for (int ord {0}; ord < ALPHABET_SIZE; ord++) {
            result += ordLetter(ord);
            result += ' ';
            result.append(table[static_cast<std::size_t>(ord)], '|');
            result += '\n';
        }
        return result;
    }

    std::string digramGrid(const DigramTable &table) {
        std::string result;
        for (int left {0}; left < ALPHABET_SIZE; left++) {
            for (int right {0}; right < ALPHABET_SIZE; right++) {
                const char first {ordLetter(left)}, second {ordLetter(right)};
                auto it {table.find({first, second})};
                std::string cell {it == table.end()? "  ": std::format("{:2}", it->second)};
                if (right != 0) result += "  ";
                result += std::format("{}{}({})", first, second, cell);
            }
            result += '\n';
        }
        return result;
    }
}
