#include "../include/codebreakers/Common.hpp"

namespace Codebreakers {
    std::string normalize(std::string_view raw) {
        std::string result;
        result.reserve(raw.size());
        for (const char &ch: raw) {
            if (!isAsciiLetter(ch)) continue;
            result += ch >= 'a'? static_cast<char>(ch - 'a' + 'A'): ch;
        }
        return result;
    }

    std::string normalizeKey(std::string_view raw) {
        std::string key {normalize(raw)};
        if (key.empty())
            throw InvalidKey("Key must contain at least one letter");
        return key;
    }

    std::string groupLetters(std::string_view letters, std::size_t groupSize, std::size_t groupsPerLine) {
        if (groupSize == 0) return std::string{letters};

        std::string result;
        result.reserve(letters.size() + letters.size() / groupSize + 1);
        for (std::size_t i {0}; i < letters.size(); i++) {
            if (i != 0 && i % groupSize == 0) {
                std::size_t groupIdx {i / groupSize};
                bool lineBreak {groupsPerLine != 0 && groupIdx % groupsPerLine == 0};
                result += lineBreak? '\n': ' ';
            }
            result += letters[i];
        }
        return result;
    }
}
