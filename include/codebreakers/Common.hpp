#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Codebreakers {
    constexpr int ALPHABET_SIZE {26};

    // Key normalized down to nothing, nothing to encipher with
    class InvalidKey: public std::invalid_argument {
        public:
            explicit InvalidKey(const std::string &message): std::invalid_argument(message) {}
    };

    // Ciphertext cannot be laid back into the grid described by the key
    class LengthMismatch: public std::runtime_error {
        public:
            explicit LengthMismatch(const std::string &message): std::runtime_error(message) {}
    };

    // A=0 .. Z=25, expects an uppercase letter
    constexpr int letterOrd(char ch) { return ch - 'A'; }

    // Wraps any integer (negatives included) back into 'A'..'Z'
    constexpr char ordLetter(int ord) {
        return static_cast<char>('A' + ((ord % ALPHABET_SIZE) + ALPHABET_SIZE) % ALPHABET_SIZE);
    }

    constexpr bool isAsciiLetter(char ch) {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
    }

    // Drops everything that is not an ASCII letter and uppercases the rest.
    // Total over any input; idempotent.
    [[nodiscard]] std::string normalize(std::string_view raw);

    // Same as normalize, throws InvalidKey if no letters survive
    [[nodiscard]] std::string normalizeKey(std::string_view raw);

    // Chunk letters into groups, "ABCDE FGHIJ ..." with a newline instead of
    // the space after every `groupsPerLine` groups. Zero disables either step.
    [[nodiscard]] std::string groupLetters(
        std::string_view letters,
        std::size_t groupSize = 5,
        std::size_t groupsPerLine = 5
    );
}
