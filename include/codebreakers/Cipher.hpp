#pragma once

#include <string>
#include <string_view>

namespace Codebreakers::Cipher {
    enum class Kind { VIGENERE, AUTOKEY, TRANSPOSITION };
    enum class Direction { ENCIPHER, DECIPHER };

    constexpr std::string_view str(Kind kind) {
        switch (kind) {
            case Kind::VIGENERE:      return "vigenere";
            case Kind::AUTOKEY:       return "autokey";
            case Kind::TRANSPOSITION: return "transposition";
        }
        return "unknown";
    }

    constexpr std::string_view str(Direction direction) {
        return direction == Direction::ENCIPHER? "encipher": "decipher";
    }

    // Case insensitive; also takes "vigenere-standard" / "vigenere-autokey".
    // Throws std::invalid_argument on anything else.
    [[nodiscard]] Kind parseKind(std::string_view name);

    // Returns unformatted letters
    [[nodiscard]] std::string run(Kind kind, Direction direction, std::string_view text, std::string_view key);
}
