#pragma once

#include <string>
#include <string_view>

namespace Codebreakers::Vigenere {
    // STANDARD repeats the key; AUTOKEY primes with the key, then continues with the plaintext
    enum class Mode { STANDARD, AUTOKEY };

    constexpr std::string_view str(Mode mode) {
        switch (mode) {
            case Mode::STANDARD: return "standard";
            case Mode::AUTOKEY:  return "autokey";
        }
        return "unknown";
    }

    // Inputs are normalized before use, throws InvalidKey on a letterless key
    [[nodiscard]] std::string encipher(std::string_view plaintext, std::string_view key, Mode mode = Mode::STANDARD);
    [[nodiscard]] std::string decipher(std::string_view ciphertext, std::string_view key, Mode mode = Mode::STANDARD);
}
