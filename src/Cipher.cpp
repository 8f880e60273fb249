#include "../include/codebreakers/Cipher.hpp"
#include "../include/codebreakers/Transposition.hpp"
#include "../include/codebreakers/Vigenere.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Codebreakers::Cipher {
    Kind parseKind(std::string_view name_) {
        std::string name {name_};
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        if (name == "vigenere" || name == "vigenere-standard") return Kind::VIGENERE;
        else if (name == "autokey" || name == "vigenere-autokey") return Kind::AUTOKEY;
        else if (name == "transposition") return Kind::TRANSPOSITION;
        else throw std::invalid_argument("Unknown cipher: '" + std::string{name_} + "'");
    }

    std::string run(Kind kind, Direction direction, std::string_view text, std::string_view key) {
        const bool encrypt {direction == Direction::ENCIPHER};
        switch (kind) {
            case Kind::VIGENERE:
                return encrypt? Vigenere::encipher(text, key): Vigenere::decipher(text, key);
            case Kind::AUTOKEY:
                return encrypt?
                    Vigenere::encipher(text, key, Vigenere::Mode::AUTOKEY):
                    Vigenere::decipher(text, key, Vigenere::Mode::AUTOKEY);
            case Kind::TRANSPOSITION:
                return encrypt? Transposition::encipher(text, key): Transposition::decipher(text, key);
        }
        throw std::invalid_argument("Unhandled cipher kind");
    }
}
