#include "../include/codebreakers/Vigenere.hpp"
#include "../include/codebreakers/Common.hpp"

namespace Codebreakers::Vigenere {

    /* --------------- STANDARD --------------- */

    namespace {
        enum DIRECTION { DECRYPT = -1, ENCRYPT = 1 };

        std::string shiftByRepeatingKey(const std::string &text, const std::string &key, DIRECTION direction) {
            std::string result;
            result.reserve(text.size());
            for (std::size_t i {0}; i < text.size(); i++) {
                int shift {letterOrd(key[i % key.size()])};
                result += ordLetter(letterOrd(text[i]) + direction * shift);
            }
            return result;
        }
    }

    /* --------------- PUBLIC API --------------- */

    std::string encipher(std::string_view plaintext_, std::string_view key_, Mode mode) {
        const std::string key {normalizeKey(key_)};
        const std::string plaintext {normalize(plaintext_)};
        if (mode == Mode::STANDARD)
            return shiftByRepeatingKey(plaintext, key, ENCRYPT);

        // Autokey: keystream is the key followed by the plaintext itself,
        // only the first |plaintext| letters of it are ever consulted
        std::string result;
        result.reserve(plaintext.size());
        for (std::size_t i {0}; i < plaintext.size(); i++) {
            char keyCh {i < key.size()? key[i]: plaintext[i - key.size()]};
            result += ordLetter(letterOrd(plaintext[i]) + letterOrd(keyCh));
        }
        return result;
    }

    std::string decipher(std::string_view ciphertext_, std::string_view key_, Mode mode) {
        const std::string key {normalizeKey(key_)};
        const std::string ciphertext {normalize(ciphertext_)};
        if (mode == Mode::STANDARD)
            return shiftByRepeatingKey(ciphertext, key, DECRYPT);

        // Autokey: past the priming key, each keystream letter is a plaintext
        // letter recovered earlier in this same loop. Must run left to right.
        std::string result;
        result.reserve(ciphertext.size());
        for (std::size_t i {0}; i < ciphertext.size(); i++) {
            char keyCh {i < key.size()? key[i]: result[i - key.size()]};
            result += ordLetter(letterOrd(ciphertext[i]) - letterOrd(keyCh));
        }
        return result;
    }
}
