#include <cassert>
#include <random>
#include <string>

#include "../include/codebreakers/Common.hpp"
#include "../include/codebreakers/Vigenere.hpp"

namespace {
    std::string randomLetters(std::mt19937 &rng, std::size_t length) {
        std::uniform_int_distribution<int> letter {0, 25};
        std::string result;
        for (std::size_t i {0}; i < length; i++)
            result += static_cast<char>('A' + letter(rng));
        return result;
    }
}

int main() {
    using namespace Codebreakers;
    using Vigenere::Mode;

    // Standard (repeating key) known answers
    {
        assert(Vigenere::encipher("INANOBSCURECORNER", "THISISMODERNWAR").starts_with("BUIFWTEQXVVPKRE"));
        assert(Vigenere::encipher("NOW IS THE TIME FOR ALL GOOD MEN", "TYPE") == "GMLMLRWIMGBIYMGEEJVSHBBIG");
        assert(Vigenere::decipher("GMLML RWIMG BIYMG EEJVS HBBIG", "TYPE") == "NOWISTHETIMEFORALLGOODMEN");
        assert(Vigenere::encipher("attack at dawn", "lemon") == "LXFOPVEFRNHR");
        assert(Vigenere::decipher("LXFOPVEFRNHR", "LEMON") == "ATTACKATDAWN");
    }

    // Autokey known answers, keystream = key ++ plaintext
    {
        assert(Vigenere::encipher("AAAAAA", "ZZZ", Mode::AUTOKEY) == "ZZZAAA");
        assert(Vigenere::decipher("ZZZAAA", "ZZZ", Mode::AUTOKEY) == "AAAAAA");
        assert(Vigenere::encipher("ATTACKATDAWN", "QUEENLY", Mode::AUTOKEY) == "QNXEPVYTWTWP");
        assert(Vigenere::decipher("QNXEPVYTWTWP", "QUEENLY", Mode::AUTOKEY) == "ATTACKATDAWN");
    }

    // Key of A is the identity, key longer than text only uses its prefix
    {
        assert(Vigenere::encipher("Hello there", "a") == "HELLOTHERE");
        assert(Vigenere::decipher("Hello there", "aaa") == "HELLOTHERE");
        assert(Vigenere::encipher("HI", "LONGERKEY") == "SW");
        assert(Vigenere::encipher("HI", "LONGERKEY", Mode::AUTOKEY) == "SW");
        assert(Vigenere::decipher("SW", "LONGERKEY", Mode::AUTOKEY) == "HI");
    }

    // Empty text is fine, letterless key is not
    {
        assert(Vigenere::encipher("", "KEY").empty());
        assert(Vigenere::decipher("... ---", "KEY", Mode::AUTOKEY).empty());

        for (Mode mode: {Mode::STANDARD, Mode::AUTOKEY}) {
            bool thrown {false};
            try { (void) Vigenere::encipher("SOME TEXT", "1234", mode); }
            catch (const InvalidKey &) { thrown = true; }
            assert(thrown);

            thrown = false;
            try { (void) Vigenere::decipher("", "", mode); }
            catch (const InvalidKey &) { thrown = true; }
            assert(thrown);
        }
    }

    // Decipher undoes encipher, output stays within A-Z and keeps the length
    {
        std::mt19937 rng {1234};
        std::uniform_int_distribution<std::size_t> textLen {0, 120}, keyLen {1, 20};
        for (int round {0}; round < 300; round++) {
            const std::string plaintext {randomLetters(rng, textLen(rng))}, key {randomLetters(rng, keyLen(rng))};
            for (Mode mode: {Mode::STANDARD, Mode::AUTOKEY}) {
                const std::string ciphertext {Vigenere::encipher(plaintext, key, mode)};
                assert(ciphertext.size() == plaintext.size());
                for (const char &ch: ciphertext) assert(ch >= 'A' && ch <= 'Z');
                assert(Vigenere::decipher(ciphertext, key, mode) == plaintext);
            }
        }
    }

    return 0;
}
