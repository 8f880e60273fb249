#include <algorithm>
#include <cassert>
#include <random>
#include <string>
#include <vector>

#include "../include/codebreakers/Common.hpp"
#include "../include/codebreakers/Transposition.hpp"

int main() {
    using namespace Codebreakers;

    // Column order: sort by letter, ties keep their position
    {
        using Columns = std::vector<std::size_t>;
        assert(Transposition::columnOrder("BACD") == (Columns{1, 0, 2, 3}));
        assert(Transposition::columnRanks("BACD") == (Columns{1, 0, 2, 3}));
        assert(Transposition::columnOrder("ZEBRA") == (Columns{4, 2, 1, 3, 0}));
        assert(Transposition::columnRanks("ZEBRA") == (Columns{4, 2, 1, 3, 0}));
        assert(Transposition::columnRanks("BAACDDZZXY") == (Columns{2, 0, 1, 3, 4, 5, 8, 9, 6, 7}));
        assert(Transposition::columnOrder("aaa") == (Columns{0, 1, 2}));
        assert(Transposition::columnOrder("C-A-B") == (Columns{1, 2, 0}));
    }

    // Ranks are always a permutation of 0..n-1
    {
        std::mt19937 rng {7};
        std::uniform_int_distribution<int> letter {'A', 'Z'}, length {1, 30};
        for (int round {0}; round < 200; round++) {
            std::string key(static_cast<std::size_t>(length(rng)), 'A');
            for (char &ch: key) ch = static_cast<char>(letter(rng));
            std::vector<std::size_t> ranks {Transposition::columnRanks(key)};
            std::vector<bool> seen(ranks.size(), false);
            for (const std::size_t &rank: ranks) {
                assert(rank < ranks.size() && !seen[rank]);
                seen[rank] = true;
            }
        }
    }

    // Known answers
    {
        assert(Transposition::encipher("WE ARE DISCOVERED. FLEE AT ONCE", "ZEBRAS") == "EVLNACDTESEAROFODEECWIREE");
        assert(Transposition::decipher("EVLNA CDTES EAROF ODEEC WIREE", "ZEBRAS") == "WEAREDISCOVEREDFLEEATONCE");
        assert(Transposition::encipher("ATTACK AT DAWN", "CAB") == "TCTWTKDNAAAA");
        assert(Transposition::decipher("TCTWT KDNAA AA", "CAB") == "ATTACKATDAWN");
        assert(Transposition::encipher("DEFEND THE EAST WALL OF THE CASTLE", "GERMAN") == "NALCEHWTTDTTFSEELEEDSOAFEAHL");
        assert(Transposition::decipher("NALCEHWTTDTTFSEELEEDSOAFEAHL", "GERMAN") == "DEFENDTHEEASTWALLOFTHECASTLE");
    }

    // 12 letters under ZEBRA: last row holds 2 letters, in columns Z and E
    {
        assert(Transposition::encipher("ABCDEFGHIJKL", "ZEBRA") == "EJCHBGLDIAFK");
        assert(Transposition::decipher("EJCHBGLDIAFK", "ZEBRA") == "ABCDEFGHIJKL");
        assert(Transposition::encipher("WEARE DISCO VE", "ZEBRA") == "EOASEIERCWDV");
        assert(Transposition::decipher("EOASEIERCWDV", "ZEBRA") == "WEAREDISCOVE");
    }

    // Repeated key letters, keys wider than the text, single column
    {
        assert(Transposition::encipher("ABCDEFG", "AAA") == "ADGBECF");
        assert(Transposition::decipher("ADGBECF", "AAA") == "ABCDEFG");
        assert(Transposition::encipher("HELLO", "LONGKEYWORD") == "LOHLE");
        assert(Transposition::decipher("LOHLE", "LONGKEYWORD") == "HELLO");
        assert(Transposition::encipher("HELLO", "Q") == "HELLO");
        assert(Transposition::decipher("HELLO", "Q") == "HELLO");
    }

    // Empty text is fine, letterless key is not
    {
        assert(Transposition::encipher("", "KEY").empty());
        assert(Transposition::decipher(" . ", "KEY").empty());

        bool thrown {false};
        try { (void) Transposition::encipher("TEXT", " 42 "); }
        catch (const InvalidKey &) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { (void) Transposition::decipher("TEXT", ""); }
        catch (const InvalidKey &) { thrown = true; }
        assert(thrown);
    }

    // Decipher undoes encipher, and the letters are only moved around
    {
        std::mt19937 rng {99};
        std::uniform_int_distribution<int> letter {'A', 'Z'};
        std::uniform_int_distribution<std::size_t> textLen {0, 150}, keyLen {1, 15};
        for (int round {0}; round < 300; round++) {
            std::string plaintext(textLen(rng), 'A'), key(keyLen(rng), 'A');
            for (char &ch: plaintext) ch = static_cast<char>(letter(rng));
            for (char &ch: key) ch = static_cast<char>(letter(rng));

            const std::string ciphertext {Transposition::encipher(plaintext, key)};
            std::string sortedPlain {plaintext}, sortedCipher {ciphertext};
            std::sort(sortedPlain.begin(), sortedPlain.end());
            std::sort(sortedCipher.begin(), sortedCipher.end());
            assert(sortedPlain == sortedCipher);
            assert(Transposition::decipher(ciphertext, key) == plaintext);
        }
    }

    return 0;
}
