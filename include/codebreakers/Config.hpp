#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "Cipher.hpp"
#include "IniParser.hpp"
#include "Logger.hpp"

namespace Codebreakers {
    struct Config {
        // Output grouping, see groupLetters
        std::size_t groupSize {5}, groupsPerLine {5};

        // Used when --cipher is not given
        Cipher::Kind defaultCipher {Cipher::Kind::VIGENERE};

        Logging::Level logLevel {Logging::Level::WARN};

        // Where the values came from, "<defaults>" if no file was read
        std::string source {"<defaults>"};

        static Config defaults();

        // Apply recognized keys over the defaults, warn on anything else
        static Config fromIni(const INI::Parser &ini);
        static Config fromString(const std::string &raw);

        // Explicit path must exist; otherwise falls back to $HOME/.codebreakers.ini
        // if present, else defaults
        static Config load(const std::optional<std::filesystem::path> &path = std::nullopt);
    };
}
