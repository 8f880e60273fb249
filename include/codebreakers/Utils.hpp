#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace fs = std::filesystem;

namespace Codebreakers {
    // Reads the entire contents of a file into a string, throws if it cannot be opened
    [[nodiscard]] std::string readTextFile(const fs::path &path);

    // Drains a stream into a string
    [[nodiscard]] std::string readStream(std::istream &is);

    // "-" means stdin, anything else is a file path
    [[nodiscard]] std::string readInput(const std::string &source);
}
