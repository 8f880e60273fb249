#include "../include/codebreakers/Utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Codebreakers {
    std::string readTextFile(const fs::path &path) {
        std::ifstream ifs {path, std::ios::binary | std::ios::in};
        if (!ifs) throw std::runtime_error("Failed to open file for reading: " + path.string());
        return readStream(ifs);
    }

    std::string readStream(std::istream &is) {
        std::ostringstream oss;
        oss << is.rdbuf();
        if (is.bad()) throw std::runtime_error("Failed while reading input stream");
        return oss.str();
    }

    std::string readInput(const std::string &source) {
        return source == "-"? readStream(std::cin): readTextFile(source);
    }
}
