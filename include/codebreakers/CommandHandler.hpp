#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "ArgParse.hpp"
#include "Cipher.hpp"
#include "Config.hpp"

namespace Codebreakers {
    class CommandHandler {
        public:
            explicit CommandHandler(std::ostream &out = std::cout);

            // Parse the CMD inputs and execute the appropriate function
            void handleArgs(int argc, char **argv);
            void handleArgs(const std::vector<std::string> &argVec);

        private:
            std::ostream &out;
            argparse::ArgumentParser argparser;

            // Initialize the parser with all the gory details
            static argparse::ArgumentParser initParser();

            void runCipher(const argparse::ArgumentParser &parser, Cipher::Direction direction, const Config &config);
            void runFrequency(const argparse::ArgumentParser &parser);
    };
}
