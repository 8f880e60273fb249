#include "include/codebreakers/CommandHandler.hpp"
#include "include/codebreakers/Logger.hpp"

#include <exception>

int main(int argc, char **argv) {
    try {
        Codebreakers::CommandHandler handler;
        handler.handleArgs(argc, argv);
    } catch (const std::exception &ex) {
        Codebreakers::Logging::Error("{}", ex.what());
        return 1;
    }

    return 0;
}
