#include "../include/codebreakers/CommandHandler.hpp"
#include "../include/codebreakers/Common.hpp"
#include "../include/codebreakers/Frequency.hpp"
#include "../include/codebreakers/Logger.hpp"
#include "../include/codebreakers/Utils.hpp"

#include <optional>

namespace Codebreakers {
    CommandHandler::CommandHandler(std::ostream &out): out(out), argparser(initParser()) {}

    argparse::ArgumentParser CommandHandler::initParser() {
        argparse::ArgumentParser parser {"codebreakers"};
        parser.description("Classical ciphers (Vigenere, autokey, columnar transposition) and frequency analysis");
        parser.addArgument("config").help("INI file to read settings from (default: ~/.codebreakers.ini)");
        parser.addArgument("log-level")
            .help("error, warn, info, debug or trace (any case), overrides the config file");

        // encipher and decipher take the exact same arguments
        for (const std::string &command: {"encipher", "decipher"}) {
            argparse::ArgumentParser &cipherParser {parser.addSubcommand(command)};
            cipherParser.description(command == "encipher"?
                "Encipher text read from a file or stdin": "Decipher text read from a file or stdin");
            cipherParser.addArgument("cipher").alias("c")
                .help("vigenere, autokey or transposition (default from config, else vigenere)");
            cipherParser.addArgument("key").alias("k").required()
                .help("Key, anything that is not a letter is ignored");
            cipherParser.addArgument("file", argparse::POSITIONAL).defaultValue("-")
                .help("File to read, '-' reads from stdin");
        }

        argparse::ArgumentParser &frequencyParser {parser.addSubcommand("frequency")};
        frequencyParser.description("Letter or digram frequency histogram of the input");
        frequencyParser.addArgument("digrams").alias("d").defaultValue(false).implicitValue(true)
            .help("Count adjacent letter pairs instead of single letters");
        frequencyParser.addArgument("file", argparse::POSITIONAL).defaultValue("-")
            .help("File to read, '-' reads from stdin");

        return parser;
    }

    void CommandHandler::handleArgs(int argc, char **argv) {
        handleArgs(std::vector<std::string>{argv, argv + argc});
    }

    void CommandHandler::handleArgs(const std::vector<std::string> &argVec) {
        argparser.parseArgs(argVec);
        if (std::optional<std::string> help {argparser.pendingHelp()}) {
            out << *help << '\n';
            return;
        }

        // Command line level applies before the config is even read
        const bool logLevelGiven {argparser.exists("log-level")};
        if (logLevelGiven)
            Logging::setLogLevel(Logging::parseLevel(argparser.get("log-level")));

        std::optional<fs::path> configPath;
        if (argparser.exists("config"))
            configPath = argparser.get("config");
        const Config config {Config::load(configPath)};
        if (!logLevelGiven)
            Logging::setLogLevel(config.logLevel);
        Logging::Debug("Using config from {}", config.source);

        argparse::ArgumentParser &encipherParser  {argparser.getChildParser("encipher")};
        argparse::ArgumentParser &decipherParser  {argparser.getChildParser("decipher")};
        argparse::ArgumentParser &frequencyParser {argparser.getChildParser("frequency")};

        if (encipherParser.ok())
            runCipher(encipherParser, Cipher::Direction::ENCIPHER, config);
        else if (decipherParser.ok())
            runCipher(decipherParser, Cipher::Direction::DECIPHER, config);
        else if (frequencyParser.ok())
            runFrequency(frequencyParser);
        else
            out << argparser.getHelp() << '\n';
    }

    void CommandHandler::runCipher(const argparse::ArgumentParser &parser, Cipher::Direction direction, const Config &config) {
        const Cipher::Kind kind {parser.exists("cipher")? Cipher::parseKind(parser.get("cipher")): config.defaultCipher};
        const std::string key {parser.get("key")}, source {parser.get("file")};

        const std::string input {readInput(source)};
        Logging::Debug("{} using {}: {} bytes from '{}'", Cipher::str(direction), Cipher::str(kind), input.size(), source);

        const std::string result {Cipher::run(kind, direction, input, key)};
        Logging::Trace("{} letters produced", result.size());
        out << groupLetters(result, config.groupSize, config.groupsPerLine) << '\n';
    }

    void CommandHandler::runFrequency(const argparse::ArgumentParser &parser) {
        const std::string source {parser.get("file")};
        const std::string input {readInput(source)};
        Logging::Debug("frequency: {} bytes from '{}'", input.size(), source);

        if (parser.get<bool>("digrams"))
            out << Frequency::digramGrid(Frequency::digrams(input));
        else
            out << Frequency::histogram(Frequency::letters(input));
    }
}
