#include "../include/codebreakers/Config.hpp"
#include "../include/codebreakers/Utils.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace Codebreakers {

    namespace {
        std::size_t parseSize(const std::string &key, const std::string &value) {
            std::size_t result {};
            std::from_chars_result parseResult {std::from_chars(value.data(), value.data() + value.size(), result)};
            if (parseResult.ec != std::errc() || parseResult.ptr != value.data() + value.size())
                throw std::invalid_argument("Config: '" + key + "' expects a non negative integer, got '" + value + "'");
            return result;
        }
    }

    Config Config::defaults() { return Config{}; }

    Config Config::fromIni(const INI::Parser &ini) {
        Config config {defaults()};
        for (const auto &[sectionName, section]: ini) {
            for (const auto &[key, value]: section) {
                if (sectionName == "output" && key == "group_size")
                    config.groupSize = parseSize(key, value);
                else if (sectionName == "output" && key == "groups_per_line")
                    config.groupsPerLine = parseSize(key, value);
                else if (sectionName == "cipher" && key == "default")
                    config.defaultCipher = Cipher::parseKind(value);
                else if (sectionName == "logging" && key == "level")
                    config.logLevel = Logging::parseLevel(value);
                else
                    Logging::Warn("Ignoring unknown config option '{}' in section '{}'", key, sectionName);
            }
        }
        return config;
    }

    Config Config::fromString(const std::string &raw) {
        INI::Parser ini;
        ini.reads(raw);
        return fromIni(ini);
    }

    Config Config::load(const std::optional<fs::path> &path) {
        fs::path configPath;
        if (path) {
            if (!fs::is_regular_file(*path))
                throw std::runtime_error("Config file not found: " + path->string());
            configPath = *path;
        } else {
            const char *home {std::getenv("HOME")};
            if (home == nullptr || !fs::is_regular_file(fs::path{home} / ".codebreakers.ini")) {
                Logging::Debug("No config file found, using defaults");
                return defaults();
            }
            configPath = fs::path{home} / ".codebreakers.ini";
        }

        Logging::Debug("Reading config from {}", configPath.string());
        Config config {fromString(readTextFile(configPath))};
        config.source = configPath.string();
        return config;
    }
}
