#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

// Minimal INI reader: [sections], key = value / key: value, ';' and '#' comments.
// Section names are case insensitive, keys are kept as written.
namespace Codebreakers::INI {
    class Section {
        private:
            std::map<std::string, std::string> data;

        public:
            using ConstIterator = std::map<std::string, std::string>::const_iterator;

            ConstIterator begin() const { return data.cbegin(); }
            ConstIterator end() const { return data.cend(); }

            bool exists(const std::string &key) const noexcept { return data.find(key) != data.end(); }
            bool empty() const noexcept { return data.empty(); }

            const std::string &operator[](const std::string &key) const {
                auto it {data.find(key)};
                if (it == data.end())
                    throw std::runtime_error("Key: `" + key + "` not found.");
                return it->second;
            }

            // Returns false if the key was already present (value left untouched)
            bool insert(const std::string &key, const std::string &value) {
                return data.emplace(key, value).second;
            }
    };

    class Parser {
        private:
            std::map<std::string, Section> sections;

            static std::string tolower(std::string str) {
                std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
                    return static_cast<char>(std::tolower(ch));
                });
                return str;
            }

            static std::string trim(const std::string &str) {
                auto notSpace {[](unsigned char ch) { return !std::isspace(ch); }};
                auto first {std::find_if(str.begin(), str.end(), notSpace)};
                auto last {std::find_if(str.rbegin(), str.rend(), notSpace).base()};
                return first < last? std::string{first, last}: std::string{};
            }

            [[noreturn]] static void fail(std::size_t lineNo, const std::string &message) {
                throw std::runtime_error("Line #: " + std::to_string(lineNo) + ": " + message);
            }

        public:
            using ConstIterator = std::map<std::string, Section>::const_iterator;

            ConstIterator begin() const { return sections.cbegin(); }
            ConstIterator end() const { return sections.cend(); }

            bool exists(const std::string &sectionName) const {
                return sections.find(tolower(sectionName)) != sections.end();
            }

            bool exists(const std::string &sectionName, const std::string &key) const {
                auto it {sections.find(tolower(sectionName))};
                return it != sections.end() && it->second.exists(key);
            }

            const Section &operator[](const std::string &sectionName) const {
                auto it {sections.find(tolower(sectionName))};
                if (it == sections.end())
                    throw std::runtime_error("Section: `" + sectionName + "` not found.");
                return it->second;
            }

            // Read into curr object from an input string; keys before any
            // section header land in the "" section
            void reads(const std::string &raw) {
                std::string currSectionName;
                std::size_t lineNo {0}, start {0};
                while (start <= raw.size()) {
                    std::size_t end {raw.find('\n', start)};
                    if (end == std::string::npos) end = raw.size();
                    std::string line {trim(raw.substr(start, end - start))};
                    start = end + 1; lineNo++;

                    // Skip blanks and comments
                    if (line.empty() || line[0] == ';' || line[0] == '#')
                        continue;

                    // Start of a new section
                    if (line.front() == '[') {
                        if (line.size() < 3 || line.back() != ']')
                            fail(lineNo, "Malformed section header: " + line);
                        currSectionName = tolower(trim(line.substr(1, line.size() - 2)));
                        if (!sections.emplace(currSectionName, Section{}).second)
                            fail(lineNo, "Section '" + currSectionName + "' already exists.");
                        continue;
                    }

                    // Key value pair, key contains atleast 1 char
                    std::size_t sep {line.find_first_of("=:")};
                    if (sep == std::string::npos || sep == 0)
                        fail(lineNo, "Error parsing line: " + line);

                    std::string key {trim(line.substr(0, sep))}, value {trim(line.substr(sep + 1))};
                    if (!sections[currSectionName].insert(key, value))
                        fail(lineNo, "Option '" + key + "' in section '" + currSectionName + "' already exists.");
                }
            }
    };
}
