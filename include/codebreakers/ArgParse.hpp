#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Codebreakers::argparse {
    enum ARGTYPE { POSITIONAL, NAMED };

    using VALUE_TYPE = std::variant<bool, int, std::string>;

    template<typename T>
    concept ValidValueType =
        std::same_as<T, bool> || std::same_as<T, int> || std::same_as<T, std::string>;

    inline std::string toString(const VALUE_TYPE &val) {
        return std::visit([](const auto &arg) -> std::string {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, bool>) return arg? "true": "false";
            else if constexpr (std::is_same_v<T, int>) return std::to_string(arg);
            else return arg;
        }, val);
    }

    class Argument {
        private:
            std::string _name;
            ARGTYPE _type;
            bool _required {false}, _valueSet {false}, _defaultValueSet {false};
            std::string _alias, _helpStr;
            VALUE_TYPE _value;
            std::optional<VALUE_TYPE> _default, _implicit;
            std::vector<std::string> _choices;

            template<typename T>
            T parse(const std::string &arg) const {
                if constexpr (std::is_same_v<T, bool>) {
                    return arg != "" && arg != "0" && arg != "false";
                }

                else if constexpr (std::is_same_v<T, std::string>) {
                    if (!_choices.empty() && std::find(_choices.begin(), _choices.end(), arg) == _choices.end())
                        throw std::runtime_error("Argparse Error: Invalid choice for '" + _name + "': " + arg);
                    return arg;
                }

                else {
                    T placeholder;
                    std::from_chars_result parseResult {std::from_chars(arg.data(), arg.data() + arg.size(), placeholder)};
                    if (parseResult.ec != std::errc() || parseResult.ptr != arg.data() + arg.size())
                        throw std::runtime_error("Argparse Error: Invalid value passed to '" + _name + "': " + arg);
                    return placeholder;
                }
            }

        public:
            Argument(const std::string &name, ARGTYPE type = NAMED):
                _name(name), _type(type), _value(std::string{})
            {
                if (name.empty())
                    throw std::runtime_error("Argparse Error: Argument name cannot be empty");
                else if (name.starts_with('-') || name.find('=') != std::string::npos)
                    throw std::runtime_error("Argparse Error: Invalid parameter name: " + name);
            }

            bool           ok() const { return !_required || _valueSet || _defaultValueSet; }
            bool   isOptional() const { return !_required || _defaultValueSet; }
            bool   isValueSet() const { return _valueSet; }
            bool isDefaultSet() const { return _defaultValueSet; }

            // Flags never swallow the next token as their value
            bool isFlag() const { return std::holds_alternative<bool>(_value) && _implicit.has_value(); }

            const std::string &getName() const { return _name; }
            const std::string &getAlias() const { return _alias; }
            ARGTYPE getArgType() const { return _type; }

            template<ValidValueType T>
            T get() const {
                if (!_valueSet && !_defaultValueSet)
                    throw std::runtime_error("Argparse Error: Argument '" + _name + "' was not set");
                else if (!std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (get): " + _name);
                return std::get<T>(_value);
            }

            std::string getHelp(int width) const {
                std::ostringstream oss, part;
                part << (_type == POSITIONAL? "": "--") << _name;
                if (!_alias.empty()) part << ", -" << _alias;

                oss << std::left << std::setw(width) << part.str() << "\t" << _helpStr;
                if (!_choices.empty()) {
                    oss << " {";
                    for (std::size_t i {0}; i < _choices.size(); i++)
                        oss << (i? ",": "") << _choices[i];
                    oss << '}';
                }
                if (_required) oss << " (REQUIRED)";
                if (_defaultValueSet) oss << " (default=" << toString(*_default) << ")";
                return oss.str();
            }

            Argument &alias(const std::string &name) {
                if (_type == POSITIONAL)
                    throw std::runtime_error("Argparse Error: Alias being set for a positional argument: " + _name);
                _alias = name; return *this;
            }

            Argument &required() { _required = true; return *this; }
            Argument &help(const std::string &msg) { _helpStr = msg; return *this; }

            Argument &choices(const std::vector<std::string> &options) {
                if (!std::holds_alternative<std::string>(_value))
                    throw std::runtime_error("Argparse Error: Choices only apply to string arguments: " + _name);
                _choices = options; return *this;
            }

            // Flag style, no value given on the command line
            Argument &set() {
                if (!_implicit.has_value())
                    throw std::runtime_error("Argparse Error: Missing value for argument: " + _name);
                _value = *_implicit; _valueSet = true; return *this;
            }

            Argument &set(const std::string &val) {
                std::visit([&](auto &arg) {
                    using T = std::decay_t<decltype(arg)>;
                    arg = parse<T>(val);
                }, _value);
                _valueSet = true; return *this;
            }

            template<ValidValueType T>
            Argument &scan() { _value = T{}; return *this; }

            template<ValidValueType T>
            Argument &defaultValue(const T &val) {
                if (_implicit.has_value() && !std::holds_alternative<T>(*_implicit))
                    throw std::runtime_error("Argparse Error: Type mismatch (default): " + _name);
                _defaultValueSet = true; _default = _value = val; return *this;
            }

            template<ValidValueType T>
            Argument &implicitValue(const T &val) {
                if (_defaultValueSet && !std::holds_alternative<T>(*_default))
                    throw std::runtime_error("Argparse Error: Type mismatch (implicit): " + _name);
                _implicit = val;
                if (!_defaultValueSet) _value = T{};
                return *this;
            }

            // Auto cast char* to std::string
            Argument  &defaultValue(const char *val) { return  defaultValue<std::string>(val); }
            Argument &implicitValue(const char *val) { return implicitValue<std::string>(val); }
    };

    class ArgumentParser {
        private:
            static constexpr const char *HELP_ARG {"help"};

            std::string name;
            std::optional<std::string> _description;
            std::vector<Argument> args;
            std::map<std::string, std::unique_ptr<ArgumentParser>> subcommands;

            // Whether parseArgs reached this parser at all, needed to tell
            // which subcommand was invoked
            bool touched {false};

            Argument *find(const std::string &key) {
                auto it {std::find_if(args.begin(), args.end(), [&key](const Argument &arg) {
                    return arg.getName() == key;
                })};
                return it == args.end()? nullptr: &*it;
            }

            const Argument *find(const std::string &key) const {
                return const_cast<ArgumentParser *>(this)->find(key);
            }

            Argument *findAlias(const std::string &alias) {
                auto it {std::find_if(args.begin(), args.end(), [&alias](const Argument &arg) {
                    return !arg.getAlias().empty() && arg.getAlias() == alias;
                })};
                return it == args.end()? nullptr: &*it;
            }

            Argument *nextPositional() {
                for (Argument &arg: args) {
                    if (arg.getArgType() == POSITIONAL && !arg.isValueSet())
                        return &arg;
                }
                return nullptr;
            }

            // Assign the value for a named / aliased arg, consuming the next token if needed
            static void assign(Argument &arg, const std::optional<std::string> &inlineValue,
                    const std::vector<std::string> &argVec, std::size_t &i) {
                if (inlineValue)
                    arg.set(*inlineValue);
                else if (arg.isFlag() || i + 1 >= argVec.size() || argVec[i + 1].starts_with('-'))
                    arg.set();
                else
                    arg.set(argVec[++i]);
            }

        public:
            explicit ArgumentParser(const std::string &name): name(name) {
                addArgument(HELP_ARG).help("Display this help text and exit")
                    .defaultValue(false).implicitValue(true).alias("h");
            }

            const std::string &getName() const { return name; }

            ArgumentParser &description(const std::string &message) {
                _description = message; return *this;
            }

            // Add a new argument for the parser, no duplicates
            Argument &addArgument(const std::string &argName, ARGTYPE type = NAMED) {
                if (find(argName) != nullptr)
                    throw std::runtime_error("Argparse Error: Duplicate argument with name: " + argName);
                args.emplace_back(argName, type);
                return args.back();
            }

            ArgumentParser &addSubcommand(const std::string &cmdName) {
                if (subcommands.find(cmdName) != subcommands.end())
                    throw std::runtime_error("Argparse Error: Duplicate subcommand with name: " + cmdName);
                return *subcommands.emplace(cmdName, std::make_unique<ArgumentParser>(cmdName)).first->second;
            }

            ArgumentParser &getChildParser(const std::string &cmdName) {
                auto it {subcommands.find(cmdName)};
                if (it == subcommands.end())
                    throw std::runtime_error("Argparse Error: Subcommand with name '" + cmdName + "' does not exist");
                return *it->second;
            }

            // Name of the first unsatisfied argument, empty if all are fine.
            // Does not look into child parsers.
            std::string check() const {
                for (const Argument &arg: args)
                    if (!arg.ok()) return arg.getName();
                return "";
            }

            bool ok() const { return touched && check().empty(); }
            bool isTouched() const { return touched; }

            bool helpRequested() const { return touched && get<bool>(HELP_ARG); }

            // Help text of whichever parser in the tree was asked for --help
            std::optional<std::string> pendingHelp() const {
                if (helpRequested()) return getHelp();
                for (const auto &[_, child]: subcommands) {
                    if (auto help {child->pendingHelp()}) return help;
                }
                return std::nullopt;
            }

            bool exists(const std::string &key) const noexcept {
                const Argument *arg {find(key)};
                return arg != nullptr && (arg->isValueSet() || arg->isDefaultSet());
            }

            template<ValidValueType T=std::string>
            T get(const std::string &key) const {
                const Argument *arg {find(key)};
                if (arg == nullptr)
                    throw std::runtime_error("Argparse Error: Argument with name '" + key + "' does not exist");
                return arg->get<T>();
            }

            void parseArgs(int argc, char **argv) {
                parseArgs(std::vector<std::string>{argv, argv + argc});
            }

            // argVec[0] is the program name; hands over to a subcommand parser
            // as soon as its name shows up, skipping validation of the parent
            void parseArgs(const std::vector<std::string> &argVec, std::size_t parseStartIdx = 0) {
                touched = true;
                bool positionalOnly {false};
                for (std::size_t i {parseStartIdx + 1}; i < argVec.size(); i++) {
                    const std::string &token {argVec[i]};

                    if (!positionalOnly && token == "--") {
                        positionalOnly = true;
                    }

                    // Named arg, eg: "--key=LEMON" (or) "--key LEMON"
                    else if (!positionalOnly && token.starts_with("--")) {
                        std::size_t eq {token.find('=')};
                        std::string argName {token.substr(2, eq == std::string::npos? std::string::npos: eq - 2)};
                        std::optional<std::string> value;
                        if (eq != std::string::npos) value = token.substr(eq + 1);

                        Argument *arg {find(argName)};
                        if (arg == nullptr || arg->getArgType() == POSITIONAL)
                            throw std::runtime_error("Argparse Error: Unknown named argument passed: " + argName);
                        assign(*arg, value, argVec, i);
                    }

                    // Aliased arg, eg: "-k LEMON"; a lone "-" is a positional (stdin)
                    else if (!positionalOnly && token.size() > 1 && token.starts_with('-')) {
                        Argument *arg {findAlias(token.substr(1))};
                        if (arg == nullptr)
                            throw std::runtime_error("Argparse Error: Unknown aliased argument passed: " + token.substr(1));
                        assign(*arg, std::nullopt, argVec, i);
                    }

                    else if (!positionalOnly && subcommands.find(token) != subcommands.end()) {
                        subcommands.at(token)->parseArgs(argVec, i);
                        return;
                    }

                    else {
                        Argument *arg {nextPositional()};
                        if (arg == nullptr)
                            throw std::runtime_error("Argparse Error: Unknown positional argument passed: " + token);
                        arg->set(token);
                    }

                    // Stop right away on --help, nothing else matters
                    if (get<bool>(HELP_ARG)) return;
                }

                const std::string missingArg {check()};
                if (!missingArg.empty())
                    throw std::runtime_error("Argparse Error: Missing value for argument: " + missingArg);
            }

            std::string getHelp() const {
                int width {15};
                for (const Argument &arg: args)
                    width = std::max(width, static_cast<int>(arg.getName().size() + 10));

                std::ostringstream oss;
                oss << "Usage: " << name << " [OPTIONS] ";
                if (!subcommands.empty()) {
                    std::string names;
                    for (const auto &[cmdName, _]: subcommands)
                        names += (names.empty()? "": ",") + cmdName;
                    oss << '{' << names << "} ";
                }
                for (const Argument &arg: args) {
                    if (arg.getArgType() != POSITIONAL) continue;
                    oss << (arg.isOptional()? '[' + arg.getName() + ']': arg.getName()) << ' ';
                }

                if (_description) oss << "\n\n" << *_description;

                if (!subcommands.empty()) {
                    oss << "\n\nSubcommands:";
                    for (const auto &[cmdName, command]: subcommands) {
                        oss << "\n " << std::left << std::setw(width) << cmdName << "\t"
                            << command->_description.value_or("The '" + cmdName + "' subcommand");
                    }
                }

                oss << "\n\nArguments:\n";
                for (const Argument &arg: args)
                    oss << " " << arg.getHelp(width) << '\n';
                return oss.str();
            }
    };
}
