#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"

namespace ndeploy::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs
        {
            Zero,
            One
        };

        enum class Type
        {
            Bool,
            String
        };

        NArgs nargs;
        Type type;
        std::string help;
    };

    /**
     * @brief Command line parser for `--name value`, `--name=value` and bare flag arguments.
     * 
     * Arguments that do not start with '-' are collected as positional arguments in order.
     * A value given more than once is accumulated.
     */
    class ArgParser
    {
        public:
            void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help);

            /**
             * @brief Adds a positional argument description to the help message.
             */
            void addPositional(std::string name, std::string help);

            Result<void> parse(int argc, const char * const argv[]);
            Result<void> parse(const std::vector<std::string> & args);

            /**
             * @brief Returns the value of a parsed argument.
             * 
             * Supported types: bool, std::vector<std::string>.
             * Returns std::nullopt when the argument was not given.
             */
            template<class T>
            std::optional<T> getArg(const std::string & name) const;

            const std::vector<std::string> & getPositionalArgs() const;

            std::string constructHelpMessage() const;

        private:
            std::map<std::string, CommandLineArgDef> _defs;
            std::vector<std::pair<std::string, std::string>> _positional_defs;

            std::map<std::string, std::vector<std::string>> _values;
            std::vector<std::string> _positional;
    };

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const;
}
