#include "arg_parser.hpp"

#include <fmt/format.h>

namespace ndeploy::cmd
{
    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help)
    {
        _defs.insert_or_assign(std::move(name), CommandLineArgDef{.nargs = nargs, .type = type, .help = std::move(help)});
    }

    void ArgParser::addPositional(std::string name, std::string help)
    {
        _positional_defs.emplace_back(std::move(name), std::move(help));
    }

    Result<void> ArgParser::parse(int argc, const char * const argv[])
    {
        std::vector<std::string> args;
        for(int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parse(args);
    }

    Result<void> ArgParser::parse(const std::vector<std::string> & args)
    {
        _values.clear();
        _positional.clear();

        for(std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string & arg = args[i];

            if(arg.size() < 2 || arg.front() != '-')
            {
                _positional.push_back(arg);
                continue;
            }

            std::string name = arg;
            std::optional<std::string> inline_value;
            if(const auto eq = arg.find('='); eq != std::string::npos)
            {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }

            const auto def_it = _defs.find(name);
            if(def_it == _defs.end())
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::INVALID_ARGUMENT,
                    .message = fmt::format("Unknown argument '{}'", name)
                });
            }

            const CommandLineArgDef & def = def_it->second;
            if(def.nargs == CommandLineArgDef::NArgs::Zero)
            {
                if(inline_value)
                {
                    return std::unexpected(Error{
                        .kind = Error::Kind::INVALID_ARGUMENT,
                        .message = fmt::format("Argument '{}' does not take a value", name)
                    });
                }
                _values[name];
                continue;
            }

            if(inline_value)
            {
                _values[name].push_back(*inline_value);
                continue;
            }

            if(i + 1 >= args.size())
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::INVALID_ARGUMENT,
                    .message = fmt::format("Argument '{}' expects a value", name)
                });
            }

            _values[name].push_back(args[++i]);
        }

        return {};
    }

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const
    {
        if(_values.contains(name) == false)
        {
            return std::nullopt;
        }
        return true;
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end() || it->second.empty())
        {
            return std::nullopt;
        }
        return it->second;
    }

    const std::vector<std::string> & ArgParser::getPositionalArgs() const
    {
        return _positional;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::string out = "Usage: ndeploy";
        for(const auto & [name, help] : _positional_defs)
        {
            out += fmt::format(" <{}>", name);
        }
        out += " [options]\n";

        if(!_positional_defs.empty())
        {
            out += "\nArguments:\n";
            for(const auto & [name, help] : _positional_defs)
            {
                out += fmt::format("  {:<24}{}\n", name, help);
            }
        }

        out += "\nOptions:\n";
        for(const auto & [name, def] : _defs)
        {
            const std::string left = def.nargs == CommandLineArgDef::NArgs::One
                ? fmt::format("{} <value>", name)
                : name;
            out += fmt::format("  {:<24}{}\n", left, def.help);
        }
        return out;
    }
}
