#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

#include <fmt/chrono.h>

namespace ndeploy::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path) 
    {
        std::ifstream file(path);
        if (!file.is_open()) return "Unknown";
        std::string timestamp;
        std::getline(file, timestamp);
        return timestamp;
    }

    std::string currentTimestamp()
    {
        const std::time_t now = std::time(nullptr);
        return fmt::format("{:%F-%H_%M_%S}", fmt::localtime(now));
    }

    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
    }

    std::string redact(std::string text, const std::string & secret)
    {
        if(secret.empty())
        {
            return text;
        }

        const std::string mask = REDACTED;
        std::size_t pos = text.find(secret);
        while(pos != std::string::npos)
        {
            text.replace(pos, secret.size(), mask);
            pos = text.find(secret, pos + mask.size());
        }
        return text;
    }

    std::string shellQuote(const std::string & arg)
    {
        if(arg.empty())
        {
            return "''";
        }

        const bool plain = std::ranges::all_of(arg, [](unsigned char c)
            {
                return std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '/' || c == ':' || c == '=' || c == '@';
            });

        if(plain)
        {
            return arg;
        }

        std::string out = "'";
        for(const char c : arg)
        {
            if(c == '\'')
            {
                out += "'\\''";
            }
            else
            {
                out.push_back(c);
            }
        }
        out += "'";
        return out;
    }
}
