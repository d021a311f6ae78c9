#pragma once

#include <cstdint>
#include <string>
#include <expected>

#include <fmt/format.h>

namespace ndeploy
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            MISSING_REQUIRED_CONFIG,
            INVALID_CONFIG_FILE,
            INVALID_ACCOUNT_REFERENCE,
            INVALID_ARGUMENT,
            EXTERNAL_COMMAND_FAILED
        } kind = Kind::UNKNOWN;

        std::string message;

        // set for EXTERNAL_COMMAND_FAILED
        std::string operation;
        std::string account;
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct fmt::formatter<ndeploy::Error::Kind> : fmt::formatter<std::string_view>
{
    auto format(const ndeploy::Error::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case ndeploy::Error::Kind::MISSING_REQUIRED_CONFIG:
                return formatter<std::string_view>::format("Missing required config", ctx);
            case ndeploy::Error::Kind::INVALID_CONFIG_FILE:
                return formatter<std::string_view>::format("Invalid config file", ctx);
            case ndeploy::Error::Kind::INVALID_ACCOUNT_REFERENCE:
                return formatter<std::string_view>::format("Invalid account reference", ctx);
            case ndeploy::Error::Kind::INVALID_ARGUMENT:
                return formatter<std::string_view>::format("Invalid argument", ctx);
            case ndeploy::Error::Kind::EXTERNAL_COMMAND_FAILED:
                return formatter<std::string_view>::format("External command failed", ctx);
            default:
                return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
