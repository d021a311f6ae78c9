#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "config.hpp"

namespace ndeploy::command
{
    inline constexpr const char * INIT_METHOD = "new";
    inline constexpr const char * INIT_ARGS = "{}";
    inline constexpr const char * SUBACCOUNT_INITIAL_BALANCE = "10";
    inline constexpr const char * SEED_PHRASE_HD_PATH = "m/44'/397'/0'";

    enum class Kind : std::uint8_t
    {
        LOGIN = 0,
        CREATE_SUBACCOUNT,
        DEPLOY_WITH_INIT,
        QUERY_STATE
    };

    /**
     * @brief A single invocation of an external tool.
     * 
     * `secret_args` holds indices into `args` whose values must never be printed.
     */
    struct Command
    {
        Kind kind;
        std::string program;
        std::vector<std::string> args;
        std::string account;
        bool interactive = false;
        std::vector<std::size_t> secret_args;
    };

    Command buildLogin(const config::ResolvedConfig & cfg);

    /**
     * @brief Creates `account` under the master wallet with a fixed initial balance and without a hardware key.
     */
    Command buildCreateSubaccount(const std::string & account, const config::ResolvedConfig & cfg);

    /**
     * @brief Builds and deploys the contract to `account` and calls its `new` initializer with empty arguments,
     * signing with the seed credential.
     */
    Command buildDeployWithInit(const std::string & account, const config::ResolvedConfig & cfg);

    Command buildQueryState(const std::string & account, const config::ResolvedConfig & cfg);

    /**
     * @brief Renders the command as a shell line with secret arguments masked.
     */
    std::string renderCommand(const Command & cmd);
}

template <>
struct fmt::formatter<ndeploy::command::Kind> : fmt::formatter<std::string_view>
{
    auto format(const ndeploy::command::Kind & kind, format_context & ctx) const
    {
        switch(kind)
        {
            case ndeploy::command::Kind::LOGIN:
                return formatter<std::string_view>::format("login", ctx);
            case ndeploy::command::Kind::CREATE_SUBACCOUNT:
                return formatter<std::string_view>::format("create-subaccount", ctx);
            case ndeploy::command::Kind::DEPLOY_WITH_INIT:
                return formatter<std::string_view>::format("deploy", ctx);
            case ndeploy::command::Kind::QUERY_STATE:
                return formatter<std::string_view>::format("state", ctx);
            default:
                return formatter<std::string_view>::format("unknown", ctx);
        }
    }
};
