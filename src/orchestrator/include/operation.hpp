#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "config.hpp"
#include "runner.hpp"
#include "orchestrator.hpp"

namespace ndeploy::orchestrator
{
    enum class Operation : std::uint8_t
    {
        LOGIN = 0,
        DEPLOY,
        DEPLOY_MAIN,
        DEPLOY_TOKEN,
        DEPLOY_HTLC,
        CREATE_SUBACCOUNTS,
        STATE,
        STATE_ALL,
        SHOW_CONFIG
    };

    struct OperationInfo
    {
        Operation operation;
        std::string_view name;
        bool takes_account;
        std::string_view help;
    };

    const std::vector<OperationInfo> & operations();

    /**
     * @brief Parses an operation name and its optional account argument from the positional arguments.
     */
    Result<std::pair<Operation, std::optional<std::string>>> parseInvocation(const std::vector<std::string> & positional);

    /**
     * @brief Runs a parsed operation.
     */
    Result<void> runOperation(Orchestrator & orchestrator, Operation operation, const std::optional<std::string> & account_id);

    /**
     * @brief Where the configuration of one run comes from.
     */
    struct ConfigSources
    {
        config::Settings command_line;
        config::EnvLookup lookup;
        std::filesystem::path override_path;
        std::filesystem::path dotenv_path = config::DEFAULT_DOTENV_FILE;
    };

    /**
     * @brief Resolves the configuration and runs the operation through `runner`.
     * 
     * Nothing reaches the runner when the configuration cannot be resolved.
     */
    Result<void> resolveAndRun(const ConfigSources & sources, runner::ICommandRunner & runner, Operation operation, const std::optional<std::string> & account_id);
}
