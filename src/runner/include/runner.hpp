#pragma once

#include <string>

#include "command.hpp"

namespace ndeploy::runner
{
    struct RunResult
    {
        // -1 when the process could not be started
        int exit_code = -1;
        std::string output;
    };

    /**
     * @brief Boundary between the orchestrator and the external tools.
     */
    class ICommandRunner
    {
    public:
        virtual ~ICommandRunner() = default;

        virtual RunResult run(const command::Command & cmd) = 0;
    };

    /**
     * @brief Runs commands as child processes and logs their output with secrets masked.
     * 
     * Interactive commands share the terminal and their output is not captured.
     */
    class NativeRunner final : public ICommandRunner
    {
    public:
        RunResult run(const command::Command & cmd) override;
    };

    /**
     * @brief Logs what would be run and reports success without spawning anything.
     */
    class DryRunRunner final : public ICommandRunner
    {
    public:
        RunResult run(const command::Command & cmd) override;
    };

    /**
     * @brief Masks the values of the command's secret arguments in `text`.
     */
    std::string redactSecrets(std::string text, const command::Command & cmd);
}
