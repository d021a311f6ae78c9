#include "runner.hpp"

#include <spdlog/spdlog.h>

#include "native.h"
#include "utils.hpp"

namespace ndeploy::runner
{
    std::string redactSecrets(std::string text, const command::Command & cmd)
    {
        for(const std::size_t index : cmd.secret_args)
        {
            if(index < cmd.args.size())
            {
                text = utils::redact(std::move(text), cmd.args[index]);
            }
        }
        return text;
    }

    RunResult NativeRunner::run(const command::Command & cmd)
    {
        spdlog::info("Running: {}", command::renderCommand(cmd));

        if(cmd.interactive)
        {
            const int exit_code = native::runAttachedProcess(cmd.program, cmd.args);
            spdlog::debug("{} exited with code {}", cmd.program, exit_code);
            return RunResult{.exit_code = exit_code};
        }

        auto [exit_code, output] = native::runProcess(cmd.program, cmd.args);
        output = redactSecrets(std::move(output), cmd);

        if(!output.empty())
        {
            if(exit_code == 0)
            {
                spdlog::info("{} output:\n{}", cmd.program, output);
            }
            else
            {
                spdlog::error("{} output:\n{}", cmd.program, output);
            }
        }
        spdlog::debug("{} exited with code {}", cmd.program, exit_code);

        return RunResult{.exit_code = exit_code, .output = std::move(output)};
    }

    RunResult DryRunRunner::run(const command::Command & cmd)
    {
        spdlog::info("[dry-run] {}", command::renderCommand(cmd));
        return RunResult{.exit_code = 0};
    }
}
