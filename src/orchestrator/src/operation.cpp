#include "operation.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace ndeploy::orchestrator
{
    const std::vector<OperationInfo> & operations()
    {
        static const std::vector<OperationInfo> infos{
            {Operation::LOGIN,              "login",                false,  "Log in to the wallet through the chain CLI"},
            {Operation::DEPLOY,             "deploy",               true,   "Deploy and initialize the contract on [account], main account by default"},
            {Operation::DEPLOY_MAIN,        "deploy-main",          false,  "Deploy and initialize the contract on the main account"},
            {Operation::DEPLOY_TOKEN,       "deploy-token",         false,  "Deploy and initialize the contract on token.<wallet>"},
            {Operation::DEPLOY_HTLC,        "deploy-htlc",          false,  "Deploy and initialize the contract on htlc.<wallet>"},
            {Operation::CREATE_SUBACCOUNTS, "create-subaccounts",   false,  "Create token.<wallet> then htlc.<wallet>"},
            {Operation::STATE,              "state",                true,   "Show the state of [account], main account by default"},
            {Operation::STATE_ALL,          "state-all",            false,  "Show the state of the main, token and htlc accounts"},
            {Operation::SHOW_CONFIG,        "show-config",          false,  "Print the resolved configuration and accounts"}
        };
        return infos;
    }

    Result<std::pair<Operation, std::optional<std::string>>> parseInvocation(const std::vector<std::string> & positional)
    {
        if(positional.empty())
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ARGUMENT,
                .message = "No operation given"
            });
        }

        const auto & infos = operations();
        const auto it = std::ranges::find_if(infos, [&positional](const OperationInfo & info)
            {
                return utils::equalsIgnoreCase(positional.front(), std::string(info.name));
            });

        if(it == infos.end())
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ARGUMENT,
                .message = fmt::format("Unknown operation '{}'", positional.front())
            });
        }

        const std::size_t max_args = it->takes_account ? 2 : 1;
        if(positional.size() > max_args)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ARGUMENT,
                .message = fmt::format("Unexpected argument '{}' for operation '{}'", positional.at(max_args), it->name)
            });
        }

        std::optional<std::string> account_id;
        if(positional.size() == 2)
        {
            account_id = positional.at(1);
        }
        return std::make_pair(it->operation, std::move(account_id));
    }

    Result<void> runOperation(Orchestrator & orchestrator, Operation operation, const std::optional<std::string> & account_id)
    {
        switch(operation)
        {
            case Operation::LOGIN:
                return orchestrator.login();
            case Operation::DEPLOY:
                return orchestrator.deployDefault(account_id);
            case Operation::DEPLOY_MAIN:
                return orchestrator.deployMain();
            case Operation::DEPLOY_TOKEN:
                return orchestrator.deployToken();
            case Operation::DEPLOY_HTLC:
                return orchestrator.deployHtlc();
            case Operation::CREATE_SUBACCOUNTS:
                return orchestrator.createSubaccounts();
            case Operation::STATE:
                return orchestrator.queryState(account_id);
            case Operation::STATE_ALL:
            {
                const StateReport report = orchestrator.queryAllStates();
                for(const StateQueryOutcome & outcome : report.outcomes)
                {
                    if(outcome.result)
                    {
                        spdlog::info("  {:<40} ok", outcome.account);
                    }
                    else
                    {
                        spdlog::warn("  {:<40} FAILED: {}", outcome.account, outcome.result.error().message);
                    }
                }
                if(!report.ok())
                {
                    return std::unexpected(Error{
                        .kind = Error::Kind::EXTERNAL_COMMAND_FAILED,
                        .message = fmt::format("{} of {} state queries failed", report.failures(), report.outcomes.size()),
                        .operation = "state-all"
                    });
                }
                return {};
            }
            case Operation::SHOW_CONFIG:
            {
                const auto & accounts = orchestrator.accounts();
                spdlog::info("Config: {}", config::describeConfig(orchestrator.resolvedConfig()));
                spdlog::info("Accounts: main={} token={} htlc={}", accounts.main, accounts.token, accounts.htlc);
                return {};
            }
        }

        return std::unexpected(Error{
            .kind = Error::Kind::INVALID_ARGUMENT,
            .message = "Unhandled operation"
        });
    }

    Result<void> resolveAndRun(const ConfigSources & sources, runner::ICommandRunner & runner, Operation operation, const std::optional<std::string> & account_id)
    {
        const auto cfg_res = config::resolve(sources.command_line, sources.lookup, sources.override_path, sources.dotenv_path);
        if(!cfg_res)
        {
            return std::unexpected(cfg_res.error());
        }

        spdlog::debug("Resolved config: {}", config::describeConfig(*cfg_res));

        Orchestrator orchestrator(*cfg_res, runner);
        return runOperation(orchestrator, operation, account_id);
    }
}
