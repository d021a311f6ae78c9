#include "orchestrator.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace ndeploy::orchestrator
{
    bool StateReport::ok() const
    {
        return failures() == 0;
    }

    std::size_t StateReport::failures() const
    {
        return static_cast<std::size_t>(std::ranges::count_if(outcomes, [](const StateQueryOutcome & o) { return !o.result.has_value(); }));
    }

    Orchestrator::Orchestrator(config::ResolvedConfig cfg, runner::ICommandRunner & runner)
    :   _cfg(std::move(cfg)),
        _accounts(account::derive(_cfg.wallet_identity)),
        _runner(runner)
    {
    }

    const config::ResolvedConfig & Orchestrator::resolvedConfig() const noexcept
    {
        return _cfg;
    }

    const account::AccountSet & Orchestrator::accounts() const noexcept
    {
        return _accounts;
    }

    Result<std::string> Orchestrator::_targetAccount(const std::optional<std::string> & account_id) const
    {
        if(!account_id)
        {
            return _accounts.main;
        }
        return account::validateAccountReference(*account_id);
    }

    Result<void> Orchestrator::_execute(const command::Command & cmd, std::string_view operation)
    {
        spdlog::debug("{} ({}) on {}", operation, cmd.kind, cmd.account);

        const runner::RunResult result = _runner.run(cmd);
        if(result.exit_code != 0)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::EXTERNAL_COMMAND_FAILED,
                .message = result.exit_code < 0
                    ? fmt::format("{} for {} could not be started", operation, cmd.account)
                    : fmt::format("{} for {} exited with code {}", operation, cmd.account, result.exit_code),
                .operation = std::string(operation),
                .account = cmd.account
            });
        }

        spdlog::info("{} for {} succeeded", operation, cmd.account);
        return {};
    }

    Result<void> Orchestrator::login()
    {
        return _execute(command::buildLogin(_cfg), "login");
    }

    Result<void> Orchestrator::deployMain()
    {
        return _execute(command::buildDeployWithInit(_accounts.main, _cfg), "deploy-main");
    }

    Result<void> Orchestrator::deployToken()
    {
        return _execute(command::buildDeployWithInit(_accounts.token, _cfg), "deploy-token");
    }

    Result<void> Orchestrator::deployHtlc()
    {
        return _execute(command::buildDeployWithInit(_accounts.htlc, _cfg), "deploy-htlc");
    }

    Result<void> Orchestrator::deployDefault(const std::optional<std::string> & account_id)
    {
        const auto target_res = _targetAccount(account_id);
        if(!target_res)
        {
            return std::unexpected(target_res.error());
        }

        return _execute(command::buildDeployWithInit(*target_res, _cfg), "deploy");
    }

    Result<void> Orchestrator::createSubaccounts()
    {
        for(const std::string & account : {_accounts.token, _accounts.htlc})
        {
            const auto res = _execute(command::buildCreateSubaccount(account, _cfg), "create-subaccount");
            if(!res)
            {
                return res;
            }
        }
        return {};
    }

    Result<void> Orchestrator::queryState(const std::optional<std::string> & account_id)
    {
        const auto target_res = _targetAccount(account_id);
        if(!target_res)
        {
            return std::unexpected(target_res.error());
        }

        return _execute(command::buildQueryState(*target_res, _cfg), "state");
    }

    StateReport Orchestrator::queryAllStates()
    {
        StateReport report;
        for(const std::string & account : {_accounts.main, _accounts.token, _accounts.htlc})
        {
            report.outcomes.push_back(StateQueryOutcome{
                .account = account,
                .result = _execute(command::buildQueryState(account, _cfg), "state")
            });
        }

        if(report.ok())
        {
            spdlog::info("All {} state queries succeeded", report.outcomes.size());
        }
        else
        {
            spdlog::warn("{} of {} state queries failed", report.failures(), report.outcomes.size());
        }
        return report;
    }
}
