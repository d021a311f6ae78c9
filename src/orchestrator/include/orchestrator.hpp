#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "account.hpp"
#include "command.hpp"
#include "config.hpp"
#include "error.hpp"
#include "runner.hpp"

namespace ndeploy::orchestrator
{
    struct StateQueryOutcome
    {
        std::string account;
        Result<void> result;
    };

    /**
     * @brief Outcome of querying every account of the set, in query order.
     */
    struct StateReport
    {
        std::vector<StateQueryOutcome> outcomes;

        bool ok() const;
        std::size_t failures() const;
    };

    /**
     * @brief Named deployment operations over the main, token and htlc accounts.
     * 
     * Every operation runs its commands one after another through the runner and blocks on each.
     * Nothing is retried.
     */
    class Orchestrator
    {
        public:
            Orchestrator(config::ResolvedConfig cfg, runner::ICommandRunner & runner);

            const config::ResolvedConfig & resolvedConfig() const noexcept;
            const account::AccountSet & accounts() const noexcept;

            Result<void> login();

            Result<void> deployMain();
            Result<void> deployToken();
            Result<void> deployHtlc();

            /**
             * @brief Deploys to `account_id`, or to the main account when none is given.
             */
            Result<void> deployDefault(const std::optional<std::string> & account_id = std::nullopt);

            /**
             * @brief Creates the token subaccount, then the htlc subaccount.
             * 
             * Stops at the first failure.
             */
            Result<void> createSubaccounts();

            Result<void> queryState(const std::optional<std::string> & account_id = std::nullopt);

            /**
             * @brief Queries main, token and htlc in that order.
             * 
             * A failed query does not prevent the remaining ones.
             */
            StateReport queryAllStates();

        private:
            Result<std::string> _targetAccount(const std::optional<std::string> & account_id) const;

            Result<void> _execute(const command::Command & cmd, std::string_view operation);

            const config::ResolvedConfig _cfg;
            const account::AccountSet _accounts;
            runner::ICommandRunner & _runner;
    };
}
