#include "command.hpp"

#include <algorithm>

#include "utils.hpp"

namespace ndeploy::command
{
    Command buildLogin(const config::ResolvedConfig & cfg)
    {
        return Command{
            .kind = Kind::LOGIN,
            .program = cfg.chain_cli,
            .args = {
                "login",
                "--networkId", cfg.network,
                "--walletUrl", cfg.wallet_ui_endpoint
            },
            .account = cfg.wallet_identity,
            .interactive = true
        };
    }

    Command buildCreateSubaccount(const std::string & account, const config::ResolvedConfig & cfg)
    {
        return Command{
            .kind = Kind::CREATE_SUBACCOUNT,
            .program = cfg.chain_cli,
            .args = {
                "create-account", account,
                "--masterAccount", cfg.wallet_identity,
                "--initialBalance", SUBACCOUNT_INITIAL_BALANCE,
                "--useLedgerKey", "false",
                "--networkId", cfg.network
            },
            .account = account
        };
    }

    Command buildDeployWithInit(const std::string & account, const config::ResolvedConfig & cfg)
    {
        Command cmd{
            .kind = Kind::DEPLOY_WITH_INIT,
            .program = cfg.deploy_tool,
            .args = {
                "near", "deploy",
                "build-non-reproducible-wasm", account,
                "with-init-call", INIT_METHOD,
                "text-args", INIT_ARGS,
                "prepaid-gas", cfg.gas_budget,
                "attached-deposit", cfg.deposit_amount,
                "network-config", cfg.network,
                "sign-with-seed-phrase"
            },
            .account = account
        };

        cmd.secret_args.push_back(cmd.args.size());
        cmd.args.push_back(cfg.seed_credential);

        cmd.args.emplace_back("--seed-phrase-hd-path");
        cmd.args.emplace_back(SEED_PHRASE_HD_PATH);
        cmd.args.emplace_back("send");
        return cmd;
    }

    Command buildQueryState(const std::string & account, const config::ResolvedConfig & cfg)
    {
        return Command{
            .kind = Kind::QUERY_STATE,
            .program = cfg.chain_cli,
            .args = {
                "state", account,
                "--networkId", cfg.network
            },
            .account = account
        };
    }

    std::string renderCommand(const Command & cmd)
    {
        std::string out = utils::shellQuote(cmd.program);
        for(std::size_t i = 0; i < cmd.args.size(); ++i)
        {
            out.push_back(' ');
            if(std::ranges::find(cmd.secret_args, i) != cmd.secret_args.end())
            {
                out += utils::REDACTED;
            }
            else
            {
                out += utils::shellQuote(cmd.args[i]);
            }
        }
        return out;
    }
}
