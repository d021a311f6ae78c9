#include "ndeploy.hpp"

static void _configureLogger(const std::filesystem::path & logs_path, bool verbose)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    console_sink->set_pattern("[%T] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);
    if(!ec)
    {
        const std::string log_name = ndeploy::utils::currentTimestamp() + "-ndeploy.log";
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>((logs_path / log_name).string(), true);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);

    if(ec)
    {
        spdlog::warn("Cannot create log directory {}: {}. Logging to console only", logs_path.string(), ec.message());
    }
}

static void _reportError(const ndeploy::Error & error)
{
    if(error.operation.empty())
    {
        spdlog::error("{}: {}", error.kind, error.message);
    }
    else
    {
        spdlog::error("{} [{}{}{}]: {}", error.kind, error.operation, error.account.empty() ? "" : " ", error.account, error.message);
    }
}

int main(int argc, char* argv[])
{
    using ndeploy::cmd::CommandLineArgDef;

    ndeploy::cmd::ArgParser arg_parser;
    arg_parser.addPositional("operation", "One of the operations listed below");
    arg_parser.addArg("-h", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--verbose", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Print debug output to the console");
    arg_parser.addArg("--dry-run", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Print the commands instead of running them");
    arg_parser.addArg("--log-dir", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Directory for log files");
    arg_parser.addArg("--config", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Override file (default: $NEAR_DEPLOY_CONFIG or .near-deploy.json)");
    arg_parser.addArg("--wallet", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Master wallet account (default: $NEAR_WALLET)");
    arg_parser.addArg("--network", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Network name (default: $NEAR_NETWORK or testnet)");
    arg_parser.addArg("--gas", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Prepaid gas for the init call (default: $NEAR_GAS or '100.0 Tgas')");
    arg_parser.addArg("--deposit", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Deposit attached to the init call (default: $NEAR_DEPOSIT or '1 NEAR')");
    arg_parser.addArg("--wallet-url", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Wallet UI used by login (default: $NEAR_WALLET_URL)");

    const auto parse_res = arg_parser.parse(argc, argv);

    const std::filesystem::path bin_path = std::filesystem::path(argv[0]).parent_path();
    const std::filesystem::path logs_path = arg_parser.getArg<std::vector<std::string>>("--log-dir")
        .transform([](const std::vector<std::string> & v) { return std::filesystem::path(v.back()); })
        .value_or(bin_path.parent_path() / "logs");

    _configureLogger(logs_path, arg_parser.getArg<bool>("--verbose").value_or(false));

    if(!parse_res)
    {
        _reportError(parse_res.error());
        std::printf("%s", arg_parser.constructHelpMessage().c_str());
        return 1;
    }

    const std::string build_timestamp = ndeploy::utils::loadBuildTimestamp(bin_path / "build_timestamp");

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("ndeploy build timestamp: {}", build_timestamp);
        spdlog::info("Version: {}.{}.{}", ndeploy::MAJOR_VERSION, ndeploy::MINOR_VERSION, ndeploy::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        std::string help = arg_parser.constructHelpMessage();
        help += "\nOperations:\n";
        for(const auto & info : ndeploy::orchestrator::operations())
        {
            const std::string name = info.takes_account ? std::string(info.name) + " [account]" : std::string(info.name);
            help += fmt::format("  {:<24}{}\n", name, info.help);
        }
        std::printf("%s", help.c_str());
        return 0;
    }

    spdlog::debug("ndeploy {}.{}.{} started with {} arguments", ndeploy::MAJOR_VERSION, ndeploy::MINOR_VERSION, ndeploy::PATCH_VERSION, argc);

    const auto invocation_res = ndeploy::orchestrator::parseInvocation(arg_parser.getPositionalArgs());
    if(!invocation_res)
    {
        _reportError(invocation_res.error());
        return 1;
    }
    const auto & [operation, account_id] = *invocation_res;

    const auto single_value = [&arg_parser](const std::string & name) -> std::optional<std::string>
    {
        return arg_parser.getArg<std::vector<std::string>>(name)
            .transform([](const std::vector<std::string> & v) { return v.back(); });
    };

    ndeploy::config::Settings command_line;
    command_line.wallet_identity = single_value("--wallet");
    command_line.network = single_value("--network");
    command_line.gas_budget = single_value("--gas");
    command_line.deposit_amount = single_value("--deposit");
    command_line.wallet_ui_endpoint = single_value("--wallet-url");

    const auto env_lookup = ndeploy::config::processEnvironment();
    const std::optional<std::filesystem::path> explicit_override = single_value("--config");

    const ndeploy::orchestrator::ConfigSources sources{
        .command_line = std::move(command_line),
        .lookup = env_lookup,
        .override_path = ndeploy::config::overrideFilePath(explicit_override, env_lookup)
    };

    std::unique_ptr<ndeploy::runner::ICommandRunner> runner;
    if(arg_parser.getArg<bool>("--dry-run").value_or(false))
    {
        runner = std::make_unique<ndeploy::runner::DryRunRunner>();
    }
    else
    {
        runner = std::make_unique<ndeploy::runner::NativeRunner>();
    }

    const auto result = ndeploy::orchestrator::resolveAndRun(sources, *runner, operation, account_id);
    if(!result)
    {
        _reportError(result.error());
        return 1;
    }

    spdlog::debug("Program finished");
    return 0;
}
