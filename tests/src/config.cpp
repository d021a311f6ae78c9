#include "unit-tests.hpp"

#include <filesystem>
#include <fstream>

#ifndef NDEPLOY_TEST_BINARY_DIR
    #error "NDEPLOY_TEST_BINARY_DIR is not defined"
#endif

using namespace ndeploy;
using namespace ndeploy::tests;

namespace
{
    const std::map<std::string, std::string> REQUIRED_ENV{
        {config::env::WALLET, "alice.testnet"},
        {config::env::WALLET_SEED, "seed words"}
    };

    std::filesystem::path writeConfigFile(const std::string & name, const std::string & content)
    {
        const auto dir = std::filesystem::path(NDEPLOY_TEST_BINARY_DIR) / "config-tests";
        std::filesystem::create_directories(dir);
        const auto path = dir / name;
        std::ofstream out(path, std::ios::trunc);
        out << content;
        return path;
    }

    std::filesystem::path missingFile()
    {
        return std::filesystem::path(NDEPLOY_TEST_BINARY_DIR) / "config-tests" / "does-not-exist.json";
    }
}

TEST_F(UnitTest, Config_Resolve_AppliesDefaultsForUnsetOptionalValues)
{
    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), missingFile(), missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "alice.testnet");
    EXPECT_EQ(cfg->seed_credential, "seed words");
    EXPECT_EQ(cfg->network, "testnet");
    EXPECT_EQ(cfg->gas_budget, "100.0 Tgas");
    EXPECT_EQ(cfg->deposit_amount, "1 NEAR");
    EXPECT_EQ(cfg->wallet_ui_endpoint, config::DEFAULT_WALLET_UI_ENDPOINT);
    EXPECT_EQ(cfg->deploy_tool, "cargo");
    EXPECT_EQ(cfg->chain_cli, "near");
}

TEST_F(UnitTest, Config_Resolve_EnvironmentOverridesDefaults)
{
    auto env = REQUIRED_ENV;
    env[config::env::NETWORK] = "mainnet";
    env[config::env::GAS] = "300.0 Tgas";
    env[config::env::DEPOSIT] = "0 NEAR";
    env[config::env::WALLET_URL] = "https://app.mynearwallet.com";

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(env), missingFile(), missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->network, "mainnet");
    EXPECT_EQ(cfg->gas_budget, "300.0 Tgas");
    EXPECT_EQ(cfg->deposit_amount, "0 NEAR");
    EXPECT_EQ(cfg->wallet_ui_endpoint, "https://app.mynearwallet.com");
}

TEST_F(UnitTest, Config_Resolve_EmptyValueFallsBackToDefault)
{
    auto env = REQUIRED_ENV;
    env[config::env::NETWORK] = "";
    env[config::env::GAS] = "";

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(env), missingFile(), missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->network, "testnet");
    EXPECT_EQ(cfg->gas_budget, "100.0 Tgas");
}

TEST_F(UnitTest, Config_Resolve_MissingWalletFails)
{
    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment({{config::env::WALLET_SEED, "seed words"}}), missingFile(), missingFile());

    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().kind, Error::Kind::MISSING_REQUIRED_CONFIG);
    EXPECT_NE(cfg.error().message.find(config::env::WALLET), std::string::npos);
}

TEST_F(UnitTest, Config_Resolve_MissingSeedFails)
{
    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment({{config::env::WALLET, "alice.testnet"}}), missingFile(), missingFile());

    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().kind, Error::Kind::MISSING_REQUIRED_CONFIG);
    EXPECT_NE(cfg.error().message.find(config::env::WALLET_SEED), std::string::npos);
}

TEST_F(UnitTest, Config_Resolve_MalformedWalletFails)
{
    const auto cfg = config::resolve(
        config::Settings{},
        fakeEnvironment({{config::env::WALLET, "Alice Wallet"}, {config::env::WALLET_SEED, "seed words"}}),
        missingFile(),
        missingFile());

    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().kind, Error::Kind::INVALID_ACCOUNT_REFERENCE);
}

TEST_F(UnitTest, Config_Resolve_CommandLineOverridesEnvironment)
{
    config::Settings command_line;
    command_line.wallet_identity = "bob.testnet";
    command_line.network = "mainnet";

    auto env = REQUIRED_ENV;
    env[config::env::NETWORK] = "localnet";

    const auto cfg = config::resolve(command_line, fakeEnvironment(env), missingFile(), missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "bob.testnet");
    EXPECT_EQ(cfg->network, "mainnet");
    EXPECT_EQ(cfg->seed_credential, "seed words");
}

TEST_F(UnitTest, Config_Resolve_OverrideFileSuppliesRequiredValues)
{
    const auto path = writeConfigFile("required.json", R"({"wallet": "carol.testnet", "seed": "file seed", "deposit": "2 NEAR"})");

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment({}), path, missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "carol.testnet");
    EXPECT_EQ(cfg->seed_credential, "file seed");
    EXPECT_EQ(cfg->deposit_amount, "2 NEAR");
    EXPECT_EQ(cfg->network, "testnet");
}

TEST_F(UnitTest, Config_Resolve_EnvironmentWinsOverOverrideFile)
{
    const auto path = writeConfigFile("shadowed.json", R"({"wallet": "carol.testnet", "network": "localnet", "gas": "50.0 Tgas"})");

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), path, missingFile());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "alice.testnet");
    EXPECT_EQ(cfg->network, "localnet");
    EXPECT_EQ(cfg->gas_budget, "50.0 Tgas");
}

TEST_F(UnitTest, Config_Resolve_MalformedOverrideFileFails)
{
    const auto broken = writeConfigFile("broken.json", "{\"wallet\": ");
    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), broken, missingFile());

    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().kind, Error::Kind::INVALID_CONFIG_FILE);

    const auto wrong_type = writeConfigFile("wrong-type.json", R"({"gas": 100})");
    const auto cfg_wrong_type = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), wrong_type, missingFile());

    ASSERT_FALSE(cfg_wrong_type.has_value());
    EXPECT_EQ(cfg_wrong_type.error().kind, Error::Kind::INVALID_CONFIG_FILE);

    const auto not_object = writeConfigFile("array.json", R"(["alice.testnet"])");
    const auto cfg_not_object = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), not_object, missingFile());

    ASSERT_FALSE(cfg_not_object.has_value());
    EXPECT_EQ(cfg_not_object.error().kind, Error::Kind::INVALID_CONFIG_FILE);
}

TEST_F(UnitTest, Config_ParseOverride_IgnoresUnknownKeys)
{
    const auto settings = config::parseOverride(R"({"network": "mainnet", "colour": "blue"})", "inline");

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->network, std::optional<std::string>("mainnet"));
    EXPECT_FALSE(settings->wallet_identity.has_value());
}

TEST_F(UnitTest, Config_Merge_ExplicitOverOverrideOverDefaults)
{
    config::Settings explicit_settings;
    explicit_settings.wallet_identity = "alice.testnet";
    explicit_settings.seed_credential = "seed";
    explicit_settings.gas_budget = "10.0 Tgas";

    config::Settings override_settings;
    override_settings.gas_budget = "20.0 Tgas";
    override_settings.deposit_amount = "3 NEAR";

    const auto cfg = config::merge(explicit_settings, override_settings, config::defaults());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->gas_budget, "10.0 Tgas");
    EXPECT_EQ(cfg->deposit_amount, "3 NEAR");
    EXPECT_EQ(cfg->network, "testnet");
}

TEST_F(UnitTest, Config_OverrideFilePath_Precedence)
{
    const auto env = fakeEnvironment({{config::env::CONFIG_PATH, "/etc/ndeploy.json"}});

    EXPECT_EQ(config::overrideFilePath(std::filesystem::path("local.json"), env), std::filesystem::path("local.json"));
    EXPECT_EQ(config::overrideFilePath(std::nullopt, env), std::filesystem::path("/etc/ndeploy.json"));
    EXPECT_EQ(config::overrideFilePath(std::nullopt, fakeEnvironment({})), std::filesystem::path(config::DEFAULT_OVERRIDE_FILE));
}

TEST_F(UnitTest, Config_DescribeConfig_MasksSeed)
{
    const auto cfg = sampleConfig();
    const std::string description = config::describeConfig(cfg);

    EXPECT_EQ(description.find(cfg.seed_credential), std::string::npos);
    EXPECT_NE(description.find("alice.testnet"), std::string::npos);
    EXPECT_NE(description.find(utils::REDACTED), std::string::npos);
}

TEST_F(UnitTest, Config_Resolve_DotenvSuppliesRequiredValues)
{
    const auto dotenv = writeConfigFile("required.env",
        "# deployment account\n"
        "NEAR_WALLET=dave.testnet\n"
        "export NEAR_WALLET_SEED=\"dotenv seed words\"\n"
        "\n"
        "NEAR_GAS='200.0 Tgas'\n");

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment({}), missingFile(), dotenv);

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "dave.testnet");
    EXPECT_EQ(cfg->seed_credential, "dotenv seed words");
    EXPECT_EQ(cfg->gas_budget, "200.0 Tgas");
    EXPECT_EQ(cfg->network, "testnet");
}

TEST_F(UnitTest, Config_Resolve_DotenvBetweenEnvironmentAndOverrideFile)
{
    const auto dotenv = writeConfigFile("layered.env", "NEAR_WALLET=dave.testnet\nNEAR_NETWORK=localnet\nNEAR_DEPOSIT=5 NEAR\n");
    const auto override_file = writeConfigFile("layered.json", R"({"network": "mainnet", "deposit": "7 NEAR", "gas": "30.0 Tgas"})");

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), override_file, dotenv);

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->wallet_identity, "alice.testnet");
    EXPECT_EQ(cfg->network, "localnet");
    EXPECT_EQ(cfg->deposit_amount, "5 NEAR");
    EXPECT_EQ(cfg->gas_budget, "30.0 Tgas");
}

TEST_F(UnitTest, Config_Resolve_MalformedDotenvFails)
{
    const auto dotenv = writeConfigFile("broken.env", "NEAR_WALLET=alice.testnet\nthis line has no separator\n");

    const auto cfg = config::resolve(config::Settings{}, fakeEnvironment(REQUIRED_ENV), missingFile(), dotenv);

    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().kind, Error::Kind::INVALID_CONFIG_FILE);
    EXPECT_NE(cfg.error().message.find(":2"), std::string::npos);
}

TEST_F(UnitTest, Config_ParseDotenv_SkipsUnrelatedKeys)
{
    const auto settings = config::parseDotenv("PATH=/usr/bin\r\n  NEAR_CLI = /opt/near/bin/near \nNEAR_WALLET=\n", "inline");

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->chain_cli, std::optional<std::string>("/opt/near/bin/near"));
    EXPECT_EQ(settings->wallet_identity, std::optional<std::string>(""));
    EXPECT_FALSE(settings->network.has_value());
}
