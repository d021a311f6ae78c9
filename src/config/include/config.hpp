#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "error.hpp"

namespace ndeploy::config
{
    inline constexpr const char * DEFAULT_NETWORK = "testnet";
    inline constexpr const char * DEFAULT_GAS_BUDGET = "100.0 Tgas";
    inline constexpr const char * DEFAULT_DEPOSIT_AMOUNT = "1 NEAR";
    inline constexpr const char * DEFAULT_WALLET_UI_ENDPOINT = "https://testnet.mynearwallet.com";
    inline constexpr const char * DEFAULT_DEPLOY_TOOL = "cargo";
    inline constexpr const char * DEFAULT_CHAIN_CLI = "near";

    inline constexpr const char * DEFAULT_OVERRIDE_FILE = ".near-deploy.json";
    inline constexpr const char * DEFAULT_DOTENV_FILE = ".env";

    namespace env
    {
        inline constexpr const char * WALLET = "NEAR_WALLET";
        inline constexpr const char * WALLET_SEED = "NEAR_WALLET_SEED";
        inline constexpr const char * NETWORK = "NEAR_NETWORK";
        inline constexpr const char * GAS = "NEAR_GAS";
        inline constexpr const char * DEPOSIT = "NEAR_DEPOSIT";
        inline constexpr const char * WALLET_URL = "NEAR_WALLET_URL";
        inline constexpr const char * DEPLOY_TOOL = "NEAR_DEPLOY_TOOL";
        inline constexpr const char * CHAIN_CLI = "NEAR_CLI";
        inline constexpr const char * CONFIG_PATH = "NEAR_DEPLOY_CONFIG";
    }

    /**
     * @brief One layer of configuration. Every value is optional.
     * 
     * An empty string counts as unset when layers are merged.
     */
    struct Settings
    {
        std::optional<std::string> wallet_identity;
        std::optional<std::string> seed_credential;
        std::optional<std::string> network;
        std::optional<std::string> gas_budget;
        std::optional<std::string> deposit_amount;
        std::optional<std::string> wallet_ui_endpoint;
        std::optional<std::string> deploy_tool;
        std::optional<std::string> chain_cli;
    };

    /**
     * @brief Configuration of a single run. Read-only once resolved.
     */
    struct ResolvedConfig
    {
        std::string wallet_identity;
        std::string seed_credential;
        std::string network;
        std::string gas_budget;
        std::string deposit_amount;
        std::string wallet_ui_endpoint;
        std::string deploy_tool;
        std::string chain_cli;
    };

    using EnvLookup = std::function<std::optional<std::string>(const char *)>;

    /**
     * @brief Lookup backed by the process environment.
     */
    EnvLookup processEnvironment();

    /**
     * @brief The documented defaults. Required settings have none.
     */
    Settings defaults();

    Settings readEnvironment(const EnvLookup & lookup);

    /**
     * @brief Reads the local override file.
     * 
     * A missing file yields an empty layer. A file that is not a JSON object of strings
     * yields INVALID_CONFIG_FILE.
     */
    Result<Settings> loadOverrideFile(const std::filesystem::path & path);

    Result<Settings> parseOverride(const std::string & content, const std::string & source_name);

    /**
     * @brief Reads `KEY=VALUE` lines from a dotenv file in the working directory.
     * 
     * Only the NEAR_* names of readEnvironment are picked up, other keys are skipped.
     * Blank lines, `#` comments and an `export ` prefix are accepted, values may be quoted.
     * A missing file yields an empty layer. A line without '=' yields INVALID_CONFIG_FILE.
     */
    Result<Settings> loadDotenv(const std::filesystem::path & path);

    Result<Settings> parseDotenv(const std::string & content, const std::string & source_name);

    /**
     * @brief Combines two layers, values of `top` win when set and non-empty.
     */
    Settings overlay(const Settings & top, const Settings & bottom);

    /**
     * @brief Resolves the final configuration.
     * 
     * Precedence is explicit, then override, then defaults.
     * Fails with MISSING_REQUIRED_CONFIG when the wallet identity or the seed credential is absent
     * from every layer, and with INVALID_ACCOUNT_REFERENCE when the wallet identity is malformed.
     */
    Result<ResolvedConfig> merge(const Settings & explicit_settings, const Settings & override_settings, const Settings & default_settings);

    /**
     * @brief Picks the override file: explicit path, then NEAR_DEPLOY_CONFIG, then the default file name.
     */
    std::filesystem::path overrideFilePath(const std::optional<std::filesystem::path> & explicit_path, const EnvLookup & lookup);

    /**
     * @brief Full resolution: command line over environment over dotenv file over override file over defaults.
     */
    Result<ResolvedConfig> resolve(
        const Settings & command_line,
        const EnvLookup & lookup,
        const std::filesystem::path & override_path,
        const std::filesystem::path & dotenv_path = DEFAULT_DOTENV_FILE);

    /**
     * @brief Human readable dump of the configuration with the seed credential masked.
     */
    std::string describeConfig(const ResolvedConfig & cfg);
}
