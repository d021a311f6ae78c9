#include "config.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "account.hpp"
#include "file.hpp"
#include "utils.hpp"

namespace ndeploy::config
{
    using json = nlohmann::json;

    namespace
    {
        using SettingsField = std::optional<std::string> Settings::*;

        struct FieldBinding
        {
            const char * key;
            const char * env_name;
            SettingsField field;
        };

        constexpr std::array<FieldBinding, 8> FIELDS{{
            {"wallet",      env::WALLET,        &Settings::wallet_identity},
            {"seed",        env::WALLET_SEED,   &Settings::seed_credential},
            {"network",     env::NETWORK,       &Settings::network},
            {"gas",         env::GAS,           &Settings::gas_budget},
            {"deposit",     env::DEPOSIT,       &Settings::deposit_amount},
            {"wallet_url",  env::WALLET_URL,    &Settings::wallet_ui_endpoint},
            {"deploy_tool", env::DEPLOY_TOOL,   &Settings::deploy_tool},
            {"chain_cli",   env::CHAIN_CLI,     &Settings::chain_cli}
        }};

        bool _isSet(const std::optional<std::string> & value)
        {
            return value.has_value() && !value->empty();
        }

        std::optional<std::string> _pick(const std::optional<std::string> & top, const std::optional<std::string> & bottom)
        {
            if(_isSet(top))
            {
                return top;
            }
            if(_isSet(bottom))
            {
                return bottom;
            }
            return std::nullopt;
        }

        Result<std::string> _required(const std::optional<std::string> & value, const char * env_name, const char * key)
        {
            if(!_isSet(value))
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::MISSING_REQUIRED_CONFIG,
                    .message = fmt::format("{} is not set (environment variable or .env entry {}, or '{}' in the override file)", key, env_name, key)
                });
            }
            return *value;
        }

        std::string _optional(const std::optional<std::string> & value, const char * fallback)
        {
            return _isSet(value) ? *value : std::string(fallback);
        }

        std::string_view _trim(std::string_view text)
        {
            constexpr std::string_view WHITESPACE = " \t\r";
            const auto first = text.find_first_not_of(WHITESPACE);
            if(first == std::string_view::npos)
            {
                return {};
            }
            const auto last = text.find_last_not_of(WHITESPACE);
            return text.substr(first, last - first + 1);
        }

        std::string_view _unquote(std::string_view value)
        {
            if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }
    }

    EnvLookup processEnvironment()
    {
        return [](const char * name) -> std::optional<std::string>
        {
            const char * value = std::getenv(name);
            if(value == nullptr)
            {
                return std::nullopt;
            }
            return std::string(value);
        };
    }

    Settings defaults()
    {
        Settings out;
        out.network = DEFAULT_NETWORK;
        out.gas_budget = DEFAULT_GAS_BUDGET;
        out.deposit_amount = DEFAULT_DEPOSIT_AMOUNT;
        out.wallet_ui_endpoint = DEFAULT_WALLET_UI_ENDPOINT;
        out.deploy_tool = DEFAULT_DEPLOY_TOOL;
        out.chain_cli = DEFAULT_CHAIN_CLI;
        return out;
    }

    Settings readEnvironment(const EnvLookup & lookup)
    {
        Settings out;
        for(const FieldBinding & binding : FIELDS)
        {
            out.*(binding.field) = lookup(binding.env_name);
        }
        return out;
    }

    Result<Settings> parseOverride(const std::string & content, const std::string & source_name)
    {
        const json document = json::parse(content, nullptr, false);
        if(document.is_discarded())
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_CONFIG_FILE,
                .message = fmt::format("{} is not valid JSON", source_name)
            });
        }

        if(!document.is_object())
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_CONFIG_FILE,
                .message = fmt::format("{} must contain a JSON object", source_name)
            });
        }

        Settings out;
        for(const auto & item : document.items())
        {
            const std::string & key = item.key();
            const json & value = item.value();

            const auto binding = std::ranges::find_if(FIELDS, [&key](const FieldBinding & b) { return key == b.key; });
            if(binding == FIELDS.end())
            {
                spdlog::warn("Ignoring unknown key '{}' in {}", key, source_name);
                continue;
            }

            if(!value.is_string())
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::INVALID_CONFIG_FILE,
                    .message = fmt::format("'{}' in {} must be a string", key, source_name)
                });
            }

            out.*(binding->field) = value.get<std::string>();
        }
        return out;
    }

    Result<Settings> loadOverrideFile(const std::filesystem::path & path)
    {
        std::error_code ec;
        if(!std::filesystem::exists(path, ec))
        {
            spdlog::debug("No override file at {}", path.string());
            return Settings{};
        }

        const auto content = file::loadTextFile(path);
        if(!content)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_CONFIG_FILE,
                .message = fmt::format("Cannot read {}", path.string())
            });
        }

        spdlog::debug("Loaded override file {}", path.string());
        return parseOverride(*content, path.string());
    }

    Result<Settings> parseDotenv(const std::string & content, const std::string & source_name)
    {
        constexpr std::string_view EXPORT_PREFIX = "export ";

        Settings out;
        std::size_t line_no = 0;
        std::size_t pos = 0;
        while(pos <= content.size())
        {
            const auto end = std::min(content.find('\n', pos), content.size());
            std::string_view line = _trim(std::string_view(content).substr(pos, end - pos));
            pos = end + 1;
            ++line_no;

            if(line.empty() || line.front() == '#')
            {
                continue;
            }

            if(line.starts_with(EXPORT_PREFIX))
            {
                line = _trim(line.substr(EXPORT_PREFIX.size()));
            }

            const auto eq = line.find('=');
            if(eq == std::string_view::npos)
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::INVALID_CONFIG_FILE,
                    .message = fmt::format("{}:{} is not a KEY=VALUE line", source_name, line_no)
                });
            }

            const std::string_view key = _trim(line.substr(0, eq));
            const std::string_view value = _unquote(_trim(line.substr(eq + 1)));

            const auto binding = std::ranges::find_if(FIELDS, [key](const FieldBinding & b) { return key == b.env_name; });
            if(binding == FIELDS.end())
            {
                continue;
            }

            out.*(binding->field) = std::string(value);
        }
        return out;
    }

    Result<Settings> loadDotenv(const std::filesystem::path & path)
    {
        std::error_code ec;
        if(!std::filesystem::exists(path, ec))
        {
            spdlog::debug("No dotenv file at {}", path.string());
            return Settings{};
        }

        const auto content = file::loadTextFile(path);
        if(!content)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_CONFIG_FILE,
                .message = fmt::format("Cannot read {}", path.string())
            });
        }

        spdlog::debug("Loaded dotenv file {}", path.string());
        return parseDotenv(*content, path.string());
    }

    Settings overlay(const Settings & top, const Settings & bottom)
    {
        Settings out;
        for(const FieldBinding & binding : FIELDS)
        {
            out.*(binding.field) = _pick(top.*(binding.field), bottom.*(binding.field));
        }
        return out;
    }

    Result<ResolvedConfig> merge(const Settings & explicit_settings, const Settings & override_settings, const Settings & default_settings)
    {
        const Settings layered = overlay(overlay(explicit_settings, override_settings), default_settings);

        auto wallet_res = _required(layered.wallet_identity, env::WALLET, "wallet");
        if(!wallet_res)
        {
            return std::unexpected(std::move(wallet_res.error()));
        }

        auto seed_res = _required(layered.seed_credential, env::WALLET_SEED, "seed");
        if(!seed_res)
        {
            return std::unexpected(std::move(seed_res.error()));
        }

        if(!account::isValidAccountId(*wallet_res))
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ACCOUNT_REFERENCE,
                .message = fmt::format("Wallet identity '{}' is not a valid account id", *wallet_res),
                .account = *wallet_res
            });
        }

        ResolvedConfig cfg;
        cfg.wallet_identity = std::move(*wallet_res);
        cfg.seed_credential = std::move(*seed_res);
        cfg.network = _optional(layered.network, DEFAULT_NETWORK);
        cfg.gas_budget = _optional(layered.gas_budget, DEFAULT_GAS_BUDGET);
        cfg.deposit_amount = _optional(layered.deposit_amount, DEFAULT_DEPOSIT_AMOUNT);
        cfg.wallet_ui_endpoint = _optional(layered.wallet_ui_endpoint, DEFAULT_WALLET_UI_ENDPOINT);
        cfg.deploy_tool = _optional(layered.deploy_tool, DEFAULT_DEPLOY_TOOL);
        cfg.chain_cli = _optional(layered.chain_cli, DEFAULT_CHAIN_CLI);
        return cfg;
    }

    std::filesystem::path overrideFilePath(const std::optional<std::filesystem::path> & explicit_path, const EnvLookup & lookup)
    {
        if(explicit_path && !explicit_path->empty())
        {
            return *explicit_path;
        }

        if(const auto from_env = lookup(env::CONFIG_PATH); _isSet(from_env))
        {
            return std::filesystem::path(*from_env);
        }

        return std::filesystem::path(DEFAULT_OVERRIDE_FILE);
    }

    Result<ResolvedConfig> resolve(
        const Settings & command_line,
        const EnvLookup & lookup,
        const std::filesystem::path & override_path,
        const std::filesystem::path & dotenv_path)
    {
        const auto dotenv_res = loadDotenv(dotenv_path);
        if(!dotenv_res)
        {
            return std::unexpected(dotenv_res.error());
        }

        const Settings explicit_settings = overlay(overlay(command_line, readEnvironment(lookup)), *dotenv_res);

        const auto override_res = loadOverrideFile(override_path);
        if(!override_res)
        {
            return std::unexpected(override_res.error());
        }

        return merge(explicit_settings, *override_res, defaults());
    }

    std::string describeConfig(const ResolvedConfig & cfg)
    {
        return fmt::format(
            "wallet={} seed={} network={} gas={} deposit={} wallet_url={} deploy_tool={} chain_cli={}",
            cfg.wallet_identity,
            cfg.seed_credential.empty() ? "<unset>" : utils::REDACTED,
            cfg.network,
            cfg.gas_budget,
            cfg.deposit_amount,
            cfg.wallet_ui_endpoint,
            cfg.deploy_tool,
            cfg.chain_cli);
    }
}
