#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "error.hpp"
#include "utils.hpp"
#include "native.h"
#include "file.hpp"
#include "arg_parser.hpp"
#include "config.hpp"
#include "account.hpp"
#include "command.hpp"
#include "runner.hpp"
#include "orchestrator.hpp"
#include "operation.hpp"

namespace ndeploy::tests
{
    class UnitTest : public ::testing::Test
    {
        protected:
            void SetUp() override
            {
                spdlog::set_level(spdlog::level::off);
            }

            void TearDown() override
            {
                spdlog::set_level(spdlog::level::info);
            }
    };

    /**
     * @brief Routes the default logger into a string for the lifetime of the object.
     * 
     * Every line is written as "<level>: <message>".
     */
    class CapturedLog
    {
        public:
            CapturedLog()
            :   _previous(spdlog::default_logger())
            {
                auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(_stream);
                sink->set_pattern("%l: %v");
                auto logger = std::make_shared<spdlog::logger>("captured", std::move(sink));
                logger->set_level(spdlog::level::debug);
                spdlog::set_default_logger(std::move(logger));
            }

            ~CapturedLog()
            {
                spdlog::set_default_logger(_previous);
            }

            CapturedLog(const CapturedLog &) = delete;
            CapturedLog & operator=(const CapturedLog &) = delete;

            std::string text() const
            {
                return _stream.str();
            }

        private:
            std::shared_ptr<spdlog::logger> _previous;
            std::ostringstream _stream;
    };

    /**
     * @brief Records every command and answers with a scripted exit code.
     * 
     * Exit codes are keyed by (kind, account); anything unscripted succeeds.
     */
    class RecordingRunner final : public runner::ICommandRunner
    {
        public:
            runner::RunResult run(const command::Command & cmd) override
            {
                calls.push_back(cmd);

                const auto it = exit_codes.find({cmd.kind, cmd.account});
                return runner::RunResult{.exit_code = it == exit_codes.end() ? 0 : it->second};
            }

            void failOn(command::Kind kind, const std::string & account, int exit_code = 1)
            {
                exit_codes[{kind, account}] = exit_code;
            }

            std::size_t countFor(command::Kind kind, const std::string & account) const
            {
                std::size_t count = 0;
                for(const auto & cmd : calls)
                {
                    if(cmd.kind == kind && cmd.account == account)
                    {
                        ++count;
                    }
                }
                return count;
            }

            std::vector<command::Command> calls;
            std::map<std::pair<command::Kind, std::string>, int> exit_codes;
    };

    /**
     * @brief Environment lookup backed by a map instead of the process environment.
     */
    inline config::EnvLookup fakeEnvironment(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](const char * name) -> std::optional<std::string>
        {
            const auto it = values.find(name);
            if(it == values.end())
            {
                return std::nullopt;
            }
            return it->second;
        };
    }

    inline config::ResolvedConfig sampleConfig(const std::string & wallet = "alice.testnet")
    {
        config::Settings explicit_settings;
        explicit_settings.wallet_identity = wallet;
        explicit_settings.seed_credential = "word1 word2 word3 word4 word5 word6 word7 word8 word9 word10 word11 word12";
        auto cfg = config::merge(explicit_settings, config::Settings{}, config::defaults());
        EXPECT_TRUE(cfg.has_value());
        return cfg.value_or(config::ResolvedConfig{});
    }
}
