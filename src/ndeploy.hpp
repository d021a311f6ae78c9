#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

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

namespace ndeploy
{
    static constexpr int MAJOR_VERSION = 0;
    static constexpr int MINOR_VERSION = 1;
    static constexpr int PATCH_VERSION = 0;
}
