#pragma once

#include <fstream>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace ndeploy::file
{
    std::optional<std::string> loadTextFile(const std::filesystem::path & path);
}
