#pragma once

#include <string>
#include <filesystem>
#include <fstream>

namespace ndeploy::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path);

    /**
     * @brief Local time formatted for use in file names (YYYY-MM-DD-HH_MM_SS).
     */
    std::string currentTimestamp();

    bool equalsIgnoreCase(const std::string& a, const std::string& b);

    /**
     * @brief Replaces every occurrence of `secret` in `text` with a fixed mask.
     *
     * An empty secret leaves the text unchanged.
     */
    std::string redact(std::string text, const std::string & secret);

    /**
     * @brief Quotes a single argument so the rendered command can be pasted into a POSIX shell.
     */
    std::string shellQuote(const std::string & arg);

    inline constexpr const char * REDACTED = "***";
}
