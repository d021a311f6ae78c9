#pragma once

#if !defined(__unix__) && !defined(__APPLE__)
#   error "Error, unsupported platform"
#endif

#include <string>
#include <vector>
#include <utility>

namespace ndeploy::native
{
    /**
     * Spawns a new process and waits for it to finish.
     * The command is looked up in PATH when it contains no slash.
     * Standard output and standard error are captured together.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @return exit code and captured output. The exit code is -1 if the process could not be started,
     *         in which case the output holds the reason, and 128 + signal number if it was killed by a signal.
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});

    /**
     * Spawns a new process that shares the terminal of the caller and waits for it to finish.
     * Used for commands that need to interact with the operator.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @return exit code of the process, -1 if the process could not be started,
     *         128 + signal number if it was killed by a signal.
     */
    int runAttachedProcess(const std::string & command, std::vector<std::string> args = {});
}
