#include "native.h"

#include <cerrno>
#include <cstring>
#include <array>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace ndeploy::native
{
    namespace
    {
        constexpr int EXEC_FAILED_CODE = 127;
        constexpr int SIGNAL_EXIT_BASE = 128;

        std::vector<char*> _makeArgv(std::string & command, std::vector<std::string> & args)
        {
            std::vector<char*> argv;
            argv.reserve(args.size() + 2);
            argv.push_back(command.data());
            for(std::string & arg : args)
            {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
            return argv;
        }

        int _waitForChild(pid_t pid)
        {
            int status = 0;
            while(waitpid(pid, &status, 0) < 0)
            {
                if(errno != EINTR)
                {
                    spdlog::error("waitpid failed: {}", std::strerror(errno));
                    return -1;
                }
            }

            if(WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }

            if(WIFSIGNALED(status))
            {
                spdlog::warn("Child process terminated by signal {}", WTERMSIG(status));
                return SIGNAL_EXIT_BASE + WTERMSIG(status);
            }
            return -1;
        }
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        std::string program = command;
        std::vector<char*> argv = _makeArgv(program, args);

        int out_pipe[2];
        if(pipe(out_pipe) != 0)
        {
            return {-1, std::string("pipe failed: ") + std::strerror(errno)};
        }

        // reports exec failure from the child, closed on successful exec
        int exec_pipe[2];
        if(pipe(exec_pipe) != 0)
        {
            const std::string reason = std::string("pipe failed: ") + std::strerror(errno);
            close(out_pipe[0]);
            close(out_pipe[1]);
            return {-1, reason};
        }
        fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

        const pid_t pid = fork();
        if(pid < 0)
        {
            const std::string reason = std::string("fork failed: ") + std::strerror(errno);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(exec_pipe[0]);
            close(exec_pipe[1]);
            return {-1, reason};
        }

        if(pid == 0)
        {
            close(out_pipe[0]);
            close(exec_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
            close(out_pipe[1]);

            execvp(argv[0], argv.data());

            const int exec_errno = errno;
            [[maybe_unused]] const auto written = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
            _exit(EXEC_FAILED_CODE);
        }

        close(out_pipe[1]);
        close(exec_pipe[1]);

        std::string output;
        std::array<char, 4096> buffer{};
        while(true)
        {
            const ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
            if(n > 0)
            {
                output.append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }
            if(n < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        close(out_pipe[0]);

        int exec_errno = 0;
        const ssize_t exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        close(exec_pipe[0]);

        const int exit_code = _waitForChild(pid);

        if(exec_read == static_cast<ssize_t>(sizeof(exec_errno)))
        {
            return {-1, std::string("failed to start '") + command + "': " + std::strerror(exec_errno)};
        }

        return {exit_code, output};
    }

    int runAttachedProcess(const std::string & command, std::vector<std::string> args)
    {
        std::string program = command;
        std::vector<char*> argv = _makeArgv(program, args);

        int exec_pipe[2];
        if(pipe(exec_pipe) != 0)
        {
            spdlog::error("pipe failed: {}", std::strerror(errno));
            return -1;
        }
        fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

        const pid_t pid = fork();
        if(pid < 0)
        {
            spdlog::error("fork failed: {}", std::strerror(errno));
            close(exec_pipe[0]);
            close(exec_pipe[1]);
            return -1;
        }

        if(pid == 0)
        {
            close(exec_pipe[0]);
            execvp(argv[0], argv.data());

            const int exec_errno = errno;
            [[maybe_unused]] const auto written = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
            _exit(EXEC_FAILED_CODE);
        }

        close(exec_pipe[1]);

        int exec_errno = 0;
        const ssize_t exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        close(exec_pipe[0]);

        const int exit_code = _waitForChild(pid);

        if(exec_read == static_cast<ssize_t>(sizeof(exec_errno)))
        {
            spdlog::error("Failed to start '{}': {}", command, std::strerror(exec_errno));
            return -1;
        }

        return exit_code;
    }
}
