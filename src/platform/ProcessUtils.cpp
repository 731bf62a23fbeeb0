#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace utils
{

namespace
{

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

CaptureResult ProcessUtils::RunAndCapture(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                          std::chrono::milliseconds timeout)
{
    CaptureResult result;

    std::error_code ec;
    if (exePath.empty() || !std::filesystem::exists(exePath, ec))
    {
        result.error = "invalid executable path: " + exePath.string();
        PLOG_ERROR << result.error;
        return result;
    }

    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        PLOG_ERROR << result.error;
        return result;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        result.error = std::string("fork() failed: ") + strerror(errno);
        PLOG_ERROR << result.error;
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0)
    {
        // Child: stdout -> pipe, stderr -> /dev/null
        close(pipefd[0]);
        if (dup2(pipefd[1], STDOUT_FILENO) == -1)
            _exit(127);
        close(pipefd[1]);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0)
        {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(exePath.c_str()));
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execv(exePath.c_str(), argv.data());
        _exit(127);
    }

    close(pipefd[1]);
    result.started = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[16384];
    bool eof = false;

    while (!eof)
    {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            result.timed_out = true;
            break;
        }

        pollfd pfd{ pipefd[0], POLLIN, 0 };
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            result.error = std::string("poll() failed: ") + strerror(errno);
            break;
        }
        if (rc == 0)
            continue;

        ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0)
        {
            result.output.append(buffer, static_cast<std::size_t>(n));
        }
        else if (n == 0)
        {
            eof = true;
        }
        else if (errno != EINTR)
        {
            result.error = std::string("read() failed: ") + strerror(errno);
            break;
        }
    }
    close(pipefd[0]);

    if (!eof)
    {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            PLOG_WARNING << "waitpid() failed: " << strerror(errno);
            return result;
        }
    }

    result.exit_code = decode_status(status);
    if (result.exit_code == 127 && result.output.empty() && result.error.empty())
        result.error = "exec failed for " + exePath.string();
    return result;
}

std::filesystem::path ProcessUtils::FindChromiumPath()
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (const char* env = std::getenv("PUPPETEER_EXECUTABLE_PATH"); env && *env)
    {
        return fs::path(env);
    }

    // Nix-based deployments
    if (fs::is_directory("/nix/store", ec))
    {
        for (const auto& entry : fs::directory_iterator("/nix/store", ec))
        {
            const auto name = entry.path().filename().string();
            if (name.find("chromium-") == std::string::npos || name.find("sandbox") != std::string::npos ||
                name.find("unwrapped") != std::string::npos || name.find("chromaprint") != std::string::npos)
                continue;

            auto bin = entry.path() / "bin" / "chromium";
            if (fs::exists(bin, ec))
                return bin;
        }
    }

    for (const char* candidate :
         { "/usr/bin/chromium", "/usr/bin/chromium-browser", "/usr/bin/google-chrome", "/usr/bin/google-chrome-stable" })
    {
        if (fs::exists(candidate, ec))
            return fs::path(candidate);
    }

    return {};
}

} // namespace utils
