#include "core/subprocess.hpp"
#include "logging/logger.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

namespace
{
    constexpr int POLL_INTERVAL_MS = 50;

    void closeFd(int &fd)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }

    // Drain whatever is currently readable; returns false on EOF or error
    bool drainFd(int fd, std::vector<uint8_t> &sink)
    {
        uint8_t buffer[65536];
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0)
        {
            sink.insert(sink.end(), buffer, buffer + n);
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            return true;
        return false;
    }
}

SubprocessResult Subprocess::run(const std::vector<std::string> &argv, const CancellationToken *cancel, int timeout_ms)
{
    SubprocessResult result;
    if (argv.empty())
    {
        result.error_message = "Empty command";
        return result;
    }

    // Build argv before fork; the child may only make async-signal-safe calls
    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    c_argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0)
    {
        result.error_message = std::string("pipe() failed: ") + std::strerror(errno);
        for (int *fds : {out_pipe, err_pipe, exec_pipe})
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return result;
    }

    Logger::debug("Running: " + formatCommand(argv));

    pid_t pid = fork();
    if (pid < 0)
    {
        result.error_message = std::string("fork() failed: ") + std::strerror(errno);
        for (int *fds : {out_pipe, err_pipe, exec_pipe})
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return result;
    }

    if (pid == 0)
    {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);

        execvp(c_argv[0], c_argv.data());

        // Only reached if exec failed; report errno through the CLOEXEC pipe
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t exec_read;
    do
    {
        exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (exec_read == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        waitpid(pid, nullptr, 0);
        closeFd(out_pipe[0]);
        closeFd(err_pipe[0]);
        result.error_message = "Cannot execute " + argv[0] + ": " + std::strerror(exec_errno);
        Logger::debug(result.error_message);
        return result;
    }
    result.launched = true;

    auto started = std::chrono::steady_clock::now();
    std::vector<uint8_t> stderr_bytes;
    bool killed = false;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0)
    {
        if (!killed && isCancelled(cancel))
        {
            kill(pid, SIGKILL);
            killed = true;
            result.cancelled = true;
        }
        if (!killed && timeout_ms > 0)
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();
            if (elapsed >= timeout_ms)
            {
                kill(pid, SIGKILL);
                killed = true;
                result.timed_out = true;
            }
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_pipe[0] >= 0)
        {
            out_index = static_cast<int>(count);
            fds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_pipe[0] >= 0)
        {
            err_index = static_cast<int>(count);
            fds[count++] = {err_pipe[0], POLLIN, 0};
        }

        int ready = poll(fds, count, POLL_INTERVAL_MS);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            result.error_message = std::string("poll() failed: ") + std::strerror(errno);
            kill(pid, SIGKILL);
            killed = true;
            break;
        }

        if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR)))
        {
            if (!drainFd(out_pipe[0], result.stdout_data))
                closeFd(out_pipe[0]);
        }
        if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR)))
        {
            if (!drainFd(err_pipe[0], stderr_bytes))
                closeFd(err_pipe[0]);
        }
    }

    closeFd(out_pipe[0]);
    closeFd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }

    if (WIFEXITED(status))
    {
        result.exited_normally = true;
        result.exit_code = WEXITSTATUS(status);
    }
    result.stderr_text.assign(stderr_bytes.begin(), stderr_bytes.end());

    if (result.cancelled)
        Logger::debug("Killed cancelled child: " + argv[0]);
    else if (result.timed_out)
        Logger::warn("Killed child after " + std::to_string(timeout_ms) + " ms timeout: " + formatCommand(argv));

    return result;
}

bool Subprocess::isAvailable(const std::string &program)
{
    SubprocessResult result = run({program, "-version"}, nullptr, 10000);
    return result.succeeded();
}

std::string Subprocess::formatCommand(const std::vector<std::string> &argv)
{
    std::ostringstream ss;
    for (size_t i = 0; i < argv.size(); ++i)
    {
        if (i > 0)
            ss << ' ';
        if (argv[i].find(' ') != std::string::npos)
            ss << '"' << argv[i] << '"';
        else
            ss << argv[i];
    }
    return ss.str();
}
