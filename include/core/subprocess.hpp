#pragma once

#include "core/cancellation_token.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Outcome of a child process run
 */
struct SubprocessResult
{
    bool launched = false;     // execvp succeeded
    int exit_code = -1;        // Valid when exited_normally
    bool exited_normally = false;
    bool cancelled = false;    // Killed because the token fired
    bool timed_out = false;    // Killed because the deadline passed
    std::vector<uint8_t> stdout_data;
    std::string stderr_text;
    std::string error_message; // Launch failure reason

    bool succeeded() const { return launched && exited_normally && exit_code == 0 && !cancelled && !timed_out; }
};

/**
 * @brief Runs an external program without a shell
 *
 * stdout is captured as raw bytes and stderr as text. The child is killed
 * with SIGKILL as soon as the cancellation token fires or the timeout
 * elapses, and is always reaped before run() returns.
 */
class Subprocess
{
public:
    /**
     * @param argv Program followed by its arguments; argv[0] is looked up on PATH
     * @param cancel Optional token polled while the child runs
     * @param timeout_ms Kill the child after this many milliseconds; 0 disables
     */
    static SubprocessResult run(const std::vector<std::string> &argv,
                                const CancellationToken *cancel = nullptr,
                                int timeout_ms = 0);

    /**
     * @brief Check that a program can be executed by running "<program> -version"
     */
    static bool isAvailable(const std::string &program);

    /**
     * @brief Render argv for logging
     */
    static std::string formatCommand(const std::vector<std::string> &argv);
};
