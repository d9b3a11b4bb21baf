#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpify {

/**
 * @brief Raised when a child process cannot be started (exec or chdir failure)
 */
class ProcessLaunchError : public std::runtime_error {
public:
    explicit ProcessLaunchError(const std::string& message)
        : std::runtime_error(message) {}
};

struct ProcessRequest {
    std::vector<std::string> argv;  // argv[0] is looked up in PATH
    std::string working_dir;        // empty: inherit
    std::string input;              // written to stdin, then stdin is closed
    std::chrono::milliseconds timeout{30000};
    std::shared_ptr<std::atomic_bool> cancel;
};

struct ProcessResult {
    int exit_code = -1;  // 128 + signal when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

/**
 * @brief Runs a child process with captured output and a hard deadline
 *
 * The child runs in its own process group; on timeout or cancellation the
 * whole group receives SIGKILL, so no descendant outlives the call.
 */
class ProcessRunner {
public:
    /**
     * @throws ProcessLaunchError if the program cannot be executed
     * @throws std::runtime_error if pipes or fork fail
     */
    static ProcessResult run(const ProcessRequest& request);
};

} // namespace mcpify
