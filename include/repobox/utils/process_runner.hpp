/**
 * @file process_runner.hpp
 * @brief Spawn a host process with captured output and a wall-clock limit
 *
 * Used by the Docker runtime adapter to drive the `docker` CLI. The child is
 * started directly from an argv vector (no shell), in its own session, so a
 * timeout can take down the whole process group.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

namespace repobox {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Limits applied to a spawned process
 */
struct ProcessOptions {
    std::chrono::milliseconds timeout{0};             ///< Wall-clock limit (0 = unlimited)
    std::size_t max_output_bytes{16 * 1024 * 1024};   ///< Per-stream capture cap
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished (or killed) process
 */
struct ProcessResult {
    int exit_code{-1};                       ///< Exit status, or 128 + signal
    std::string stdout_output;               ///< Captured standard output
    std::string stderr_output;               ///< Captured standard error
    std::chrono::milliseconds duration{0};   ///< Wall-clock duration
    bool timed_out{false};                   ///< Killed because the limit expired
    bool output_truncated{false};            ///< A stream exceeded max_output_bytes
};

/**
 * @class ProcessRunner
 * @brief fork/exec wrapper with pipe capture and deadline enforcement
 *
 * **Thread Safety**: Run() is reentrant; concurrent calls spawn independent
 * children.
 */
class ProcessRunner {
public:
    /**
     * @brief Run @p argv to completion or until the timeout expires
     *
     * On timeout the child's process group receives SIGKILL and the result
     * is marked timed_out. Output beyond the cap is drained and discarded.
     *
     * @throws std::runtime_error if the process cannot be spawned
     *         (pipe/fork failure, or execvp failure reported by the child)
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions{});

private:
    ProcessRunner() = delete;
};

} // namespace utils
} // namespace repobox
