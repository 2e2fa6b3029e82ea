/**
 * @file container_runtime.hpp
 * @brief Narrow capability interface the lifecycle core uses to drive sandboxes
 *
 * The core never talks to a container engine directly. Everything it needs
 * is expressed through ContainerRuntime: start a sandbox, execute inside
 * it, inspect it and destroy it. DockerRuntime implements the interface
 * over the docker CLI; tests substitute an in-memory fake.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstddef>

namespace repobox {
namespace runtime {

/**
 * @struct SandboxHandle
 * @brief Opaque reference from a registry record to its runtime-side sandbox
 *
 * Only the owning record's lifecycle may pass a handle to Destroy().
 */
struct SandboxHandle {
    std::string runtime_id;   ///< Container name/id as known to the runtime

    bool operator==(const SandboxHandle& other) const { return runtime_id == other.runtime_id; }
    bool operator!=(const SandboxHandle& other) const { return !(*this == other); }
};

/**
 * @struct SandboxSpec
 * @brief Everything the runtime needs to start one sandbox
 */
struct SandboxSpec {
    std::string name;                                  ///< Unique sandbox name
    std::string image;                                 ///< Base image
    std::string working_directory{"/workspace"};       ///< Initial working dir (created if missing)
    std::map<std::string, std::string> environment;    ///< Injected environment
    std::map<std::string, std::string> labels;         ///< Runtime labels
};

/**
 * @struct ExecSpec
 * @brief A single command to run inside a sandbox
 */
struct ExecSpec {
    std::vector<std::string> argv;                  ///< Program and arguments (no shell)
    std::string working_directory;                  ///< Empty = sandbox default
    std::chrono::milliseconds timeout{30000};       ///< Hard time bound
    std::size_t max_output_bytes{16 * 1024 * 1024}; ///< Per-stream capture cap
};

/**
 * @struct ExecOutcome
 * @brief Raw result of ExecIn()
 */
struct ExecOutcome {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds elapsed{0};
    bool timed_out{false};          ///< Killed at the time bound
    bool output_truncated{false};
};

/**
 * @enum SandboxState
 * @brief Runtime-side state reported by Inspect()
 */
enum class SandboxState {
    RUNNING,   ///< Alive and accepting exec
    STOPPED,   ///< Exists but not running (created, exited, dead, paused)
    MISSING    ///< Runtime does not know the sandbox
};

/**
 * @class ContainerRuntime
 * @brief Abstract sandbox capability
 *
 * Implementations report infrastructure problems (engine unreachable,
 * resource exhaustion) by throwing core::InfrastructureError. A command that
 * runs and fails is not an infrastructure problem: it is returned in
 * ExecOutcome.
 *
 * **Thread Safety**: Implementations must accept concurrent calls for
 * different sandboxes.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Create and start a sandbox that stays alive until destroyed
     * @throws core::InfrastructureError on failure
     */
    virtual SandboxHandle Start(const SandboxSpec& spec) = 0;

    /**
     * @brief Run a command inside a sandbox, enforcing spec.timeout
     * @throws core::InfrastructureError if the runtime cannot dispatch the command
     */
    virtual ExecOutcome ExecIn(const SandboxHandle& handle, const ExecSpec& spec) = 0;

    virtual SandboxState Inspect(const SandboxHandle& handle) = 0;

    /**
     * @brief Destroy a sandbox and release its resources
     *
     * Destroying a sandbox the runtime no longer knows is a success.
     *
     * @throws core::InfrastructureError if destruction fails
     */
    virtual void Destroy(const SandboxHandle& handle) = 0;

    /**
     * @brief Check that the runtime is reachable
     */
    virtual bool Ping() = 0;

    virtual std::string Name() const = 0;
};

} // namespace runtime
} // namespace repobox
