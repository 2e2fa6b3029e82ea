/**
 * @file docker_runtime.hpp
 * @brief ContainerRuntime implementation over the docker CLI
 *
 * Every operation is one `docker` invocation spawned through
 * utils::ProcessRunner. Sandboxes are long-lived containers running an idle
 * process; commands are `docker exec` calls wrapped in coreutils `timeout`
 * so the in-sandbox process tree dies at the time bound even if the docker
 * client is killed first.
 *
 * @date 2025
 */

#pragma once

#include "repobox/runtime/container_runtime.hpp"
#include "repobox/core/service_config.hpp"
#include "repobox/utils/process_runner.hpp"

#include <string>
#include <vector>
#include <chrono>

namespace repobox {
namespace runtime {

/**
 * @class DockerRuntime
 * @brief Docker engine adapter
 *
 * **Container hardening applied by Start()**:
 * - Memory (swap disabled), CPU and PID limits
 * - Capabilities dropped (ALL by default) with a small add-back list
 * - `no-new-privileges`
 * - `--init` so orphaned processes are reaped
 * - Label `repobox.managed=true` for reconciliation after a restart
 *
 * **Thread Safety**: Stateless apart from configuration; safe for concurrent use.
 */
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(const core::RuntimeSettings& settings);
    ~DockerRuntime() override = default;

    DockerRuntime(const DockerRuntime&) = delete;
    DockerRuntime& operator=(const DockerRuntime&) = delete;

    SandboxHandle Start(const SandboxSpec& spec) override;
    ExecOutcome ExecIn(const SandboxHandle& handle, const ExecSpec& spec) override;
    SandboxState Inspect(const SandboxHandle& handle) override;
    void Destroy(const SandboxHandle& handle) override;
    bool Ping() override;
    std::string Name() const override { return "docker"; }

    /**
     * @brief Arguments (after the docker binary) for `docker run`
     */
    std::vector<std::string> BuildRunArguments(const SandboxSpec& spec) const;

    /**
     * @brief Arguments (after the docker binary) for `docker exec`
     */
    std::vector<std::string> BuildExecArguments(const SandboxHandle& handle,
                                                const ExecSpec& spec) const;

    /**
     * @brief Map `docker inspect --format {{.State.Status}}` output to a state
     */
    static SandboxState ParseState(const std::string& status);

private:
    utils::ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                              std::chrono::milliseconds timeout,
                                              std::size_t max_output_bytes = 1024 * 1024) const;

    core::RuntimeSettings settings_;
};

} // namespace runtime
} // namespace repobox
