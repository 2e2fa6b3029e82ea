/**
 * @file docker_runtime.cpp
 * @brief docker CLI adapter implementing the sandbox capability
 *
 * **Command mapping**:
 * ```
 * Start    docker run -d --name <id> [limits] [labels] [-e K=V] -w <wd> <image> tail -f /dev/null
 * ExecIn   docker exec -w <wd> <id> timeout -s KILL <secs> <argv...>
 * Inspect  docker inspect --format {{.State.Status}} <id>
 * Destroy  docker rm --force --volumes <id>
 * Ping     docker version --format {{.Server.Version}}
 * ```
 *
 * **Failure classification for exec**: exit code 125 or a daemon/OCI error
 * on stderr means the command never ran, which is an infrastructure error.
 * Any other exit code belongs to the command.
 *
 * @date 2025
 */

#include "repobox/runtime/docker_runtime.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace repobox {
namespace runtime {

using utils::StringUtils;

namespace {

// Slack when deciding whether SIGKILL came from the in-sandbox timeout.
constexpr std::chrono::milliseconds kTimeoutTolerance{50};

constexpr int kDockerDaemonError = 125;

bool IsNoSuchContainer(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container") ||
           StringUtils::Contains(stderr_output, "No such object");
}

bool IsDispatchFailure(const utils::ProcessResult& result) {
    if (result.exit_code == kDockerDaemonError) {
        return true;
    }
    return StringUtils::StartsWith(result.stderr_output, "Error response from daemon") ||
           StringUtils::StartsWith(result.stderr_output, "Error: No such container") ||
           StringUtils::Contains(result.stderr_output, "OCI runtime exec failed");
}

std::string FirstLine(const std::string& text) {
    auto trimmed = StringUtils::Trim(text);
    auto pos = trimmed.find('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(0, pos);
}

} // anonymous namespace

DockerRuntime::DockerRuntime(const core::RuntimeSettings& settings)
    : settings_(settings) {
    spdlog::debug("Docker runtime: binary={}, image={}, network={}",
                  settings_.docker_binary, settings_.image, settings_.network_mode);
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerRuntime::BuildRunArguments(const SandboxSpec& spec) const {
    std::vector<std::string> args = {"run", "-d", "--init"};

    args.push_back("--name");
    args.push_back(spec.name);

    // Resource limits (swap equal to memory disables swap)
    args.push_back("--memory");
    args.push_back(std::to_string(settings_.memory_limit_mb) + "m");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(settings_.memory_limit_mb) + "m");
    args.push_back("--cpus");
    args.push_back(fmt::format("{}", settings_.cpu_limit));
    args.push_back("--pids-limit");
    args.push_back(std::to_string(settings_.pids_limit));

    args.push_back("--network");
    args.push_back(settings_.network_mode);

    // Security
    for (const auto& cap : settings_.drop_capabilities) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : settings_.add_capabilities) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : spec.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    if (!spec.working_directory.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_directory);
    }

    args.push_back(spec.image.empty() ? settings_.image : spec.image);

    // Idle process keeping the sandbox alive until destroyed
    args.push_back("tail");
    args.push_back("-f");
    args.push_back("/dev/null");

    return args;
}

std::vector<std::string> DockerRuntime::BuildExecArguments(const SandboxHandle& handle,
                                                           const ExecSpec& spec) const {
    std::vector<std::string> args = {"exec"};

    if (!spec.working_directory.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_directory);
    }
    args.push_back(handle.runtime_id);

    args.push_back("timeout");
    args.push_back("-s");
    args.push_back("KILL");
    args.push_back(fmt::format("{:.3f}", spec.timeout.count() / 1000.0));

    args.insert(args.end(), spec.argv.begin(), spec.argv.end());
    return args;
}

SandboxState DockerRuntime::ParseState(const std::string& status) {
    auto state = StringUtils::ToLower(StringUtils::Trim(status));
    if (state == "running") {
        return SandboxState::RUNNING;
    }
    return SandboxState::STOPPED;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

SandboxHandle DockerRuntime::Start(const SandboxSpec& spec) {
    spdlog::info("Creating container: {} ({})", spec.name, spec.image.empty() ? settings_.image : spec.image);

    auto result = ExecuteDockerCommand(BuildRunArguments(spec), settings_.control_timeout);

    if (result.timed_out) {
        throw core::InfrastructureError("docker run timed out for " + spec.name);
    }
    if (result.exit_code != 0) {
        spdlog::error("Failed to create container: {}", FirstLine(result.stderr_output));
        throw core::InfrastructureError("Failed to start sandbox: " + FirstLine(result.stderr_output));
    }

    auto container_id = StringUtils::Trim(result.stdout_output);
    spdlog::debug("Container {} started with id {}", spec.name, container_id.substr(0, 12));

    return SandboxHandle{spec.name};
}

ExecOutcome DockerRuntime::ExecIn(const SandboxHandle& handle, const ExecSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("ExecIn requires a non-empty argv");
    }

    // The in-sandbox timeout fires first; the host deadline only catches a hung client.
    auto host_deadline = spec.timeout + std::chrono::duration_cast<std::chrono::milliseconds>(settings_.exec_grace);
    auto result = ExecuteDockerCommand(BuildExecArguments(handle, spec), host_deadline,
                                       spec.max_output_bytes);

    if (!result.timed_out && IsDispatchFailure(result)) {
        spdlog::error("docker exec failed in {}: {}", handle.runtime_id, FirstLine(result.stderr_output));
        throw core::InfrastructureError("Failed to execute in sandbox " + handle.runtime_id + ": " +
                                        FirstLine(result.stderr_output));
    }

    ExecOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.stdout_output = std::move(result.stdout_output);
    outcome.stderr_output = std::move(result.stderr_output);
    outcome.elapsed = result.duration;
    outcome.output_truncated = result.output_truncated;

    // timeout(1) with -s KILL makes the command exit with 128 + SIGKILL
    constexpr int kKilledExitCode = 128 + 9;
    outcome.timed_out = result.timed_out ||
        (result.exit_code == kKilledExitCode && result.duration + kTimeoutTolerance >= spec.timeout);

    return outcome;
}

SandboxState DockerRuntime::Inspect(const SandboxHandle& handle) {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{.State.Status}}", handle.runtime_id},
                                       settings_.control_timeout);

    if (result.exit_code == 0 && !result.timed_out) {
        return ParseState(result.stdout_output);
    }
    if (IsNoSuchContainer(result.stderr_output)) {
        return SandboxState::MISSING;
    }
    throw core::InfrastructureError("Failed to inspect sandbox " + handle.runtime_id + ": " +
                                    (result.timed_out ? std::string("timed out")
                                                      : FirstLine(result.stderr_output)));
}

void DockerRuntime::Destroy(const SandboxHandle& handle) {
    spdlog::info("Removing container: {}", handle.runtime_id);

    auto result = ExecuteDockerCommand({"rm", "--force", "--volumes", handle.runtime_id},
                                       settings_.control_timeout);

    if (result.exit_code == 0 && !result.timed_out) {
        return;
    }
    if (IsNoSuchContainer(result.stderr_output)) {
        spdlog::debug("Container {} already gone", handle.runtime_id);
        return;
    }

    spdlog::error("Failed to remove container: {}", FirstLine(result.stderr_output));
    throw core::InfrastructureError("Failed to destroy sandbox " + handle.runtime_id + ": " +
                                    (result.timed_out ? std::string("timed out")
                                                      : FirstLine(result.stderr_output)));
}

bool DockerRuntime::Ping() {
    try {
        auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                           settings_.control_timeout);
        if (result.exit_code == 0 && !result.timed_out) {
            spdlog::debug("Docker server version: {}", StringUtils::Trim(result.stdout_output));
            return true;
        }
        spdlog::debug("Docker not reachable: {}", FirstLine(result.stderr_output));
    } catch (const core::InfrastructureError& e) {
        spdlog::debug("Docker not reachable: {}", e.what());
    }
    return false;
}

// ============================================================================
// DOCKER COMMAND EXECUTION
// ============================================================================

utils::ProcessResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         std::chrono::milliseconds timeout,
                                                         std::size_t max_output_bytes) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(settings_.docker_binary);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Truncate(StringUtils::Join(argv, " "), 512));

    utils::ProcessOptions options;
    options.timeout = timeout;
    options.max_output_bytes = max_output_bytes;

    try {
        return utils::ProcessRunner::Run(argv, options);
    } catch (const std::runtime_error& e) {
        throw core::InfrastructureError(std::string("Cannot run docker: ") + e.what());
    }
}

} // namespace runtime
} // namespace repobox
