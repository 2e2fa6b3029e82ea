/**
 * @file provisioner.cpp
 * @brief Sandbox creation, repository seeding and registration
 *
 * **Setup commands issued inside the sandbox**:
 * ```
 * sh -c <bootstrap_command>
 * git clone --quiet -- <repo_url> <workspace>
 * git -C <workspace> checkout --quiet <branch> --
 * git -C <workspace> reset --hard --quiet <commit>      (commit given)
 * ```
 *
 * Git runs with GIT_TERMINAL_PROMPT=0 so private repositories fail fast
 * instead of waiting for credentials.
 *
 * @date 2025
 */

#include "repobox/core/provisioner.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/utils/path_utils.hpp"
#include "repobox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace repobox {
namespace core {

using utils::StringUtils;

namespace {

std::string DescribeFailure(const runtime::ExecOutcome& outcome) {
    auto message = StringUtils::Trim(outcome.stderr_output);
    if (message.empty()) {
        message = StringUtils::Trim(outcome.stdout_output);
    }
    if (message.empty()) {
        message = "exit code " + std::to_string(outcome.exit_code);
    }
    return StringUtils::Truncate(message, 500);
}

bool HostAllowed(const std::string& host, const std::vector<std::string>& allowed) {
    return std::any_of(allowed.begin(), allowed.end(), [&host](const std::string& entry) {
        auto candidate = StringUtils::ToLower(entry);
        return host == candidate || StringUtils::EndsWith(host, "." + candidate);
    });
}

} // anonymous namespace

Provisioner::Provisioner(SandboxRegistry& registry,
                         runtime::ContainerRuntime& runtime,
                         CommandExecutor& executor,
                         const ServiceConfig& config)
    : registry_(registry)
    , runtime_(runtime)
    , executor_(executor)
    , config_(config) {
}

// ============================================================================
// REQUEST VALIDATION
// ============================================================================

void Provisioner::ValidateRequest(const CreateRequest& request) const {
    if (!StringUtils::IsRepositoryURL(request.repo_url)) {
        throw ValidationError("Invalid repository URL: " + StringUtils::Truncate(request.repo_url, 200));
    }

    if (!config_.allowed_repo_hosts.empty()) {
        auto host = StringUtils::ExtractHost(request.repo_url);
        if (!host || !HostAllowed(*host, config_.allowed_repo_hosts)) {
            throw ValidationError("Repository host not allowed: " + host.value_or(request.repo_url));
        }
    }

    if (request.branch && !StringUtils::IsGitRefName(*request.branch)) {
        throw ValidationError("Invalid branch name: " + StringUtils::Truncate(*request.branch, 100));
    }
    if (request.commit && !StringUtils::IsCommitHash(*request.commit)) {
        throw ValidationError("Invalid commit hash: " + StringUtils::Truncate(*request.commit, 100));
    }
    if (request.max_runtime_secs) {
        // The clock cannot represent every int64 second count; cap by what fits past now
        auto limit = std::min(config_.max_container_runtime,
                              std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max() - Clock::now()));
        if (*request.max_runtime_secs <= 0 || *request.max_runtime_secs > limit.count()) {
            throw ValidationError("max_runtime_secs must be between 1 and " + std::to_string(limit.count()));
        }
    }

    for (const auto& [name, value] : request.env_vars) {
        if (!StringUtils::IsEnvVarName(name)) {
            throw ValidationError("Invalid environment variable name: " + StringUtils::Truncate(name, 100));
        }
        if (value.find('\0') != std::string::npos) {
            throw ValidationError("Environment variable " + name + " contains a NUL byte");
        }
    }

    if (request.initial_command && StringUtils::Trim(*request.initial_command).empty()) {
        throw ValidationError("initial_command must not be empty when given");
    }
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

ContainerRecord Provisioner::CreateContainer(const CreateRequest& request) {
    ValidateRequest(request);

    ContainerRecord record;
    record.id = GenerateContainerId();
    record.repo_url = request.repo_url;
    record.branch = request.branch.value_or(config_.default_branch);
    record.commit = request.commit;
    record.working_directory = utils::PathUtils::Normalize(config_.workspace_directory);
    record.environment_vars = request.env_vars;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("PROVISIONING CONTAINER {}", record.id);
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Repository: {}", record.repo_url);
    spdlog::info("Branch: {}{}", record.branch, record.commit ? " @ " + *record.commit : std::string());

    runtime::SandboxSpec spec;
    spec.name = record.id;
    spec.image = config_.runtime.image;
    spec.working_directory = record.working_directory;
    spec.environment = request.env_vars;
    spec.environment["REPO_URL"] = record.repo_url;
    spec.environment["REPO_BRANCH"] = record.branch;
    spec.environment["REPO_COMMIT"] = record.commit.value_or("");
    spec.environment["WORKING_DIR"] = record.working_directory;
    spec.environment["GIT_TERMINAL_PROMPT"] = "0";
    spec.labels = {{"repobox.managed", "true"}, {"repobox.id", record.id}};

    try {
        record.handle = runtime_.Start(spec);
    } catch (const SandboxError& e) {
        // A timed-out start may still have left a container behind under our name
        spdlog::error("Failed to start container {}: {}", record.id, e.what());
        RollBack(runtime::SandboxHandle{spec.name});
        throw;
    }
    spdlog::info("✓ Container started: {}", record.handle.runtime_id);

    try {
        if (!StringUtils::Trim(config_.bootstrap_command).empty()) {
            RunSetupStep(record.handle, "bootstrap", {"sh", "-c", config_.bootstrap_command},
                         config_.bootstrap_timeout);
        }

        RunSetupStep(record.handle, "clone",
                     {"git", "clone", "--quiet", "--", record.repo_url, record.working_directory},
                     config_.clone_timeout);

        RunSetupStep(record.handle, "checkout",
                     {"git", "-C", record.working_directory, "checkout", "--quiet", record.branch, "--"},
                     config_.clone_timeout);

        if (record.commit) {
            RunSetupStep(record.handle, "reset",
                         {"git", "-C", record.working_directory, "reset", "--hard", "--quiet", *record.commit},
                         config_.clone_timeout);
        }
        spdlog::info("✓ Repository ready in {}", record.working_directory);

        if (request.initial_command) {
            try {
                record.last_command_result = executor_.Dispatch(
                    record.handle, *request.initial_command, record.working_directory,
                    config_.initial_command_timeout);
                if (record.last_command_result->exit_code != 0) {
                    spdlog::warn("Initial command exited with {} in {}",
                                 record.last_command_result->exit_code, record.id);
                }
            } catch (const SandboxError& e) {
                spdlog::warn("Initial command could not run in {}: {}", record.id, e.what());
            }
        }

        record.status = ContainerStatus::RUNNING;
        record.created_at = Clock::now();
        if (request.max_runtime_secs) {
            record.expires_at = record.created_at + std::chrono::seconds(*request.max_runtime_secs);
        }

        registry_.Insert(record);
    } catch (const std::exception& e) {
        spdlog::error("Provisioning of {} failed: {}", record.id, e.what());
        RollBack(record.handle);
        throw;
    }

    spdlog::info("✓ Container created: {}", record.id);
    return record;
}

std::string Provisioner::GenerateContainerId() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now().time_since_epoch()).count();
    auto sequence = ++sequence_;
    return config_.container_prefix + "-" + std::to_string(seconds) + "-" + std::to_string(sequence);
}

void Provisioner::RunSetupStep(const runtime::SandboxHandle& handle,
                               const std::string& step,
                               std::vector<std::string> argv,
                               std::chrono::seconds timeout) {
    spdlog::info("Running {} step...", step);

    runtime::ExecSpec spec;
    spec.argv = std::move(argv);
    spec.working_directory = "/";
    spec.timeout = timeout;
    spec.max_output_bytes = 256 * 1024;

    auto outcome = runtime_.ExecIn(handle, spec);

    if (outcome.timed_out) {
        throw ProvisionError(step + " timed out after " + std::to_string(timeout.count()) + "s");
    }
    if (outcome.exit_code != 0) {
        throw ProvisionError(step + " failed: " + DescribeFailure(outcome));
    }
}

void Provisioner::RollBack(const runtime::SandboxHandle& handle) noexcept {
    try {
        runtime_.Destroy(handle);
        spdlog::info("Rolled back partially created container {}", handle.runtime_id);
    } catch (const std::exception& e) {
        spdlog::error("Rollback failed, container {} needs manual cleanup: {}",
                      handle.runtime_id, e.what());
    }
}

} // namespace core
} // namespace repobox
