/**
 * @file command_executor.cpp
 * @brief Command execution with per-sandbox serialization
 *
 * **Execution Flow**:
 * ```
 * validate request -> policy check -> [acquire sandbox lock]
 *   -> re-read record, require RUNNING and unexpired -> runtime.ExecIn(shell -c cmd)
 *   -> record last_command_result -> [release]
 * ```
 *
 * @date 2025
 */

#include "repobox/core/command_executor.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/utils/path_utils.hpp"
#include "repobox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <shared_mutex>

namespace repobox {
namespace core {

using utils::StringUtils;

CommandPolicy AllowAllCommands() {
    return [](const std::string&) { return true; };
}

CommandPolicy MakePrefixWhitelist(std::vector<std::string> prefixes) {
    return [prefixes = std::move(prefixes)](const std::string& command) {
        static const std::vector<std::string> control_operators = {";", "&", "|", "`", "$(", "\n", ">", "<"};
        for (const auto& op : control_operators) {
            if (StringUtils::Contains(command, op)) {
                return false;
            }
        }

        auto trimmed = StringUtils::Trim(command);
        for (const auto& prefix : prefixes) {
            if (trimmed == prefix) {
                return true;
            }
            if (StringUtils::StartsWith(trimmed, prefix) && trimmed.size() > prefix.size() &&
                (trimmed[prefix.size()] == ' ' || trimmed[prefix.size()] == '\t')) {
                return true;
            }
        }
        return false;
    };
}

CommandExecutor::CommandExecutor(SandboxRegistry& registry,
                                 runtime::ContainerRuntime& runtime,
                                 const ServiceConfig& config,
                                 CommandPolicy policy)
    : registry_(registry)
    , runtime_(runtime)
    , config_(config)
    , policy_(policy ? std::move(policy) : AllowAllCommands()) {
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandResult CommandExecutor::ExecuteCommand(const std::string& id, const ExecuteRequest& request) {
    // Existence first so unknown ids report NotFound regardless of input
    auto command_lock = registry_.CommandLock(id);

    if (StringUtils::Trim(request.command).empty()) {
        throw ValidationError("Command must not be empty");
    }
    auto timeout = ResolveTimeout(request);

    if (!policy_(request.command)) {
        spdlog::warn("Command rejected by policy in {}: {}", id, StringUtils::Truncate(request.command, 120));
        throw ValidationError("Command not permitted: " + StringUtils::Truncate(request.command, 120));
    }

    // Held until the command returns; the Reaper cannot expire the record meanwhile
    std::unique_lock<std::shared_mutex> serial;
    std::shared_lock<std::shared_mutex> concurrent;
    if (config_.serialize_commands) {
        serial = std::unique_lock<std::shared_mutex>(*command_lock);
    } else {
        concurrent = std::shared_lock<std::shared_mutex>(*command_lock);
    }

    auto record = registry_.Get(id);
    if (record.status != ContainerStatus::RUNNING) {
        throw InvalidStateError("Container " + id + " is " + ContainerStatusName(record.status) +
                                ", commands require a running container");
    }
    if (record.expires_at && *record.expires_at <= Clock::now()) {
        throw InvalidStateError("Container " + id + " has expired");
    }

    auto working_directory = utils::PathUtils::Resolve(
        record.working_directory, request.working_directory.value_or(""));

    auto result = Dispatch(record.handle, request.command, working_directory, timeout);

    if (!registry_.RecordCommandResult(id, result)) {
        spdlog::debug("Container {} removed while command was running", id);
    }
    return result;
}

CommandResult CommandExecutor::Dispatch(const runtime::SandboxHandle& handle,
                                        const std::string& command,
                                        const std::string& working_directory,
                                        std::chrono::milliseconds timeout) {
    runtime::ExecSpec spec;
    spec.argv = {config_.shell, "-c", command};
    spec.working_directory = working_directory;
    spec.timeout = timeout;
    spec.max_output_bytes = config_.max_output_bytes;

    spdlog::debug("Executing in {}: {}", handle.runtime_id, StringUtils::Truncate(command, 200));

    auto start = std::chrono::steady_clock::now();
    auto outcome = runtime_.ExecIn(handle, spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CommandResult result;
    result.command = command;
    result.exit_code = outcome.timed_out ? kTimeoutExitCode : outcome.exit_code;
    result.stdout_output = std::move(outcome.stdout_output);
    result.stderr_output = std::move(outcome.stderr_output);
    result.elapsed_secs = std::chrono::duration<double>(elapsed).count();
    result.timestamp = Clock::now();
    result.timed_out = outcome.timed_out;
    result.output_truncated = outcome.output_truncated;

    if (result.timed_out) {
        spdlog::warn("Command timed out after {}s in {}", timeout.count() / 1000.0, handle.runtime_id);
    } else {
        spdlog::info("Command finished in {} (exit {}, {:.3f}s)",
                     handle.runtime_id, result.exit_code, result.elapsed_secs);
    }
    return result;
}

std::chrono::milliseconds CommandExecutor::ResolveTimeout(const ExecuteRequest& request) const {
    if (!request.timeout_secs) {
        return config_.default_command_timeout;
    }
    if (*request.timeout_secs < 1 || *request.timeout_secs > config_.max_command_timeout.count()) {
        throw ValidationError("timeout_secs must be between 1 and " +
                              std::to_string(config_.max_command_timeout.count()));
    }
    return std::chrono::seconds(*request.timeout_secs);
}

} // namespace core
} // namespace repobox
