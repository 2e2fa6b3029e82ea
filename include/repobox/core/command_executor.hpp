/**
 * @file command_executor.hpp
 * @brief Runs caller commands inside Running sandboxes under a time bound
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_types.hpp"
#include "repobox/core/sandbox_registry.hpp"
#include "repobox/core/service_config.hpp"
#include "repobox/runtime/container_runtime.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <functional>

namespace repobox {
namespace core {

/**
 * @brief Predicate deciding whether a command may be dispatched
 */
using CommandPolicy = std::function<bool(const std::string& command)>;

/**
 * @brief Policy accepting every command (the default)
 */
CommandPolicy AllowAllCommands();

/**
 * @brief Policy accepting commands whose first word matches one of @p prefixes
 *
 * "git" allows "git status" but not "gitk" or "rm -rf /; git status".
 * Commands containing shell control operators (; & | ` $( newline) are
 * rejected outright since they could chain an unlisted program.
 */
CommandPolicy MakePrefixWhitelist(std::vector<std::string> prefixes);

/**
 * @class CommandExecutor
 * @brief Executes shell commands in sandboxes
 *
 * Commands run as `<shell> -c <command>` in the requested working directory
 * (relative paths resolve against the sandbox workspace). The runtime kills
 * the command at the time bound; the result then carries timed_out and
 * kTimeoutExitCode.
 *
 * **Concurrency**: with serialize_commands (default) commands against the
 * same sandbox run one at a time; different sandboxes never block each
 * other. The Running check happens under that per-sandbox lock right before
 * dispatch.
 *
 * Executing a command never changes a sandbox's status or expiry.
 */
class CommandExecutor {
public:
    CommandExecutor(SandboxRegistry& registry,
                    runtime::ContainerRuntime& runtime,
                    const ServiceConfig& config,
                    CommandPolicy policy = AllowAllCommands());

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /**
     * @brief Execute a command in sandbox @p id
     *
     * @throws NotFoundError for unknown ids
     * @throws InvalidStateError unless the sandbox is Running
     * @throws ValidationError for an empty command, an out-of-range timeout
     *         or a command rejected by the policy
     * @throws InfrastructureError if the runtime cannot dispatch
     */
    CommandResult ExecuteCommand(const std::string& id, const ExecuteRequest& request);

    /**
     * @brief Dispatch without registry checks
     *
     * Used by the Provisioner for the initial command, before the record
     * is registered.
     */
    CommandResult Dispatch(const runtime::SandboxHandle& handle,
                           const std::string& command,
                           const std::string& working_directory,
                           std::chrono::milliseconds timeout);

private:
    std::chrono::milliseconds ResolveTimeout(const ExecuteRequest& request) const;

    SandboxRegistry& registry_;
    runtime::ContainerRuntime& runtime_;
    const ServiceConfig& config_;
    CommandPolicy policy_;
};

} // namespace core
} // namespace repobox
