/**
 * @file sandbox_manager.hpp
 * @brief Container Lifecycle Manager facade
 *
 * Owns the Registry and wires it, together with the container runtime,
 * into the Provisioner, Executor, Filesystem Accessor and Reaper. Adapters
 * (the JSON-lines server, the CLI) only talk to this class.
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_types.hpp"
#include "repobox/core/service_config.hpp"
#include "repobox/core/command_executor.hpp"
#include "repobox/runtime/container_runtime.hpp"

#include <memory>
#include <string>
#include <vector>

namespace repobox {
namespace core {

class SandboxRegistry;

/**
 * @struct ContainerListing
 * @brief Result of ListContainers()
 */
struct ContainerListing {
    std::vector<ContainerRecord> containers;  ///< Ordered by creation time
    std::size_t total_count{0};
    std::size_t active_count{0};              ///< RUNNING records
};

/**
 * @struct ReadinessReport
 * @brief Result of Ready()
 */
struct ReadinessReport {
    bool ready{false};
    std::string reason;   ///< Why not ready (empty when ready)
};

/**
 * @class SandboxManager
 * @brief Entry point of the lifecycle core
 *
 * **Lifecycle**:
 * @code
 * SandboxManager manager(config, std::make_unique<runtime::DockerRuntime>(config.runtime));
 * manager.Initialize();                    // checks the runtime, starts the Reaper
 *
 * CreateRequest request;
 * request.repo_url = "https://github.com/org/repo";
 * request.max_runtime_secs = 3600;
 * auto record = manager.CreateContainer(request);
 *
 * auto result = manager.ExecuteCommand(record.id, ExecuteRequest{"make test", {}, 600});
 *
 * manager.Shutdown();                      // stops the Reaper, destroys all sandboxes
 * @endcode
 *
 * **Thread Safety**: All operations may be called concurrently.
 */
class SandboxManager {
public:
    SandboxManager(const ServiceConfig& config,
                   std::unique_ptr<runtime::ContainerRuntime> runtime,
                   CommandPolicy policy = nullptr);

    /// Calls Shutdown()
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Check the runtime and start the Reaper
     *
     * @return true if the runtime is reachable. The Reaper starts either
     *         way so sandboxes created after a runtime recovery still expire.
     */
    bool Initialize();

    /**
     * @brief Stop the Reaper and destroy every remaining sandbox (idempotent)
     */
    void Shutdown();

    // ------------------------------------------------------------------------
    // Sandbox operations
    // ------------------------------------------------------------------------

    ContainerRecord CreateContainer(const CreateRequest& request);

    /**
     * @brief All records, RUNNING ones refreshed against the runtime
     */
    ContainerListing ListContainers();

    /**
     * @brief One record, refreshed against the runtime
     *
     * A RUNNING sandbox the runtime reports stopped or missing becomes FAILED.
     *
     * @throws NotFoundError for unknown ids
     */
    ContainerRecord GetContainer(const std::string& id);

    /**
     * @brief Destroy a sandbox and remove its record
     *
     * A RUNNING record becomes STOPPED first. If destruction fails the
     * record stays so the delete can be retried.
     *
     * @throws NotFoundError for unknown ids
     * @throws InfrastructureError if the runtime fails to destroy
     */
    void DeleteContainer(const std::string& id);

    CommandResult ExecuteCommand(const std::string& id, const ExecuteRequest& request);

    DirectoryListing BrowseDirectory(const std::string& id, const std::string& path);

    FileContent ReadFile(const std::string& id, const std::string& file_path);

    // ------------------------------------------------------------------------
    // Service status (read-only)
    // ------------------------------------------------------------------------

    HealthReport Health();
    ReadinessReport Ready();
    bool Live() const { return true; }

    const ServiceConfig& Config() const { return config_; }
    std::string RuntimeName() const;

    /**
     * @brief Run one Reaper sweep now
     */
    std::size_t ReapExpired();

private:
    /**
     * @brief Move a RUNNING record to FAILED if its sandbox is gone
     */
    void Refresh(ContainerRecord& record);

    ServiceConfig config_;

    class Impl;
    std::unique_ptr<Impl> impl_;  ///< Pimpl idiom for implementation hiding
};

} // namespace core
} // namespace repobox
