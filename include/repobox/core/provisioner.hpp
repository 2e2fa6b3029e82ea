/**
 * @file provisioner.hpp
 * @brief Creates sandboxes seeded with a cloned repository
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_types.hpp"
#include "repobox/core/sandbox_registry.hpp"
#include "repobox/core/command_executor.hpp"
#include "repobox/core/service_config.hpp"
#include "repobox/runtime/container_runtime.hpp"

#include <string>
#include <vector>
#include <atomic>
#include <cstdint>
#include <chrono>

namespace repobox {
namespace core {

/**
 * @class Provisioner
 * @brief Validates create requests and builds Running sandboxes
 *
 * **Provisioning Workflow**:
 * 1. Validate the request (no side effects on failure)
 * 2. Start a sandbox with limits and injected environment
 * 3. Bootstrap (install git when the image lacks it)
 * 4. Clone, check out the branch, reset to the commit if given
 * 5. Run the optional initial command (failures are recorded, not raised)
 * 6. Register the record as RUNNING
 *
 * Any failure in steps 2-4 destroys the partially created sandbox and
 * leaves the Registry unchanged. The Registry lock is only taken for the
 * final insert, so concurrent creates proceed in parallel.
 */
class Provisioner {
public:
    Provisioner(SandboxRegistry& registry,
                runtime::ContainerRuntime& runtime,
                CommandExecutor& executor,
                const ServiceConfig& config);

    Provisioner(const Provisioner&) = delete;
    Provisioner& operator=(const Provisioner&) = delete;

    /**
     * @brief Create, seed and register a sandbox
     *
     * @throws ValidationError for malformed input
     * @throws InfrastructureError if the runtime cannot start the sandbox
     * @throws ProvisionError if bootstrap, clone, checkout or reset fails
     */
    ContainerRecord CreateContainer(const CreateRequest& request);

    /**
     * @throws ValidationError naming the first invalid field
     */
    void ValidateRequest(const CreateRequest& request) const;

private:
    std::string GenerateContainerId();

    /**
     * @brief Run one setup step, raising ProvisionError on failure or timeout
     */
    void RunSetupStep(const runtime::SandboxHandle& handle,
                      const std::string& step,
                      std::vector<std::string> argv,
                      std::chrono::seconds timeout);

    void RollBack(const runtime::SandboxHandle& handle) noexcept;

    SandboxRegistry& registry_;
    runtime::ContainerRuntime& runtime_;
    CommandExecutor& executor_;
    const ServiceConfig& config_;
    std::atomic<std::uint64_t> sequence_{0};   ///< Id counter
};

} // namespace core
} // namespace repobox
