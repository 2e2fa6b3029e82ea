/**
 * @file sandbox_manager.cpp
 * @brief Wiring and orchestration of the lifecycle core
 *
 * **Component Graph**:
 * ```
 *                 SandboxManager
 *                       |
 *      +-------+--------+---------+----------+
 *      |       |        |         |          |
 *  Registry Provisioner Executor Accessor  Reaper
 *      ^       |        |         |          |
 *      +-------+--------+---------+----------+   (all share one Registry)
 *                       |
 *               ContainerRuntime (docker / fake)
 * ```
 *
 * @date 2025
 */

#include "repobox/core/sandbox_manager.hpp"
#include "repobox/core/sandbox_registry.hpp"
#include "repobox/core/provisioner.hpp"
#include "repobox/core/filesystem_accessor.hpp"
#include "repobox/core/reaper.hpp"
#include "repobox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

namespace repobox {
namespace core {

class SandboxManager::Impl {
public:
    Impl(const ServiceConfig& config,
         std::unique_ptr<runtime::ContainerRuntime> runtime_ptr,
         CommandPolicy policy)
        : runtime(std::move(runtime_ptr))
        , executor(registry, *runtime, config, std::move(policy))
        , provisioner(registry, *runtime, executor, config)
        , accessor(registry, *runtime, config)
        , reaper(registry, *runtime, config.reaper_interval) {
    }

    SandboxRegistry registry;
    std::unique_ptr<runtime::ContainerRuntime> runtime;
    CommandExecutor executor;
    Provisioner provisioner;
    FilesystemAccessor accessor;
    Reaper reaper;

    std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
    std::atomic<bool> is_shut_down{false};
};

namespace {

CommandPolicy SelectPolicy(const ServiceConfig& config, CommandPolicy policy) {
    if (policy) {
        return policy;
    }
    if (!config.allowed_command_prefixes.empty()) {
        spdlog::info("Command whitelist active ({} prefixes)", config.allowed_command_prefixes.size());
        return MakePrefixWhitelist(config.allowed_command_prefixes);
    }
    return AllowAllCommands();
}

} // anonymous namespace

SandboxManager::SandboxManager(const ServiceConfig& config,
                               std::unique_ptr<runtime::ContainerRuntime> runtime,
                               CommandPolicy policy)
    : config_(config) {
    if (!runtime) {
        throw std::invalid_argument("SandboxManager requires a container runtime");
    }
    impl_ = std::make_unique<Impl>(config_, std::move(runtime), SelectPolicy(config_, std::move(policy)));
}

SandboxManager::~SandboxManager() {
    Shutdown();
}

// ============================================================================
// SERVICE LIFECYCLE
// ============================================================================

bool SandboxManager::Initialize() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING {} v{}", config_.api_name, config_.version);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    spdlog::info("Checking {} availability...", impl_->runtime->Name());
    bool available = impl_->runtime->Ping();
    if (available) {
        spdlog::info("✓ {} is available", impl_->runtime->Name());
    } else {
        spdlog::warn("⚠ {} is not reachable, container creation will fail until it is",
                     impl_->runtime->Name());
    }

    impl_->reaper.Start();

    spdlog::info("Image: {}", config_.runtime.image);
    spdlog::info("Workspace: {}", config_.workspace_directory);
    spdlog::info("Default command timeout: {}s", config_.default_command_timeout.count());
    spdlog::info("═══════════════════════════════════════════════════════════════");
    return available;
}

void SandboxManager::Shutdown() {
    bool expected = false;
    if (!impl_ || !impl_->is_shut_down.compare_exchange_strong(expected, true)) {
        return;
    }

    spdlog::info("Shutting down, destroying {} container(s)...", impl_->registry.Size());
    impl_->reaper.Stop(true);

    auto remaining = impl_->registry.Size();
    if (remaining > 0) {
        spdlog::error("{} container(s) could not be destroyed during shutdown", remaining);
    } else {
        spdlog::info("✓ Shutdown complete");
    }
}

// ============================================================================
// SANDBOX OPERATIONS
// ============================================================================

ContainerRecord SandboxManager::CreateContainer(const CreateRequest& request) {
    return impl_->provisioner.CreateContainer(request);
}

ContainerListing SandboxManager::ListContainers() {
    ContainerListing listing;
    listing.containers = impl_->registry.List();

    for (auto& record : listing.containers) {
        Refresh(record);
        if (record.status == ContainerStatus::RUNNING) {
            ++listing.active_count;
        }
    }
    listing.total_count = listing.containers.size();
    return listing;
}

ContainerRecord SandboxManager::GetContainer(const std::string& id) {
    auto record = impl_->registry.Get(id);
    Refresh(record);
    return record;
}

void SandboxManager::DeleteContainer(const std::string& id) {
    auto record = impl_->registry.Get(id);

    if (record.status == ContainerStatus::RUNNING &&
        !impl_->registry.CompareAndSetStatus(id, ContainerStatus::RUNNING, ContainerStatus::STOPPED)) {
        spdlog::debug("Container {} changed state before delete", id);
    }

    spdlog::info("Deleting container {}", id);
    impl_->runtime->Destroy(record.handle);

    if (impl_->registry.Remove(id)) {
        spdlog::info("✓ Container deleted: {}", id);
    }
}

CommandResult SandboxManager::ExecuteCommand(const std::string& id, const ExecuteRequest& request) {
    return impl_->executor.ExecuteCommand(id, request);
}

DirectoryListing SandboxManager::BrowseDirectory(const std::string& id, const std::string& path) {
    return impl_->accessor.BrowseDirectory(id, path);
}

FileContent SandboxManager::ReadFile(const std::string& id, const std::string& file_path) {
    return impl_->accessor.ReadFile(id, file_path);
}

std::size_t SandboxManager::ReapExpired() {
    return impl_->reaper.RunOnce();
}

// ============================================================================
// SERVICE STATUS
// ============================================================================

HealthReport SandboxManager::Health() {
    HealthReport report;
    report.version = config_.version;
    report.uptime_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - impl_->started_at).count();
    report.total_containers = impl_->registry.Size();
    report.active_containers = impl_->registry.CountByStatus(ContainerStatus::RUNNING);
    report.runtime_available = impl_->runtime->Ping();
    report.runtime_name = impl_->runtime->Name();
    report.healthy = report.runtime_available;
    return report;
}

ReadinessReport SandboxManager::Ready() {
    ReadinessReport report;
    if (impl_->is_shut_down) {
        report.reason = "service is shutting down";
    } else if (!impl_->runtime->Ping()) {
        report.reason = impl_->runtime->Name() + " is not reachable";
    } else {
        report.ready = true;
    }
    return report;
}

std::string SandboxManager::RuntimeName() const {
    return impl_->runtime->Name();
}

void SandboxManager::Refresh(ContainerRecord& record) {
    if (record.status != ContainerStatus::RUNNING) {
        return;
    }

    runtime::SandboxState state;
    try {
        state = impl_->runtime->Inspect(record.handle);
    } catch (const InfrastructureError& e) {
        spdlog::warn("Cannot refresh {}: {}", record.id, e.what());
        return;
    }

    if (state == runtime::SandboxState::RUNNING) {
        return;
    }

    if (impl_->registry.CompareAndSetStatus(record.id, ContainerStatus::RUNNING, ContainerStatus::FAILED)) {
        spdlog::warn("Container {} is no longer running ({}), marked failed", record.id,
                     state == runtime::SandboxState::MISSING ? "missing" : "stopped");
        record.status = ContainerStatus::FAILED;
    } else if (auto current = impl_->registry.Find(record.id)) {
        record.status = current->status;
    }
}

} // namespace core
} // namespace repobox
