#include "repobox/core/reaper.hpp"
#include "repobox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <shared_mutex>

namespace repobox {
namespace core {

Reaper::Reaper(SandboxRegistry& registry,
               runtime::ContainerRuntime& runtime,
               std::chrono::milliseconds interval)
    : registry_(registry)
    , runtime_(runtime)
    , interval_(interval) {
}

Reaper::~Reaper() {
    Stop(false);
}

void Reaper::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    worker_ = std::thread(&Reaper::Loop, this);
    spdlog::info("Reaper started (interval {}ms)", interval_.count());
}

void Reaper::Stop(bool destroy_remaining) {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("Reaper stopped");
    }

    if (destroy_remaining) {
        auto destroyed = DestroyAll();
        spdlog::info("Shutdown sweep destroyed {} container(s)", destroyed);
    }
}

void Reaper::Loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_) {
        lock.unlock();
        try {
            auto reaped = RunOnce();
            if (reaped > 0) {
                spdlog::info("Reaper destroyed {} expired container(s)", reaped);
            }
        } catch (const std::exception& e) {
            spdlog::error("Reaper sweep failed: {}", e.what());
        }
        lock.lock();
        wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

// ============================================================================
// SWEEPS
// ============================================================================

std::size_t Reaper::RunOnce() {
    const auto now = Clock::now();
    std::size_t reaped = 0;

    for (auto record : registry_.List()) {
        if (!record.expires_at || *record.expires_at > now) {
            continue;
        }

        if (record.status == ContainerStatus::RUNNING) {
            if (!Expire(record.id)) {
                continue;
            }
            record.status = ContainerStatus::EXPIRED;
            spdlog::info("Container {} expired", record.id);
        } else if (record.status == ContainerStatus::PROVISIONING) {
            continue;
        }

        if (DestroyAndRemove(record)) {
            ++reaped;
        }
    }
    return reaped;
}

bool Reaper::Expire(const std::string& id) {
    std::shared_ptr<std::shared_mutex> command_mutex;
    try {
        command_mutex = registry_.CommandLock(id);
    } catch (const NotFoundError&) {
        return false;
    }

    std::unique_lock<std::shared_mutex> guard(*command_mutex, std::try_to_lock);
    if (!guard.owns_lock()) {
        spdlog::debug("Container {} has a command in flight, expiry deferred", id);
        return false;
    }
    // Deleted or failed concurrently; the next sweep sees the new state
    return registry_.CompareAndSetStatus(id, ContainerStatus::RUNNING, ContainerStatus::EXPIRED);
}

std::size_t Reaper::DestroyAll() {
    std::size_t destroyed = 0;

    for (const auto& record : registry_.List()) {
        if (record.status == ContainerStatus::RUNNING &&
            !registry_.CompareAndSetStatus(record.id, ContainerStatus::RUNNING, ContainerStatus::STOPPED)) {
            spdlog::debug("Container {} changed state during shutdown sweep", record.id);
        }
        if (DestroyAndRemove(record)) {
            ++destroyed;
        }
    }
    return destroyed;
}

bool Reaper::DestroyAndRemove(const ContainerRecord& record) {
    try {
        runtime_.Destroy(record.handle);
    } catch (const SandboxError& e) {
        spdlog::warn("Failed to destroy {} ({}), will retry: {}",
                     record.id, ContainerStatusName(record.status), e.what());
        return false;
    }

    registry_.Remove(record.id);
    spdlog::debug("Removed container {} from registry", record.id);
    return true;
}

} // namespace core
} // namespace repobox
