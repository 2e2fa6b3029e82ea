/**
 * @file reaper.hpp
 * @brief Background destruction of expired sandboxes
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_registry.hpp"
#include "repobox/runtime/container_runtime.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace repobox {
namespace core {

/**
 * @class Reaper
 * @brief Periodic sweep over the Registry
 *
 * Each tick moves RUNNING records whose expiry has passed to EXPIRED, then
 * destroys and removes every expired record. A record with a command in
 * flight is expired on a later tick, once the command has returned. A failed destroy keeps the
 * record for the next tick. Records without an expiry are never touched.
 * Failures are logged, never raised.
 *
 * **Thread Safety**: RunOnce() may be called concurrently with the
 * background thread; the Registry's compare-and-set resolves races with
 * concurrent deletes.
 */
class Reaper {
public:
    Reaper(SandboxRegistry& registry,
           runtime::ContainerRuntime& runtime,
           std::chrono::milliseconds interval);

    /// Stops the thread without a final sweep
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    /**
     * @brief Start the background thread (no-op if already running)
     */
    void Start();

    /**
     * @brief Stop the background thread
     *
     * @param destroy_remaining Also destroy every remaining sandbox
     *        (service shutdown); failures are logged.
     */
    void Stop(bool destroy_remaining = false);

    /**
     * @brief Run one sweep synchronously
     * @return Number of sandboxes destroyed and removed
     */
    std::size_t RunOnce();

    /**
     * @brief Destroy and remove every registered sandbox
     * @return Number of sandboxes destroyed and removed
     */
    std::size_t DestroyAll();

    bool IsRunning() const { return running_.load(); }

private:
    void Loop();

    /**
     * @brief RUNNING -> EXPIRED under the record's command mutex
     * @return false if the record is gone, changed state or has a command in flight
     */
    bool Expire(const std::string& id);

    /**
     * @brief Destroy a record's sandbox and remove it on success
     */
    bool DestroyAndRemove(const ContainerRecord& record);

    SandboxRegistry& registry_;
    runtime::ContainerRuntime& runtime_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread worker_;
};

} // namespace core
} // namespace repobox
