/**
 * @file sandbox_registry.hpp
 * @brief In-memory table of sandbox records
 *
 * The single source of truth for which sandboxes exist and in which status.
 * Constructed once per process by SandboxManager and passed by reference to
 * every component that needs it.
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_types.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>

namespace repobox {
namespace core {

/**
 * @class SandboxRegistry
 * @brief Thread-safe id -> ContainerRecord map
 *
 * **Thread Safety**: All operations are serialized by one mutex. Reads
 * return copies, so callers never observe a record while it is mutated.
 * The mutex is never held while calling into the container runtime.
 *
 * Each entry also owns a command mutex. The Executor holds it (exclusively
 * when commands are serialized, shared otherwise) from its status check
 * until the command returns; the Reaper takes it exclusively to expire a
 * record, so no dispatch starts after expiry.
 */
class SandboxRegistry {
public:
    SandboxRegistry() = default;

    SandboxRegistry(const SandboxRegistry&) = delete;
    SandboxRegistry& operator=(const SandboxRegistry&) = delete;

    /**
     * @brief Insert a new record
     * @throws InvalidStateError if a record with the same id exists
     */
    void Insert(ContainerRecord record);

    /**
     * @brief Copy of the record with @p id
     * @throws NotFoundError if absent
     */
    ContainerRecord Get(const std::string& id) const;

    std::optional<ContainerRecord> Find(const std::string& id) const;

    /**
     * @brief Snapshot of all records ordered by creation time (ties by id)
     */
    std::vector<ContainerRecord> List() const;

    /**
     * @brief Remove a record
     * @return true if a record was removed
     */
    bool Remove(const std::string& id);

    /**
     * @brief Atomically move @p id from @p expected to @p next
     *
     * @return false if the record is absent or not in @p expected
     * @throws InvalidStateError if expected -> next is not a valid transition
     */
    bool CompareAndSetStatus(const std::string& id, ContainerStatus expected, ContainerStatus next);

    /**
     * @brief Store @p result as the record's last command result
     * @return false if the record no longer exists
     */
    bool RecordCommandResult(const std::string& id, const CommandResult& result);

    /**
     * @brief Per-sandbox command mutex
     *
     * The returned pointer stays valid after the record is removed.
     *
     * @throws NotFoundError if absent
     */
    std::shared_ptr<std::shared_mutex> CommandLock(const std::string& id) const;

    std::size_t Size() const;
    std::size_t CountByStatus(ContainerStatus status) const;

private:
    struct Entry {
        ContainerRecord record;
        std::shared_ptr<std::shared_mutex> command_mutex;
    };

    mutable std::mutex state_mutex_;          ///< Protects entries_
    std::map<std::string, Entry> entries_;
};

} // namespace core
} // namespace repobox
