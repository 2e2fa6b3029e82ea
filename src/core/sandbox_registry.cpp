#include "repobox/core/sandbox_registry.hpp"
#include "repobox/core/errors.hpp"

#include <algorithm>

namespace repobox {
namespace core {

void SandboxRegistry::Insert(ContainerRecord record) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (entries_.count(record.id) > 0) {
        throw InvalidStateError("Container already registered: " + record.id);
    }
    std::string id = record.id;
    entries_.emplace(id, Entry{std::move(record), std::make_shared<std::shared_mutex>()});
}

ContainerRecord SandboxRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw NotFoundError("Container not found: " + id);
    }
    return it->second.record;
}

std::optional<ContainerRecord> SandboxRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<ContainerRecord> SandboxRegistry::List() const {
    std::vector<ContainerRecord> records;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        records.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            records.push_back(entry.record);
        }
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const ContainerRecord& a, const ContainerRecord& b) {
                         if (a.created_at != b.created_at) {
                             return a.created_at < b.created_at;
                         }
                         return a.id < b.id;
                     });
    return records;
}

bool SandboxRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return entries_.erase(id) > 0;
}

bool SandboxRegistry::CompareAndSetStatus(const std::string& id,
                                          ContainerStatus expected,
                                          ContainerStatus next) {
    if (!IsValidTransition(expected, next)) {
        throw InvalidStateError(std::string("Invalid status transition: ") +
                                ContainerStatusName(expected) + " -> " +
                                ContainerStatusName(next));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.record.status != expected) {
        return false;
    }
    it->second.record.status = next;
    return true;
}

bool SandboxRegistry::RecordCommandResult(const std::string& id, const CommandResult& result) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.record.last_command_result = result;
    return true;
}

std::shared_ptr<std::shared_mutex> SandboxRegistry::CommandLock(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw NotFoundError("Container not found: " + id);
    }
    return it->second.command_mutex;
}

std::size_t SandboxRegistry::Size() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return entries_.size();
}

std::size_t SandboxRegistry::CountByStatus(ContainerStatus status) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [status](const auto& item) { return item.second.record.status == status; }));
}

} // namespace core
} // namespace repobox
