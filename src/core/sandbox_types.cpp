#include "repobox/core/sandbox_types.hpp"

namespace repobox {
namespace core {

const char* ContainerStatusName(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::PROVISIONING: return "provisioning";
        case ContainerStatus::RUNNING:      return "running";
        case ContainerStatus::STOPPED:      return "stopped";
        case ContainerStatus::FAILED:       return "failed";
        case ContainerStatus::EXPIRED:      return "expired";
    }
    return "unknown";
}

bool IsTerminal(ContainerStatus status) {
    return status == ContainerStatus::STOPPED ||
           status == ContainerStatus::FAILED ||
           status == ContainerStatus::EXPIRED;
}

bool IsValidTransition(ContainerStatus from, ContainerStatus to) {
    switch (from) {
        case ContainerStatus::PROVISIONING:
            return to == ContainerStatus::RUNNING || to == ContainerStatus::FAILED;
        case ContainerStatus::RUNNING:
            return to == ContainerStatus::STOPPED ||
                   to == ContainerStatus::FAILED ||
                   to == ContainerStatus::EXPIRED;
        default:
            return false;
    }
}

const char* EntryKindName(EntryKind kind) {
    switch (kind) {
        case EntryKind::FILE:      return "file";
        case EntryKind::DIRECTORY: return "directory";
        case EntryKind::SYMLINK:   return "symlink";
        case EntryKind::OTHER:     return "other";
    }
    return "other";
}

} // namespace core
} // namespace repobox
