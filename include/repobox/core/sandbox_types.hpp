/**
 * @file sandbox_types.hpp
 * @brief Data model of the lifecycle core
 *
 * Records, command results and filesystem views exchanged between the
 * Registry, the Provisioner, the Executor, the Filesystem Accessor and the
 * API layer.
 *
 * @date 2025
 */

#pragma once

#include "repobox/runtime/container_runtime.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace repobox {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Exit code reported for a command killed at its time bound (matches coreutils timeout)
constexpr int kTimeoutExitCode = 124;

/**
 * @enum ContainerStatus
 * @brief Lifecycle status of a sandbox record
 *
 * Transitions are monotonic:
 * ```
 * PROVISIONING -> RUNNING -> { STOPPED, FAILED, EXPIRED }
 * PROVISIONING -> FAILED
 * ```
 * STOPPED, FAILED and EXPIRED are terminal.
 */
enum class ContainerStatus {
    PROVISIONING,  ///< Sandbox being created and cloned
    RUNNING,       ///< Ready for commands
    STOPPED,       ///< Deleted by a caller or at shutdown
    FAILED,        ///< Runtime reported the sandbox dead
    EXPIRED        ///< Lifetime elapsed, awaiting or past destruction
};

const char* ContainerStatusName(ContainerStatus status);

/**
 * @brief Check whether @p from -> @p to is an edge of the status DAG
 */
bool IsValidTransition(ContainerStatus from, ContainerStatus to);

/**
 * @brief Terminal statuses never transition again
 */
bool IsTerminal(ContainerStatus status);

/**
 * @struct CommandResult
 * @brief Outcome of one command executed in a sandbox
 */
struct CommandResult {
    std::string command;             ///< Command line as submitted
    int exit_code{0};                ///< Exit status (kTimeoutExitCode on timeout)
    std::string stdout_output;       ///< Captured standard output
    std::string stderr_output;       ///< Captured standard error
    double elapsed_secs{0.0};        ///< Wall-clock duration
    TimePoint timestamp;             ///< Completion time
    bool timed_out{false};           ///< Killed at the time bound
    bool output_truncated{false};    ///< Output exceeded the capture cap
};

/**
 * @struct ContainerRecord
 * @brief One registry entry
 */
struct ContainerRecord {
    std::string id;                                      ///< Unique, immutable
    runtime::SandboxHandle handle;                       ///< Runtime-side sandbox
    ContainerStatus status{ContainerStatus::PROVISIONING};
    std::string repo_url;
    std::string branch;                                  ///< Resolved branch
    std::optional<std::string> commit;
    TimePoint created_at;
    std::optional<TimePoint> expires_at;                 ///< Unset = unbounded lifetime
    std::string working_directory;                       ///< Clone location inside the sandbox
    std::map<std::string, std::string> environment_vars;
    std::optional<CommandResult> last_command_result;
};

/**
 * @struct CreateRequest
 * @brief Caller input to the Provisioner
 */
struct CreateRequest {
    std::string repo_url;
    std::optional<std::string> branch;
    std::optional<std::string> commit;
    std::optional<std::int64_t> max_runtime_secs;
    std::map<std::string, std::string> env_vars;
    std::optional<std::string> initial_command;
};

/**
 * @struct ExecuteRequest
 * @brief Caller input to the Executor
 */
struct ExecuteRequest {
    std::string command;
    std::optional<std::string> working_directory;
    std::optional<std::int64_t> timeout_secs;
};

enum class EntryKind {
    FILE,
    DIRECTORY,
    SYMLINK,
    OTHER
};

const char* EntryKindName(EntryKind kind);

/**
 * @struct DirectoryEntry
 * @brief One item of a directory listing
 */
struct DirectoryEntry {
    std::string name;
    EntryKind kind{EntryKind::OTHER};
    std::uint64_t size{0};
    std::string permissions;       ///< ls-style mode string, e.g. "drwxr-xr-x"
    std::optional<TimePoint> modified_at;
};

struct DirectoryListing {
    std::string path;                     ///< Resolved directory path
    std::vector<DirectoryEntry> entries;  ///< Sorted by name
};

/**
 * @struct FileContent
 * @brief Content of a file read from a sandbox
 */
struct FileContent {
    std::string path;              ///< Resolved path inside the sandbox
    std::string content;           ///< Raw bytes
    std::uint64_t size{0};
    bool is_binary{false};         ///< Not printable UTF-8
};

/**
 * @struct HealthReport
 * @brief Snapshot returned by the health operation
 */
struct HealthReport {
    bool healthy{false};
    std::string version;
    double uptime_secs{0.0};
    std::size_t total_containers{0};
    std::size_t active_containers{0};
    bool runtime_available{false};
    std::string runtime_name;
};

} // namespace core
} // namespace repobox
