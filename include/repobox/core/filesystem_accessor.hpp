/**
 * @file filesystem_accessor.hpp
 * @brief Read-only directory listing and file reads inside sandboxes
 *
 * All paths are confined to the sandbox workspace: a path is normalized
 * lexically and rejected if it leaves the workspace, then resolved inside
 * the sandbox (following symlinks) and rejected again if the resolved
 * target leaves it.
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
#include <cstdint>

namespace repobox {
namespace core {

/**
 * @class FilesystemAccessor
 * @brief Inspects sandbox filesystems through read-only probe commands
 *
 * Probes: `realpath -m`, `stat -c`, `find -printf`, `head -c`. Nothing is
 * ever written inside the sandbox. Any record status is accepted.
 */
class FilesystemAccessor {
public:
    FilesystemAccessor(SandboxRegistry& registry,
                       runtime::ContainerRuntime& runtime,
                       const ServiceConfig& config);

    FilesystemAccessor(const FilesystemAccessor&) = delete;
    FilesystemAccessor& operator=(const FilesystemAccessor&) = delete;

    /**
     * @brief List the entries of a directory (sorted by name)
     *
     * @param path Absolute, or relative to the workspace; empty = workspace
     *
     * @throws NotFoundError for unknown ids or missing paths
     * @throws PathTraversalError if the path leaves the workspace
     * @throws ValidationError if the path is not a directory
     * @throws ExecutionTimeoutError if a probe exceeds probe_timeout
     */
    DirectoryListing BrowseDirectory(const std::string& id, const std::string& path);

    /**
     * @brief Read a regular file completely
     *
     * @throws SizeExceededError if the file exceeds max_file_size_bytes
     * @throws ValidationError if the path is not a regular file
     * (plus the errors of BrowseDirectory)
     */
    FileContent ReadFile(const std::string& id, const std::string& file_path);

private:
    struct StatInfo {
        std::string type;        ///< stat %F, e.g. "directory", "regular file"
        std::uint64_t size{0};
    };

    /**
     * @brief Confine @p path to the workspace and resolve symlinks inside the sandbox
     */
    std::string ResolvePath(const ContainerRecord& record, const std::string& path);

    StatInfo Stat(const ContainerRecord& record, const std::string& resolved);

    runtime::ExecOutcome Probe(const ContainerRecord& record,
                               std::vector<std::string> argv,
                               std::size_t max_output_bytes = 1024 * 1024);

    SandboxRegistry& registry_;
    runtime::ContainerRuntime& runtime_;
    const ServiceConfig& config_;
};

} // namespace core
} // namespace repobox
