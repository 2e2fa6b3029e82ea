/**
 * @file filesystem_accessor.cpp
 * @brief Workspace-confined filesystem inspection
 *
 * **Probe sequence**:
 * ```
 * lexical normalize + containment check          (no sandbox access)
 * realpath -m -- <path>                          (resolve symlinks)
 * containment check on the resolved path
 * stat -c '%F<TAB>%s' -- <resolved>              (type and size)
 * find <dir> -mindepth 1 -maxdepth 1 -printf ... (Browse)
 * head -c <limit+1> -- <file>                    (ReadFile)
 * ```
 *
 * find records are NUL terminated with tab separated fields and the name
 * last, so names containing tabs or newlines survive parsing.
 *
 * @date 2025
 */

#include "repobox/core/filesystem_accessor.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/utils/path_utils.hpp"
#include "repobox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace repobox {
namespace core {

using utils::PathUtils;
using utils::StringUtils;

namespace {

bool IsMissingPath(const runtime::ExecOutcome& outcome) {
    return StringUtils::Contains(outcome.stderr_output, "No such file or directory") ||
           StringUtils::Contains(outcome.stderr_output, "Not a directory");
}

std::string StripTrailingNewline(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

EntryKind ParseEntryKind(const std::string& type) {
    if (type == "f") return EntryKind::FILE;
    if (type == "d") return EntryKind::DIRECTORY;
    if (type == "l") return EntryKind::SYMLINK;
    return EntryKind::OTHER;
}

std::uint64_t ParseSize(const std::string& text) {
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return 0;
    }
}

std::optional<TimePoint> ParseModifiedTime(const std::string& text) {
    try {
        double seconds = std::stod(text);
        auto whole = static_cast<std::int64_t>(std::floor(seconds));
        return TimePoint(std::chrono::seconds(whole));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // anonymous namespace

FilesystemAccessor::FilesystemAccessor(SandboxRegistry& registry,
                                       runtime::ContainerRuntime& runtime,
                                       const ServiceConfig& config)
    : registry_(registry)
    , runtime_(runtime)
    , config_(config) {
}

// ============================================================================
// DIRECTORY BROWSING
// ============================================================================

DirectoryListing FilesystemAccessor::BrowseDirectory(const std::string& id, const std::string& path) {
    auto record = registry_.Get(id);
    auto resolved = ResolvePath(record, path);

    auto info = Stat(record, resolved);
    if (info.type != "directory") {
        throw ValidationError("Not a directory: " + resolved);
    }

    auto outcome = Probe(record,
                         {"find", resolved, "-mindepth", "1", "-maxdepth", "1",
                          "-printf", "%y\\t%s\\t%M\\t%T@\\t%f\\0"},
                         config_.max_output_bytes);

    if (outcome.exit_code != 0) {
        if (outcome.stdout_output.empty()) {
            throw InfrastructureError("Cannot list " + resolved + ": " +
                                      StringUtils::Trim(outcome.stderr_output));
        }
        // find exits 1 when some entries are unreadable but still lists the rest
        spdlog::warn("Partial listing of {} in {}: {}", resolved, id,
                     StringUtils::Truncate(StringUtils::Trim(outcome.stderr_output), 200));
    }

    DirectoryListing listing;
    listing.path = resolved;

    auto records = StringUtils::Split(outcome.stdout_output, '\0');
    // The piece after the final terminator is empty, or cut off by the output cap
    records.pop_back();
    if (outcome.output_truncated) {
        spdlog::warn("Listing of {} truncated at {} entries", resolved, records.size());
    }

    for (const auto& line : records) {
        auto fields = StringUtils::SplitN(line, '\t', 5);
        if (fields.size() != 5 || fields[4].empty()) {
            spdlog::debug("Skipping malformed listing record: {}", line);
            continue;
        }

        DirectoryEntry entry;
        entry.kind = ParseEntryKind(fields[0]);
        entry.size = ParseSize(fields[1]);
        entry.permissions = fields[2];
        entry.modified_at = ParseModifiedTime(fields[3]);
        entry.name = fields[4];
        listing.entries.push_back(std::move(entry));
    }

    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });

    spdlog::debug("Listed {} entries in {}:{}", listing.entries.size(), id, resolved);
    return listing;
}

// ============================================================================
// FILE READING
// ============================================================================

FileContent FilesystemAccessor::ReadFile(const std::string& id, const std::string& file_path) {
    auto record = registry_.Get(id);
    auto resolved = ResolvePath(record, file_path);

    auto info = Stat(record, resolved);
    if (info.type != "regular file" && info.type != "regular empty file") {
        throw ValidationError("Not a regular file: " + resolved + " (" + info.type + ")");
    }

    const auto limit = config_.max_file_size_bytes;
    if (info.size > limit) {
        throw SizeExceededError("File " + resolved + " is " + std::to_string(info.size) +
                                " bytes, limit is " + std::to_string(limit));
    }

    auto outcome = Probe(record, {"head", "-c", std::to_string(limit + 1), "--", resolved}, limit + 2);

    if (outcome.exit_code != 0) {
        if (IsMissingPath(outcome)) {
            throw NotFoundError("File not found: " + resolved);
        }
        throw InfrastructureError("Cannot read " + resolved + ": " +
                                  StringUtils::Trim(outcome.stderr_output));
    }
    if (outcome.stdout_output.size() > limit) {
        // Grew between stat and read
        throw SizeExceededError("File " + resolved + " exceeds " + std::to_string(limit) + " bytes");
    }

    FileContent content;
    content.path = resolved;
    content.size = outcome.stdout_output.size();
    content.is_binary = !StringUtils::IsPrintableUtf8(outcome.stdout_output);
    content.content = std::move(outcome.stdout_output);

    spdlog::debug("Read {} bytes from {}:{}", content.size, id, resolved);
    return content;
}

// ============================================================================
// PATH RESOLUTION AND PROBES
// ============================================================================

std::string FilesystemAccessor::ResolvePath(const ContainerRecord& record, const std::string& path) {
    if (path.find('\0') != std::string::npos) {
        throw ValidationError("Path contains a NUL byte");
    }

    const auto root = PathUtils::Normalize(record.working_directory);
    const auto lexical = PathUtils::Resolve(root, path);

    if (!PathUtils::IsWithin(root, lexical)) {
        spdlog::warn("Path traversal rejected in {}: {}", record.id, StringUtils::Truncate(path, 200));
        throw PathTraversalError("Path escapes the workspace: " + StringUtils::Truncate(path, 200));
    }

    auto outcome = Probe(record, {"realpath", "-m", "--", lexical});
    if (outcome.exit_code != 0) {
        throw InfrastructureError("Cannot resolve " + lexical + ": " +
                                  StringUtils::Trim(outcome.stderr_output));
    }

    auto resolved = PathUtils::Normalize(StripTrailingNewline(outcome.stdout_output));
    if (!PathUtils::IsWithin(root, resolved)) {
        spdlog::warn("Symlink escape rejected in {}: {} -> {}", record.id, lexical, resolved);
        throw PathTraversalError("Path resolves outside the workspace: " + StringUtils::Truncate(path, 200));
    }
    return resolved;
}

FilesystemAccessor::StatInfo FilesystemAccessor::Stat(const ContainerRecord& record,
                                                      const std::string& resolved) {
    auto outcome = Probe(record, {"stat", "-c", "%F\t%s", "--", resolved});

    if (outcome.exit_code != 0) {
        if (IsMissingPath(outcome)) {
            throw NotFoundError("Path not found: " + resolved);
        }
        throw InfrastructureError("Cannot stat " + resolved + ": " +
                                  StringUtils::Trim(outcome.stderr_output));
    }

    auto fields = StringUtils::SplitN(StripTrailingNewline(outcome.stdout_output), '\t', 2);
    if (fields.size() != 2) {
        throw InfrastructureError("Unexpected stat output for " + resolved);
    }
    return StatInfo{fields[0], ParseSize(fields[1])};
}

runtime::ExecOutcome FilesystemAccessor::Probe(const ContainerRecord& record,
                                               std::vector<std::string> argv,
                                               std::size_t max_output_bytes) {
    runtime::ExecSpec spec;
    spec.argv = std::move(argv);
    spec.working_directory = "/";
    spec.timeout = config_.probe_timeout;
    spec.max_output_bytes = max_output_bytes;

    auto outcome = runtime_.ExecIn(record.handle, spec);
    if (outcome.timed_out) {
        throw ExecutionTimeoutError(spec.argv.front() + " probe timed out in " + record.id);
    }
    return outcome;
}

} // namespace core
} // namespace repobox
