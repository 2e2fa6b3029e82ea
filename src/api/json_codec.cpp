#include "repobox/api/json_codec.hpp"
#include "repobox/utils/string_utils.hpp"

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

namespace repobox {
namespace api {

using core::ValidationError;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

double RoundMillis(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

std::optional<std::string> ReadOptionalString(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::int64_t> ReadOptionalInteger(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw ValidationError(std::string("Field '") + key + "' must be an integer");
    }
    return it->get<std::int64_t>();
}

void RequireObject(const json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
}

} // anonymous namespace

std::string FormatTimestamp(const core::TimePoint& timestamp) {
    auto time_t_value = core::Clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// ============================================================================
// RESPONSE VIEWS
// ============================================================================

json ToJson(const core::ContainerRecord& record) {
    json j = {
        {"id", record.id},
        {"status", core::ContainerStatusName(record.status)},
        {"repo_url", record.repo_url},
        {"branch", record.branch},
        {"commit", OptionalString(record.commit)},
        {"created_at", FormatTimestamp(record.created_at)},
        {"expires_at", record.expires_at ? json(FormatTimestamp(*record.expires_at)) : json(nullptr)},
        {"working_directory", record.working_directory}
    };

    if (record.last_command_result) {
        const auto& last = *record.last_command_result;
        j["last_command"] = {
            {"command", last.command},
            {"exit_code", last.exit_code},
            {"timed_out", last.timed_out},
            {"timestamp", FormatTimestamp(last.timestamp)}
        };
    }
    return j;
}

json ToJson(const core::ContainerListing& listing) {
    json containers = json::array();
    for (const auto& record : listing.containers) {
        containers.push_back(ToJson(record));
    }
    return {
        {"containers", containers},
        {"total_count", listing.total_count},
        {"active_count", listing.active_count}
    };
}

json ToJson(const core::CommandResult& result) {
    return {
        {"command", result.command},
        {"exit_code", result.exit_code},
        {"stdout", result.stdout_output},
        {"stderr", result.stderr_output},
        {"elapsed_secs", RoundMillis(result.elapsed_secs)},
        {"timestamp", FormatTimestamp(result.timestamp)},
        {"timed_out", result.timed_out},
        {"output_truncated", result.output_truncated}
    };
}

json ToJson(const core::DirectoryListing& listing) {
    json items = json::array();
    for (const auto& entry : listing.entries) {
        items.push_back({
            {"name", entry.name},
            {"type", core::EntryKindName(entry.kind)},
            {"size", entry.size},
            {"permissions", entry.permissions},
            {"modified_at", entry.modified_at ? json(FormatTimestamp(*entry.modified_at)) : json(nullptr)}
        });
    }
    return {
        {"path", listing.path},
        {"items", items},
        {"total_items", listing.entries.size()}
    };
}

json ToJson(const core::FileContent& content) {
    return {
        {"path", content.path},
        {"content", content.is_binary ? utils::StringUtils::ToBase64(content.content) : content.content},
        {"size", content.size},
        {"encoding", content.is_binary ? "base64" : "utf-8"},
        {"is_binary", content.is_binary}
    };
}

json ToJson(const core::HealthReport& report) {
    return {
        {"status", report.healthy ? "healthy" : "unhealthy"},
        {"version", report.version},
        {"uptime_seconds", RoundMillis(report.uptime_secs)},
        {"total_containers", report.total_containers},
        {"active_containers", report.active_containers},
        {"runtime_available", report.runtime_available},
        {"runtime", report.runtime_name}
    };
}

json ToJson(const core::ReadinessReport& report) {
    json j = {{"status", report.ready ? "ready" : "not ready"}};
    if (!report.reason.empty()) {
        j["reason"] = report.reason;
    }
    return j;
}

json InfoJson(const core::ServiceConfig& config, const std::string& runtime_name) {
    return {
        {"api_name", config.api_name},
        {"api_version", config.version},
        {"runtime", {
            {"name", runtime_name},
            {"image", config.runtime.image},
            {"network_mode", config.runtime.network_mode}
        }},
        {"workspace_directory", config.workspace_directory},
        {"default_command_timeout_secs", config.default_command_timeout.count()},
        {"max_file_size_bytes", config.max_file_size_bytes}
    };
}

json MakeErrorResponse(const std::string& error, const std::string& detail) {
    return {
        {"error", error},
        {"detail", detail},
        {"timestamp", FormatTimestamp(core::Clock::now())}
    };
}

json MakeErrorResponse(const core::SandboxError& error) {
    return MakeErrorResponse(core::ErrorKindName(error.Kind()), error.what());
}

// ============================================================================
// REQUEST PARSING
// ============================================================================

core::CreateRequest ParseCreateRequest(const json& body) {
    RequireObject(body);

    core::CreateRequest request;
    auto repo_url = ReadOptionalString(body, "repo_url");
    if (!repo_url) {
        throw ValidationError("Field 'repo_url' is required");
    }
    request.repo_url = *repo_url;
    request.branch = ReadOptionalString(body, "branch");
    request.commit = ReadOptionalString(body, "commit");
    request.max_runtime_secs = ReadOptionalInteger(body, "max_runtime_secs");
    request.initial_command = ReadOptionalString(body, "initial_command");

    auto env = body.find("env_vars");
    if (env != body.end() && !env->is_null()) {
        if (!env->is_object()) {
            throw ValidationError("Field 'env_vars' must be an object");
        }
        for (const auto& item : env->items()) {
            if (!item.value().is_string()) {
                throw ValidationError("Environment variable '" + item.key() + "' must be a string");
            }
            request.env_vars[item.key()] = item.value().get<std::string>();
        }
    }
    return request;
}

core::ExecuteRequest ParseExecuteRequest(const json& body) {
    RequireObject(body);

    core::ExecuteRequest request;
    auto command = ReadOptionalString(body, "command");
    if (!command) {
        throw ValidationError("Field 'command' is required");
    }
    request.command = *command;
    request.working_directory = ReadOptionalString(body, "working_directory");
    request.timeout_secs = ReadOptionalInteger(body, "timeout_secs");
    return request;
}

} // namespace api
} // namespace repobox
