/**
 * @file service_config.cpp
 * @brief JSON file and environment loading for ServiceConfig
 *
 * **File layout** (every key optional):
 * ```json
 * {
 *   "runtime": { "image": "ubuntu:22.04", "network_mode": "bridge",
 *                "memory_limit_mb": 2048, "cpu_limit": 2.0 },
 *   "workspace_directory": "/workspace",
 *   "default_command_timeout_secs": 30,
 *   "reaper_interval_secs": 30,
 *   "allowed_repo_hosts": ["github.com"]
 * }
 * ```
 *
 * @date 2025
 */

#include "repobox/core/service_config.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/utils/string_utils.hpp"
#include "repobox/utils/path_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace repobox {
namespace core {

namespace {

template <typename T>
void ReadField(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void ReadSeconds(const json& object, const char* key, std::chrono::seconds& target) {
    std::int64_t value = target.count();
    ReadField(object, key, value);
    target = std::chrono::seconds(value);
}

void WarnUnknownKeys(const json& object, const std::set<std::string>& known, const std::string& scope) {
    for (const auto& item : object.items()) {
        if (known.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown configuration key '{}{}'", scope, item.key());
        }
    }
}

void ApplyRuntimeSection(const json& section, RuntimeSettings& runtime) {
    if (!section.is_object()) {
        throw ValidationError("Configuration key 'runtime' must be an object");
    }
    WarnUnknownKeys(section,
                    {"docker_binary", "image", "network_mode", "memory_limit_mb", "cpu_limit",
                     "pids_limit", "drop_capabilities", "add_capabilities", "exec_grace_secs",
                     "control_timeout_secs"},
                    "runtime.");

    ReadField(section, "docker_binary", runtime.docker_binary);
    ReadField(section, "image", runtime.image);
    ReadField(section, "network_mode", runtime.network_mode);
    ReadField(section, "memory_limit_mb", runtime.memory_limit_mb);
    ReadField(section, "cpu_limit", runtime.cpu_limit);
    ReadField(section, "pids_limit", runtime.pids_limit);
    ReadField(section, "drop_capabilities", runtime.drop_capabilities);
    ReadField(section, "add_capabilities", runtime.add_capabilities);
    ReadSeconds(section, "exec_grace_secs", runtime.exec_grace);
    ReadSeconds(section, "control_timeout_secs", runtime.control_timeout);
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::int64_t ParseInteger(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ValidationError(std::string("Environment variable ") + name +
                              " is not an integer: '" + value + "'");
    }
}

double ParseDouble(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ValidationError(std::string("Environment variable ") + name +
                              " is not a number: '" + value + "'");
    }
}

bool ParseBool(const std::string& value) {
    auto lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

} // anonymous namespace

// ============================================================================
// FILE LOADING
// ============================================================================

ServiceConfig ParseConfig(const std::string& json_text, const ServiceConfig& base) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Malformed configuration: ") + e.what());
    }
    if (!document.is_object()) {
        throw ValidationError("Configuration root must be a JSON object");
    }

    WarnUnknownKeys(document,
                    {"api_name", "version", "runtime", "workspace_directory", "default_branch",
                     "container_prefix", "bootstrap_command", "bootstrap_timeout_secs",
                     "clone_timeout_secs", "allowed_repo_hosts", "max_container_runtime_secs", "shell",
                     "default_command_timeout_secs", "max_command_timeout_secs",
                     "initial_command_timeout_secs", "max_output_bytes", "serialize_commands",
                     "allowed_command_prefixes", "max_file_size_bytes", "probe_timeout_secs",
                     "reaper_interval_secs", "log_level"},
                    "");

    ServiceConfig config = base;

    ReadField(document, "api_name", config.api_name);
    ReadField(document, "version", config.version);
    if (document.contains("runtime")) {
        ApplyRuntimeSection(document.at("runtime"), config.runtime);
    }

    ReadField(document, "workspace_directory", config.workspace_directory);
    ReadField(document, "default_branch", config.default_branch);
    ReadField(document, "container_prefix", config.container_prefix);
    ReadField(document, "bootstrap_command", config.bootstrap_command);
    ReadSeconds(document, "bootstrap_timeout_secs", config.bootstrap_timeout);
    ReadSeconds(document, "clone_timeout_secs", config.clone_timeout);
    ReadField(document, "allowed_repo_hosts", config.allowed_repo_hosts);
    ReadSeconds(document, "max_container_runtime_secs", config.max_container_runtime);

    ReadField(document, "shell", config.shell);
    ReadSeconds(document, "default_command_timeout_secs", config.default_command_timeout);
    ReadSeconds(document, "max_command_timeout_secs", config.max_command_timeout);
    ReadSeconds(document, "initial_command_timeout_secs", config.initial_command_timeout);
    ReadField(document, "max_output_bytes", config.max_output_bytes);
    ReadField(document, "serialize_commands", config.serialize_commands);
    ReadField(document, "allowed_command_prefixes", config.allowed_command_prefixes);

    ReadField(document, "max_file_size_bytes", config.max_file_size_bytes);
    ReadSeconds(document, "probe_timeout_secs", config.probe_timeout);
    ReadSeconds(document, "reaper_interval_secs", config.reaper_interval);
    ReadField(document, "log_level", config.log_level);

    return config;
}

ServiceConfig LoadConfigFile(const std::filesystem::path& path, const ServiceConfig& base) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loaded configuration file: {}", path.string());
    return ParseConfig(buffer.str(), base);
}

// ============================================================================
// ENVIRONMENT OVERRIDES
// ============================================================================

void ApplyEnvironment(ServiceConfig& config) {
    if (auto value = GetEnv("REPOBOX_DOCKER_BINARY")) {
        config.runtime.docker_binary = *value;
    }
    if (auto value = GetEnv("REPOBOX_IMAGE")) {
        config.runtime.image = *value;
    }
    if (auto value = GetEnv("REPOBOX_NETWORK_MODE")) {
        config.runtime.network_mode = *value;
    }
    if (auto value = GetEnv("REPOBOX_MEMORY_LIMIT_MB")) {
        config.runtime.memory_limit_mb =
            static_cast<std::size_t>(ParseInteger("REPOBOX_MEMORY_LIMIT_MB", *value));
    }
    if (auto value = GetEnv("REPOBOX_CPU_LIMIT")) {
        config.runtime.cpu_limit = ParseDouble("REPOBOX_CPU_LIMIT", *value);
    }
    if (auto value = GetEnv("REPOBOX_WORKSPACE")) {
        config.workspace_directory = *value;
    }
    if (auto value = GetEnv("REPOBOX_DEFAULT_BRANCH")) {
        config.default_branch = *value;
    }
    if (auto value = GetEnv("REPOBOX_MAX_RUNTIME")) {
        config.max_container_runtime =
            std::chrono::seconds(ParseInteger("REPOBOX_MAX_RUNTIME", *value));
    }
    if (auto value = GetEnv("REPOBOX_DEFAULT_TIMEOUT")) {
        config.default_command_timeout =
            std::chrono::seconds(ParseInteger("REPOBOX_DEFAULT_TIMEOUT", *value));
    }
    if (auto value = GetEnv("REPOBOX_MAX_TIMEOUT")) {
        config.max_command_timeout =
            std::chrono::seconds(ParseInteger("REPOBOX_MAX_TIMEOUT", *value));
    }
    if (auto value = GetEnv("REPOBOX_REAPER_INTERVAL")) {
        config.reaper_interval =
            std::chrono::seconds(ParseInteger("REPOBOX_REAPER_INTERVAL", *value));
    }
    if (auto value = GetEnv("REPOBOX_MAX_FILE_SIZE")) {
        config.max_file_size_bytes =
            static_cast<std::size_t>(ParseInteger("REPOBOX_MAX_FILE_SIZE", *value));
    }
    if (auto value = GetEnv("REPOBOX_ALLOWED_HOSTS")) {
        config.allowed_repo_hosts.clear();
        for (const auto& host : utils::StringUtils::Split(*value, ',')) {
            auto trimmed = utils::StringUtils::Trim(host);
            if (!trimmed.empty()) {
                config.allowed_repo_hosts.push_back(utils::StringUtils::ToLower(trimmed));
            }
        }
    }
    if (auto value = GetEnv("REPOBOX_LOG_LEVEL")) {
        config.log_level = *value;
    }
    if (auto value = GetEnv("REPOBOX_DEBUG")) {
        if (ParseBool(*value)) {
            config.log_level = "debug";
        }
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const ServiceConfig& config) {
    if (config.runtime.docker_binary.empty()) {
        throw ValidationError("runtime.docker_binary must not be empty");
    }
    if (config.runtime.image.empty()) {
        throw ValidationError("runtime.image must not be empty");
    }
    if (config.runtime.network_mode.empty() || config.runtime.network_mode == "host") {
        throw ValidationError("runtime.network_mode must be set and must not be 'host'");
    }
    if (config.runtime.memory_limit_mb == 0 || config.runtime.cpu_limit <= 0.0 ||
        config.runtime.pids_limit <= 0) {
        throw ValidationError("runtime resource limits must be positive");
    }
    if (config.workspace_directory.empty() || config.workspace_directory.front() != '/' ||
        utils::PathUtils::Normalize(config.workspace_directory) == "/") {
        throw ValidationError("workspace_directory must be an absolute path below '/'");
    }
    if (!utils::StringUtils::IsGitRefName(config.default_branch)) {
        throw ValidationError("default_branch is not a valid branch name: " + config.default_branch);
    }
    if (config.container_prefix.empty()) {
        throw ValidationError("container_prefix must not be empty");
    }
    if (config.max_container_runtime.count() <= 0) {
        throw ValidationError("max_container_runtime must be positive");
    }
    if (config.shell.empty()) {
        throw ValidationError("shell must not be empty");
    }
    if (config.default_command_timeout.count() <= 0 ||
        config.max_command_timeout < config.default_command_timeout) {
        throw ValidationError("default_command_timeout must be positive and not above max_command_timeout");
    }
    if (config.initial_command_timeout.count() <= 0 || config.clone_timeout.count() <= 0 ||
        config.bootstrap_timeout.count() <= 0 || config.probe_timeout.count() <= 0) {
        throw ValidationError("timeouts must be positive");
    }
    if (config.reaper_interval.count() <= 0) {
        throw ValidationError("reaper_interval must be positive");
    }
    if (config.max_file_size_bytes == 0 || config.max_output_bytes <= config.max_file_size_bytes) {
        throw ValidationError("max_output_bytes must exceed max_file_size_bytes, which must be positive");
    }
}

} // namespace core
} // namespace repobox
