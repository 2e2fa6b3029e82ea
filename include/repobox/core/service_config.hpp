/**
 * @file service_config.hpp
 * @brief Configuration of the lifecycle manager
 *
 * Values come from, in increasing precedence: built-in defaults, a JSON
 * configuration file, `REPOBOX_*` environment variables and command-line
 * flags (applied by main.cpp).
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <cstddef>

namespace repobox {
namespace core {

/**
 * @struct RuntimeSettings
 * @brief Container engine settings used for every sandbox
 */
struct RuntimeSettings {
    std::string docker_binary{"docker"};         ///< docker CLI (PATH lookup)
    std::string image{"ubuntu:22.04"};           ///< Base image
    std::string network_mode{"bridge"};          ///< "bridge", "none" or a user network
    std::size_t memory_limit_mb{2048};           ///< Memory limit (2GB)
    double cpu_limit{2.0};                       ///< CPU limit (cores)
    int pids_limit{512};                         ///< Process limit
    std::vector<std::string> drop_capabilities{"ALL"};
    std::vector<std::string> add_capabilities{   ///< Needed by apt-get and git
        "CHOWN", "DAC_OVERRIDE", "FOWNER", "SETUID", "SETGID"};
    std::chrono::seconds exec_grace{5};          ///< Host-side slack over the in-sandbox timeout
    std::chrono::seconds control_timeout{60};    ///< Bound for run/inspect/rm calls
};

/**
 * @struct ServiceConfig
 * @brief Complete service configuration
 */
struct ServiceConfig {
    // Identity
    std::string api_name{"Remote Code Docker Deployment API"};
    std::string version{"1.0.0"};

    // Runtime
    RuntimeSettings runtime;

    // Provisioning
    std::string workspace_directory{"/workspace"};   ///< Clone location inside sandboxes
    std::string default_branch{"main"};
    std::string container_prefix{"repo-container"};  ///< Id prefix
    std::string bootstrap_command{                    ///< Run before cloning (sh -c)
        "command -v git >/dev/null 2>&1 || "
        "(apt-get update -qq && DEBIAN_FRONTEND=noninteractive apt-get install -y -qq "
        "--no-install-recommends git ca-certificates >/dev/null)"};
    std::chrono::seconds bootstrap_timeout{300};
    std::chrono::seconds clone_timeout{600};
    std::vector<std::string> allowed_repo_hosts;      ///< Empty = any host
    std::chrono::seconds max_container_runtime{30 * 24 * 3600}; ///< Upper bound for max_runtime_secs

    // Execution
    std::string shell{"bash"};
    std::chrono::seconds default_command_timeout{30};
    std::chrono::seconds max_command_timeout{3600};
    std::chrono::seconds initial_command_timeout{300};
    std::size_t max_output_bytes{16 * 1024 * 1024};
    bool serialize_commands{true};                    ///< One command at a time per sandbox
    std::vector<std::string> allowed_command_prefixes; ///< Empty = unrestricted

    // Filesystem access
    std::size_t max_file_size_bytes{10 * 1024 * 1024};
    std::chrono::seconds probe_timeout{10};

    // Reaper
    std::chrono::seconds reaper_interval{30};

    // Logging
    std::string log_level{"info"};
};

/**
 * @brief Load a configuration file on top of @p base
 *
 * Unknown keys are ignored with a warning. Missing keys keep @p base's value.
 *
 * @throws ValidationError if the file cannot be read or parsed, or a value has the wrong type
 */
ServiceConfig LoadConfigFile(const std::filesystem::path& path, const ServiceConfig& base = ServiceConfig{});

/**
 * @brief Parse configuration from a JSON document string on top of @p base
 * @throws ValidationError on malformed JSON or wrongly typed values
 */
ServiceConfig ParseConfig(const std::string& json_text, const ServiceConfig& base = ServiceConfig{});

/**
 * @brief Apply REPOBOX_* environment variables
 *
 * Recognized: REPOBOX_IMAGE, REPOBOX_NETWORK_MODE, REPOBOX_DOCKER_BINARY,
 * REPOBOX_MEMORY_LIMIT_MB, REPOBOX_CPU_LIMIT, REPOBOX_WORKSPACE,
 * REPOBOX_DEFAULT_BRANCH, REPOBOX_MAX_RUNTIME, REPOBOX_DEFAULT_TIMEOUT, REPOBOX_MAX_TIMEOUT,
 * REPOBOX_REAPER_INTERVAL, REPOBOX_MAX_FILE_SIZE, REPOBOX_ALLOWED_HOSTS
 * (comma separated), REPOBOX_LOG_LEVEL, REPOBOX_DEBUG.
 *
 * @throws ValidationError if a numeric variable does not parse
 */
void ApplyEnvironment(ServiceConfig& config);

/**
 * @brief Reject inconsistent configurations
 * @throws ValidationError naming the first offending field
 */
void ValidateConfig(const ServiceConfig& config);

} // namespace core
} // namespace repobox
