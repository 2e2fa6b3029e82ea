/**
 * @file main.cpp
 * @brief repobox - Container Lifecycle Manager command-line interface
 *
 * Subcommands:
 * - `serve`  JSON-lines control protocol on stdin/stdout until EOF or a signal
 * - `check`  print the health report and exit (0 when the runtime is reachable)
 * - `run`    one-shot: create a sandbox, run one command, print the result, destroy it
 *
 * Logs always go to stderr so stdout carries only machine-readable output.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "repobox/api/json_codec.hpp"
#include "repobox/api/request_handler.hpp"
#include "repobox/core/errors.hpp"
#include "repobox/core/sandbox_manager.hpp"
#include "repobox/core/service_config.hpp"
#include "repobox/runtime/docker_runtime.hpp"

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <signal.h>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void HandleStopSignal(int) {
    g_stop_requested = true;
}

/**
 * @brief Install SIGINT/SIGTERM handlers without SA_RESTART
 *
 * A blocking read on stdin then fails with EINTR, which ends the serve loop.
 */
void InstallSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void ConfigureLogging() {
    auto logger = spdlog::stderr_color_mt("repobox");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

void SetLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

std::string Dump(const json& value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"repobox - disposable repository sandboxes"};
    app.require_subcommand(1);

    // Global options
    std::string config_path;
    bool verbose = false;
    std::string image;
    std::string network_mode;
    std::string workspace;
    int reaper_interval = 0;
    int default_timeout = 0;
    std::vector<std::string> allowed_hosts;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    auto* image_opt = app.add_option("--image", image, "Base image for sandboxes");
    auto* network_opt = app.add_option("--network", network_mode, "Sandbox network mode (bridge, none, ...)");
    auto* workspace_opt = app.add_option("--workspace", workspace, "Clone location inside sandboxes");
    auto* reaper_opt = app.add_option("--reaper-interval", reaper_interval, "Seconds between expiry sweeps")
        ->check(CLI::PositiveNumber);
    auto* timeout_opt = app.add_option("--default-timeout", default_timeout, "Default command timeout in seconds")
        ->check(CLI::PositiveNumber);
    auto* hosts_opt = app.add_option("--allow-host", allowed_hosts, "Restrict repository hosts (repeatable)");

    auto* serve_cmd = app.add_subcommand("serve", "Serve JSON-lines requests on stdin/stdout");
    auto* check_cmd = app.add_subcommand("check", "Print the health report and exit");

    auto* run_cmd = app.add_subcommand("run", "Create a sandbox, run one command and destroy it");
    std::string run_repo;
    std::string run_branch;
    std::string run_commit;
    std::string run_command;
    int run_timeout = 0;
    run_cmd->add_option("repo_url", run_repo, "Repository to clone")->required();
    run_cmd->add_option("command", run_command, "Shell command to run in the workspace")->required();
    auto* run_branch_opt = run_cmd->add_option("-b,--branch", run_branch, "Branch to check out");
    auto* run_commit_opt = run_cmd->add_option("--commit", run_commit, "Commit to reset to");
    auto* run_timeout_opt = run_cmd->add_option("-t,--timeout", run_timeout, "Command timeout in seconds")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging();

    try {
        // Configuration: defaults < file < environment < flags
        repobox::core::ServiceConfig config;
        if (!config_path.empty()) {
            config = repobox::core::LoadConfigFile(config_path, config);
        }
        repobox::core::ApplyEnvironment(config);

        if (image_opt->count() > 0) config.runtime.image = image;
        if (network_opt->count() > 0) config.runtime.network_mode = network_mode;
        if (workspace_opt->count() > 0) config.workspace_directory = workspace;
        if (reaper_opt->count() > 0) config.reaper_interval = std::chrono::seconds(reaper_interval);
        if (timeout_opt->count() > 0) config.default_command_timeout = std::chrono::seconds(default_timeout);
        if (hosts_opt->count() > 0) config.allowed_repo_hosts = allowed_hosts;
        if (verbose) config.log_level = "debug";

        SetLogLevel(config.log_level);
        repobox::core::ValidateConfig(config);

        repobox::core::SandboxManager manager(
            config, std::make_unique<repobox::runtime::DockerRuntime>(config.runtime));

        if (*check_cmd) {
            auto report = manager.Health();
            std::cout << Dump(repobox::api::ToJson(report)) << std::endl;
            return report.healthy ? 0 : 1;
        }

        InstallSignalHandlers();
        if (!manager.Initialize()) {
            spdlog::warn("Continuing without a reachable runtime");
        }

        if (*serve_cmd) {
            repobox::api::RequestHandler handler(manager);
            handler.Serve(std::cin, std::cout, g_stop_requested);
            manager.Shutdown();
            return 0;
        }

        if (*run_cmd) {
            repobox::core::CreateRequest create;
            create.repo_url = run_repo;
            if (run_branch_opt->count() > 0) create.branch = run_branch;
            if (run_commit_opt->count() > 0) create.commit = run_commit;

            auto record = manager.CreateContainer(create);

            repobox::core::ExecuteRequest execute;
            execute.command = run_command;
            if (run_timeout_opt->count() > 0) execute.timeout_secs = run_timeout;

            auto result = manager.ExecuteCommand(record.id, execute);
            std::cout << Dump(repobox::api::ToJson(result)) << std::endl;

            manager.DeleteContainer(record.id);
            manager.Shutdown();
            return result.exit_code == 0 ? 0 : 2;
        }

        return 0;

    } catch (const repobox::core::SandboxError& e) {
        std::cout << Dump(repobox::api::MakeErrorResponse(e)) << std::endl;
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
