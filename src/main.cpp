/**
 * @file main.cpp
 * @brief quantlab research sandbox server - Command-line interface
 *
 * Entry point for the quantlab tool server. Loads configuration, wires the
 * container runtime, Lean CLI and audit sink into a SessionManager, then
 * serves JSON tool requests line by line: one request object per line on
 * stdin, one response object per line on stdout. Logs go to stderr (and
 * optionally a file) so stdout carries nothing but responses.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "quantlab/core/config.hpp"
#include "quantlab/core/session_manager.hpp"
#include "quantlab/sandbox/lean_cli.hpp"
#include "quantlab/security/security_logger.hpp"
#include "quantlab/tools/tool_dispatcher.hpp"
#include "quantlab/utils/container_utils.hpp"
#include "quantlab/utils/logging_utils.hpp"

#include <chrono>
#include <iostream>
#include <string>

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"quantlab - sandboxed QuantBook research sessions"};
    app.footer("\nRequests are read from stdin as JSON lines, e.g.\n"
               "  {\"id\": 1, \"tool\": \"initialize_quantbook\", \"arguments\": {}}");

    std::string config_path;
    std::size_t max_sessions = 0;
    int session_timeout = 0;
    int cleanup_interval = 0;
    int base_port = 0;
    std::string log_level;
    std::string log_file;
    std::string launcher;
    std::string image;
    std::string engine;
    std::string lean_binary;
    bool list_tools = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    auto* max_sessions_opt = app.add_option("--max-sessions", max_sessions, "Maximum concurrent sessions")
        ->check(CLI::PositiveNumber);
    auto* timeout_opt = app.add_option("--session-timeout", session_timeout, "Idle session timeout in seconds")
        ->check(CLI::PositiveNumber);
    auto* cleanup_opt = app.add_option("--cleanup-interval", cleanup_interval, "Expiry sweep interval in seconds")
        ->check(CLI::PositiveNumber);
    auto* port_opt = app.add_option("--base-port", base_port, "First host port handed to sessions")
        ->check(CLI::Range(1, 65535));
    auto* level_opt = app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    auto* file_opt = app.add_option("--log-file", log_file, "Also write logs to this file");
    auto* launcher_opt = app.add_option("--launcher", launcher, "Sandbox launcher (lean, direct)");
    auto* image_opt = app.add_option("--image", image, "Research image for the direct launcher");
    auto* engine_opt = app.add_option("--engine", engine, "Container engine (docker, podman)");
    auto* lean_opt = app.add_option("--lean-binary", lean_binary, "Lean CLI executable");
    app.add_flag("--list-tools", list_tools, "Print the available tool names and exit");

    CLI11_PARSE(app, argc, argv);

    quantlab::core::QuantlabConfig config;

    try {
        if (!config_path.empty()) {
            quantlab::core::LoadConfigFile(config, config_path);
        }
        quantlab::core::ApplyEnvironment(config);

        if (max_sessions_opt->count() > 0) config.manager.max_sessions = max_sessions;
        if (timeout_opt->count() > 0) config.manager.session_timeout = std::chrono::seconds(session_timeout);
        if (cleanup_opt->count() > 0) config.manager.cleanup_interval = std::chrono::seconds(cleanup_interval);
        if (port_opt->count() > 0) config.manager.base_port = base_port;
        if (level_opt->count() > 0) config.log_level = log_level;
        if (file_opt->count() > 0) config.log_file = std::filesystem::path(log_file);
        if (launcher_opt->count() > 0) {
            config.manager.default_params.launcher = quantlab::core::ParseLauncher(launcher);
        }
        if (image_opt->count() > 0) config.manager.default_params.image = image;
        if (engine_opt->count() > 0) config.container_engine = engine;
        if (lean_opt->count() > 0) config.lean_binary = lean_binary;

        quantlab::core::ValidateConfig(config);
        quantlab::utils::ConfigureLogging(config.log_level, config.log_file);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    try {
        spdlog::info("[INIT] Starting quantlab (launcher: {}, engine: {})",
                     quantlab::core::LauncherToString(config.manager.default_params.launcher),
                     config.container_engine);

        auto engine_kind = config.container_engine == "podman"
            ? quantlab::utils::RuntimeEngine::PODMAN
            : quantlab::utils::RuntimeEngine::DOCKER;

        std::shared_ptr<quantlab::utils::ContainerRuntime> runtime;
        try {
            runtime = std::make_shared<quantlab::utils::DockerRuntime>(engine_kind);
        } catch (const std::runtime_error& e) {
            spdlog::error("[ERROR] Container runtime unavailable: {}", e.what());
            return 1;
        }

        quantlab::core::SessionDependencies deps;
        deps.runtime = runtime;
        deps.provisioning = std::make_shared<quantlab::sandbox::LeanCli>(config.lean_binary);
        deps.audit = std::make_shared<quantlab::security::SecurityLogger>();
        deps.guard = config.guard;

        quantlab::core::SessionManager manager(config.manager, deps);
        quantlab::tools::ToolDispatcher dispatcher(manager);

        if (list_tools) {
            for (const auto& name : dispatcher.ToolNames()) {
                std::cout << name << "\n";
            }
            return 0;
        }

        manager.Start();
        spdlog::info("[READY] Serving {} tools on stdin", dispatcher.ToolNames().size());

        std::size_t handled = quantlab::tools::ServeRequests(dispatcher, std::cin, std::cout);
        spdlog::info("[SHUTDOWN] Input closed after {} request(s)", handled);

        manager.Stop();
        spdlog::info("[DONE] quantlab stopped");
        return 0;

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
