/**
 * @file lean_cli.cpp
 * @brief Lean CLI wrapper used to scaffold and launch research environments
 *
 * Commands run inside the workspace directory:
 * ```
 * lean --version
 * lean init [--organization <id>]
 * lean research Research --port <port> --no-open --detach \
 *     --extra-docker-config '{"labels": {"quantlab.session_id": "<id>", ...}}'
 * ```
 * The labels let the session find its container deterministically even
 * when the launch output does not name it.
 *
 * @date 2025
 */

#include "quantlab/sandbox/lean_cli.hpp"
#include "quantlab/utils/process_utils.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace quantlab {
namespace sandbox {

namespace {

ToolResult ToToolResult(const utils::CommandResult& result) {
    ToolResult tool_result;
    tool_result.exit_code = result.exit_code;
    tool_result.output = result.output;
    tool_result.error = result.error;
    tool_result.success = result.Succeeded();
    return tool_result;
}

} // anonymous namespace

LeanCli::LeanCli(std::string binary)
    : binary_(std::move(binary)) {
}

std::optional<std::string> LeanCli::VersionCheck() {
    auto result = utils::RunProcess({binary_, "--version"});
    if (!result.Succeeded()) {
        spdlog::debug("{} --version failed: {}", binary_, utils::StringUtils::Trim(result.error));
        return std::nullopt;
    }
    return utils::StringUtils::Trim(result.output);
}

ToolResult LeanCli::Init(const std::filesystem::path& workspace,
                         const std::optional<std::string>& organization_id) {
    std::vector<std::string> argv = {binary_, "init"};
    if (organization_id && !organization_id->empty()) {
        argv.push_back("--organization");
        argv.push_back(*organization_id);
    }

    spdlog::info("Initializing LEAN workspace: {}", workspace.string());

    utils::ProcessOptions options;
    options.working_dir = workspace;
    return ToToolResult(utils::RunProcess(argv, options));
}

ToolResult LeanCli::Launch(const LaunchRequest& request) {
    std::vector<std::string> argv = {
        binary_, "research", request.project_dir.string(),
        "--port", std::to_string(request.port),
        "--no-open"
    };
    if (request.detached) {
        argv.push_back("--detach");
    }
    if (!request.labels.empty()) {
        nlohmann::json docker_config;
        docker_config["labels"] = request.labels;
        argv.push_back("--extra-docker-config");
        argv.push_back(docker_config.dump());
    }

    spdlog::info("Starting research environment: {}", utils::FormatCommandLine(argv));

    utils::ProcessOptions options;
    options.working_dir = request.workspace;
    return ToToolResult(utils::RunProcess(argv, options));
}

} // namespace sandbox
} // namespace quantlab
