/**
 * @file lean_cli.hpp
 * @brief Provisioning tool that scaffolds workspaces and launches sandboxes
 *
 * The LEAN CLI owns the research image, its volume layout and the notebook
 * server inside it. quantlab only drives three of its commands:
 * `lean --version`, `lean init` and `lean research --detach`.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace quantlab {
namespace sandbox {

/**
 * @struct LaunchRequest
 * @brief Arguments for ProvisioningTool::Launch()
 */
struct LaunchRequest {
    std::filesystem::path workspace;               ///< Directory holding lean.json
    std::filesystem::path project_dir;             ///< Project to open (relative to workspace or absolute)
    int port{8888};                                ///< Host port for the notebook server
    std::map<std::string, std::string> labels;     ///< Labels attached to the sandbox container
    bool detached{true};                           ///< Return once the container is up
};

/**
 * @struct ToolResult
 * @brief Captured outcome of one provisioning command
 */
struct ToolResult {
    int exit_code{0};
    std::string output;   ///< stdout
    std::string error;    ///< stderr
    bool success{false};

    /// stderr if non-empty, else stdout
    const std::string& Message() const { return error.empty() ? output : error; }
};

/**
 * @class ProvisioningTool
 * @brief Interface to the external provisioning CLI
 */
class ProvisioningTool {
public:
    virtual ~ProvisioningTool() = default;

    /**
     * @brief Check the tool is installed
     * @return Version string, or std::nullopt if the tool cannot be run
     */
    virtual std::optional<std::string> VersionCheck() = 0;

    /**
     * @brief Scaffold a workspace (lean.json, data folder)
     * @param organization_id Organization to bind the workspace to, if any
     */
    virtual ToolResult Init(const std::filesystem::path& workspace,
                            const std::optional<std::string>& organization_id) = 0;

    /// Start the research environment for a project
    virtual ToolResult Launch(const LaunchRequest& request) = 0;
};

/**
 * @class LeanCli
 * @brief ProvisioningTool backed by the `lean` executable
 *
 * **Commands issued**:
 * @code
 * lean --version
 * lean init [--organization <id>]                        (cwd = workspace)
 * lean research <project> --port <p> --no-open --detach
 *      --extra-docker-config '{"labels": {...}}'          (cwd = workspace)
 * @endcode
 */
class LeanCli : public ProvisioningTool {
public:
    explicit LeanCli(std::string binary = "lean");

    std::optional<std::string> VersionCheck() override;
    ToolResult Init(const std::filesystem::path& workspace,
                    const std::optional<std::string>& organization_id) override;
    ToolResult Launch(const LaunchRequest& request) override;

    const std::string& GetBinary() const { return binary_; }

private:
    std::string binary_;
};

} // namespace sandbox
} // namespace quantlab
