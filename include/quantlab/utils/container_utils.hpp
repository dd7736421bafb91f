/**
 * @file container_utils.hpp
 * @brief Container runtime abstraction for research sandboxes
 *
 * Research sessions talk to their sandbox exclusively through the
 * ContainerRuntime interface: discovering the container (by name, label or
 * published host port), running commands inside it and stopping it. The
 * production implementation drives the docker (or podman) CLI; tests plug in
 * an in-memory runtime.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quantlab {
namespace utils {

/**
 * @enum RuntimeEngine
 * @brief Supported container CLIs
 */
enum class RuntimeEngine {
    DOCKER,   ///< Docker Engine
    PODMAN    ///< Podman (CLI-compatible with docker)
};

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by `ps`
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    NONE,      ///< No network access
    BRIDGE,    ///< Default bridge network (needed for published ports)
    HOST       ///< Host network
};

/**
 * @struct ContainerConfig
 * @brief Settings for a container started directly by the runtime
 *
 * Defaults describe a research sandbox: bridge networking so the notebook
 * server port can be published, 2 GB of memory and one CPU.
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                                    ///< Container name
    std::string image{"quantconnect/research:latest"};   ///< Image to run
    std::vector<std::string> command;                    ///< Overrides the image command when set

    // Resource Limits
    std::size_t memory_limit_mb{2048};   ///< Memory limit (2GB)
    double cpu_limit{1.0};               ///< CPU limit (1 core)

    // Network Settings
    NetworkMode network_mode{NetworkMode::BRIDGE};   ///< Network mode
    std::map<int, int> port_mappings;                ///< Host port -> container port

    // Filesystem Settings
    std::map<std::filesystem::path, std::filesystem::path> mounts;   ///< Host -> container bind mounts
    std::filesystem::path working_dir;                               ///< Working directory (empty = image default)

    // Metadata
    std::map<std::string, std::string> environment_vars;   ///< Environment variables
    std::map<std::string, std::string> labels;             ///< Container labels

    // Lifecycle
    bool auto_remove{true};   ///< Remove the container once it stops
};

/**
 * @struct ContainerInfo
 * @brief One row of the runtime's container listing
 */
struct ContainerInfo {
    std::string id;                              ///< Container ID (short form)
    std::string name;                            ///< Container name
    std::string image;                           ///< Image name
    ContainerState state{ContainerState::UNKNOWN};
    std::map<std::string, std::string> labels;   ///< Container labels
    std::map<int, int> port_mappings;            ///< Host port -> container port
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in a container
 */
struct ContainerExecResult {
    int exit_code{0};                        ///< Exit code of the command (or the CLI)
    std::string stdout_output;               ///< Standard output
    std::string stderr_output;               ///< Standard error
    std::chrono::milliseconds duration{0};   ///< Execution duration
    bool success{false};                     ///< exit_code == 0
    bool sandbox_missing{false};             ///< Container no longer exists or is not running
    bool timed_out{false};                   ///< Client was killed when the time limit passed
};

/**
 * @class ContainerRuntime
 * @brief Interface to the engine that hosts research sandboxes
 *
 * Implementations must be safe to call from several threads at once.
 *
 * **Usage Example**:
 * @code
 * std::shared_ptr<ContainerRuntime> runtime = std::make_shared<DockerRuntime>();
 * auto matches = runtime->FindByLabel("quantlab.session_id", "default");
 * if (!matches.empty()) {
 *     auto result = runtime->Exec(matches.front().id, {"python3", "--version"}, "/LeanCLI",
 *                                 std::chrono::seconds(30));
 * }
 * @endcode
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief List running containers
     * @return Containers known to the runtime (empty on failure)
     */
    virtual std::vector<ContainerInfo> List() = 0;

    /**
     * @brief Look up a container by exact name or ID
     */
    virtual std::optional<ContainerInfo> GetByName(const std::string& name_or_id) = 0;

    /**
     * @brief Find containers carrying a label with the given value
     *
     * Default implementation filters List().
     */
    virtual std::vector<ContainerInfo> FindByLabel(const std::string& key, const std::string& value);

    /**
     * @brief Find the container publishing a given host port
     *
     * Default implementation filters List().
     */
    virtual std::optional<ContainerInfo> FindByHostPort(int host_port);

    /**
     * @brief Create and start a detached container
     * @return Container ID
     * @throws std::runtime_error if the runtime refuses to start it
     */
    virtual std::string CreateAndRun(const ContainerConfig& config) = 0;

    /**
     * @brief Run a command inside a container and wait for it
     * @param handle Container name or ID
     * @param command Program and arguments
     * @param working_dir Directory inside the container
     * @param time_limit Host-side bound on the call (zero = wait indefinitely);
     *        on expiry the result has timed_out set
     */
    virtual ContainerExecResult Exec(const std::string& handle,
                                     const std::vector<std::string>& command,
                                     const std::string& working_dir,
                                     std::chrono::milliseconds time_limit) = 0;

    /// Stop gracefully, waiting up to @p timeout before the runtime kills it
    virtual bool Stop(const std::string& handle, std::chrono::seconds timeout) = 0;

    /// Kill immediately
    virtual bool Kill(const std::string& handle) = 0;
};

/**
 * @class DockerRuntime
 * @brief ContainerRuntime backed by the docker / podman CLI
 *
 * Every operation shells out to the runtime binary via RunProcess; no
 * daemon socket access is needed beyond what the CLI itself uses.
 */
class DockerRuntime : public ContainerRuntime {
public:
    /**
     * @brief Construct runtime wrapper
     * @param engine Which CLI to drive
     * @throws std::runtime_error if the CLI is not available
     */
    explicit DockerRuntime(RuntimeEngine engine = RuntimeEngine::DOCKER);

    /**
     * @brief Check if container runtime is available
     * @param engine Runtime to check
     * @return true if `<engine> --version` succeeds
     */
    static bool IsRuntimeAvailable(RuntimeEngine engine = RuntimeEngine::DOCKER);

    /**
     * @brief Get runtime version string
     * @return Version like "24.0.7", or "unknown"
     */
    static std::string GetRuntimeVersion(RuntimeEngine engine = RuntimeEngine::DOCKER);

    std::vector<ContainerInfo> List() override;
    std::optional<ContainerInfo> GetByName(const std::string& name_or_id) override;
    std::vector<ContainerInfo> FindByLabel(const std::string& key, const std::string& value) override;
    std::string CreateAndRun(const ContainerConfig& config) override;
    ContainerExecResult Exec(const std::string& handle,
                             const std::vector<std::string>& command,
                             const std::string& working_dir,
                             std::chrono::milliseconds time_limit) override;
    bool Stop(const std::string& handle, std::chrono::seconds timeout) override;
    bool Kill(const std::string& handle) override;

    /***************************************************************************
     * Parsing helpers (public for testing)
     ***************************************************************************/

    /**
     * @brief Parse `ps --format '{{json .}}'` output
     *
     * One JSON object per line. Malformed lines are skipped with a warning.
     */
    static std::vector<ContainerInfo> ParseListOutput(const std::string& output);

    /**
     * @brief Parse the "Labels" column ("k1=v1,k2=v2")
     */
    static std::map<std::string, std::string> ParseLabels(const std::string& labels);

    /**
     * @brief Parse the "Ports" column
     *
     * Example: "0.0.0.0:8888->8888/tcp, :::8888->8888/tcp" yields {8888: 8888}.
     * Exposed-but-unpublished entries ("8888/tcp") are ignored.
     */
    static std::map<int, int> ParsePorts(const std::string& ports);

    /// Map runtime state strings ("running", "exited", ...) to ContainerState
    static ContainerState ParseState(const std::string& state_str);

    static std::string StateToString(ContainerState state);

    /// Build the argument list for `run` (without the binary name)
    static std::vector<std::string> BuildRunCommand(const ContainerConfig& config);

    /// Whether CLI error text means the target container is gone or stopped
    static bool IndicatesMissingContainer(const std::string& error_text);

private:
    ContainerExecResult ExecuteDockerCommand(
        const std::vector<std::string>& args,
        std::optional<std::chrono::milliseconds> time_limit = std::nullopt) const;

    static std::string BinaryName(RuntimeEngine engine);

    RuntimeEngine engine_;
    std::string binary_;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithPort(int host_port, int container_port);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                                const std::filesystem::path& container);
    ContainerBuilder& WithEnvironment(const std::string& key,
                                      const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& WithWorkingDir(const std::filesystem::path& dir);
    ContainerBuilder& WithAutoRemove(bool auto_remove = true);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace quantlab
