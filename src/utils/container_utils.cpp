/**
 * @file container_utils.cpp
 * @brief docker / podman CLI implementation of ContainerRuntime
 *
 * **Discovery**:
 * Container listings come from `ps --format '{{json .}}'`, one JSON object
 * per line. Labels and published ports are flattened strings in that output
 * and are parsed here:
 * ```
 * {"ID":"3f2a..","Names":"lean_cli_research","Labels":"quantlab.session_id=default",
 *  "Ports":"0.0.0.0:8888->8888/tcp","State":"running",...}
 * ```
 *
 * **Missing sandboxes**:
 * `exec` against a removed or stopped container fails inside the CLI before
 * any command runs. Those failures are flagged via
 * ContainerExecResult::sandbox_missing so callers can tell them apart from
 * a command that ran and exited non-zero.
 *
 * @date 2025
 */

#include "quantlab/utils/container_utils.hpp"
#include "quantlab/utils/process_utils.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace quantlab {
namespace utils {

// ============================================================================
// DEFAULT DISCOVERY (INTERFACE)
// ============================================================================

std::vector<ContainerInfo> ContainerRuntime::FindByLabel(const std::string& key,
                                                         const std::string& value) {
    std::vector<ContainerInfo> matches;
    for (auto& info : List()) {
        auto it = info.labels.find(key);
        if (it != info.labels.end() && it->second == value) {
            matches.push_back(std::move(info));
        }
    }
    return matches;
}

std::optional<ContainerInfo> ContainerRuntime::FindByHostPort(int host_port) {
    for (auto& info : List()) {
        if (info.port_mappings.count(host_port) > 0) {
            return info;
        }
    }
    return std::nullopt;
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

DockerRuntime::DockerRuntime(RuntimeEngine engine)
    : engine_(engine), binary_(BinaryName(engine)) {
    if (!IsRuntimeAvailable(engine)) {
        throw std::runtime_error("Container runtime not available: " + binary_);
    }
    spdlog::info("Container runtime: {} {}", binary_, GetRuntimeVersion(engine));
}

std::string DockerRuntime::BinaryName(RuntimeEngine engine) {
    switch (engine) {
        case RuntimeEngine::PODMAN: return "podman";
        case RuntimeEngine::DOCKER:
        default:
            return "docker";
    }
}

bool DockerRuntime::IsRuntimeAvailable(RuntimeEngine engine) {
    try {
        return RunProcess({BinaryName(engine), "--version"}).Succeeded();
    }
    catch (const std::exception& e) {
        spdlog::warn("Runtime check failed: {}", e.what());
        return false;
    }
}

std::string DockerRuntime::GetRuntimeVersion(RuntimeEngine engine) {
    auto result = RunProcess({BinaryName(engine), "--version"});
    if (result.Succeeded()) {
        // Extract version number (matches x.y.z format)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(result.output, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.output);
    }

    return "unknown";
}

// ============================================================================
// DISCOVERY
// ============================================================================

std::vector<ContainerInfo> DockerRuntime::List() {
    auto result = ExecuteDockerCommand({"ps", "--format", "{{json .}}"});
    if (!result.success) {
        spdlog::warn("Failed to list containers: {}", StringUtils::Trim(result.stderr_output));
        return {};
    }
    return ParseListOutput(result.stdout_output);
}

std::optional<ContainerInfo> DockerRuntime::GetByName(const std::string& name_or_id) {
    for (auto& info : List()) {
        if (info.name == name_or_id || info.id == name_or_id ||
            (name_or_id.size() >= 12 && StringUtils::StartsWith(name_or_id, info.id))) {
            return info;
        }
    }
    return std::nullopt;
}

std::vector<ContainerInfo> DockerRuntime::FindByLabel(const std::string& key,
                                                      const std::string& value) {
    auto result = ExecuteDockerCommand({
        "ps",
        "--filter", "label=" + key + "=" + value,
        "--format", "{{json .}}"
    });
    if (!result.success) {
        spdlog::warn("Label lookup failed: {}", StringUtils::Trim(result.stderr_output));
        return {};
    }
    return ParseListOutput(result.stdout_output);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerRuntime::CreateAndRun(const ContainerConfig& config) {
    spdlog::info("Creating container: {} ({})", config.name, config.image);

    auto result = ExecuteDockerCommand(BuildRunCommand(config));
    if (!result.success) {
        throw std::runtime_error("Failed to start container " + config.name + ": " +
                                 StringUtils::Trim(result.stderr_output));
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    spdlog::info("Container started: {}", container_id);
    return container_id;
}

ContainerExecResult DockerRuntime::Exec(const std::string& handle,
                                        const std::vector<std::string>& command,
                                        const std::string& working_dir,
                                        std::chrono::milliseconds time_limit) {
    std::vector<std::string> args = {"exec", "-i"};
    if (!working_dir.empty()) {
        args.push_back("-w");
        args.push_back(working_dir);
    }
    args.push_back(handle);
    args.insert(args.end(), command.begin(), command.end());

    auto start_time = std::chrono::steady_clock::now();
    std::optional<std::chrono::milliseconds> limit;
    if (time_limit.count() > 0) {
        limit = time_limit;
    }

    auto exec_result = ExecuteDockerCommand(args, limit);
    exec_result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (!exec_result.success && IndicatesMissingContainer(exec_result.stderr_output)) {
        exec_result.sandbox_missing = true;
    }

    return exec_result;
}

bool DockerRuntime::Stop(const std::string& handle, std::chrono::seconds timeout) {
    spdlog::info("Stopping container: {} (timeout: {}s)", handle, timeout.count());

    auto result = ExecuteDockerCommand({
        "stop",
        "--time", std::to_string(timeout.count()),
        handle
    });

    if (!result.success) {
        spdlog::warn("Failed to stop container {}: {}", handle,
                     StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

bool DockerRuntime::Kill(const std::string& handle) {
    spdlog::warn("Killing container: {}", handle);

    auto result = ExecuteDockerCommand({"kill", handle});
    if (!result.success) {
        spdlog::error("Failed to kill container {}: {}", handle,
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

// ============================================================================
// PARSING
// ============================================================================

std::vector<ContainerInfo> DockerRuntime::ParseListOutput(const std::string& output) {
    std::vector<ContainerInfo> containers;

    for (const auto& raw_line : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw_line);
        if (line.empty()) continue;

        try {
            json j = json::parse(line);

            ContainerInfo info;
            info.id = j.value("ID", "");
            info.name = j.value("Names", "");
            info.image = j.value("Image", "");
            info.state = ParseState(j.value("State", ""));
            info.labels = ParseLabels(j.value("Labels", ""));
            info.port_mappings = ParsePorts(j.value("Ports", ""));

            containers.push_back(std::move(info));
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

std::map<std::string, std::string> DockerRuntime::ParseLabels(const std::string& labels) {
    std::map<std::string, std::string> result;
    for (const auto& pair : StringUtils::Split(labels, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            result[StringUtils::Trim(pair)] = "";
        } else {
            result[StringUtils::Trim(pair.substr(0, eq))] = pair.substr(eq + 1);
        }
    }
    return result;
}

std::map<int, int> DockerRuntime::ParsePorts(const std::string& ports) {
    std::map<int, int> result;

    for (const auto& raw_entry : StringUtils::Split(ports, ',')) {
        std::string entry = StringUtils::Trim(raw_entry);
        auto arrow = entry.find("->");
        if (arrow == std::string::npos) {
            continue;  // Exposed but not published
        }

        std::string host_side = entry.substr(0, arrow);
        std::string container_side = entry.substr(arrow + 2);

        auto colon = host_side.rfind(':');
        std::string host_port = colon == std::string::npos ? host_side : host_side.substr(colon + 1);
        std::string container_port = container_side.substr(0, container_side.find('/'));

        // Port ranges ("8000-8001") are not used by research sandboxes
        if (host_port.find('-') != std::string::npos ||
            container_port.find('-') != std::string::npos) {
            continue;
        }

        try {
            result[std::stoi(host_port)] = std::stoi(container_port);
        }
        catch (const std::exception&) {
            spdlog::debug("Ignoring unparseable port mapping: {}", entry);
        }
    }

    return result;
}

ContainerState DockerRuntime::ParseState(const std::string& state_str) {
    std::string state = StringUtils::ToLower(state_str);
    if (state == "created") return ContainerState::CREATED;
    if (state == "running") return ContainerState::RUNNING;
    if (state == "restarting") return ContainerState::RUNNING;
    if (state == "paused") return ContainerState::PAUSED;
    if (state == "exited") return ContainerState::EXITED;
    if (state == "removing") return ContainerState::EXITED;
    if (state == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string DockerRuntime::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED:  return "paused";
        case ContainerState::EXITED:  return "exited";
        case ContainerState::DEAD:    return "dead";
        default: return "unknown";
    }
}

bool DockerRuntime::IndicatesMissingContainer(const std::string& error_text) {
    return StringUtils::ContainsIgnoreCase(error_text, "No such container") ||
           StringUtils::ContainsIgnoreCase(error_text, "is not running") ||
           StringUtils::ContainsIgnoreCase(error_text, "no container with name or ID");
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult DockerRuntime::ExecuteDockerCommand(
    const std::vector<std::string>& args,
    std::optional<std::chrono::milliseconds> time_limit) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    ProcessOptions options;
    options.timeout = time_limit;
    auto cmd_result = RunProcess(argv, options);

    ContainerExecResult exec_result;
    exec_result.exit_code = cmd_result.exit_code;
    exec_result.stdout_output = cmd_result.output;
    exec_result.stderr_output = cmd_result.error;
    exec_result.success = cmd_result.Succeeded();
    exec_result.timed_out = cmd_result.timed_out;
    if (cmd_result.timed_out) {
        exec_result.stderr_output += "\n" + binary_ + " " + args.front() + " exceeded " +
                                     std::to_string(time_limit->count()) + "ms and was killed";
    }

    return exec_result;
}

std::vector<std::string> DockerRuntime::BuildRunCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    if (config.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::HOST:
            args.push_back("--network");
            args.push_back("host");
            break;
        case NetworkMode::BRIDGE:
        default:
            break;
    }

    for (const auto& [host_port, container_port] : config.port_mappings) {
        args.push_back("-p");
        args.push_back(std::to_string(host_port) + ":" + std::to_string(container_port));
    }

    for (const auto& [host_path, container_path] : config.mounts) {
        args.push_back("-v");
        args.push_back(host_path.string() + ":" + container_path.string());
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir.string());
    }

    if (config.auto_remove) {
        args.push_back("--rm");
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

// ============================================================================
// CONTAINER BUILDER
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPort(int host_port, int container_port) {
    config_.port_mappings[host_port] = container_port;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::filesystem::path& container) {
    config_.mounts[host] = container;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::filesystem::path& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithAutoRemove(bool auto_remove) {
    config_.auto_remove = auto_remove;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace quantlab
