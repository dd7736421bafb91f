/**
 * @file process_utils.hpp
 * @brief Child process execution with captured output
 *
 * Runs external commands (container runtime CLI, provisioning tool) without
 * going through a shell. Arguments are passed verbatim to execvp, so no
 * quoting or escaping is needed by callers.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quantlab {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Optional knobs for RunProcess()
 */
struct ProcessOptions {
    std::optional<std::filesystem::path> working_dir;   ///< chdir before exec
    std::optional<std::string> stdin_data;              ///< Written to the child's stdin, then closed
    std::optional<std::chrono::milliseconds> timeout;   ///< Child is killed once this elapses
};

/**
 * @struct CommandResult
 * @brief Outcome of a finished child process
 */
struct CommandResult {
    int exit_code = -1;         ///< Exit status, or 128 + signal number
    std::string output;         ///< Captured stdout
    std::string error;          ///< Captured stderr
    bool launched = false;      ///< false when the executable could not be started
    bool timed_out = false;     ///< Killed because ProcessOptions::timeout elapsed

    bool Succeeded() const { return launched && exit_code == 0; }
};

/**
 * @brief Run a command to completion and capture stdout/stderr
 *
 * Blocks until the child exits. Both pipes are drained concurrently, so
 * large outputs cannot deadlock the child. With ProcessOptions::timeout set,
 * the child gets SIGKILL when the deadline passes and whatever it printed
 * so far is returned with timed_out set.
 *
 * @param argv Program name followed by its arguments (argv[0] is looked up in PATH)
 * @param options Working directory, stdin payload and deadline
 * @return CommandResult; launched is false if execvp failed
 *
 * @throws std::runtime_error if pipes cannot be created or fork fails
 *
 * **Example**:
 * @code
 * auto result = RunProcess({"docker", "ps", "-a"});
 * if (!result.Succeeded()) {
 *     spdlog::error("docker ps failed: {}", result.error);
 * }
 * @endcode
 */
CommandResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

/**
 * @brief Check whether an executable can be found in PATH
 * @param name Program name, or a path containing '/'
 */
bool IsExecutableAvailable(const std::string& name);

/// Render an argv for log messages
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace quantlab
