/**
 * @file execution_strategy.hpp
 * @brief Interchangeable ways of running the newest notebook cell
 *
 * The research sandbox offers several routes to execute code, none of which
 * is guaranteed to work in every image: a live notebook kernel, a plain
 * interpreter and a headless notebook render. Each route is an
 * ExecutionStrategy; a session tries its configured list in order.
 *
 * All strategies execute the **last cell** of the notebook stored in the
 * sandbox working directory and report output in the same shape.
 *
 * @date 2025
 */

#pragma once

#include "quantlab/sandbox/notebook.hpp"
#include "quantlab/utils/container_utils.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quantlab {
namespace sandbox {

/// Marker line preceding a JSON-encoded exception in strategy output
constexpr const char* kErrorMarker = "__QUANTLAB_ERROR__";

/// Exit code strategy scripts use when their mechanism is unavailable
constexpr int kMechanismUnavailableExit = 2;

/// Exit code for code stopped by its in-sandbox time limit (matches coreutils `timeout`)
constexpr int kSandboxTimeoutExit = 124;

/**
 * @struct ExecutionContext
 * @brief Everything a strategy needs to reach the sandbox
 *
 * Copied into the attempt's worker thread; the runtime is shared so an
 * abandoned attempt keeps it alive.
 */
struct ExecutionContext {
    std::shared_ptr<utils::ContainerRuntime> runtime;
    std::string sandbox_ref;                               ///< Container name or ID
    std::string session_id;
    std::string sandbox_workdir{"/LeanCLI"};                ///< Notebook directory inside the sandbox
    std::string notebook_name{"research.ipynb"};
    int kernel_port{8888};                                 ///< Notebook server port inside the sandbox
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};  ///< Limit enforced inside the sandbox
    std::chrono::milliseconds exec_limit{0};   ///< Host-side bound on each exec (zero = none)
};

/**
 * @enum AttemptStatus
 * @brief How far a single strategy attempt got
 */
enum class AttemptStatus {
    COMPLETED,     ///< Code ran (it may still have raised; see AttemptResult::error)
    FAILED,        ///< Mechanism failed; try the next strategy
    TIMED_OUT,     ///< Code hit its time limit inside the sandbox (or the exec was cut off)
    SANDBOX_LOST   ///< Sandbox no longer exists or is stopped
};

/**
 * @struct AttemptResult
 * @brief Outcome of ExecutionStrategy::Run()
 */
struct AttemptResult {
    AttemptStatus status{AttemptStatus::FAILED};
    std::string output;                ///< Captured stdout of the user code
    std::optional<CodeError> error;    ///< Exception raised by the user code
    int exit_code{0};
    std::string detail;                ///< Why the attempt failed
};

/**
 * @class ExecutionStrategy
 * @brief One route for executing the newest cell
 */
class ExecutionStrategy {
public:
    virtual ~ExecutionStrategy() = default;

    /// Short name used in configuration and results ("kernel", ...)
    virtual std::string Name() const = 0;

    /**
     * @brief Run the last notebook cell
     *
     * Blocking. Must not throw for sandbox-side failures; those are
     * reported as FAILED, TIMED_OUT or SANDBOX_LOST.
     */
    virtual AttemptResult Run(const ExecutionContext& context) = 0;
};

/**
 * @class KernelStrategy
 * @brief Execute through the notebook server's running kernel
 *
 * Runs a helper script inside the sandbox that lists kernels via the
 * server's REST API and sends the cell with jupyter_client. Shares state
 * with the interactive notebook (e.g. the preinitialized `qb`).
 */
class KernelStrategy : public ExecutionStrategy {
public:
    std::string Name() const override { return "kernel"; }
    AttemptResult Run(const ExecutionContext& context) override;
};

/**
 * @class InterpreterStrategy
 * @brief Execute the cell in a fresh interpreter process
 *
 * The interpreter runs under `timeout`, so runaway code is killed inside the
 * sandbox even after the host has given up on the attempt.
 */
class InterpreterStrategy : public ExecutionStrategy {
public:
    explicit InterpreterStrategy(std::string interpreter = "python3");

    std::string Name() const override { return "interpreter"; }
    AttemptResult Run(const ExecutionContext& context) override;

private:
    std::string interpreter_;
};

/**
 * @class NotebookRenderStrategy
 * @brief Execute the whole notebook headlessly and read back the last cell
 *
 * Uses `jupyter nbconvert --execute --allow-errors`; the rendered copy is
 * deleted afterwards.
 */
class NotebookRenderStrategy : public ExecutionStrategy {
public:
    std::string Name() const override { return "render"; }
    AttemptResult Run(const ExecutionContext& context) override;

    static constexpr const char* kExecutedStem = "research_executed";
};

/**
 * @brief Create a strategy by name
 * @param name "kernel", "interpreter" or "render"
 * @throws std::invalid_argument for unknown names
 */
std::shared_ptr<ExecutionStrategy> MakeStrategy(const std::string& name);

/// Create strategies for each name, in order
std::vector<std::shared_ptr<ExecutionStrategy>> MakeStrategies(const std::vector<std::string>& names);

/**
 * @brief Classify the result of a helper script run in the sandbox
 *
 * - sandbox missing -> SANDBOX_LOST
 * - exec cut off, or exit kSandboxTimeoutExit -> TIMED_OUT
 * - other non-zero exit -> FAILED
 * - otherwise       -> COMPLETED; a kErrorMarker line, if present, is
 *   decoded into AttemptResult::error and removed from the output
 */
AttemptResult InterpretScriptResult(const utils::ContainerExecResult& exec);

} // namespace sandbox
} // namespace quantlab
