/**
 * @file execution_strategy.cpp
 * @brief Kernel, interpreter and notebook-render execution routes
 *
 * Every route executes a helper inside the sandbox with `exec`; the
 * helpers read the notebook themselves, so only short argument lists
 * cross the container boundary.
 *
 * **Helper output protocol** (kernel and interpreter):
 * ```
 * <captured stdout of the cell>
 * __QUANTLAB_ERROR__{"ename": "...", "evalue": "...", "traceback": [...]}
 * ```
 * The marker line appears only when the cell raised. Exit code 2 means the
 * mechanism itself is unavailable (no kernel, missing module); exit code
 * 124 means the cell was stopped by its time limit.
 *
 * @date 2025
 */

#include "quantlab/sandbox/execution_strategy.hpp"
#include "quantlab/core/session_types.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace quantlab {
namespace sandbox {

namespace {

// ============================================================================
// SANDBOX HELPER SCRIPTS
// ============================================================================

const char* const kInterpreterScript = R"PY(
import json, sys, traceback
MARKER = "__QUANTLAB_ERROR__"
with open(sys.argv[1]) as handle:
    notebook = json.load(handle)
source = notebook["cells"][-1].get("source", "")
code = "".join(source) if isinstance(source, list) else source
namespace = {"__name__": "__main__"}
try:
    exec(compile(code, "<research-cell>", "exec"), namespace)
except BaseException as exc:
    sys.stdout.flush()
    payload = {
        "ename": type(exc).__name__,
        "evalue": str(exc),
        "traceback": traceback.format_exception(type(exc), exc, exc.__traceback__),
    }
    sys.stdout.write("\n" + MARKER + json.dumps(payload) + "\n")
)PY";

const char* const kKernelScript = R"PY(
import json, os, queue, sys, urllib.request
MARKER = "__QUANTLAB_ERROR__"
try:
    from jupyter_client import BlockingKernelClient
    from jupyter_core.paths import jupyter_runtime_dir
except ImportError as exc:
    sys.stderr.write("jupyter_client unavailable: %s\n" % exc)
    sys.exit(2)
notebook_name, port, timeout = sys.argv[1], sys.argv[2], float(sys.argv[3])
with open(notebook_name) as handle:
    notebook = json.load(handle)
source = notebook["cells"][-1].get("source", "")
code = "".join(source) if isinstance(source, list) else source
base = "http://localhost:%s/api/kernels" % port
token = os.environ.get("JUPYTER_TOKEN", "")
query = "?token=" + token if token else ""
try:
    kernels = json.load(urllib.request.urlopen(base + query, timeout=5))
except Exception as exc:
    sys.stderr.write("kernel listing failed: %s\n" % exc)
    sys.exit(2)
if not kernels:
    sys.stderr.write("no running kernel\n")
    sys.exit(2)
connection = os.path.join(jupyter_runtime_dir(), "kernel-%s.json" % kernels[0]["id"])
if not os.path.exists(connection):
    sys.stderr.write("connection file missing: %s\n" % connection)
    sys.exit(2)
client = BlockingKernelClient(connection_file=connection)
client.load_connection_file()
client.start_channels()
chunks = []
failure = {}
def on_output(msg):
    kind = msg["header"]["msg_type"]
    content = msg["content"]
    if kind == "stream":
        chunks.append(content.get("text", ""))
    elif kind in ("execute_result", "display_data"):
        chunks.append(content.get("data", {}).get("text/plain", "") + "\n")
    elif kind == "error":
        failure.update(ename=content.get("ename", ""), evalue=content.get("evalue", ""),
                       traceback=content.get("traceback", []))
try:
    client.execute_interactive(code, timeout=timeout, output_hook=on_output)
except (TimeoutError, queue.Empty):
    try:
        interrupt = "%s/%s/interrupt%s" % (base, kernels[0]["id"], query)
        urllib.request.urlopen(urllib.request.Request(interrupt, data=b"", method="POST"), timeout=5)
    except Exception as exc:
        sys.stderr.write("kernel interrupt failed: %s\n" % exc)
    sys.stdout.write("".join(chunks))
    sys.stderr.write("cell exceeded %ss\n" % timeout)
    sys.exit(124)
finally:
    client.stop_channels()
sys.stdout.write("".join(chunks))
if failure:
    sys.stdout.write("\n" + MARKER + json.dumps(failure) + "\n")
)PY";

std::string TimeoutSeconds(std::chrono::milliseconds timeout) {
    auto seconds = (timeout.count() + 999) / 1000;
    return std::to_string(seconds > 0 ? seconds : 1);
}

bool IndicatesTimeout(const utils::ContainerExecResult& exec) {
    return exec.timed_out ||
           exec.exit_code == kSandboxTimeoutExit ||
           exec.stderr_output.find("CellTimeoutError") != std::string::npos;
}

AttemptResult MechanismFailure(const utils::ContainerExecResult& exec, const std::string& what) {
    AttemptResult attempt;
    attempt.exit_code = exec.exit_code;
    if (exec.sandbox_missing) {
        attempt.status = AttemptStatus::SANDBOX_LOST;
        attempt.detail = utils::StringUtils::Trim(exec.stderr_output);
        return attempt;
    }
    attempt.status = IndicatesTimeout(exec) ? AttemptStatus::TIMED_OUT : AttemptStatus::FAILED;
    attempt.output = exec.stdout_output;
    attempt.detail = what + " (exit code " + std::to_string(exec.exit_code) + "): " +
                     utils::StringUtils::Tail(utils::StringUtils::Trim(
                         exec.stderr_output.empty() ? exec.stdout_output : exec.stderr_output), 2000);
    return attempt;
}

} // anonymous namespace

// ============================================================================
// RESULT CLASSIFICATION
// ============================================================================

AttemptResult InterpretScriptResult(const utils::ContainerExecResult& exec) {
    if (exec.sandbox_missing || exec.exit_code != 0) {
        return MechanismFailure(exec, "Helper script failed");
    }

    AttemptResult attempt;
    attempt.status = AttemptStatus::COMPLETED;
    attempt.exit_code = exec.exit_code;

    std::string text = exec.stdout_output;
    const std::string marker = kErrorMarker;

    // Last marker at the start of a line
    std::size_t pos = text.rfind(marker);
    while (pos != std::string::npos && pos != 0 && text[pos - 1] != '\n') {
        pos = text.rfind(marker, pos - 1);
    }

    if (pos != std::string::npos) {
        std::size_t line_end = text.find('\n', pos);
        std::string payload = text.substr(pos + marker.size(),
                                          line_end == std::string::npos ? std::string::npos
                                                                        : line_end - pos - marker.size());
        try {
            attempt.error = CodeError::FromJson(json::parse(payload));
            std::string before = text.substr(0, pos);
            // Drop the separator newline written ahead of the marker
            if (!before.empty() && before.back() == '\n') {
                before.pop_back();
            }
            text = before + (line_end == std::string::npos ? "" : text.substr(line_end + 1));
        }
        catch (const json::exception& e) {
            spdlog::warn("Unreadable error payload from sandbox helper: {}", e.what());
        }
    }

    attempt.output = text;
    if (!exec.stderr_output.empty()) {
        if (!attempt.output.empty() && attempt.output.back() != '\n') {
            attempt.output += "\n";
        }
        attempt.output += exec.stderr_output;
    }

    return attempt;
}

// ============================================================================
// KERNEL
// ============================================================================

AttemptResult KernelStrategy::Run(const ExecutionContext& context) {
    auto exec = context.runtime->Exec(
        context.sandbox_ref,
        {"python3", "-c", kKernelScript, context.notebook_name,
         std::to_string(context.kernel_port), TimeoutSeconds(context.timeout)},
        context.sandbox_workdir, context.exec_limit);

    if (exec.exit_code == kMechanismUnavailableExit && !exec.sandbox_missing) {
        return MechanismFailure(exec, "Notebook kernel unavailable");
    }
    return InterpretScriptResult(exec);
}

// ============================================================================
// INTERPRETER
// ============================================================================

InterpreterStrategy::InterpreterStrategy(std::string interpreter)
    : interpreter_(std::move(interpreter)) {
}

AttemptResult InterpreterStrategy::Run(const ExecutionContext& context) {
    auto exec = context.runtime->Exec(
        context.sandbox_ref,
        {"timeout", "--kill-after=5", TimeoutSeconds(context.timeout),
         interpreter_, "-c", kInterpreterScript, context.notebook_name},
        context.sandbox_workdir, context.exec_limit);

    return InterpretScriptResult(exec);
}

// ============================================================================
// NOTEBOOK RENDER
// ============================================================================

AttemptResult NotebookRenderStrategy::Run(const ExecutionContext& context) {
    const std::string executed_name = std::string(kExecutedStem) + ".ipynb";

    auto render = context.runtime->Exec(
        context.sandbox_ref,
        {"jupyter", "nbconvert",
         "--to", "notebook",
         "--execute", context.notebook_name,
         "--output", kExecutedStem,
         "--ExecutePreprocessor.timeout=" + TimeoutSeconds(context.timeout),
         "--allow-errors"},
        context.sandbox_workdir, context.exec_limit);

    if (render.sandbox_missing || render.exit_code != 0) {
        return MechanismFailure(render, "nbconvert failed");
    }

    auto read = context.runtime->Exec(context.sandbox_ref, {"cat", executed_name},
                                      context.sandbox_workdir, context.exec_limit);

    auto cleanup = context.runtime->Exec(context.sandbox_ref, {"rm", "-f", executed_name},
                                         context.sandbox_workdir, context.exec_limit);
    if (!cleanup.success) {
        spdlog::debug("Could not remove {}: {}", executed_name,
                      utils::StringUtils::Trim(cleanup.stderr_output));
    }

    if (read.sandbox_missing || read.exit_code != 0) {
        return MechanismFailure(read, "Could not read rendered notebook");
    }

    AttemptResult attempt;
    attempt.exit_code = 0;
    try {
        auto cell_output = Notebook::Parse(read.stdout_output).LastCellOutput();
        attempt.status = AttemptStatus::COMPLETED;
        attempt.output = cell_output.text;
        attempt.error = cell_output.error;
    }
    catch (const core::ArtifactParseError& e) {
        attempt.status = AttemptStatus::FAILED;
        attempt.detail = std::string("Rendered notebook unreadable: ") + e.what();
    }

    return attempt;
}

// ============================================================================
// FACTORY
// ============================================================================

std::shared_ptr<ExecutionStrategy> MakeStrategy(const std::string& name) {
    std::string key = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (key == "kernel") {
        return std::make_shared<KernelStrategy>();
    }
    if (key == "interpreter") {
        return std::make_shared<InterpreterStrategy>();
    }
    if (key == "render") {
        return std::make_shared<NotebookRenderStrategy>();
    }
    throw std::invalid_argument("Unknown execution strategy: " + name);
}

std::vector<std::shared_ptr<ExecutionStrategy>> MakeStrategies(const std::vector<std::string>& names) {
    std::vector<std::shared_ptr<ExecutionStrategy>> strategies;
    strategies.reserve(names.size());
    for (const auto& name : names) {
        strategies.push_back(MakeStrategy(name));
    }
    return strategies;
}

} // namespace sandbox
} // namespace quantlab
