/**
 * @file research_session.cpp
 * @brief Research session provisioning, location, execution and teardown
 *
 * **Execution Pipeline**:
 * ```
 * Execute(code)
 *   -> Initialize() if needed
 *   -> CodeGuard::Inspect()          (size limit, pattern audit, fingerprint)
 *   -> LocateSandbox() if no sandbox_ref
 *   -> append cell to Research/research.ipynb
 *   -> strategies in order, each bounded by timeout + attempt_overhead
 *   -> READY (or ERROR if the sandbox vanished)
 * ```
 *
 * **Attempt Timeouts**:
 * Each attempt runs on its own detached thread. The caller waits on the
 * attempt's future; when the budget elapses the attempt is abandoned and
 * the next strategy starts. The exec behind an abandoned attempt is killed
 * on the host at the same budget, and the code inside the sandbox is
 * stopped by its own in-sandbox limit (`timeout`, kernel interrupt or the
 * nbconvert cell timeout). An in-sandbox limit firing first is reported as
 * TIMED_OUT and counts the same as an abandoned attempt.
 *
 * @date 2025
 */

#include "quantlab/core/research_session.hpp"
#include "quantlab/sandbox/notebook.hpp"
#include "quantlab/utils/logging_utils.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <future>
#include <regex>
#include <thread>

namespace quantlab {
namespace core {

namespace {

constexpr const char* kResearchDirName = "Research";
constexpr const char* kNotebookName = "research.ipynb";
constexpr const char* kSandboxWorkdir = "/LeanCLI";
constexpr auto kStopGracePeriod = std::chrono::seconds(10);

std::filesystem::path CreateTempWorkspace(const std::string& session_id) {
    std::string pattern = (std::filesystem::temp_directory_path() /
                           ("qc_research_" + utils::StringUtils::SanitizeName(session_id) + "_XXXXXX")).string();

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create workspace: " + std::string(std::strerror(errno)));
    }
    return std::filesystem::path(buffer.data());
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ResearchSession::ResearchSession(std::string session_id, SessionParams params, SessionDependencies deps)
    : session_id_(std::move(session_id)),
      params_(std::move(params)),
      deps_(std::move(deps)),
      guard_(deps_.guard, deps_.audit),
      strategies_(sandbox::MakeStrategies(params_.strategies)),
      logger_(utils::GetContainerLogger(session_id_)) {

    if (!deps_.runtime) {
        throw std::invalid_argument("ResearchSession requires a container runtime");
    }
    if (params_.launcher == LauncherKind::LEAN_CLI && !deps_.provisioning) {
        throw std::invalid_argument("ResearchSession with the lean launcher requires a provisioning tool");
    }

    if (params_.workspace) {
        workspace_ = *params_.workspace;
        owns_workspace_ = false;
        std::filesystem::create_directories(workspace_);
    } else {
        workspace_ = CreateTempWorkspace(session_id_);
        owns_workspace_ = true;
    }

    port_ = params_.port.value_or(kSandboxNotebookPort);

    created_at_ = std::chrono::steady_clock::now();
    last_used_ = created_at_;
    created_wall_ = std::chrono::system_clock::now();
    last_used_wall_ = created_wall_;

    logger_->debug("Session {} workspace: {} (port {})", session_id_, workspace_.string(), port_);
}

ResearchSession::~ResearchSession() {
    Close("destroyed");
}

// ============================================================================
// INITIALIZATION
// ============================================================================

void ResearchSession::Initialize() {
    std::string failure;

    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::UNINITIALIZED) {
                return;
            }
            state_ = SessionState::INITIALIZING;
        }

        logger_->info("Initializing research session {} ({} launcher)",
                      session_id_, LauncherToString(params_.launcher));

        try {
            if (params_.launcher == LauncherKind::LEAN_CLI) {
                ProvisionWithLeanCli();
            } else {
                ProvisionDirectContainer();
            }
            TransitionTo(SessionState::READY);
        }
        catch (const ProvisioningError& e) {
            failure = e.what();
        }
        catch (const std::exception& e) {
            failure = std::string("Failed to initialize research session: ") + e.what();
        }
    }

    if (!failure.empty()) {
        logger_->error("Session {} initialization failed: {}", session_id_, failure);
        Close("initialization_failed");
        throw ProvisioningError(failure);
    }

    if (GetSandboxRef()) {
        logger_->info("Research session {} ready at {}", session_id_, GetEndpoint());
    } else {
        logger_->warn("Research session {} started but its container was not located yet; "
                      "will retry on first execution. Check {}", session_id_, GetEndpoint());
    }
}

void ResearchSession::ProvisionWithLeanCli() {
    auto version = deps_.provisioning->VersionCheck();
    if (!version) {
        throw ProvisioningError("Lean CLI is not installed or not on PATH. Install it with: pip install lean");
    }
    logger_->debug("Lean CLI version: {}", *version);

    EnsureScaffold();
    auto research_dir = EnsureResearchNotebook();

    sandbox::LaunchRequest request;
    request.workspace = workspace_;
    request.project_dir = research_dir.filename();
    request.port = port_;
    request.labels = SessionLabels();
    request.detached = true;

    auto launch = deps_.provisioning->Launch(request);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        launch_output_ = launch.output + "\n" + launch.error;
    }

    if (!launch.success) {
        std::string message = utils::StringUtils::Trim(launch.Message());
        if (utils::StringUtils::ContainsIgnoreCase(message, "log in") ||
            utils::StringUtils::ContainsIgnoreCase(message, "login")) {
            throw ProvisioningError("Lean CLI is not authenticated, run 'lean login': " + message);
        }
        throw ProvisioningError("Failed to start research environment: " + message);
    }

    if (params_.relocation_delay.count() > 0) {
        std::this_thread::sleep_for(params_.relocation_delay);
    }

    LocateSandbox();
}

void ResearchSession::ProvisionDirectContainer() {
    auto research_dir = EnsureResearchNotebook();

    utils::ContainerBuilder builder;
    builder.WithName("qc_research_" + utils::StringUtils::SanitizeName(session_id_))
           .WithImage(params_.image)
           .WithMemoryLimit(params_.memory_limit_mb)
           .WithCPULimit(params_.cpu_limit)
           .WithPort(port_, kSandboxNotebookPort)
           .WithMount(research_dir, kSandboxWorkdir)
           .WithWorkingDir(kSandboxWorkdir)
           .WithEnvironment("COMPOSER_DLL_DIRECTORY", "/Lean")
           .WithEnvironment("LEAN_ENGINE", "true")
           .WithEnvironment("PYTHONPATH", "/Lean")
           .WithAutoRemove(true);

    for (const auto& [key, value] : SessionLabels()) {
        builder.WithLabel(key, value);
    }

    std::string handle = deps_.runtime->CreateAndRun(builder.Build());
    if (handle.empty()) {
        throw ProvisioningError("Container runtime returned no container id");
    }
    SetSandboxRef(handle);
}

void ResearchSession::EnsureScaffold() {
    if (std::filesystem::exists(workspace_ / "lean.json") ||
        std::filesystem::exists(workspace_ / "config.json")) {
        return;
    }

    auto init = deps_.provisioning->Init(workspace_, params_.organization_id);
    if (!init.success) {
        logger_->warn("lean init failed in {}: {}", workspace_.string(),
                      utils::StringUtils::Trim(init.Message()));
    }
}

std::filesystem::path ResearchSession::EnsureResearchNotebook() {
    auto research_dir = workspace_ / kResearchDirName;
    std::filesystem::create_directories(research_dir);

    auto notebook_path = research_dir / kNotebookName;
    if (!std::filesystem::exists(notebook_path)) {
        sandbox::Notebook::CreateDefault().Save(notebook_path);
        logger_->debug("Created default research notebook: {}", notebook_path.string());
    }
    return research_dir;
}

std::map<std::string, std::string> ResearchSession::SessionLabels() const {
    return {
        {kSessionLabel, session_id_},
        {kCreatedAtLabel, utils::StringUtils::FormatTimestamp(created_wall_)}
    };
}

// ============================================================================
// SANDBOX LOCATION
// ============================================================================

bool ResearchSession::LocateSandbox() {
    std::optional<std::string> ref = LocateFromLaunchOutput();
    if (!ref) ref = LocateByLabel();
    if (!ref) ref = LocateByPort();

    if (!ref) {
        logger_->warn("Could not locate container for session {}", session_id_);
        return false;
    }

    SetSandboxRef(*ref);
    logger_->info("Located container {} for session {}", *ref, session_id_);
    return true;
}

std::optional<std::string> ResearchSession::ParseLaunchOutput(const std::string& output) {
    static const std::regex quoted_name("'([^']+)'");
    static const std::regex bare_name(R"(container[:\s]+([^\s'",]+))", std::regex::icase);

    for (const auto& line : utils::StringUtils::SplitLines(output)) {
        if (!utils::StringUtils::ContainsIgnoreCase(line, "container")) continue;
        if (!utils::StringUtils::ContainsIgnoreCase(line, "started") &&
            !utils::StringUtils::ContainsIgnoreCase(line, "running")) continue;

        std::smatch match;
        if (std::regex_search(line, match, quoted_name)) {
            return match[1].str();
        }
        if (std::regex_search(line, match, bare_name)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

std::optional<std::string> ResearchSession::LocateFromLaunchOutput() {
    std::string output;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        output = launch_output_;
    }

    auto name = ParseLaunchOutput(output);
    if (!name) {
        return std::nullopt;
    }

    try {
        auto info = deps_.runtime->GetByName(*name);
        if (info) {
            return info->id.empty() ? *name : info->id;
        }
        logger_->debug("Launcher reported container {} but the runtime does not list it", *name);
    }
    catch (const std::exception& e) {
        logger_->warn("Container lookup by name failed: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> ResearchSession::LocateByLabel() {
    try {
        auto matches = deps_.runtime->FindByLabel(kSessionLabel, session_id_);
        if (!matches.empty()) {
            if (matches.size() > 1) {
                logger_->warn("{} containers carry label {}={}, using the first",
                              matches.size(), kSessionLabel, session_id_);
            }
            return matches.front().id.empty() ? matches.front().name : matches.front().id;
        }
    }
    catch (const std::exception& e) {
        logger_->warn("Container lookup by label failed: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> ResearchSession::LocateByPort() {
    try {
        auto info = deps_.runtime->FindByHostPort(port_);
        if (info) {
            return info->id.empty() ? info->name : info->id;
        }
    }
    catch (const std::exception& e) {
        logger_->warn("Container lookup by port failed: {}", e.what());
    }
    return std::nullopt;
}

void ResearchSession::SetSandboxRef(const std::string& ref) {
    bool audit_creation = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        sandbox_ref_ = ref;
        if (!creation_audited_) {
            creation_audited_ = true;
            audit_creation = true;
        }
    }

    if (audit_creation && deps_.audit) {
        deps_.audit->SessionCreated(session_id_, ref);
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult ResearchSession::Execute(const std::string& code,
                                         std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> execution_lock(execution_mutex_);

    const auto effective_timeout = timeout.value_or(params_.default_timeout);

    switch (GetState()) {
        case SessionState::CLOSED:
            return ExecutionResult::Failure(session_id_, ErrorKind::EXECUTION_FAILED,
                                            "Research session " + session_id_ + " is closed");
        case SessionState::ERROR:
            return ExecutionResult::Failure(session_id_, ErrorKind::SANDBOX_NOT_FOUND,
                                            "Research session " + session_id_ +
                                            " lost its container; remove and recreate it");
        case SessionState::UNINITIALIZED:
            try {
                Initialize();
            }
            catch (const ProvisioningError& e) {
                return ExecutionResult::Failure(session_id_, ErrorKind::PROVISIONING, e.what());
            }
            break;
        default:
            break;
    }

    auto verdict = guard_.Inspect(session_id_, code);
    if (!verdict.allowed) {
        return ExecutionResult::Failure(session_id_, ErrorKind::SECURITY_VIOLATION,
                                        verdict.rejection_reason);
    }

    if (!GetSandboxRef()) {
        logger_->info("No container recorded for session {}, retrying location", session_id_);
        if (!LocateSandbox()) {
            return ExecutionResult::Failure(
                session_id_, ErrorKind::SANDBOX_NOT_FOUND,
                "Research container not found. The environment may still be starting up; "
                "check " + GetEndpoint() + " and retry");
        }
    }

    Touch();
    if (!TransitionTo(SessionState::EXECUTING)) {
        return ExecutionResult::Failure(session_id_, ErrorKind::EXECUTION_FAILED,
                                        "Research session " + session_id_ + " is closed");
    }

    logger_->info("Executing code (hash: {}, timeout: {}ms)", verdict.fingerprint, effective_timeout.count());

    ExecutionResult result;
    try {
        auto notebook_path = GetNotebookPath();
        auto notebook = sandbox::Notebook::LoadOrCreate(notebook_path);
        notebook.AppendCode(code);
        notebook.Save(notebook_path);

        sandbox::ExecutionContext context;
        context.runtime = deps_.runtime;
        context.sandbox_ref = GetSandboxRef().value_or("");
        context.session_id = session_id_;
        context.sandbox_workdir = kSandboxWorkdir;
        context.notebook_name = kNotebookName;
        context.kernel_port = kSandboxNotebookPort;
        context.timeout = effective_timeout;
        context.exec_limit = effective_timeout + params_.attempt_overhead;

        result = RunStrategies(context);
    }
    catch (const ArtifactParseError& e) {
        logger_->error("Research notebook for session {} is corrupted: {}", session_id_, e.what());
        result = ExecutionResult::Failure(session_id_, ErrorKind::ARTIFACT_PARSE, e.what());
    }
    catch (const std::exception& e) {
        logger_->error("Execution failed for session {}: {}", session_id_, e.what());
        result = ExecutionResult::Failure(session_id_, ErrorKind::EXECUTION_FAILED,
                                          std::string("Execution failed: ") + e.what());
    }

    result.output = utils::StringUtils::ToValidUtf8(result.output);
    if (result.error) {
        result.error = utils::StringUtils::ToValidUtf8(*result.error);
    }

    Touch();
    TransitionTo(result.error_kind == ErrorKind::SANDBOX_NOT_FOUND ? SessionState::ERROR
                                                                   : SessionState::READY);

    if (deps_.audit) {
        deps_.audit->CodeExecution(session_id_, verdict.fingerprint, result.IsSuccess());
    }

    return result;
}

ExecutionResult ResearchSession::RunStrategies(const sandbox::ExecutionContext& context) {
    if (strategies_.empty()) {
        return ExecutionResult::Failure(session_id_, ErrorKind::EXECUTION_FAILED,
                                        "No execution strategies configured");
    }

    const auto budget = context.timeout + params_.attempt_overhead;

    sandbox::AttemptResult last_failure;
    std::string last_name;
    bool last_timed_out = false;

    for (std::size_t i = 0; i < strategies_.size(); ++i) {
        const auto& strategy = strategies_[i];
        last_name = strategy->Name();
        logger_->debug("Trying execution strategy {}/{}: {}", i + 1, strategies_.size(), last_name);

        auto attempt = RunAttempt(strategy, context, budget);
        if (!attempt) {
            logger_->warn("Strategy {} timed out after {}ms", last_name, budget.count());
            last_timed_out = true;
            continue;
        }
        last_timed_out = false;

        if (attempt->status == sandbox::AttemptStatus::SANDBOX_LOST) {
            logger_->error("Container for session {} is gone: {}", session_id_, attempt->detail);
            auto result = ExecutionResult::Failure(
                session_id_, ErrorKind::SANDBOX_NOT_FOUND,
                "Research container is no longer running" +
                (attempt->detail.empty() ? std::string() : ": " + attempt->detail));
            result.strategy = last_name;
            return result;
        }

        if (attempt->status == sandbox::AttemptStatus::TIMED_OUT) {
            logger_->warn("Strategy {} hit the time limit inside the sandbox: {}", last_name, attempt->detail);
            last_timed_out = true;
            continue;
        }

        if (attempt->status == sandbox::AttemptStatus::FAILED) {
            logger_->warn("Strategy {} failed: {}", last_name, attempt->detail);
            last_failure = std::move(*attempt);
            continue;
        }

        // Completed
        ExecutionResult result;
        result.session_id = session_id_;
        result.strategy = last_name;
        result.exit_code = attempt->exit_code;

        std::string output = utils::StringUtils::Trim(attempt->output);
        if (attempt->error) {
            result.status = ResultStatus::ERROR;
            result.error_kind = ErrorKind::CODE_ERROR;
            result.error = attempt->error->Format();
            result.output = output;
        } else {
            result.status = ResultStatus::SUCCESS;
            result.output = output.empty() ? "Code executed successfully (no output)" : output;
        }

        logger_->info("Execution via {} finished ({})", last_name,
                      result.IsSuccess() ? "success" : "code error");
        return result;
    }

    if (last_timed_out) {
        auto seconds = (context.timeout.count() + 999) / 1000;
        if (deps_.audit) {
            deps_.audit->ResourceLimitHit(session_id_, security::kResourceExecutionTimeout,
                                          std::to_string(context.timeout.count()) + "ms");
        }
        auto result = ExecutionResult::Failure(
            session_id_, ErrorKind::EXECUTION_TIMEOUT,
            "Code execution timed out after " + std::to_string(seconds) + " seconds");
        result.timeout = true;
        result.strategy = last_name;
        return result;
    }

    auto result = ExecutionResult::Failure(session_id_, ErrorKind::EXECUTION_FAILED,
                                           "All execution strategies failed. Last error: " +
                                           last_failure.detail);
    result.output = utils::StringUtils::Trim(last_failure.output);
    result.exit_code = last_failure.exit_code;
    result.strategy = last_name;
    return result;
}

std::optional<sandbox::AttemptResult> ResearchSession::RunAttempt(
    std::shared_ptr<sandbox::ExecutionStrategy> strategy,
    const sandbox::ExecutionContext& context,
    std::chrono::milliseconds budget) {

    auto task = std::make_shared<std::packaged_task<sandbox::AttemptResult()>>(
        [strategy, context]() { return strategy->Run(context); });
    auto future = task->get_future();

    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(budget) != std::future_status::ready) {
        return std::nullopt;
    }

    try {
        return future.get();
    }
    catch (const std::exception& e) {
        sandbox::AttemptResult failed;
        failed.status = sandbox::AttemptStatus::FAILED;
        failed.detail = e.what();
        return failed;
    }
}

// ============================================================================
// TEARDOWN
// ============================================================================

void ResearchSession::Close(const std::string& reason) noexcept {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    try {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        std::optional<std::string> ref;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ref = sandbox_ref_;
            state_ = SessionState::CLOSED;
        }

        logger_->info("Closing research session {} (reason: {})", session_id_, reason);

        if (ref) {
            bool stopped = false;
            try {
                stopped = deps_.runtime->Stop(*ref, kStopGracePeriod);
            }
            catch (const std::exception& e) {
                logger_->warn("Stopping container {} failed: {}", *ref, e.what());
            }

            if (!stopped) {
                try {
                    if (!deps_.runtime->Kill(*ref)) {
                        logger_->error("Container {} could not be stopped or killed", *ref);
                    }
                }
                catch (const std::exception& e) {
                    logger_->error("Killing container {} failed: {}", *ref, e.what());
                }
            }
        }

        ReleaseWorkspace();

        if (deps_.audit) {
            deps_.audit->SessionDestroyed(session_id_, reason);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error while closing session {}: {}", session_id_, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SessionState::CLOSED;
    }
    utils::DropContainerLogger(session_id_);
}

void ResearchSession::ReleaseWorkspace() {
    if (!owns_workspace_) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(workspace_, ec);
    if (ec) {
        logger_->warn("Failed to remove workspace {}: {}", workspace_.string(), ec.message());
    } else {
        logger_->debug("Removed workspace {}", workspace_.string());
    }
}

// ============================================================================
// STATE
// ============================================================================

bool ResearchSession::TransitionTo(SessionState next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::CLOSED) {
        return false;
    }
    state_ = next;
    return true;
}

void ResearchSession::Touch() {
    auto now = std::chrono::steady_clock::now();
    auto wall_now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_used_ = std::max(last_used_, now);
    last_used_wall_ = std::max(last_used_wall_, wall_now);
}

bool ResearchSession::IsExpired(std::chrono::milliseconds max_idle) const {
    return IsExpired(max_idle, std::chrono::steady_clock::now());
}

bool ResearchSession::IsExpired(std::chrono::milliseconds max_idle,
                                std::chrono::steady_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return now - last_used_ > max_idle;
}

SessionState ResearchSession::GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ResearchSession::IsInitialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == SessionState::READY ||
           state_ == SessionState::EXECUTING ||
           state_ == SessionState::ERROR;
}

std::optional<std::string> ResearchSession::GetSandboxRef() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return sandbox_ref_;
}

std::string ResearchSession::GetEndpoint() const {
    return "http://localhost:" + std::to_string(port_);
}

std::chrono::steady_clock::time_point ResearchSession::GetCreatedAt() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return created_at_;
}

std::chrono::steady_clock::time_point ResearchSession::GetLastUsed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_used_;
}

std::filesystem::path ResearchSession::GetNotebookPath() const {
    return workspace_ / kResearchDirName / kNotebookName;
}

SessionInfo ResearchSession::GetInfo() const {
    SessionInfo info;
    info.session_id = session_id_;
    info.workspace_dir = workspace_.string();
    info.port = port_;

    std::lock_guard<std::mutex> lock(state_mutex_);
    info.state = state_;
    info.initialized = state_ == SessionState::READY ||
                       state_ == SessionState::EXECUTING ||
                       state_ == SessionState::ERROR;
    info.created_at = utils::StringUtils::FormatTimestamp(created_wall_);
    info.last_used = utils::StringUtils::FormatTimestamp(last_used_wall_);
    info.sandbox_ref = sandbox_ref_;
    return info;
}

} // namespace core
} // namespace quantlab
