/**
 * @file tool_dispatcher.cpp
 * @brief Tool handlers and the JSON-lines request loop
 *
 * Handler responses follow the shapes LLM clients of the QuantBook tools
 * already expect (instance_name, container_info, usage_instructions, ...).
 *
 * @date 2025
 */

#include "quantlab/tools/tool_dispatcher.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <istream>
#include <ostream>

using json = nlohmann::json;

namespace quantlab {
namespace tools {

namespace {

constexpr auto kReadinessCheckTimeout = std::chrono::seconds(10);

const char* const kInfoSnippet =
    "try:\n"
    "    securities_count = len(qb.Securities) if hasattr(qb, 'Securities') else 0\n"
    "    available_methods = [m for m in dir(qb) if not m.startswith('_')]\n"
    "    print(f'Securities count: {securities_count}')\n"
    "    print(f'Available methods: {len(available_methods)}')\n"
    "    print(f'QuantBook type: {type(qb).__name__}')\n"
    "except Exception as e:\n"
    "    print(f'Error getting QuantBook info: {e}')\n";

std::string InstanceName(const json& args) {
    return args.value("instance_name", std::string("default"));
}

json ErrorResponse(const std::string& error, const std::string& message) {
    return {
        {"status", "error"},
        {"error", error},
        {"message", message}
    };
}

json UsageInstructions() {
    return {
        {"CRITICAL", "To use QuantBook functions, the first line in a cell should be qb = QuantBook()"},
        {"example", "equity = qb.AddEquity('AAPL')\nhistory = qb.History(equity.Symbol, 10, Resolution.Daily)"},
        {"notebook_location", "/LeanCLI - where research.ipynb is located"}
    };
}

json SessionCountJson(const core::SessionCount& count) {
    return {
        {"active_sessions", count.active},
        {"max_sessions", count.max},
        {"available_slots", count.available}
    };
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(core::SessionManager& manager)
    : manager_(manager) {
    handlers_["initialize_quantbook"] = [this](const json& a) { return InitializeQuantbook(a); };
    handlers_["list_quantbook_instances"] = [this](const json& a) { return ListQuantbookInstances(a); };
    handlers_["get_quantbook_info"] = [this](const json& a) { return GetQuantbookInfo(a); };
    handlers_["check_quantbook_container"] = [this](const json& a) { return CheckQuantbookContainer(a); };
    handlers_["remove_quantbook_instance"] = [this](const json& a) { return RemoveQuantbookInstance(a); };
    handlers_["execute_quantbook_code"] = [this](const json& a) { return ExecuteQuantbookCode(a); };
    handlers_["get_session_manager_status"] = [this](const json& a) { return GetSessionManagerStatus(a); };
}

// ============================================================================
// DISPATCH
// ============================================================================

json ToolDispatcher::Dispatch(const json& request) {
    json response;

    if (!request.is_object() || !request.contains("tool") || !request["tool"].is_string()) {
        response = ErrorResponse("Request must be an object with a string \"tool\" field",
                                 "Invalid request");
    } else {
        json arguments = request.value("arguments", json::object());
        response = Call(request["tool"].get<std::string>(), arguments);
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

json ToolDispatcher::Call(const std::string& tool, const json& arguments) {
    auto it = handlers_.find(tool);
    if (it == handlers_.end()) {
        json response = ErrorResponse("Unknown tool: " + tool, "Tool not found");
        response["available_tools"] = ToolNames();
        return response;
    }

    if (!arguments.is_object()) {
        return ErrorResponse("\"arguments\" must be an object", "Invalid arguments for " + tool);
    }

    spdlog::debug("Tool call: {}", tool);

    try {
        return it->second(arguments);
    }
    catch (const json::exception& e) {
        return ErrorResponse(std::string("Invalid arguments: ") + e.what(), "Invalid arguments for " + tool);
    }
    catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", tool, e.what());
        return ErrorResponse(e.what(), "Tool " + tool + " failed");
    }
}

std::vector<std::string> ToolDispatcher::ToolNames() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// HANDLERS
// ============================================================================

json ToolDispatcher::InitializeQuantbook(const json& args) {
    const std::string instance_name = InstanceName(args);

    core::SessionParams params = manager_.GetConfig().default_params;
    if (args.contains("memory_limit_mb")) params.memory_limit_mb = args["memory_limit_mb"].get<std::size_t>();
    if (args.contains("cpu_limit")) params.cpu_limit = args["cpu_limit"].get<double>();
    if (args.contains("timeout")) params.default_timeout = std::chrono::seconds(args["timeout"].get<int>());
    if (args.contains("port")) params.port = args["port"].get<int>();

    std::shared_ptr<core::ResearchSession> session;
    try {
        session = manager_.GetOrCreateSession(instance_name, params);
    }
    catch (const core::SessionError& e) {
        spdlog::error("Failed to initialize QuantBook instance '{}': {}", instance_name, e.what());
        return ErrorResponse(e.what(), "Failed to initialize QuantBook instance '" + instance_name + "'");
    }

    auto readiness = session->Execute("print('Container ready')", std::chrono::milliseconds(kReadinessCheckTimeout));
    bool container_ready = readiness.IsSuccess();

    json response = {
        {"status", "success"},
        {"instance_name", instance_name},
        {"session_id", session->GetId()},
        {"container_info", {
            {"memory_limit_mb", session->GetParams().memory_limit_mb},
            {"cpu_limit", session->GetParams().cpu_limit},
            {"timeout", std::chrono::duration_cast<std::chrono::seconds>(
                            session->GetParams().default_timeout).count()},
            {"workspace", session->GetWorkspace().string()},
            {"port", session->GetPort()}
        }},
        {"usage_instructions", UsageInstructions()}
    };

    if (container_ready) {
        response["message"] = "QuantBook instance '" + instance_name + "' initialized successfully in container";
    } else {
        response["message"] = "QuantBook instance '" + instance_name +
                              "' is starting up. Jupyter Lab will be available at " + session->GetEndpoint();
        response["note"] = "Container is still starting. Try executing code in a few seconds.";
    }
    return response;
}

json ToolDispatcher::ListQuantbookInstances(const json& /*args*/) {
    json details = json::array();
    json names = json::array();
    for (const auto& info : manager_.ListSessions()) {
        names.push_back(info.session_id);
        details.push_back(info.ToJson());
    }

    return {
        {"status", "success"},
        {"instances", names},
        {"count", names.size()},
        {"session_details", details},
        {"capacity", SessionCountJson(manager_.GetSessionCount())}
    };
}

json ToolDispatcher::GetQuantbookInfo(const json& args) {
    const std::string instance_name = InstanceName(args);
    auto session = manager_.GetSession(instance_name);
    if (!session) {
        return NotFound(instance_name);
    }

    auto info = session->GetInfo();
    json container_info = {
        {"created_at", info.created_at},
        {"last_used", info.last_used},
        {"port", info.port},
        {"workspace", info.workspace_dir},
        {"initialized", info.initialized},
        {"jupyter_url", session->GetEndpoint()}
    };

    auto result = session->Execute(kInfoSnippet);
    if (result.error_kind == core::ErrorKind::SANDBOX_NOT_FOUND) {
        return {
            {"status", "success"},
            {"instance_name", instance_name},
            {"session_id", session->GetId()},
            {"container_info", container_info},
            {"message", "Container is still starting up. Jupyter Lab should be available soon."},
            {"note", result.error.value_or("")}
        };
    }

    return {
        {"status", "success"},
        {"instance_name", instance_name},
        {"session_id", session->GetId()},
        {"container_info", container_info},
        {"execution_result", result.ToJson()}
    };
}

json ToolDispatcher::CheckQuantbookContainer(const json& args) {
    const std::string instance_name = InstanceName(args);
    auto session = manager_.GetSession(instance_name);
    if (!session) {
        return NotFound(instance_name);
    }

    bool found = session->LocateSandbox();
    auto ref = session->GetSandboxRef();

    return {
        {"status", "success"},
        {"instance_name", instance_name},
        {"container_found", found},
        {"container_id", ref ? json(*ref) : json(nullptr)},
        {"port", session->GetPort()},
        {"jupyter_url", session->GetEndpoint()},
        {"message", found ? "Container is running" : "Container not yet found - may still be starting"}
    };
}

json ToolDispatcher::RemoveQuantbookInstance(const json& args) {
    if (!args.contains("instance_name")) {
        return ErrorResponse("Missing required argument: instance_name", "Invalid arguments");
    }
    const std::string instance_name = args["instance_name"].get<std::string>();

    if (!manager_.CloseSession(instance_name, "user_request")) {
        return NotFound(instance_name);
    }

    return {
        {"status", "success"},
        {"message", "QuantBook instance '" + instance_name + "' removed successfully"},
        {"remaining_instances", InstanceNames()}
    };
}

json ToolDispatcher::ExecuteQuantbookCode(const json& args) {
    if (!args.contains("code") || !args["code"].is_string()) {
        return ErrorResponse("Missing required argument: code", "Invalid arguments");
    }
    const std::string instance_name = InstanceName(args);
    auto session = manager_.GetSession(instance_name);
    if (!session) {
        json response = NotFound(instance_name);
        response["message"] = "Initialize a QuantBook instance first using initialize_quantbook";
        return response;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (args.contains("timeout") && !args["timeout"].is_null()) {
        timeout = std::chrono::seconds(args["timeout"].get<int>());
    }

    json response = session->Execute(args["code"].get<std::string>(), timeout).ToJson();
    response["instance_name"] = instance_name;
    return response;
}

json ToolDispatcher::GetSessionManagerStatus(const json& /*args*/) {
    const auto& config = manager_.GetConfig();

    json sessions = json::array();
    for (const auto& info : manager_.ListSessions()) {
        sessions.push_back(info.ToJson());
    }

    return {
        {"status", "success"},
        {"running", manager_.IsRunning()},
        {"session_count", SessionCountJson(manager_.GetSessionCount())},
        {"sessions", sessions},
        {"configuration", {
            {"max_sessions", config.max_sessions},
            {"session_timeout_hours",
             std::chrono::duration<double, std::ratio<3600>>(config.session_timeout).count()},
            {"cleanup_interval_seconds",
             std::chrono::duration_cast<std::chrono::seconds>(config.cleanup_interval).count()}
        }}
    };
}

// ============================================================================
// HELPERS
// ============================================================================

json ToolDispatcher::NotFound(const std::string& instance_name) const {
    return {
        {"status", "error"},
        {"error", "QuantBook instance '" + instance_name + "' not found"},
        {"available_instances", InstanceNames()}
    };
}

json ToolDispatcher::InstanceNames() const {
    json names = json::array();
    for (const auto& info : manager_.ListSessions()) {
        names.push_back(info.session_id);
    }
    return names;
}

// ============================================================================
// REQUEST LOOP
// ============================================================================

std::size_t ServeRequests(ToolDispatcher& dispatcher, std::istream& in, std::ostream& out) {
    std::string line;
    std::size_t handled = 0;

    while (std::getline(in, line)) {
        line = utils::StringUtils::Trim(line);
        if (line.empty()) {
            continue;
        }

        json request;
        json response;
        try {
            request = json::parse(line);
            response = dispatcher.Dispatch(request);
        }
        catch (const json::parse_error& e) {
            spdlog::warn("[REQUEST] Malformed request: {}", e.what());
            response = ErrorResponse(std::string("Malformed request: ") + e.what(),
                                     "Requests must be one JSON object per line");
        }
        catch (const std::exception& e) {
            spdlog::error("[REQUEST] Request failed: {}", e.what());
            response = ErrorResponse(std::string("Internal error: ") + e.what(),
                                     "The request could not be completed");
            if (request.is_object() && request.contains("id")) {
                response["id"] = request["id"];
            }
        }

        out << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
        ++handled;
    }

    return handled;
}

} // namespace tools
} // namespace quantlab
