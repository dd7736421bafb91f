/**
 * @file tool_dispatcher.hpp
 * @brief JSON tool surface over the session manager
 *
 * Maps named tool requests from the LLM client onto SessionManager and
 * ResearchSession operations. Every response is a JSON object with
 * "status": "success" | "error"; tool handlers never throw.
 *
 * **Request shape**:
 * @code{.json}
 * {"id": 7, "tool": "execute_quantbook_code",
 *  "arguments": {"instance_name": "default", "code": "print(1)", "timeout": 60}}
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "quantlab/core/session_manager.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace quantlab {
namespace tools {

/**
 * @class ToolDispatcher
 * @brief Routes tool requests to handlers
 *
 * **Tools**:
 * - initialize_quantbook
 * - list_quantbook_instances
 * - get_quantbook_info
 * - check_quantbook_container
 * - remove_quantbook_instance
 * - execute_quantbook_code
 * - get_session_manager_status
 */
class ToolDispatcher {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    explicit ToolDispatcher(core::SessionManager& manager);

    /**
     * @brief Handle one request
     *
     * The request "id", if present, is echoed back in the response.
     */
    nlohmann::json Dispatch(const nlohmann::json& request);

    /**
     * @brief Run a tool by name
     * @param tool Tool name
     * @param arguments Tool arguments (object, may be empty)
     */
    nlohmann::json Call(const std::string& tool, const nlohmann::json& arguments);

    /// Names of all registered tools, sorted
    std::vector<std::string> ToolNames() const;

private:
    nlohmann::json InitializeQuantbook(const nlohmann::json& args);
    nlohmann::json ListQuantbookInstances(const nlohmann::json& args);
    nlohmann::json GetQuantbookInfo(const nlohmann::json& args);
    nlohmann::json CheckQuantbookContainer(const nlohmann::json& args);
    nlohmann::json RemoveQuantbookInstance(const nlohmann::json& args);
    nlohmann::json ExecuteQuantbookCode(const nlohmann::json& args);
    nlohmann::json GetSessionManagerStatus(const nlohmann::json& args);

    nlohmann::json NotFound(const std::string& instance_name) const;
    nlohmann::json InstanceNames() const;

    core::SessionManager& manager_;
    std::map<std::string, Handler> handlers_;
};

/**
 * @brief Serve JSON-lines requests until @p in is exhausted
 *
 * One request object per input line, one response object per output line.
 * Malformed lines and failing requests get an error response; the loop
 * only ends with the input. Responses are serialized with invalid UTF-8
 * replaced, so sandbox output can never break the stream.
 *
 * @return Number of requests answered
 */
std::size_t ServeRequests(ToolDispatcher& dispatcher, std::istream& in, std::ostream& out);

} // namespace tools
} // namespace quantlab
