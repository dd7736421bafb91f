#include "quantlab/tools/tool_dispatcher.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace quantlab;
using json = nlohmann::json;
using quantlab::fakes::StubRuntime;

namespace {

class ToolDispatcherTest : public ::testing::Test {
protected:
    ToolDispatcherTest()
        : manager_(Config(), fx.Deps()),
          dispatcher_(manager_) {}

    static core::ManagerConfig Config() {
        core::ManagerConfig config;
        config.max_sessions = 2;
        config.base_port = 9100;
        config.default_params = fakes::FastParams();
        return config;
    }

    fakes::Fixture fx;
    core::SessionManager manager_;
    tools::ToolDispatcher dispatcher_;
};

} // namespace

TEST_F(ToolDispatcherTest, RegistersAllTools) {
    auto names = dispatcher_.ToolNames();
    EXPECT_EQ(7u, names.size());
    EXPECT_EQ("check_quantbook_container", names.front());
}

TEST_F(ToolDispatcherTest, InitializeQuantbook) {
    auto response = dispatcher_.Call("initialize_quantbook", {{"instance_name", "research"},
                                                              {"memory_limit_mb", 4096}});

    EXPECT_EQ("success", response["status"].get<std::string>());
    EXPECT_EQ("research", response["instance_name"].get<std::string>());
    EXPECT_EQ(4096, response["container_info"]["memory_limit_mb"].get<int>());
    EXPECT_EQ(9100, response["container_info"]["port"].get<int>());
    EXPECT_FALSE(response.contains("note"));
    EXPECT_NE(nullptr, manager_.GetSession("research"));
}

TEST_F(ToolDispatcherTest, InitializeReportsStartingContainer) {
    fx.runtime->SetExecHandler([](const std::string&, const std::vector<std::string>&) {
        return StubRuntime::Fail(1, "kernel not ready");
    });

    auto response = dispatcher_.Call("initialize_quantbook", json::object());
    EXPECT_EQ("success", response["status"].get<std::string>());
    EXPECT_EQ("default", response["instance_name"].get<std::string>());
    EXPECT_TRUE(response.contains("note"));
}

TEST_F(ToolDispatcherTest, InitializeFailureIsAnError) {
    fx.tool->installed = false;
    auto response = dispatcher_.Call("initialize_quantbook", json::object());
    EXPECT_EQ("error", response["status"].get<std::string>());
    EXPECT_NE(std::string::npos, response["error"].get<std::string>().find("Lean CLI"));
}

TEST_F(ToolDispatcherTest, CapacityErrorIsReported) {
    dispatcher_.Call("initialize_quantbook", {{"instance_name", "a"}});
    dispatcher_.Call("initialize_quantbook", {{"instance_name", "b"}});
    auto response = dispatcher_.Call("initialize_quantbook", {{"instance_name", "c"}});
    EXPECT_EQ("error", response["status"].get<std::string>());
    EXPECT_EQ("Maximum number of sessions (2) reached", response["error"].get<std::string>());
}

TEST_F(ToolDispatcherTest, ExecuteQuantbookCode) {
    fx.runtime->SetExecHandler([](const std::string&, const std::vector<std::string>&) {
        return StubRuntime::Ok("3\n");
    });
    dispatcher_.Call("initialize_quantbook", json::object());

    auto response = dispatcher_.Call("execute_quantbook_code", {{"code", "print(1 + 2)"}, {"timeout", 30}});
    EXPECT_EQ("success", response["status"].get<std::string>());
    EXPECT_EQ("3", response["output"].get<std::string>());
    EXPECT_EQ("default", response["instance_name"].get<std::string>());
    EXPECT_EQ("kernel", response["execution_method"].get<std::string>());
}

TEST_F(ToolDispatcherTest, ExecuteWithoutInstance) {
    auto response = dispatcher_.Call("execute_quantbook_code", {{"code", "print(1)"}});
    EXPECT_EQ("error", response["status"].get<std::string>());
    EXPECT_EQ("Initialize a QuantBook instance first using initialize_quantbook",
              response["message"].get<std::string>());
    EXPECT_TRUE(response["available_instances"].empty());
}

TEST_F(ToolDispatcherTest, ExecuteRequiresCode) {
    auto response = dispatcher_.Call("execute_quantbook_code", json::object());
    EXPECT_EQ("error", response["status"].get<std::string>());
}

TEST_F(ToolDispatcherTest, ListAndRemoveInstances) {
    dispatcher_.Call("initialize_quantbook", {{"instance_name", "a"}});
    dispatcher_.Call("initialize_quantbook", {{"instance_name", "b"}});

    auto listing = dispatcher_.Call("list_quantbook_instances", json::object());
    EXPECT_EQ(2, listing["count"].get<int>());
    EXPECT_EQ(0, listing["capacity"]["available_slots"].get<int>());
    EXPECT_EQ(2u, listing["session_details"].size());

    auto removed = dispatcher_.Call("remove_quantbook_instance", {{"instance_name", "a"}});
    EXPECT_EQ("success", removed["status"].get<std::string>());
    EXPECT_EQ(json::array({"b"}), removed["remaining_instances"]);

    auto again = dispatcher_.Call("remove_quantbook_instance", {{"instance_name", "a"}});
    EXPECT_EQ("error", again["status"].get<std::string>());
}

TEST_F(ToolDispatcherTest, QuantbookInfoAndContainerCheck) {
    dispatcher_.Call("initialize_quantbook", json::object());

    auto info = dispatcher_.Call("get_quantbook_info", json::object());
    EXPECT_EQ("success", info["status"].get<std::string>());
    EXPECT_EQ(9100, info["container_info"]["port"].get<int>());
    EXPECT_TRUE(info.contains("execution_result"));

    auto check = dispatcher_.Call("check_quantbook_container", json::object());
    EXPECT_TRUE(check["container_found"].get<bool>());
    EXPECT_EQ("http://localhost:9100", check["jupyter_url"].get<std::string>());

    auto missing = dispatcher_.Call("get_quantbook_info", {{"instance_name", "nope"}});
    EXPECT_EQ("error", missing["status"].get<std::string>());
}

TEST_F(ToolDispatcherTest, ManagerStatus) {
    auto status = dispatcher_.Call("get_session_manager_status", json::object());
    EXPECT_EQ("success", status["status"].get<std::string>());
    EXPECT_FALSE(status["running"].get<bool>());
    EXPECT_EQ(2, status["configuration"]["max_sessions"].get<int>());
    EXPECT_DOUBLE_EQ(1.0, status["configuration"]["session_timeout_hours"].get<double>());
    EXPECT_EQ(300, status["configuration"]["cleanup_interval_seconds"].get<int>());
}

TEST_F(ToolDispatcherTest, DispatchEchoesIdAndRejectsUnknownTools) {
    auto response = dispatcher_.Dispatch({{"id", 7}, {"tool", "launch_rockets"}});
    EXPECT_EQ(7, response["id"].get<int>());
    EXPECT_EQ("error", response["status"].get<std::string>());
    EXPECT_EQ(7u, response["available_tools"].size());

    auto malformed = dispatcher_.Dispatch(json::array({1, 2}));
    EXPECT_EQ("error", malformed["status"].get<std::string>());

    auto bad_args = dispatcher_.Dispatch({{"tool", "initialize_quantbook"},
                                          {"arguments", {{"memory_limit_mb", "lots"}}}});
    EXPECT_EQ("error", bad_args["status"].get<std::string>());
}

TEST_F(ToolDispatcherTest, BinaryOutputStillSerializes) {
    fx.runtime->SetExecHandler([](const std::string&, const std::vector<std::string>&) {
        return StubRuntime::Ok("bytes: \xff\xfe\n");
    });
    dispatcher_.Call("initialize_quantbook", json::object());

    auto response = dispatcher_.Dispatch({{"tool", "execute_quantbook_code"},
                                          {"arguments", {{"code", "sys.stdout.buffer.write(b'\\xff')"}}}});
    EXPECT_EQ("success", response["status"].get<std::string>());
    EXPECT_EQ("bytes: \xEF\xBF\xBD\xEF\xBF\xBD", response["output"].get<std::string>());
    EXPECT_NO_THROW(response.dump());
}

TEST_F(ToolDispatcherTest, ServeRequestsAnswersEveryLine) {
    fx.runtime->SetExecHandler([](const std::string&, const std::vector<std::string>&) {
        return StubRuntime::Ok("\xff\n");
    });

    std::istringstream in(
        "{\"id\": 1, \"tool\": \"initialize_quantbook\", \"arguments\": {}}\n"
        "\n"
        "not json\n"
        "{\"id\": 2, \"tool\": \"execute_quantbook_code\", \"arguments\": {\"code\": \"print(1)\"}}\n"
        "{\"id\": 3, \"tool\": \"get_session_manager_status\"}\n");
    std::ostringstream out;

    EXPECT_EQ(4u, tools::ServeRequests(dispatcher_, in, out));

    std::istringstream lines(out.str());
    std::vector<json> responses;
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }

    ASSERT_EQ(4u, responses.size());
    EXPECT_EQ(1, responses[0]["id"].get<int>());
    EXPECT_EQ("error", responses[1]["status"].get<std::string>());
    EXPECT_EQ(2, responses[2]["id"].get<int>());
    EXPECT_EQ("success", responses[2]["status"].get<std::string>());
    EXPECT_EQ(3, responses[3]["id"].get<int>());
    EXPECT_EQ("success", responses[3]["status"].get<std::string>());
}
