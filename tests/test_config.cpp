#include "quantlab/core/config.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <map>

using namespace quantlab;
using json = nlohmann::json;

namespace {

core::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
    auto storage = std::make_shared<std::map<std::string, std::string>>(std::move(values));
    return [storage](const char* name) -> const char* {
        auto it = storage->find(name);
        return it == storage->end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    core::QuantlabConfig config;
    EXPECT_NO_THROW(core::ValidateConfig(config));
    EXPECT_EQ(10u, config.manager.max_sessions);
    EXPECT_EQ(std::chrono::hours(1), config.manager.session_timeout);
    EXPECT_EQ(std::chrono::minutes(5), config.manager.cleanup_interval);
    EXPECT_EQ(8888, config.manager.base_port);
    EXPECT_EQ(50000u, config.guard.max_code_bytes);
    EXPECT_EQ("info", config.log_level);
}

TEST(ConfigTest, ApplyJsonOverridesSections) {
    core::QuantlabConfig config;
    core::ApplyJson(config, json::parse(R"({
        "manager": {"max_sessions": 4, "session_timeout_seconds": 1800,
                    "cleanup_interval_seconds": 120, "base_port": 8890},
        "session": {"launcher": "direct", "memory_limit_mb": 4096, "cpu_limit": 2.0,
                    "default_timeout_seconds": 60, "strategies": ["render"],
                    "organization_id": "org"},
        "security": {"max_code_bytes": 1000, "dangerous_patterns": ["socket"]},
        "logging": {"level": "debug", "file": "/tmp/quantlab.log"},
        "runtime": {"engine": "podman", "lean_binary": "/opt/lean"},
        "unknown": {"ignored": true}
    })"));

    EXPECT_EQ(4u, config.manager.max_sessions);
    EXPECT_EQ(std::chrono::seconds(1800), config.manager.session_timeout);
    EXPECT_EQ(std::chrono::seconds(120), config.manager.cleanup_interval);
    EXPECT_EQ(8890, config.manager.base_port);

    const auto& params = config.manager.default_params;
    EXPECT_EQ(core::LauncherKind::DIRECT_CONTAINER, params.launcher);
    EXPECT_EQ(4096u, params.memory_limit_mb);
    EXPECT_DOUBLE_EQ(2.0, params.cpu_limit);
    EXPECT_EQ(std::chrono::seconds(60), params.default_timeout);
    EXPECT_EQ(std::vector<std::string>{"render"}, params.strategies);
    EXPECT_EQ("org", params.organization_id.value_or(""));

    EXPECT_EQ(1000u, config.guard.max_code_bytes);
    EXPECT_EQ(std::vector<std::string>{"socket"}, config.guard.dangerous_patterns);
    EXPECT_EQ("debug", config.log_level);
    EXPECT_EQ("/tmp/quantlab.log", config.log_file.value_or("").string());
    EXPECT_EQ("podman", config.container_engine);
    EXPECT_EQ("/opt/lean", config.lean_binary);

    EXPECT_NO_THROW(core::ValidateConfig(config));
}

TEST(ConfigTest, WrongTypesAreRejected) {
    core::QuantlabConfig config;
    EXPECT_THROW(core::ApplyJson(config, json::parse(R"({"manager": {"max_sessions": "many"}})")),
                 std::runtime_error);
    EXPECT_THROW(core::ApplyJson(config, json::parse(R"({"session": {"launcher": "kubernetes"}})")),
                 std::runtime_error);
}

TEST(ConfigTest, LoadConfigFile) {
    auto dir = fakes::ScratchDir("config");
    auto path = dir / "quantlab.json";
    std::ofstream(path) << R"({"manager": {"max_sessions": 3}})";

    core::QuantlabConfig config;
    core::LoadConfigFile(config, path);
    EXPECT_EQ(3u, config.manager.max_sessions);

    std::ofstream(path, std::ios::trunc) << "{broken";
    EXPECT_THROW(core::LoadConfigFile(config, path), std::runtime_error);
    EXPECT_THROW(core::LoadConfigFile(config, dir / "missing.json"), std::runtime_error);

    std::filesystem::remove_all(dir);
}

TEST(ConfigTest, EnvironmentOverrides) {
    core::QuantlabConfig config;
    core::ApplyEnvironment(config, FakeEnv({
        {"QUANTBOOK_DOCKER_PORT", "9999"},
        {"QUANTCONNECT_ORGANIZATION_ID", "org-7"},
        {"QUANTLAB_MAX_SESSIONS", "2"},
        {"QUANTLAB_SESSION_TIMEOUT", "60"},
        {"QUANTLAB_LOG_LEVEL", "warn"}
    }));

    EXPECT_EQ(9999, config.manager.base_port);
    EXPECT_EQ("org-7", config.manager.default_params.organization_id.value_or(""));
    EXPECT_EQ(2u, config.manager.max_sessions);
    EXPECT_EQ(std::chrono::seconds(60), config.manager.session_timeout);
    EXPECT_EQ("warn", config.log_level);
}

TEST(ConfigTest, EmptyOrganizationIsIgnored) {
    core::QuantlabConfig config;
    core::ApplyEnvironment(config, FakeEnv({{"QUANTCONNECT_ORGANIZATION_ID", ""}}));
    EXPECT_FALSE(config.manager.default_params.organization_id.has_value());
}

TEST(ConfigTest, NonNumericEnvironmentValueThrows) {
    core::QuantlabConfig config;
    EXPECT_THROW(core::ApplyEnvironment(config, FakeEnv({{"QUANTBOOK_DOCKER_PORT", "88x"}})),
                 std::runtime_error);
}

TEST(ConfigTest, ValidationCatchesBadValues) {
    core::QuantlabConfig config;
    config.manager.max_sessions = 0;
    EXPECT_THROW(core::ValidateConfig(config), std::runtime_error);

    config = core::QuantlabConfig{};
    config.manager.base_port = 70000;
    EXPECT_THROW(core::ValidateConfig(config), std::runtime_error);

    config = core::QuantlabConfig{};
    config.manager.default_params.strategies = {"kernel", "papermill"};
    EXPECT_THROW(core::ValidateConfig(config), std::runtime_error);

    config = core::QuantlabConfig{};
    config.manager.default_params.strategies.clear();
    EXPECT_THROW(core::ValidateConfig(config), std::runtime_error);

    config = core::QuantlabConfig{};
    config.container_engine = "lxc";
    EXPECT_THROW(core::ValidateConfig(config), std::runtime_error);
}
