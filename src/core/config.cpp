/**
 * @file config.cpp
 * @brief Layered configuration: defaults, JSON file, environment
 *
 * Command-line overrides are applied on top of these by main().
 *
 * @date 2025
 */

#include "quantlab/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace quantlab {
namespace core {

namespace {

std::chrono::milliseconds Seconds(const json& value) {
    return std::chrono::milliseconds(static_cast<long long>(value.get<double>() * 1000.0));
}

long long ParseInteger(const char* name, const char* raw) {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (raw[consumed] != '\0') {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    }
    catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid value for ") + name + ": " + raw);
    }
}

void ApplySessionJson(SessionParams& params, const json& j) {
    if (j.contains("launcher")) params.launcher = ParseLauncher(j["launcher"].get<std::string>());
    if (j.contains("image")) params.image = j["image"].get<std::string>();
    if (j.contains("memory_limit_mb")) params.memory_limit_mb = j["memory_limit_mb"].get<std::size_t>();
    if (j.contains("cpu_limit")) params.cpu_limit = j["cpu_limit"].get<double>();
    if (j.contains("default_timeout_seconds")) params.default_timeout = Seconds(j["default_timeout_seconds"]);
    if (j.contains("attempt_overhead_seconds")) params.attempt_overhead = Seconds(j["attempt_overhead_seconds"]);
    if (j.contains("relocation_delay_seconds")) params.relocation_delay = Seconds(j["relocation_delay_seconds"]);
    if (j.contains("strategies")) params.strategies = j["strategies"].get<std::vector<std::string>>();
    if (j.contains("organization_id")) params.organization_id = j["organization_id"].get<std::string>();
}

} // anonymous namespace

void ApplyJson(QuantlabConfig& config, const json& j) {
    try {
        if (j.contains("manager")) {
            const auto& m = j["manager"];
            if (m.contains("max_sessions")) config.manager.max_sessions = m["max_sessions"].get<std::size_t>();
            if (m.contains("session_timeout_seconds")) config.manager.session_timeout = Seconds(m["session_timeout_seconds"]);
            if (m.contains("cleanup_interval_seconds")) config.manager.cleanup_interval = Seconds(m["cleanup_interval_seconds"]);
            if (m.contains("base_port")) config.manager.base_port = m["base_port"].get<int>();
        }

        if (j.contains("session")) {
            ApplySessionJson(config.manager.default_params, j["session"]);
        }

        if (j.contains("security")) {
            const auto& s = j["security"];
            if (s.contains("max_code_bytes")) config.guard.max_code_bytes = s["max_code_bytes"].get<std::size_t>();
            if (s.contains("dangerous_patterns")) {
                config.guard.dangerous_patterns = s["dangerous_patterns"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            if (l.contains("level")) config.log_level = l["level"].get<std::string>();
            if (l.contains("file")) config.log_file = std::filesystem::path(l["file"].get<std::string>());
        }

        if (j.contains("runtime")) {
            const auto& r = j["runtime"];
            if (r.contains("engine")) config.container_engine = r["engine"].get<std::string>();
            if (r.contains("lean_binary")) config.lean_binary = r["lean_binary"].get<std::string>();
        }
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }
    catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }
}

void LoadConfigFile(QuantlabConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    ApplyJson(config, j);
    spdlog::debug("Loaded configuration from {}", path.string());
}

void ApplyEnvironment(QuantlabConfig& config, const EnvLookup& lookup) {
    EnvLookup get = lookup ? lookup : EnvLookup([](const char* name) { return std::getenv(name); });

    if (const char* port = get("QUANTBOOK_DOCKER_PORT")) {
        config.manager.base_port = static_cast<int>(ParseInteger("QUANTBOOK_DOCKER_PORT", port));
    }
    if (const char* org = get("QUANTCONNECT_ORGANIZATION_ID")) {
        if (*org != '\0') {
            config.manager.default_params.organization_id = std::string(org);
        }
    }
    if (const char* max_sessions = get("QUANTLAB_MAX_SESSIONS")) {
        config.manager.max_sessions =
            static_cast<std::size_t>(ParseInteger("QUANTLAB_MAX_SESSIONS", max_sessions));
    }
    if (const char* timeout = get("QUANTLAB_SESSION_TIMEOUT")) {
        config.manager.session_timeout =
            std::chrono::seconds(ParseInteger("QUANTLAB_SESSION_TIMEOUT", timeout));
    }
    if (const char* level = get("QUANTLAB_LOG_LEVEL")) {
        config.log_level = level;
    }
}

void ValidateConfig(const QuantlabConfig& config) {
    if (config.manager.max_sessions == 0) {
        throw std::runtime_error("max_sessions must be at least 1");
    }
    if (config.manager.base_port <= 0 || config.manager.base_port > 65535) {
        throw std::runtime_error("base_port must be between 1 and 65535");
    }
    if (config.manager.cleanup_interval.count() <= 0) {
        throw std::runtime_error("cleanup_interval must be positive");
    }
    if (config.manager.default_params.strategies.empty()) {
        throw std::runtime_error("At least one execution strategy is required");
    }
    for (const auto& name : config.manager.default_params.strategies) {
        if (name != "kernel" && name != "interpreter" && name != "render") {
            throw std::runtime_error("Unknown execution strategy: " + name);
        }
    }
    if (config.container_engine != "docker" && config.container_engine != "podman") {
        throw std::runtime_error("Unknown container engine: " + config.container_engine);
    }
}

} // namespace core
} // namespace quantlab
