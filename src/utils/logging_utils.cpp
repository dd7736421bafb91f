/**
 * @file logging_utils.cpp
 * @brief spdlog sink setup and named logger registry
 *
 * All loggers share the same sinks: colored stderr plus an optional file.
 * stdout is left free for tool responses.
 *
 * @date 2025
 */

#include "quantlab/utils/logging_utils.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <mutex>
#include <vector>

namespace quantlab {
namespace utils {

namespace {

// Logger creation is check-then-register; serialize it
std::mutex& RegistryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> CloneDefault(const std::string& name) {
    auto base = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(name, base->sinks().begin(), base->sinks().end());
    logger->set_level(base->level());
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> GetOrCreate(const std::string& name) {
    std::lock_guard<std::mutex> lock(RegistryMutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = CloneDefault(name);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum ParseLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

void ConfigureLogging(const std::string& level,
                      const std::optional<std::filesystem::path>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(ParseLogLevel(level));
    sinks.push_back(console_sink);

    if (log_file) {
        if (log_file->has_parent_path()) {
            std::filesystem::create_directories(log_file->parent_path());
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string());
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("quantlab", sinks.begin(), sinks.end());
    // Logger level is the lowest of the sink levels; sinks filter further
    logger->set_level(log_file ? std::min(spdlog::level::debug, ParseLogLevel(level))
                               : ParseLogLevel(level));
    logger->set_pattern(kLogPattern);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(RegistryMutex());
    spdlog::drop_all();
    spdlog::set_default_logger(logger);

    auto security = std::make_shared<spdlog::logger>(kSecurityLoggerName, sinks.begin(), sinks.end());
    security->set_level(logger->level());
    security->set_pattern(kLogPattern);
    security->flush_on(spdlog::level::info);
    spdlog::register_logger(security);
}

std::shared_ptr<spdlog::logger> GetSecurityLogger() {
    return GetOrCreate(kSecurityLoggerName);
}

std::shared_ptr<spdlog::logger> GetContainerLogger(const std::string& session_id) {
    return GetOrCreate(kContainerLoggerPrefix + session_id);
}

void DropContainerLogger(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    spdlog::drop(kContainerLoggerPrefix + session_id);
}

} // namespace utils
} // namespace quantlab
