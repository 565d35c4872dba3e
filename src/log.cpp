#include "clink/log.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace clink::log {

namespace {

spdlog::level::level_enum levelFromEnv() {
    const char* env = std::getenv("CLINK_LOG_LEVEL");
    if (env == nullptr || *env == '\0') return spdlog::level::warn;
    return parseLevel(env);
}

std::shared_ptr<spdlog::logger> makeLogger() {
    if (auto existing = spdlog::get("clink")) return existing;
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("clink", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(levelFromEnv());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

spdlog::level::level_enum parseLevel(std::string_view name) {
    const std::string s(name);
    const auto level = spdlog::level::from_str(s);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && s != "off") return spdlog::level::warn;
    return level;
}

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = makeLogger();
    return instance;
}

} // namespace clink::log
