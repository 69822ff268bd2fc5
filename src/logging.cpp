#include "mcpconn/logging.hpp"
#include "mcpconn/error.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <string>

namespace mcpconn {

namespace {
constexpr const char* LOGGER_NAME = "mcpconn";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            instance = existing;
            return;
        }
        instance = spdlog::stderr_color_mt(LOGGER_NAME);
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
        instance->set_level(spdlog::level::info);
    });
    return instance;
}

spdlog::level::level_enum parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") lower = "warn";
    if (lower == "fatal") lower = "critical";

    auto level = spdlog::level::from_str(lower);
    // from_str() maps unknown names to "off"; only accept "off" when asked for.
    if (level == spdlog::level::off && lower != "off") {
        throw ConfigurationError("Unknown log level: '" + std::string(name) + "'");
    }
    return level;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mcpconn
