#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace mcpconn {

/// Library logger ("mcpconn"). Writes to stderr: stdout may carry MCP
/// traffic when the host process is itself a stdio server.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
/// "critical", "off"), case-insensitive. "warning" is accepted as "warn".
/// Throws ConfigurationError on anything else.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name);

/// Process-wide: every registry shares the "mcpconn" logger.
void set_log_level(spdlog::level::level_enum level);

} // namespace mcpconn
