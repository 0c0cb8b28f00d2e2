#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace toolbridge::log {

constexpr const char* LOGGER_NAME = "toolbridge";

/// The runtime's logger. Reuses a logger registered under LOGGER_NAME by the
/// host application, otherwise creates a stderr colour logger on first use.
/// stdout is never written to.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
/// "critical", "off"). Unknown names leave the level unchanged and return false.
bool set_level(const std::string& level);

} // namespace toolbridge::log
