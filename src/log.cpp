#include "toolbridge/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace toolbridge::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex create_mutex;
    static std::shared_ptr<spdlog::logger> cached;

    std::lock_guard<std::mutex> lock(create_mutex);
    if (cached) return cached;

    if (auto existing = spdlog::get(LOGGER_NAME)) {
        cached = existing;
    } else {
        cached = spdlog::stderr_color_mt(LOGGER_NAME);
        cached->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [t%t] %v");
        cached->set_level(spdlog::level::info);
    }
    return cached;
}

bool set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only accept "off" when asked for.
    if (parsed == spdlog::level::off && level != "off") return false;
    logger()->set_level(parsed);
    return true;
}

} // namespace toolbridge::log
