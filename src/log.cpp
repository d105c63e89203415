// =============================================================================
// log.cpp - Shared spdlog logger
// =============================================================================

#include "gasopt/log.hpp"
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gasopt::log {

namespace {
constexpr const char* LOGGER_NAME = "gasopt";
std::mutex create_mutex;
}

std::shared_ptr<spdlog::logger> get() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(create_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

bool set_level(std::string_view level) {
    std::string name{level};
    auto parsed = spdlog::level::from_str(name);

    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }

    get()->set_level(parsed);
    return true;
}

} // namespace gasopt::log
