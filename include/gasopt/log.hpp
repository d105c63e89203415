#ifndef GASOPT_LOG_HPP
#define GASOPT_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gasopt::log {

// Shared "gasopt" logger, created on first use.
std::shared_ptr<spdlog::logger> get();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names leave the level unchanged and return false.
bool set_level(std::string_view level);

} // namespace gasopt::log

#endif // GASOPT_LOG_HPP
