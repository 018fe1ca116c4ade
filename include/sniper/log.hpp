// Sniper Taker Engine - Logging
// spdlog setup shared by the library and the tools

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace sniper::log {

// Installs the default "sniper" console logger at the given level
// ("trace", "debug", "info", "warn", "error", "critical", "off").
void init(std::string_view level);

// Named child logger sharing the default sinks, e.g. get("risk")
std::shared_ptr<spdlog::logger> get(std::string_view component);

}  // namespace sniper::log
