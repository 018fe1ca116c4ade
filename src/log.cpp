// Sniper Taker Engine - Logging Implementation

#include <sniper/log.hpp>
#include <sniper/errors.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace sniper::log {

namespace {

constexpr const char* PATTERN = "%H:%M:%S [%l] %n: %v";

std::mutex g_registry_mutex;

std::shared_ptr<spdlog::logger> root_logger() {
    auto root = spdlog::default_logger();
    if (!root || root->name() != "sniper") {
        root = spdlog::stdout_color_mt("sniper");
        root->set_pattern(PATTERN);
        spdlog::set_default_logger(root);
    }
    return root;
}

}  // namespace

void init(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + std::string(level));
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);
    auto root = root_logger();
    root->set_level(parsed);
    spdlog::set_level(parsed);
}

std::shared_ptr<spdlog::logger> get(std::string_view component) {
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    std::string name(component);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto root = root_logger();
    auto logger = std::make_shared<spdlog::logger>(
        name, root->sinks().begin(), root->sinks().end());
    logger->set_pattern(PATTERN);
    logger->set_level(root->level());
    spdlog::register_logger(logger);
    return logger;
}

}  // namespace sniper::log
