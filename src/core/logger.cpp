#include "scriptsign/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace scriptsign {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

auto parse_level(std::string_view level) -> spdlog::level::level_enum {
    // from_str maps anything it does not know to "off".
    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

} // anonymous namespace

void Logger::init(std::string_view name, std::string_view level) {
    const std::string logger_name(name);
    spdlog::drop(logger_name);

    g_logger = spdlog::stderr_color_mt(logger_name);
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    g_logger->flush_on(spdlog::level::warn);
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level));
}

void Logger::flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

} // namespace scriptsign
