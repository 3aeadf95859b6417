#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace scriptsign {

/// Process-wide spdlog logger for the CLI.
///
/// stdout belongs to command results (a port number, a certificate table),
/// so every log line goes to stderr. Each subcommand calls init() once the
/// effective config is known; calling it again replaces the logger. LOG_*
/// before init() use a default logger at "info".
class Logger {
public:
    static void init(std::string_view name = "scriptsign", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Accepts spdlog level names plus "warn". Unknown names select "info".
    static void set_level(std::string_view level);
    static void flush();
};

} // namespace scriptsign

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::scriptsign::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::scriptsign::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::scriptsign::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::scriptsign::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::scriptsign::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::scriptsign::Logger::get(), __VA_ARGS__)
