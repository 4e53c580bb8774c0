#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace schedfmt {

/// Process-wide spdlog logger writing to stderr, so stdout carries only
/// command output. The first get() creates it at "info" level if init()
/// has not run.
///
/// init() replaces the logger without synchronisation and must not run
/// while other threads are logging. Call it once at startup; use
/// set_level() to adjust verbosity afterwards.
class Logger {
public:
    static void init(std::string_view name = "schedfmt", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace schedfmt

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::schedfmt::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::schedfmt::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::schedfmt::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::schedfmt::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::schedfmt::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::schedfmt::Logger::get(), __VA_ARGS__)
