#include "schedfmt/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace schedfmt {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::once_flag g_default_init;

    auto to_spdlog_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    // A second init replaces the logger registered under the same name.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    g_logger->set_level(to_spdlog_level(level));
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    std::call_once(g_default_init, [] {
        if (!g_logger) {
            init();
        }
    });
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(to_spdlog_level(level));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace schedfmt
