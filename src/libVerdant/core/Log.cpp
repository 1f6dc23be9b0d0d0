#include "Log.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
VD_DISABLE_WARNINGS_POP

#include <vector>

namespace verdant {

// Static member definitions
std::mutex Log::s_Mutex;
std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::Init(const char* logFilePath, Level level) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink goes to stderr: stdout carries the JSON summary line
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (logFilePath && logFilePath[0] != '\0') {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("Verdant", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace); // Capture all levels, filter below
    logger->flush_on(spdlog::level::err);

    {
        std::lock_guard lock(s_Mutex);
        if (s_Logger) {
            spdlog::drop(s_Logger->name());
        }
        s_Logger = logger;
    }

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    SetLevel(level);

    Info("Verdant logger initialized");
    Debug("Build: {}", BuildDescription());
}

void Log::Shutdown() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard lock(s_Mutex);
        logger = std::move(s_Logger);
    }
    if (!logger) {
        return;
    }

    logger->info("Shutting down logger...");
    logger->flush();
    spdlog::shutdown();
}

void Log::SetLevel(Level level) {
    auto logger = GetLogger();
    if (!logger) return;

    switch (level) {
        case Level::Trace:    logger->set_level(spdlog::level::trace); break;
        case Level::Debug:    logger->set_level(spdlog::level::debug); break;
        case Level::Info:     logger->set_level(spdlog::level::info); break;
        case Level::Warn:     logger->set_level(spdlog::level::warn); break;
        case Level::Error:    logger->set_level(spdlog::level::err); break;
        case Level::Critical: logger->set_level(spdlog::level::critical); break;
        case Level::Off:      logger->set_level(spdlog::level::off); break;
    }
}

Log::Level Log::GetLevel() {
    auto logger = GetLogger();
    if (!logger) return Level::Off;

    switch (logger->level()) {
        case spdlog::level::trace:    return Level::Trace;
        case spdlog::level::debug:    return Level::Debug;
        case spdlog::level::info:     return Level::Info;
        case spdlog::level::warn:     return Level::Warn;
        case spdlog::level::err:      return Level::Error;
        case spdlog::level::critical: return Level::Critical;
        default:                      return Level::Off;
    }
}

Optional<Log::Level> Log::ParseLevel(StringView name) {
    if (name == "trace")    return Level::Trace;
    if (name == "debug")    return Level::Debug;
    if (name == "info")     return Level::Info;
    if (name == "warn")     return Level::Warn;
    if (name == "error")    return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off")      return Level::Off;
    return std::nullopt;
}

void Log::Flush() {
    if (auto logger = GetLogger()) {
        logger->flush();
    }
}

} // namespace verdant
