#pragma once

#include "Platform.hpp"
#include "Types.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <spdlog/spdlog.h>
VD_DISABLE_WARNINGS_POP

#include <memory>
#include <mutex>

// ============================================================================
// Logging System Facade
// spdlog wrapper with multiple severity levels
// ============================================================================

namespace verdant {

/// Centralized logging system using spdlog backend
class VD_API Log {
public:
    /// Log severity levels
    enum class Level {
        Trace,    // Verbose debugging info
        Debug,    // Development-time diagnostic
        Info,     // General informational messages
        Warn,     // Warnings (dropped scenes, retries)
        Error,    // Errors (recoverable failures)
        Critical, // Critical errors (program-terminating)
        Off       // Disable logging
    };

    /// Initialize the logging system with console and file output
    /// @param logFilePath Optional path to log file (nullptr or "" = console only)
    /// @param level Minimum severity level to display
    static void Init(const char* logFilePath = "verdant.log", Level level = Level::Info);

    /// Shutdown the logging system (flushes buffers)
    static void Shutdown();

    /// Set the global log level at runtime
    static void SetLevel(Level level);

    /// Retrieve the current log level
    static Level GetLevel();

    /// Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
    static Optional<Level> ParseLevel(StringView name);

    // ========================================================================
    // Templated Logging Interface (supports fmt-style formatting)
    // ========================================================================

    template<typename... Args>
    static void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = GetLogger()) {
            logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

    /// Flush all log buffers immediately
    static void Flush();

private:
    /// Library code may log before Init() (tests, embedding); fall back to
    /// spdlog's default logger in that case. Callers hold their own reference,
    /// so a concurrent Shutdown() never frees a logger that is still in use.
    static std::shared_ptr<spdlog::logger> GetLogger() {
        {
            std::lock_guard lock(s_Mutex);
            if (s_Logger) {
                return s_Logger;
            }
        }
        return spdlog::default_logger();
    }

    static std::mutex s_Mutex;
    static std::shared_ptr<spdlog::logger> s_Logger;
};

} // namespace verdant

// ============================================================================
// Convenience Macros
// ============================================================================

#define VD_LOG_TRACE(...)    ::verdant::Log::Trace(__VA_ARGS__)
#define VD_LOG_DEBUG(...)    ::verdant::Log::Debug(__VA_ARGS__)
#define VD_LOG_INFO(...)     ::verdant::Log::Info(__VA_ARGS__)
#define VD_LOG_WARN(...)     ::verdant::Log::Warn(__VA_ARGS__)
#define VD_LOG_ERROR(...)    ::verdant::Log::Error(__VA_ARGS__)
#define VD_LOG_CRITICAL(...) ::verdant::Log::Critical(__VA_ARGS__)
