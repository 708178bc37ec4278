#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the queue engine.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace soulsync::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Output sinks:
 * - Console output with colors
 * - Rotating file output (skipped when fileOutput is false)
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = ./logs)
     * @param fileOutput Also write a rotating log file
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "",
                   bool fileOutput = true) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (fileOutput) {
                std::filesystem::path logPath = logDir.empty()
                    ? std::filesystem::current_path() / "logs" / "soulsync-queue.log"
                    : std::filesystem::path(logDir) / "soulsync-queue.log";

                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    true              // Rotate on open
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>("soulsync", sinks.begin(), sinks.end());
            logger->set_level(toSpdlogLevel(level));
            logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(logger);
            spdlog::flush_every(std::chrono::seconds(3));

            m_logger = logger;

        } catch (const std::exception& ex) {
            // filesystem_error from create_directories lands here too
            m_logger = spdlog::stderr_color_mt("soulsync_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Parse a level name from configuration ("debug", "warn", ...)
     * @param name Level name, case-insensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel levelFromString(std::string name, LogLevel fallback = LogLevel::Info) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return fallback;
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace soulsync::core

// Convenience macros
#define SOULSYNC_LOG_TRACE(...)    soulsync::core::Logger::instance().trace(__VA_ARGS__)
#define SOULSYNC_LOG_DEBUG(...)    soulsync::core::Logger::instance().debug(__VA_ARGS__)
#define SOULSYNC_LOG_INFO(...)     soulsync::core::Logger::instance().info(__VA_ARGS__)
#define SOULSYNC_LOG_WARN(...)     soulsync::core::Logger::instance().warn(__VA_ARGS__)
#define SOULSYNC_LOG_ERROR(...)    soulsync::core::Logger::instance().error(__VA_ARGS__)
#define SOULSYNC_LOG_CRITICAL(...) soulsync::core::Logger::instance().critical(__VA_ARGS__)
