#pragma once

// Standard
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

// seqan3
#include <seqan3/core/debug_stream.hpp>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/**
 * @brief Process wide log sink writing to seqan3::debug_stream.
 *
 * Messages below the configured level are dropped. A message at ERROR level terminates the
 * process with EXIT_FAILURE after it has been written.
 */
class Logger {
   public:
    Logger(Logger &&) = delete;
    auto operator=(Logger &&) -> Logger & = delete;
    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;
    ~Logger() = default;

    static auto getInstance() -> Logger & {
        static Logger instance;  // Singleton instance
        return instance;
    }

    static auto parseLogLevel(const std::string &logLevelString) -> std::optional<LogLevel> {
        static const std::map<std::string, LogLevel> stringToLogLevelMap{
            {"debug", LogLevel::DEBUG},     {"DEBUG", LogLevel::DEBUG},
            {"info", LogLevel::INFO},       {"INFO", LogLevel::INFO},
            {"warning", LogLevel::WARNING}, {"WARNING", LogLevel::WARNING},
            {"error", LogLevel::ERROR},     {"ERROR", LogLevel::ERROR}};

        auto iterator = stringToLogLevelMap.find(logLevelString);
        if (iterator == stringToLogLevelMap.end()) {
            return std::nullopt;
        }
        return iterator->second;
    }

    static void setLogLevel(const std::string &logLevelString) {
        const auto level = parseLogLevel(logLevelString);
        if (level.has_value()) {
            setLogLevel(level.value());
        } else {
            log(LogLevel::ERROR, "Invalid log level: ", logLevelString);
        }
    }

    static void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(getInstance().logMutex);
        getInstance().logLevel = level;
    }

    template <typename... Args>
    static void log(LogLevel level, Args &&...args) {
        {
            std::lock_guard<std::mutex> lock(getInstance().logMutex);
            if (level < getInstance().logLevel) {
                return;
            }
            seqan3::debug_stream << getTime() << " GarNet: " << levelName(level) << " - ";
            (seqan3::debug_stream << ... << std::forward<Args>(args)) << "\n";
        }

        if (level == LogLevel::ERROR) {
            exit(EXIT_FAILURE);
        }
    }

   private:
    Logger() = default;

    LogLevel logLevel{LogLevel::INFO};
    std::mutex logMutex;

    static auto levelName(LogLevel level) -> const char * {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
        }
        return "";
    }

    static auto getTime() -> std::string {
        const auto now = std::chrono::system_clock::now();
        const std::time_t current_time = std::chrono::system_clock::to_time_t(now);

        std::ostringstream time_stream;
        time_stream << std::put_time(std::localtime(&current_time), "[%Y-%m-%d %H:%M:%S]");

        return time_stream.str();
    };
};
