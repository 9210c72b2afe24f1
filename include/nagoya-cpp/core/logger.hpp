#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace nagoya_cpp {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Component logger names
inline constexpr const char* BUILD_LOGGER = "nagoya.build";
inline constexpr const char* ENGINE_LOGGER = "nagoya.engine";
inline constexpr const char* CONTAINER_LOGGER = "nagoya.container";

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogMessage&)>;

class Logger {
public:
    static Logger* getInstance(const std::string& name = BUILD_LOGGER);
    static void resetInstance(const std::string& name = BUILD_LOGGER);

    ~Logger();

    // Configuration methods
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isLevelEnabled(LogLevel level) const;
    void setPattern(const std::string& pattern);
    void setConsoleSinkEnabled(bool enabled);

    // Logging methods
    template <typename... Args>
    void trace(const std::string& format, Args&&... args);

    template <typename... Args>
    void debug(const std::string& format, Args&&... args);

    template <typename... Args>
    void info(const std::string& format, Args&&... args);

    template <typename... Args>
    void warning(const std::string& format, Args&&... args);

    template <typename... Args>
    void error(const std::string& format, Args&&... args);

    template <typename... Args>
    void critical(const std::string& format, Args&&... args);

    // Sink management
    void addSink(LogSink sink, LogLevel level = LogLevel::TRACE);
    void addFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::INFO);
    void clearSinks();

    void flush();
    std::string getName() const;

private:
    explicit Logger(std::string name);

    // Non-copyable, non-movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void log(LogLevel level, const std::string& message);
    void logToFile(const std::filesystem::path& file_path, const LogMessage& message);
    std::string formatMessage(const LogMessage& message) const;

    template <typename... Args>
    std::string formatString(const std::string& format, Args&&... args) const;

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    std::vector<SinkInfo> sinks_;
    std::unordered_map<std::string, std::unique_ptr<std::ofstream>> file_sinks_;
    std::mutex sinks_mutex_;
    std::mutex file_sinks_mutex_;
};

// Utility functions
std::string toString(LogLevel level);
LogLevel fromString(const std::string& level_str);

/**
 * @brief Case-insensitive level name lookup; empty for unknown names
 */
std::optional<LogLevel> parseLogLevel(const std::string& level_str);

/**
 * @brief Configure every component logger at once
 *
 * quiet keeps warnings and above, verbose enables debug output; verbose wins
 * when both are set.
 */
void setupLogging(bool quiet, bool verbose);
void setupLogging(LogLevel level);

/**
 * @brief Send every component logger to file_path, replacing earlier sinks
 */
void setupLogFile(const std::filesystem::path& file_path, LogLevel level = LogLevel::TRACE);
void setupLogPattern(const std::string& pattern);

// Template implementations
template <typename... Args>
void Logger::trace(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::TRACE)) {
        log(LogLevel::TRACE, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::debug(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::info(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::INFO)) {
        log(LogLevel::INFO, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::warning(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::WARNING)) {
        log(LogLevel::WARNING, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::error(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::ERROR)) {
        log(LogLevel::ERROR, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::critical(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::CRITICAL)) {
        log(LogLevel::CRITICAL, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
std::string Logger::formatString(const std::string& format, Args&&... args) const
{
    // Replace {} placeholders one by one
    std::string result = format;
    size_t pos = 0;
    auto format_arg = [&](auto&& arg) {
        size_t brace_pos = result.find("{}", pos);
        if (brace_pos != std::string::npos) {
            std::ostringstream oss;
            oss << arg;
            result.replace(brace_pos, 2, oss.str());
            pos = brace_pos + oss.str().length();
        }
    };

    (format_arg(args), ...);

    return result;
}

} // namespace nagoya_cpp
