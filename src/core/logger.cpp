#include <nagoya-cpp/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace nagoya_cpp {

// Static member definitions
std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::instances_;
std::mutex Logger::instances_mutex_;

Logger* Logger::getInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);

    auto it = instances_.find(name);
    if (it == instances_.end()) {
        it = instances_.emplace(name, std::unique_ptr<Logger>(new Logger(name))).first;
    }

    return it->second.get();
}

void Logger::resetInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);
    instances_.erase(name);
}

Logger::Logger(std::string name)
    : name_(std::move(name)), level_(LogLevel::INFO), pattern_("[%l] %n: %v"),
      console_sink_enabled_(true)
{}

Logger::~Logger()
{
    flush();

    std::lock_guard<std::mutex> lock(file_sinks_mutex_);
    file_sinks_.clear();
}

void Logger::setLevel(LogLevel level)
{
    level_ = level;
}

LogLevel Logger::getLevel() const
{
    return level_;
}

bool Logger::isLevelEnabled(LogLevel level) const
{
    return level >= level_.load();
}

void Logger::setPattern(const std::string& pattern)
{
    pattern_ = pattern;
}

void Logger::setConsoleSinkEnabled(bool enabled)
{
    console_sink_enabled_ = enabled;
}

void Logger::addSink(LogSink sink, LogLevel level)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back({std::move(sink), level});
}

void Logger::addFileSink(const std::filesystem::path& file_path, LogLevel level)
{
    {
        std::lock_guard<std::mutex> lock(file_sinks_mutex_);

        std::filesystem::path dir = file_path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        auto& file_stream = file_sinks_[file_path.string()];
        if (!file_stream) {
            file_stream = std::make_unique<std::ofstream>(file_path, std::ios::app);
            if (!file_stream->is_open()) {
                file_sinks_.erase(file_path.string());
                throw std::runtime_error("Failed to open log file: " + file_path.string());
            }
        }
    }

    addSink([this, file_path](const LogMessage& message) { logToFile(file_path, message); },
            level);
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();

    std::lock_guard<std::mutex> file_lock(file_sinks_mutex_);
    file_sinks_.clear();
}

void Logger::flush()
{
    std::lock_guard<std::mutex> file_lock(file_sinks_mutex_);
    for (auto& [path, stream] : file_sinks_) {
        if (stream && stream->is_open()) {
            stream->flush();
        }
    }
    std::cout.flush();
    std::cerr.flush();
}

std::string Logger::getName() const
{
    return name_;
}

void Logger::log(LogLevel level, const std::string& message)
{
    if (!isLevelEnabled(level)) {
        return;
    }

    LogMessage log_message;
    log_message.level = level;
    log_message.message = message;
    log_message.logger_name = name_;
    log_message.thread_id = std::this_thread::get_id();
    log_message.timestamp = std::chrono::system_clock::now();

    // Warnings and worse go to stderr so build output on stdout stays readable
    if (console_sink_enabled_) {
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << formatMessage(log_message) << std::endl;
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink_info : sinks_) {
        if (level >= sink_info.level) {
            sink_info.sink(log_message);
        }
    }
}

void Logger::logToFile(const std::filesystem::path& file_path, const LogMessage& message)
{
    std::lock_guard<std::mutex> lock(file_sinks_mutex_);

    auto it = file_sinks_.find(file_path.string());
    if (it != file_sinks_.end() && it->second && it->second->is_open()) {
        *it->second << formatMessage(message) << std::endl;
    }
}

std::string Logger::formatMessage(const LogMessage& message) const
{
    std::string result = pattern_;

    auto replace_token = [&result](const std::string& token, const std::string& value) {
        size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.length(), value);
            pos += value.length();
        }
    };

    replace_token("%l", toString(message.level));
    replace_token("%n", message.logger_name);

    if (result.find("%t") != std::string::npos) {
        auto time_t = std::chrono::system_clock::to_time_t(message.timestamp);
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        std::ostringstream time_stream;
        time_stream << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        replace_token("%t", time_stream.str());
    }

    if (result.find("%T") != std::string::npos) {
        std::ostringstream thread_stream;
        thread_stream << message.thread_id;
        replace_token("%T", thread_stream.str());
    }

    // Message last so that tokens inside the message text are left alone
    replace_token("%v", message.message);

    return result;
}

std::string toString(LogLevel level)
{
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& level_str)
{
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (LogLevel level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING,
                           LogLevel::ERROR, LogLevel::CRITICAL}) {
        if (upper_str == toString(level)) {
            return level;
        }
    }
    return std::nullopt;
}

LogLevel fromString(const std::string& level_str)
{
    // Default to INFO for invalid strings
    return parseLogLevel(level_str).value_or(LogLevel::INFO);
}

void setupLogging(LogLevel level)
{
    for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER, CONTAINER_LOGGER}) {
        Logger::getInstance(name)->setLevel(level);
    }
}

void setupLogging(bool quiet, bool verbose)
{
    if (verbose) {
        setupLogging(LogLevel::DEBUG);
    }
    else if (quiet) {
        setupLogging(LogLevel::WARNING);
    }
    else {
        setupLogging(LogLevel::INFO);
    }
}

void setupLogFile(const std::filesystem::path& file_path, LogLevel level)
{
    for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER, CONTAINER_LOGGER}) {
        Logger* logger = Logger::getInstance(name);
        logger->clearSinks();
        logger->addFileSink(file_path, level);
    }
}

void setupLogPattern(const std::string& pattern)
{
    for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER, CONTAINER_LOGGER}) {
        Logger::getInstance(name)->setPattern(pattern);
    }
}

} // namespace nagoya_cpp
