#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>
#include <atomic>

namespace handdeck {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
 */
LogLevel logLevelFromString(const std::string& name);

/**
 * Thread-safe logger shared by the classification path, the output
 * scheduler and the feedback receiver.
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_.store(level); }

    /**
     * Get current log level
     */
    LogLevel getLevel() const { return minLevel_.load(); }

    /**
     * Check whether a message at this level would be written
     */
    bool isEnabled(LogLevel level) const { return level >= minLevel_.load(); }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_.store(enable); }

    /**
     * Set log file (appends)
     */
    bool setLogFile(const std::string& filename);

    /**
     * Close log file
     */
    void closeLogFile();

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if console only
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path
     * @return Path to current log file, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    /**
     * Flush all pending log messages
     */
    void flush();

    /**
     * Log message
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    // Convenience methods
    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string levelToString(LogLevel level) const;
    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    std::atomic<LogLevel> minLevel_;
    std::atomic<bool> consoleOutput_;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

/**
 * Suppresses repeats of the same warning inside a time window.
 * Used on the MIDI send path where a dead port would otherwise
 * produce one line per control per tick.
 */
class LogThrottle {
public:
    explicit LogThrottle(std::chrono::milliseconds interval)
        : interval_(interval) {}

    /**
     * @return true if the caller should log now; counts suppressed calls otherwise
     */
    bool shouldLog();

    /**
     * Number of calls suppressed before the most recent permitted one
     */
    int suppressedCount() const { return reported_; }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_{};
    bool first_ = true;
    int suppressed_ = 0;
    int reported_ = 0;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(msg) handdeck::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) handdeck::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) handdeck::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) handdeck::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) handdeck::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) handdeck::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (Logger::getInstance().isEnabled(level_)) {
            Logger::getInstance().log(level_,
                component_.empty() ? stream_.str() : component_ + ": " + stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define HANDDECK_LOG_DEBUG(component) \
    handdeck::core::LogStream(handdeck::core::LogLevel::DEBUG, component)

#define HANDDECK_LOG_INFO(component) \
    handdeck::core::LogStream(handdeck::core::LogLevel::INFO, component)

#define HANDDECK_LOG_WARNING(component) \
    handdeck::core::LogStream(handdeck::core::LogLevel::WARNING, component)

#define HANDDECK_LOG_ERROR(component) \
    handdeck::core::LogStream(handdeck::core::LogLevel::ERROR, component)

#define HANDDECK_LOG_CRITICAL(component) \
    handdeck::core::LogStream(handdeck::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace handdeck
