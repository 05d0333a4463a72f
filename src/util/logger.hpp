#ifndef TOKENVAULT_UTIL_LOGGER_HPP
#define TOKENVAULT_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for TokenVault.
 *
 * Console lines go to stderr so that tools printing tokenized text on stdout
 * keep a clean output stream.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::debug("Debug message");
 *   - logger::enableFileOutput("tokenvault.log");
 *
 * Never pass a real (sensitive) value to the logger. Use
 * util::hashing::fingerprint() to identify a value in a log line.
 */

namespace tokenvault {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name as found in config files ("debug", "Info", "WARN"...).
 * @throw std::runtime_error for an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output, optional console output
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Turn console (stderr) output on or off. File output is unaffected.
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, "DEBUG", msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, "INFO", msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, "WARN", msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, "ERROR", msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO),
          consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const char *levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }
        if (!consoleEnabled_ && !fileStream_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName << "] " << msg << '\n';

        if (consoleEnabled_) {
            std::cerr << line.str();
            std::cerr.flush();
        }
        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }

inline void setConsoleOutput(bool enabled) { Logger::getInstance().setConsoleOutput(enabled); }

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace tokenvault

#endif // TOKENVAULT_UTIL_LOGGER_HPP
