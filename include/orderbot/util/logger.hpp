#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace orderbot {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

const char* log_level_name(LogLevel level);

// Accepts "debug", "info", "warn"/"warning", "error" in any case
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * Sink for diagnostic messages. Messages below the minimum level are
 * dropped before they reach write().
 */
class Logger {
public:
    virtual ~Logger() = default;

    void log(LogLevel level, const std::string& message) {
        if (level >= min_level_) {
            write(level, message);
        }
    }

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

protected:
    virtual void write(LogLevel level, const std::string& message) = 0;

private:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Line-oriented logger: "HH:MM:SS LEVEL component: message".
 * Writes to stderr unless another stream is given; the stream must
 * outlive the logger.
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::string component = "");
    ConsoleLogger(std::string component, std::ostream& out);

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::string component_;
    std::ostream& out_;
};

class NullLogger : public Logger {
protected:
    void write(LogLevel, const std::string&) override {}
};

using LoggerPtr = std::shared_ptr<Logger>;

LoggerPtr make_null_logger();
LoggerPtr make_console_logger(const std::string& component, LogLevel min_level);

}  // namespace orderbot
