#include <orderbot/util/logger.hpp>
#include <orderbot/util/text.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace orderbot {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = text::to_lower(text::trim(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARNING;
    if (n == "error") return LogLevel::ERROR;
    return std::nullopt;
}

// ============================================================================
// ConsoleLogger
// ============================================================================

ConsoleLogger::ConsoleLogger(std::string component)
    : ConsoleLogger(std::move(component), std::cerr) {}

ConsoleLogger::ConsoleLogger(std::string component, std::ostream& out)
    : component_(std::move(component)), out_(out) {}

void ConsoleLogger::write(LogLevel level, const std::string& message) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    out_ << std::put_time(&local, "%H:%M:%S") << ' ' << log_level_name(level) << ' ';
    if (!component_.empty()) {
        out_ << component_ << ": ";
    }
    out_ << message << '\n';
    out_.flush();
}

// ============================================================================
// Factories
// ============================================================================

LoggerPtr make_null_logger() {
    return std::make_shared<NullLogger>();
}

LoggerPtr make_console_logger(const std::string& component, LogLevel min_level) {
    auto logger = std::make_shared<ConsoleLogger>(component);
    logger->set_min_level(min_level);
    return logger;
}

}  // namespace orderbot
