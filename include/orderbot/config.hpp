#pragma once

#include <orderbot/util/logger.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace orderbot {

namespace fs = std::filesystem;

/**
 * Runtime configuration for the dialogue engine and its stores.
 */
struct Config {
    fs::path menu_path;                 // JSON menu; empty uses the built-in menu
    fs::path state_path;                // JSON state snapshot; empty keeps state in memory
    size_t history_limit = 20;          // History entries loaded per turn
    size_t prompt_history = 10;         // History entries shown to the reply generator
    size_t max_recommendations = 2;
    std::chrono::seconds suggestion_ttl{300};
    int max_clarification_attempts = 3;
    bool verbose = false;
    LogLevel log_level = LogLevel::WARNING;    // DEBUG when verbose

    LogLevel effective_log_level() const { return verbose ? LogLevel::DEBUG : log_level; }

    /**
     * Build a config from ORDERBOT_* environment variables, starting
     * from the defaults above. Unparseable numeric values are ignored.
     */
    static Config from_env();
};

}  // namespace orderbot
