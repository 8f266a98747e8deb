#include <orderbot/config.hpp>
#include <orderbot/util/text.hpp>

#include <cstdlib>
#include <string>

namespace orderbot {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

}  // namespace

Config Config::from_env() {
    Config config;

    if (const char* menu = env("ORDERBOT_MENU_PATH")) {
        config.menu_path = menu;
    }
    if (const char* state = env("ORDERBOT_STATE_PATH")) {
        config.state_path = state;
    }
    if (const char* limit = env("ORDERBOT_HISTORY_LIMIT")) {
        int n = text::parse_positive_int(limit);
        if (n > 0) {
            config.history_limit = static_cast<size_t>(n);
        }
    }
    if (const char* verbose = env("ORDERBOT_VERBOSE")) {
        std::string v = text::to_lower(verbose);
        config.verbose = (v == "1" || v == "true" || v == "yes");
    }
    if (const char* level = env("ORDERBOT_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(level)) {
            config.log_level = *parsed;
        }
    }

    return config;
}

}  // namespace orderbot
