#include <gtest/gtest.h>
#include <orderbot/config.hpp>
#include <orderbot/language_detector.hpp>
#include <orderbot/result.hpp>
#include <orderbot/util/logger.hpp>
#include <orderbot/util/text.hpp>

#include <cstdlib>
#include <sstream>

using namespace orderbot;

// ============================================================================
// Result / Error
// ============================================================================

TEST(ResultTest, ValueAndError) {
    Result<int> good = 7;
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.value(), 7);
    EXPECT_EQ(good.error_code(), ErrorCode::OK);

    Result<int> bad = Error(ErrorCode::EMPTY_CART, "nothing to check out");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.value_or(-1), -1);
    EXPECT_EQ(bad.error().to_string(), "EMPTY_CART: nothing to check out");
    EXPECT_THROW(bad.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(Ok().ok());

    Result<void> failed(ErrorCode::IO_ERROR, "disk full");
    EXPECT_FALSE(failed.ok());
    EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST(ResultTest, ErrorContext) {
    Error e(ErrorCode::CORRUPTION, "Invalid JSON in menu.json");
    Error wrapped = e.with_context("Loading menu");
    EXPECT_EQ(wrapped.code(), ErrorCode::CORRUPTION);
    EXPECT_EQ(wrapped.message(), "Loading menu: Invalid JSON in menu.json");

    EXPECT_EQ(Error(ErrorCode::NOT_FOUND).with_context("cart").message(), "cart");
    EXPECT_EQ(Error(ErrorCode::NOT_FOUND).to_string(), "NOT_FOUND");
}

TEST(ResultTest, TransientErrors) {
    EXPECT_TRUE(Error(ErrorCode::TIMEOUT).is_transient());
    EXPECT_TRUE(Error(ErrorCode::NETWORK_ERROR).is_transient());
    EXPECT_TRUE(Error(ErrorCode::PROVIDER_UNAVAILABLE).is_transient());
    EXPECT_FALSE(Error(ErrorCode::MODEL_NOT_FOUND).is_transient());
    EXPECT_FALSE(Error(ErrorCode::PARSE_ERROR).is_transient());
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("DEBUG").value_or(LogLevel::ERROR), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" warn ").value_or(LogLevel::ERROR), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("warning").value_or(LogLevel::ERROR), LogLevel::WARNING);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(LoggerTest, ConsoleLoggerFiltersAndPrefixes) {
    std::ostringstream out;
    ConsoleLogger logger("store", out);
    logger.set_min_level(LogLevel::WARNING);

    logger.info("opened");
    logger.warning("state file missing");

    std::string line = out.str();
    EXPECT_EQ(line.find("opened"), std::string::npos);
    EXPECT_NE(line.find("WARN store: state file missing\n"), std::string::npos);
}

// ============================================================================
// Config
// ============================================================================

class ConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"ORDERBOT_MENU_PATH", "ORDERBOT_HISTORY_LIMIT",
                                 "ORDERBOT_VERBOSE", "ORDERBOT_LOG_LEVEL"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigEnvTest, Defaults) {
    Config config = Config::from_env();
    EXPECT_TRUE(config.menu_path.empty());
    EXPECT_EQ(config.history_limit, 20u);
    EXPECT_EQ(config.suggestion_ttl, std::chrono::seconds(300));
    EXPECT_EQ(config.max_clarification_attempts, 3);
    EXPECT_EQ(config.effective_log_level(), LogLevel::WARNING);
}

TEST_F(ConfigEnvTest, ReadsEnvironment) {
    setenv("ORDERBOT_MENU_PATH", "/tmp/menu.json", 1);
    setenv("ORDERBOT_HISTORY_LIMIT", "5", 1);
    setenv("ORDERBOT_LOG_LEVEL", "info", 1);

    Config config = Config::from_env();
    EXPECT_EQ(config.menu_path.string(), "/tmp/menu.json");
    EXPECT_EQ(config.history_limit, 5u);
    EXPECT_EQ(config.effective_log_level(), LogLevel::INFO);

    setenv("ORDERBOT_VERBOSE", "true", 1);
    EXPECT_EQ(Config::from_env().effective_log_level(), LogLevel::DEBUG);
}

TEST_F(ConfigEnvTest, BadNumbersAreIgnored) {
    setenv("ORDERBOT_HISTORY_LIMIT", "lots", 1);
    EXPECT_EQ(Config::from_env().history_limit, 20u);
}

// ============================================================================
// Language and text helpers
// ============================================================================

TEST(LanguageDetectorTest, Script) {
    EXPECT_EQ(LanguageDetector::detect("add cola"), "en");
    EXPECT_EQ(LanguageDetector::detect("عايز كولا"), "ar");
    EXPECT_EQ(LanguageDetector::detect("2 كولا please"), "ar");
    EXPECT_EQ(LanguageDetector::detect(""), "en");
    EXPECT_TRUE(LanguageDetector::is_supported("ar"));
    EXPECT_FALSE(LanguageDetector::is_supported("fr"));
}

TEST(TextTest, Helpers) {
    EXPECT_EQ(text::strip_trailing_punctuation("  add cola!! "), "add cola");
    EXPECT_EQ(text::squeeze_spaces("  large   pizza "), "large pizza");
    EXPECT_TRUE(text::icontains("Margherita Pizza", "PIZZA"));
    EXPECT_EQ(text::parse_positive_int("12"), 12);
    EXPECT_EQ(text::parse_positive_int("0"), -1);
    EXPECT_EQ(text::parse_positive_int("#1"), -1);
    EXPECT_EQ(text::format_price(140), "140");
    EXPECT_EQ(text::format_price(12.5), "12.50");
}
