#include <gtest/gtest.h>
#include <orderbot/nlp/pattern_matcher.hpp>

using namespace orderbot;
using namespace orderbot::nlp;

class PatternMatcherTest : public ::testing::Test {
protected:
    ExtractionResult expect_match(const std::string& text) {
        auto result = matcher_.match(text);
        EXPECT_TRUE(result.has_value()) << "no rule matched: " << text;
        return result.value_or(ExtractionResult{});
    }

    PatternMatcher matcher_;
};

// ============================================================================
// Intent classification
// ============================================================================

TEST_F(PatternMatcherTest, Greeting) {
    auto r = expect_match("Hi!");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::WELCOME);
    EXPECT_EQ(r.source, ExtractionSource::PATTERN);
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);
    EXPECT_EQ(r.language, "en");
}

TEST_F(PatternMatcherTest, DeterministicIntents) {
    struct Case { std::string text; Intent intent; };
    std::vector<Case> cases = {
        {"show my cart", Intent::VIEW_CART},
        {"what's in my cart", Intent::VIEW_CART},
        {"clear my cart", Intent::CLEAR_CART},
        {"checkout", Intent::CHECKOUT},
        {"show me the menu", Intent::BROWSE_MENU},
        {"yes", Intent::CONFIRMATION},
        {"no thanks", Intent::REJECTION},
        {"start a new order", Intent::NEW_ORDER},
    };

    for (const auto& c : cases) {
        auto r = expect_match(c.text);
        ASSERT_TRUE(r.intent.has_value()) << c.text;
        EXPECT_EQ(*r.intent, c.intent) << c.text;
    }
}

TEST_F(PatternMatcherTest, AddKeywordFollowedByOtherRequestIsNotAnItem) {
    auto r = expect_match("i want to pay");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::CHECKOUT);

    r = expect_match("i want to see the menu");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::BROWSE_MENU);
}

TEST_F(PatternMatcherTest, NewOrderWinsOverAddKeyword) {
    auto r = expect_match("i want a new order");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::NEW_ORDER);
    EXPECT_FALSE(r.entities.item.has_value());
}

TEST_F(PatternMatcherTest, NoRuleMatches) {
    EXPECT_FALSE(matcher_.match("the weather is lovely today").has_value());
    EXPECT_FALSE(matcher_.match("").has_value());
    EXPECT_FALSE(matcher_.match("?!").has_value());
}

TEST_F(PatternMatcherTest, TrackOrderWithNumber) {
    auto r = expect_match("track order #42");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::TRACK_ORDER);
    ASSERT_TRUE(r.entities.order_id.has_value());
    EXPECT_EQ(*r.entities.order_id, "42");

    r = expect_match("where is my order");
    EXPECT_EQ(*r.intent, Intent::TRACK_ORDER);
    EXPECT_FALSE(r.entities.order_id.has_value());
}

// ============================================================================
// add_item entities
// ============================================================================

TEST_F(PatternMatcherTest, AddItemWithSize) {
    auto r = expect_match("add large margherita pizza");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::ADD_ITEM);
    ASSERT_TRUE(r.entities.item.has_value());
    EXPECT_EQ(*r.entities.item, "margherita pizza");
    ASSERT_TRUE(r.entities.size.has_value());
    EXPECT_EQ(*r.entities.size, "L");
    EXPECT_FALSE(r.entities.quantity.has_value());
    EXPECT_FALSE(r.is_batch());
}

TEST_F(PatternMatcherTest, AddItemWithQuantityWordAndCartSuffix) {
    auto r = expect_match("add two cola to my cart please");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::ADD_ITEM);
    EXPECT_EQ(r.entities.item.value_or(""), "cola");
    EXPECT_EQ(r.entities.quantity.value_or(0), 2);
}

TEST_F(PatternMatcherTest, AddItemWithCommaBeforePlease) {
    auto r = expect_match("add large margherita pizza, please");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::ADD_ITEM);
    EXPECT_FALSE(r.is_batch());
    EXPECT_EQ(r.entities.item.value_or(""), "margherita pizza");
    EXPECT_EQ(r.entities.size.value_or(""), "L");
}

TEST_F(PatternMatcherTest, AddItemWithMultiplicationSign) {
    auto r = expect_match("add 2 x cola");
    EXPECT_EQ(r.entities.item.value_or(""), "cola");
    EXPECT_EQ(r.entities.quantity.value_or(0), 2);

    r = expect_match("add 3x fries");
    EXPECT_EQ(r.entities.item.value_or(""), "fries");
    EXPECT_EQ(r.entities.quantity.value_or(0), 3);
}

TEST_F(PatternMatcherTest, AddItemWithZeroQuantity) {
    auto r = expect_match("add 0 cola");
    EXPECT_EQ(r.entities.item.value_or(""), "cola");
    ASSERT_TRUE(r.entities.quantity.has_value());
    EXPECT_EQ(*r.entities.quantity, 0);
}

TEST_F(PatternMatcherTest, AddItemWithoutSize) {
    auto r = expect_match("I want a pepperoni pizza");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::ADD_ITEM);
    EXPECT_EQ(r.entities.item.value_or(""), "pepperoni pizza");
    EXPECT_FALSE(r.entities.size.has_value());
}

TEST_F(PatternMatcherTest, BareQuantityLedBatch) {
    auto r = expect_match("1 fries 2 cola");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::ADD_ITEM);
    ASSERT_TRUE(r.is_batch());
    ASSERT_EQ(r.batch_items.size(), 2u);
    EXPECT_EQ(r.batch_items[0].item, "fries");
    EXPECT_EQ(r.batch_items[0].quantity, 1);
    EXPECT_EQ(r.batch_items[1].item, "cola");
    EXPECT_EQ(r.batch_items[1].quantity, 2);
}

TEST_F(PatternMatcherTest, SeparatorBatchWithSizes) {
    auto r = expect_match("add a small bbq chicken pizza and 3 water");
    ASSERT_TRUE(r.is_batch());
    ASSERT_EQ(r.batch_items.size(), 2u);
    EXPECT_EQ(r.batch_items[0].item, "bbq chicken pizza");
    EXPECT_EQ(r.batch_items[0].size.value_or(""), "S");
    EXPECT_EQ(r.batch_items[0].quantity, 1);
    EXPECT_EQ(r.batch_items[1].item, "water");
    EXPECT_EQ(r.batch_items[1].quantity, 3);
}

TEST_F(PatternMatcherTest, SeparatorBatchWithTrailingComma) {
    auto r = expect_match("add fries, cola, please");
    ASSERT_TRUE(r.is_batch());
    ASSERT_EQ(r.batch_items.size(), 2u);
    EXPECT_EQ(r.batch_items[0].item, "fries");
    EXPECT_EQ(r.batch_items[1].item, "cola");
    EXPECT_EQ(r.batch_items[1].quantity, 1);
}

TEST_F(PatternMatcherTest, RemoveItemSplitsQuantityAndSize) {
    auto r = expect_match("remove 2 large cola from my cart");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::REMOVE_ITEM);
    EXPECT_EQ(r.entities.item.value_or(""), "cola");
    EXPECT_EQ(r.entities.size.value_or(""), "L");
    EXPECT_EQ(r.entities.quantity.value_or(0), 2);
}

// ============================================================================
// Arabic
// ============================================================================

TEST_F(PatternMatcherTest, ArabicGreetingAndCart) {
    auto r = expect_match("مرحبا");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::WELCOME);
    EXPECT_EQ(r.language, "ar");

    r = expect_match("امسح السلة");
    EXPECT_EQ(*r.intent, Intent::CLEAR_CART);
}

TEST_F(PatternMatcherTest, ArabicConfirmation) {
    auto r = expect_match("نعم");
    EXPECT_EQ(*r.intent, Intent::CONFIRMATION);
    EXPECT_EQ(r.language, "ar");
}

// ============================================================================
// Normalisation helpers
// ============================================================================

TEST_F(PatternMatcherTest, ExtractQuantity) {
    auto [q1, rest1] = matcher_.extract_quantity("3 cola");
    EXPECT_EQ(q1.value_or(0), 3);
    EXPECT_EQ(rest1, "cola");

    auto [q2, rest2] = matcher_.extract_quantity("five fries");
    EXPECT_EQ(q2.value_or(0), 5);
    EXPECT_EQ(rest2, "fries");

    auto [q3, rest3] = matcher_.extract_quantity("margherita pizza");
    EXPECT_FALSE(q3.has_value());
    EXPECT_EQ(rest3, "margherita pizza");

    auto [q4, rest4] = matcher_.extract_quantity("two x cola");
    EXPECT_EQ(q4.value_or(0), 2);
    EXPECT_EQ(rest4, "cola");
}

TEST_F(PatternMatcherTest, ExtractQuantityOutOfRange) {
    auto [zero, rest1] = matcher_.extract_quantity("0 cola");
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, 0);
    EXPECT_EQ(rest1, "cola");

    auto [huge, rest2] = matcher_.extract_quantity("1234567 cola");
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(*huge, 0);
    EXPECT_EQ(rest2, "cola");
}

TEST_F(PatternMatcherTest, ExtractSize) {
    auto [s1, rest1] = matcher_.extract_size("medium veggie pizza");
    EXPECT_EQ(s1.value_or(""), "M");
    EXPECT_EQ(rest1, "veggie pizza");

    auto [s2, rest2] = matcher_.extract_size("fries");
    EXPECT_FALSE(s2.has_value());
    EXPECT_EQ(rest2, "fries");
}

TEST_F(PatternMatcherTest, CleanItemNameDropsArticles) {
    EXPECT_EQ(matcher_.clean_item_name("a sea ranch pizza"), "sea ranch pizza");
    EXPECT_EQ(matcher_.clean_item_name("the cola"), "cola");
}

TEST_F(PatternMatcherTest, CleanItemNameDropsEdgeSeparators) {
    EXPECT_EQ(matcher_.clean_item_name("margherita pizza,"), "margherita pizza");
    EXPECT_EQ(matcher_.clean_item_name(", fries and"), "fries");
    EXPECT_EQ(matcher_.clean_item_name("sandwich"), "sandwich");
}

TEST_F(PatternMatcherTest, MultiItemDetection) {
    EXPECT_TRUE(matcher_.is_multi_item("1 fries 2 cola"));
    EXPECT_TRUE(matcher_.is_multi_item("fries and cola"));
    EXPECT_FALSE(matcher_.is_multi_item("2 cola"));
    EXPECT_FALSE(matcher_.is_multi_item("fries and"));
    EXPECT_TRUE(matcher_.is_multi_item("fries, cola,"));
    EXPECT_FALSE(matcher_.is_multi_item("fries,"));
    EXPECT_FALSE(matcher_.is_multi_item("fries,,cola"));
}

TEST_F(PatternMatcherTest, AddRuleAppendsToTable) {
    size_t before = matcher_.rules().size();
    matcher_.add_rule(Intent::BROWSE_MENU, "en", R"re(^specials$)re");
    EXPECT_EQ(matcher_.rules().size(), before + 1);

    auto r = expect_match("specials");
    EXPECT_EQ(*r.intent, Intent::BROWSE_MENU);

    EXPECT_THROW(matcher_.add_rule(Intent::BROWSE_MENU, "en", "(unclosed"), std::regex_error);
}
