#include <gtest/gtest.h>
#include <orderbot/dialogue/orchestrator.hpp>
#include <orderbot/dialogue/response_policy.hpp>
#include <orderbot/store/memory_store.hpp>

#include <stdexcept>

using namespace orderbot;
using namespace orderbot::dialogue;

namespace {

// Generative provider with canned answers
class ScriptedFallback : public llm::FallbackProvider {
public:
    Result<llm::IntentExtraction> extract_intent(const std::string&,
                                                 const std::string&) override {
        ++extract_calls;
        if (!extraction) {
            return Error(ErrorCode::NETWORK_ERROR, "connection refused");
        }
        return *extraction;
    }

    Result<std::string> generate_reply(const std::string&,
                                       const std::string& context_blob,
                                       const std::string&) override {
        ++reply_calls;
        last_blob = context_blob;
        if (throw_on_reply) {
            throw std::runtime_error("provider crashed");
        }
        return reply;
    }

    std::optional<llm::IntentExtraction> extraction;
    std::string reply = "Sure thing! Your total is 999 EGP.";
    bool throw_on_reply = false;
    int extract_calls = 0;
    int reply_calls = 0;
    std::string last_blob;
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = store::MemoryStore::open(Config{});
        ASSERT_TRUE(result.ok()) << result.error().to_string();
        store_ = std::move(result.value());
        recommender_ = std::make_unique<recommendation::MenuRecommender>(*store_);

        now_ = from_epoch_seconds(1700000000);
    }

    void build(std::shared_ptr<ScriptedFallback> fallback = nullptr) {
        fallback_ = fallback;
        orchestrator_ = std::make_unique<Orchestrator>(*store_, *recommender_, fallback);
        orchestrator_->set_clock([this] { return now_; });
    }

    ResponseEnvelope say(const std::string& text) {
        return orchestrator_->process_message("u1", text);
    }

    SessionState session() {
        auto s = store_->load_session("u1");
        EXPECT_TRUE(s.ok());
        return s.value_or(SessionState{});
    }

    TimePoint now_;
    std::unique_ptr<store::MemoryStore> store_;
    std::unique_ptr<recommendation::MenuRecommender> recommender_;
    std::shared_ptr<ScriptedFallback> fallback_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

// ============================================================================
// Deterministic flows
// ============================================================================

TEST_F(OrchestratorTest, AddItemWithAllFields) {
    build();
    auto env = say("add large margherita pizza");

    EXPECT_TRUE(env.success);
    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::ADD_ITEM);
    EXPECT_EQ(env.source, ExtractionSource::PATTERN);
    EXPECT_TRUE(env.handler_executed);
    EXPECT_EQ(env.handler_name, "add_item");
    EXPECT_TRUE(starts_with(env.reply, "Added Margherita Pizza (L) x 1 to cart"));
    EXPECT_FALSE(env.clarification_needed);

    ASSERT_EQ(env.cart.lines.size(), 1u);
    EXPECT_EQ(env.cart.total(), 140);
    EXPECT_FALSE(env.recommendations.empty());
    EXPECT_NE(env.reply.find("🎯"), std::string::npos);
    EXPECT_EQ(env.suggested_actions, (std::vector<std::string>{"view cart", "checkout"}));
}

TEST_F(OrchestratorTest, BatchAddsEveryItem) {
    build();
    auto env = say("1 fries 2 cola");

    EXPECT_EQ(env.handler_name, "batch_add_item");
    EXPECT_TRUE(starts_with(env.reply, "Added 2 items to cart: Fries (REG), Cola (REG) x2"));
    EXPECT_EQ(env.cart.item_count(), 3);
    EXPECT_EQ(env.cart.total(), 90);
}

TEST_F(OrchestratorTest, AddItemWithCommaBeforePlease) {
    build();
    auto env = say("add large margherita pizza, please");

    EXPECT_EQ(env.handler_name, "add_item");
    EXPECT_TRUE(starts_with(env.reply, "Added Margherita Pizza (L) x 1 to cart")) << env.reply;
    EXPECT_EQ(env.cart.item_count(), 1);
    EXPECT_FALSE(session().pending_suggestion.has_value());
}

TEST_F(OrchestratorTest, ZeroQuantityIsRejected) {
    build();
    auto env = say("add 0 large margherita pizza");

    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::ADD_ITEM);
    EXPECT_TRUE(env.handler_executed);
    EXPECT_TRUE(starts_with(env.reply, "Quantity must be a whole number of at least 1")) << env.reply;
    EXPECT_TRUE(env.cart.empty());
}

TEST_F(OrchestratorTest, UnknownTextWithoutGenerator) {
    build();
    auto env = say("blorp zzz");

    EXPECT_TRUE(env.success);
    EXPECT_FALSE(env.intent.has_value());
    EXPECT_EQ(env.source, ExtractionSource::NONE);
    EXPECT_FALSE(env.handler_executed);
    EXPECT_EQ(env.reply, ResponsePolicy::GENERIC_HELP);
    EXPECT_EQ(env.suggested_actions, (std::vector<std::string>{"show menu", "view cart"}));
}

TEST_F(OrchestratorTest, CheckoutWithEmptyCartIsNotRouted) {
    build();
    auto env = say("checkout");

    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::CHECKOUT);
    EXPECT_FALSE(env.handler_executed);
    EXPECT_EQ(env.reply, "Your cart is empty. Add some items before checking out.");
}

// ============================================================================
// Clarification
// ============================================================================

TEST_F(OrchestratorTest, MissingSizeAsksAndResumes) {
    build();
    auto env = say("add margherita pizza");

    EXPECT_TRUE(env.clarification_needed);
    EXPECT_FALSE(env.handler_executed);
    EXPECT_EQ(env.reply, "What size would you like for Margherita Pizza?\n"
                         "  • Small (S) - 83 EGP\n"
                         "  • Medium (M) - 100 EGP\n"
                         "  • Large (L) - 140 EGP");
    EXPECT_EQ(env.clarification_question, env.reply);
    EXPECT_EQ(env.suggested_actions, (std::vector<std::string>{"show menu"}));
    EXPECT_TRUE(env.cart.empty());
    ASSERT_TRUE(session().pending_action.has_value());
    EXPECT_EQ(session().state, DialogueState::AWAITING_SIZE);

    env = say("large");
    EXPECT_FALSE(env.clarification_needed);
    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::ADD_ITEM);
    EXPECT_TRUE(env.handler_executed);
    EXPECT_TRUE(starts_with(env.reply, "Added Margherita Pizza (L) x 1 to cart"));
    EXPECT_FALSE(session().pending_action.has_value());
    EXPECT_EQ(session().state, DialogueState::IDLE);
}

TEST_F(OrchestratorTest, NewRequestDiscardsPendingQuestion) {
    build();
    say("add margherita pizza");

    auto env = say("show my cart");
    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::VIEW_CART);
    EXPECT_EQ(env.handler_name, "view_cart");
    EXPECT_FALSE(session().pending_action.has_value());
}

TEST_F(OrchestratorTest, UnhelpfulRepliesAbandonClarification) {
    build();
    say("add margherita pizza");

    EXPECT_TRUE(say("hmm").clarification_needed);
    EXPECT_TRUE(say("hmm").clarification_needed);

    auto env = say("hmm");
    EXPECT_FALSE(env.clarification_needed);
    EXPECT_FALSE(env.handler_executed);
    EXPECT_EQ(env.reply,
              "Sorry, I couldn't get the details. Let's start again: what would you like to do?");
    EXPECT_FALSE(session().pending_action.has_value());
}

TEST_F(OrchestratorTest, BatchDropsPendingQuestion) {
    build();
    EXPECT_TRUE(say("add margherita pizza").clarification_needed);

    auto env = say("1 fries 2 cola");
    EXPECT_EQ(env.handler_name, "batch_add_item");
    EXPECT_FALSE(session().pending_action.has_value());
    EXPECT_EQ(session().state, DialogueState::IDLE);

    env = say("large");
    EXPECT_FALSE(env.handler_executed);
    EXPECT_EQ(env.cart.item_count(), 3);
    for (const auto& line : env.cart.lines) {
        EXPECT_NE(line.name, "Margherita Pizza");
    }
}

TEST_F(OrchestratorTest, BatchSkipsClarification) {
    build();
    auto env = say("1 margherita pizza 2 cola");

    EXPECT_FALSE(env.clarification_needed);
    EXPECT_EQ(env.handler_name, "batch_add_item");
    EXPECT_FALSE(session().pending_action.has_value());
}

// ============================================================================
// Suggestions
// ============================================================================

TEST_F(OrchestratorTest, SuggestionConfirmedByYes) {
    build();
    auto env = say("add colaa");

    EXPECT_EQ(env.reply, "I couldn't find 'colaa'. Did you mean Cola? (Say 'yes' to add it)");
    EXPECT_EQ(env.suggested_actions, (std::vector<std::string>{"yes", "no"}));
    EXPECT_TRUE(env.cart.empty());
    EXPECT_TRUE(env.recommendations.empty());
    ASSERT_TRUE(session().pending_suggestion.has_value());
    EXPECT_EQ(session().state, DialogueState::AWAITING_CONFIRMATION);

    now_ += std::chrono::seconds(60);
    env = say("yes");
    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::CONFIRMATION);
    EXPECT_TRUE(starts_with(env.reply, "✅ Added 1x REG Cola to your cart!"));
    ASSERT_EQ(env.cart.lines.size(), 1u);
    EXPECT_EQ(env.cart.lines[0].name, "Cola");
    EXPECT_FALSE(session().pending_suggestion.has_value());

    env = say("yes");
    EXPECT_EQ(env.reply,
              "I'm not sure what you're confirming. Could you please be more specific?");
    EXPECT_EQ(env.cart.item_count(), 1);
}

TEST_F(OrchestratorTest, ExpiredSuggestionIsNotApplied) {
    build();
    say("add colaa");

    now_ += std::chrono::seconds(301);
    auto env = say("yes");
    EXPECT_EQ(env.reply, "That suggestion has expired. What would you like to order?");
    EXPECT_TRUE(env.cart.empty());
    EXPECT_FALSE(session().pending_suggestion.has_value());
}

TEST_F(OrchestratorTest, SuggestionRejected) {
    build();
    say("add colaa");

    auto env = say("no");
    EXPECT_EQ(env.reply, "No problem! What would you like to order instead?");
    EXPECT_FALSE(session().pending_suggestion.has_value());
}

// ============================================================================
// Generative provider
// ============================================================================

TEST_F(OrchestratorTest, CheckoutReplyNeverComesFromGenerator) {
    build(std::make_shared<ScriptedFallback>());
    ASSERT_TRUE(say("add large margherita pizza").handler_executed);

    auto env = say("checkout");
    EXPECT_EQ(fallback_->extract_calls, 0);
    EXPECT_EQ(env.handler_name, "checkout");
    EXPECT_EQ(env.reply,
              "✅ Order placed successfully!\n\n"
              "• 1x L Margherita Pizza - 140 EGP\n\n"
              "💰 Total: 140 EGP\n"
              "📦 Order ID: #1\n\n"
              "Your delicious pizza will be ready in 30-40 minutes. Thank you for your order! 🍕");
    EXPECT_EQ(env.reply.find("999"), std::string::npos);
    EXPECT_TRUE(env.cart.empty());
    EXPECT_EQ(env.suggested_actions, (std::vector<std::string>{"track order 1", "new order"}));
}

TEST_F(OrchestratorTest, GeneratorWritesNonDeterministicReplies) {
    auto fallback = std::make_shared<ScriptedFallback>();
    fallback->reply = "  Great choice!  ";
    build(fallback);

    auto env = say("add large margherita pizza");
    EXPECT_TRUE(starts_with(env.reply, "Great choice!"));
    EXPECT_EQ(fallback->reply_calls, 1);
    EXPECT_NE(fallback->last_blob.find("Handler executed: add_item"), std::string::npos);
    EXPECT_NE(fallback->last_blob.find("Margherita Pizza"), std::string::npos);
}

TEST_F(OrchestratorTest, DeterministicIntentSkipsGenerator) {
    auto fallback = std::make_shared<ScriptedFallback>();
    build(fallback);

    auto env = say("show my cart");
    EXPECT_EQ(fallback->reply_calls, 0);
    EXPECT_EQ(env.handler_name, "view_cart");
}

TEST_F(OrchestratorTest, FallbackExtractionIsRouted) {
    auto fallback = std::make_shared<ScriptedFallback>();
    llm::IntentExtraction extraction;
    extraction.intent = Intent::VIEW_CART;
    extraction.confidence = 0.8;
    fallback->extraction = extraction;
    build(fallback);

    auto env = say("what did i pick so far");
    EXPECT_EQ(fallback->extract_calls, 1);
    EXPECT_EQ(env.source, ExtractionSource::FALLBACK);
    ASSERT_TRUE(env.intent.has_value());
    EXPECT_EQ(*env.intent, Intent::VIEW_CART);
    EXPECT_EQ(env.handler_name, "view_cart");
}

TEST_F(OrchestratorTest, FailedExtractionStillReplies) {
    build(std::make_shared<ScriptedFallback>());

    auto env = say("blorp zzz");
    EXPECT_TRUE(env.success);
    EXPECT_EQ(env.source, ExtractionSource::ERROR);
    EXPECT_FALSE(env.intent.has_value());
    EXPECT_EQ(env.reply, "Sure thing! Your total is 999 EGP.");
}

TEST_F(OrchestratorTest, GeneratorFailureFallsBackToHandlerMessage) {
    auto fallback = std::make_shared<ScriptedFallback>();
    fallback->throw_on_reply = true;
    build(fallback);

    auto env = say("add large margherita pizza");
    EXPECT_TRUE(env.success);
    EXPECT_TRUE(starts_with(env.reply, "Added Margherita Pizza (L) x 1 to cart"));

    fallback->throw_on_reply = false;
    fallback->reply = "   ";
    env = say("add 2 cola");
    EXPECT_TRUE(starts_with(env.reply, "Added Cola (REG) x 2 to cart"));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(OrchestratorTest, HistoryRecordsBothSides) {
    build();
    say("hi");
    say("add large margherita pizza");

    auto history = store_->get_history("u1", 10);
    ASSERT_TRUE(history.ok()) << history.error().to_string();
    ASSERT_EQ(history.value().size(), 4u);
    EXPECT_EQ(history.value()[0].role, "user");
    EXPECT_EQ(history.value()[0].text, "hi");
    EXPECT_EQ(history.value()[0].metadata.value("intent", ""), "welcome");
    EXPECT_EQ(history.value()[1].role, "bot");
    EXPECT_EQ(history.value()[3].metadata.value("handler", ""), "add_item");
}

TEST_F(OrchestratorTest, EnvelopeJson) {
    build();
    json j = say("add large margherita pizza").to_json();

    EXPECT_TRUE(j.value("success", false));
    EXPECT_EQ(j.value("intent", ""), "add_item");
    EXPECT_EQ(j.value("nlp_source", ""), "pattern");
    EXPECT_TRUE(j.value("handler_executed", false));
    EXPECT_TRUE(j["cart"].is_object());
    EXPECT_TRUE(j["recommendations"].is_array());
    EXPECT_FALSE(j.value("clarification_needed", true));
}
