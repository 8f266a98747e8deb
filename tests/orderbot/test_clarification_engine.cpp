#include <gtest/gtest.h>
#include <orderbot/dialogue/clarification_engine.hpp>
#include <orderbot/store/memory_store.hpp>

using namespace orderbot;
using namespace orderbot::dialogue;

namespace {

// Serves the menu from a MemoryStore but reports its own size list
class SizeListStore : public store::StateStore {
public:
    SizeListStore(store::StateStore& inner, std::vector<store::MenuSize> sizes)
        : inner_(inner), sizes_(std::move(sizes)) {}

    Result<std::vector<store::MenuSize>> get_available_sizes(store::MenuItemId item_id) override {
        ++size_lookups;
        last_item_id = item_id;
        return sizes_;
    }

    Result<store::UserProfile> get_user(const store::UserId& user_id) override {
        return inner_.get_user(user_id);
    }
    Result<store::MenuItem> get_menu_item(const std::string& query, bool exact) override {
        return inner_.get_menu_item(query, exact);
    }
    Result<store::MenuItem> get_menu_item_by_id(store::MenuItemId item_id) override {
        return inner_.get_menu_item_by_id(item_id);
    }
    Result<std::vector<store::MenuItem>> search_menu(const std::string& query) override {
        return inner_.search_menu(query);
    }
    Result<std::vector<store::MenuItem>> list_menu(const std::string& category) override {
        return inner_.list_menu(category);
    }
    Result<store::Cart> get_cart(const store::UserId& user_id) override {
        return inner_.get_cart(user_id);
    }
    Result<store::CartLine> add_to_cart(const store::UserId& user_id, store::MenuItemId item_id,
                                        const std::string& size, int quantity) override {
        return inner_.add_to_cart(user_id, item_id, size, quantity);
    }
    Result<store::CartLine> remove_from_cart(const store::UserId& user_id, store::MenuItemId item_id,
                                             const std::string& size) override {
        return inner_.remove_from_cart(user_id, item_id, size);
    }
    Result<void> update_cart_quantity(const store::UserId& user_id, store::MenuItemId item_id,
                                      const std::string& size, int quantity) override {
        return inner_.update_cart_quantity(user_id, item_id, size, quantity);
    }
    Result<void> clear_cart(const store::UserId& user_id) override {
        return inner_.clear_cart(user_id);
    }
    Result<store::OrderReceipt> checkout(const store::UserId& user_id) override {
        return inner_.checkout(user_id);
    }
    Result<store::OrderReceipt> get_order(store::OrderId order_id) override {
        return inner_.get_order(order_id);
    }
    Result<std::vector<store::OrderReceipt>> list_orders(const store::UserId& user_id) override {
        return inner_.list_orders(user_id);
    }
    Result<std::vector<std::pair<store::MenuItemId, int>>> popular_items(size_t limit) override {
        return inner_.popular_items(limit);
    }
    Result<std::vector<store::HistoryEntry>> get_history(const store::UserId& user_id,
                                                         size_t limit) override {
        return inner_.get_history(user_id, limit);
    }
    Result<void> append_history(const store::UserId& user_id, const std::string& role,
                                const std::string& text, const json& metadata) override {
        return inner_.append_history(user_id, role, text, metadata);
    }
    Result<SessionState> load_session(const store::UserId& user_id) override {
        return inner_.load_session(user_id);
    }
    Result<void> save_session(const store::UserId& user_id, const SessionState& session) override {
        return inner_.save_session(user_id, session);
    }

    int size_lookups = 0;
    store::MenuItemId last_item_id = store::INVALID_MENU_ITEM_ID;

private:
    store::StateStore& inner_;
    std::vector<store::MenuSize> sizes_;
};

}  // namespace

class ClarificationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = store::MemoryStore::open(Config{});
        ASSERT_TRUE(result.ok()) << result.error().to_string();
        store_ = std::move(result.value());
        engine_ = std::make_unique<ClarificationEngine>(*store_, matcher_, 3);
    }

    static Entities item_only(const std::string& item) {
        Entities e;
        e.item = item;
        return e;
    }

    std::unique_ptr<store::MemoryStore> store_;
    nlp::PatternMatcher matcher_;
    std::unique_ptr<ClarificationEngine> engine_;
};

// ============================================================================
// Required fields
// ============================================================================

TEST_F(ClarificationEngineTest, PizzaNeedsSize) {
    auto check = engine_->needs_clarification(Intent::ADD_ITEM, item_only("margherita pizza"));
    EXPECT_TRUE(check.needed);
    ASSERT_EQ(check.missing.size(), 1u);
    EXPECT_EQ(check.missing[0], "size");
}

TEST_F(ClarificationEngineTest, SimpleAdditionNeedsOnlyItem) {
    auto check = engine_->needs_clarification(Intent::ADD_ITEM, item_only("fries"));
    EXPECT_FALSE(check.needed);
    EXPECT_TRUE(check.missing.empty());

    check = engine_->needs_clarification(Intent::ADD_ITEM, item_only("كولا"));
    EXPECT_FALSE(check.needed);
}

TEST_F(ClarificationEngineTest, AddWithNothingNeedsItemAndSize) {
    auto check = engine_->needs_clarification(Intent::ADD_ITEM, Entities{});
    EXPECT_TRUE(check.needed);
    EXPECT_EQ(check.missing, (std::vector<std::string>{"item", "size"}));
}

TEST_F(ClarificationEngineTest, EmptyStringCountsAsMissing) {
    Entities e;
    e.item = "";
    auto check = engine_->needs_clarification(Intent::REMOVE_ITEM, e);
    EXPECT_TRUE(check.needed);
    EXPECT_EQ(check.missing, (std::vector<std::string>{"item"}));
}

TEST_F(ClarificationEngineTest, OtherIntentsNeedNothingOrOrderId) {
    EXPECT_FALSE(engine_->needs_clarification(Intent::VIEW_CART, Entities{}).needed);
    EXPECT_FALSE(engine_->needs_clarification(Intent::CHECKOUT, Entities{}).needed);

    auto check = engine_->needs_clarification(Intent::TRACK_ORDER, Entities{});
    EXPECT_TRUE(check.needed);
    EXPECT_EQ(check.missing, (std::vector<std::string>{"order_id"}));
}

// ============================================================================
// Questions
// ============================================================================

TEST_F(ClarificationEngineTest, SizeQuestionListsPrices) {
    std::string q = engine_->generate_question(Intent::ADD_ITEM, item_only("pizza"), {"size"},
                                               "en", store::Cart{});
    EXPECT_EQ(q,
              "What size would you like for Margherita Pizza?\n"
              "  • Small (S) - 83 EGP\n"
              "  • Medium (M) - 100 EGP\n"
              "  • Large (L) - 140 EGP");
}

TEST_F(ClarificationEngineTest, SizeQuestionUsesStoreSizeList) {
    SizeListStore sizes(*store_, {{"M", 95.0, true}, {"L", 130.0, true}});
    ClarificationEngine engine(sizes, matcher_, 3);

    std::string q = engine.generate_question(Intent::ADD_ITEM, item_only("margherita pizza"),
                                             {"size"}, "en", store::Cart{});
    EXPECT_EQ(q,
              "What size would you like for Margherita Pizza?\n"
              "  • Medium (M) - 95 EGP\n"
              "  • Large (L) - 130 EGP");
    EXPECT_EQ(sizes.size_lookups, 1);

    auto margherita = store_->get_menu_item("margherita pizza", false);
    ASSERT_TRUE(margherita.ok()) << margherita.error().to_string();
    EXPECT_EQ(sizes.last_item_id, margherita.value().id);
}

TEST_F(ClarificationEngineTest, SizeQuestionForUnknownItem) {
    std::string q = engine_->generate_question(Intent::ADD_ITEM, item_only("calzone"), {"size"},
                                               "en", store::Cart{});
    EXPECT_EQ(q, "Sorry, I couldn't find 'calzone' in our menu. Could you check the name?");
}

TEST_F(ClarificationEngineTest, SizeQuestionMatchesLongerWord) {
    std::string q = engine_->generate_question(Intent::ADD_ITEM, item_only("the salami one"),
                                               {"size"}, "en", store::Cart{});
    EXPECT_EQ(q.rfind("What size would you like for Salami Pizza?", 0), 0u) << q;
}

TEST_F(ClarificationEngineTest, RemoveQuestionDependsOnCart) {
    std::string q = engine_->generate_question(Intent::REMOVE_ITEM, Entities{}, {"item"},
                                               "en", store::Cart{});
    EXPECT_EQ(q, "Your cart is empty. There's nothing to remove.");

    auto cola = store_->get_menu_item("cola", true);
    ASSERT_TRUE(cola.ok()) << cola.error().to_string();
    ASSERT_TRUE(store_->add_to_cart("u1", cola.value().id, "REG", 2).ok());
    auto cart = store_->get_cart("u1");
    ASSERT_TRUE(cart.ok());

    q = engine_->generate_question(Intent::REMOVE_ITEM, Entities{}, {"item"}, "en", cart.value());
    EXPECT_EQ(q, "Which item would you like to remove? Your cart has: Cola (REG)");
}

TEST_F(ClarificationEngineTest, ItemAndOrderQuestions) {
    EXPECT_EQ(engine_->generate_question(Intent::ADD_ITEM, Entities{}, {"item", "size"},
                                         "en", store::Cart{}),
              "What would you like to order? Please tell me the item name.");
    EXPECT_EQ(engine_->generate_question(Intent::TRACK_ORDER, Entities{}, {"order_id"},
                                         "en", store::Cart{}),
              "I need your order number to track it. What's your order number?");
}

TEST_F(ClarificationEngineTest, ArabicQuestion) {
    std::string q = engine_->generate_question(Intent::TRACK_ORDER, Entities{}, {"order_id"},
                                               "ar", store::Cart{});
    EXPECT_NE(q.find("رقم الطلب"), std::string::npos);
}

// ============================================================================
// Reply extraction
// ============================================================================

TEST_F(ClarificationEngineTest, ExtractFromShortReplies) {
    auto size = engine_->extract_from_reply("Large please", {"size"}, "en");
    EXPECT_EQ(size.size.value_or(""), "L");
    EXPECT_FALSE(size.item.has_value());

    auto quantity = engine_->extract_from_reply("3", {"quantity"}, "en");
    EXPECT_EQ(quantity.quantity.value_or(0), 3);

    auto word = engine_->extract_from_reply("two", {"quantity"}, "en");
    EXPECT_EQ(word.quantity.value_or(0), 2);

    auto order = engine_->extract_from_reply("it's order 42", {"order_id"}, "en");
    EXPECT_EQ(order.order_id.value_or(""), "42");

    auto item = engine_->extract_from_reply("a cola", {"item"}, "en");
    EXPECT_EQ(item.item.value_or(""), "cola");
}

TEST_F(ClarificationEngineTest, ExtractOnlyMissingFields) {
    auto found = engine_->extract_from_reply("large", {"quantity"}, "en");
    EXPECT_FALSE(found.size.has_value());
    EXPECT_FALSE(found.quantity.has_value());
}

// ============================================================================
// Pending actions
// ============================================================================

TEST_F(ClarificationEngineTest, StartPendingActionSetsAwaitingState) {
    SessionState session;
    auto fixed = from_epoch_seconds(1700000000);
    engine_->set_clock([fixed] { return fixed; });

    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});

    ASSERT_TRUE(session.pending_action.has_value());
    EXPECT_EQ(session.pending_action->action, Intent::ADD_ITEM);
    EXPECT_EQ(session.pending_action->missing_fields, (std::vector<std::string>{"size"}));
    EXPECT_EQ(session.pending_action->attempts, 0);
    EXPECT_EQ(session.pending_action->created_at, fixed);
    EXPECT_EQ(session.state, DialogueState::AWAITING_SIZE);
}

TEST_F(ClarificationEngineTest, DiscardPendingActionReturnsToIdle) {
    SessionState session;
    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});

    engine_->discard_pending_action(session);
    EXPECT_FALSE(session.pending_action.has_value());
    EXPECT_EQ(session.state, DialogueState::IDLE);

    engine_->discard_pending_action(session);
    EXPECT_EQ(session.state, DialogueState::IDLE);
}

TEST_F(ClarificationEngineTest, NewPendingActionReplacesOld) {
    SessionState session;
    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});
    engine_->start_pending_action(session, Intent::TRACK_ORDER, Entities{}, {"order_id"});

    ASSERT_TRUE(session.pending_action.has_value());
    EXPECT_EQ(session.pending_action->action, Intent::TRACK_ORDER);
    EXPECT_EQ(session.state, DialogueState::CLARIFYING_ITEM);
}

TEST_F(ClarificationEngineTest, ResolveWithSizeReply) {
    SessionState session;
    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});

    auto r = engine_->resolve_pending_action(session, std::nullopt, Entities{}, "large", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::RESOLVED);
    EXPECT_EQ(r.intent, Intent::ADD_ITEM);
    EXPECT_EQ(r.entities.item.value_or(""), "pizza");
    EXPECT_EQ(r.entities.size.value_or(""), "L");
    EXPECT_FALSE(session.pending_action.has_value());
    EXPECT_EQ(session.state, DialogueState::IDLE);
}

TEST_F(ClarificationEngineTest, ResolveWithSameIntentEntities) {
    SessionState session;
    engine_->start_pending_action(session, Intent::TRACK_ORDER, Entities{}, {"order_id"});

    Entities e;
    e.order_id = "9";
    auto r = engine_->resolve_pending_action(session, Intent::TRACK_ORDER, e, "track order 9", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::RESOLVED);
    EXPECT_EQ(r.entities.order_id.value_or(""), "9");
}

TEST_F(ClarificationEngineTest, DifferentIntentDiscardsPending) {
    SessionState session;
    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});

    auto r = engine_->resolve_pending_action(session, Intent::VIEW_CART, Entities{}, "show cart", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::DISCARDED);
    EXPECT_FALSE(session.pending_action.has_value());
    EXPECT_EQ(session.state, DialogueState::IDLE);
}

TEST_F(ClarificationEngineTest, UnhelpfulRepliesEventuallyAbandon) {
    SessionState session;
    engine_->start_pending_action(session, Intent::ADD_ITEM, item_only("pizza"), {"size"});

    auto r = engine_->resolve_pending_action(session, std::nullopt, Entities{}, "hmm", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::STILL_MISSING);
    EXPECT_EQ(r.missing, (std::vector<std::string>{"size"}));
    ASSERT_TRUE(session.pending_action.has_value());
    EXPECT_EQ(session.pending_action->attempts, 1);
    EXPECT_EQ(session.state, DialogueState::AWAITING_SIZE);

    r = engine_->resolve_pending_action(session, std::nullopt, Entities{}, "not sure", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::STILL_MISSING);

    r = engine_->resolve_pending_action(session, std::nullopt, Entities{}, "whatever", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::ABANDONED);
    EXPECT_FALSE(session.pending_action.has_value());
    EXPECT_EQ(session.state, DialogueState::IDLE);
}

TEST_F(ClarificationEngineTest, NothingPending) {
    SessionState session;
    auto r = engine_->resolve_pending_action(session, Intent::ADD_ITEM, Entities{}, "add", "en");
    EXPECT_EQ(r.status, PendingResolution::Status::NONE);
}

TEST(AwaitingStateTest, FieldMapping) {
    EXPECT_EQ(awaiting_state_for("size"), DialogueState::AWAITING_SIZE);
    EXPECT_EQ(awaiting_state_for("quantity"), DialogueState::AWAITING_QUANTITY);
    EXPECT_EQ(awaiting_state_for("address"), DialogueState::AWAITING_ADDRESS);
    EXPECT_EQ(awaiting_state_for("item"), DialogueState::CLARIFYING_ITEM);
}
