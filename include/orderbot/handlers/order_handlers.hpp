#pragma once

#include <orderbot/dialogue/intent_handler.hpp>
#include <orderbot/handlers/handler_services.hpp>

namespace orderbot::handlers {

/**
 * Turns the cart into an order. Only offered when the loaded cart
 * snapshot has items.
 */
class CheckoutHandler : public dialogue::IntentHandler {
public:
    explicit CheckoutHandler(HandlerServices services);

    std::string name() const override { return "checkout"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

// Reports status of one of the user's own orders
class TrackOrderHandler : public dialogue::IntentHandler {
public:
    explicit TrackOrderHandler(HandlerServices services);

    std::string name() const override { return "track_order"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

/**
 * Lists the menu, one category of it, or the sizes and prices of one
 * item when an item entity is present.
 */
class BrowseMenuHandler : public dialogue::IntentHandler {
public:
    explicit BrowseMenuHandler(HandlerServices services);

    std::string name() const override { return "browse_menu"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

    // Category named in the message ("pizza", "addition") or ""
    static std::string detect_category(const std::string& message);

private:
    HandlerServices services_;
};

}  // namespace orderbot::handlers
