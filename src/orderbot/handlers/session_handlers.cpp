#include <orderbot/handlers/session_handlers.hpp>

namespace orderbot::handlers {

using dialogue::DialogueContext;
using dialogue::SuggestionClaim;

// ============================================================================
// ConfirmationHandler
// ============================================================================

ConfirmationHandler::ConfirmationHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool ConfirmationHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::CONFIRMATION;
}

DialogueContext ConfirmationHandler::execute(DialogueContext ctx) {
    SuggestionClaim claim = services_.suggestions.claim(ctx.session);

    switch (claim.status) {
        case SuggestionClaim::Status::NONE:
            ctx.handler.result = {
                {"success", false},
                {"message", "I'm not sure what you're confirming. Could you please be more specific?"}
            };
            return ctx;

        case SuggestionClaim::Status::EXPIRED:
            services_.logger->info("Suggestion for " + ctx.user_id + " expired");
            ctx.handler.result = {
                {"success", false},
                {"message", "That suggestion has expired. What would you like to order?"}
            };
            return ctx;

        case SuggestionClaim::Status::ACTIVE:
            break;
    }

    if (claim.suggestion->action != Intent::ADD_ITEM) {
        ctx.handler.result = {
            {"success", false},
            {"message", "I couldn't process that confirmation."}
        };
        return ctx;
    }
    return confirm_add_item(std::move(ctx), *claim.suggestion);
}

DialogueContext ConfirmationHandler::confirm_add_item(DialogueContext ctx,
                                                      const PendingSuggestion& suggestion) {
    std::string item_name = suggestion.proposed.item.value_or("");
    int quantity = suggestion.proposed.quantity.value_or(1);

    auto item = services_.store.get_menu_item(item_name, false);
    if (!item.ok()) {
        ctx.handler.result = {
            {"success", false},
            {"message", "Sorry, I couldn't find '" + item_name + "' in our menu anymore."}
        };
        return ctx;
    }

    // Proposed size, then REG, then whatever is still on offer
    const store::MenuItem& menu_item = item.value();
    const store::MenuSize* size = nullptr;
    if (suggestion.proposed.size) {
        size = menu_item.find_size(*suggestion.proposed.size);
    }
    if (size == nullptr || !size->available) {
        size = menu_item.find_size("REG");
    }
    if (size == nullptr || !size->available) {
        size = nullptr;
        for (const auto& s : menu_item.sizes) {
            if (s.available) {
                size = &s;
                break;
            }
        }
    }
    if (size == nullptr) {
        ctx.handler.result = {
            {"success", false},
            {"message", "Sorry, I couldn't find the right size for " + item_name + "."}
        };
        return ctx;
    }

    auto line = services_.store.add_to_cart(ctx.user_id, menu_item.id, size->code, quantity);
    if (!line.ok()) {
        ctx.handler.result = {
            {"success", false},
            {"message", line.error().message()}
        };
        return ctx;
    }

    ctx.handler.result = {
        {"success", true},
        {"action", "add_item"},
        {"message", "✅ Added " + std::to_string(quantity) + "x " + size->code + " " +
                    menu_item.name + " to your cart!"},
        {"item_added", {{"name", menu_item.name}, {"size", size->code}, {"quantity", quantity}}}
    };
    return ctx;
}

// ============================================================================
// RejectionHandler
// ============================================================================

RejectionHandler::RejectionHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool RejectionHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::REJECTION;
}

DialogueContext RejectionHandler::execute(DialogueContext ctx) {
    bool had_suggestion = services_.suggestions.reject(ctx.session);
    ctx.handler.result = {
        {"success", true},
        {"message", had_suggestion ? "No problem! What would you like to order instead?"
                                   : "Okay! How can I help you?"}
    };
    return ctx;
}

// ============================================================================
// WelcomeHandler
// ============================================================================

WelcomeHandler::WelcomeHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool WelcomeHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::WELCOME;
}

DialogueContext WelcomeHandler::execute(DialogueContext ctx) {
    std::string name = ctx.user ? ctx.user->name : "";
    std::string message;
    if (ctx.language == "ar") {
        message = "أهلاً" + (name.empty() ? "" : " " + name) +
                  "! 👋 نورتنا. تحب تطلب إيه النهارده؟";
    } else {
        message = "Hello" + (name.empty() ? "" : " " + name) +
                  "! 👋 Welcome to our pizza place. What would you like to order today?";
    }

    ctx.handler.result = {
        {"success", true},
        {"message", message},
        {"cart_items", ctx.cart.item_count()}
    };
    return ctx;
}

// ============================================================================
// NewOrderHandler
// ============================================================================

NewOrderHandler::NewOrderHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool NewOrderHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::NEW_ORDER;
}

DialogueContext NewOrderHandler::execute(DialogueContext ctx) {
    auto cleared = services_.store.clear_cart(ctx.user_id);
    if (!cleared.ok()) {
        ctx.handler.result = failed_result("Could not start a new order: " + cleared.error().message());
        return ctx;
    }

    ctx.cart = store::Cart{};
    ctx.session.pending_action.reset();
    ctx.session.pending_suggestion.reset();
    ctx.session.state = DialogueState::IDLE;

    ctx.handler.result = {
        {"success", true},
        {"action", "new_order"},
        {"message", "Starting a fresh order! Your cart is empty. What would you like?"}
    };
    return ctx;
}

}  // namespace orderbot::handlers
