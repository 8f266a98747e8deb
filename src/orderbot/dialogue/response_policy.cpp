#include <orderbot/dialogue/response_policy.hpp>
#include <orderbot/util/text.hpp>

namespace orderbot::dialogue {

namespace {

std::string json_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return text::format_price(value.get<double>());
    return value.dump();
}

std::string unhandled_reply(Intent intent, const std::string& language) {
    bool ar = language == "ar";
    switch (intent) {
        case Intent::CHECKOUT:
            return ar ? "السلة فاضية. ضيف أصناف الأول قبل ما تطلب."
                      : "Your cart is empty. Add some items before checking out.";
        case Intent::REMOVE_ITEM:
            return ar ? "عايز تشيل إيه من السلة؟" : "Which item would you like to remove?";
        case Intent::TRACK_ORDER:
            return ar ? "محتاج رقم الطلب علشان أتابعه."
                      : "I need your order number to track it. What's your order number?";
        case Intent::ADD_ITEM:
            return ar ? "عايز تطلب إيه؟" : "What would you like to order?";
        default:
            return ResponsePolicy::GENERIC_HELP;
    }
}

}  // namespace

const char* reply_mode_name(ReplyMode mode) {
    switch (mode) {
        case ReplyMode::PRESET: return "preset";
        case ReplyMode::STRUCTURED_CHECKOUT: return "structured_checkout";
        case ReplyMode::HANDLER_MESSAGE: return "handler_message";
        case ReplyMode::GENERATIVE: return "generative";
    }
    return "unknown";
}

bool ResponsePolicy::is_deterministic(const std::optional<Intent>& intent) {
    if (!intent) return false;
    switch (*intent) {
        case Intent::VIEW_CART:
        case Intent::CLEAR_CART:
        case Intent::BROWSE_MENU:
        case Intent::CHECKOUT:
        case Intent::CONFIRMATION:
        case Intent::REJECTION:
        case Intent::TRACK_ORDER:
            return true;
        default:
            return false;
    }
}

ReplyMode ResponsePolicy::select_mode(const DialogueContext& ctx, bool generator_available) {
    if (ctx.has_reply()) {
        return ReplyMode::PRESET;
    }
    if (ctx.intent == Intent::CHECKOUT && ctx.handler.succeeded()) {
        return ReplyMode::STRUCTURED_CHECKOUT;
    }
    if (is_deterministic(ctx.intent) || !generator_available) {
        return ReplyMode::HANDLER_MESSAGE;
    }
    return ReplyMode::GENERATIVE;
}

std::string ResponsePolicy::format_checkout(const json& result) {
    std::vector<std::string> lines;
    for (const auto& item : result.value("items", json::array())) {
        lines.push_back("• " + json_text(item.value("quantity", json(0))) + "x " +
                        item.value("size", std::string()) + " " +
                        item.value("name", std::string()) + " - " +
                        json_text(item.value("subtotal", json(0))) + " EGP");
    }

    return "✅ Order placed successfully!\n\n" + text::join(lines, "\n") +
           "\n\n💰 Total: " + json_text(result.value("total_price", json(0))) + " EGP" +
           "\n📦 Order ID: #" + json_text(result.value("order_id", json(0))) +
           "\n\nYour delicious pizza will be ready in 30-40 minutes. Thank you for your order! 🍕";
}

std::string ResponsePolicy::handler_reply(const DialogueContext& ctx) {
    if (!ctx.handler.executed) {
        return ctx.intent ? unhandled_reply(*ctx.intent, ctx.language) : GENERIC_HELP;
    }

    const json& result = ctx.handler.result;
    for (const char* key : {"message", "summary", "error"}) {
        auto it = result.find(key);
        if (it != result.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return ctx.handler.succeeded() ? "Request processed successfully" : GENERIC_HELP;
}

std::string ResponsePolicy::build_context_blob(const DialogueContext& ctx, size_t history_window) {
    std::string handler_summary;
    if (ctx.handler.executed) {
        handler_summary = "Handler executed: " + ctx.handler.handler_name +
                          "\nResults: " + ctx.handler.result.dump();
    } else {
        handler_summary = "No specific handler for intent: " + intent_label(ctx.intent);
    }

    return "Conversation History:\n" + ctx.history_text(history_window) +
           "\nUser's current message: " + ctx.message +
           "\n\nHandler Information:\n" + handler_summary +
           "\n\nCRITICAL - ACTUAL DATA (do not modify or guess):\nHandler Result: " +
           ctx.handler.result.dump(2) +
           "\n\nCurrent cart: " + ctx.cart.to_json().dump() +
           "\n\nInstructions:\n"
           "1. For orders/checkout: Use EXACT quantities, prices, and items from handler_result\n"
           "2. Never guess or change numerical values\n"
           "3. Be natural but accurate\n"
           "4. Keep it concise (1-2 sentences)\n\n"
           "Please provide a natural, friendly response based ONLY on the actual data above.";
}

bool ResponsePolicy::wants_recommendations(const DialogueContext& ctx) {
    return ctx.handler.succeeded() && ctx.handler.result.value("action", std::string()) == "add_item";
}

std::vector<std::string> ResponsePolicy::suggested_actions(const DialogueContext& ctx) {
    if (ctx.clarification_needed) {
        return {"show menu"};
    }
    if (ctx.session.pending_suggestion && ctx.handler.result.value("suggestion_created", false)) {
        return {"yes", "no"};
    }
    if (!ctx.intent) {
        return {"show menu", "view cart"};
    }

    bool ok = ctx.handler.succeeded();
    switch (*ctx.intent) {
        case Intent::ADD_ITEM:
        case Intent::CONFIRMATION:
            if (ok) return {"view cart", "checkout"};
            return {"show menu"};
        case Intent::REMOVE_ITEM:
            return ok ? std::vector<std::string>{"view cart", "checkout"}
                      : std::vector<std::string>{"view cart"};
        case Intent::VIEW_CART:
            if (ctx.cart.empty()) return {"show menu"};
            return {"checkout", "clear cart"};
        case Intent::CHECKOUT:
            if (ok) {
                return {"track order " + json_text(ctx.handler.result.value("order_id", json(0))),
                        "new order"};
            }
            return {"show menu"};
        case Intent::BROWSE_MENU:
            return {"add [item] [size]", "view cart"};
        case Intent::CLEAR_CART:
        case Intent::NEW_ORDER:
        case Intent::REJECTION:
            return {"show menu"};
        case Intent::WELCOME:
            return {"show menu", "view cart"};
        case Intent::TRACK_ORDER:
            return {"new order"};
    }
    return {};
}

}  // namespace orderbot::dialogue
