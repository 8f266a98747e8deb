#include <orderbot/handlers/order_handlers.hpp>
#include <orderbot/util/text.hpp>

namespace orderbot::handlers {

using dialogue::DialogueContext;

// ============================================================================
// CheckoutHandler
// ============================================================================

CheckoutHandler::CheckoutHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool CheckoutHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::CHECKOUT && !ctx.cart.empty();
}

DialogueContext CheckoutHandler::execute(DialogueContext ctx) {
    auto receipt = services_.store.checkout(ctx.user_id);
    if (!receipt.ok()) {
        if (receipt.error_code() == ErrorCode::EMPTY_CART) {
            ctx.handler.result = failed_result("Your cart is empty. Cannot checkout.");
        } else {
            ctx.handler.result = failed_result("Checkout failed: " + receipt.error().message());
        }
        return ctx;
    }

    const store::OrderReceipt& order = receipt.value();
    json items = json::array();
    for (const auto& line : order.items) {
        items.push_back({
            {"name", line.name},
            {"size", line.size},
            {"quantity", line.quantity},
            {"unit_price", line.unit_price},
            {"subtotal", line.subtotal()}
        });
    }

    ctx.handler.result = {
        {"success", true},
        {"order_id", order.order_id},
        {"total_price", order.total_price},
        {"items", items},
        {"message", "Order #" + std::to_string(order.order_id) + " placed"}
    };
    ctx.response_data = {
        {"order_id", order.order_id},
        {"total_price", order.total_price},
        {"items", items}
    };
    ctx.cart = store::Cart{};
    services_.logger->info("Order #" + std::to_string(order.order_id) + " placed for " + ctx.user_id);
    return ctx;
}

// ============================================================================
// TrackOrderHandler
// ============================================================================

TrackOrderHandler::TrackOrderHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool TrackOrderHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::TRACK_ORDER && ctx.entities.has(fields::ORDER_ID);
}

DialogueContext TrackOrderHandler::execute(DialogueContext ctx) {
    std::string raw = text::trim(*ctx.entities.order_id);
    if (!raw.empty() && raw.front() == '#') {
        raw.erase(0, 1);
    }

    int parsed = text::parse_positive_int(raw);
    if (parsed <= 0) {
        ctx.handler.result = failed_result("'" + raw + "' is not a valid order number");
        return ctx;
    }

    auto order = services_.store.get_order(static_cast<store::OrderId>(parsed));
    if (!order.ok() || order.value().user_id != ctx.user_id) {
        if (!order.ok() && order.error_code() != ErrorCode::NOT_FOUND) {
            ctx.handler.result = failed_result("Error tracking order: " + order.error().message());
        } else {
            ctx.handler.result = failed_result("Order #" + raw + " not found");
        }
        return ctx;
    }

    const store::OrderReceipt& receipt = order.value();
    std::vector<std::string> lines;
    for (const auto& line : receipt.items) {
        lines.push_back(std::to_string(line.quantity) + "x " + line.size + " " + line.name);
    }

    ctx.handler.result = {
        {"success", true},
        {"order", receipt.to_json()},
        {"message", "📦 Order #" + std::to_string(receipt.order_id) + " is " + receipt.status +
                    ".\nItems: " + text::join(lines, ", ") +
                    "\nTotal: " + text::format_price(receipt.total_price) + " EGP"}
    };
    return ctx;
}

// ============================================================================
// BrowseMenuHandler
// ============================================================================

BrowseMenuHandler::BrowseMenuHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool BrowseMenuHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::BROWSE_MENU;
}

std::string BrowseMenuHandler::detect_category(const std::string& message) {
    std::string lowered = text::to_lower(message);
    for (const char* word : {"pizza", "بيتزا"}) {
        if (text::contains(lowered, word)) return store::CATEGORY_PIZZA;
    }
    for (const char* word : {"drink", "addition", "side", "مشروبات", "اضافات"}) {
        if (text::contains(lowered, word)) return store::CATEGORY_ADDITION;
    }
    return "";
}

DialogueContext BrowseMenuHandler::execute(DialogueContext ctx) {
    if (ctx.entities.has(fields::ITEM)) {
        auto item = services_.store.get_menu_item(*ctx.entities.item, false);
        if (!item.ok()) {
            ctx.handler.result = failed_result("Item '" + *ctx.entities.item + "' not found in menu");
            return ctx;
        }

        std::string formatted = item.value().display_line();
        ctx.handler.result = {
            {"success", true},
            {"item", item.value().to_json()},
            {"formatted", formatted},
            {"message", formatted}
        };
        ctx.response_data = {
            {"item_name", item.value().name},
            {"category", item.value().category},
            {"formatted_display", formatted}
        };
        return ctx;
    }

    auto render = [](const std::vector<store::MenuItem>& items) {
        json lines = json::array();
        for (const auto& item : items) {
            lines.push_back(item.display_line());
        }
        return lines;
    };
    auto bullet_list = [](const json& lines) {
        std::string out;
        for (const auto& line : lines) {
            out += "\n  • " + line.get<std::string>();
        }
        return out;
    };

    std::string category = detect_category(ctx.message);
    if (!category.empty()) {
        auto items = services_.store.list_menu(category);
        if (!items.ok() || items.value().empty()) {
            ctx.handler.result = failed_result("No items found in category '" + category + "'");
            return ctx;
        }

        json lines = render(items.value());
        std::string title = category == store::CATEGORY_PIZZA ? "🍕 Pizzas:" : "🥤 Additions:";
        ctx.handler.result = {
            {"success", true},
            {"category", category},
            {"items", lines},
            {"count", lines.size()},
            {"message", title + bullet_list(lines)}
        };
        ctx.response_data = {{"category", category}, {"items", lines}};
        return ctx;
    }

    auto pizzas = services_.store.list_menu(store::CATEGORY_PIZZA);
    auto additions = services_.store.list_menu(store::CATEGORY_ADDITION);
    if (!pizzas.ok() || !additions.ok()) {
        ctx.handler.result = failed_result("Could not load the menu");
        return ctx;
    }

    json pizza_lines = render(pizzas.value());
    json addition_lines = render(additions.value());
    std::string heading = ctx.language == "ar" ? "🍕 المنيو:" : "🍕 Our Menu:";

    ctx.handler.result = {
        {"success", true},
        {"menu", {{"pizzas", pizza_lines}, {"additions", addition_lines}}},
        {"pizza_count", pizza_lines.size()},
        {"addition_count", addition_lines.size()},
        {"message", heading + "\n\nPizzas:" + bullet_list(pizza_lines) +
                    "\n\nAdditions:" + bullet_list(addition_lines)}
    };
    ctx.response_data = {{"pizzas", pizza_lines}, {"additions", addition_lines}};
    return ctx;
}

}  // namespace orderbot::handlers
