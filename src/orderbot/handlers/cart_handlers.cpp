#include <orderbot/handlers/cart_handlers.hpp>
#include <orderbot/util/text.hpp>

namespace orderbot::handlers {

using dialogue::DialogueContext;

namespace {

json line_json(const store::CartLine& line) {
    return {
        {"name", line.name},
        {"size", line.size},
        {"quantity", line.quantity},
        {"unit_price", line.unit_price},
        {"subtotal", line.subtotal()}
    };
}

const char* const INVALID_QUANTITY = "Quantity must be a whole number of at least 1";

// Re-read the cart so the context matches the store after a mutation
void refresh_cart(DialogueContext& ctx, store::StateStore& store, Logger& logger) {
    auto cart = store.get_cart(ctx.user_id);
    if (cart.ok()) {
        ctx.cart = std::move(cart.value());
    } else {
        logger.warning("Cart reload failed: " + cart.error().to_string());
    }
}

}  // namespace

// ============================================================================
// BatchAddItemHandler
// ============================================================================

BatchAddItemHandler::BatchAddItemHandler(HandlerServices services)
    : services_(std::move(services))
    , validator_(services_.store) {}

bool BatchAddItemHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.is_batch();
}

DialogueContext BatchAddItemHandler::execute(DialogueContext ctx) {
    json results = json::array();
    std::vector<std::string> added;
    std::vector<std::pair<std::string, std::string>> failed;

    for (const auto& requested : ctx.batch_items) {
        json entry = {{"item", requested.item}, {"quantity", requested.quantity}};

        if (requested.quantity < 1) {
            entry["success"] = false;
            entry["error"] = INVALID_QUANTITY;
            results.push_back(entry);
            failed.emplace_back(requested.item, INVALID_QUANTITY);
            continue;
        }

        auto validated = validator_.validate(requested.item, requested.size);
        std::string error;
        if (!validated.ok()) {
            error = validated.error().message();
        } else if (!validated.value().ok()) {
            error = validated.value().message;
        } else {
            const auto& outcome = validated.value();
            auto line = services_.store.add_to_cart(ctx.user_id, outcome.item->id,
                                                    outcome.size, requested.quantity);
            if (line.ok()) {
                entry["success"] = true;
                entry["name"] = outcome.item->name;
                entry["size"] = outcome.size;
                entry["unit_price"] = outcome.price;
                results.push_back(entry);

                std::string label = outcome.item->name + " (" + outcome.size + ")";
                if (requested.quantity > 1) {
                    label += " x" + std::to_string(requested.quantity);
                }
                added.push_back(label);
                continue;
            }
            error = line.error().message();
        }

        entry["success"] = false;
        entry["error"] = error;
        results.push_back(entry);
        failed.emplace_back(requested.item, error);
    }

    if (added.empty()) {
        std::string message = "Couldn't add any items:";
        for (const auto& [item, error] : failed) {
            message += "\n  • " + item + ": " + error;
        }
        ctx.handler.result = failed_result(message);
        ctx.handler.result["results"] = results;
        return ctx;
    }

    std::string message = "Added " + std::to_string(added.size()) + " items to cart: " +
                          text::join(added, ", ");
    if (!failed.empty()) {
        std::vector<std::string> reasons;
        for (const auto& [item, error] : failed) {
            reasons.push_back(item + " (" + error + ")");
        }
        message += "\n\nCouldn't add: " + text::join(reasons, ", ");
    }

    ctx.handler.result = {
        {"success", true},
        {"action", "add_item"},
        {"message", message},
        {"added_count", added.size()},
        {"failed_count", failed.size()},
        {"results", results}
    };
    refresh_cart(ctx, services_.store, *services_.logger);
    return ctx;
}

// ============================================================================
// AddItemHandler
// ============================================================================

AddItemHandler::AddItemHandler(HandlerServices services)
    : services_(std::move(services))
    , validator_(services_.store) {}

bool AddItemHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::ADD_ITEM && ctx.entities.has(fields::ITEM);
}

DialogueContext AddItemHandler::execute(DialogueContext ctx) {
    std::string requested = *ctx.entities.item;
    int quantity = ctx.entities.quantity.value_or(1);
    if (quantity < 1) {
        ctx.handler.result = failed_result(INVALID_QUANTITY);
        return ctx;
    }

    auto validated = validator_.validate(requested, ctx.entities.size);
    if (!validated.ok()) {
        ctx.handler.result = failed_result("Error adding item: " + validated.error().message());
        return ctx;
    }

    const ValidationOutcome& outcome = validated.value();
    if (outcome.status == ValidationOutcome::Status::SIMILAR_FOUND) {
        return propose_alternative(std::move(ctx), outcome, requested, quantity);
    }
    if (!outcome.ok()) {
        ctx.handler.result = failed_result(outcome.message);
        ctx.handler.result["status"] = validation_status_name(outcome.status);
        if (outcome.item) {
            std::vector<std::string> sizes;
            for (const auto& s : outcome.item->available_sizes()) {
                sizes.push_back(s.code + " (" + text::format_price(s.price) + " EGP)");
            }
            ctx.handler.result["suggestion"] = sizes.empty() ? "No sizes available"
                                                             : text::join(sizes, ", ");
        }
        return ctx;
    }

    auto line = services_.store.add_to_cart(ctx.user_id, outcome.item->id, outcome.size, quantity);
    if (!line.ok()) {
        ctx.handler.result = failed_result(line.error().message());
        return ctx;
    }

    ctx.handler.result = {
        {"success", true},
        {"action", "add_item"},
        {"message", "Added " + outcome.item->name + " (" + outcome.size + ") x " +
                    std::to_string(quantity) + " to cart"},
        {"item", {
            {"name", outcome.item->name},
            {"size", outcome.size},
            {"quantity", quantity},
            {"unit_price", outcome.price},
            {"subtotal", outcome.price * quantity}
        }},
        {"cart_line", line_json(line.value())}
    };
    refresh_cart(ctx, services_.store, *services_.logger);
    return ctx;
}

DialogueContext AddItemHandler::propose_alternative(DialogueContext ctx,
                                                    const ValidationOutcome& outcome,
                                                    const std::string& requested,
                                                    int quantity) {
    const store::MenuItem& best = outcome.similar.front();

    Entities proposed;
    proposed.item = best.name;
    proposed.size = ctx.entities.size.value_or("REG");
    proposed.quantity = quantity;
    services_.suggestions.propose(ctx.session, Intent::ADD_ITEM, proposed);
    services_.logger->info("Suggesting " + best.name + " for '" + requested + "'");

    std::string question;
    if (ctx.language == "ar") {
        question = "لم أجد '" + requested + "'. هل تقصد " + best.name + "؟";
    } else {
        std::string qty_text = quantity > 1 ? std::to_string(quantity) + " " : "";
        std::string size_text = ctx.entities.size ? *ctx.entities.size + " " : "";
        question = "I couldn't find '" + requested + "'. Did you mean " + qty_text + size_text +
                   best.name + "? (Say 'yes' to add it)";
    }

    ctx.handler.result = failed_result(outcome.message);
    ctx.handler.result["suggestion_created"] = true;
    ctx.handler.result["message"] = question;
    ctx.reply = question;
    return ctx;
}

// ============================================================================
// RemoveItemHandler
// ============================================================================

RemoveItemHandler::RemoveItemHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool RemoveItemHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::REMOVE_ITEM && ctx.entities.has(fields::ITEM);
}

DialogueContext RemoveItemHandler::execute(DialogueContext ctx) {
    std::string wanted = text::to_lower(text::trim(*ctx.entities.item));

    if (ctx.entities.quantity && *ctx.entities.quantity < 1) {
        ctx.handler.result = failed_result(INVALID_QUANTITY);
        return ctx;
    }

    auto cart = services_.store.get_cart(ctx.user_id);
    if (!cart.ok()) {
        ctx.handler.result = failed_result("Error removing item: " + cart.error().message());
        return ctx;
    }
    if (cart.value().empty()) {
        ctx.handler.result = failed_result("Your cart is empty");
        return ctx;
    }

    const store::CartLine* match = nullptr;
    for (const auto& line : cart.value().lines) {
        std::string name = text::to_lower(line.name);
        if (!text::contains(name, wanted) && !text::contains(wanted, name)) continue;
        if (ctx.entities.size && !text::iequals(*ctx.entities.size, line.size)) {
            if (match == nullptr) match = &line;
            continue;
        }
        match = &line;
        break;
    }

    if (match == nullptr) {
        std::vector<std::string> names;
        for (const auto& line : cart.value().lines) {
            names.push_back(line.name);
        }
        ctx.handler.result = failed_result("'" + *ctx.entities.item + "' not found in cart. You have: " +
                                           text::join(names, ", "));
        return ctx;
    }

    store::CartLine target = *match;
    std::string message;

    if (ctx.entities.quantity && *ctx.entities.quantity < target.quantity) {
        int remaining = target.quantity - *ctx.entities.quantity;
        auto updated = services_.store.update_cart_quantity(ctx.user_id, target.item_id,
                                                            target.size, remaining);
        if (!updated.ok()) {
            ctx.handler.result = failed_result("Error removing item: " + updated.error().message());
            return ctx;
        }
        message = "Removed " + std::to_string(*ctx.entities.quantity) + " " + target.name + ", " +
                  std::to_string(remaining) + " remaining";
    } else {
        auto removed = services_.store.remove_from_cart(ctx.user_id, target.item_id, target.size);
        if (!removed.ok()) {
            ctx.handler.result = failed_result("Error removing item: " + removed.error().message());
            return ctx;
        }
        message = ctx.entities.quantity ? "Removed all " + target.name + " from cart"
                                        : "Removed " + target.name + " from cart";
    }

    ctx.handler.result = {
        {"success", true},
        {"action", "remove_item"},
        {"message", message},
        {"item", line_json(target)}
    };
    refresh_cart(ctx, services_.store, *services_.logger);
    return ctx;
}

// ============================================================================
// ViewCartHandler
// ============================================================================

ViewCartHandler::ViewCartHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool ViewCartHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::VIEW_CART;
}

DialogueContext ViewCartHandler::execute(DialogueContext ctx) {
    auto cart = services_.store.get_cart(ctx.user_id);
    if (!cart.ok()) {
        ctx.handler.result = failed_result("Could not retrieve cart");
        return ctx;
    }

    ctx.cart = std::move(cart.value());
    std::string summary = ctx.cart.summary(ctx.language);
    ctx.handler.result = {
        {"success", true},
        {"cart_data", ctx.cart.to_json()},
        {"summary", summary},
        {"message", summary}
    };
    ctx.response_data = {{"cart_summary", summary}};
    return ctx;
}

// ============================================================================
// ClearCartHandler
// ============================================================================

ClearCartHandler::ClearCartHandler(HandlerServices services)
    : services_(std::move(services)) {}

bool ClearCartHandler::can_handle(const DialogueContext& ctx) const {
    return ctx.intent == Intent::CLEAR_CART;
}

DialogueContext ClearCartHandler::execute(DialogueContext ctx) {
    auto cleared = services_.store.clear_cart(ctx.user_id);
    if (!cleared.ok()) {
        ctx.handler.result = failed_result("Error clearing cart: " + cleared.error().message());
        return ctx;
    }

    ctx.cart = store::Cart{};
    ctx.handler.result = {
        {"success", true},
        {"action", "clear_cart"},
        {"message", "Cart cleared! Ready for a new order 🛒"}
    };
    return ctx;
}

}  // namespace orderbot::handlers
