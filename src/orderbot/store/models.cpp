#include <orderbot/store/models.hpp>
#include <orderbot/util/text.hpp>

namespace orderbot::store {

// ============================================================================
// Menu
// ============================================================================

const MenuSize* MenuItem::find_size(const std::string& code) const {
    for (const auto& s : sizes) {
        if (text::iequals(s.code, code)) {
            return &s;
        }
    }
    return nullptr;
}

std::vector<MenuSize> MenuItem::available_sizes() const {
    std::vector<MenuSize> out;
    for (const auto& s : sizes) {
        if (s.available) out.push_back(s);
    }
    return out;
}

std::string MenuItem::display_line() const {
    auto open_sizes = available_sizes();
    if (!available || open_sizes.empty()) {
        return name + " (Currently unavailable)";
    }

    std::vector<std::string> prices;
    for (const auto& s : open_sizes) {
        prices.push_back(s.code + ": " + text::format_price(s.price) + " EGP");
    }
    return name + " (" + text::join(prices, ", ") + ")";
}

json MenuItem::to_json() const {
    json j_sizes = json::array();
    for (const auto& s : sizes) {
        j_sizes.push_back({{"size", s.code}, {"price", s.price}, {"available", s.available}});
    }
    return {
        {"id", id},
        {"name", name},
        {"category", category},
        {"description", description},
        {"available", available},
        {"sizes", j_sizes}
    };
}

MenuItem MenuItem::from_json(const json& j) {
    MenuItem item;
    item.id = j.value("id", INVALID_MENU_ITEM_ID);
    item.name = j.value("name", "");
    item.category = j.value("category", "");
    item.description = j.value("description", "");
    item.available = j.value("available", true);
    if (j.contains("sizes") && j["sizes"].is_array()) {
        for (const auto& s : j["sizes"]) {
            MenuSize size;
            size.code = normalize_size_code(s.value("size", ""));
            size.price = s.value("price", 0.0);
            size.available = s.value("available", true);
            item.sizes.push_back(size);
        }
    }
    return item;
}

// ============================================================================
// Cart
// ============================================================================

json CartLine::to_json() const {
    return {
        {"menu_item_id", item_id},
        {"item_name", name},
        {"category", category},
        {"size", size},
        {"price", unit_price},
        {"quantity", quantity},
        {"subtotal", subtotal()}
    };
}

CartLine CartLine::from_json(const json& j) {
    CartLine line;
    line.item_id = j.value("menu_item_id", INVALID_MENU_ITEM_ID);
    line.name = j.value("item_name", "");
    line.category = j.value("category", "");
    line.size = j.value("size", "");
    line.unit_price = j.value("price", 0.0);
    line.quantity = j.value("quantity", 0);
    return line;
}

double Cart::total() const {
    double total = 0.0;
    for (const auto& line : lines) {
        total += line.subtotal();
    }
    return total;
}

int Cart::item_count() const {
    int count = 0;
    for (const auto& line : lines) {
        count += line.quantity;
    }
    return count;
}

json Cart::to_json() const {
    json items = json::array();
    for (const auto& line : lines) {
        items.push_back(line.to_json());
    }
    return {
        {"items", items},
        {"total_price", total()},
        {"item_count", item_count()}
    };
}

Cart Cart::from_json(const json& j) {
    Cart cart;
    if (j.contains("items") && j["items"].is_array()) {
        for (const auto& line : j["items"]) {
            cart.lines.push_back(CartLine::from_json(line));
        }
    }
    return cart;
}

std::string Cart::summary(const std::string& language) const {
    bool ar = language == "ar";
    if (lines.empty()) {
        return ar ? "السلة فاضية" : "Your cart is empty";
    }

    std::string currency = ar ? " جنيه" : " EGP";
    std::string out = ar ? "السلة الحالية:\n" : "Current Cart:\n";
    for (const auto& line : lines) {
        out += "  • " + line.name + " (" + line.size + ") x" + std::to_string(line.quantity) +
               " = " + text::format_price(line.subtotal()) + currency + "\n";
    }
    out += (ar ? "\nالإجمالي: " : "\nTotal: ") + text::format_price(total()) + currency;
    return out;
}

// ============================================================================
// Users, orders, history
// ============================================================================

json UserProfile::to_json() const {
    return {{"id", id}, {"name", name}, {"preferred_language", preferred_language}};
}

UserProfile UserProfile::from_json(const json& j) {
    UserProfile user;
    user.id = j.value("id", "");
    user.name = j.value("name", "");
    user.preferred_language = j.value("preferred_language", "en");
    return user;
}

json OrderReceipt::to_json() const {
    json items_json = json::array();
    for (const auto& line : items) {
        items_json.push_back(line.to_json());
    }
    return {
        {"order_id", order_id},
        {"user_id", user_id},
        {"items", items_json},
        {"total_price", total_price},
        {"status", status},
        {"created_at", to_epoch_seconds(created_at)}
    };
}

OrderReceipt OrderReceipt::from_json(const json& j) {
    OrderReceipt order;
    order.order_id = j.value("order_id", OrderId{0});
    order.user_id = j.value("user_id", "");
    if (j.contains("items") && j["items"].is_array()) {
        for (const auto& line : j["items"]) {
            order.items.push_back(CartLine::from_json(line));
        }
    }
    order.total_price = j.value("total_price", 0.0);
    order.status = j.value("status", "pending");
    order.created_at = from_epoch_seconds(j.value("created_at", int64_t{0}));
    return order;
}

json HistoryEntry::to_json() const {
    return {
        {"role", role},
        {"text", text},
        {"metadata", metadata},
        {"timestamp", to_epoch_seconds(timestamp)}
    };
}

HistoryEntry HistoryEntry::from_json(const json& j) {
    HistoryEntry entry;
    entry.role = j.value("role", "");
    entry.text = j.value("text", "");
    entry.metadata = j.value("metadata", json::object());
    entry.timestamp = from_epoch_seconds(j.value("timestamp", int64_t{0}));
    return entry;
}

}  // namespace orderbot::store
