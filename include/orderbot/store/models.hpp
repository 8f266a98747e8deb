#pragma once

#include <orderbot/types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace orderbot::store {

using UserId = std::string;
using MenuItemId = uint32_t;
using OrderId = uint64_t;

constexpr MenuItemId INVALID_MENU_ITEM_ID = 0;

// Menu categories used by the built-in menu
constexpr const char* CATEGORY_PIZZA = "pizza";
constexpr const char* CATEGORY_ADDITION = "addition";

/**
 * One orderable size of a menu item (S, M, L or REG).
 */
struct MenuSize {
    std::string code;
    double price = 0.0;
    bool available = true;
};

struct MenuItem {
    MenuItemId id = INVALID_MENU_ITEM_ID;
    std::string name;
    std::string category;
    std::string description;
    bool available = true;
    std::vector<MenuSize> sizes;

    // Case-insensitive size lookup; nullptr if the item has no such size
    const MenuSize* find_size(const std::string& code) const;

    std::vector<MenuSize> available_sizes() const;

    // "Cola (REG: 20 EGP)", or "Cola (Currently unavailable)"
    std::string display_line() const;

    json to_json() const;
    static MenuItem from_json(const json& j);
};

struct CartLine {
    MenuItemId item_id = INVALID_MENU_ITEM_ID;
    std::string name;
    std::string category;
    std::string size;
    double unit_price = 0.0;
    int quantity = 0;

    double subtotal() const { return unit_price * quantity; }

    json to_json() const;
    static CartLine from_json(const json& j);
};

/**
 * Snapshot of a user's cart at the time it was read.
 */
struct Cart {
    std::vector<CartLine> lines;

    bool empty() const { return lines.empty(); }
    double total() const;
    int item_count() const;

    // {"items": [...], "total_price": N, "item_count": N}
    json to_json() const;
    static Cart from_json(const json& j);

    /**
     * Human-readable cart listing:
     * "Current Cart:\n  • Cola (REG) x2 = 40 EGP\n\nTotal: 40 EGP"
     */
    std::string summary(const std::string& language = "en") const;
};

struct UserProfile {
    UserId id;
    std::string name;
    std::string preferred_language = "en";

    json to_json() const;
    static UserProfile from_json(const json& j);
};

struct OrderReceipt {
    OrderId order_id = 0;
    UserId user_id;
    std::vector<CartLine> items;
    double total_price = 0.0;
    std::string status = "pending";
    TimePoint created_at;

    json to_json() const;
    static OrderReceipt from_json(const json& j);
};

/**
 * One persisted line of conversation.
 */
struct HistoryEntry {
    std::string role;       // "user" or "bot"
    std::string text;
    json metadata = json::object();
    TimePoint timestamp;

    json to_json() const;
    static HistoryEntry from_json(const json& j);
};

}  // namespace orderbot::store
