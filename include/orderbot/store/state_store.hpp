#pragma once

#include <orderbot/result.hpp>
#include <orderbot/store/models.hpp>
#include <orderbot/types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace orderbot::store {

/**
 * External state owned outside the dialogue engine: users, carts, the
 * menu, orders, conversation history and per-user dialogue sessions.
 *
 * Every operation reports failure through Result; none is expected to
 * throw. Reads return snapshots, so callers re-read after mutating.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    // ------------------------------------------------------------------
    // Users
    // ------------------------------------------------------------------

    // Unknown users are created on first access
    virtual Result<UserProfile> get_user(const UserId& user_id) = 0;

    // ------------------------------------------------------------------
    // Menu
    // ------------------------------------------------------------------

    /**
     * Look up a menu item by name.
     *
     * @param query Item name as the customer wrote it
     * @param exact Require a case-insensitive full-name match; otherwise
     *        the first item whose name contains the query is returned
     * @return The item, or NOT_FOUND
     */
    virtual Result<MenuItem> get_menu_item(const std::string& query, bool exact) = 0;

    virtual Result<MenuItem> get_menu_item_by_id(MenuItemId item_id) = 0;

    /**
     * Items that resemble the query word-by-word, closest first. Used to
     * propose an alternative when get_menu_item finds nothing.
     */
    virtual Result<std::vector<MenuItem>> search_menu(const std::string& query) = 0;

    // All items, or those of one category when category is non-empty
    virtual Result<std::vector<MenuItem>> list_menu(const std::string& category = "") = 0;

    virtual Result<std::vector<MenuSize>> get_available_sizes(MenuItemId item_id) = 0;

    // ------------------------------------------------------------------
    // Cart
    // ------------------------------------------------------------------

    virtual Result<Cart> get_cart(const UserId& user_id) = 0;

    /**
     * Add quantity of one item size. Adding a size already in the cart
     * increases that line's quantity.
     *
     * @return The resulting cart line
     */
    virtual Result<CartLine> add_to_cart(const UserId& user_id, MenuItemId item_id,
                                         const std::string& size, int quantity) = 0;

    // Remove a whole line; NOT_FOUND if the cart has no such line
    virtual Result<CartLine> remove_from_cart(const UserId& user_id, MenuItemId item_id,
                                              const std::string& size) = 0;

    // Set a line's quantity; zero or less removes the line
    virtual Result<void> update_cart_quantity(const UserId& user_id, MenuItemId item_id,
                                              const std::string& size, int quantity) = 0;

    virtual Result<void> clear_cart(const UserId& user_id) = 0;

    /**
     * Turn the cart into an order and empty the cart.
     *
     * @return The order receipt, or EMPTY_CART
     */
    virtual Result<OrderReceipt> checkout(const UserId& user_id) = 0;

    // ------------------------------------------------------------------
    // Orders
    // ------------------------------------------------------------------

    virtual Result<OrderReceipt> get_order(OrderId order_id) = 0;
    virtual Result<std::vector<OrderReceipt>> list_orders(const UserId& user_id) = 0;

    // (item id, units ordered) across all users, most ordered first
    virtual Result<std::vector<std::pair<MenuItemId, int>>> popular_items(size_t limit) = 0;

    // ------------------------------------------------------------------
    // Conversation history and sessions
    // ------------------------------------------------------------------

    // Most recent entries, oldest first
    virtual Result<std::vector<HistoryEntry>> get_history(const UserId& user_id, size_t limit) = 0;

    virtual Result<void> append_history(const UserId& user_id, const std::string& role,
                                        const std::string& text, const json& metadata) = 0;

    virtual Result<SessionState> load_session(const UserId& user_id) = 0;
    virtual Result<void> save_session(const UserId& user_id, const SessionState& session) = 0;
};

}  // namespace orderbot::store
