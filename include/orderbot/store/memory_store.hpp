#pragma once

#include <orderbot/config.hpp>
#include <orderbot/store/state_store.hpp>
#include <orderbot/util/logger.hpp>

#include <memory>
#include <unordered_map>
#include <vector>

namespace orderbot::store {

/**
 * MemoryStore - in-process StateStore.
 *
 * Holds the menu, carts, orders, history and sessions in memory. The
 * menu comes from Config::menu_path or the built-in pizza menu. When
 * Config::state_path is set, state is loaded on open and written back
 * by flush() and close().
 */
class MemoryStore : public StateStore {
public:
    /**
     * Open a store.
     *
     * @param config Menu and state file locations
     * @param logger Optional logger
     * @return The opened store, or IO_ERROR / CORRUPTION for unreadable files
     */
    static Result<std::unique_ptr<MemoryStore>> open(const Config& config,
                                                     LoggerPtr logger = nullptr);

    /**
     * Flush state (if a state file is configured) and close.
     */
    void close();

    ~MemoryStore() override;

    /**
     * Write carts, orders, history and sessions to the state file.
     * A no-op without a configured state file.
     */
    Result<void> flush();

    bool is_open() const { return is_open_; }

    // The built-in menu: nine pizzas in S/M/L and four REG additions
    static std::vector<MenuItem> default_menu();

    // ========================================================================
    // Menu administration
    // ========================================================================

    // Replace the menu; ids are reassigned from 1 in list order
    void set_menu(std::vector<MenuItem> items);

    Result<void> set_item_availability(MenuItemId item_id, bool available);
    Result<void> set_size_availability(MenuItemId item_id, const std::string& size, bool available);

    // ========================================================================
    // StateStore
    // ========================================================================

    Result<UserProfile> get_user(const UserId& user_id) override;

    Result<MenuItem> get_menu_item(const std::string& query, bool exact) override;
    Result<MenuItem> get_menu_item_by_id(MenuItemId item_id) override;
    Result<std::vector<MenuItem>> search_menu(const std::string& query) override;
    Result<std::vector<MenuItem>> list_menu(const std::string& category = "") override;
    Result<std::vector<MenuSize>> get_available_sizes(MenuItemId item_id) override;

    Result<Cart> get_cart(const UserId& user_id) override;
    Result<CartLine> add_to_cart(const UserId& user_id, MenuItemId item_id,
                                 const std::string& size, int quantity) override;
    Result<CartLine> remove_from_cart(const UserId& user_id, MenuItemId item_id,
                                      const std::string& size) override;
    Result<void> update_cart_quantity(const UserId& user_id, MenuItemId item_id,
                                      const std::string& size, int quantity) override;
    Result<void> clear_cart(const UserId& user_id) override;
    Result<OrderReceipt> checkout(const UserId& user_id) override;

    Result<OrderReceipt> get_order(OrderId order_id) override;
    Result<std::vector<OrderReceipt>> list_orders(const UserId& user_id) override;
    Result<std::vector<std::pair<MenuItemId, int>>> popular_items(size_t limit) override;

    Result<std::vector<HistoryEntry>> get_history(const UserId& user_id, size_t limit) override;
    Result<void> append_history(const UserId& user_id, const std::string& role,
                                const std::string& text, const json& metadata) override;

    Result<SessionState> load_session(const UserId& user_id) override;
    Result<void> save_session(const UserId& user_id, const SessionState& session) override;

private:
    MemoryStore() = default;

    Result<void> load_menu_file(const fs::path& path);
    Result<void> load_state_file(const fs::path& path);
    const MenuItem* find_item(MenuItemId item_id) const;

    std::vector<MenuItem> menu_;
    std::unordered_map<UserId, UserProfile> users_;
    std::unordered_map<UserId, Cart> carts_;
    std::vector<OrderReceipt> orders_;
    std::unordered_map<UserId, std::vector<HistoryEntry>> history_;
    std::unordered_map<UserId, SessionState> sessions_;
    OrderId next_order_id_ = 1;
    fs::path state_path_;
    LoggerPtr logger_;
    bool is_open_ = false;
};

}  // namespace orderbot::store
