#include <orderbot/store/memory_store.hpp>
#include <orderbot/util/text.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

namespace orderbot::store {

namespace {

Result<json> read_json_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    json j = json::parse(ss.str(), nullptr, false);
    if (j.is_discarded()) {
        return Error(ErrorCode::CORRUPTION, "Invalid JSON in " + path.string());
    }
    return j;
}

MenuItem make_item(const std::string& name, const std::string& category,
                   std::vector<MenuSize> sizes) {
    MenuItem item;
    item.name = name;
    item.category = category;
    item.sizes = std::move(sizes);
    return item;
}

// "colas" -> "cola"; only strips a single trailing s from words of 4+ letters
std::string singular(const std::string& s) {
    if (s.size() >= 4 && s.back() == 's' && s[s.size() - 2] != 's') {
        return s.substr(0, s.size() - 1);
    }
    return s;
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Result<std::unique_ptr<MemoryStore>> MemoryStore::open(const Config& config, LoggerPtr logger) {
    auto store = std::unique_ptr<MemoryStore>(new MemoryStore());
    store->logger_ = logger ? std::move(logger) : make_null_logger();

    if (config.menu_path.empty()) {
        store->set_menu(default_menu());
    } else {
        auto loaded = store->load_menu_file(config.menu_path);
        if (!loaded.ok()) {
            return loaded.error().with_context("Loading menu");
        }
    }

    store->state_path_ = config.state_path;
    if (!config.state_path.empty()) {
        std::error_code ec;
        if (fs::exists(config.state_path, ec)) {
            auto loaded = store->load_state_file(config.state_path);
            if (!loaded.ok()) {
                return loaded.error().with_context("Loading state");
            }
        }
    }

    store->is_open_ = true;
    store->logger_->debug("Store opened with " + std::to_string(store->menu_.size()) + " menu items");
    return std::move(store);
}

void MemoryStore::close() {
    if (!is_open_) {
        return;
    }
    auto flushed = flush();
    if (!flushed.ok()) {
        logger_->error("Failed to save state: " + flushed.error().to_string());
    }
    is_open_ = false;
}

MemoryStore::~MemoryStore() {
    close();
}

std::vector<MenuItem> MemoryStore::default_menu() {
    auto pizza = [](const std::string& name, double s, double m, double l) {
        return make_item(name, CATEGORY_PIZZA, {{"S", s, true}, {"M", m, true}, {"L", l, true}});
    };
    auto addition = [](const std::string& name, double price) {
        return make_item(name, CATEGORY_ADDITION, {{"REG", price, true}});
    };

    return {
        pizza("Margherita Pizza", 83, 100, 140),
        pizza("Vegetables Pizza", 85, 105, 145),
        pizza("Mushroom Pizza", 90, 120, 160),
        pizza("Cheese Lovers Pizza", 100, 125, 170),
        pizza("Hot Dog Pizza", 100, 125, 170),
        pizza("Salami Pizza", 105, 135, 180),
        pizza("Pastrami Pizza", 105, 135, 180),
        pizza("Double Pepperoni Pizza", 110, 145, 195),
        pizza("Super Supreme Pizza", 125, 165, 215),
        addition("Fries", 50),
        addition("Mango Juice", 40),
        addition("Cola", 20),
        addition("Water", 10),
    };
}

void MemoryStore::set_menu(std::vector<MenuItem> items) {
    menu_ = std::move(items);
    MenuItemId next_id = 1;
    for (auto& item : menu_) {
        item.id = next_id++;
    }
}

Result<void> MemoryStore::load_menu_file(const fs::path& path) {
    auto parsed = read_json_file(path);
    if (!parsed.ok()) {
        return parsed.error();
    }

    const json& j = parsed.value();
    if (!j.is_array() && !j.is_object()) {
        return Error(ErrorCode::CORRUPTION, "Menu file is not a JSON object or array: " + path.string());
    }
    const json& items = j.is_array() ? j : j.value("items", json::array());
    if (!items.is_array() || items.empty()) {
        return Error(ErrorCode::CORRUPTION, "Menu file has no items: " + path.string());
    }

    std::vector<MenuItem> menu;
    for (const auto& entry : items) {
        MenuItem item = MenuItem::from_json(entry);
        if (item.name.empty() || item.sizes.empty()) {
            return Error(ErrorCode::CORRUPTION,
                "Menu entry needs a name and at least one size in " + path.string());
        }
        menu.push_back(std::move(item));
    }

    set_menu(std::move(menu));
    return Ok();
}

Result<void> MemoryStore::load_state_file(const fs::path& path) {
    auto parsed = read_json_file(path);
    if (!parsed.ok()) {
        return parsed.error();
    }
    const json& j = parsed.value();
    if (!j.is_object()) {
        return Error(ErrorCode::CORRUPTION, "State file is not an object: " + path.string());
    }

    next_order_id_ = j.value("next_order_id", OrderId{1});

    json users = j.value("users", json::array());
    for (const auto& u : users) {
        UserProfile user = UserProfile::from_json(u);
        users_[user.id] = user;
    }

    json carts = j.value("carts", json::object());
    for (auto& el : carts.items()) {
        carts_[el.key()] = Cart::from_json(el.value());
    }

    json orders = j.value("orders", json::array());
    for (const auto& o : orders) {
        orders_.push_back(OrderReceipt::from_json(o));
    }

    json history = j.value("history", json::object());
    for (auto& el : history.items()) {
        auto& list = history_[el.key()];
        for (const auto& e : el.value()) {
            list.push_back(HistoryEntry::from_json(e));
        }
    }

    json sessions = j.value("sessions", json::object());
    for (auto& el : sessions.items()) {
        sessions_[el.key()] = SessionState::from_json(el.value());
    }

    logger_->info("Loaded state: " + std::to_string(orders_.size()) + " orders, " +
                  std::to_string(users_.size()) + " users");
    return Ok();
}

Result<void> MemoryStore::flush() {
    if (state_path_.empty()) {
        return Ok();
    }

    json j;
    j["next_order_id"] = next_order_id_;

    json users = json::array();
    for (const auto& [id, user] : users_) {
        users.push_back(user.to_json());
    }
    j["users"] = users;

    json carts = json::object();
    for (const auto& [id, cart] : carts_) {
        carts[id] = cart.to_json();
    }
    j["carts"] = carts;

    json orders = json::array();
    for (const auto& order : orders_) {
        orders.push_back(order.to_json());
    }
    j["orders"] = orders;

    json history = json::object();
    for (const auto& [id, entries] : history_) {
        json list = json::array();
        for (const auto& e : entries) {
            list.push_back(e.to_json());
        }
        history[id] = list;
    }
    j["history"] = history;

    json sessions = json::object();
    for (const auto& [id, session] : sessions_) {
        sessions[id] = session.to_json();
    }
    j["sessions"] = sessions;

    std::error_code ec;
    if (state_path_.has_parent_path()) {
        fs::create_directories(state_path_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR, "Failed to create state directory: " + ec.message());
        }
    }

    // Write a sibling temp file, then rename it over the state file
    fs::path tmp = state_path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::IO_ERROR, "Cannot write " + tmp.string());
        }
        out << j.dump(2);
        if (!out) {
            return Error(ErrorCode::IO_ERROR, "Write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, state_path_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Failed to replace state file: " + ec.message());
    }
    return Ok();
}

// ============================================================================
// Users
// ============================================================================

Result<UserProfile> MemoryStore::get_user(const UserId& user_id) {
    if (user_id.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty user id");
    }
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        UserProfile user;
        user.id = user_id;
        user.name = user_id;
        it = users_.emplace(user_id, user).first;
    }
    return it->second;
}

// ============================================================================
// Menu
// ============================================================================

const MenuItem* MemoryStore::find_item(MenuItemId item_id) const {
    for (const auto& item : menu_) {
        if (item.id == item_id) {
            return &item;
        }
    }
    return nullptr;
}

Result<MenuItem> MemoryStore::get_menu_item(const std::string& query, bool exact) {
    std::string q = text::squeeze_spaces(text::to_lower(query));
    if (q.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Item name cannot be empty");
    }

    for (const auto& item : menu_) {
        if (text::to_lower(item.name) == q) {
            return item;
        }
    }
    if (exact) {
        return Error(ErrorCode::NOT_FOUND, "'" + query + "' not found in menu");
    }

    std::string single = singular(q);
    for (const auto& item : menu_) {
        std::string name = text::to_lower(item.name);
        if (text::contains(name, q) || text::contains(name, single)) {
            return item;
        }
    }
    return Error(ErrorCode::NOT_FOUND, "'" + query + "' not found in menu");
}

Result<MenuItem> MemoryStore::get_menu_item_by_id(MenuItemId item_id) {
    const MenuItem* item = find_item(item_id);
    if (!item) {
        return Error(ErrorCode::NOT_FOUND, "Unknown menu item " + std::to_string(item_id));
    }
    return *item;
}

Result<std::vector<MenuItem>> MemoryStore::search_menu(const std::string& query) {
    std::string q = text::squeeze_spaces(text::to_lower(query));
    auto query_words = text::split_words(q);

    std::vector<std::pair<size_t, const MenuItem*>> ranked;
    for (const auto& item : menu_) {
        if (!item.available) continue;

        std::string name = text::to_lower(item.name);
        auto name_words = text::split_words(name);

        bool similar = false;
        for (const auto& qw : query_words) {
            if (qw.size() >= 3 && text::contains(name, qw)) {
                similar = true;
                break;
            }
            for (const auto& nw : name_words) {
                if (nw.size() >= 3 && text::contains(qw, nw)) {
                    similar = true;
                    break;
                }
            }
            if (similar) break;
        }

        if (similar) {
            size_t distance = name.size() > q.size() ? name.size() - q.size() : q.size() - name.size();
            ranked.emplace_back(distance, &item);
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<MenuItem> out;
    for (const auto& [distance, item] : ranked) {
        out.push_back(*item);
    }
    return out;
}

Result<std::vector<MenuItem>> MemoryStore::list_menu(const std::string& category) {
    std::vector<MenuItem> out;
    for (const auto& item : menu_) {
        if (category.empty() || text::iequals(item.category, category)) {
            out.push_back(item);
        }
    }
    return out;
}

Result<std::vector<MenuSize>> MemoryStore::get_available_sizes(MenuItemId item_id) {
    const MenuItem* item = find_item(item_id);
    if (!item) {
        return Error(ErrorCode::NOT_FOUND, "Unknown menu item " + std::to_string(item_id));
    }
    return item->available_sizes();
}

Result<void> MemoryStore::set_item_availability(MenuItemId item_id, bool available) {
    for (auto& item : menu_) {
        if (item.id == item_id) {
            item.available = available;
            return Ok();
        }
    }
    return Error(ErrorCode::NOT_FOUND, "Unknown menu item " + std::to_string(item_id));
}

Result<void> MemoryStore::set_size_availability(MenuItemId item_id, const std::string& size,
                                                bool available) {
    for (auto& item : menu_) {
        if (item.id != item_id) continue;
        for (auto& s : item.sizes) {
            if (text::iequals(s.code, size)) {
                s.available = available;
                return Ok();
            }
        }
        return Error(ErrorCode::NOT_FOUND, item.name + " has no size " + size);
    }
    return Error(ErrorCode::NOT_FOUND, "Unknown menu item " + std::to_string(item_id));
}

// ============================================================================
// Cart
// ============================================================================

Result<Cart> MemoryStore::get_cart(const UserId& user_id) {
    auto it = carts_.find(user_id);
    if (it == carts_.end()) {
        return Cart{};
    }
    return it->second;
}

Result<CartLine> MemoryStore::add_to_cart(const UserId& user_id, MenuItemId item_id,
                                          const std::string& size, int quantity) {
    if (quantity <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Quantity must be positive");
    }

    const MenuItem* item = find_item(item_id);
    if (!item) {
        return Error(ErrorCode::NOT_FOUND, "Item not found in menu");
    }
    const MenuSize* menu_size = item->find_size(size);
    if (!menu_size) {
        return Error(ErrorCode::INVALID_ARGUMENT, item->name + " has no size " + size);
    }
    if (!item->available || !menu_size->available) {
        return Error(ErrorCode::OUT_OF_STOCK, item->name + " (" + menu_size->code + ") is unavailable");
    }

    auto& cart = carts_[user_id];
    for (auto& line : cart.lines) {
        if (line.item_id == item_id && line.size == menu_size->code) {
            line.quantity += quantity;
            return line;
        }
    }

    CartLine line;
    line.item_id = item_id;
    line.name = item->name;
    line.category = item->category;
    line.size = menu_size->code;
    line.unit_price = menu_size->price;
    line.quantity = quantity;
    cart.lines.push_back(line);
    return line;
}

Result<CartLine> MemoryStore::remove_from_cart(const UserId& user_id, MenuItemId item_id,
                                               const std::string& size) {
    auto it = carts_.find(user_id);
    if (it != carts_.end()) {
        auto& lines = it->second.lines;
        for (auto line = lines.begin(); line != lines.end(); ++line) {
            if (line->item_id == item_id && text::iequals(line->size, size)) {
                CartLine removed = *line;
                lines.erase(line);
                return removed;
            }
        }
    }
    return Error(ErrorCode::NOT_FOUND, "Item not found in cart");
}

Result<void> MemoryStore::update_cart_quantity(const UserId& user_id, MenuItemId item_id,
                                               const std::string& size, int quantity) {
    if (quantity <= 0) {
        auto removed = remove_from_cart(user_id, item_id, size);
        if (!removed.ok()) {
            return removed.error();
        }
        return Ok();
    }

    auto it = carts_.find(user_id);
    if (it != carts_.end()) {
        for (auto& line : it->second.lines) {
            if (line.item_id == item_id && text::iequals(line.size, size)) {
                line.quantity = quantity;
                return Ok();
            }
        }
    }
    return Error(ErrorCode::NOT_FOUND, "Item not found in cart");
}

Result<void> MemoryStore::clear_cart(const UserId& user_id) {
    carts_[user_id].lines.clear();
    return Ok();
}

Result<OrderReceipt> MemoryStore::checkout(const UserId& user_id) {
    auto it = carts_.find(user_id);
    if (it == carts_.end() || it->second.empty()) {
        return Error(ErrorCode::EMPTY_CART, "Cart is empty");
    }

    OrderReceipt order;
    order.order_id = next_order_id_++;
    order.user_id = user_id;
    order.items = it->second.lines;
    order.total_price = it->second.total();
    order.created_at = Clock::now();
    orders_.push_back(order);

    it->second.lines.clear();
    logger_->info("Order " + std::to_string(order.order_id) + " placed for " + user_id);
    return order;
}

// ============================================================================
// Orders
// ============================================================================

Result<OrderReceipt> MemoryStore::get_order(OrderId order_id) {
    for (const auto& order : orders_) {
        if (order.order_id == order_id) {
            return order;
        }
    }
    return Error(ErrorCode::NOT_FOUND, "Order not found");
}

Result<std::vector<OrderReceipt>> MemoryStore::list_orders(const UserId& user_id) {
    std::vector<OrderReceipt> out;
    for (const auto& order : orders_) {
        if (order.user_id == user_id) {
            out.push_back(order);
        }
    }
    return out;
}

Result<std::vector<std::pair<MenuItemId, int>>> MemoryStore::popular_items(size_t limit) {
    std::map<MenuItemId, int> counts;
    for (const auto& order : orders_) {
        for (const auto& line : order.items) {
            counts[line.item_id] += line.quantity;
        }
    }

    std::vector<std::pair<MenuItemId, int>> ranked(counts.begin(), counts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

// ============================================================================
// History and sessions
// ============================================================================

Result<std::vector<HistoryEntry>> MemoryStore::get_history(const UserId& user_id, size_t limit) {
    auto it = history_.find(user_id);
    if (it == history_.end()) {
        return std::vector<HistoryEntry>{};
    }
    const auto& all = it->second;
    size_t start = all.size() > limit ? all.size() - limit : 0;
    return std::vector<HistoryEntry>(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
}

Result<void> MemoryStore::append_history(const UserId& user_id, const std::string& role,
                                         const std::string& text, const json& metadata) {
    if (role != "user" && role != "bot") {
        return Error(ErrorCode::INVALID_ARGUMENT, "Unknown history role: " + role);
    }
    HistoryEntry entry;
    entry.role = role;
    entry.text = text;
    entry.metadata = metadata.is_null() ? json::object() : metadata;
    entry.timestamp = Clock::now();
    history_[user_id].push_back(std::move(entry));
    return Ok();
}

Result<SessionState> MemoryStore::load_session(const UserId& user_id) {
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) {
        return SessionState{};
    }
    return it->second;
}

Result<void> MemoryStore::save_session(const UserId& user_id, const SessionState& session) {
    sessions_[user_id] = session;
    return Ok();
}

}  // namespace orderbot::store
