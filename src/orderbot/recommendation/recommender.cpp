#include <orderbot/recommendation/recommender.hpp>
#include <orderbot/util/text.hpp>

#include <set>

namespace orderbot::recommendation {

namespace {

const std::vector<std::string> DRINK_NAMES = {"Cola", "Mango Juice"};
const char* SIDE_NAME = "Fries";

bool is_drink(const store::CartLine& line) {
    std::string name = text::to_lower(line.name);
    return text::contains(name, "cola") || text::contains(name, "juice") ||
           text::contains(name, "water");
}

bool is_side(const store::CartLine& line) {
    return text::contains(text::to_lower(line.name), "fries");
}

Recommendation make_recommendation(const store::MenuItem& item, std::string reason,
                                   std::string badge) {
    Recommendation rec;
    rec.item_id = item.id;
    rec.name = item.name;
    rec.category = item.category;
    rec.sizes = item.available_sizes();
    rec.reason = std::move(reason);
    rec.badge = std::move(badge);
    return rec;
}

// Collects recommendations while enforcing the limit and de-duplication
class Picker {
public:
    Picker(const store::Cart& cart, size_t limit) : limit_(limit) {
        for (const auto& line : cart.lines) {
            taken_.insert(line.item_id);
        }
    }

    bool full() const { return picked_.size() >= limit_; }

    bool offer(const store::MenuItem& item, const std::string& reason, const std::string& badge) {
        if (full() || !item.available || item.available_sizes().empty()) {
            return false;
        }
        if (!taken_.insert(item.id).second) {
            return false;
        }
        picked_.push_back(make_recommendation(item, reason, badge));
        return true;
    }

    std::vector<Recommendation> take() { return std::move(picked_); }

private:
    size_t limit_;
    std::set<store::MenuItemId> taken_;
    std::vector<Recommendation> picked_;
};

}  // namespace

json Recommendation::to_json() const {
    json j_sizes = json::array();
    for (const auto& s : sizes) {
        j_sizes.push_back({{"size", s.code}, {"price", s.price}});
    }
    return {
        {"menu_item_id", item_id},
        {"name", name},
        {"category", category},
        {"sizes", j_sizes},
        {"reason", reason},
        {"badge", badge}
    };
}

MenuRecommender::MenuRecommender(store::StateStore& store)
    : store_(store) {}

Result<std::vector<Recommendation>> MenuRecommender::get_recommendations(
    const store::UserId& user_id, const store::Cart& cart, size_t max_items) {
    Picker picker(cart, max_items);
    if (max_items == 0) {
        return picker.take();
    }

    // 1. Complementary items for what is already in the cart
    bool has_pizza = false, has_drink = false, has_side = false;
    for (const auto& line : cart.lines) {
        has_pizza = has_pizza || line.category == store::CATEGORY_PIZZA;
        has_drink = has_drink || is_drink(line);
        has_side = has_side || is_side(line);
    }

    if (has_pizza && !has_drink) {
        for (const auto& name : DRINK_NAMES) {
            auto drink = store_.get_menu_item(name, true);
            if (drink.ok() && picker.offer(drink.value(), "Perfect with your pizza!", "🥤 Pair it")) {
                break;
            }
        }
    }
    if (has_pizza && !has_side) {
        auto side = store_.get_menu_item(SIDE_NAME, true);
        if (side.ok()) {
            picker.offer(side.value(), "Complete your meal!", "🍟 Add on");
        }
    }

    // 2. Same categories as the user's past orders
    if (!picker.full()) {
        auto orders = store_.list_orders(user_id);
        if (!orders.ok()) {
            return orders.error();
        }

        std::set<store::MenuItemId> ordered_before;
        std::set<std::string> categories;
        for (const auto& order : orders.value()) {
            for (const auto& line : order.items) {
                ordered_before.insert(line.item_id);
                categories.insert(line.category);
            }
        }

        if (!categories.empty()) {
            auto menu = store_.list_menu();
            if (!menu.ok()) {
                return menu.error();
            }
            for (const auto& item : menu.value()) {
                if (picker.full()) break;
                if (categories.count(item.category) && !ordered_before.count(item.id)) {
                    picker.offer(item, "Based on your previous orders", "✨ For You");
                }
            }
        }
    }

    // 3. Most ordered overall
    if (!picker.full()) {
        auto popular = store_.popular_items(max_items * 3);
        if (!popular.ok()) {
            return popular.error();
        }
        for (const auto& [item_id, count] : popular.value()) {
            if (picker.full()) break;
            auto item = store_.get_menu_item_by_id(item_id);
            if (item.ok()) {
                picker.offer(item.value(), "Popular choice", "🔥 Popular");
            }
        }
    }

    // 4. Featured fallback
    if (!picker.full()) {
        auto menu = store_.list_menu();
        if (!menu.ok()) {
            return menu.error();
        }
        for (const auto& item : menu.value()) {
            if (picker.full()) break;
            picker.offer(item, "Great choice", "⭐ Featured");
        }
    }

    return picker.take();
}

std::string MenuRecommender::format_recommendations_text(
    const std::vector<Recommendation>& recommendations,
    const std::string& language) const {
    if (recommendations.empty()) {
        return "";
    }

    bool ar = language == "ar";
    std::string currency = ar ? " جنيه" : " EGP";
    std::string out = ar ? "🎯 اقتراحات ليك:\n\n" : "🎯 Recommendations for you:\n\n";

    for (const auto& rec : recommendations) {
        out += (rec.badge.empty() ? std::string("⭐") : rec.badge) + " " + rec.name + "\n";
        if (!rec.reason.empty()) {
            out += "   " + rec.reason + "\n";
        }
        if (rec.sizes.size() == 1) {
            out += "   " + text::format_price(rec.sizes.front().price) + currency + "\n";
        } else if (!rec.sizes.empty()) {
            std::vector<std::string> parts;
            for (const auto& s : rec.sizes) {
                parts.push_back(s.code + "(" + text::format_price(s.price) + currency + ")");
            }
            out += "   " + text::join(parts, ", ") + "\n";
        }
        out += "\n";
    }
    return out;
}

}  // namespace orderbot::recommendation
