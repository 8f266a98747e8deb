#pragma once

#include <orderbot/result.hpp>
#include <orderbot/store/state_store.hpp>

#include <string>
#include <vector>

namespace orderbot::recommendation {

struct Recommendation {
    store::MenuItemId item_id = store::INVALID_MENU_ITEM_ID;
    std::string name;
    std::string category;
    std::vector<store::MenuSize> sizes;
    std::string reason;
    std::string badge;

    json to_json() const;
};

/**
 * Source of "you might also like" suggestions appended to replies.
 */
class Recommender {
public:
    virtual ~Recommender() = default;

    /**
     * @param user_id Customer
     * @param cart Current cart snapshot
     * @param max_items Upper bound on the list size
     */
    virtual Result<std::vector<Recommendation>> get_recommendations(
        const store::UserId& user_id, const store::Cart& cart, size_t max_items) = 0;

    /**
     * Render recommendations for chat. Empty list renders as "".
     */
    virtual std::string format_recommendations_text(
        const std::vector<Recommendation>& recommendations,
        const std::string& language) const = 0;
};

/**
 * Recommender driven by the menu and order history in a StateStore.
 *
 * Strategies, in priority order, until max_items is reached:
 * complementary items for the cart (a drink, then fries, next to a
 * pizza), items from categories the user ordered before, items most
 * ordered by everyone, then the first available menu items. Items
 * already in the cart or already recommended are skipped.
 */
class MenuRecommender : public Recommender {
public:
    explicit MenuRecommender(store::StateStore& store);

    Result<std::vector<Recommendation>> get_recommendations(
        const store::UserId& user_id, const store::Cart& cart, size_t max_items) override;

    std::string format_recommendations_text(
        const std::vector<Recommendation>& recommendations,
        const std::string& language) const override;

private:
    store::StateStore& store_;
};

}  // namespace orderbot::recommendation
