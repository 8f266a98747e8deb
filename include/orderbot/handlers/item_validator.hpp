#pragma once

#include <orderbot/result.hpp>
#include <orderbot/store/state_store.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orderbot::handlers {

/**
 * Structured outcome of checking a requested item and size against the menu.
 */
struct ValidationOutcome {
    enum class Status {
        FOUND,
        NOT_FOUND,
        SIMILAR_FOUND,      // No match, but similar items exist
        OUT_OF_STOCK,
        SIZE_UNAVAILABLE,   // Size exists but is switched off
        INVALID_SIZE,       // Item has no such size
        NO_SIZES            // Every size of the item is switched off
    };

    Status status = Status::NOT_FOUND;
    std::optional<store::MenuItem> item;
    std::string size;                       // Resolved size code when FOUND
    double price = 0.0;
    std::vector<store::MenuItem> similar;   // Closest first, when SIMILAR_FOUND
    std::string message;                    // Customer-facing explanation

    bool ok() const { return status == Status::FOUND; }
};

const char* validation_status_name(ValidationOutcome::Status status);

/**
 * Checks existence, stock and size of a requested menu item.
 */
class ItemValidator {
public:
    // Suggestions listed in a "Did you mean" message
    static constexpr size_t MAX_SUGGESTIONS = 3;

    explicit ItemValidator(store::StateStore& store);

    /**
     * Validate an item name and optional size code.
     *
     * A missing size resolves to the first available size. Lookup is
     * exact first, then by substring; when both miss, similar items
     * are searched.
     *
     * @return The outcome, or an error for store failures other than
     *         a plain "not found"
     */
    Result<ValidationOutcome> validate(const std::string& item_name,
                                       const std::optional<std::string>& size) const;

private:
    store::StateStore& store_;
};

}  // namespace orderbot::handlers
