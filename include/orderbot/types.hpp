#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace orderbot {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Intents
// ============================================================================

/**
 * Closed intent vocabulary. Anything outside this set is "no intent".
 */
enum class Intent {
    WELCOME,
    TRACK_ORDER,
    ADD_ITEM,
    REMOVE_ITEM,
    VIEW_CART,
    CLEAR_CART,
    CHECKOUT,
    BROWSE_MENU,
    NEW_ORDER,
    CONFIRMATION,
    REJECTION
};

const char* intent_name(Intent intent);

/**
 * Parse a wire label ("add_item", "view_cart", ...) into an Intent.
 * A few legacy labels are aliased ("item_info" -> browse_menu).
 *
 * @return The intent, or nullopt for unknown labels
 */
std::optional<Intent> parse_intent(const std::string& label);

const std::vector<Intent>& all_intents();

// Label used in envelopes and history when no intent was recognised
constexpr const char* NO_INTENT_LABEL = "unknown";

inline std::string intent_label(const std::optional<Intent>& intent) {
    return intent ? intent_name(*intent) : NO_INTENT_LABEL;
}

// ============================================================================
// Extraction
// ============================================================================

enum class ExtractionSource {
    PATTERN,
    FALLBACK,
    NONE,
    ERROR
};

const char* source_name(ExtractionSource source);

// Entity field names, the fixed slot vocabulary
namespace fields {
constexpr const char* ITEM = "item";
constexpr const char* SIZE = "size";
constexpr const char* QUANTITY = "quantity";
constexpr const char* ORDER_ID = "order_id";
constexpr const char* ADDRESS = "address";
constexpr const char* PHONE = "phone";
}  // namespace fields

// Map English size words ("large", "l") to menu codes; other text is kept
std::string normalize_size_code(const std::string& size);

/**
 * Slot values extracted from one message. Absent slots are nullopt.
 */
struct Entities {
    std::optional<std::string> item;
    std::optional<std::string> size;      // S, M, L or REG
    std::optional<int> quantity;
    std::optional<std::string> order_id;
    std::optional<std::string> address;
    std::optional<std::string> phone;

    // True when the named field is present and non-empty
    bool has(const std::string& field) const;
    bool empty() const;

    /**
     * Set a field from its textual form. Quantity must parse as a
     * positive integer; other fields are stored trimmed.
     *
     * @return false if the field name is unknown or the value is unusable
     */
    bool set(const std::string& field, const std::string& value);

    // Copy every field present in other over this one
    void overlay(const Entities& other);

    json to_json() const;
    static Entities from_json(const json& j);
};

/**
 * One item of a multi-item request ("1 fries 2 cola").
 */
struct BatchItem {
    std::string item;
    std::optional<std::string> size;
    int quantity = 1;

    json to_json() const;
};

/**
 * Standardised output of the extraction stage.
 */
struct ExtractionResult {
    std::optional<Intent> intent;
    Entities entities;
    std::string language = "en";
    ExtractionSource source = ExtractionSource::NONE;
    double confidence = 0.0;
    std::vector<BatchItem> batch_items;

    bool is_batch() const { return batch_items.size() >= 2; }
};

// ============================================================================
// Dialogue session state
// ============================================================================

enum class DialogueState {
    IDLE,
    AWAITING_SIZE,
    AWAITING_QUANTITY,
    AWAITING_CONFIRMATION,
    AWAITING_ADDRESS,
    AWAITING_PAYMENT,
    CLARIFYING_ITEM
};

const char* dialogue_state_name(DialogueState state);
std::optional<DialogueState> parse_dialogue_state(const std::string& name);

/**
 * An incomplete command waiting for the user to supply missing fields.
 */
struct PendingAction {
    Intent action = Intent::ADD_ITEM;
    std::vector<std::string> missing_fields;
    Entities partial;
    TimePoint created_at;
    int attempts = 0;

    json to_json() const;
    static std::optional<PendingAction> from_json(const json& j);
};

/**
 * A proposed action waiting for a yes/no answer.
 */
struct PendingSuggestion {
    Intent action = Intent::ADD_ITEM;
    Entities proposed;
    TimePoint created_at;

    json to_json() const;
    static std::optional<PendingSuggestion> from_json(const json& j);
};

/**
 * Per-user state that survives between turns. At most one pending
 * action and one pending suggestion exist per user; assigning a new one
 * replaces the old.
 */
struct SessionState {
    DialogueState state = DialogueState::IDLE;
    std::optional<PendingAction> pending_action;
    std::optional<PendingSuggestion> pending_suggestion;

    json to_json() const;
    static SessionState from_json(const json& j);
};

// Timestamps are stored as whole seconds since the epoch
int64_t to_epoch_seconds(TimePoint tp);
TimePoint from_epoch_seconds(int64_t seconds);

}  // namespace orderbot
