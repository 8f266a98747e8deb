#include <orderbot/types.hpp>
#include <orderbot/util/text.hpp>

#include <unordered_map>

namespace orderbot {

// ============================================================================
// Intent names
// ============================================================================

const char* intent_name(Intent intent) {
    switch (intent) {
        case Intent::WELCOME: return "welcome";
        case Intent::TRACK_ORDER: return "track_order";
        case Intent::ADD_ITEM: return "add_item";
        case Intent::REMOVE_ITEM: return "remove_item";
        case Intent::VIEW_CART: return "view_cart";
        case Intent::CLEAR_CART: return "clear_cart";
        case Intent::CHECKOUT: return "checkout";
        case Intent::BROWSE_MENU: return "browse_menu";
        case Intent::NEW_ORDER: return "new_order";
        case Intent::CONFIRMATION: return "confirmation";
        case Intent::REJECTION: return "rejection";
    }
    return "unknown";
}

std::optional<Intent> parse_intent(const std::string& label) {
    static const std::unordered_map<std::string, Intent> LABELS = {
        {"welcome", Intent::WELCOME},
        {"greeting", Intent::WELCOME},
        {"track_order", Intent::TRACK_ORDER},
        {"add_item", Intent::ADD_ITEM},
        {"remove_item", Intent::REMOVE_ITEM},
        {"view_cart", Intent::VIEW_CART},
        {"clear_cart", Intent::CLEAR_CART},
        {"checkout", Intent::CHECKOUT},
        {"browse_menu", Intent::BROWSE_MENU},
        {"item_info", Intent::BROWSE_MENU},
        {"get_price", Intent::BROWSE_MENU},
        {"new_order", Intent::NEW_ORDER},
        {"confirmation", Intent::CONFIRMATION},
        {"rejection", Intent::REJECTION},
    };

    auto it = LABELS.find(text::to_lower(text::trim(label)));
    if (it == LABELS.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<Intent>& all_intents() {
    static const std::vector<Intent> INTENTS = {
        Intent::WELCOME, Intent::TRACK_ORDER, Intent::ADD_ITEM,
        Intent::REMOVE_ITEM, Intent::VIEW_CART, Intent::CLEAR_CART,
        Intent::CHECKOUT, Intent::BROWSE_MENU, Intent::NEW_ORDER,
        Intent::CONFIRMATION, Intent::REJECTION
    };
    return INTENTS;
}

const char* source_name(ExtractionSource source) {
    switch (source) {
        case ExtractionSource::PATTERN: return "pattern";
        case ExtractionSource::FALLBACK: return "fallback";
        case ExtractionSource::NONE: return "none";
        case ExtractionSource::ERROR: return "error";
    }
    return "none";
}

// ============================================================================
// Entities
// ============================================================================

std::string normalize_size_code(const std::string& size) {
    static const std::unordered_map<std::string, std::string> CODES = {
        {"s", "S"}, {"small", "S"},
        {"m", "M"}, {"medium", "M"},
        {"l", "L"}, {"large", "L"}, {"big", "L"},
        {"reg", "REG"}, {"regular", "REG"},
    };
    auto it = CODES.find(text::to_lower(text::trim(size)));
    if (it != CODES.end()) {
        return it->second;
    }
    return text::trim(size);
}

bool Entities::has(const std::string& field) const {
    if (field == fields::ITEM) return item && !item->empty();
    if (field == fields::SIZE) return size && !size->empty();
    if (field == fields::QUANTITY) return quantity.has_value();
    if (field == fields::ORDER_ID) return order_id && !order_id->empty();
    if (field == fields::ADDRESS) return address && !address->empty();
    if (field == fields::PHONE) return phone && !phone->empty();
    return false;
}

bool Entities::empty() const {
    return !item && !size && !quantity && !order_id && !address && !phone;
}

bool Entities::set(const std::string& field, const std::string& value) {
    std::string v = text::trim(value);
    if (v.empty()) {
        return false;
    }

    if (field == fields::QUANTITY) {
        int q = text::parse_positive_int(v);
        if (q <= 0) return false;
        quantity = q;
        return true;
    }
    if (field == fields::ITEM) { item = v; return true; }
    if (field == fields::SIZE) { size = normalize_size_code(v); return true; }
    if (field == fields::ORDER_ID) { order_id = v; return true; }
    if (field == fields::ADDRESS) { address = v; return true; }
    if (field == fields::PHONE) { phone = v; return true; }
    return false;
}

void Entities::overlay(const Entities& other) {
    if (other.item) item = other.item;
    if (other.size) size = other.size;
    if (other.quantity) quantity = other.quantity;
    if (other.order_id) order_id = other.order_id;
    if (other.address) address = other.address;
    if (other.phone) phone = other.phone;
}

json Entities::to_json() const {
    auto opt = [](const std::optional<std::string>& v) -> json {
        return v ? json(*v) : json(nullptr);
    };
    json j;
    j[fields::ITEM] = opt(item);
    j[fields::SIZE] = opt(size);
    j[fields::QUANTITY] = quantity ? json(*quantity) : json(nullptr);
    j[fields::ORDER_ID] = opt(order_id);
    j[fields::ADDRESS] = opt(address);
    j[fields::PHONE] = opt(phone);
    return j;
}

Entities Entities::from_json(const json& j) {
    Entities e;
    if (!j.is_object()) {
        return e;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (v.is_null()) continue;

        if (v.is_string()) {
            e.set(it.key(), v.get<std::string>());
        } else if (v.is_number_integer()) {
            e.set(it.key(), std::to_string(v.get<long long>()));
        } else if (v.is_number()) {
            e.set(it.key(), std::to_string(static_cast<long long>(v.get<double>())));
        }
    }
    return e;
}

json BatchItem::to_json() const {
    return {
        {"item", item},
        {"size", size ? json(*size) : json(nullptr)},
        {"quantity", quantity}
    };
}

// ============================================================================
// Dialogue state
// ============================================================================

const char* dialogue_state_name(DialogueState state) {
    switch (state) {
        case DialogueState::IDLE: return "idle";
        case DialogueState::AWAITING_SIZE: return "awaiting_size";
        case DialogueState::AWAITING_QUANTITY: return "awaiting_quantity";
        case DialogueState::AWAITING_CONFIRMATION: return "awaiting_confirmation";
        case DialogueState::AWAITING_ADDRESS: return "awaiting_address";
        case DialogueState::AWAITING_PAYMENT: return "awaiting_payment";
        case DialogueState::CLARIFYING_ITEM: return "clarifying_item";
    }
    return "idle";
}

std::optional<DialogueState> parse_dialogue_state(const std::string& name) {
    static const std::unordered_map<std::string, DialogueState> STATES = {
        {"idle", DialogueState::IDLE},
        {"awaiting_size", DialogueState::AWAITING_SIZE},
        {"awaiting_quantity", DialogueState::AWAITING_QUANTITY},
        {"awaiting_confirmation", DialogueState::AWAITING_CONFIRMATION},
        {"awaiting_address", DialogueState::AWAITING_ADDRESS},
        {"awaiting_payment", DialogueState::AWAITING_PAYMENT},
        {"clarifying_item", DialogueState::CLARIFYING_ITEM},
    };
    auto it = STATES.find(name);
    if (it == STATES.end()) {
        return std::nullopt;
    }
    return it->second;
}

int64_t to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
}

TimePoint from_epoch_seconds(int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

json PendingAction::to_json() const {
    return {
        {"action_type", intent_name(action)},
        {"missing_info", missing_fields},
        {"partial_data", partial.to_json()},
        {"created_at", to_epoch_seconds(created_at)},
        {"attempts", attempts}
    };
}

std::optional<PendingAction> PendingAction::from_json(const json& j) {
    if (!j.is_object() || !j.contains("action_type")) {
        return std::nullopt;
    }
    auto intent = parse_intent(j.value("action_type", ""));
    if (!intent) {
        return std::nullopt;
    }

    PendingAction pa;
    pa.action = *intent;
    if (j.contains("missing_info") && j["missing_info"].is_array()) {
        for (const auto& f : j["missing_info"]) {
            if (f.is_string()) pa.missing_fields.push_back(f.get<std::string>());
        }
    }
    pa.partial = Entities::from_json(j.value("partial_data", json::object()));
    pa.created_at = from_epoch_seconds(j.value("created_at", int64_t{0}));
    pa.attempts = j.value("attempts", 0);
    return pa;
}

json PendingSuggestion::to_json() const {
    json j = proposed.to_json();
    j["type"] = intent_name(action);
    j["created_at"] = to_epoch_seconds(created_at);
    return j;
}

std::optional<PendingSuggestion> PendingSuggestion::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto intent = parse_intent(j.value("type", ""));
    if (!intent) {
        return std::nullopt;
    }

    PendingSuggestion ps;
    ps.action = *intent;
    json slots = j;
    slots.erase("type");
    slots.erase("created_at");
    ps.proposed = Entities::from_json(slots);
    ps.created_at = from_epoch_seconds(j.value("created_at", int64_t{0}));
    return ps;
}

json SessionState::to_json() const {
    json j;
    j["state"] = dialogue_state_name(state);
    j["pending_action"] = pending_action ? pending_action->to_json() : json(nullptr);
    j["pending_suggestion"] = pending_suggestion ? pending_suggestion->to_json() : json(nullptr);
    return j;
}

SessionState SessionState::from_json(const json& j) {
    SessionState s;
    if (!j.is_object()) {
        return s;
    }
    if (auto st = parse_dialogue_state(j.value("state", "idle"))) {
        s.state = *st;
    }
    if (j.contains("pending_action")) {
        s.pending_action = PendingAction::from_json(j["pending_action"]);
    }
    if (j.contains("pending_suggestion")) {
        s.pending_suggestion = PendingSuggestion::from_json(j["pending_suggestion"]);
    }
    return s;
}

}  // namespace orderbot
