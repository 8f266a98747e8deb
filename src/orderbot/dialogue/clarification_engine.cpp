#include <orderbot/dialogue/clarification_engine.hpp>
#include <orderbot/util/text.hpp>

#include <algorithm>
#include <regex>

namespace orderbot::dialogue {

namespace {

// Items that come in a single regular size
const std::vector<std::string> SIMPLE_ADDITION_KEYWORDS = {
    "fries", "cola", "juice", "water", "drink",
    "بطاطس", "كولا", "عصير", "مياه"
};

bool is_simple_addition(const std::string& item) {
    std::string lowered = text::to_lower(item);
    for (const auto& keyword : SIMPLE_ADDITION_KEYWORDS) {
        if (text::contains(lowered, keyword)) {
            return true;
        }
    }
    return false;
}

std::string size_label(const std::string& code, bool ar) {
    if (code == "S") return ar ? "صغير" : "Small";
    if (code == "M") return ar ? "متوسط" : "Medium";
    if (code == "L") return ar ? "كبير" : "Large";
    if (code == "REG") return ar ? "عادي" : "Regular";
    return code;
}

bool contains_field(const std::vector<std::string>& fields, const char* field) {
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

}  // namespace

DialogueState awaiting_state_for(const std::string& field) {
    if (field == fields::SIZE) return DialogueState::AWAITING_SIZE;
    if (field == fields::QUANTITY) return DialogueState::AWAITING_QUANTITY;
    if (field == fields::ADDRESS || field == fields::PHONE) return DialogueState::AWAITING_ADDRESS;
    return DialogueState::CLARIFYING_ITEM;
}

ClarificationEngine::ClarificationEngine(store::StateStore& store,
                                         const nlp::PatternMatcher& matcher,
                                         int max_attempts,
                                         LoggerPtr logger)
    : store_(store)
    , matcher_(matcher)
    , max_attempts_(max_attempts > 0 ? max_attempts : 1)
    , logger_(logger ? std::move(logger) : make_null_logger())
    , clock_([] { return Clock::now(); }) {}

// ============================================================================
// Required fields
// ============================================================================

std::vector<std::string> ClarificationEngine::required_fields(Intent intent,
                                                              const Entities& entities) const {
    switch (intent) {
        case Intent::ADD_ITEM:
            if (entities.item && is_simple_addition(*entities.item)) {
                return {fields::ITEM};
            }
            return {fields::ITEM, fields::SIZE};
        case Intent::REMOVE_ITEM:
            return {fields::ITEM};
        case Intent::TRACK_ORDER:
            return {fields::ORDER_ID};
        default:
            return {};
    }
}

ClarificationCheck ClarificationEngine::needs_clarification(Intent intent,
                                                            const Entities& entities) const {
    ClarificationCheck check;
    for (const auto& field : required_fields(intent, entities)) {
        if (!entities.has(field)) {
            check.missing.push_back(field);
        }
    }
    check.needed = !check.missing.empty();
    return check;
}

// ============================================================================
// Questions
// ============================================================================

std::optional<store::MenuItem> ClarificationEngine::resolve_menu_item(const std::string& name) const {
    auto found = store_.get_menu_item(name, false);
    if (found.ok()) {
        return found.value();
    }

    // "the margherita one" -> try each longer word on its own
    for (const auto& word : text::split_words(name)) {
        if (word.size() <= 3) continue;
        auto by_word = store_.get_menu_item(word, false);
        if (by_word.ok()) {
            return by_word.value();
        }
    }
    return std::nullopt;
}

std::string ClarificationEngine::generate_question(Intent intent, const Entities& entities,
                                                   const std::vector<std::string>& missing,
                                                   const std::string& language,
                                                   const store::Cart& cart) const {
    bool ar = language == "ar";

    if (contains_field(missing, fields::ITEM)) {
        if (intent == Intent::REMOVE_ITEM) {
            if (cart.empty()) {
                return ar ? "السلة فاضية، مفيش حاجة تتشال."
                          : "Your cart is empty. There's nothing to remove.";
            }
            std::vector<std::string> names;
            for (const auto& line : cart.lines) {
                names.push_back(line.name + " (" + line.size + ")");
            }
            return (ar ? "عايز تشيل إيه؟ في السلة: " : "Which item would you like to remove? Your cart has: ") +
                   text::join(names, ", ");
        }
        return ar ? "عايز تطلب إيه؟ قولي اسم الصنف."
                  : "What would you like to order? Please tell me the item name.";
    }

    if (missing.size() == 1 && missing.front() == fields::SIZE && entities.item) {
        auto item = resolve_menu_item(*entities.item);
        if (!item) {
            return ar ? "للأسف مش لاقي '" + *entities.item + "' في المنيو. ممكن تتأكد من الاسم؟"
                      : "Sorry, I couldn't find '" + *entities.item +
                        "' in our menu. Could you check the name?";
        }

        std::string currency = ar ? " جنيه" : " EGP";
        std::string question = ar ? "تحب " + item->name + " مقاس إيه؟"
                                  : "What size would you like for " + item->name + "?";
        auto sizes = store_.get_available_sizes(item->id);
        if (!sizes.ok()) {
            logger_->warning("Size lookup failed: " + sizes.error().to_string());
            return question;
        }
        for (const auto& size : sizes.value()) {
            question += "\n  • " + size_label(size.code, ar) + " (" + size.code + ") - " +
                        text::format_price(size.price) + currency;
        }
        return question;
    }

    if (contains_field(missing, fields::ORDER_ID)) {
        return ar ? "محتاج رقم الطلب علشان أتابعه. رقم طلبك كام؟"
                  : "I need your order number to track it. What's your order number?";
    }

    return (ar ? "محتاج معلومات أكتر: " : "I need more information: ") + text::join(missing, ", ");
}

// ============================================================================
// Pending actions
// ============================================================================

void ClarificationEngine::start_pending_action(SessionState& session, Intent intent,
                                               const Entities& entities,
                                               const std::vector<std::string>& missing) const {
    PendingAction action;
    action.action = intent;
    action.missing_fields = missing;
    action.partial = entities;
    action.created_at = clock_();
    action.attempts = 0;

    session.pending_action = action;
    session.state = missing.empty() ? DialogueState::IDLE : awaiting_state_for(missing.front());
    logger_->debug(std::string("Pending ") + intent_name(intent) + " awaiting " +
                   text::join(missing, ", "));
}

Entities ClarificationEngine::extract_from_reply(const std::string& message,
                                                 const std::vector<std::string>& missing,
                                                 const std::string& language) const {
    Entities found;
    std::string cleaned = text::strip_trailing_punctuation(text::to_lower(message));

    auto [size, without_size] = matcher_.extract_size(cleaned, language);
    auto [quantity, rest] = matcher_.extract_quantity(without_size, language);

    if (contains_field(missing, fields::SIZE) && size) {
        found.size = size;
    }

    if (contains_field(missing, fields::QUANTITY)) {
        if (quantity) {
            found.quantity = quantity;
        } else if (int n = text::parse_positive_int(text::trim(cleaned)); n > 0) {
            found.quantity = n;
        } else if (auto word = matcher_.word_to_number(text::trim(cleaned), language)) {
            found.quantity = word;
        }
    }

    if (contains_field(missing, fields::ORDER_ID)) {
        static const std::regex DIGITS(R"re(\d+)re");
        std::smatch m;
        if (std::regex_search(cleaned, m, DIGITS)) {
            found.order_id = m.str(0);
        }
    }

    if (contains_field(missing, fields::ITEM)) {
        std::string item = matcher_.clean_item_name(rest, language);
        if (!item.empty()) {
            found.item = item;
        }
    }

    if (contains_field(missing, fields::ADDRESS)) {
        found.set(fields::ADDRESS, text::trim(message));
    }
    if (contains_field(missing, fields::PHONE)) {
        found.set(fields::PHONE, text::trim(message));
    }

    return found;
}

void ClarificationEngine::discard_pending_action(SessionState& session) const {
    if (session.pending_action) {
        logger_->debug(std::string("Discarding pending ") + intent_name(session.pending_action->action));
    }
    session.pending_action.reset();
    session.state = DialogueState::IDLE;
}

PendingResolution ClarificationEngine::resolve_pending_action(SessionState& session,
                                                              const std::optional<Intent>& intent,
                                                              const Entities& entities,
                                                              const std::string& message,
                                                              const std::string& language) const {
    PendingResolution resolution;
    if (!session.pending_action) {
        return resolution;
    }

    PendingAction& pending = *session.pending_action;
    resolution.intent = pending.action;

    if (intent && *intent != pending.action) {
        logger_->debug(std::string("Dropping pending ") + intent_name(pending.action) +
                       " for new intent " + intent_name(*intent));
        session.pending_action.reset();
        session.state = DialogueState::IDLE;
        resolution.status = PendingResolution::Status::DISCARDED;
        return resolution;
    }

    Entities merged = pending.partial;
    merged.overlay(extract_from_reply(message, pending.missing_fields, language));
    merged.overlay(entities);

    auto check = needs_clarification(pending.action, merged);
    resolution.entities = merged;
    resolution.missing = check.missing;

    if (!check.needed) {
        session.pending_action.reset();
        session.state = DialogueState::IDLE;
        resolution.status = PendingResolution::Status::RESOLVED;
        return resolution;
    }

    pending.attempts += 1;
    if (pending.attempts >= max_attempts_) {
        logger_->info(std::string("Giving up on pending ") + intent_name(pending.action) +
                      " after " + std::to_string(pending.attempts) + " attempts");
        session.pending_action.reset();
        session.state = DialogueState::IDLE;
        resolution.status = PendingResolution::Status::ABANDONED;
        return resolution;
    }

    pending.partial = merged;
    pending.missing_fields = check.missing;
    session.state = awaiting_state_for(check.missing.front());
    resolution.status = PendingResolution::Status::STILL_MISSING;
    return resolution;
}

}  // namespace orderbot::dialogue
