#include <orderbot/nlp/pattern_matcher.hpp>
#include <orderbot/language_detector.hpp>
#include <orderbot/util/text.hpp>

#include <iterator>
#include <unordered_map>

namespace orderbot::nlp {

namespace {

struct RuleSpec {
    Intent intent;
    std::string language;
    std::string pattern;
    std::vector<std::string> groups;
};

// Words after an add keyword that start a different request, not an item
const std::string NOT_AN_ITEM =
    R"re((?!(?:to\s+)?(?:checkout|check out|pay|see|view|show|remove|delete|)re"
    R"re(cancel|clear|empty|track|know|the menu|menu|my cart|my order)\b))re";

// Rule table, grouped by intent. Order matters: first hit wins.
const std::vector<RuleSpec>& default_rule_specs() {
    static const std::vector<RuleSpec> SPECS = {
        // welcome
        {Intent::WELCOME, "en",
         R"re(^(?:hi|hello|hey|good (?:morning|afternoon|evening))(?:\s+there)?$)re", {}},
        {Intent::WELCOME, "ar",
         R"re(^(?:اهلا|أهلا|مرحبا|هاي|السلام عليكم)$)re", {}},

        // track_order
        {Intent::TRACK_ORDER, "en",
         R"re(\b(?:track|status of)\s+(?:my\s+)?order(?:\s+(?:number\s+|no\s+|#)?(\d+))?)re",
         {fields::ORDER_ID}},
        {Intent::TRACK_ORDER, "en",
         R"re(\bwhere(?:'s|\s+is)\s+my\s+order(?:\s+(?:number\s+|no\s+|#)?(\d+))?)re",
         {fields::ORDER_ID}},
        {Intent::TRACK_ORDER, "ar",
         R"re((?:عايز اعرف|حالة)\s+طلبي(?:\s+رقم\s+(\d+))?)re",
         {fields::ORDER_ID}},

        // new_order
        {Intent::NEW_ORDER, "en",
         R"re(\b(?:new order|start (?:a\s+)?(?:new\s+)?order|start over)\b)re", {}},
        {Intent::NEW_ORDER, "ar",
         R"re((?:طلب جديد|ابدأ طلب))re", {}},

        // add_item
        {Intent::ADD_ITEM, "en",
         std::string(R"re(\b(?:add|order|i want to order|i'd like|i would like|i want|get me|give me|can i (?:get|have))\s+)re")
         + NOT_AN_ITEM +
         R"re((?:a\s+)?([\w\s,]+?)(?:\s+to\s+(?:my\s+|the\s+)?(?:cart|order))?(?:\s+(?:please|thanks|thank you))?$)re",
         {FULL_INPUT_GROUP}},
        {Intent::ADD_ITEM, "en",
         R"re(^((?:\d+\s*|(?:one|two|three|four|five|six|seven|eight|nine|ten)\s+)[a-z][\w\s,]*)$)re",
         {FULL_INPUT_GROUP}},
        {Intent::ADD_ITEM, "ar",
         R"re((?:ضيف|اطلب|طلب|عايز)\s+(.+?)(?:\s+(?:من فضلك|شكرا))?$)re",
         {FULL_INPUT_GROUP}},

        // view_cart
        {Intent::VIEW_CART, "en",
         R"re(\b(?:show|view|see|check)\s+(?:me\s+)?(?:my\s+|the\s+)?cart\b)re", {}},
        {Intent::VIEW_CART, "en",
         R"re(\bwhat(?:'s|\s+is)?\s+in\s+(?:my\s+|the\s+)?cart\b)re", {}},
        {Intent::VIEW_CART, "en",
         R"re(\b(?:what|how much|what's|whats)\s+(?:is\s+)?(?:the\s+|my\s+)?total\b)re", {}},
        {Intent::VIEW_CART, "en",
         R"re(\bhow much\s+(?:do\s+|did\s+)?i\s+(?:owe|have|spend)\b)re", {}},
        {Intent::VIEW_CART, "en",
         R"re(^(?:my\s+)?cart$)re", {}},
        {Intent::VIEW_CART, "ar",
         R"re((?:اعرض|شوف|شف)\s+(?:سلة\s+)?الطلب|كام في السلة)re", {}},
        {Intent::VIEW_CART, "ar",
         R"re((?:كام|إيه|ايه)\s+(?:المجموع|السعر))re", {}},

        // clear_cart
        {Intent::CLEAR_CART, "en",
         R"re(\b(?:clear|empty|reset|cancel)\s+(?:my\s+|the\s+)?cart\b)re", {}},
        {Intent::CLEAR_CART, "ar",
         R"re((?:امسح|فضي|الغي)\s+(?:السلة|الطلب))re", {}},

        // remove_item
        {Intent::REMOVE_ITEM, "en",
         R"re(\b(?:remove|delete|drop|take out)\s+(?:the\s+|my\s+)?([\w\s,]+?)(?:\s+from\s+(?:my\s+|the\s+)?(?:cart|order))?$)re",
         {fields::ITEM}},
        {Intent::REMOVE_ITEM, "ar",
         R"re((?:شيل|احذف)\s+(.+))re",
         {fields::ITEM}},

        // checkout
        {Intent::CHECKOUT, "en",
         R"re(\b(?:checkout|check out|pay|place (?:my\s+|the\s+)?order|complete (?:my\s+|the\s+)?order|confirm (?:my\s+|the\s+)?order|that's all|done ordering)\b)re",
         {}},
        {Intent::CHECKOUT, "ar",
         R"re((?:ادفع|اكمل|اتمم الطلب))re", {}},

        // browse_menu
        {Intent::BROWSE_MENU, "en",
         R"re(\b(?:how much is|how much are|price of|tell me about)\s+(?:the\s+|a\s+)?([\w\s]+)$)re",
         {fields::ITEM}},
        {Intent::BROWSE_MENU, "en",
         R"re(\b(?:what do you have|what can i order|show (?:me\s+)?(?:the\s+)?menu|menu|pizzas?|items|drinks)\b)re",
         {}},
        {Intent::BROWSE_MENU, "ar",
         R"re((?:في إيه|قائمة|المنيو|عندك إيه|بيتزا))re", {}},

        // confirmation
        {Intent::CONFIRMATION, "en",
         R"re(^(?:yes|yeah|yep|yup|sure|ok|okay|correct|right|fine|alright|sounds good|that's right|yes please)$)re",
         {}},
        {Intent::CONFIRMATION, "ar",
         R"re(^(?:نعم|ايوة|أيوة|ماشي|تمام|صح)$)re", {}},

        // rejection
        {Intent::REJECTION, "en",
         R"re(^(?:no|nope|nah|not really|incorrect|wrong|cancel that|no thanks|no thank you)$)re",
         {}},
        {Intent::REJECTION, "ar",
         R"re(^(?:لا|مش صح|غلط)$)re", {}},
    };
    return SPECS;
}

using SizeTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

// Size codes are checked in this order
const SizeTable EN_SIZES = {
    {"S", {"small", "s"}},
    {"M", {"medium", "m"}},
    {"L", {"large", "l", "big"}},
    {"REG", {"regular", "reg"}},
};

const SizeTable AR_SIZES = {
    {"S", {"صغير", "ص"}},
    {"M", {"متوسط", "م"}},
    {"L", {"كبير", "ك"}},
    {"REG", {"عادي", "عاد"}},
};

const std::unordered_map<std::string, int> EN_NUMBERS = {
    {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
    {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10}
};

const std::unordered_map<std::string, int> AR_NUMBERS = {
    {"واحد", 1}, {"اتنين", 2}, {"تلاتة", 3}, {"اربعة", 4}, {"خمسة", 5},
    {"ستة", 6}, {"سبعة", 7}, {"تمانية", 8}, {"تسعة", 9}, {"عشرة", 10}
};

const std::vector<std::string> EN_FILLERS = {"a", "an", "the", "some"};

const SizeTable& sizes_for(const std::string& language) {
    return language == "ar" ? AR_SIZES : EN_SIZES;
}

const std::regex& separator_pattern(const std::string& language) {
    static const std::regex EN_SEP(R"re(\band\b|,)re");
    static const std::regex AR_SEP(R"re(\s+و\s+|،|,|\band\b)re");
    return language == "ar" ? AR_SEP : EN_SEP;
}

// Drop commas and a dangling "and" from both ends: "margherita pizza," -> "margherita pizza"
std::string trim_separators(const std::string& text) {
    static const std::regex EDGES(R"re(^(?:\s|,|،|\band\b)+|(?:\s|,|،|\band\b)+$)re");
    return std::regex_replace(text, EDGES, "");
}

// Split on separators, keeping inner empty segments so callers can reject them
std::vector<std::string> split_segments(const std::string& text, const std::string& language) {
    std::vector<std::string> parts;
    const std::regex& sep = separator_pattern(language);

    size_t last = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), sep);
         it != std::sregex_iterator(); ++it) {
        size_t pos = static_cast<size_t>(it->position());
        parts.push_back(text.substr(last, pos - last));
        last = pos + static_cast<size_t>(it->length());
    }
    parts.push_back(text.substr(last));

    // "fries, cola," ends with a separator, not a missing item
    while (parts.size() > 1 && text::trim(parts.back()).empty()) {
        parts.pop_back();
    }
    return parts;
}

}  // namespace

PatternMatcher::PatternMatcher() {
    load_default_rules();
}

void PatternMatcher::load_default_rules() {
    for (const auto& spec : default_rule_specs()) {
        add_rule(spec.intent, spec.language, spec.pattern, spec.groups);
    }
}

void PatternMatcher::add_rule(Intent intent, const std::string& language,
                              const std::string& pattern,
                              std::vector<std::string> group_names) {
    PatternRule rule;
    rule.intent = intent;
    rule.language = language;
    rule.source = pattern;
    rule.pattern = std::regex(pattern, std::regex::ECMAScript);
    rule.group_names = std::move(group_names);
    rules_.push_back(std::move(rule));
}

std::optional<ExtractionResult> PatternMatcher::match(const std::string& text) const {
    std::string cleaned = text::strip_trailing_punctuation(text);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    std::string lowered = text::to_lower(cleaned);
    std::string language = LanguageDetector::detect(lowered);

    for (const auto& rule : rules_) {
        if (rule.language != language) {
            continue;
        }

        std::smatch m;
        if (!std::regex_search(lowered, m, rule.pattern)) {
            continue;
        }

        ExtractionResult result;
        result.intent = rule.intent;
        result.language = language;
        result.source = ExtractionSource::PATTERN;
        result.confidence = 1.0;

        std::string full_input;
        for (size_t i = 0; i < rule.group_names.size(); ++i) {
            const std::string& name = rule.group_names[i];
            size_t group = i + 1;
            if (name.empty() || group >= m.size() || !m[group].matched) {
                continue;
            }

            std::string value = text::trim(m[group].str());
            if (value.empty()) {
                continue;
            }

            if (name == FULL_INPUT_GROUP) {
                full_input = value;
            } else if (name == fields::ITEM) {
                result.entities.set(name, clean_item_name(value, language));
            } else {
                result.entities.set(name, value);
            }
        }

        if (rule.intent == Intent::ADD_ITEM && !full_input.empty()) {
            fill_add_item(full_input, language, result);
        }

        // "remove 2 large cola" -> quantity 2, size L, item "cola"
        if (rule.intent == Intent::REMOVE_ITEM && result.entities.item) {
            auto [quantity, rest] = extract_quantity(*result.entities.item, language);
            auto [size, remaining] = extract_size(rest, language);
            std::string item = clean_item_name(remaining, language);
            if (!item.empty()) {
                result.entities.item = item;
                result.entities.quantity = quantity;
                result.entities.size = size;
            }
        }

        return result;
    }

    return std::nullopt;
}

void PatternMatcher::fill_add_item(const std::string& full_input,
                                   const std::string& language,
                                   ExtractionResult& result) const {
    std::string input = trim_separators(text::squeeze_spaces(full_input));

    if (is_multi_item(input, language)) {
        auto items = parse_multi_items(input, language);
        if (items.size() >= 2) {
            result.batch_items = std::move(items);
            return;
        }
    }

    auto [quantity, rest] = extract_quantity(input, language);
    if (quantity) {
        result.entities.quantity = quantity;
    }

    auto [size, remaining] = extract_size(rest, language);
    if (size) {
        result.entities.size = size;
    }

    std::string item = clean_item_name(remaining, language);
    if (!item.empty()) {
        result.entities.item = item;
    }
}

// ============================================================================
// Normalisation helpers
// ============================================================================

bool PatternMatcher::is_multi_item(const std::string& text, const std::string& language) const {
    std::string lowered = text::to_lower(text);

    static const std::regex NUMBERED_ITEM(R"re(\d+\s*[a-z])re");
    auto count = std::distance(
        std::sregex_iterator(lowered.begin(), lowered.end(), NUMBERED_ITEM),
        std::sregex_iterator());
    if (count >= 2) {
        return true;
    }

    auto parts = split_segments(lowered, language);
    if (parts.size() < 2) {
        return false;
    }
    for (const auto& part : parts) {
        if (text::trim(part).empty()) {
            return false;
        }
    }
    return true;
}

std::vector<BatchItem> PatternMatcher::parse_multi_items(const std::string& text,
                                                         const std::string& language) const {
    std::vector<BatchItem> items;
    std::string lowered = text::trim(text::to_lower(text));

    // Strategy 1: repeated "number + item" ("1fries 2cola", "1 large pizza, 2 cola")
    static const std::regex NUMBER_THEN_ITEM(
        R"re((\d+)\s*([a-z]+(?:\s+[a-z]+)*?)(?=\s*\d|$|\s+and\s+|,))re");

    std::vector<std::smatch> scans(
        std::sregex_iterator(lowered.begin(), lowered.end(), NUMBER_THEN_ITEM),
        std::sregex_iterator());

    if (scans.size() >= 2) {
        for (const auto& m : scans) {
            int quantity = text::parse_positive_int(m[1].str());
            quantity = quantity > 0 ? quantity : 0;
            auto [size, rest] = extract_size(m[2].str(), language);
            std::string name = clean_item_name(rest, language);
            if (!name.empty()) {
                items.push_back({name, size, quantity});
            }
        }
        return items;
    }

    // Strategy 2: separator split ("fries and cola", "one fries, 2 cola")
    auto parts = split_segments(lowered, language);
    if (parts.size() >= 2) {
        for (const auto& part : parts) {
            if (auto item = parse_segment(part, language)) {
                items.push_back(std::move(*item));
            }
        }
    }

    return items;
}

std::optional<BatchItem> PatternMatcher::parse_segment(const std::string& segment,
                                                       const std::string& language) const {
    std::string part = text::trim(segment);
    if (part.empty()) {
        return std::nullopt;
    }

    auto [quantity, rest] = extract_quantity(part, language);
    auto [size, remaining] = extract_size(rest, language);
    std::string name = clean_item_name(remaining, language);
    if (name.empty()) {
        return std::nullopt;
    }

    BatchItem item;
    item.item = name;
    item.size = size;
    item.quantity = quantity.value_or(1);
    return item;
}

std::pair<std::optional<std::string>, std::string>
PatternMatcher::extract_size(const std::string& text, const std::string& language) const {
    auto words = text::split_words(text::to_lower(text));

    for (const auto& [code, spellings] : sizes_for(language)) {
        std::vector<std::string> kept;
        bool found = false;
        for (const auto& word : words) {
            bool is_size = false;
            for (const auto& spelling : spellings) {
                if (word == spelling) {
                    is_size = true;
                    break;
                }
            }
            if (is_size) {
                found = true;
            } else {
                kept.push_back(word);
            }
        }
        if (found) {
            return {code, text::join(kept, " ")};
        }
    }

    return {std::nullopt, text::join(words, " ")};
}

std::pair<std::optional<int>, std::string>
PatternMatcher::extract_quantity(const std::string& text, const std::string& language) const {
    std::string trimmed = text::trim(text);
    auto words = text::split_words(trimmed);
    if (words.empty()) {
        return {std::nullopt, ""};
    }

    if (auto n = word_to_number(words.front(), language)) {
        words.erase(words.begin());
        if (!words.empty() && words.front() == "x") {
            words.erase(words.begin());
        }
        return {n, text::join(words, " ")};
    }

    // "2 cola", "2cola", "2 x cola", "2x cola"
    static const std::regex LEADING_DIGITS(R"re(^(\d+)\s*(?:x\s+)?(\D.*)$)re");
    std::smatch m;
    if (std::regex_match(trimmed, m, LEADING_DIGITS)) {
        // Zero or out-of-range counts are reported as 0 for the handler to reject
        int quantity = text::parse_positive_int(m[1].str());
        return {quantity > 0 ? quantity : 0, text::trim(m[2].str())};
    }

    return {std::nullopt, trimmed};
}

std::string PatternMatcher::clean_item_name(const std::string& text,
                                            const std::string& language) const {
    auto words = text::split_words(trim_separators(text::to_lower(text)));
    if (language != "ar") {
        while (!words.empty()) {
            const std::string& first = words.front();
            bool filler = false;
            for (const auto& f : EN_FILLERS) {
                if (first == f) {
                    filler = true;
                    break;
                }
            }
            if (!filler) break;
            words.erase(words.begin());
        }
    }
    return text::join(words, " ");
}

std::optional<int> PatternMatcher::word_to_number(const std::string& word,
                                                  const std::string& language) const {
    const auto& table = language == "ar" ? AR_NUMBERS : EN_NUMBERS;
    auto it = table.find(text::to_lower(word));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace orderbot::nlp
