#pragma once

#include <orderbot/types.hpp>

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace orderbot::nlp {

/**
 * One row of the rule table. std::regex has no named groups, so the
 * slot each capture group fills is listed in group_names (index 0 is
 * capture group 1). An empty name leaves that group unused.
 */
struct PatternRule {
    Intent intent;
    std::string language;
    std::string source;
    std::regex pattern;
    std::vector<std::string> group_names;
};

// Slot name for the raw remainder of an add_item request
constexpr const char* FULL_INPUT_GROUP = "full_input";

/**
 * Deterministic rule-based intent and entity extractor.
 *
 * Rules are grouped by intent and tried in table order against messages
 * of the same language only. The first matching rule wins; there is no
 * scoring between candidates. Every match reports confidence 1.0.
 *
 * For add_item the remainder of the request is further normalised:
 * a leading numeral or number word becomes the quantity, a size word
 * becomes a size code, leading articles are dropped, and requests naming
 * two or more items are split into batch items.
 */
class PatternMatcher {
public:
    PatternMatcher();

    /**
     * Match a message against the rule table.
     *
     * @param text Raw customer message
     * @return Extraction with source=pattern, or nullopt if no rule hit
     */
    std::optional<ExtractionResult> match(const std::string& text) const;

    /**
     * Append a rule to the end of the table.
     *
     * @throws std::regex_error if the pattern does not compile
     */
    void add_rule(Intent intent, const std::string& language,
                  const std::string& pattern,
                  std::vector<std::string> group_names = {});

    const std::vector<PatternRule>& rules() const { return rules_; }

    // ------------------------------------------------------------------
    // Normalisation helpers (public for direct testing)
    // ------------------------------------------------------------------

    /**
     * True when text names two or more items: either two digit-prefixed
     * tokens ("1 fries 2 cola") or a separator ("and", comma) splitting it
     * into two or more non-empty segments.
     */
    bool is_multi_item(const std::string& text, const std::string& language = "en") const;

    /**
     * Split a multi-item request. Tries a repeated "number + item" scan
     * first, then a separator split where each segment takes an optional
     * leading quantity (default 1) and an embedded size.
     *
     * @return Parsed items; fewer than two means "treat as single item"
     */
    std::vector<BatchItem> parse_multi_items(const std::string& text,
                                             const std::string& language = "en") const;

    /**
     * Find and remove a size word.
     *
     * @return (size code or nullopt, remaining text)
     */
    std::pair<std::optional<std::string>, std::string>
    extract_size(const std::string& text, const std::string& language = "en") const;

    /**
     * Strip a leading quantity given as digits ("2 cola", "2x cola") or as a
     * number word ("two cola"). A zero or over-long numeral yields 0.
     *
     * @return (quantity or nullopt, remaining text)
     */
    std::pair<std::optional<int>, std::string>
    extract_quantity(const std::string& text, const std::string& language = "en") const;

    // Drop edge separators and leading articles: "a sea ranch pizza," -> "sea ranch pizza"
    std::string clean_item_name(const std::string& text, const std::string& language = "en") const;

    // Number word to digit, e.g. "three" -> 3
    std::optional<int> word_to_number(const std::string& word, const std::string& language) const;

private:
    std::vector<PatternRule> rules_;

    void load_default_rules();
    void fill_add_item(const std::string& full_input, const std::string& language,
                       ExtractionResult& result) const;
    std::optional<BatchItem> parse_segment(const std::string& segment,
                                           const std::string& language) const;
};

}  // namespace orderbot::nlp
