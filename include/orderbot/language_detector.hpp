#pragma once

#include <string>

namespace orderbot {

/**
 * Detects the language of a customer message from its script.
 *
 * Any character in the Arabic block (U+0600..U+06FF) selects "ar";
 * everything else is "en".
 */
class LanguageDetector {
public:
    /**
     * Detect language of a UTF-8 message.
     *
     * @param text Raw message text
     * @return "ar" or "en"
     */
    static std::string detect(const std::string& text);

    static bool is_supported(const std::string& language);
};

}  // namespace orderbot
