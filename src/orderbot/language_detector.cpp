#include <orderbot/language_detector.hpp>

namespace orderbot {

namespace {

// UTF-8 lead bytes for U+0600..U+06FF
bool is_arabic_lead_byte(unsigned char c) {
    return c >= 0xD8 && c <= 0xDB;
}

}  // namespace

std::string LanguageDetector::detect(const std::string& text) {
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        auto lead = static_cast<unsigned char>(text[i]);
        auto next = static_cast<unsigned char>(text[i + 1]);
        if (is_arabic_lead_byte(lead) && (next & 0xC0) == 0x80) {
            return "ar";
        }
    }
    return "en";
}

bool LanguageDetector::is_supported(const std::string& language) {
    return language == "en" || language == "ar";
}

}  // namespace orderbot
