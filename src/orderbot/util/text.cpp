#include <orderbot/util/text.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace orderbot::text {

namespace {

char ascii_lower(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), ascii_lower);
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string strip_trailing_punctuation(const std::string& s) {
    std::string out = trim(s);
    while (!out.empty()) {
        char c = out.back();
        if (c == '.' || c == '!' || c == '?' || is_space(c)) {
            out.pop_back();
            continue;
        }
        // Arabic question mark U+061F is 0xD8 0x9F in UTF-8
        if (out.size() >= 2 &&
            static_cast<unsigned char>(out[out.size() - 2]) == 0xD8 &&
            static_cast<unsigned char>(c) == 0x9F) {
            out.resize(out.size() - 2);
            continue;
        }
        break;
    }
    return out;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool iequals(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

std::string squeeze_spaces(const std::string& s) {
    return join(split_words(s), " ");
}

int parse_positive_int(const std::string& s) {
    if (s.empty() || s.size() > 6) return -1;
    int value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return -1;
        value = value * 10 + (c - '0');
    }
    return value > 0 ? value : -1;
}

std::string format_price(double price) {
    char buf[32];
    if (std::fabs(price - std::round(price)) < 1e-9) {
        std::snprintf(buf, sizeof(buf), "%.0f", price);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f", price);
    }
    return buf;
}

}  // namespace orderbot::text
