#pragma once

#include <string>
#include <vector>

namespace orderbot::text {

// ASCII-only lowercase; multi-byte UTF-8 sequences pass through untouched
std::string to_lower(const std::string& s);

std::string trim(const std::string& s);

// Trim and drop trailing sentence punctuation ("add cola!" -> "add cola")
std::string strip_trailing_punctuation(const std::string& s);

std::vector<std::string> split_words(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool contains(const std::string& haystack, const std::string& needle);

// Case-insensitive substring test (ASCII folding)
bool icontains(const std::string& haystack, const std::string& needle);

bool iequals(const std::string& a, const std::string& b);

// Collapse runs of whitespace to single spaces and trim
std::string squeeze_spaces(const std::string& s);

/**
 * Parse a strictly positive decimal integer.
 *
 * @return The value, or -1 if s is not a positive integer
 */
int parse_positive_int(const std::string& s);

// Prices are whole EGP in the seed menu; print without trailing zeros
std::string format_price(double price);

}  // namespace orderbot::text
