#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dreamgroup::util {

// ASCII lower-casing; multi-byte UTF-8 sequences pass through untouched
std::string to_lower(std::string_view text);

std::string trim(std::string_view text);

// Trim plus the given characters from both ends, repeatedly
std::string strip_chars(std::string_view text, std::string_view chars);

// Collapse runs of whitespace into one space and trim
std::string collapse_whitespace(std::string_view text);

// Split on ASCII whitespace, dropping empties
std::vector<std::string> split_words(std::string_view text);

// Split on a single character, keeping empty fields
std::vector<std::string> split(std::string_view text, char sep);

bool starts_with(std::string_view text, std::string_view prefix);

// True if the text is non-empty and consists of ASCII letters and spaces only
bool is_letters_and_spaces(std::string_view text);

} // namespace dreamgroup::util
