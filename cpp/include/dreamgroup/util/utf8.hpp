#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dreamgroup::util {

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Writing systems the normalizer builds prompts for
enum class Script {
    LATIN,
    HEBREW,
    ARABIC,
    CYRILLIC
};

const char* script_name(Script script);

// True if the codepoint lies in the block of the given script. LATIN never matches.
bool in_script_block(uint32_t codepoint, Script script);

// First non-Latin block found in the text; LATIN when there is none
Script detect_script(std::string_view text);

// True if any codepoint of the text belongs to the script's block
bool contains_script(std::string_view text, Script script);

} // namespace dreamgroup::util
