#include "dreamgroup/util/utf8.hpp"

namespace dreamgroup::util {

namespace {

constexpr uint32_t kReplacement = 0xFFFD;
constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
constexpr uint8_t kLeadMark[] = {0, 0, 0xC0, 0xE0, 0xF0};

// Bytes announced by a lead byte; 0 for a stray continuation or an invalid byte
size_t sequence_length(uint8_t lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

// Titles come from user input, so bad bytes become U+FFFD and decoding resumes at the next byte
std::vector<uint32_t> decode_utf8(std::string_view data) {
    if (data.substr(0, 3) == "\xEF\xBB\xBF") data.remove_prefix(3);

    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    size_t i = 0;
    while (i < data.size()) {
        const auto lead = static_cast<uint8_t>(data[i]);
        const size_t len = sequence_length(lead);
        if (len == 1) {
            codepoints.push_back(lead);
            ++i;
            continue;
        }
        if (len == 0 || i + len > data.size()) {
            codepoints.push_back(kReplacement);
            ++i;
            continue;
        }

        uint32_t cp = lead & (0x7F >> len);
        bool complete = true;
        for (size_t k = 1; k < len; ++k) {
            const auto next = static_cast<uint8_t>(data[i + k]);
            if ((next & 0xC0) != 0x80) {
                complete = false;
                break;
            }
            cp = (cp << 6) | (next & 0x3F);
        }
        if (!complete) {
            codepoints.push_back(kReplacement);
            ++i;
            continue;
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = kReplacement;
        }
        codepoints.push_back(cp);
        i += len;
    }
    return codepoints;
}

std::string encode_utf8(uint32_t cp) {
    if (cp < 0x80) return std::string(1, static_cast<char>(cp));

    const size_t len = cp < 0x800 ? 2 : (cp < 0x10000 ? 3 : 4);
    std::string bytes(len, '\0');
    for (size_t k = len - 1; k > 0; --k) {
        bytes[k] = static_cast<char>(0x80 | (cp & 0x3F));
        cp >>= 6;
    }
    bytes[0] = static_cast<char>(kLeadMark[len] | cp);
    return bytes;
}

const char* script_name(Script script) {
    switch (script) {
        case Script::LATIN: return "English";
        case Script::HEBREW: return "Hebrew";
        case Script::ARABIC: return "Arabic";
        case Script::CYRILLIC: return "Russian";
    }
    return "English";
}

bool in_script_block(uint32_t cp, Script script) {
    switch (script) {
        case Script::HEBREW: return cp >= 0x0590 && cp <= 0x05FF;
        case Script::ARABIC: return cp >= 0x0600 && cp <= 0x06FF;
        case Script::CYRILLIC: return cp >= 0x0400 && cp <= 0x04FF;
        case Script::LATIN: return false;
    }
    return false;
}

Script detect_script(std::string_view text) {
    for (uint32_t cp : decode_utf8(text)) {
        if (cp < 0x0400) continue;
        for (Script s : {Script::HEBREW, Script::ARABIC, Script::CYRILLIC}) {
            if (in_script_block(cp, s)) return s;
        }
    }
    return Script::LATIN;
}

bool contains_script(std::string_view text, Script script) {
    if (script == Script::LATIN) return false;
    for (uint32_t cp : decode_utf8(text)) {
        if (in_script_block(cp, script)) return true;
    }
    return false;
}

} // namespace dreamgroup::util
