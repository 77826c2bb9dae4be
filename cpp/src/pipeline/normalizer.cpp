#include "dreamgroup/pipeline/normalizer.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/text.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace dreamgroup::pipeline {

namespace {

constexpr double kNormalizeTemperature = 0.1;
constexpr int kNormalizeMaxTokens = 100;

// Canonical phrases start with "to " unless they open with one of these
constexpr std::array<std::string_view, 12> kDeterminers = {
    "a ", "an ", "the ", "my ", "your ", "our ", "his ", "her ", "their ", "this ", "that ", "some "};

constexpr std::array<std::string_view, 5> kReplyLabels = {
    "normalized:", "english:", "translation:", "simplified:", "answer:"};

constexpr std::array<std::string_view, 4> kArrows = {"\xE2\x86\x92", "->", "=", "\xE2\x80\x93"};

std::vector<std::string> lines_of(std::string_view text) {
    std::vector<std::string> lines;
    for (auto& line : util::split(text, '\n')) {
        std::string trimmed = util::trim(line);
        if (!trimmed.empty()) lines.push_back(std::move(trimmed));
    }
    return lines;
}

// First regex capture that is non-blank and free of the source script
std::optional<std::string> first_clean_capture(std::string_view text, const std::regex& pattern,
                                               util::Script source) {
    std::string haystack(text);
    for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        std::string span = util::trim((*it)[1].str());
        if (!span.empty() && !util::contains_script(span, source)) return span;
    }
    return std::nullopt;
}

void erase_all(std::string& text, std::string_view needle) {
    size_t pos;
    while ((pos = text.find(needle)) != std::string::npos) text.erase(pos, needle.size());
}

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

const ResponseParser<std::string>& parser_for(util::Script script) {
    static const std::array<ResponseParser<std::string>, 4> parsers = {
        make_normalization_parser(util::Script::LATIN),
        make_normalization_parser(util::Script::HEBREW),
        make_normalization_parser(util::Script::ARABIC),
        make_normalization_parser(util::Script::CYRILLIC),
    };
    return parsers[static_cast<size_t>(script)];
}

} // namespace

ResponseParser<std::string> make_normalization_parser(util::Script source) {
    static const std::regex emphasis(R"(\*+([^*\n]+)\*+)");
    static const std::regex quoted(R"x("([^"\n]+)")x");

    ResponseParser<std::string> parser;

    parser.add(
        "emphasized_span",
        [](std::string_view text) { return text.find('*') != std::string_view::npos; },
        [source](std::string_view text) { return first_clean_capture(text, emphasis, source); });

    parser.add(
        "quoted_span",
        [](std::string_view text) { return text.find('"') != std::string_view::npos; },
        [source](std::string_view text) { return first_clean_capture(text, quoted, source); });

    parser.add(
        "labelled_line",
        [](std::string_view text) { return text.find(':') != std::string_view::npos; },
        [source](std::string_view text) -> std::optional<std::string> {
            for (const auto& line : lines_of(text)) {
                std::string lower = util::to_lower(line);
                for (auto label : kReplyLabels) {
                    size_t pos = lower.rfind(label);
                    if (pos == std::string::npos) continue;
                    std::string rest = util::trim(std::string_view(line).substr(pos + label.size()));
                    if (!rest.empty() && !util::contains_script(rest, source)) return rest;
                }
            }
            return std::nullopt;
        });

    parser.add(
        "arrow_tail",
        [](std::string_view text) {
            return std::any_of(kArrows.begin(), kArrows.end(),
                               [&](std::string_view arrow) { return text.find(arrow) != std::string_view::npos; });
        },
        [source](std::string_view text) -> std::optional<std::string> {
            for (const auto& line : lines_of(text)) {
                size_t cut = std::string::npos;
                size_t width = 0;
                for (auto arrow : kArrows) {
                    size_t pos = line.rfind(arrow);
                    if (pos != std::string::npos && (cut == std::string::npos || pos > cut)) {
                        cut = pos;
                        width = arrow.size();
                    }
                }
                if (cut == std::string::npos) continue;
                std::string rest = util::trim(std::string_view(line).substr(cut + width));
                if (!rest.empty() && !util::contains_script(rest, source)) return rest;
            }
            return std::nullopt;
        });

    parser.add("first_line", [](std::string_view text) -> std::optional<std::string> {
        auto lines = lines_of(text);
        if (lines.empty()) return std::nullopt;
        return lines.front();
    });

    return parser;
}

Normalizer::Normalizer(oracle::TextOracle& oracle, oracle::OracleCache& cache)
    : oracle_(oracle)
    , cache_(cache) {}

std::string Normalizer::normalize(const std::string& raw) {
    std::string key = util::trim(raw);
    DREAMGROUP_CHECK_ARGUMENT(!key.empty(), "Cannot normalize a blank title");

    if (auto cached = cache_.get(oracle::OperationKind::NORMALIZE, key)) {
        return *cached;
    }
    std::string phrase = normalize_uncached(key);
    cache_.put(oracle::OperationKind::NORMALIZE, key, phrase);
    return phrase;
}

std::string Normalizer::normalize_uncached(const std::string& raw) {
    const util::Script script = util::detect_script(raw);

    oracle::OracleRequest request;
    request.kind = oracle::OperationKind::NORMALIZE;
    request.prompt = build_prompt(raw, script);
    request.temperature = kNormalizeTemperature;
    request.max_tokens = kNormalizeMaxTokens;

    std::string reply;
    try {
        ++oracle_calls_;
        reply = oracle_.complete(request);
    } catch (const std::exception& e) {
        LOG_WARN("Normalization oracle failed for '", raw, "': ", e.what());
        ++fallbacks_;
        return fallback(raw);
    }

    auto parsed = parser_for(script).parse(reply);
    if (!parsed) {
        LOG_WARN("Unusable normalization reply for '", raw, "': '", reply, "'");
        ++fallbacks_;
        return fallback(raw);
    }

    std::string phrase = canonicalize(parsed->value);
    if (phrase.size() < 3 || util::contains_script(phrase, script)) {
        LOG_WARN("Rejected normalization '", phrase, "' for '", raw, "' (", parsed->strategy, ")");
        ++fallbacks_;
        return fallback(raw);
    }

    LOG_DEBUG("Normalized '", raw, "' -> '", phrase, "' via ", parsed->strategy);
    return phrase;
}

std::string Normalizer::build_prompt(std::string_view raw, util::Script script) {
    std::string prompt;
    switch (script) {
        case util::Script::HEBREW:
            prompt =
                "Translate this Hebrew dream to a simple, generic English phrase.\n"
                "Remove specific details like: locations, numbers, names, years, specific brands.\n"
                "Keep only the core dream concept.\n"
                "Format: \"to [verb] [object]\"\n\n"
                "Examples:\n"
                "\"\xD7\x9C\xD7\x94\xD7\xAA\xD7\x97\xD7\xAA\xD7\x9F \xD7\x95\xD7\xA9\xD7\x99\xD7\x94\xD7\x99\xD7\x95 "
                "\xD7\x9C\xD7\x99 \xD7\x99\xD7\x9C\xD7\x93\xD7\x99\xD7\x9D\" \xE2\x86\x92 \"to get married\"\n"
                "\"\xD7\x9C\xD7\xA7\xD7\xA0\xD7\x95\xD7\xAA 3 \xD7\xA0\xD7\x9B\xD7\xA1\xD7\x99 "
                "\xD7\xA0\xD7\x93\xD7\x9C\xD7\x9F\" \xE2\x86\x92 \"to buy property\"\n\n"
                "Hebrew: ";
            prompt.append(raw);
            prompt += "\nReply with ONLY the simplified English phrase:";
            break;
        case util::Script::ARABIC:
        case util::Script::CYRILLIC:
            prompt = "Translate this ";
            prompt += util::script_name(script);
            prompt +=
                " dream to a simple, generic English phrase.\n"
                "Remove specific details like: locations, numbers, names, years, specific brands.\n"
                "Keep only the core dream concept.\n"
                "Format: \"to [verb] [object]\"\n\n"
                "Dream: ";
            prompt.append(raw);
            prompt += "\nReply with ONLY the simplified English phrase:";
            break;
        case util::Script::LATIN:
            prompt =
                "Simplify this dream to its core concept.\n"
                "Remove: locations, numbers, names, specific details, brands.\n"
                "Format: \"to [verb] [object]\"\n\n"
                "Examples:\n"
                "\"build an animal rescue farm in Belgium\" \xE2\x86\x92 \"to build an animal rescue farm\"\n"
                "\"buy 3 houses in Tel Aviv\" \xE2\x86\x92 \"to buy property\"\n"
                "\"become a YouTube star with 1M subscribers\" \xE2\x86\x92 \"to become a content creator\"\n\n"
                "Input: ";
            prompt.append(raw);
            prompt += "\nReply with ONLY the simplified phrase:";
            break;
    }
    return prompt;
}

std::string Normalizer::canonicalize(std::string_view candidate) {
    static const std::regex parenthetical(R"(\([^)]*\))");

    std::string text = std::regex_replace(std::string(candidate), parenthetical, " ");

    // Quote and emphasis markers, ASCII and typographic
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) { return c == '*' || c == '"' || c == '`' || c == '_'; }),
               text.end());
    for (std::string_view mark : {"\xE2\x80\x9C", "\xE2\x80\x9D", "\xE2\x80\x98", "\xE2\x80\x99"}) {
        erase_all(text, mark);
    }

    text = util::collapse_whitespace(util::to_lower(text));
    text = util::strip_chars(text, "'.!,;:");

    while (util::starts_with(text, "to to ")) text.erase(0, 3);
    replace_all(text, " to to ", " to ");

    if (text.empty() || text == "to") return "";

    bool has_determiner = std::any_of(kDeterminers.begin(), kDeterminers.end(),
                                      [&](std::string_view d) { return util::starts_with(text, d); });
    if (!util::starts_with(text, "to ") && !has_determiner) {
        text = "to " + text;
    }
    return text;
}

std::string Normalizer::fallback(std::string_view raw) {
    std::string clean = util::collapse_whitespace(util::to_lower(raw));
    if (!util::starts_with(clean, "to ")) {
        clean = "to " + clean;
    }
    return clean;
}

} // namespace dreamgroup::pipeline
