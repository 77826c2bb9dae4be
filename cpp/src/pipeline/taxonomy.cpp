#include "dreamgroup/pipeline/taxonomy.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/text.hpp"

#include <cctype>
#include <regex>

namespace dreamgroup::pipeline {

namespace {

struct KeywordRule {
    std::vector<std::string_view> keywords;
    TaxonomyPath path;
};

const std::vector<KeywordRule>& keyword_rules() {
    static const std::vector<KeywordRule> rules = {
        {{"youtube", "tiktok", "instagram", "influencer", "content creator", "streamer", "blogger"},
         {"Career", "Digital Creator", "Social Media"}},
        {{"doctor", "lawyer", "engineer", "teacher", "nurse", "pilot"},
         {"Career", "Professional", "Traditional"}},
        {{"rich", "money", "millionaire", "wealth"},
         {"Financial", "Wealth", "Personal"}},
        {{"travel", "visit", "trip", "abroad"},
         {"Travel", "Adventure", "Exploration"}},
        {{"marry", "married", "wedding", "love", "family", "children"},
         {"Relationships", "Romance", "Marriage"}},
        {{"fit", "gym", "weight", "muscle"},
         {"Health", "Fitness", "Physical"}},
    };
    return rules;
}

const TaxonomyPath& default_path() {
    static const TaxonomyPath path{"Personal", "Goals", "General"};
    return path;
}

bool matches_word_start(std::string_view text, std::string_view keyword) {
    size_t pos = text.find(keyword);
    while (pos != std::string_view::npos) {
        if (pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]))) return true;
        pos = text.find(keyword, pos + 1);
    }
    return false;
}

std::optional<TaxonomyPath> accept(std::string a, std::string b, std::string c) {
    TaxonomyPath path{util::trim(a), util::trim(b), util::trim(c)};
    if (!util::is_letters_and_spaces(path.level1) || !util::is_letters_and_spaces(path.level2) ||
        !util::is_letters_and_spaces(path.level3)) {
        return std::nullopt;
    }
    path.level1 = util::collapse_whitespace(path.level1);
    path.level2 = util::collapse_whitespace(path.level2);
    path.level3 = util::collapse_whitespace(path.level3);
    return path;
}

} // namespace

ResponseParser<TaxonomyPath> make_taxonomy_parser() {
    static const std::regex strict(R"(^\s*([A-Za-z ]+)\|([A-Za-z ]+)\|([A-Za-z ]+)\s*$)");
    static const std::regex embedded(R"(([A-Za-z][A-Za-z ]*)\|([A-Za-z][A-Za-z ]*)\|([A-Za-z][A-Za-z ]*))");
    static const std::regex category(R"(^\s*\W*category\W*:\s*(.+)$)", std::regex::icase);
    static const std::regex subcategory(R"(^\s*\W*sub-?category\W*:\s*(.+)$)", std::regex::icase);
    static const std::regex specific(R"(^\s*\W*specific\W*:\s*(.+)$)", std::regex::icase);

    ResponseParser<TaxonomyPath> parser;

    parser.add(
        "strict_triplet",
        [](std::string_view text) { return text.find('|') != std::string_view::npos; },
        [](std::string_view text) -> std::optional<TaxonomyPath> {
            std::string s(text);
            std::smatch m;
            if (!std::regex_match(s, m, strict)) return std::nullopt;
            return accept(m[1].str(), m[2].str(), m[3].str());
        });

    parser.add(
        "embedded_triplet",
        [](std::string_view text) { return text.find('|') != std::string_view::npos; },
        [](std::string_view text) -> std::optional<TaxonomyPath> {
            std::string s(text);
            for (auto it = std::sregex_iterator(s.begin(), s.end(), embedded); it != std::sregex_iterator(); ++it) {
                if (auto path = accept((*it)[1].str(), (*it)[2].str(), (*it)[3].str())) return path;
            }
            return std::nullopt;
        });

    parser.add(
        "labelled_lines",
        [](std::string_view text) { return text.find(':') != std::string_view::npos; },
        [](std::string_view text) -> std::optional<TaxonomyPath> {
            std::string level1, level2, level3;
            for (const auto& raw_line : util::split(text, '\n')) {
                std::string line = util::strip_chars(raw_line, "*-");
                std::smatch m;
                if (level2.empty() && std::regex_match(line, m, subcategory)) {
                    level2 = util::strip_chars(m[1].str(), "*\"'.");
                } else if (level1.empty() && std::regex_match(line, m, category)) {
                    level1 = util::strip_chars(m[1].str(), "*\"'.");
                } else if (level3.empty() && std::regex_match(line, m, specific)) {
                    level3 = util::strip_chars(m[1].str(), "*\"'.");
                }
            }
            return accept(level1, level2, level3);
        });

    return parser;
}

TaxonomyClassifier::TaxonomyClassifier(oracle::TextOracle& oracle, oracle::OracleCache& cache)
    : oracle_(oracle)
    , cache_(cache) {}

TaxonomyPath TaxonomyClassifier::classify(const std::string& phrase) {
    const std::string key = util::trim(phrase);
    if (auto cached = cache_.get(oracle::OperationKind::TAXONOMY, key)) {
        if (auto path = decode(*cached)) return *path;
    }
    TaxonomyPath path = classify_uncached(key);
    cache_.put(oracle::OperationKind::TAXONOMY, key, encode(path));
    return path;
}

TaxonomyPath TaxonomyClassifier::classify_uncached(const std::string& phrase) {
    static const ResponseParser<TaxonomyPath> parser = make_taxonomy_parser();

    oracle::OracleRequest request;
    request.kind = oracle::OperationKind::TAXONOMY;
    request.prompt = build_prompt(phrase);
    request.temperature = 0.1;
    request.max_tokens = 100;

    std::string reply;
    try {
        ++oracle_calls_;
        reply = oracle_.complete(request);
    } catch (const std::exception& e) {
        LOG_WARN("Taxonomy oracle failed for '", phrase, "': ", e.what());
        ++fallbacks_;
        return fallback(phrase);
    }

    if (auto parsed = parser.parse(reply)) {
        LOG_DEBUG("Classified '", phrase, "' as ", encode(parsed->value), " via ", parsed->strategy);
        return parsed->value;
    }

    LOG_WARN("Unusable taxonomy reply for '", phrase, "': '", reply, "'");
    ++fallbacks_;
    return fallback(phrase);
}

std::string TaxonomyClassifier::build_prompt(std::string_view phrase) {
    std::string prompt = "Categorize '";
    prompt.append(phrase);
    prompt += "' into 3 levels. Reply ONLY with format: Category|Subcategory|Specific";
    return prompt;
}

TaxonomyPath TaxonomyClassifier::fallback(std::string_view phrase) {
    const std::string lower = util::to_lower(phrase);
    for (const auto& rule : keyword_rules()) {
        for (auto keyword : rule.keywords) {
            if (matches_word_start(lower, keyword)) return rule.path;
        }
    }
    return default_path();
}

std::string TaxonomyClassifier::encode(const TaxonomyPath& path) {
    return path.level1 + "|" + path.level2 + "|" + path.level3;
}

std::optional<TaxonomyPath> TaxonomyClassifier::decode(std::string_view text) {
    auto parts = util::split(text, '|');
    if (parts.size() != 3) return std::nullopt;
    TaxonomyPath path{parts[0], parts[1], parts[2]};
    if (!path.complete()) return std::nullopt;
    return path;
}

} // namespace dreamgroup::pipeline
