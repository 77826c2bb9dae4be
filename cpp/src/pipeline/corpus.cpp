#include "dreamgroup/pipeline/corpus.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/text.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace dreamgroup::pipeline {

namespace {

// Strip surrounding double quotes and undouble embedded ones
std::string unquote(std::string_view field) {
    std::string value = util::trim(field);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        std::string out;
        out.reserve(value.size() - 2);
        for (size_t i = 1; i + 1 < value.size(); ++i) {
            out.push_back(value[i]);
            if (value[i] == '"' && i + 2 < value.size() && value[i + 1] == '"') ++i;
        }
        return out;
    }
    return value;
}

} // namespace

int current_year() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    return tm.tm_year + 1900;
}

std::optional<int> age_from_birth_date(std::string_view birth_date, int reference_year) {
    std::string value = util::trim(birth_date);
    if (value.size() < 4) return std::nullopt;
    for (size_t i = 0; i < 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return std::nullopt;
    }
    if (value.size() > 4 && value[4] != '-' && value[4] != '/') return std::nullopt;

    int year = std::stoi(value.substr(0, 4));
    int ref = reference_year > 0 ? reference_year : current_year();
    int age = ref - year;
    if (age < 1 || age > 120) return std::nullopt;
    return age;
}

CorpusLoadResult parse_corpus(std::istream& in, int reference_year) {
    CorpusLoadResult result;

    std::string line;
    if (!std::getline(in, line)) {
        throw CorpusError("Corpus is empty (no header row)", __func__);
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    // UTF-8 BOM from spreadsheet exports
    if (util::starts_with(line, "\xEF\xBB\xBF")) line.erase(0, 3);

    std::unordered_map<std::string, size_t> columns;
    auto header = util::split(line, '\t');
    for (size_t i = 0; i < header.size(); ++i) {
        columns.emplace(util::to_lower(unquote(header[i])), i);
    }
    for (const char* required : {"post_id", "post_title", "username"}) {
        if (!columns.count(required)) {
            throw CorpusError(std::string("Corpus header lacks column '") + required + "'", __func__);
        }
    }
    const size_t id_col = columns["post_id"];
    const size_t title_col = columns["post_title"];
    const size_t author_col = columns["username"];
    const auto dob_it = columns.find("date_of_birth");
    const size_t min_columns = std::max({id_col, title_col, author_col}) + 1;

    std::unordered_set<std::string> seen;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (util::trim(line).empty()) continue;

        auto fields = util::split(line, '\t');
        if (fields.size() < min_columns) {
            ++result.skipped_malformed;
            LOG_DEBUG("Line ", line_no, ": expected ", min_columns, " columns, got ", fields.size());
            continue;
        }

        DreamRecord record;
        record.id = unquote(fields[id_col]);
        record.raw_title = unquote(fields[title_col]);
        record.author = unquote(fields[author_col]);

        if (record.id.empty()) {
            ++result.skipped_malformed;
            continue;
        }
        if (record.raw_title.empty()) {
            ++result.skipped_blank;
            continue;
        }
        if (!seen.insert(record.id).second) {
            ++result.duplicate_ids;
            LOG_DEBUG("Line ", line_no, ": duplicate post_id ", record.id);
            continue;
        }

        if (dob_it != columns.end() && dob_it->second < fields.size()) {
            std::string dob = unquote(fields[dob_it->second]);
            if (!dob.empty() && dob != "NULL" && dob != "null") {
                record.birth_date = dob;
                record.age = age_from_birth_date(dob, reference_year);
            }
        }

        result.records.push_back(std::move(record));
    }

    if (result.skipped_blank || result.skipped_malformed || result.duplicate_ids) {
        LOG_WARN("Corpus: skipped ", result.skipped_blank, " blank titles, ", result.skipped_malformed,
                 " malformed rows, ", result.duplicate_ids, " duplicate ids");
    }
    return result;
}

CorpusLoadResult load_corpus(const std::string& path, int reference_year) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CorpusError("Cannot open corpus file " + path, __func__);
    }
    CorpusLoadResult result = parse_corpus(in, reference_year);
    if (in.bad()) {
        throw CorpusError("I/O error reading " + path, __func__);
    }
    LOG_INFO("Loaded ", result.records.size(), " records from ", path);
    return result;
}

} // namespace dreamgroup::pipeline
