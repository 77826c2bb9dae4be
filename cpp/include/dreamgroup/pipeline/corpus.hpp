#pragma once

#include "dreamgroup/types.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dreamgroup::pipeline {

struct CorpusLoadResult {
    std::vector<DreamRecord> records;
    size_t skipped_blank = 0;      // rows whose title is missing or blank
    size_t skipped_malformed = 0;  // rows without an id or with too few columns
    size_t duplicate_ids = 0;      // later rows reusing an id are dropped
};

// Reads the TSV export: header row naming post_id, post_title, username and optionally
// date_of_birth, columns in any order. reference_year 0 means the current year.
CorpusLoadResult load_corpus(const std::string& path, int reference_year = 0);
CorpusLoadResult parse_corpus(std::istream& in, int reference_year = 0);

// Age in whole years at reference_year, from "YYYY-MM-DD" or "YYYY"; nullopt when unparseable
// or outside 1..120
std::optional<int> age_from_birth_date(std::string_view birth_date, int reference_year);

int current_year();

} // namespace dreamgroup::pipeline
