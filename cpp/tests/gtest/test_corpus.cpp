// =============================================================================
// Corpus Loader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/error.hpp"
#include "dreamgroup/pipeline/corpus.hpp"
#include "test_support.hpp"

#include <fstream>
#include <sstream>

using namespace dreamgroup;
using namespace dreamgroup::pipeline;

namespace {
CorpusLoadResult parse(const std::string& text, int year = 2025) {
    std::istringstream in(text);
    return parse_corpus(in, year);
}
}

TEST(CorpusTest, ParsesRowsWithAges) {
    auto result = parse(
        "post_id\tpost_title\tusername\tdate_of_birth\n"
        "1\tbecome a doctor\tdana\t2008-05-01\n"
        "2\ttravel the world\tomer\tNULL\n"
        "3\tget rich\tnoa\t1990\n");

    ASSERT_EQ(result.records.size(), 3u);
    EXPECT_EQ(result.records[0].id, "1");
    EXPECT_EQ(result.records[0].raw_title, "become a doctor");
    EXPECT_EQ(result.records[0].author, "dana");
    EXPECT_EQ(result.records[0].age, 17);
    EXPECT_FALSE(result.records[1].birth_date.has_value());
    EXPECT_FALSE(result.records[1].age.has_value());
    EXPECT_EQ(result.records[2].age, 35);
    EXPECT_FALSE(result.records[0].normalized());
}

TEST(CorpusTest, ColumnsInAnyOrderWithBomAndCrlf) {
    auto result = parse(
        "\xEF\xBB\xBFusername\tpost_title\tpost_id\r\n"
        "dana\t\"to \"\"fly\"\"\"\t7\r\n");

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].id, "7");
    EXPECT_EQ(result.records[0].raw_title, "to \"fly\"");
    EXPECT_FALSE(result.records[0].birth_date.has_value());
}

TEST(CorpusTest, SkipsBlankMalformedAndDuplicateRows) {
    auto result = parse(
        "post_id\tpost_title\tusername\n"
        "1\tfly\tdana\n"
        "2\t   \tomer\n"
        "\tswim\tnoa\n"
        "3\n"
        "1\tfly again\tdana\n"
        "\n"
        "4\tsing\tyael\n");

    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[1].id, "4");
    EXPECT_EQ(result.skipped_blank, 1u);
    EXPECT_EQ(result.skipped_malformed, 2u);
    EXPECT_EQ(result.duplicate_ids, 1u);
}

TEST(CorpusTest, MissingRequiredColumnThrows) {
    EXPECT_THROW(parse("post_id\ttitle\tusername\n1\tfly\tdana\n"), CorpusError);
    EXPECT_THROW(parse(""), CorpusError);
}

TEST(CorpusTest, UnreadableFileThrows) {
    test::TempDir dir;
    try {
        load_corpus(dir.file("missing.tsv"));
        FAIL() << "Expected CorpusError";
    } catch (const DreamGroupException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CORPUS_UNREADABLE);
    }
}

TEST(CorpusTest, LoadsFromFile) {
    test::TempDir dir;
    const std::string path = dir.file("corpus.tsv");
    std::ofstream(path) << "post_id\tpost_title\tusername\n9\tto paint\tdana\n";
    auto result = load_corpus(path, 2025);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].raw_title, "to paint");
}

TEST(AgeTest, BirthDateForms) {
    EXPECT_EQ(age_from_birth_date("2000-01-31", 2025), 25);
    EXPECT_EQ(age_from_birth_date("2000/01/31", 2025), 25);
    EXPECT_EQ(age_from_birth_date("2000", 2025), 25);
    EXPECT_FALSE(age_from_birth_date("unknown", 2025).has_value());
    EXPECT_FALSE(age_from_birth_date("20001", 2025).has_value());
    EXPECT_FALSE(age_from_birth_date("2030-01-01", 2025).has_value());
    EXPECT_FALSE(age_from_birth_date("1850", 2025).has_value());
}
