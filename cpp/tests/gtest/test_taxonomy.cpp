// =============================================================================
// Taxonomy Classifier Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dreamgroup/error.hpp"
#include "dreamgroup/pipeline/taxonomy.hpp"
#include "test_support.hpp"

using namespace dreamgroup;
using namespace dreamgroup::pipeline;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

namespace {
TaxonomyPath path(const char* a, const char* b, const char* c) {
    return TaxonomyPath{a, b, c};
}
}

class TaxonomyTest : public ::testing::Test {
protected:
    test::MockTextOracle oracle_;
    oracle::OracleCache cache_;
    TaxonomyClassifier classifier_{oracle_, cache_};
};

TEST_F(TaxonomyTest, StrictTripletReply) {
    EXPECT_CALL(oracle_, complete(Field(&oracle::OracleRequest::kind, oracle::OperationKind::TAXONOMY)))
        .WillOnce(Return("Career|Healthcare|Medicine"));
    EXPECT_EQ(classifier_.classify("to become a doctor"), path("Career", "Healthcare", "Medicine"));
    EXPECT_EQ(classifier_.fallbacks(), 0u);
}

TEST_F(TaxonomyTest, FailureUsesKeywordTable) {
    EXPECT_CALL(oracle_, complete(_)).WillOnce(Throw(OracleError("down")));
    EXPECT_EQ(classifier_.classify("become a youtuber"), path("Career", "Digital Creator", "Social Media"));
    EXPECT_EQ(classifier_.fallbacks(), 1u);
}

TEST_F(TaxonomyTest, GarbageReplyUsesKeywordTable) {
    EXPECT_CALL(oracle_, complete(_)).WillOnce(Return("I cannot categorize that."));
    EXPECT_EQ(classifier_.classify("to get married"), path("Relationships", "Romance", "Marriage"));
}

TEST_F(TaxonomyTest, ResultsAreCached) {
    EXPECT_CALL(oracle_, complete(_)).Times(1).WillOnce(Return("Travel|Adventure|Backpacking"));
    auto first = classifier_.classify("to backpack across asia");
    auto second = classifier_.classify("to backpack across asia ");
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache_.get(oracle::OperationKind::TAXONOMY, "to backpack across asia").value_or(""),
              "Travel|Adventure|Backpacking");
}

TEST_F(TaxonomyTest, ClassifyIsTotal) {
    EXPECT_CALL(oracle_, complete(_))
        .WillOnce(Return(""))
        .WillOnce(Return("|||"))
        .WillOnce(Return("Career|Digital 2.0|Media"))
        .WillOnce(Throw(std::runtime_error("socket closed")));
    for (const char* phrase : {"to fly", "to sing", "to paint", "to garden"}) {
        EXPECT_TRUE(classifier_.classify(phrase).complete()) << phrase;
    }
}

TEST_F(TaxonomyTest, PromptFormat) {
    EXPECT_EQ(TaxonomyClassifier::build_prompt("to fly"),
              "Categorize 'to fly' into 3 levels. Reply ONLY with format: Category|Subcategory|Specific");
}

TEST(TaxonomyFallbackTest, KeywordRows) {
    EXPECT_EQ(TaxonomyClassifier::fallback("to be a famous TikTok star"), path("Career", "Digital Creator", "Social Media"));
    EXPECT_EQ(TaxonomyClassifier::fallback("to become a doctor"), path("Career", "Professional", "Traditional"));
    EXPECT_EQ(TaxonomyClassifier::fallback("to be rich"), path("Financial", "Wealth", "Personal"));
    EXPECT_EQ(TaxonomyClassifier::fallback("to travel the world"), path("Travel", "Adventure", "Exploration"));
    EXPECT_EQ(TaxonomyClassifier::fallback("to get fit"), path("Health", "Fitness", "Physical"));
    EXPECT_EQ(TaxonomyClassifier::fallback("to be happy"), path("Personal", "Goals", "General"));
}

TEST(TaxonomyFallbackTest, KeywordsMatchAtWordStartOnly) {
    // "enrich" must not hit "rich", "outfit" must not hit "fit"
    EXPECT_EQ(TaxonomyClassifier::fallback("to enrich my outfit"), path("Personal", "Goals", "General"));
}

TEST(TaxonomyCodecTest, EncodeDecode) {
    EXPECT_EQ(TaxonomyClassifier::encode(path("A", "B", "C")), "A|B|C");
    EXPECT_EQ(TaxonomyClassifier::decode("A|B|C"), path("A", "B", "C"));
    EXPECT_FALSE(TaxonomyClassifier::decode("A|B").has_value());
    EXPECT_FALSE(TaxonomyClassifier::decode("A||C").has_value());
}

class TaxonomyParserTest : public ::testing::Test {
protected:
    ResponseParser<TaxonomyPath> parser_ = make_taxonomy_parser();
};

TEST_F(TaxonomyParserTest, EmbeddedTriplet) {
    auto result = parser_.parse("Here you go: Health|Fitness|Running. Hope that helps!");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value, path("Health", "Fitness", "Running"));
    EXPECT_EQ(result->strategy, "embedded_triplet");
}

TEST_F(TaxonomyParserTest, LabelledLines) {
    auto result = parser_.parse("**Category:** Education\n**Subcategory:** Higher Learning\n**Specific:** Doctorate");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->value, path("Education", "Higher Learning", "Doctorate"));
    EXPECT_EQ(result->strategy, "labelled_lines");
}

TEST_F(TaxonomyParserTest, RejectsNonLetters) {
    EXPECT_FALSE(parser_.parse("Career|Level 2|Specific").has_value());
}
