// =============================================================================
// Checkpoint Persistence Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/error.hpp"
#include "dreamgroup/pipeline/checkpoint.hpp"
#include "dreamgroup/util/file_sync.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using namespace dreamgroup;
using namespace dreamgroup::pipeline;

namespace {

PipelineState sample_state() {
    PipelineState state;
    state.stage = Stage::CLASSIFY;

    DreamRecord a;
    a.id = "101";
    a.raw_title = "\xD7\x9C\xD7\x98\xD7\x95\xD7\xA1";
    a.author = "dana";
    a.birth_date = "2008-04-01";
    a.age = 17;
    a.normalized_phrase = "to fly";
    a.cluster_id = "group_00001";

    DreamRecord b;
    b.id = "102";
    b.raw_title = "Fly a \"plane\"\tfast";
    b.author = "omer";
    b.normalized_phrase = "to fly a plane";
    b.cluster_id = "group_00001";

    state.records = {a, b};

    Cluster c;
    c.id = "group_00001";
    c.representative = "to fly";
    c.member_ids = {"101", "102"};
    c.taxonomy = TaxonomyPath{"Travel", "Adventure", "Flight"};
    state.clusters = {c};

    state.cache = {
        {oracle::OperationKind::NORMALIZE, "Fly a \"plane\"\tfast", "to fly a plane"},
        {oracle::OperationKind::EQUIVALENCE, oracle::OracleCache::pair_key("to fly", "to fly a plane"), "1"},
    };
    return state;
}

} // namespace

class CheckpointTest : public ::testing::Test {
protected:
    test::TempDir dir_;
};

TEST_F(CheckpointTest, MissingFileLoadsEmptyState) {
    CheckpointManager checkpoint(dir_.file("none.json"));
    EXPECT_FALSE(checkpoint.exists());
    PipelineState state = checkpoint.load();
    EXPECT_TRUE(state.empty());
    EXPECT_EQ(state.stage, Stage::NORMALIZE);
}

TEST_F(CheckpointTest, SaveThenLoadRestoresEverything) {
    CheckpointManager checkpoint(dir_.file("state.json"));
    PipelineState state = sample_state();
    checkpoint.save(state);

    EXPECT_TRUE(checkpoint.exists());
    EXPECT_FALSE(std::filesystem::exists(dir_.file("state.json.tmp")));
    EXPECT_EQ(checkpoint.load(), state);
}

TEST_F(CheckpointTest, UnclassifiedClustersOmitTaxonomy) {
    PipelineState state = sample_state();
    state.stage = Stage::CLUSTER;
    state.clusters[0].taxonomy.reset();
    state.records[0].age.reset();
    state.records[0].birth_date.reset();

    PipelineState back = CheckpointManager::from_json(CheckpointManager::to_json(state));
    EXPECT_FALSE(back.clusters[0].taxonomy.has_value());
    EXPECT_FALSE(back.records[0].age.has_value());
    EXPECT_EQ(back, state);
}

TEST_F(CheckpointTest, SaveOverwritesPreviousCheckpoint) {
    CheckpointManager checkpoint(dir_.file("state.json"));
    PipelineState state = sample_state();
    checkpoint.save(state);

    state.stage = Stage::DONE;
    state.records.pop_back();
    checkpoint.save(state);

    EXPECT_EQ(checkpoint.load(), state);
}

TEST_F(CheckpointTest, CreatesParentDirectories) {
    CheckpointManager checkpoint((dir_.path() / "nested" / "deeper" / "state.json").string());
    checkpoint.save(sample_state());
    EXPECT_TRUE(checkpoint.exists());
}

TEST_F(CheckpointTest, MalformedFileIsReported) {
    const std::string path = dir_.file("broken.json");
    CheckpointManager checkpoint(path);

    for (const char* body : {"{not json", "[]", R"({"stage":"sideways","records":[],"clusters":[]})",
                             R"({"stage":"cluster","records":[{"id":1}],"clusters":[]})"}) {
        std::ofstream(path, std::ios::trunc) << body;
        try {
            checkpoint.load();
            FAIL() << "Expected CheckpointError for " << body;
        } catch (const CheckpointError& e) {
            EXPECT_EQ(e.code(), ErrorCode::CHECKPOINT_READ_FAILED) << body;
        }
    }
}

TEST_F(CheckpointTest, RemoveDeletesFile) {
    CheckpointManager checkpoint(dir_.file("state.json"));
    checkpoint.save(sample_state());
    checkpoint.remove();
    EXPECT_FALSE(checkpoint.exists());
    // Removing twice is harmless
    EXPECT_NO_THROW(checkpoint.remove());
}

TEST_F(CheckpointTest, NormalizedIds) {
    PipelineState state = sample_state();
    state.records[1].normalized_phrase.clear();
    auto ids = state.normalized_ids();
    EXPECT_EQ(ids.size(), 1u);
    EXPECT_TRUE(ids.count("101"));
}

TEST_F(CheckpointTest, SaveLeavesNoTempFileBehind) {
    const std::string path = dir_.file("state.json");
    CheckpointManager checkpoint(path);
    checkpoint.save(sample_state());
    checkpoint.save(sample_state());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(CheckpointTest, SyncToDiskAcceptsFilesAndDirectories) {
    const std::string path = dir_.file("synced.txt");
    {
        std::ofstream out(path);
        out << "payload";
    }
    EXPECT_FALSE(util::sync_to_disk(path));
    EXPECT_FALSE(util::sync_to_disk(dir_.path().string()));
}

TEST_F(CheckpointTest, SyncToDiskReportsMissingPath) {
    std::error_code ec = util::sync_to_disk(dir_.file("missing.json"));
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST(ParentDirectoryTest, SplitsOffTheFileName) {
    EXPECT_EQ(util::parent_directory("state.json"), ".");
    EXPECT_EQ(util::parent_directory("out/state.json"), "out");
    EXPECT_EQ(util::parent_directory("/var/lib/dreamgroup/state.json"), "/var/lib/dreamgroup");
}
