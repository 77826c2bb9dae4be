// =============================================================================
// Cluster Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/error.hpp"
#include "dreamgroup/store/cluster_store.hpp"
#include "test_support.hpp"

using namespace dreamgroup;
using namespace dreamgroup::pipeline;
using namespace dreamgroup::store;

namespace {

DreamRecord record(const std::string& id, const std::string& phrase, const std::string& cluster) {
    DreamRecord r;
    r.id = id;
    r.raw_title = phrase;
    r.author = "a" + id;
    r.normalized_phrase = phrase;
    r.cluster_id = cluster;
    return r;
}

Cluster cluster(const std::string& id, const std::string& rep, std::vector<std::string> members) {
    Cluster c;
    c.id = id;
    c.representative = rep;
    c.member_ids = std::move(members);
    c.taxonomy = TaxonomyPath{"Personal", "Goals", "General"};
    return c;
}

PipelineState clustered_state() {
    PipelineState state;
    state.stage = Stage::DONE;
    state.records = {
        record("1", "to become a doctor", "group_00001"),
        record("2", "to become a physician", "group_00001"),
        record("3", "to travel the world", "group_00002"),
        record("4", "to see the world", "group_00003"),
    };
    state.clusters = {
        cluster("group_00001", "to become a doctor", {"1", "2"}),
        cluster("group_00002", "to travel the world", {"3"}),
        cluster("group_00003", "to see the world", {"4"}),
    };
    return state;
}

} // namespace

TEST(ClusterStoreTest, LookupsByIdAndPhrase) {
    ClusterStore live(clustered_state());
    EXPECT_EQ(live.size(), 3u);
    ASSERT_NE(live.find("group_00002"), nullptr);
    EXPECT_EQ(live.find("group_00002")->representative, "to travel the world");
    EXPECT_EQ(live.find("group_00009"), nullptr);

    ASSERT_NE(live.find_by_phrase("to become a physician"), nullptr);
    EXPECT_EQ(live.find_by_phrase("to become a physician")->id, "group_00001");
    EXPECT_EQ(live.find_by_phrase("to swim"), nullptr);
}

TEST(ClusterStoreTest, MemberPhrasesStartWithRepresentative) {
    ClusterStore live(clustered_state());
    auto phrases = live.member_phrases("group_00001");
    EXPECT_EQ(phrases, (std::vector<std::string>{"to become a doctor", "to become a physician"}));
    EXPECT_TRUE(live.member_phrases("missing").empty());
}

TEST(ClusterStoreTest, MergeMovesMembersAndRetiresSources) {
    ClusterStore live(clustered_state());
    const Cluster& merged = live.merge_into("group_00002", {"group_00003"});

    EXPECT_EQ(merged.id, "group_00002");
    EXPECT_EQ(merged.representative, "to travel the world");
    EXPECT_EQ(merged.member_ids, (std::vector<std::string>{"3", "4"}));
    EXPECT_FALSE(live.live("group_00003"));
    EXPECT_EQ(live.size(), 2u);

    // Phrases of the absorbed cluster now resolve to the target
    ASSERT_NE(live.find_by_phrase("to see the world"), nullptr);
    EXPECT_EQ(live.find_by_phrase("to see the world")->id, "group_00002");
    for (const auto& r : live.state().records) {
        if (r.id == "4") EXPECT_EQ(r.cluster_id, "group_00002");
    }
}

TEST(ClusterStoreTest, MergeSeveralSources) {
    ClusterStore live(clustered_state());
    const Cluster& merged = live.merge_into("group_00001", {"group_00003", "group_00002"});
    EXPECT_EQ(merged.member_ids, (std::vector<std::string>{"1", "2", "4", "3"}));
    EXPECT_EQ(live.size(), 1u);
}

TEST(ClusterStoreTest, MergeRejectsBadArguments) {
    ClusterStore live(clustered_state());
    EXPECT_THROW(live.merge_into("group_00001", {}), InvalidArgumentError);
    EXPECT_THROW(live.merge_into("group_00009", {"group_00002"}), InvalidArgumentError);
    EXPECT_THROW(live.merge_into("group_00001", {"group_00009"}), InvalidArgumentError);
    EXPECT_THROW(live.merge_into("group_00001", {"group_00001"}), InvalidArgumentError);
    EXPECT_THROW(live.merge_into("group_00001", {"group_00002", "group_00002"}), InvalidArgumentError);
    // Nothing changed
    EXPECT_EQ(live.size(), 3u);
}

TEST(ClusterStoreTest, MergedAwayClusterIsNoLongerLive) {
    ClusterStore live(clustered_state());
    EXPECT_TRUE(live.live("group_00003"));
    live.merge_into("group_00002", {"group_00003"});
    EXPECT_FALSE(live.live("group_00003"));

    // A second merge naming the retired cluster, as either side, is refused
    EXPECT_THROW(live.merge_into("group_00001", {"group_00003"}), InvalidArgumentError);
    EXPECT_THROW(live.merge_into("group_00003", {"group_00001"}), InvalidArgumentError);
    EXPECT_EQ(live.size(), 2u);
    EXPECT_EQ(live.find("group_00002")->member_ids, (std::vector<std::string>{"3", "4"}));
}

TEST(ClusterStoreTest, MergedStateSurvivesCheckpoint) {
    test::TempDir dir;
    CheckpointManager checkpoint(dir.file("state.json"));
    {
        ClusterStore live(clustered_state());
        live.merge_into("group_00001", {"group_00002"});
        checkpoint.save(live.state());
    }
    ClusterStore reloaded = ClusterStore::load(checkpoint);
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_FALSE(reloaded.live("group_00002"));
    EXPECT_EQ(reloaded.find_by_phrase("to travel the world")->id, "group_00001");
}

TEST(ClusterStoreTest, MissingCheckpointGivesEmptyStore) {
    test::TempDir dir;
    ClusterStore live = ClusterStore::load(CheckpointManager(dir.file("none.json")));
    EXPECT_TRUE(live.empty());
}
