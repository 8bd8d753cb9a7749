#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <vector>

#include "engram/core/clock.h"
#include "engram/storage/node_store.h"
#include "test_util/temp_dir.h"

namespace engram {
namespace storage {
namespace {

class NodeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = core::GraphConfig::Default();
        config_.num_store_shards = 4;
        clock_ = std::make_shared<core::ManualClock>();
        store_ = std::make_unique<NodeStore>(config_, clock_);
    }

    NodeDraft Draft(const std::string& owner, core::Level level = core::Level::ATOMIC) {
        NodeDraft draft;
        draft.owner = owner;
        draft.level = level;
        draft.content = "note from " + owner;
        draft.similarity_key = {1.0f, 0.0f};
        return draft;
    }

    core::NodeId Create(const std::string& owner, core::Level level = core::Level::ATOMIC) {
        auto result = store_->create(Draft(owner, level));
        EXPECT_TRUE(result.ok());
        return result.value();
    }

    core::GraphConfig config_;
    std::shared_ptr<core::ManualClock> clock_;
    std::unique_ptr<NodeStore> store_;
};

TEST_F(NodeStoreTest, CreateFillsDefaults) {
    auto id = Create("office-a");
    auto node = store_->get(id);
    ASSERT_TRUE(node.ok());
    EXPECT_EQ(node.value().id, id);
    EXPECT_EQ(node.value().owner, "office-a");
    EXPECT_EQ(node.value().created_at, clock_->now());
    EXPECT_EQ(node.value().ttl, config_.ttl.atomic);
    EXPECT_FLOAT_EQ(node.value().importance, config_.default_importance);
    EXPECT_EQ(node.value().access_count, 0u);
    EXPECT_FALSE(node.value().parent.has_value());
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(NodeStoreTest, IdsAreUniqueAndIncreasing) {
    auto a = Create("office-a");
    auto b = Create("office-b");
    auto c = Create("office-a");
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST_F(NodeStoreTest, CreateRejectsBadDrafts) {
    auto draft = Draft("");
    EXPECT_TRUE(store_->create(draft).is(core::Error::Code::INVALID_ARGUMENT));

    draft = Draft("office-a");
    draft.ttl = 0;
    EXPECT_TRUE(store_->create(draft).is(core::Error::Code::INVALID_ARGUMENT));

    draft = Draft("office-a");
    draft.importance = 1.5f;
    EXPECT_TRUE(store_->create(draft).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(NodeStoreTest, NanImportanceIsRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto draft = Draft("office-a");
    draft.importance = nan;
    EXPECT_TRUE(store_->create(draft).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_EQ(store_->size(), 0u);

    auto id = Create("office-a");
    EXPECT_TRUE(store_->update_importance(id, "office-a", nan).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->set_importance(id, nan).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_FLOAT_EQ(store_->get(id).value().importance, config_.default_importance);
}

TEST_F(NodeStoreTest, HugeTtlNeverExpires) {
    auto draft = Draft("office-a");
    draft.ttl = std::numeric_limits<core::Duration>::max();
    auto id = store_->create(draft).value();

    auto node = store_->get(id);
    ASSERT_TRUE(node.ok());
    EXPECT_EQ(node.value().expires_at(), std::numeric_limits<core::Timestamp>::max());

    clock_->advance(365LL * 24 * 3600 * 1000);
    EXPECT_TRUE(store_->get(id).ok());
    ASSERT_TRUE(store_->delete_expired().ok());
    EXPECT_EQ(store_->size(), 1u);

    auto other = Create("office-a");
    ASSERT_TRUE(store_->update_ttl(other, "office-a", std::numeric_limits<core::Duration>::max()).ok());
    EXPECT_TRUE(store_->get(other).ok());
}

TEST_F(NodeStoreTest, ExpiredNodeIsInvisibleBeforeSweep) {
    auto draft = Draft("office-a");
    draft.ttl = 1000;
    auto id = store_->create(draft).value();

    clock_->advance(999);
    EXPECT_TRUE(store_->get(id).ok());
    clock_->advance(1);
    EXPECT_TRUE(store_->get(id).is(core::Error::Code::NOT_FOUND));
    EXPECT_TRUE(store_->touch(id).is(core::Error::Code::NOT_FOUND));
    // Still physically present until the sweep.
    EXPECT_TRUE(store_->find(id).has_value());
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(NodeStoreTest, TouchCountsAccesses) {
    auto id = Create("office-a");
    clock_->advance(50);
    ASSERT_TRUE(store_->touch(id).ok());
    ASSERT_TRUE(store_->touch(id).ok());
    auto node = store_->get(id).value();
    EXPECT_EQ(node.access_count, 2u);
    EXPECT_EQ(node.last_accessed_at, clock_->now());
    EXPECT_TRUE(store_->touch(12345).is(core::Error::Code::NOT_FOUND));
}

TEST_F(NodeStoreTest, OwnerOnlyMutations) {
    auto id = Create("office-a");
    EXPECT_TRUE(store_->update_consent(id, "office-b", core::ConsentLevel::PUBLIC)
                    .is(core::Error::Code::FORBIDDEN));
    EXPECT_TRUE(store_->update_ttl(id, "office-b", 10).is(core::Error::Code::FORBIDDEN));
    EXPECT_TRUE(store_->update_importance(id, "office-b", 0.9f).is(core::Error::Code::FORBIDDEN));

    ASSERT_TRUE(store_->update_consent(id, "office-a", core::ConsentLevel::PUBLIC).ok());
    ASSERT_TRUE(store_->update_ttl(id, "office-a", 5000).ok());
    ASSERT_TRUE(store_->update_importance(id, "office-a", 0.9f).ok());

    auto node = store_->get(id).value();
    EXPECT_EQ(node.consent, core::ConsentLevel::PUBLIC);
    EXPECT_EQ(node.ttl, 5000);
    EXPECT_FLOAT_EQ(node.importance, 0.9f);

    EXPECT_TRUE(store_->update_ttl(id, "office-a", -1).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->update_importance(id, "office-a", -0.1f).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->update_consent(999, "office-a", core::ConsentLevel::PUBLIC)
                    .is(core::Error::Code::NOT_FOUND));
}

TEST_F(NodeStoreTest, TtlChangeCountsFromCreation) {
    auto id = Create("office-a");
    clock_->advance(2000);
    ASSERT_TRUE(store_->update_ttl(id, "office-a", 1500).ok());
    // created_at + 1500 is already in the past
    EXPECT_TRUE(store_->get(id).is(core::Error::Code::NOT_FOUND));
}

TEST_F(NodeStoreTest, EraseCascadesAndNotifies) {
    auto a = Create("office-a");
    auto b = Create("office-a");

    core::AccessGrant grant;
    grant.node_id = a;
    grant.granting_owner = "office-a";
    grant.receiving_owner = "office-b";
    grant.expires_at = clock_->now() + 1000;
    ASSERT_TRUE(store_->add_grant(grant).ok());

    core::MemoryEdge edge;
    edge.source = b;
    edge.target = a;
    edge.creator = "office-a";
    edge.relation = "follows";
    ASSERT_TRUE(store_->add_edge(edge).ok());

    std::vector<core::NodeId> removed;
    store_->add_removal_listener([&removed](const core::MemoryNode& node) { removed.push_back(node.id); });

    EXPECT_TRUE(store_->erase(a, "office-b").is(core::Error::Code::FORBIDDEN));
    auto erased = store_->erase(a, "office-a");
    ASSERT_TRUE(erased.ok());
    EXPECT_EQ(erased.value().id, a);

    EXPECT_TRUE(store_->get(a).is(core::Error::Code::NOT_FOUND));
    EXPECT_EQ(store_->grants().size(), 0u);
    EXPECT_EQ(store_->edges().size(), 0u);
    EXPECT_EQ(removed, (std::vector<core::NodeId>{a}));
    EXPECT_TRUE(store_->erase(a, "office-a").is(core::Error::Code::NOT_FOUND));
}

TEST_F(NodeStoreTest, DeleteExpiredSweepsNodesAndGrants) {
    auto draft = Draft("office-a");
    draft.ttl = 100;
    auto short_lived = store_->create(draft).value();
    auto long_lived = Create("office-a");

    core::AccessGrant grant;
    grant.node_id = long_lived;
    grant.granting_owner = "office-a";
    grant.receiving_owner = "office-b";
    grant.expires_at = clock_->now() + 100;
    ASSERT_TRUE(store_->add_grant(grant).ok());

    size_t notified = 0;
    store_->add_removal_listener([&notified](const core::MemoryNode&) { ++notified; });

    clock_->advance(100);
    auto swept = store_->delete_expired();
    ASSERT_TRUE(swept.ok());
    EXPECT_EQ(swept.value(), 1u);
    EXPECT_EQ(notified, 1u);
    EXPECT_FALSE(store_->find(short_lived).has_value());
    EXPECT_TRUE(store_->get(long_lived).ok());
    EXPECT_EQ(store_->grants().size(), 0u);

    auto again = store_->delete_expired();
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(NodeStoreTest, UnrolledIsChronological) {
    auto first = Create("office-a");
    clock_->advance(10);
    auto second = Create("office-a");
    Create("office-b");
    Create("office-a", core::Level::DAILY);

    auto nodes = store_->unrolled("office-a", core::Level::ATOMIC);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].id, first);
    EXPECT_EQ(nodes[1].id, second);
    EXPECT_EQ(store_->count_unrolled("office-a", core::Level::ATOMIC), 2u);
    EXPECT_EQ(store_->count_unrolled("office-c", core::Level::ATOMIC), 0u);
    EXPECT_EQ(store_->owners(), (std::vector<core::OwnerId>{"office-a", "office-b"}));
    EXPECT_EQ(store_->ids_of("office-a").size(), 3u);
}

TEST_F(NodeStoreTest, CommitSummaryParentsChildren) {
    auto a = Create("office-a");
    auto b = Create("office-a");

    auto draft = Draft("office-a", core::Level::DAILY);
    auto summary = store_->commit_summary(draft, {a, b});
    ASSERT_TRUE(summary.ok());

    auto node = store_->get(summary.value()).value();
    EXPECT_EQ(node.level, core::Level::DAILY);
    EXPECT_EQ(node.children, (std::vector<core::NodeId>{a, b}));
    EXPECT_EQ(node.ttl, config_.ttl.daily);
    EXPECT_EQ(store_->get(a).value().parent, summary.value());
    EXPECT_EQ(store_->get(b).value().parent, summary.value());
    EXPECT_EQ(store_->count_unrolled("office-a", core::Level::ATOMIC), 0u);
    EXPECT_EQ(store_->count_unrolled("office-a", core::Level::DAILY), 1u);
}

TEST_F(NodeStoreTest, CommitSummaryIsAllOrNothing) {
    auto a = Create("office-a");
    auto b = Create("office-a");
    auto foreign = Create("office-b");
    auto daily = Create("office-a", core::Level::DAILY);
    const size_t before = store_->size();

    auto daily_draft = Draft("office-a", core::Level::DAILY);
    EXPECT_TRUE(store_->commit_summary(Draft("office-a"), {a}).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->commit_summary(daily_draft, {}).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->commit_summary(daily_draft, {a, a}).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->commit_summary(daily_draft, {a, foreign}).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->commit_summary(daily_draft, {a, daily}).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(store_->commit_summary(daily_draft, {a, 9999}).is(core::Error::Code::NOT_FOUND));

    EXPECT_EQ(store_->size(), before);
    EXPECT_FALSE(store_->get(a).value().parent.has_value());

    ASSERT_TRUE(store_->commit_summary(daily_draft, {a, b}).ok());
    // Already summarized children cannot be rolled up twice.
    EXPECT_TRUE(store_->commit_summary(daily_draft, {b}).is(core::Error::Code::INVALID_ARGUMENT));
}

TEST_F(NodeStoreTest, StatsBreakdown) {
    auto draft = Draft("office-a");
    draft.tags = {"astro"};
    draft.consent = core::ConsentLevel::PUBLIC;
    auto id = store_->create(draft).value();
    Create("office-b", core::Level::WEEKLY);
    ASSERT_TRUE(store_->touch(id).ok());

    auto stats = store_->stats();
    EXPECT_EQ(stats.total_nodes, 2u);
    EXPECT_EQ(stats.nodes_per_level[static_cast<size_t>(core::Level::ATOMIC)], 1u);
    EXPECT_EQ(stats.nodes_per_level[static_cast<size_t>(core::Level::WEEKLY)], 1u);
    EXPECT_EQ(stats.nodes_per_owner["office-a"], 1u);
    EXPECT_EQ(stats.nodes_per_consent[static_cast<size_t>(core::ConsentLevel::PUBLIC)], 1u);
    EXPECT_EQ(stats.nodes_per_tag["astro"], 1u);
    EXPECT_EQ(stats.total_accesses, 1u);
}

class NodeStoreRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("engram_node_store");
        config_ = core::GraphConfig::Default();
        config_.num_store_shards = 4;
        clock_ = std::make_shared<core::ManualClock>();
    }

    std::unique_ptr<NodeStore> Open() {
        auto journal = std::make_shared<Journal>(dir_->str(), config_.journal);
        auto store = std::make_unique<NodeStore>(config_, clock_, journal);
        EXPECT_TRUE(store->recover().ok());
        return store;
    }

    NodeDraft Draft(const std::string& owner) {
        NodeDraft draft;
        draft.owner = owner;
        draft.content = "entry";
        return draft;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::GraphConfig config_;
    std::shared_ptr<core::ManualClock> clock_;
};

TEST_F(NodeStoreRecoveryTest, ReplayRestoresState) {
    core::NodeId a, b, summary, erased;
    {
        auto store = Open();
        a = store->create(Draft("office-a")).value();
        b = store->create(Draft("office-a")).value();
        erased = store->create(Draft("office-a")).value();
        ASSERT_TRUE(store->update_consent(a, "office-a", core::ConsentLevel::SHARED).ok());
        ASSERT_TRUE(store->touch(a).ok());
        ASSERT_TRUE(store->touch(a).ok());

        NodeDraft daily = Draft("office-a");
        daily.level = core::Level::DAILY;
        summary = store->commit_summary(daily, {a, b}).value();

        core::AccessGrant grant;
        grant.node_id = a;
        grant.granting_owner = "office-a";
        grant.receiving_owner = "office-b";
        grant.expires_at = clock_->now() + 1000;
        ASSERT_TRUE(store->add_grant(grant).ok());
        ASSERT_TRUE(store->erase(erased, "office-a").ok());
        ASSERT_TRUE(store->flush().ok());
    }

    auto store = Open();
    EXPECT_EQ(store->size(), 3u);
    auto node = store->get(a);
    ASSERT_TRUE(node.ok());
    EXPECT_EQ(node.value().consent, core::ConsentLevel::SHARED);
    EXPECT_EQ(node.value().access_count, 2u);
    EXPECT_EQ(node.value().parent, summary);
    EXPECT_EQ(store->get(summary).value().children, (std::vector<core::NodeId>{a, b}));
    EXPECT_TRUE(store->get(erased).is(core::Error::Code::NOT_FOUND));
    EXPECT_EQ(store->grants().grants_for(a).size(), 1u);

    // New ids continue after the recovered ones.
    auto fresh = store->create(Draft("office-a")).value();
    EXPECT_GT(fresh, summary);
}

TEST_F(NodeStoreRecoveryTest, CheckpointKeepsIdsMonotonic) {
    core::NodeId last;
    {
        auto store = Open();
        store->create(Draft("office-a")).value();
        last = store->create(Draft("office-a")).value();
        ASSERT_TRUE(store->erase(last, "office-a").ok());
        ASSERT_TRUE(store->checkpoint().ok());
    }

    auto store = Open();
    EXPECT_EQ(store->size(), 1u);
    auto fresh = store->create(Draft("office-a")).value();
    EXPECT_GT(fresh, last);
}

TEST_F(NodeStoreRecoveryTest, CheckpointThenMoreWrites) {
    core::NodeId a, b;
    {
        auto store = Open();
        a = store->create(Draft("office-a")).value();
        ASSERT_TRUE(store->checkpoint().ok());
        b = store->create(Draft("office-b")).value();
        ASSERT_TRUE(store->update_importance(a, "office-a", 0.9f).ok());
    }

    auto store = Open();
    EXPECT_EQ(store->size(), 2u);
    EXPECT_FLOAT_EQ(store->get(a).value().importance, 0.9f);
    EXPECT_TRUE(store->get(b).ok());
}

TEST_F(NodeStoreRecoveryTest, CheckpointDueFollowsThreshold) {
    config_.journal.checkpoint_threshold_bytes = 1;
    auto store = Open();
    EXPECT_FALSE(store->checkpoint_due());
    store->create(Draft("office-a")).value();
    EXPECT_TRUE(store->checkpoint_due());
    ASSERT_TRUE(store->checkpoint().ok());
    EXPECT_FALSE(store->checkpoint_due());
}

} // namespace
} // namespace storage
} // namespace engram
