#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <vector>

#include "engram/core/error.h"
#include "engram/storage/journal.h"
#include "test_util/temp_dir.h"

namespace engram {
namespace storage {
namespace {

core::MemoryNode MakeNode(core::NodeId id) {
    core::MemoryNode node;
    node.id = id;
    node.owner = "office-a";
    node.level = core::Level::DAILY;
    node.content = "mercury retrograde note " + std::to_string(id);
    node.tags = {"astro", "market_timing"};
    node.similarity_key = {0.5f, -0.25f, 0.0f};
    node.consent = core::ConsentLevel::SHARED;
    node.created_at = 1000 + static_cast<core::Timestamp>(id);
    node.ttl = 60000;
    node.access_count = 3;
    node.last_accessed_at = 2000;
    node.importance = 0.75f;
    node.children = {id + 100, id + 101};
    node.parent = id + 1000;
    return node;
}

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("engram_journal");
        config_ = core::JournalConfig::Default();
    }

    std::vector<JournalRecord> ReplayAll(Journal& journal) {
        std::vector<JournalRecord> records;
        auto result = journal.replay([&records](const JournalRecord& r) { records.push_back(r); });
        EXPECT_TRUE(result.ok());
        return records;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::JournalConfig config_;
};

TEST(JournalCodecTest, NodeRecordKeepsEveryField) {
    auto original = MakeNode(7);
    auto decoded = deserialize_record(serialize_record(JournalRecord::NodePut(original)));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, RecordType::NODE_PUT);

    const auto& node = decoded->node;
    EXPECT_EQ(node.id, 7u);
    EXPECT_EQ(node.owner, "office-a");
    EXPECT_EQ(node.level, core::Level::DAILY);
    EXPECT_EQ(node.content, original.content);
    EXPECT_EQ(node.tags, original.tags);
    EXPECT_EQ(node.similarity_key, original.similarity_key);
    EXPECT_EQ(node.consent, core::ConsentLevel::SHARED);
    EXPECT_EQ(node.created_at, original.created_at);
    EXPECT_EQ(node.ttl, 60000);
    EXPECT_EQ(node.access_count, 3u);
    EXPECT_EQ(node.last_accessed_at, 2000);
    EXPECT_FLOAT_EQ(node.importance, 0.75f);
    EXPECT_EQ(node.children, original.children);
    ASSERT_TRUE(node.parent.has_value());
    EXPECT_EQ(*node.parent, 1007u);
}

TEST(JournalCodecTest, NodeWithoutParent) {
    auto original = MakeNode(1);
    original.parent.reset();
    auto decoded = deserialize_record(serialize_record(JournalRecord::SummaryCommit(original)));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, RecordType::SUMMARY_COMMIT);
    EXPECT_FALSE(decoded->node.parent.has_value());
}

TEST(JournalCodecTest, GrantAndEdgeRecords) {
    core::AccessGrant grant;
    grant.id = 4;
    grant.node_id = 9;
    grant.granting_owner = "office-a";
    grant.receiving_owner = "office-b";
    grant.created_at = 10;
    grant.expires_at = 20;
    grant.can_modify = true;
    auto g = deserialize_record(serialize_record(JournalRecord::GrantPut(grant)));
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->grant.receiving_owner, "office-b");
    EXPECT_EQ(g->grant.expires_at, 20);
    EXPECT_TRUE(g->grant.can_modify);

    core::MemoryEdge edge;
    edge.id = 5;
    edge.source = 1;
    edge.target = 2;
    edge.creator = "office-a";
    edge.relation = "supports";
    edge.weight = 0.5f;
    edge.created_at = 30;
    auto e = deserialize_record(serialize_record(JournalRecord::EdgePut(edge)));
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->edge.relation, "supports");
    EXPECT_EQ(e->edge.target, 2u);
    EXPECT_FLOAT_EQ(e->edge.weight, 0.5f);
}

TEST(JournalCodecTest, WatermarkCarriesThreeCounters) {
    auto decoded = deserialize_record(serialize_record(JournalRecord::IdWatermark(11, 22, 33)));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, RecordType::ID_WATERMARK);
    EXPECT_EQ(decoded->id, 11u);
    EXPECT_EQ(decoded->grant.id, 22u);
    EXPECT_EQ(decoded->edge.id, 33u);
}

TEST(JournalCodecTest, RejectsGarbage) {
    EXPECT_FALSE(deserialize_record({}).has_value());
    EXPECT_FALSE(deserialize_record({0xEE, 1, 2, 3}).has_value());

    auto bytes = serialize_record(JournalRecord::NodePut(MakeNode(3)));
    bytes.resize(bytes.size() / 2);
    EXPECT_FALSE(deserialize_record(bytes).has_value());

    // Consent byte past PUBLIC
    auto consent = serialize_record(JournalRecord::Consent(1, core::ConsentLevel::PUBLIC));
    consent.back() = 9;
    EXPECT_FALSE(deserialize_record(consent).has_value());
}

TEST_F(JournalTest, ReplaysInOrder) {
    {
        Journal journal(dir_->str(), config_);
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(1))).ok());
        ASSERT_TRUE(journal.log(JournalRecord::Consent(1, core::ConsentLevel::PUBLIC)).ok());
        ASSERT_TRUE(journal.log(JournalRecord::Touch(1, 4, 5000), false).ok());
        ASSERT_TRUE(journal.log(JournalRecord::NodeErase(1)).ok());
    }

    Journal reopened(dir_->str(), config_);
    auto records = ReplayAll(reopened);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].type, RecordType::NODE_PUT);
    EXPECT_EQ(records[1].type, RecordType::CONSENT);
    EXPECT_EQ(records[1].consent, core::ConsentLevel::PUBLIC);
    EXPECT_EQ(records[2].type, RecordType::TOUCH);
    EXPECT_EQ(records[2].access_count, 4u);
    EXPECT_EQ(records[3].type, RecordType::NODE_ERASE);
}

TEST_F(JournalTest, TruncatedTailIsIgnored) {
    {
        Journal journal(dir_->str(), config_);
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(1))).ok());
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(2))).ok());
    }

    // An append interrupted half way: the length promises more than follows.
    {
        std::ofstream out(dir_->path() / "journal_000000.log", std::ios::binary | std::ios::app);
        uint32_t length = 512;
        out.write(reinterpret_cast<const char*>(&length), sizeof(length));
        out.write("abc", 3);
    }

    const auto segment = dir_->path() / "journal_000000.log";
    const auto torn_size = std::filesystem::file_size(segment);
    {
        Journal reopened(dir_->str(), config_);
        EXPECT_EQ(std::filesystem::file_size(segment), torn_size - sizeof(uint32_t) - 3);
        auto records = ReplayAll(reopened);
        ASSERT_EQ(records.size(), 2u);
        EXPECT_EQ(records[1].node.id, 2u);

        // Written after the restart, so it must survive the next one too.
        ASSERT_TRUE(reopened.log(JournalRecord::NodePut(MakeNode(3))).ok());
    }

    Journal again(dir_->str(), config_);
    auto records = ReplayAll(again);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].node.id, 3u);
}

TEST_F(JournalTest, ZeroLengthTailIsCut) {
    {
        Journal journal(dir_->str(), config_);
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(1))).ok());
    }
    {
        std::ofstream out(dir_->path() / "journal_000000.log", std::ios::binary | std::ios::app);
        const char zeros[6] = {0, 0, 0, 0, 0, 0};
        out.write(zeros, sizeof(zeros));
    }
    {
        Journal reopened(dir_->str(), config_);
        ASSERT_TRUE(reopened.log(JournalRecord::NodeErase(1)).ok());
    }

    Journal again(dir_->str(), config_);
    auto records = ReplayAll(again);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].type, RecordType::NODE_ERASE);
}

TEST_F(JournalTest, IgnoresFilesWithOverlongNumbers) {
    {
        Journal journal(dir_->str(), config_);
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(1))).ok());
    }
    {
        std::ofstream stray(dir_->path() / "journal_99999999999.log", std::ios::binary);
        stray << "not a segment";
    }

    Journal reopened(dir_->str(), config_);
    EXPECT_EQ(reopened.current_segment(), 0);
    auto records = ReplayAll(reopened);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].node.id, 1u);
}

TEST_F(JournalTest, RotatesPastSegmentSize) {
    config_.segment_size_bytes = 256;
    Journal journal(dir_->str(), config_);
    for (core::NodeId id = 1; id <= 20; ++id) {
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(id))).ok());
    }
    EXPECT_GT(journal.current_segment(), 0);

    auto records = ReplayAll(journal);
    ASSERT_EQ(records.size(), 20u);
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].node.id, i + 1);
    }
}

TEST_F(JournalTest, CheckpointReplacesOlderSegments) {
    Journal journal(dir_->str(), config_);
    for (core::NodeId id = 1; id <= 3; ++id) {
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(id))).ok());
    }
    EXPECT_GT(journal.bytes_since_checkpoint(), 0u);

    auto segment = journal.rotate_for_checkpoint();
    ASSERT_TRUE(segment.ok());
    EXPECT_EQ(journal.bytes_since_checkpoint(), 0u);

    // Logged after the switch, lands in the new segment.
    ASSERT_TRUE(journal.log(JournalRecord::NodeErase(2)).ok());

    auto written = journal.write_snapshot(segment.value(), [](const RecordSink& sink) {
        sink(JournalRecord::IdWatermark(4, 1, 1));
        sink(JournalRecord::NodePut(MakeNode(1)));
        sink(JournalRecord::NodePut(MakeNode(2)));
        sink(JournalRecord::NodePut(MakeNode(3)));
    });
    ASSERT_TRUE(written.ok());

    EXPECT_FALSE(std::filesystem::exists(dir_->path() / "journal_000000.log"));
    EXPECT_TRUE(std::filesystem::exists(dir_->path() / "snapshot_000001.bin"));

    auto records = ReplayAll(journal);
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records[0].type, RecordType::ID_WATERMARK);
    EXPECT_EQ(records[3].node.id, 3u);
    EXPECT_EQ(records[4].type, RecordType::NODE_ERASE);
    EXPECT_EQ(records[4].id, 2u);
}

TEST_F(JournalTest, ReopenContinuesNewestSegment) {
    {
        Journal journal(dir_->str(), config_);
        ASSERT_TRUE(journal.log(JournalRecord::NodePut(MakeNode(1))).ok());
        auto segment = journal.rotate_for_checkpoint();
        ASSERT_TRUE(segment.ok());
        ASSERT_TRUE(journal.write_snapshot(segment.value(), [](const RecordSink& sink) {
            sink(JournalRecord::NodePut(MakeNode(1)));
        }).ok());
    }

    Journal reopened(dir_->str(), config_);
    EXPECT_EQ(reopened.current_segment(), 1);
    ASSERT_TRUE(reopened.log(JournalRecord::Ttl(1, 99)).ok());

    auto records = ReplayAll(reopened);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].type, RecordType::TTL);
    EXPECT_EQ(records[1].ttl, 99);
}

TEST_F(JournalTest, UnusableDirectoryThrows) {
    auto blocker = dir_->path() / "not_a_dir";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    const std::string journal_dir = (blocker / "journal").string();
    EXPECT_THROW({ Journal journal(journal_dir, config_); }, core::StorageUnavailableError);
}

} // namespace
} // namespace storage
} // namespace engram
