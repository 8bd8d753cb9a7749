#include <gtest/gtest.h>
#include <limits>
#include <memory>

#include "engram/consent/consent_engine.h"
#include "engram/core/clock.h"

namespace engram {
namespace consent {
namespace {

constexpr core::Duration kHour = 3600 * 1000;

class ConsentEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<core::ManualClock>();
        store_ = std::make_shared<storage::NodeStore>(core::GraphConfig::Default(), clock_);
        engine_ = std::make_unique<ConsentEngine>(store_);
    }

    core::NodeId Create(core::ConsentLevel consent, const std::string& owner = "office-a") {
        storage::NodeDraft draft;
        draft.owner = owner;
        draft.content = "forecast";
        draft.consent = consent;
        return store_->create(draft).value();
    }

    core::MemoryNode Node(core::NodeId id) { return store_->get(id).value(); }

    std::shared_ptr<core::ManualClock> clock_;
    std::shared_ptr<storage::NodeStore> store_;
    std::unique_ptr<ConsentEngine> engine_;
};

TEST_F(ConsentEngineTest, OwnerAlwaysReadsAndModifies) {
    for (auto consent : {core::ConsentLevel::PRIVATE, core::ConsentLevel::RESTRICTED,
                         core::ConsentLevel::SHARED, core::ConsentLevel::PUBLIC}) {
        auto node = Node(Create(consent));
        EXPECT_TRUE(engine_->can_read(node, "office-a"));
        EXPECT_TRUE(engine_->can_modify(node, "office-a"));
    }
}

TEST_F(ConsentEngineTest, WithoutGrants) {
    EXPECT_FALSE(engine_->can_read(Node(Create(core::ConsentLevel::PRIVATE)), "office-b"));
    EXPECT_FALSE(engine_->can_read(Node(Create(core::ConsentLevel::RESTRICTED)), "office-b"));
    EXPECT_FALSE(engine_->can_read(Node(Create(core::ConsentLevel::SHARED)), "office-b"));
    EXPECT_TRUE(engine_->can_read(Node(Create(core::ConsentLevel::PUBLIC)), "office-b"));
    // Public content is readable, not writable.
    EXPECT_FALSE(engine_->can_modify(Node(Create(core::ConsentLevel::PUBLIC)), "office-b"));
}

TEST_F(ConsentEngineTest, EmptyRequesterIsDenied) {
    auto node = Node(Create(core::ConsentLevel::PUBLIC));
    EXPECT_FALSE(engine_->can_read(node, ""));
    EXPECT_FALSE(engine_->can_modify(node, ""));
}

TEST_F(ConsentEngineTest, GrantOpensSharedAndRestricted) {
    auto shared = Create(core::ConsentLevel::SHARED);
    auto restricted = Create(core::ConsentLevel::RESTRICTED);
    ASSERT_TRUE(engine_->grant(shared, "office-a", "office-b", kHour, false).ok());
    ASSERT_TRUE(engine_->grant(restricted, "office-a", "office-b", kHour, false).ok());

    EXPECT_TRUE(engine_->can_read(Node(shared), "office-b"));
    EXPECT_TRUE(engine_->can_read(Node(restricted), "office-b"));
    EXPECT_FALSE(engine_->can_read(Node(shared), "office-c"));
    EXPECT_FALSE(engine_->can_modify(Node(shared), "office-b"));
}

TEST_F(ConsentEngineTest, HugeGrantTtlDoesNotWrap) {
    auto id = Create(core::ConsentLevel::SHARED);
    auto granted = engine_->grant(id, "office-a", "office-b", std::numeric_limits<core::Duration>::max(), false);
    ASSERT_TRUE(granted.ok());

    auto grant = store_->grants().find(granted.value());
    ASSERT_TRUE(grant.has_value());
    EXPECT_EQ(grant->expires_at, std::numeric_limits<core::Timestamp>::max());
    clock_->advance(1000 * kHour);
    EXPECT_TRUE(engine_->can_read(Node(id), "office-b"));
}

TEST_F(ConsentEngineTest, PrivateIgnoresGrants) {
    auto id = Create(core::ConsentLevel::PRIVATE);
    ASSERT_TRUE(engine_->grant(id, "office-a", "office-b", kHour, true).ok());
    EXPECT_FALSE(engine_->can_read(Node(id), "office-b"));
    EXPECT_FALSE(engine_->can_modify(Node(id), "office-b"));
}

TEST_F(ConsentEngineTest, ModifyGrant) {
    auto id = Create(core::ConsentLevel::SHARED);
    ASSERT_TRUE(engine_->grant(id, "office-a", "office-b", kHour, true).ok());
    EXPECT_TRUE(engine_->can_modify(Node(id), "office-b"));
}

TEST_F(ConsentEngineTest, GrantExpiresAtBoundary) {
    auto id = Create(core::ConsentLevel::SHARED);
    ASSERT_TRUE(engine_->grant(id, "office-a", "office-b", 1000, false).ok());
    clock_->advance(999);
    EXPECT_TRUE(engine_->can_read(Node(id), "office-b"));
    clock_->advance(1);
    EXPECT_FALSE(engine_->can_read(Node(id), "office-b"));
}

TEST_F(ConsentEngineTest, RevocationTakesEffectImmediately) {
    auto id = Create(core::ConsentLevel::RESTRICTED);
    auto grant = engine_->grant(id, "office-a", "office-b", kHour, false);
    ASSERT_TRUE(grant.ok());
    EXPECT_TRUE(engine_->can_read(Node(id), "office-b"));

    EXPECT_TRUE(engine_->revoke(grant.value(), "office-b").is(core::Error::Code::FORBIDDEN));
    ASSERT_TRUE(engine_->revoke(grant.value(), "office-a").ok());
    EXPECT_FALSE(engine_->can_read(Node(id), "office-b"));
    EXPECT_TRUE(engine_->revoke(grant.value(), "office-a").is(core::Error::Code::NOT_FOUND));
}

TEST_F(ConsentEngineTest, GrantValidation) {
    auto id = Create(core::ConsentLevel::SHARED);
    EXPECT_TRUE(engine_->grant(id, "office-a", "office-b", 0, false).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(engine_->grant(id, "office-a", "", kHour, false).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(engine_->grant(id, "office-a", "office-a", kHour, false).is(core::Error::Code::INVALID_ARGUMENT));
    EXPECT_TRUE(engine_->grant(9999, "office-a", "office-b", kHour, false).is(core::Error::Code::NOT_FOUND));
    EXPECT_TRUE(engine_->grant(id, "office-c", "office-b", kHour, false).is(core::Error::Code::FORBIDDEN));
}

TEST_F(ConsentEngineTest, GrantsAreNotTransitive) {
    auto id = Create(core::ConsentLevel::SHARED);
    ASSERT_TRUE(engine_->grant(id, "office-a", "office-b", kHour, true).ok());
    EXPECT_TRUE(engine_->grant(id, "office-b", "office-c", kHour, false).is(core::Error::Code::FORBIDDEN));
    EXPECT_FALSE(engine_->can_read(Node(id), "office-c"));
}

TEST_F(ConsentEngineTest, GrantFromAnotherOwnerDoesNotCount) {
    auto id = Create(core::ConsentLevel::RESTRICTED);
    core::AccessGrant stray;
    stray.node_id = id;
    stray.granting_owner = "office-z";
    stray.receiving_owner = "office-b";
    stray.expires_at = clock_->now() + kHour;
    ASSERT_TRUE(store_->add_grant(stray).ok());
    EXPECT_FALSE(engine_->can_read(Node(id), "office-b"));
}

TEST_F(ConsentEngineTest, ListGrantsOwnerOnly) {
    auto id = Create(core::ConsentLevel::SHARED);
    auto first = engine_->grant(id, "office-a", "office-b", kHour, false).value();
    auto second = engine_->grant(id, "office-a", "office-c", kHour, true).value();

    auto grants = engine_->grants_for(id, "office-a");
    ASSERT_TRUE(grants.ok());
    ASSERT_EQ(grants.value().size(), 2u);
    EXPECT_EQ(grants.value()[0].id, first);
    EXPECT_EQ(grants.value()[1].id, second);
    EXPECT_EQ(grants.value()[0].expires_at, grants.value()[0].created_at + kHour);

    EXPECT_TRUE(engine_->grants_for(id, "office-b").is(core::Error::Code::FORBIDDEN));
    EXPECT_TRUE(engine_->grants_for(9999, "office-a").is(core::Error::Code::NOT_FOUND));
}

} // namespace
} // namespace consent
} // namespace engram
