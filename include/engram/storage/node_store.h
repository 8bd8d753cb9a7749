#ifndef ENGRAM_STORAGE_NODE_STORE_H_
#define ENGRAM_STORAGE_NODE_STORE_H_

#include <array>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "engram/core/clock.h"
#include "engram/core/config.h"
#include "engram/core/result.h"
#include "engram/core/types.h"
#include "engram/storage/edge_table.h"
#include "engram/storage/grant_table.h"
#include "engram/storage/journal.h"

namespace engram {
namespace storage {

/**
 * @brief Fields supplied by the caller when a node is created
 *
 * ttl and importance fall back to the level policy and the configured
 * default when unset.
 */
struct NodeDraft {
    core::OwnerId owner;
    core::Level level = core::Level::ATOMIC;
    std::string content;
    std::vector<std::string> tags;
    core::SimilarityKey similarity_key;
    core::ConsentLevel consent = core::ConsentLevel::PRIVATE;
    std::optional<core::Duration> ttl;
    std::optional<float> importance;
};

struct StoreStats {
    size_t total_nodes = 0;
    std::array<size_t, core::kNumLevels> nodes_per_level{};
    std::map<core::OwnerId, size_t> nodes_per_owner;
    std::array<size_t, 4> nodes_per_consent{};
    std::map<std::string, size_t> nodes_per_tag;
    size_t total_grants = 0;
    size_t total_edges = 0;
    uint64_t total_accesses = 0;
};

// Called after a node left the store through expiry or deletion.
using RemovalListener = std::function<void(const core::MemoryNode&)>;

/**
 * @brief Authoritative, concurrent store of nodes, grants and edges
 *
 * Nodes live in hash shards, each node behind its own reader/writer lock,
 * so operations on distinct nodes never serialize on a global lock.
 * Access bookkeeping uses atomics and never takes a node's write lock.
 *
 * With a journal attached every mutation is logged before it is applied;
 * without one the store is purely in memory. The store enforces ownership
 * for owner-only mutations but knows nothing about grants or consent; that
 * is the consent engine's job.
 */
class NodeStore {
public:
    NodeStore(const core::GraphConfig& config,
              std::shared_ptr<const core::Clock> clock,
              std::shared_ptr<Journal> journal = nullptr);

    NodeStore(const NodeStore&) = delete;
    NodeStore& operator=(const NodeStore&) = delete;

    /**
     * @brief Rebuilds state from the journal. Call once before use.
     */
    core::Result<void> recover();

    /**
     * @brief Creates a node and returns its fresh id
     *
     * Fails with INVALID_ARGUMENT on an empty owner, a non-positive ttl or
     * an importance outside the configured range.
     */
    core::Result<core::NodeId> create(const NodeDraft& draft);

    /**
     * @brief Returns a copy of a live node
     *
     * Expired nodes are reported NOT_FOUND even before the sweep removes them.
     */
    core::Result<core::MemoryNode> get(core::NodeId id) const;

    // Raw lookup ignoring expiry, for callers that decide themselves.
    std::optional<core::MemoryNode> find(core::NodeId id) const;

    /**
     * @brief Records one access: bumps access_count and last_accessed_at
     */
    core::Result<void> touch(core::NodeId id);

    // Owner-only mutations. FORBIDDEN when requester is not the owner.
    core::Result<void> update_consent(core::NodeId id, const core::OwnerId& requester,
                                      core::ConsentLevel consent);
    core::Result<void> update_ttl(core::NodeId id, const core::OwnerId& requester, core::Duration ttl);
    core::Result<void> update_importance(core::NodeId id, const core::OwnerId& requester, float importance);

    // Unchecked primitives; authorization happens in the layer above.
    core::Result<void> set_consent(core::NodeId id, core::ConsentLevel consent);
    core::Result<void> set_ttl(core::NodeId id, core::Duration ttl);
    core::Result<void> set_importance(core::NodeId id, float importance);

    /**
     * @brief Deletes a node with its grants and edges. Owner only.
     * @return The removed node
     */
    core::Result<core::MemoryNode> erase(core::NodeId id, const core::OwnerId& requester);

    /**
     * @brief Removes every expired node and every expired grant
     * @return Number of nodes removed
     */
    core::Result<size_t> delete_expired();

    /**
     * @brief Live nodes of one owner at one level that have no parent yet,
     * ordered by created_at then id
     */
    std::vector<core::MemoryNode> unrolled(const core::OwnerId& owner, core::Level level) const;
    size_t count_unrolled(const core::OwnerId& owner, core::Level level) const;

    std::vector<core::OwnerId> owners() const;
    std::vector<core::NodeId> ids_of(const core::OwnerId& owner) const;

    /**
     * @brief Atomically inserts a summary node and parents its children
     *
     * Every child must be live, owned by the summary's owner, one level finer
     * than the summary and still without a parent. If any check fails
     * nothing is written.
     */
    core::Result<core::NodeId> commit_summary(const NodeDraft& draft,
                                              const std::vector<core::NodeId>& children);

    // Grants. add_grant assigns the id.
    core::Result<core::GrantId> add_grant(core::AccessGrant grant);
    core::Result<core::AccessGrant> remove_grant(core::GrantId id);
    const GrantTable& grants() const { return grants_; }
    core::Result<size_t> evict_expired_grants();

    // Edges. add_edge assigns the id.
    core::Result<core::EdgeId> add_edge(core::MemoryEdge edge);
    core::Result<core::MemoryEdge> remove_edge(core::EdgeId id);
    const EdgeTable& edges() const { return edges_; }

    void add_removal_listener(RemovalListener listener);

    /**
     * @brief Snapshots current state and truncates the journal
     */
    core::Result<void> checkpoint();
    bool checkpoint_due() const;
    core::Result<void> flush();

    // Visits live nodes (copies); expired ones are skipped.
    void for_each(const std::function<void(const core::MemoryNode&)>& fn) const;
    size_t size() const { return node_count_.load(); }
    StoreStats stats() const;

    std::shared_ptr<const core::Clock> clock() const { return clock_; }
    const core::GraphConfig& config() const { return config_; }

private:
    struct NodeEntry {
        mutable std::shared_mutex mutex;
        core::MemoryNode node;  // counters below are authoritative
        std::atomic<uint64_t> access_count{0};
        std::atomic<core::Timestamp> last_accessed_at{0};
        bool removed = false;   // guarded by mutex

        core::MemoryNode snapshot() const;
    };
    using EntryPtr = std::shared_ptr<NodeEntry>;

    struct Shard {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<core::NodeId, EntryPtr> nodes;
    };

    using LevelSets = std::array<absl::flat_hash_set<core::NodeId>, core::kNumLevels>;

    core::GraphConfig config_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<Journal> journal_;

    std::vector<std::unique_ptr<Shard>> shards_;
    GrantTable grants_;
    EdgeTable edges_;

    mutable std::shared_mutex owners_mutex_;
    absl::flat_hash_map<core::OwnerId, LevelSets> owner_index_;

    // Held shared by every log-then-apply, exclusively while a checkpoint
    // switches segments.
    mutable std::shared_mutex journal_gate_;

    std::mutex listeners_mutex_;
    std::vector<RemovalListener> listeners_;

    std::atomic<core::NodeId> next_node_id_{1};
    std::atomic<core::GrantId> next_grant_id_{1};
    std::atomic<core::EdgeId> next_edge_id_{1};
    std::atomic<size_t> node_count_{0};

    Shard& shard_for(core::NodeId id) const { return *shards_[id % shards_.size()]; }
    EntryPtr lookup(core::NodeId id) const;

    core::Result<void> log(const JournalRecord& record, bool flush_now = true);
    bool importance_in_range(float importance) const;
    core::Result<void> validate_draft(const NodeDraft& draft) const;
    core::MemoryNode materialize(const NodeDraft& draft, core::NodeId id) const;

    void insert_entry(const core::MemoryNode& node);

    // Removes a node with its grants and edges. With expired_at set the node
    // is only removed if it is expired at that time. nullopt when nothing
    // was removed.
    core::Result<std::optional<core::MemoryNode>> remove_node(core::NodeId id,
                                                              std::optional<core::Timestamp> expired_at,
                                                              bool journaled);
    void apply(const JournalRecord& record);
    void notify_removed(const core::MemoryNode& node);

    template<typename Mutator>
    core::Result<void> mutate(core::NodeId id, const core::OwnerId* requester,
                              const JournalRecord& record, Mutator&& mutator);
};

} // namespace storage
} // namespace engram

#endif // ENGRAM_STORAGE_NODE_STORE_H_
