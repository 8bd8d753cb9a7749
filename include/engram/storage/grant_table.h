#ifndef ENGRAM_STORAGE_GRANT_TABLE_H_
#define ENGRAM_STORAGE_GRANT_TABLE_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "engram/core/types.h"

namespace engram {
namespace storage {

/**
 * @brief Concurrent table of access grants keyed by node
 *
 * Each node has its own grant list with its own reader/writer lock, so
 * consent evaluation on one node never waits for grant changes on another.
 * The table only stores; it never decides. Expired grants stay visible
 * here until evicted and callers must check expires_at themselves.
 */
class GrantTable {
public:
    explicit GrantTable(size_t num_shards = 16);

    void put(const core::AccessGrant& grant);
    std::optional<core::AccessGrant> erase(core::GrantId id);
    std::optional<core::AccessGrant> find(core::GrantId id) const;

    std::vector<core::AccessGrant> grants_for(core::NodeId node_id) const;

    // True when pred holds for any grant of the node. Evaluated under the
    // list's read lock.
    bool any_of(core::NodeId node_id, const std::function<bool(const core::AccessGrant&)>& pred) const;

    // Drops every grant of a node; returns how many were removed.
    size_t erase_node(core::NodeId node_id);

    std::vector<core::GrantId> expired(core::Timestamp now) const;
    void for_each(const std::function<void(const core::AccessGrant&)>& fn) const;
    size_t size() const { return count_.load(); }

private:
    struct GrantList {
        mutable std::shared_mutex mutex;
        std::vector<core::AccessGrant> grants;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<core::NodeId, std::shared_ptr<GrantList>> lists;
    };

    const size_t num_shards_;
    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::shared_mutex id_mutex_;
    absl::flat_hash_map<core::GrantId, core::NodeId> node_of_grant_;

    std::atomic<size_t> count_{0};

    Shard& shard_for(core::NodeId node_id) const { return *shards_[node_id % num_shards_]; }
    std::shared_ptr<GrantList> list_for(core::NodeId node_id) const;
};

} // namespace storage
} // namespace engram

#endif // ENGRAM_STORAGE_GRANT_TABLE_H_
