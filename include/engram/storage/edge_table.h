#ifndef ENGRAM_STORAGE_EDGE_TABLE_H_
#define ENGRAM_STORAGE_EDGE_TABLE_H_

#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "engram/core/types.h"

namespace engram {
namespace storage {

/**
 * @brief Directed relations between memories, indexed both ways
 */
class EdgeTable {
public:
    void put(const core::MemoryEdge& edge);
    std::optional<core::MemoryEdge> erase(core::EdgeId id);
    std::optional<core::MemoryEdge> find(core::EdgeId id) const;

    std::vector<core::MemoryEdge> outgoing(core::NodeId node_id) const;
    std::vector<core::MemoryEdge> incoming(core::NodeId node_id) const;

    // Removes every edge touching the node, in either direction.
    std::vector<core::EdgeId> erase_node(core::NodeId node_id);

    void for_each(const std::function<void(const core::MemoryEdge&)>& fn) const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    absl::flat_hash_map<core::EdgeId, core::MemoryEdge> edges_;
    absl::flat_hash_map<core::NodeId, absl::flat_hash_set<core::EdgeId>> out_;
    absl::flat_hash_map<core::NodeId, absl::flat_hash_set<core::EdgeId>> in_;

    void erase_locked(const core::MemoryEdge& edge);
    std::vector<core::MemoryEdge> collect_locked(
        const absl::flat_hash_map<core::NodeId, absl::flat_hash_set<core::EdgeId>>& adjacency,
        core::NodeId node_id) const;
};

} // namespace storage
} // namespace engram

#endif // ENGRAM_STORAGE_EDGE_TABLE_H_
