#include "engram/storage/edge_table.h"

#include <algorithm>
#include <mutex>

namespace engram {
namespace storage {

void EdgeTable::put(const core::MemoryEdge& edge) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = edges_.find(edge.id);
    if (it != edges_.end()) {
        erase_locked(it->second);
    }
    edges_[edge.id] = edge;
    out_[edge.source].insert(edge.id);
    in_[edge.target].insert(edge.id);
}

std::optional<core::MemoryEdge> EdgeTable::erase(core::EdgeId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return std::nullopt;
    }
    core::MemoryEdge edge = it->second;
    erase_locked(edge);
    return edge;
}

std::optional<core::MemoryEdge> EdgeTable::find(core::EdgeId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::MemoryEdge> EdgeTable::outgoing(core::NodeId node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collect_locked(out_, node_id);
}

std::vector<core::MemoryEdge> EdgeTable::incoming(core::NodeId node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collect_locked(in_, node_id);
}

std::vector<core::EdgeId> EdgeTable::erase_node(core::NodeId node_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::EdgeId> ids;
    for (const auto* adjacency : {&out_, &in_}) {
        auto it = adjacency->find(node_id);
        if (it != adjacency->end()) {
            ids.insert(ids.end(), it->second.begin(), it->second.end());
        }
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    for (auto id : ids) {
        auto it = edges_.find(id);
        if (it != edges_.end()) {
            core::MemoryEdge edge = it->second;
            erase_locked(edge);
        }
    }
    return ids;
}

void EdgeTable::for_each(const std::function<void(const core::MemoryEdge&)>& fn) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : edges_) {
        fn(entry.second);
    }
}

size_t EdgeTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return edges_.size();
}

void EdgeTable::erase_locked(const core::MemoryEdge& edge) {
    const core::EdgeId id = edge.id;
    const core::NodeId source = edge.source;
    const core::NodeId target = edge.target;
    auto drop = [&](absl::flat_hash_map<core::NodeId, absl::flat_hash_set<core::EdgeId>>& adjacency,
                    core::NodeId node_id) {
        auto it = adjacency.find(node_id);
        if (it == adjacency.end()) {
            return;
        }
        it->second.erase(id);
        if (it->second.empty()) {
            adjacency.erase(it);
        }
    };
    drop(out_, source);
    drop(in_, target);
    edges_.erase(id);
}

std::vector<core::MemoryEdge> EdgeTable::collect_locked(
    const absl::flat_hash_map<core::NodeId, absl::flat_hash_set<core::EdgeId>>& adjacency,
    core::NodeId node_id) const {
    std::vector<core::MemoryEdge> result;
    auto it = adjacency.find(node_id);
    if (it == adjacency.end()) {
        return result;
    }
    for (auto id : it->second) {
        auto edge_it = edges_.find(id);
        if (edge_it != edges_.end()) {
            result.push_back(edge_it->second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const core::MemoryEdge& a, const core::MemoryEdge& b) { return a.id < b.id; });
    return result;
}

} // namespace storage
} // namespace engram
