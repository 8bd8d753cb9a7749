#ifndef ENGRAM_INDEX_SIMILARITY_INDEX_H_
#define ENGRAM_INDEX_SIMILARITY_INDEX_H_

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "engram/core/cancellation.h"
#include "engram/core/result.h"
#include "engram/core/types.h"

namespace engram {
namespace index {

struct IndexStats {
    size_t entries;
    size_t searches;
};

/**
 * @brief Sharded cosine-similarity index over node similarity keys
 *
 * Consent agnostic: it returns candidate ids and the caller filters them.
 * Each shard has its own reader/writer lock and searches scatter over the
 * shards in parallel, so an update concurrent with a search may or may not
 * be visible to it.
 */
class SimilarityIndex {
public:
    SimilarityIndex(size_t num_shards, size_t dimensions);

    SimilarityIndex(const SimilarityIndex&) = delete;
    SimilarityIndex& operator=(const SimilarityIndex&) = delete;

    /**
     * @brief Adds a node. INVALID_ARGUMENT when the key width is wrong.
     */
    core::Result<void> index(core::NodeId id, const core::SimilarityKey& key,
                             float importance, core::Timestamp created_at);

    bool remove(core::NodeId id);
    bool update_importance(core::NodeId id, float importance);
    bool contains(core::NodeId id) const;

    /**
     * @brief Up to k nodes scoring at least min_score
     *
     * Ordered by score, then importance, then recency (all descending), then
     * by id. Returns CANCELLED if the token fires while shards are scanned.
     */
    core::Result<std::vector<core::ScoredNode>> search(
        const core::SimilarityKey& query, size_t k, double min_score,
        const core::CancellationToken& cancel = core::CancellationToken()) const;

    size_t size() const { return total_entries_.load(); }
    size_t dimensions() const { return dimensions_; }
    IndexStats stats() const;

    static double cosine(const core::SimilarityKey& a, const core::SimilarityKey& b);

private:
    struct Entry {
        core::SimilarityKey key;
        double norm;
        float importance;
        core::Timestamp created_at;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<core::NodeId, Entry> entries;
    };

    struct Hit {
        core::NodeId id;
        double score;
        float importance;
        core::Timestamp created_at;
    };

    const size_t num_shards_;
    const size_t dimensions_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<size_t> total_entries_{0};
    mutable std::atomic<size_t> total_searches_{0};

    Shard& shard_for(core::NodeId id) const { return *shards_[id % num_shards_]; }
    static bool ranks_before(const Hit& a, const Hit& b);
};

} // namespace index
} // namespace engram

#endif // ENGRAM_INDEX_SIMILARITY_INDEX_H_
