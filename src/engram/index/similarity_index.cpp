#include "engram/index/similarity_index.h"

#include <algorithm>
#include <cmath>
#include <mutex>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace engram {
namespace index {

namespace {

double norm_of(const core::SimilarityKey& key) {
    double sum = 0.0;
    for (float v : key) {
        sum += static_cast<double>(v) * v;
    }
    return std::sqrt(sum);
}

double dot(const core::SimilarityKey& a, const core::SimilarityKey& b) {
    double sum = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return sum;
}

// Cancellation is polled every this many entries within a shard
constexpr size_t kCancelCheckInterval = 256;

} // namespace

SimilarityIndex::SimilarityIndex(size_t num_shards, size_t dimensions)
    : num_shards_(num_shards == 0 ? 1 : num_shards),
      dimensions_(dimensions) {
    shards_.reserve(num_shards_);
    for (size_t i = 0; i < num_shards_; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

double SimilarityIndex::cosine(const core::SimilarityKey& a, const core::SimilarityKey& b) {
    const double na = norm_of(a);
    const double nb = norm_of(b);
    if (na == 0.0 || nb == 0.0) {
        return 0.0;
    }
    return dot(a, b) / (na * nb);
}

bool SimilarityIndex::ranks_before(const Hit& a, const Hit& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.importance != b.importance) {
        return a.importance > b.importance;
    }
    if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
    }
    return a.id < b.id;
}

core::Result<void> SimilarityIndex::index(core::NodeId id, const core::SimilarityKey& key,
                                          float importance, core::Timestamp created_at) {
    if (key.size() != dimensions_) {
        return core::Result<void>::error("similarity key has " + std::to_string(key.size()) +
                                         " dimensions, expected " + std::to_string(dimensions_),
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    Shard& shard = shard_for(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto result = shard.entries.insert_or_assign(id, Entry{key, norm_of(key), importance, created_at});
    if (result.second) {
        total_entries_.fetch_add(1);
    }
    return core::Result<void>();
}

bool SimilarityIndex::remove(core::NodeId id) {
    Shard& shard = shard_for(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    if (shard.entries.erase(id) == 0) {
        return false;
    }
    total_entries_.fetch_sub(1);
    return true;
}

bool SimilarityIndex::update_importance(core::NodeId id, float importance) {
    Shard& shard = shard_for(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        return false;
    }
    it->second.importance = importance;
    return true;
}

bool SimilarityIndex::contains(core::NodeId id) const {
    Shard& shard = shard_for(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.contains(id);
}

core::Result<std::vector<core::ScoredNode>> SimilarityIndex::search(
    const core::SimilarityKey& query, size_t k, double min_score,
    const core::CancellationToken& cancel) const {
    using R = core::Result<std::vector<core::ScoredNode>>;

    if (query.size() != dimensions_) {
        return R::error("query has " + std::to_string(query.size()) + " dimensions, expected " +
                        std::to_string(dimensions_), core::Error::Code::INVALID_ARGUMENT);
    }
    total_searches_.fetch_add(1, std::memory_order_relaxed);
    if (k == 0) {
        return R(std::vector<core::ScoredNode>());
    }

    const double query_norm = norm_of(query);
    if (query_norm == 0.0) {
        return R(std::vector<core::ScoredNode>());
    }

    // Parallel scatter-gather across shards; each keeps its own top k
    std::vector<std::vector<Hit>> shard_hits(num_shards_);
    tbb::parallel_for(tbb::blocked_range<size_t>(0, num_shards_),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i < range.end(); ++i) {
                if (cancel.is_cancelled()) {
                    return;
                }
                auto& hits = shard_hits[i];
                const Shard& shard = *shards_[i];
                std::shared_lock<std::shared_mutex> lock(shard.mutex);
                size_t scanned = 0;
                for (const auto& kv : shard.entries) {
                    if (++scanned % kCancelCheckInterval == 0 && cancel.is_cancelled()) {
                        return;
                    }
                    const Entry& entry = kv.second;
                    if (entry.norm == 0.0) {
                        continue;
                    }
                    const double score = dot(query, entry.key) / (query_norm * entry.norm);
                    if (score >= min_score) {
                        hits.push_back(Hit{kv.first, score, entry.importance, entry.created_at});
                    }
                }
                if (hits.size() > k) {
                    std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), ranks_before);
                    hits.resize(k);
                }
            }
        });

    if (cancel.is_cancelled()) {
        return R::error("search cancelled", core::Error::Code::CANCELLED);
    }

    // Gather results
    std::vector<Hit> merged;
    for (auto& hits : shard_hits) {
        merged.insert(merged.end(), hits.begin(), hits.end());
    }
    std::sort(merged.begin(), merged.end(), ranks_before);
    if (merged.size() > k) {
        merged.resize(k);
    }

    std::vector<core::ScoredNode> result;
    result.reserve(merged.size());
    for (const auto& hit : merged) {
        result.push_back(core::ScoredNode{hit.id, hit.score});
    }
    return R(std::move(result));
}

IndexStats SimilarityIndex::stats() const {
    return IndexStats{
        total_entries_.load(),
        total_searches_.load()
    };
}

} // namespace index
} // namespace engram
