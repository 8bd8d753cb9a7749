#ifndef ENGRAM_HIERARCHY_AGGREGATOR_H_
#define ENGRAM_HIERARCHY_AGGREGATOR_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <absl/container/flat_hash_map.h>

#include "engram/core/cancellation.h"
#include "engram/core/config.h"
#include "engram/core/result.h"
#include "engram/core/types.h"
#include "engram/hierarchy/summarizer.h"
#include "engram/index/embedder.h"
#include "engram/index/similarity_index.h"
#include "engram/storage/node_store.h"

namespace engram {
namespace hierarchy {

struct RollupReport {
    size_t summaries_created = 0;
    size_t timeouts = 0;
    size_t failures = 0;
    bool cancelled = false;

    void merge(const RollupReport& other);
};

/**
 * @brief Rolls fine-grained nodes up into coarser summary nodes
 *
 * ATOMIC nodes roll into DAILY summaries, DAILY into WEEKLY and WEEKLY into
 * MONTHLY. Sources are never deleted; each gains the summary as parent and
 * so stops counting towards the next trigger. Roll-ups of one
 * (owner, level) pair are serialized; different pairs run in parallel.
 */
class HierarchyAggregator {
public:
    HierarchyAggregator(std::shared_ptr<storage::NodeStore> store,
                        std::shared_ptr<index::SimilarityIndex> index,
                        std::shared_ptr<index::Embedder> embedder,
                        std::shared_ptr<Summarizer> summarizer,
                        const core::RollupConfig& config);

    /**
     * @brief True when the owner has at least the threshold of un-rolled,
     * unexpired nodes at the level. Always false for MONTHLY.
     */
    bool check_rollup_trigger(const core::OwnerId& owner, core::Level level) const;

    /**
     * @brief Creates one summary at the next coarser level if the trigger fires
     *
     * @return The summary id, nullopt when the trigger did not fire,
     *         MAINTENANCE_TIMEOUT when the summarizer overran its deadline,
     *         CANCELLED when the token fired. Nothing is committed on error.
     */
    core::Result<std::optional<core::NodeId>> rollup(
        const core::OwnerId& owner, core::Level level,
        const core::CancellationToken& cancel = core::CancellationToken());

    /**
     * @brief Cascades roll-ups for every owner, owners in parallel
     *
     * Fails only on STORAGE_UNAVAILABLE; timeouts and other per-pair
     * failures are counted in the report and retried next pass.
     */
    core::Result<RollupReport> run(const core::CancellationToken& cancel = core::CancellationToken());

    // Summarizer calls still running, including ones abandoned on timeout.
    size_t summarizer_calls_in_flight() const { return in_flight_->load(); }

private:
    // Serializes roll-ups of one (owner, level) pair. At most one summarizer
    // call per pair is ever outstanding; while an abandoned one is still
    // running the pair reports MAINTENANCE_TIMEOUT without starting another.
    struct TupleState {
        std::mutex mutex;
        std::atomic<bool> summarizing{false};
    };

    std::shared_ptr<storage::NodeStore> store_;
    std::shared_ptr<index::SimilarityIndex> index_;
    std::shared_ptr<index::Embedder> embedder_;
    std::shared_ptr<Summarizer> summarizer_;
    core::RollupConfig config_;

    std::shared_ptr<std::atomic<size_t>> in_flight_;

    std::mutex locks_mutex_;
    absl::flat_hash_map<std::string, std::shared_ptr<TupleState>> tuples_;

    std::shared_ptr<TupleState> tuple_state(const core::OwnerId& owner, core::Level level);
    std::vector<core::MemoryNode> select_sources(std::vector<core::MemoryNode> candidates,
                                                 size_t count) const;
    core::Result<std::string> summarize_with_deadline(const SummaryRequest& request,
                                                      const std::shared_ptr<TupleState>& tuple,
                                                      const core::CancellationToken& cancel);
    RollupReport run_owner(const core::OwnerId& owner, const core::CancellationToken& cancel,
                           std::optional<std::string>& storage_error);
};

} // namespace hierarchy
} // namespace engram

#endif // ENGRAM_HIERARCHY_AGGREGATOR_H_
