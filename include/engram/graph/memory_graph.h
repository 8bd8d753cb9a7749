#ifndef ENGRAM_GRAPH_MEMORY_GRAPH_H_
#define ENGRAM_GRAPH_MEMORY_GRAPH_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engram/consent/consent_engine.h"
#include "engram/core/cancellation.h"
#include "engram/core/clock.h"
#include "engram/core/config.h"
#include "engram/core/result.h"
#include "engram/core/types.h"
#include "engram/hierarchy/aggregator.h"
#include "engram/hierarchy/summarizer.h"
#include "engram/index/embedder.h"
#include "engram/index/similarity_index.h"
#include "engram/storage/journal.h"
#include "engram/storage/node_store.h"

namespace engram {
namespace graph {

/**
 * @brief Pluggable collaborators; any left empty gets the built-in default
 */
struct GraphDependencies {
    std::shared_ptr<index::Embedder> embedder;         // HashingEmbedder
    std::shared_ptr<hierarchy::Summarizer> summarizer; // ConcatenatingSummarizer
    std::shared_ptr<const core::Clock> clock;          // SystemClock
};

struct CreateOptions {
    std::vector<std::string> tags;
    std::optional<core::Duration> ttl;  // level policy when unset
    std::optional<float> importance;    // configured default when unset
};

struct SearchOptions {
    std::vector<std::string> tags;               // keep nodes carrying any of these
    std::vector<core::OwnerId> owners;           // keep nodes of these owners
    std::optional<core::ConsentLevel> max_consent;
    core::CancellationToken cancel;
};

struct SearchHit {
    core::MemoryNode node;
    double score = 0.0;
};

struct Subgraph {
    std::vector<core::MemoryNode> nodes;
    std::vector<core::MemoryEdge> edges;
};

struct MaintenanceReport {
    size_t expired_nodes = 0;
    hierarchy::RollupReport rollups;
    bool checkpointed = false;
};

struct GraphStats {
    storage::StoreStats store;
    size_t indexed_nodes = 0;
    double average_access_count = 0.0;
};

/**
 * @brief Public entry point of the memory graph
 *
 * Every operation takes the identity of the calling owner and applies the
 * consent rules before returning data. NOT_FOUND, FORBIDDEN and
 * INVALID_ARGUMENT are ordinary results; STORAGE_UNAVAILABLE means the
 * journal could not be written and nothing was applied.
 *
 * Thread safe. The graph never schedules work itself; call
 * trigger_maintenance() periodically.
 */
class MemoryGraph {
public:
    /**
     * @brief Opens (and recovers) a graph
     *
     * With an empty config.data_dir the graph lives in memory only.
     */
    static core::Result<std::unique_ptr<MemoryGraph>> open(const core::GraphConfig& config,
                                                          GraphDependencies deps = GraphDependencies());

    ~MemoryGraph();

    MemoryGraph(const MemoryGraph&) = delete;
    MemoryGraph& operator=(const MemoryGraph&) = delete;

    core::Result<core::NodeId> create_memory(const core::OwnerId& owner,
                                             const std::string& content,
                                             core::ConsentLevel consent,
                                             const CreateOptions& options = CreateOptions());

    /**
     * @brief Reads a node and records the access
     * @return NOT_FOUND for missing or expired nodes, FORBIDDEN when the
     *         requester may not read it
     */
    core::Result<core::MemoryNode> read_memory(core::NodeId id, const core::OwnerId& requester);

    /**
     * @brief Similarity search filtered by consent
     *
     * The index is asked for k candidates; unreadable ones are dropped and
     * not replaced, so fewer than k hits may come back.
     */
    core::Result<std::vector<SearchHit>> search_memories(const core::SimilarityKey& query,
                                                         const core::OwnerId& requester,
                                                         size_t k, double min_score,
                                                         const SearchOptions& options = SearchOptions());
    core::Result<std::vector<SearchHit>> search_memories(const std::string& text,
                                                         const core::OwnerId& requester,
                                                         size_t k, double min_score,
                                                         const SearchOptions& options = SearchOptions());

    // Owner or holder of a modify grant.
    core::Result<void> update_consent(core::NodeId id, const core::OwnerId& requester,
                                      core::ConsentLevel consent);
    // Owner only.
    core::Result<void> update_ttl(core::NodeId id, const core::OwnerId& requester, core::Duration ttl);
    core::Result<void> update_importance(core::NodeId id, const core::OwnerId& requester, float importance);
    core::Result<void> delete_memory(core::NodeId id, const core::OwnerId& requester);

    core::Result<core::GrantId> grant_access(core::NodeId id,
                                             const core::OwnerId& granting_owner,
                                             const core::OwnerId& receiving_owner,
                                             core::Duration ttl,
                                             bool can_modify = false);
    core::Result<void> revoke_access(core::GrantId grant_id, const core::OwnerId& requester);
    core::Result<std::vector<core::AccessGrant>> list_grants(core::NodeId id, const core::OwnerId& requester) const;

    /**
     * @brief Adds a directed edge between two memories
     *
     * The requester must be able to read both ends and own at least one.
     */
    core::Result<core::EdgeId> link_memories(core::NodeId source, core::NodeId target,
                                             const std::string& relation, float weight,
                                             const core::OwnerId& requester);
    // Edge creator or owner of either end.
    core::Result<void> unlink_memories(core::EdgeId edge_id, const core::OwnerId& requester);
    core::Result<std::vector<core::MemoryNode>> neighbors(core::NodeId id, const core::OwnerId& requester,
                                                          const std::optional<std::string>& relation = std::nullopt) const;

    core::Result<std::vector<core::MemoryNode>> children_of(core::NodeId id, const core::OwnerId& requester) const;
    core::Result<std::optional<core::MemoryNode>> parent_of(core::NodeId id, const core::OwnerId& requester) const;

    /**
     * @brief Readable neighbourhood of a node up to depth hops over edges
     * and parent/child links
     */
    core::Result<Subgraph> subgraph(core::NodeId center, size_t depth, const core::OwnerId& requester) const;

    // Nodes of owner readable by requester, newest first.
    core::Result<std::vector<core::MemoryNode>> list_memories(const core::OwnerId& owner,
                                                              const core::OwnerId& requester) const;

    GraphStats stats() const;

    /**
     * @brief Expiry sweep, grant eviction, roll-ups, and a journal
     * checkpoint once the journal has grown past its threshold
     *
     * Safe to call concurrently with itself and with any other operation.
     */
    core::Result<MaintenanceReport> trigger_maintenance(const core::CancellationToken& cancel = core::CancellationToken());

    core::Result<void> checkpoint();
    core::Result<void> flush();

    const core::GraphConfig& config() const { return config_; }
    hierarchy::HierarchyAggregator& aggregator() { return *aggregator_; }

private:
    MemoryGraph(const core::GraphConfig& config, GraphDependencies deps,
                std::shared_ptr<storage::Journal> journal);

    core::Result<void> initialize();
    core::Result<core::MemoryNode> readable_node(core::NodeId id, const core::OwnerId& requester) const;
    bool keep_hit(const core::MemoryNode& node, const SearchOptions& options) const;

    core::GraphConfig config_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<index::Embedder> embedder_;
    std::shared_ptr<hierarchy::Summarizer> summarizer_;
    std::shared_ptr<storage::Journal> journal_;
    std::shared_ptr<storage::NodeStore> store_;
    std::shared_ptr<index::SimilarityIndex> index_;
    std::unique_ptr<consent::ConsentEngine> consent_;
    std::unique_ptr<hierarchy::HierarchyAggregator> aggregator_;
};

} // namespace graph
} // namespace engram

#endif // ENGRAM_GRAPH_MEMORY_GRAPH_H_
