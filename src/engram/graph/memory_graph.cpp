#include "engram/graph/memory_graph.h"

#include <algorithm>
#include <deque>
#include <filesystem>

#include <absl/container/flat_hash_set.h>

#include "engram/common/logger.h"
#include "engram/core/error.h"

namespace engram {
namespace graph {

namespace {

core::Result<void> require_principal(const core::OwnerId& principal) {
    if (principal.empty()) {
        return core::Result<void>::error("owner identifier must not be empty",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

core::Result<void> forbidden(const std::string& what) {
    return core::Result<void>::error(what, core::Error::Code::FORBIDDEN);
}

bool newest_first(const core::MemoryNode& a, const core::MemoryNode& b) {
    if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
    }
    return a.id > b.id;
}

} // namespace

core::Result<std::unique_ptr<MemoryGraph>> MemoryGraph::open(const core::GraphConfig& config,
                                                             GraphDependencies deps) {
    using R = core::Result<std::unique_ptr<MemoryGraph>>;

    auto valid = config.validate();
    if (!valid.ok()) {
        return R::error_from(valid);
    }

    std::shared_ptr<storage::Journal> journal;
    if (!config.data_dir.empty()) {
        try {
            const auto journal_dir = std::filesystem::path(config.data_dir) / "journal";
            journal = std::make_shared<storage::Journal>(journal_dir.string(), config.journal);
        } catch (const core::Error& e) {
            ENGRAM_ERROR("Cannot open journal in {}: {}", config.data_dir, e.what());
            return R(e);
        } catch (const std::exception& e) {
            ENGRAM_ERROR("Cannot open journal in {}: {}", config.data_dir, e.what());
            return R::error(std::string("cannot open journal: ") + e.what(),
                            core::Error::Code::STORAGE_UNAVAILABLE);
        }
    }

    std::unique_ptr<MemoryGraph> graph(new MemoryGraph(config, std::move(deps), std::move(journal)));
    auto initialized = graph->initialize();
    if (!initialized.ok()) {
        return R::error_from(initialized);
    }
    return R(std::move(graph));
}

MemoryGraph::MemoryGraph(const core::GraphConfig& config, GraphDependencies deps,
                         std::shared_ptr<storage::Journal> journal)
    : config_(config),
      clock_(deps.clock ? std::move(deps.clock) : std::make_shared<core::SystemClock>()),
      embedder_(deps.embedder ? std::move(deps.embedder)
                              : std::make_shared<index::HashingEmbedder>(config.index.dimensions)),
      summarizer_(deps.summarizer ? std::move(deps.summarizer)
                                  : std::make_shared<hierarchy::ConcatenatingSummarizer>(
                                        config.rollup.max_summary_chars)),
      journal_(std::move(journal)) {
    store_ = std::make_shared<storage::NodeStore>(config_, clock_, journal_);
    index_ = std::make_shared<index::SimilarityIndex>(config_.index.num_shards, embedder_->dimensions());
    consent_ = std::make_unique<consent::ConsentEngine>(store_);
    aggregator_ = std::make_unique<hierarchy::HierarchyAggregator>(store_, index_, embedder_, summarizer_,
                                                                   config_.rollup);
}

MemoryGraph::~MemoryGraph() {
    auto flushed = flush();
    if (!flushed.ok()) {
        ENGRAM_ERROR("Final journal flush failed: {}", flushed.error());
    }
}

core::Result<void> MemoryGraph::initialize() {
    auto recovered = store_->recover();
    if (!recovered.ok()) {
        return recovered;
    }

    // Nodes that expired while the graph was closed
    auto swept = store_->delete_expired();
    if (!swept.ok()) {
        return core::Result<void>::error_from(swept);
    }

    size_t skipped = 0;
    store_->for_each([this, &skipped](const core::MemoryNode& node) {
        auto indexed = index_->index(node.id, node.similarity_key, node.importance, node.created_at);
        if (!indexed.ok()) {
            ++skipped;
        }
    });
    if (skipped > 0) {
        ENGRAM_WARN("{} recovered nodes have keys of the wrong width and are not searchable", skipped);
    }

    auto index = index_;
    store_->add_removal_listener([index](const core::MemoryNode& node) { index->remove(node.id); });

    ENGRAM_INFO("Memory graph open: {} nodes, {} indexed, {}", store_->size(), index_->size(),
                journal_ ? "journal at " + journal_->dir() : std::string("in memory"));
    return core::Result<void>();
}

core::Result<core::NodeId> MemoryGraph::create_memory(const core::OwnerId& owner,
                                                      const std::string& content,
                                                      core::ConsentLevel consent,
                                                      const CreateOptions& options) {
    using R = core::Result<core::NodeId>;
    auto principal = require_principal(owner);
    if (!principal.ok()) {
        return R::error_from(principal);
    }

    storage::NodeDraft draft;
    draft.owner = owner;
    draft.level = core::Level::ATOMIC;
    draft.content = content;
    draft.tags = options.tags;
    draft.consent = consent;
    draft.ttl = options.ttl;
    draft.importance = options.importance;
    draft.similarity_key = embedder_->embed(content, options.tags);
    if (draft.similarity_key.size() != index_->dimensions()) {
        return R::error("embedder produced a key of the wrong width", core::Error::Code::INTERNAL);
    }

    auto created = store_->create(draft);
    if (!created.ok()) {
        return created;
    }
    const core::NodeId id = created.value();

    auto node = store_->find(id);
    if (node) {
        auto indexed = index_->index(id, node->similarity_key, node->importance, node->created_at);
        if (!indexed.ok()) {
            return R::error_from(indexed);
        }
        // A sweep or delete may have run its removal listener before the entry existed.
        if (!store_->find(id)) {
            index_->remove(id);
        }
    }
    return id;
}

core::Result<core::MemoryNode> MemoryGraph::readable_node(core::NodeId id, const core::OwnerId& requester) const {
    using R = core::Result<core::MemoryNode>;
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return R::error_from(principal);
    }
    auto node = store_->get(id);
    if (!node.ok()) {
        return node;
    }
    if (!consent_->can_read(node.value(), requester)) {
        ENGRAM_DEBUG("Read of node {} denied to {}", id, requester);
        return R::error("node " + std::to_string(id) + " is not readable by " + requester,
                        core::Error::Code::FORBIDDEN);
    }
    return node;
}

core::Result<core::MemoryNode> MemoryGraph::read_memory(core::NodeId id, const core::OwnerId& requester) {
    using R = core::Result<core::MemoryNode>;
    auto node = readable_node(id, requester);
    if (!node.ok()) {
        return node;
    }
    auto touched = store_->touch(id);
    if (!touched.ok()) {
        return R::error_from(touched);
    }
    core::MemoryNode result = node.take_value();
    result.access_count += 1;
    result.last_accessed_at = std::max(result.last_accessed_at, clock_->now());
    return result;
}

bool MemoryGraph::keep_hit(const core::MemoryNode& node, const SearchOptions& options) const {
    if (!options.owners.empty() &&
        std::find(options.owners.begin(), options.owners.end(), node.owner) == options.owners.end()) {
        return false;
    }
    if (options.max_consent && static_cast<uint8_t>(node.consent) > static_cast<uint8_t>(*options.max_consent)) {
        return false;
    }
    if (!options.tags.empty() &&
        std::none_of(options.tags.begin(), options.tags.end(),
                     [&node](const std::string& tag) { return node.has_tag(tag); })) {
        return false;
    }
    return true;
}

core::Result<std::vector<SearchHit>> MemoryGraph::search_memories(const core::SimilarityKey& query,
                                                                  const core::OwnerId& requester,
                                                                  size_t k, double min_score,
                                                                  const SearchOptions& options) {
    using R = core::Result<std::vector<SearchHit>>;
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return R::error_from(principal);
    }

    auto candidates = index_->search(query, k, min_score, options.cancel);
    if (!candidates.ok()) {
        return R::error_from(candidates);
    }

    std::vector<SearchHit> hits;
    for (const auto& candidate : candidates.value()) {
        auto node = store_->get(candidate.node_id);
        if (!node.ok()) {
            continue;
        }
        // Forbidden and missing look the same here
        if (!consent_->can_read(node.value(), requester) || !keep_hit(node.value(), options)) {
            continue;
        }
        auto touched = store_->touch(candidate.node_id);
        if (touched.is(core::Error::Code::NOT_FOUND)) {
            continue;
        }
        if (!touched.ok()) {
            return R::error_from(touched);
        }
        SearchHit hit;
        hit.node = node.take_value();
        hit.node.access_count += 1;
        hit.score = candidate.score;
        hits.push_back(std::move(hit));
    }
    return hits;
}

core::Result<std::vector<SearchHit>> MemoryGraph::search_memories(const std::string& text,
                                                                  const core::OwnerId& requester,
                                                                  size_t k, double min_score,
                                                                  const SearchOptions& options) {
    return search_memories(embedder_->embed(text, {}), requester, k, min_score, options);
}

core::Result<void> MemoryGraph::update_consent(core::NodeId id, const core::OwnerId& requester,
                                               core::ConsentLevel consent) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    auto node = store_->get(id);
    if (!node.ok()) {
        return core::Result<void>::error_from(node);
    }
    if (!consent_->can_modify(node.value(), requester)) {
        ENGRAM_DEBUG("Consent change on node {} denied to {}", id, requester);
        return forbidden("node " + std::to_string(id) + " is not modifiable by " + requester);
    }
    return store_->set_consent(id, consent);
}

core::Result<void> MemoryGraph::update_ttl(core::NodeId id, const core::OwnerId& requester, core::Duration ttl) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    return store_->update_ttl(id, requester, ttl);
}

core::Result<void> MemoryGraph::update_importance(core::NodeId id, const core::OwnerId& requester,
                                                  float importance) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    auto updated = store_->update_importance(id, requester, importance);
    if (updated.ok()) {
        index_->update_importance(id, importance);
    }
    return updated;
}

core::Result<void> MemoryGraph::delete_memory(core::NodeId id, const core::OwnerId& requester) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    auto erased = store_->erase(id, requester);
    if (!erased.ok()) {
        return core::Result<void>::error_from(erased);
    }
    ENGRAM_DEBUG("Node {} deleted by {}", id, requester);
    return core::Result<void>();
}

core::Result<core::GrantId> MemoryGraph::grant_access(core::NodeId id,
                                                      const core::OwnerId& granting_owner,
                                                      const core::OwnerId& receiving_owner,
                                                      core::Duration ttl,
                                                      bool can_modify) {
    auto principal = require_principal(granting_owner);
    if (!principal.ok()) {
        return core::Result<core::GrantId>::error_from(principal);
    }
    auto node = store_->get(id);
    if (!node.ok()) {
        return core::Result<core::GrantId>::error_from(node);
    }
    return consent_->grant(id, granting_owner, receiving_owner, ttl, can_modify);
}

core::Result<void> MemoryGraph::revoke_access(core::GrantId grant_id, const core::OwnerId& requester) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    return consent_->revoke(grant_id, requester);
}

core::Result<std::vector<core::AccessGrant>> MemoryGraph::list_grants(core::NodeId id,
                                                                      const core::OwnerId& requester) const {
    return consent_->grants_for(id, requester);
}

core::Result<core::EdgeId> MemoryGraph::link_memories(core::NodeId source, core::NodeId target,
                                                      const std::string& relation, float weight,
                                                      const core::OwnerId& requester) {
    using R = core::Result<core::EdgeId>;
    if (relation.empty()) {
        return R::error("relation must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (source == target) {
        return R::error("cannot link a memory to itself", core::Error::Code::INVALID_ARGUMENT);
    }
    auto from = readable_node(source, requester);
    if (!from.ok()) {
        return R::error_from(from);
    }
    auto to = readable_node(target, requester);
    if (!to.ok()) {
        return R::error_from(to);
    }
    if (from.value().owner != requester && to.value().owner != requester) {
        return R::error("linking requires owning one end", core::Error::Code::FORBIDDEN);
    }

    core::MemoryEdge edge;
    edge.source = source;
    edge.target = target;
    edge.creator = requester;
    edge.relation = relation;
    edge.weight = weight;
    return store_->add_edge(edge);
}

core::Result<void> MemoryGraph::unlink_memories(core::EdgeId edge_id, const core::OwnerId& requester) {
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return principal;
    }
    auto edge = store_->edges().find(edge_id);
    if (!edge) {
        return core::Result<void>::error("edge " + std::to_string(edge_id) + " not found",
                                         core::Error::Code::NOT_FOUND);
    }
    auto owns_end = [&](core::NodeId id) {
        auto node = store_->find(id);
        return node && node->owner == requester;
    };
    if (edge->creator != requester && !owns_end(edge->source) && !owns_end(edge->target)) {
        return forbidden("edge " + std::to_string(edge_id) + " is not removable by " + requester);
    }
    auto removed = store_->remove_edge(edge_id);
    if (!removed.ok()) {
        return core::Result<void>::error_from(removed);
    }
    return core::Result<void>();
}

core::Result<std::vector<core::MemoryNode>> MemoryGraph::neighbors(core::NodeId id, const core::OwnerId& requester,
                                                                   const std::optional<std::string>& relation) const {
    using R = core::Result<std::vector<core::MemoryNode>>;
    auto node = readable_node(id, requester);
    if (!node.ok()) {
        return R::error_from(node);
    }
    std::vector<core::MemoryNode> result;
    for (const auto& edge : store_->edges().outgoing(id)) {
        if (relation && edge.relation != *relation) {
            continue;
        }
        auto target = readable_node(edge.target, requester);
        if (target.ok()) {
            result.push_back(target.take_value());
        }
    }
    return result;
}

core::Result<std::vector<core::MemoryNode>> MemoryGraph::children_of(core::NodeId id,
                                                                     const core::OwnerId& requester) const {
    using R = core::Result<std::vector<core::MemoryNode>>;
    auto node = readable_node(id, requester);
    if (!node.ok()) {
        return R::error_from(node);
    }
    std::vector<core::MemoryNode> result;
    for (auto child_id : node.value().children) {
        auto child = readable_node(child_id, requester);
        if (child.ok()) {
            result.push_back(child.take_value());
        }
    }
    return result;
}

core::Result<std::optional<core::MemoryNode>> MemoryGraph::parent_of(core::NodeId id,
                                                                     const core::OwnerId& requester) const {
    using R = core::Result<std::optional<core::MemoryNode>>;
    auto node = readable_node(id, requester);
    if (!node.ok()) {
        return R::error_from(node);
    }
    if (!node.value().parent) {
        return R(std::nullopt);
    }
    // A deleted or expired summary leaves a dangling id behind
    auto parent = readable_node(*node.value().parent, requester);
    if (!parent.ok()) {
        return R(std::nullopt);
    }
    return R(std::optional<core::MemoryNode>(parent.take_value()));
}

core::Result<Subgraph> MemoryGraph::subgraph(core::NodeId center, size_t depth,
                                             const core::OwnerId& requester) const {
    using R = core::Result<Subgraph>;
    auto root = readable_node(center, requester);
    if (!root.ok()) {
        return R::error_from(root);
    }

    Subgraph result;
    absl::flat_hash_set<core::NodeId> visited{center};
    std::deque<std::pair<core::MemoryNode, size_t>> frontier;
    frontier.emplace_back(root.take_value(), 0);

    while (!frontier.empty()) {
        auto [node, distance] = std::move(frontier.front());
        frontier.pop_front();

        if (distance < depth) {
            std::vector<core::NodeId> next;
            for (const auto& edge : store_->edges().outgoing(node.id)) {
                next.push_back(edge.target);
            }
            for (const auto& edge : store_->edges().incoming(node.id)) {
                next.push_back(edge.source);
            }
            next.insert(next.end(), node.children.begin(), node.children.end());
            if (node.parent) {
                next.push_back(*node.parent);
            }
            for (auto id : next) {
                if (!visited.insert(id).second) {
                    continue;
                }
                auto neighbor = readable_node(id, requester);
                if (neighbor.ok()) {
                    frontier.emplace_back(neighbor.take_value(), distance + 1);
                }
            }
        }
        result.nodes.push_back(std::move(node));
    }

    absl::flat_hash_set<core::NodeId> exported;
    for (const auto& node : result.nodes) {
        exported.insert(node.id);
    }
    for (const auto& node : result.nodes) {
        for (const auto& edge : store_->edges().outgoing(node.id)) {
            if (exported.contains(edge.target)) {
                result.edges.push_back(edge);
            }
        }
    }
    return result;
}

core::Result<std::vector<core::MemoryNode>> MemoryGraph::list_memories(const core::OwnerId& owner,
                                                                       const core::OwnerId& requester) const {
    using R = core::Result<std::vector<core::MemoryNode>>;
    auto principal = require_principal(requester);
    if (!principal.ok()) {
        return R::error_from(principal);
    }
    std::vector<core::MemoryNode> result;
    for (auto id : store_->ids_of(owner)) {
        auto node = store_->get(id);
        if (node.ok() && consent_->can_read(node.value(), requester)) {
            result.push_back(node.take_value());
        }
    }
    std::sort(result.begin(), result.end(), newest_first);
    return result;
}

GraphStats MemoryGraph::stats() const {
    GraphStats stats;
    stats.store = store_->stats();
    stats.indexed_nodes = index_->size();
    if (stats.store.total_nodes > 0) {
        stats.average_access_count =
            static_cast<double>(stats.store.total_accesses) / static_cast<double>(stats.store.total_nodes);
    }
    return stats;
}

core::Result<MaintenanceReport> MemoryGraph::trigger_maintenance(const core::CancellationToken& cancel) {
    using R = core::Result<MaintenanceReport>;
    MaintenanceReport report;

    auto expired = store_->delete_expired();
    if (!expired.ok()) {
        return R::error_from(expired);
    }
    report.expired_nodes = expired.value();

    auto rollups = aggregator_->run(cancel);
    if (!rollups.ok()) {
        return R::error_from(rollups);
    }
    report.rollups = rollups.value();

    if (store_->checkpoint_due()) {
        auto checkpointed = store_->checkpoint();
        if (!checkpointed.ok()) {
            return R::error_from(checkpointed);
        }
        report.checkpointed = true;
    }

    if (report.rollups.timeouts > 0) {
        ENGRAM_WARN("Maintenance: {} roll-ups timed out and will be retried", report.rollups.timeouts);
    }
    ENGRAM_INFO("Maintenance: {} expired, {} summaries, {} failures{}", report.expired_nodes,
                report.rollups.summaries_created, report.rollups.failures,
                report.checkpointed ? ", checkpoint written" : "");
    return report;
}

core::Result<void> MemoryGraph::checkpoint() {
    return store_->checkpoint();
}

core::Result<void> MemoryGraph::flush() {
    return store_->flush();
}

} // namespace graph
} // namespace engram
