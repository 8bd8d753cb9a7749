#include "engram/storage/node_store.h"

#include <algorithm>

#include "engram/common/logger.h"

namespace engram {
namespace storage {

namespace {

template<typename T>
void bump_max(std::atomic<T>& target, T value) {
    T current = target.load(std::memory_order_relaxed);
    while (current < value &&
           !target.compare_exchange_weak(current, value, std::memory_order_acq_rel)) {
    }
}

core::Result<void> not_found(core::NodeId id) {
    return core::Result<void>::error("node " + std::to_string(id) + " not found",
                                     core::Error::Code::NOT_FOUND);
}

} // namespace

core::MemoryNode NodeStore::NodeEntry::snapshot() const {
    core::MemoryNode copy = node;
    copy.access_count = access_count.load(std::memory_order_acquire);
    copy.last_accessed_at = last_accessed_at.load(std::memory_order_acquire);
    return copy;
}

NodeStore::NodeStore(const core::GraphConfig& config,
                     std::shared_ptr<const core::Clock> clock,
                     std::shared_ptr<Journal> journal)
    : config_(config),
      clock_(std::move(clock)),
      journal_(std::move(journal)),
      grants_(config.num_store_shards) {
    size_t num_shards = config_.num_store_shards == 0 ? 1 : config_.num_store_shards;
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

core::Result<void> NodeStore::recover() {
    if (!journal_) {
        return core::Result<void>();
    }
    auto result = journal_->replay([this](const JournalRecord& record) { apply(record); });
    if (!result.ok()) {
        ENGRAM_ERROR("Node store recovery failed: {}", result.error());
        return result;
    }
    ENGRAM_INFO("Recovered {} nodes, {} grants, {} edges from {}",
                size(), grants_.size(), edges_.size(), journal_->dir());
    return core::Result<void>();
}

NodeStore::EntryPtr NodeStore::lookup(core::NodeId id) const {
    Shard& shard = shard_for(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.nodes.find(id);
    if (it == shard.nodes.end()) {
        return nullptr;
    }
    return it->second;
}

core::Result<void> NodeStore::log(const JournalRecord& record, bool flush_now) {
    if (!journal_) {
        return core::Result<void>();
    }
    auto result = journal_->log(record, flush_now);
    if (!result.ok()) {
        ENGRAM_ERROR("Journal append failed: {}", result.error());
    }
    return result;
}

// Written so that NaN is out of range.
bool NodeStore::importance_in_range(float importance) const {
    return importance >= config_.min_importance && importance <= config_.max_importance;
}

core::Result<void> NodeStore::validate_draft(const NodeDraft& draft) const {
    if (draft.owner.empty()) {
        return core::Result<void>::error("owner must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (draft.ttl && *draft.ttl <= 0) {
        return core::Result<void>::error("ttl must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    if (draft.importance && !importance_in_range(*draft.importance)) {
        return core::Result<void>::error("importance out of range", core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

core::MemoryNode NodeStore::materialize(const NodeDraft& draft, core::NodeId id) const {
    core::MemoryNode node;
    node.id = id;
    node.owner = draft.owner;
    node.level = draft.level;
    node.content = draft.content;
    node.tags = draft.tags;
    node.similarity_key = draft.similarity_key;
    node.consent = draft.consent;
    node.created_at = clock_->now();
    node.ttl = draft.ttl.value_or(config_.ttl.for_level(draft.level));
    node.importance = draft.importance.value_or(config_.default_importance);
    return node;
}

void NodeStore::insert_entry(const core::MemoryNode& node) {
    bool inserted = false;
    {
        Shard& shard = shard_for(node.id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto& slot = shard.nodes[node.id];
        if (slot) {
            std::unique_lock<std::shared_mutex> entry_lock(slot->mutex);
            slot->node = node;
            slot->access_count.store(node.access_count);
            slot->last_accessed_at.store(node.last_accessed_at);
        } else {
            slot = std::make_shared<NodeEntry>();
            slot->node = node;
            slot->access_count.store(node.access_count);
            slot->last_accessed_at.store(node.last_accessed_at);
            inserted = true;
        }
    }
    if (inserted) {
        node_count_.fetch_add(1);
        std::unique_lock<std::shared_mutex> lock(owners_mutex_);
        owner_index_[node.owner][static_cast<size_t>(node.level)].insert(node.id);
    }
}

core::Result<core::NodeId> NodeStore::create(const NodeDraft& draft) {
    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return core::Result<core::NodeId>::error_from(valid);
    }

    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    core::MemoryNode node = materialize(draft, next_node_id_.fetch_add(1));
    auto logged = log(JournalRecord::NodePut(node));
    if (!logged.ok()) {
        return core::Result<core::NodeId>::error_from(logged);
    }
    insert_entry(node);
    ENGRAM_TRACE("Created node {} for {} at level {}", node.id, node.owner, core::level_name(node.level));
    return node.id;
}

core::Result<core::MemoryNode> NodeStore::get(core::NodeId id) const {
    auto entry = lookup(id);
    if (!entry) {
        return core::Result<core::MemoryNode>::error_from(not_found(id));
    }
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->removed || entry->node.is_expired(clock_->now())) {
        return core::Result<core::MemoryNode>::error_from(not_found(id));
    }
    return entry->snapshot();
}

std::optional<core::MemoryNode> NodeStore::find(core::NodeId id) const {
    auto entry = lookup(id);
    if (!entry) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    return entry->snapshot();
}

core::Result<void> NodeStore::touch(core::NodeId id) {
    auto entry = lookup(id);
    if (!entry) {
        return not_found(id);
    }
    const core::Timestamp now = clock_->now();
    uint64_t count;
    core::Timestamp accessed;
    {
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        if (entry->removed || entry->node.is_expired(now)) {
            return not_found(id);
        }
        count = entry->access_count.fetch_add(1, std::memory_order_acq_rel) + 1;
        bump_max(entry->last_accessed_at, now);
        accessed = entry->last_accessed_at.load(std::memory_order_acquire);
    }
    // Bookkeeping only: appended without a flush.
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    return log(JournalRecord::Touch(id, count, accessed), false);
}

template<typename Mutator>
core::Result<void> NodeStore::mutate(core::NodeId id, const core::OwnerId* requester,
                                     const JournalRecord& record, Mutator&& mutator) {
    auto entry = lookup(id);
    if (!entry) {
        return not_found(id);
    }
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->removed || entry->node.is_expired(clock_->now())) {
        return not_found(id);
    }
    if (requester && entry->node.owner != *requester) {
        return core::Result<void>::error("only the owner may modify node " + std::to_string(id),
                                         core::Error::Code::FORBIDDEN);
    }
    auto logged = log(record);
    if (!logged.ok()) {
        return logged;
    }
    mutator(entry->node);
    return core::Result<void>();
}

core::Result<void> NodeStore::update_consent(core::NodeId id, const core::OwnerId& requester,
                                             core::ConsentLevel consent) {
    return mutate(id, &requester, JournalRecord::Consent(id, consent),
                  [consent](core::MemoryNode& node) { node.consent = consent; });
}

core::Result<void> NodeStore::set_consent(core::NodeId id, core::ConsentLevel consent) {
    return mutate(id, nullptr, JournalRecord::Consent(id, consent),
                  [consent](core::MemoryNode& node) { node.consent = consent; });
}

core::Result<void> NodeStore::update_ttl(core::NodeId id, const core::OwnerId& requester, core::Duration ttl) {
    if (ttl <= 0) {
        return core::Result<void>::error("ttl must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    return mutate(id, &requester, JournalRecord::Ttl(id, ttl),
                  [ttl](core::MemoryNode& node) { node.ttl = ttl; });
}

core::Result<void> NodeStore::set_ttl(core::NodeId id, core::Duration ttl) {
    if (ttl <= 0) {
        return core::Result<void>::error("ttl must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    return mutate(id, nullptr, JournalRecord::Ttl(id, ttl),
                  [ttl](core::MemoryNode& node) { node.ttl = ttl; });
}

core::Result<void> NodeStore::update_importance(core::NodeId id, const core::OwnerId& requester,
                                                float importance) {
    if (!importance_in_range(importance)) {
        return core::Result<void>::error("importance out of range", core::Error::Code::INVALID_ARGUMENT);
    }
    return mutate(id, &requester, JournalRecord::Importance(id, importance),
                  [importance](core::MemoryNode& node) { node.importance = importance; });
}

core::Result<void> NodeStore::set_importance(core::NodeId id, float importance) {
    if (!importance_in_range(importance)) {
        return core::Result<void>::error("importance out of range", core::Error::Code::INVALID_ARGUMENT);
    }
    return mutate(id, nullptr, JournalRecord::Importance(id, importance),
                  [importance](core::MemoryNode& node) { node.importance = importance; });
}

core::Result<std::optional<core::MemoryNode>> NodeStore::remove_node(
    core::NodeId id, std::optional<core::Timestamp> expired_at, bool journaled) {
    using R = core::Result<std::optional<core::MemoryNode>>;

    auto entry = lookup(id);
    if (!entry) {
        return R(std::nullopt);
    }

    core::MemoryNode node;
    {
        std::shared_lock<std::shared_mutex> gate(journal_gate_, std::defer_lock);
        if (journaled) {
            gate.lock();
        }
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        if (entry->removed) {
            return R(std::nullopt);
        }
        if (expired_at && !entry->node.is_expired(*expired_at)) {
            return R(std::nullopt);
        }
        if (journaled) {
            auto logged = log(JournalRecord::NodeErase(id));
            if (!logged.ok()) {
                return R::error_from(logged);
            }
        }
        entry->removed = true;
        node = entry->snapshot();
    }

    {
        Shard& shard = shard_for(id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.nodes.erase(id);
    }
    {
        std::unique_lock<std::shared_mutex> lock(owners_mutex_);
        auto it = owner_index_.find(node.owner);
        if (it != owner_index_.end()) {
            it->second[static_cast<size_t>(node.level)].erase(id);
            bool empty = std::all_of(it->second.begin(), it->second.end(),
                                     [](const absl::flat_hash_set<core::NodeId>& ids) { return ids.empty(); });
            if (empty) {
                owner_index_.erase(it);
            }
        }
    }
    node_count_.fetch_sub(1);
    grants_.erase_node(id);
    edges_.erase_node(id);
    return R(std::optional<core::MemoryNode>(std::move(node)));
}

core::Result<core::MemoryNode> NodeStore::erase(core::NodeId id, const core::OwnerId& requester) {
    auto current = get(id);
    if (!current.ok()) {
        return current;
    }
    if (current.value().owner != requester) {
        return core::Result<core::MemoryNode>::error("only the owner may delete node " + std::to_string(id),
                                                     core::Error::Code::FORBIDDEN);
    }
    auto removed = remove_node(id, std::nullopt, true);
    if (!removed.ok()) {
        return core::Result<core::MemoryNode>::error_from(removed);
    }
    if (!removed.value()) {
        return core::Result<core::MemoryNode>::error_from(not_found(id));
    }
    core::MemoryNode node = *removed.value();
    notify_removed(node);
    return node;
}

core::Result<size_t> NodeStore::delete_expired() {
    const core::Timestamp now = clock_->now();

    std::vector<core::NodeId> candidates;
    for (const auto& shard : shards_) {
        std::vector<EntryPtr> entries;
        {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            entries.reserve(shard->nodes.size());
            for (const auto& kv : shard->nodes) {
                entries.push_back(kv.second);
            }
        }
        for (const auto& entry : entries) {
            std::shared_lock<std::shared_mutex> lock(entry->mutex);
            if (!entry->removed && entry->node.is_expired(now)) {
                candidates.push_back(entry->node.id);
            }
        }
    }

    size_t removed_count = 0;
    for (auto id : candidates) {
        auto removed = remove_node(id, now, true);
        if (!removed.ok()) {
            return core::Result<size_t>::error_from(removed);
        }
        if (removed.value()) {
            notify_removed(*removed.value());
            ++removed_count;
        }
    }

    auto grants = evict_expired_grants();
    if (!grants.ok()) {
        return core::Result<size_t>::error_from(grants);
    }
    if (removed_count > 0 || grants.value() > 0) {
        ENGRAM_DEBUG("Expiry sweep removed {} nodes and {} grants", removed_count, grants.value());
    }
    return removed_count;
}

std::vector<core::MemoryNode> NodeStore::unrolled(const core::OwnerId& owner, core::Level level) const {
    std::vector<core::NodeId> ids;
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        auto it = owner_index_.find(owner);
        if (it == owner_index_.end()) {
            return {};
        }
        const auto& set = it->second[static_cast<size_t>(level)];
        ids.assign(set.begin(), set.end());
    }

    const core::Timestamp now = clock_->now();
    std::vector<core::MemoryNode> result;
    result.reserve(ids.size());
    for (auto id : ids) {
        auto entry = lookup(id);
        if (!entry) {
            continue;
        }
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        if (entry->removed || entry->node.is_expired(now) || entry->node.parent) {
            continue;
        }
        result.push_back(entry->snapshot());
    }
    std::sort(result.begin(), result.end(), [](const core::MemoryNode& a, const core::MemoryNode& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
    return result;
}

size_t NodeStore::count_unrolled(const core::OwnerId& owner, core::Level level) const {
    std::vector<core::NodeId> ids;
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        auto it = owner_index_.find(owner);
        if (it == owner_index_.end()) {
            return 0;
        }
        const auto& set = it->second[static_cast<size_t>(level)];
        ids.assign(set.begin(), set.end());
    }

    const core::Timestamp now = clock_->now();
    size_t count = 0;
    for (auto id : ids) {
        auto entry = lookup(id);
        if (!entry) {
            continue;
        }
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        if (!entry->removed && !entry->node.is_expired(now) && !entry->node.parent) {
            ++count;
        }
    }
    return count;
}

std::vector<core::OwnerId> NodeStore::owners() const {
    std::vector<core::OwnerId> result;
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        result.reserve(owner_index_.size());
        for (const auto& kv : owner_index_) {
            result.push_back(kv.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<core::NodeId> NodeStore::ids_of(const core::OwnerId& owner) const {
    std::vector<core::NodeId> result;
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        auto it = owner_index_.find(owner);
        if (it == owner_index_.end()) {
            return result;
        }
        for (const auto& level_ids : it->second) {
            result.insert(result.end(), level_ids.begin(), level_ids.end());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

core::Result<core::NodeId> NodeStore::commit_summary(const NodeDraft& draft,
                                                     const std::vector<core::NodeId>& children) {
    using R = core::Result<core::NodeId>;

    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return R::error_from(valid);
    }
    if (draft.level == core::Level::ATOMIC) {
        return R::error("summary cannot be ATOMIC", core::Error::Code::INVALID_ARGUMENT);
    }
    if (children.empty()) {
        return R::error("summary needs at least one child", core::Error::Code::INVALID_ARGUMENT);
    }
    const auto child_level = static_cast<core::Level>(static_cast<uint8_t>(draft.level) - 1);

    std::vector<core::NodeId> sorted = children;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        return R::error("duplicate child id", core::Error::Code::INVALID_ARGUMENT);
    }

    std::vector<EntryPtr> entries;
    entries.reserve(sorted.size());
    for (auto id : sorted) {
        auto entry = lookup(id);
        if (!entry) {
            return R::error_from(not_found(id));
        }
        entries.push_back(std::move(entry));
    }

    std::shared_lock<std::shared_mutex> gate(journal_gate_);

    // Child locks are always taken in id order.
    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(entries.size());
    for (auto& entry : entries) {
        locks.emplace_back(entry->mutex);
    }

    const core::Timestamp now = clock_->now();
    for (const auto& entry : entries) {
        const core::MemoryNode& child = entry->node;
        if (entry->removed || child.is_expired(now)) {
            return R::error_from(not_found(child.id));
        }
        if (child.owner != draft.owner) {
            return R::error("child " + std::to_string(child.id) + " belongs to another owner",
                            core::Error::Code::INVALID_ARGUMENT);
        }
        if (child.level != child_level) {
            return R::error("child " + std::to_string(child.id) + " is at the wrong level",
                            core::Error::Code::INVALID_ARGUMENT);
        }
        if (child.parent) {
            return R::error("child " + std::to_string(child.id) + " is already summarized",
                            core::Error::Code::INVALID_ARGUMENT);
        }
    }

    core::MemoryNode summary = materialize(draft, next_node_id_.fetch_add(1));
    summary.children = children;

    auto logged = log(JournalRecord::SummaryCommit(summary));
    if (!logged.ok()) {
        return R::error_from(logged);
    }

    insert_entry(summary);
    for (auto& entry : entries) {
        entry->node.parent = summary.id;
    }
    return summary.id;
}

core::Result<core::GrantId> NodeStore::add_grant(core::AccessGrant grant) {
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    grant.id = next_grant_id_.fetch_add(1);
    auto logged = log(JournalRecord::GrantPut(grant));
    if (!logged.ok()) {
        return core::Result<core::GrantId>::error_from(logged);
    }
    grants_.put(grant);
    return grant.id;
}

core::Result<core::AccessGrant> NodeStore::remove_grant(core::GrantId id) {
    auto grant = grants_.find(id);
    if (!grant) {
        return core::Result<core::AccessGrant>::error("grant " + std::to_string(id) + " not found",
                                                      core::Error::Code::NOT_FOUND);
    }
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    auto logged = log(JournalRecord::GrantErase(id));
    if (!logged.ok()) {
        return core::Result<core::AccessGrant>::error_from(logged);
    }
    auto removed = grants_.erase(id);
    if (!removed) {
        return core::Result<core::AccessGrant>::error("grant " + std::to_string(id) + " not found",
                                                      core::Error::Code::NOT_FOUND);
    }
    return *removed;
}

core::Result<size_t> NodeStore::evict_expired_grants() {
    size_t evicted = 0;
    for (auto id : grants_.expired(clock_->now())) {
        std::shared_lock<std::shared_mutex> gate(journal_gate_);
        auto logged = log(JournalRecord::GrantErase(id));
        if (!logged.ok()) {
            return core::Result<size_t>::error_from(logged);
        }
        if (grants_.erase(id)) {
            ++evicted;
        }
    }
    return evicted;
}

core::Result<core::EdgeId> NodeStore::add_edge(core::MemoryEdge edge) {
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    edge.id = next_edge_id_.fetch_add(1);
    edge.created_at = clock_->now();
    auto logged = log(JournalRecord::EdgePut(edge));
    if (!logged.ok()) {
        return core::Result<core::EdgeId>::error_from(logged);
    }
    edges_.put(edge);
    return edge.id;
}

core::Result<core::MemoryEdge> NodeStore::remove_edge(core::EdgeId id) {
    if (!edges_.find(id)) {
        return core::Result<core::MemoryEdge>::error("edge " + std::to_string(id) + " not found",
                                                     core::Error::Code::NOT_FOUND);
    }
    std::shared_lock<std::shared_mutex> gate(journal_gate_);
    auto logged = log(JournalRecord::EdgeErase(id));
    if (!logged.ok()) {
        return core::Result<core::MemoryEdge>::error_from(logged);
    }
    auto removed = edges_.erase(id);
    if (!removed) {
        return core::Result<core::MemoryEdge>::error("edge " + std::to_string(id) + " not found",
                                                     core::Error::Code::NOT_FOUND);
    }
    return *removed;
}

void NodeStore::add_removal_listener(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void NodeStore::notify_removed(const core::MemoryNode& node) {
    std::vector<RemovalListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(node);
    }
}

void NodeStore::apply(const JournalRecord& record) {
    switch (record.type) {
        case RecordType::NODE_PUT:
        case RecordType::SUMMARY_COMMIT: {
            insert_entry(record.node);
            bump_max(next_node_id_, record.node.id + 1);
            if (record.type == RecordType::SUMMARY_COMMIT) {
                for (auto child_id : record.node.children) {
                    auto child = lookup(child_id);
                    if (child) {
                        std::unique_lock<std::shared_mutex> lock(child->mutex);
                        child->node.parent = record.node.id;
                    }
                }
            }
            break;
        }
        case RecordType::NODE_ERASE: {
            auto removed = remove_node(record.id, std::nullopt, false);
            (void)removed;
            break;
        }
        case RecordType::CONSENT:
        case RecordType::TTL:
        case RecordType::IMPORTANCE: {
            auto entry = lookup(record.id);
            if (!entry) {
                break;
            }
            std::unique_lock<std::shared_mutex> lock(entry->mutex);
            if (record.type == RecordType::CONSENT) {
                entry->node.consent = record.consent;
            } else if (record.type == RecordType::TTL) {
                entry->node.ttl = record.ttl;
            } else {
                entry->node.importance = record.importance;
            }
            break;
        }
        case RecordType::TOUCH: {
            auto entry = lookup(record.id);
            if (entry) {
                bump_max(entry->access_count, record.access_count);
                bump_max(entry->last_accessed_at, record.timestamp);
            }
            break;
        }
        case RecordType::GRANT_PUT:
            grants_.put(record.grant);
            bump_max(next_grant_id_, record.grant.id + 1);
            break;
        case RecordType::GRANT_ERASE:
            grants_.erase(record.id);
            break;
        case RecordType::EDGE_PUT:
            edges_.put(record.edge);
            bump_max(next_edge_id_, record.edge.id + 1);
            break;
        case RecordType::EDGE_ERASE:
            edges_.erase(record.id);
            break;
        case RecordType::ID_WATERMARK:
            bump_max(next_node_id_, record.id);
            bump_max(next_grant_id_, record.grant.id);
            bump_max(next_edge_id_, record.edge.id);
            break;
    }
}

core::Result<void> NodeStore::checkpoint() {
    if (!journal_) {
        return core::Result<void>();
    }
    int segment;
    {
        std::unique_lock<std::shared_mutex> gate(journal_gate_);
        auto rotated = journal_->rotate_for_checkpoint();
        if (!rotated.ok()) {
            return core::Result<void>::error_from(rotated);
        }
        segment = rotated.value();
    }

    return journal_->write_snapshot(segment, [this](const RecordSink& sink) {
        sink(JournalRecord::IdWatermark(next_node_id_.load(), next_grant_id_.load(), next_edge_id_.load()));
        for (const auto& shard : shards_) {
            std::vector<EntryPtr> entries;
            {
                std::shared_lock<std::shared_mutex> lock(shard->mutex);
                for (const auto& kv : shard->nodes) {
                    entries.push_back(kv.second);
                }
            }
            for (const auto& entry : entries) {
                core::MemoryNode node;
                {
                    std::shared_lock<std::shared_mutex> lock(entry->mutex);
                    if (entry->removed) {
                        continue;
                    }
                    node = entry->snapshot();
                }
                sink(JournalRecord::NodePut(node));
            }
        }
        grants_.for_each([&sink](const core::AccessGrant& grant) { sink(JournalRecord::GrantPut(grant)); });
        edges_.for_each([&sink](const core::MemoryEdge& edge) { sink(JournalRecord::EdgePut(edge)); });
    });
}

bool NodeStore::checkpoint_due() const {
    return journal_ && journal_->bytes_since_checkpoint() >= config_.journal.checkpoint_threshold_bytes;
}

core::Result<void> NodeStore::flush() {
    if (!journal_) {
        return core::Result<void>();
    }
    return journal_->flush();
}

void NodeStore::for_each(const std::function<void(const core::MemoryNode&)>& fn) const {
    const core::Timestamp now = clock_->now();
    for (const auto& shard : shards_) {
        std::vector<EntryPtr> entries;
        {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            entries.reserve(shard->nodes.size());
            for (const auto& kv : shard->nodes) {
                entries.push_back(kv.second);
            }
        }
        for (const auto& entry : entries) {
            core::MemoryNode node;
            {
                std::shared_lock<std::shared_mutex> lock(entry->mutex);
                if (entry->removed || entry->node.is_expired(now)) {
                    continue;
                }
                node = entry->snapshot();
            }
            fn(node);
        }
    }
}

StoreStats NodeStore::stats() const {
    StoreStats stats;
    for_each([&stats](const core::MemoryNode& node) {
        stats.total_nodes++;
        stats.nodes_per_level[static_cast<size_t>(node.level)]++;
        stats.nodes_per_owner[node.owner]++;
        stats.nodes_per_consent[static_cast<size_t>(node.consent)]++;
        for (const auto& tag : node.tags) {
            stats.nodes_per_tag[tag]++;
        }
        stats.total_accesses += node.access_count;
    });
    stats.total_grants = grants_.size();
    stats.total_edges = edges_.size();
    return stats;
}

} // namespace storage
} // namespace engram
