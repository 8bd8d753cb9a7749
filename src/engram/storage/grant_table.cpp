#include "engram/storage/grant_table.h"

#include <algorithm>

namespace engram {
namespace storage {

GrantTable::GrantTable(size_t num_shards)
    : num_shards_(num_shards == 0 ? 1 : num_shards) {
    shards_.reserve(num_shards_);
    for (size_t i = 0; i < num_shards_; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::shared_ptr<GrantTable::GrantList> GrantTable::list_for(core::NodeId node_id) const {
    Shard& shard = shard_for(node_id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.lists.find(node_id);
    if (it == shard.lists.end()) {
        return nullptr;
    }
    return it->second;
}

void GrantTable::put(const core::AccessGrant& grant) {
    {
        Shard& shard = shard_for(grant.node_id);
        std::unique_lock<std::shared_mutex> shard_lock(shard.mutex);
        auto& list = shard.lists[grant.node_id];
        if (!list) {
            list = std::make_shared<GrantList>();
        }
        std::unique_lock<std::shared_mutex> list_lock(list->mutex);
        auto it = std::find_if(list->grants.begin(), list->grants.end(),
                               [&](const core::AccessGrant& g) { return g.id == grant.id; });
        if (it != list->grants.end()) {
            *it = grant;
            return;
        }
        list->grants.push_back(grant);
    }
    {
        std::unique_lock<std::shared_mutex> lock(id_mutex_);
        node_of_grant_[grant.id] = grant.node_id;
    }
    count_.fetch_add(1);
}

std::optional<core::AccessGrant> GrantTable::erase(core::GrantId id) {
    core::NodeId node_id;
    {
        std::unique_lock<std::shared_mutex> lock(id_mutex_);
        auto it = node_of_grant_.find(id);
        if (it == node_of_grant_.end()) {
            return std::nullopt;
        }
        node_id = it->second;
        node_of_grant_.erase(it);
    }

    Shard& shard = shard_for(node_id);
    std::unique_lock<std::shared_mutex> shard_lock(shard.mutex);
    auto list_it = shard.lists.find(node_id);
    if (list_it == shard.lists.end()) {
        return std::nullopt;
    }
    auto& list = list_it->second;
    std::optional<core::AccessGrant> removed;
    {
        std::unique_lock<std::shared_mutex> list_lock(list->mutex);
        auto it = std::find_if(list->grants.begin(), list->grants.end(),
                               [&](const core::AccessGrant& g) { return g.id == id; });
        if (it == list->grants.end()) {
            return std::nullopt;
        }
        removed = *it;
        list->grants.erase(it);
        if (!list->grants.empty()) {
            count_.fetch_sub(1);
            return removed;
        }
    }
    shard.lists.erase(list_it);
    count_.fetch_sub(1);
    return removed;
}

std::optional<core::AccessGrant> GrantTable::find(core::GrantId id) const {
    core::NodeId node_id;
    {
        std::shared_lock<std::shared_mutex> lock(id_mutex_);
        auto it = node_of_grant_.find(id);
        if (it == node_of_grant_.end()) {
            return std::nullopt;
        }
        node_id = it->second;
    }
    auto list = list_for(node_id);
    if (!list) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(list->mutex);
    for (const auto& grant : list->grants) {
        if (grant.id == id) {
            return grant;
        }
    }
    return std::nullopt;
}

std::vector<core::AccessGrant> GrantTable::grants_for(core::NodeId node_id) const {
    auto list = list_for(node_id);
    if (!list) {
        return {};
    }
    std::shared_lock<std::shared_mutex> lock(list->mutex);
    return list->grants;
}

bool GrantTable::any_of(core::NodeId node_id,
                        const std::function<bool(const core::AccessGrant&)>& pred) const {
    auto list = list_for(node_id);
    if (!list) {
        return false;
    }
    std::shared_lock<std::shared_mutex> lock(list->mutex);
    return std::any_of(list->grants.begin(), list->grants.end(), pred);
}

size_t GrantTable::erase_node(core::NodeId node_id) {
    std::shared_ptr<GrantList> list;
    {
        Shard& shard = shard_for(node_id);
        std::unique_lock<std::shared_mutex> shard_lock(shard.mutex);
        auto it = shard.lists.find(node_id);
        if (it == shard.lists.end()) {
            return 0;
        }
        list = std::move(it->second);
        shard.lists.erase(it);
    }

    std::vector<core::GrantId> ids;
    {
        std::unique_lock<std::shared_mutex> list_lock(list->mutex);
        for (const auto& grant : list->grants) {
            ids.push_back(grant.id);
        }
        list->grants.clear();
    }
    {
        std::unique_lock<std::shared_mutex> lock(id_mutex_);
        for (auto id : ids) {
            node_of_grant_.erase(id);
        }
    }
    count_.fetch_sub(ids.size());
    return ids.size();
}

std::vector<core::GrantId> GrantTable::expired(core::Timestamp now) const {
    std::vector<core::GrantId> result;
    for_each([&](const core::AccessGrant& grant) {
        if (grant.is_expired(now)) {
            result.push_back(grant.id);
        }
    });
    return result;
}

void GrantTable::for_each(const std::function<void(const core::AccessGrant&)>& fn) const {
    for (const auto& shard : shards_) {
        std::vector<std::shared_ptr<GrantList>> lists;
        {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            lists.reserve(shard->lists.size());
            for (const auto& [node_id, list] : shard->lists) {
                lists.push_back(list);
            }
        }
        for (const auto& list : lists) {
            std::shared_lock<std::shared_mutex> lock(list->mutex);
            for (const auto& grant : list->grants) {
                fn(grant);
            }
        }
    }
}

} // namespace storage
} // namespace engram
