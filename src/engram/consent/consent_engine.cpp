#include "engram/consent/consent_engine.h"

#include <algorithm>

#include "engram/common/logger.h"

namespace engram {
namespace consent {

ConsentEngine::ConsentEngine(std::shared_ptr<storage::NodeStore> store)
    : store_(std::move(store)) {}

bool ConsentEngine::has_live_grant(const core::MemoryNode& node, const core::OwnerId& requester,
                                   bool require_current_owner, bool require_modify) const {
    const core::Timestamp now = store_->clock()->now();
    return store_->grants().any_of(node.id, [&](const core::AccessGrant& grant) {
        if (grant.receiving_owner != requester || grant.is_expired(now)) {
            return false;
        }
        if (require_current_owner && grant.granting_owner != node.owner) {
            return false;
        }
        return !require_modify || grant.can_modify;
    });
}

bool ConsentEngine::can_read(const core::MemoryNode& node, const core::OwnerId& requester) const {
    if (requester.empty()) {
        return false;
    }
    if (node.owner == requester) {
        return true;
    }
    switch (node.consent) {
        case core::ConsentLevel::PUBLIC:
            return true;
        case core::ConsentLevel::SHARED:
            return has_live_grant(node, requester, true, false);
        case core::ConsentLevel::RESTRICTED:
            return has_live_grant(node, requester, true, false);
        case core::ConsentLevel::PRIVATE:
            return false;
    }
    return false;
}

bool ConsentEngine::can_modify(const core::MemoryNode& node, const core::OwnerId& requester) const {
    if (requester.empty()) {
        return false;
    }
    if (node.owner == requester) {
        return true;
    }
    if (node.consent == core::ConsentLevel::PRIVATE) {
        return false;
    }
    return has_live_grant(node, requester, true, true);
}

core::Result<core::GrantId> ConsentEngine::grant(core::NodeId node_id,
                                                 const core::OwnerId& granting_owner,
                                                 const core::OwnerId& receiving_owner,
                                                 core::Duration ttl,
                                                 bool can_modify) {
    using R = core::Result<core::GrantId>;
    if (ttl <= 0) {
        return R::error("grant ttl must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    if (receiving_owner.empty()) {
        return R::error("receiving owner must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (receiving_owner == granting_owner) {
        return R::error("cannot grant access to oneself", core::Error::Code::INVALID_ARGUMENT);
    }

    auto node = store_->get(node_id);
    if (!node.ok()) {
        return R::error_from(node);
    }
    if (node.value().owner != granting_owner) {
        ENGRAM_DEBUG("Grant on node {} denied to non-owner {}", node_id, granting_owner);
        return R::error("only the owner may grant access to node " + std::to_string(node_id),
                        core::Error::Code::FORBIDDEN);
    }

    core::AccessGrant grant;
    grant.node_id = node_id;
    grant.granting_owner = granting_owner;
    grant.receiving_owner = receiving_owner;
    grant.created_at = store_->clock()->now();
    grant.expires_at = core::deadline_after(grant.created_at, ttl);
    grant.can_modify = can_modify;
    return store_->add_grant(grant);
}

core::Result<void> ConsentEngine::revoke(core::GrantId grant_id, const core::OwnerId& requester) {
    auto grant = store_->grants().find(grant_id);
    if (!grant) {
        return core::Result<void>::error("grant " + std::to_string(grant_id) + " not found",
                                         core::Error::Code::NOT_FOUND);
    }
    if (grant->granting_owner != requester) {
        ENGRAM_DEBUG("Revoke of grant {} denied to {}", grant_id, requester);
        return core::Result<void>::error("only the granting owner may revoke grant " + std::to_string(grant_id),
                                         core::Error::Code::FORBIDDEN);
    }
    auto removed = store_->remove_grant(grant_id);
    if (!removed.ok()) {
        return core::Result<void>::error_from(removed);
    }
    return core::Result<void>();
}

core::Result<std::vector<core::AccessGrant>> ConsentEngine::grants_for(core::NodeId node_id,
                                                                       const core::OwnerId& requester) const {
    using R = core::Result<std::vector<core::AccessGrant>>;
    auto node = store_->get(node_id);
    if (!node.ok()) {
        return R::error_from(node);
    }
    if (node.value().owner != requester) {
        return R::error("only the owner may list grants of node " + std::to_string(node_id),
                        core::Error::Code::FORBIDDEN);
    }
    auto grants = store_->grants().grants_for(node_id);
    std::sort(grants.begin(), grants.end(),
              [](const core::AccessGrant& a, const core::AccessGrant& b) { return a.id < b.id; });
    return grants;
}

} // namespace consent
} // namespace engram
