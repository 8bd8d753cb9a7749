#ifndef ENGRAM_CONSENT_CONSENT_ENGINE_H_
#define ENGRAM_CONSENT_CONSENT_ENGINE_H_

#include <memory>
#include <vector>

#include "engram/core/result.h"
#include "engram/core/types.h"
#include "engram/storage/node_store.h"

namespace engram {
namespace consent {

/**
 * @brief Decides who may read or modify a node, and manages grants
 *
 * Decisions are never cached: every call re-reads the node's grant list, so
 * a grant that expires or is revoked stops working on the next evaluation.
 *
 * Read rules for a non-owner:
 *   PUBLIC      always
 *   SHARED      with an unexpired grant for (node, owner, requester)
 *   RESTRICTED  with an unexpired grant issued by the node's current owner,
 *               re-checked on every call
 *   PRIVATE     never
 */
class ConsentEngine {
public:
    explicit ConsentEngine(std::shared_ptr<storage::NodeStore> store);

    bool can_read(const core::MemoryNode& node, const core::OwnerId& requester) const;
    bool can_modify(const core::MemoryNode& node, const core::OwnerId& requester) const;

    /**
     * @brief Issues a time-bounded grant on a node
     *
     * Only the node's owner may delegate. Grants are not transitive: a
     * receiver cannot re-grant.
     *
     * @return The new grant id, FORBIDDEN for a non-owner, NOT_FOUND for a
     *         missing node, INVALID_ARGUMENT for a non-positive ttl, an empty
     *         receiver or a self-grant
     */
    core::Result<core::GrantId> grant(core::NodeId node_id,
                                      const core::OwnerId& granting_owner,
                                      const core::OwnerId& receiving_owner,
                                      core::Duration ttl,
                                      bool can_modify);

    /**
     * @brief Revokes a grant. Only the owner who issued it may revoke.
     */
    core::Result<void> revoke(core::GrantId grant_id, const core::OwnerId& requester);

    /**
     * @brief Grants on a node, visible to its owner only
     */
    core::Result<std::vector<core::AccessGrant>> grants_for(core::NodeId node_id,
                                                            const core::OwnerId& requester) const;

private:
    std::shared_ptr<storage::NodeStore> store_;

    bool has_live_grant(const core::MemoryNode& node, const core::OwnerId& requester,
                        bool require_current_owner, bool require_modify) const;
};

} // namespace consent
} // namespace engram

#endif // ENGRAM_CONSENT_CONSENT_ENGINE_H_
