#ifndef ENGRAM_CORE_TYPES_H_
#define ENGRAM_CORE_TYPES_H_

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace engram {
namespace core {

/**
 * @brief Unique identifier of a memory node
 */
using NodeId = uint64_t;

/**
 * @brief Unique identifier of an access grant
 */
using GrantId = uint64_t;

/**
 * @brief Unique identifier of a memory edge
 */
using EdgeId = uint64_t;

/**
 * @brief Opaque producer ("office") identifier
 */
using OwnerId = std::string;

/**
 * @brief Timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Searchable representation of node content
 */
using SimilarityKey = std::vector<float>;

/**
 * @brief Position of a node in the summary hierarchy
 */
enum class Level : uint8_t {
    ATOMIC = 0,
    DAILY = 1,
    WEEKLY = 2,
    MONTHLY = 3
};

constexpr size_t kNumLevels = 4;

/**
 * @brief Default visibility of a node, ordered from most to least restrictive
 */
enum class ConsentLevel : uint8_t {
    PRIVATE = 0,
    RESTRICTED = 1,
    SHARED = 2,
    PUBLIC = 3
};

/**
 * @brief start + ttl, clamped to the largest timestamp instead of overflowing
 *
 * A ttl too large to represent means the deadline is never reached.
 */
inline Timestamp deadline_after(Timestamp start, Duration ttl) {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    constexpr Timestamp kMin = std::numeric_limits<Timestamp>::min();
    if (ttl > 0 && start > kMax - ttl) {
        return kMax;
    }
    if (ttl < 0 && start < kMin - ttl) {
        return kMin;
    }
    return start + ttl;
}

const char* level_name(Level level);
std::optional<Level> parse_level(const std::string& name);
// Next coarser level; nullopt for MONTHLY.
std::optional<Level> coarser_level(Level level);

const char* consent_name(ConsentLevel consent);
std::optional<ConsentLevel> parse_consent(const std::string& name);
// The more restrictive of two consent levels.
ConsentLevel most_restrictive(ConsentLevel a, ConsentLevel b);

/**
 * @brief A unit of knowledge owned by one producer
 */
struct MemoryNode {
    NodeId id = 0;
    OwnerId owner;
    Level level = Level::ATOMIC;
    std::string content;
    std::vector<std::string> tags;
    SimilarityKey similarity_key;
    ConsentLevel consent = ConsentLevel::PRIVATE;
    Timestamp created_at = 0;
    Duration ttl = 0;
    uint64_t access_count = 0;
    Timestamp last_accessed_at = 0;
    float importance = 0.0f;
    std::vector<NodeId> children;     // summary sources, chronological
    std::optional<NodeId> parent;     // summary this node was rolled into

    Timestamp expires_at() const { return deadline_after(created_at, ttl); }
    bool is_expired(Timestamp now) const { return expires_at() <= now; }
    bool has_tag(const std::string& tag) const;

    // ATOMIC nodes never have children.
    static bool may_have_children(Level level) { return level != Level::ATOMIC; }
    // MONTHLY is the top of the hierarchy.
    static bool may_have_parent(Level level) { return level != Level::MONTHLY; }
};

/**
 * @brief Time-bounded permission for one non-owner on one node
 */
struct AccessGrant {
    GrantId id = 0;
    NodeId node_id = 0;
    OwnerId granting_owner;
    OwnerId receiving_owner;
    Timestamp created_at = 0;
    Timestamp expires_at = 0;
    bool can_modify = false;

    bool is_expired(Timestamp now) const { return expires_at <= now; }
};

/**
 * @brief Directed relation between two memories
 */
struct MemoryEdge {
    EdgeId id = 0;
    NodeId source = 0;
    NodeId target = 0;
    OwnerId creator;
    std::string relation;
    float weight = 1.0f;
    Timestamp created_at = 0;
};

/**
 * @brief A search hit produced by the similarity index
 */
struct ScoredNode {
    NodeId node_id = 0;
    double score = 0.0;
};

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_TYPES_H_
