#ifndef ENGRAM_CORE_CONFIG_H_
#define ENGRAM_CORE_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "engram/core/result.h"
#include "engram/core/types.h"

namespace engram {
namespace core {

/**
 * @brief Default time-to-live of a node by hierarchy level
 */
struct TtlPolicy {
    Duration atomic;
    Duration daily;
    Duration weekly;
    Duration monthly;

    TtlPolicy() : atomic(0), daily(0), weekly(0), monthly(0) {}

    static TtlPolicy Default() {
        TtlPolicy policy;
        policy.atomic = 24LL * 3600 * 1000;         // 24 hours
        policy.daily = 7LL * 24 * 3600 * 1000;      // 1 week
        policy.weekly = 30LL * 24 * 3600 * 1000;    // 30 days
        policy.monthly = 365LL * 24 * 3600 * 1000;  // 1 year
        return policy;
    }

    Duration for_level(Level level) const {
        switch (level) {
            case Level::ATOMIC: return atomic;
            case Level::DAILY: return daily;
            case Level::WEEKLY: return weekly;
            case Level::MONTHLY: return monthly;
        }
        return atomic;
    }
};

/**
 * @brief Roll-up thresholds and summarizer limits
 */
struct RollupConfig {
    size_t atomic_to_daily;        // un-rolled ATOMIC nodes that trigger a DAILY summary
    size_t daily_to_weekly;        // un-rolled DAILY nodes that trigger a WEEKLY summary
    size_t weekly_to_monthly;      // un-rolled WEEKLY nodes that trigger a MONTHLY summary
    Duration summarizer_timeout;   // deadline for one summarizer call
    size_t max_summary_chars;      // cap applied by the default summarizer
    size_t max_rollups_per_pass;   // per (owner, level) bound within one maintenance pass

    RollupConfig() : atomic_to_daily(0), daily_to_weekly(0), weekly_to_monthly(0),
                     summarizer_timeout(0), max_summary_chars(0), max_rollups_per_pass(0) {}

    static RollupConfig Default() {
        RollupConfig config;
        config.atomic_to_daily = 100;
        config.daily_to_weekly = 7;
        config.weekly_to_monthly = 4;
        config.summarizer_timeout = 30 * 1000;  // 30 seconds
        config.max_summary_chars = 4096;
        config.max_rollups_per_pass = 64;
        return config;
    }

    // 0 means the level never rolls up (MONTHLY).
    size_t threshold_for(Level level) const {
        switch (level) {
            case Level::ATOMIC: return atomic_to_daily;
            case Level::DAILY: return daily_to_weekly;
            case Level::WEEKLY: return weekly_to_monthly;
            case Level::MONTHLY: return 0;
        }
        return 0;
    }
};

/**
 * @brief Similarity index layout
 */
struct IndexConfig {
    size_t num_shards;        // Independent search shards
    size_t dimensions;        // Similarity key width produced by the default embedder
    double default_min_score; // Used by the CLI when no threshold is given

    IndexConfig() : num_shards(0), dimensions(0), default_min_score(0.0) {}

    static IndexConfig Default() {
        IndexConfig config;
        config.num_shards = 16;
        config.dimensions = 256;
        config.default_min_score = 0.1;
        return config;
    }
};

/**
 * @brief Journal (write-ahead log) behaviour
 */
struct JournalConfig {
    bool sync_writes;                  // Flush every structural record
    size_t segment_size_bytes;         // Rotate segments past this size
    size_t checkpoint_threshold_bytes; // Maintenance snapshots past this size

    JournalConfig() : sync_writes(true), segment_size_bytes(0), checkpoint_threshold_bytes(0) {}

    static JournalConfig Default() {
        JournalConfig config;
        config.sync_writes = true;
        config.segment_size_bytes = 64 * 1024 * 1024;          // 64MB
        config.checkpoint_threshold_bytes = 256 * 1024 * 1024; // 256MB
        return config;
    }
};

/**
 * @brief Top level configuration of a memory graph
 */
struct GraphConfig {
    std::string data_dir;       // Empty runs fully in memory
    size_t num_store_shards;    // Node store shards
    float min_importance;
    float max_importance;
    float default_importance;
    TtlPolicy ttl;
    RollupConfig rollup;
    IndexConfig index;
    JournalConfig journal;

    GraphConfig() : num_store_shards(0), min_importance(0.0f), max_importance(0.0f),
                    default_importance(0.0f),
                    ttl(TtlPolicy::Default()),
                    rollup(RollupConfig::Default()),
                    index(IndexConfig::Default()),
                    journal(JournalConfig::Default()) {}

    static GraphConfig Default() {
        GraphConfig config;
        config.data_dir = "";
        config.num_store_shards = 16;
        config.min_importance = 0.0f;
        config.max_importance = 1.0f;
        config.default_importance = 0.5f;
        return config;
    }

    Result<void> validate() const;
};

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_CONFIG_H_
