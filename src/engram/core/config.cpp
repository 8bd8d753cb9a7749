#include "engram/core/config.h"

namespace engram {
namespace core {

Result<void> GraphConfig::validate() const {
    if (num_store_shards == 0) {
        return Result<void>::error("num_store_shards must be positive", Error::Code::INVALID_ARGUMENT);
    }
    if (!(min_importance <= max_importance)) {
        return Result<void>::error("min_importance exceeds max_importance", Error::Code::INVALID_ARGUMENT);
    }
    if (!(default_importance >= min_importance && default_importance <= max_importance)) {
        return Result<void>::error("default_importance outside importance range",
                                   Error::Code::INVALID_ARGUMENT);
    }
    for (size_t i = 0; i < kNumLevels; ++i) {
        if (ttl.for_level(static_cast<Level>(i)) <= 0) {
            return Result<void>::error(std::string("ttl for level ") + level_name(static_cast<Level>(i)) +
                                       " must be positive", Error::Code::INVALID_ARGUMENT);
        }
    }
    if (rollup.atomic_to_daily < 2 || rollup.daily_to_weekly < 2 || rollup.weekly_to_monthly < 2) {
        return Result<void>::error("roll-up thresholds must be at least 2", Error::Code::INVALID_ARGUMENT);
    }
    if (rollup.summarizer_timeout <= 0) {
        return Result<void>::error("summarizer_timeout must be positive", Error::Code::INVALID_ARGUMENT);
    }
    if (rollup.max_rollups_per_pass == 0) {
        return Result<void>::error("max_rollups_per_pass must be positive", Error::Code::INVALID_ARGUMENT);
    }
    if (index.num_shards == 0 || index.dimensions == 0) {
        return Result<void>::error("index shards and dimensions must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (journal.segment_size_bytes == 0) {
        return Result<void>::error("journal segment size must be positive", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

} // namespace core
} // namespace engram
