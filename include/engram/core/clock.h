#ifndef ENGRAM_CORE_CLOCK_H_
#define ENGRAM_CORE_CLOCK_H_

#include <atomic>
#include <chrono>

#include "engram/core/types.h"

namespace engram {
namespace core {

/**
 * @brief Source of wall-clock time for TTLs, grants and bookkeeping
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 1'700'000'000'000) : now_(start) {}

    Timestamp now() const override { return now_.load(std::memory_order_acquire); }
    void advance(Duration delta) { now_.fetch_add(delta, std::memory_order_acq_rel); }
    void set(Timestamp ts) { now_.store(ts, std::memory_order_release); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_CLOCK_H_
