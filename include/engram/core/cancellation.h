#ifndef ENGRAM_CORE_CANCELLATION_H_
#define ENGRAM_CORE_CANCELLATION_H_

#include <atomic>
#include <memory>

namespace engram {
namespace core {

/**
 * @brief Shared cancellation flag for long running operations
 *
 * Copies observe the same flag, so a caller keeps one copy and hands
 * another to the operation it may want to abandon.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_CANCELLATION_H_
