#include "engram/hierarchy/aggregator.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <thread>

#include <absl/container/flat_hash_set.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "engram/common/logger.h"

namespace engram {
namespace hierarchy {

namespace {

// Granularity at which a pending summarizer call checks for cancellation
constexpr std::chrono::milliseconds kDeadlinePoll(20);

} // namespace

void RollupReport::merge(const RollupReport& other) {
    summaries_created += other.summaries_created;
    timeouts += other.timeouts;
    failures += other.failures;
    cancelled = cancelled || other.cancelled;
}

HierarchyAggregator::HierarchyAggregator(std::shared_ptr<storage::NodeStore> store,
                                         std::shared_ptr<index::SimilarityIndex> index,
                                         std::shared_ptr<index::Embedder> embedder,
                                         std::shared_ptr<Summarizer> summarizer,
                                         const core::RollupConfig& config)
    : store_(std::move(store)),
      index_(std::move(index)),
      embedder_(std::move(embedder)),
      summarizer_(std::move(summarizer)),
      config_(config),
      in_flight_(std::make_shared<std::atomic<size_t>>(0)) {}

bool HierarchyAggregator::check_rollup_trigger(const core::OwnerId& owner, core::Level level) const {
    const size_t threshold = config_.threshold_for(level);
    if (threshold == 0) {
        return false;
    }
    return store_->count_unrolled(owner, level) >= threshold;
}

std::shared_ptr<HierarchyAggregator::TupleState> HierarchyAggregator::tuple_state(const core::OwnerId& owner,
                                                                                 core::Level level) {
    std::string key = owner;
    key.push_back('\0');
    key.push_back(static_cast<char>('0' + static_cast<int>(level)));

    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = tuples_[key];
    if (!slot) {
        slot = std::make_shared<TupleState>();
    }
    return slot;
}

std::vector<core::MemoryNode> HierarchyAggregator::select_sources(std::vector<core::MemoryNode> candidates,
                                                                  size_t count) const {
    // Most recent first, importance breaks ties
    std::sort(candidates.begin(), candidates.end(), [](const core::MemoryNode& a, const core::MemoryNode& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        if (a.importance != b.importance) {
            return a.importance > b.importance;
        }
        return a.id > b.id;
    });
    if (candidates.size() > count) {
        candidates.resize(count);
    }
    std::sort(candidates.begin(), candidates.end(), [](const core::MemoryNode& a, const core::MemoryNode& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
    return candidates;
}

core::Result<std::string> HierarchyAggregator::summarize_with_deadline(const SummaryRequest& request,
                                                                       const std::shared_ptr<TupleState>& tuple,
                                                                       const core::CancellationToken& cancel) {
    using R = core::Result<std::string>;

    // Called with tuple->mutex held, so only an abandoned call can be running.
    if (tuple->summarizing.load()) {
        return R::error("previous summarizer call for this pair is still running",
                        core::Error::Code::MAINTENANCE_TIMEOUT);
    }

    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> future = promise->get_future();

    tuple->summarizing.store(true);
    in_flight_->fetch_add(1);

    // The worker owns everything it touches; an abandoned call finishes on
    // its own and its result is dropped. The pair is released before the
    // result is published so a caller that saw it may start the next call.
    std::thread worker([summarizer = summarizer_, request, promise, tuple, in_flight = in_flight_]() {
        R result = R::error("summarizer produced no result", core::Error::Code::INTERNAL);
        try {
            result = summarizer->summarize(request);
        } catch (const std::exception& e) {
            result = R::error(std::string("summarizer threw: ") + e.what(), core::Error::Code::INTERNAL);
        }
        tuple->summarizing.store(false);
        in_flight->fetch_sub(1);
        promise->set_value(std::move(result));
    });
    worker.detach();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.summarizer_timeout);
    while (true) {
        if (cancel.is_cancelled()) {
            return R::error("roll-up cancelled", core::Error::Code::CANCELLED);
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return R::error("summarizer exceeded " + std::to_string(config_.summarizer_timeout) + "ms",
                            core::Error::Code::MAINTENANCE_TIMEOUT);
        }
        const auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now, kDeadlinePoll);
        if (future.wait_for(wait) == std::future_status::ready) {
            return future.get();
        }
    }
}

core::Result<std::optional<core::NodeId>> HierarchyAggregator::rollup(const core::OwnerId& owner,
                                                                      core::Level level,
                                                                      const core::CancellationToken& cancel) {
    using R = core::Result<std::optional<core::NodeId>>;

    const auto target_level = core::coarser_level(level);
    const size_t threshold = config_.threshold_for(level);
    if (!target_level || threshold == 0) {
        return R(std::nullopt);
    }

    auto tuple = tuple_state(owner, level);
    std::lock_guard<std::mutex> lock(tuple->mutex);

    if (cancel.is_cancelled()) {
        return R::error("roll-up cancelled", core::Error::Code::CANCELLED);
    }

    // Recomputed under the lock, so a repeated call after a roll-up is a no-op
    auto candidates = store_->unrolled(owner, level);
    if (candidates.size() < threshold) {
        return R(std::nullopt);
    }

    SummaryRequest request;
    request.owner = owner;
    request.target_level = *target_level;
    request.sources = select_sources(std::move(candidates), threshold);

    auto content = summarize_with_deadline(request, tuple, cancel);
    if (!content.ok()) {
        if (content.is(core::Error::Code::MAINTENANCE_TIMEOUT)) {
            ENGRAM_WARN("Roll-up of {} {} abandoned: {}", owner, core::level_name(level), content.error());
        }
        return R::error_from(content);
    }
    if (cancel.is_cancelled()) {
        return R::error("roll-up cancelled", core::Error::Code::CANCELLED);
    }

    storage::NodeDraft draft;
    draft.owner = owner;
    draft.level = *target_level;
    draft.content = content.take_value();
    draft.consent = core::ConsentLevel::PUBLIC;
    float importance = 0.0f;
    absl::flat_hash_set<std::string> seen_tags;
    std::vector<core::NodeId> children;
    children.reserve(request.sources.size());
    for (size_t i = 0; i < request.sources.size(); ++i) {
        const auto& source = request.sources[i];
        children.push_back(source.id);
        draft.consent = core::most_restrictive(draft.consent, source.consent);
        importance = i == 0 ? source.importance : std::max(importance, source.importance);
        for (const auto& tag : source.tags) {
            if (seen_tags.insert(tag).second) {
                draft.tags.push_back(tag);
            }
        }
    }
    draft.importance = importance;
    draft.similarity_key = embedder_->embed(draft.content, draft.tags);

    auto committed = store_->commit_summary(draft, children);
    if (!committed.ok()) {
        return R::error_from(committed);
    }
    const core::NodeId summary_id = committed.value();

    auto summary = store_->find(summary_id);
    if (summary) {
        auto indexed = index_->index(summary_id, summary->similarity_key, summary->importance, summary->created_at);
        if (!indexed.ok()) {
            ENGRAM_WARN("Summary {} not searchable: {}", summary_id, indexed.error());
        } else if (!store_->find(summary_id)) {
            index_->remove(summary_id);
        }
    }

    ENGRAM_INFO("Rolled {} {} nodes of {} into {} summary {}", children.size(), core::level_name(level),
                owner, core::level_name(*target_level), summary_id);
    return R(std::optional<core::NodeId>(summary_id));
}

RollupReport HierarchyAggregator::run_owner(const core::OwnerId& owner, const core::CancellationToken& cancel,
                                            std::optional<std::string>& storage_error) {
    RollupReport report;
    for (auto level : {core::Level::ATOMIC, core::Level::DAILY, core::Level::WEEKLY}) {
        for (size_t pass = 0; pass < config_.max_rollups_per_pass; ++pass) {
            auto result = rollup(owner, level, cancel);
            if (result.ok()) {
                if (!result.value()) {
                    break;
                }
                report.summaries_created++;
                continue;
            }
            switch (result.code()) {
                case core::Error::Code::MAINTENANCE_TIMEOUT:
                    report.timeouts++;
                    break;
                case core::Error::Code::CANCELLED:
                    report.cancelled = true;
                    return report;
                case core::Error::Code::STORAGE_UNAVAILABLE:
                    storage_error = result.error();
                    return report;
                default:
                    ENGRAM_WARN("Roll-up of {} {} failed: {}", owner, core::level_name(level), result.error());
                    report.failures++;
                    break;
            }
            break;
        }
    }
    return report;
}

core::Result<RollupReport> HierarchyAggregator::run(const core::CancellationToken& cancel) {
    const auto owners = store_->owners();
    std::vector<RollupReport> reports(owners.size());
    std::vector<std::optional<std::string>> storage_errors(owners.size());

    tbb::parallel_for(tbb::blocked_range<size_t>(0, owners.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i < range.end(); ++i) {
                if (cancel.is_cancelled()) {
                    reports[i].cancelled = true;
                    continue;
                }
                reports[i] = run_owner(owners[i], cancel, storage_errors[i]);
            }
        });

    RollupReport total;
    for (size_t i = 0; i < owners.size(); ++i) {
        if (storage_errors[i]) {
            return core::Result<RollupReport>::error(*storage_errors[i], core::Error::Code::STORAGE_UNAVAILABLE);
        }
        total.merge(reports[i]);
    }
    return total;
}

} // namespace hierarchy
} // namespace engram
