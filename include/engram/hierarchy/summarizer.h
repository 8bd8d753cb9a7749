#ifndef ENGRAM_HIERARCHY_SUMMARIZER_H_
#define ENGRAM_HIERARCHY_SUMMARIZER_H_

#include <string>
#include <vector>

#include "engram/core/result.h"
#include "engram/core/types.h"

namespace engram {
namespace hierarchy {

struct SummaryRequest {
    core::OwnerId owner;
    core::Level target_level = core::Level::DAILY;
    std::vector<core::MemoryNode> sources;  // chronological
};

/**
 * @brief Produces the content of a summary node from its sources
 *
 * Called from a worker thread with a deadline. An implementation that
 * overruns is abandoned, not interrupted, so it must not touch the graph.
 */
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual core::Result<std::string> summarize(const SummaryRequest& request) = 0;
};

/**
 * @brief Joins source contents into a bullet list capped at max_chars
 */
class ConcatenatingSummarizer : public Summarizer {
public:
    explicit ConcatenatingSummarizer(size_t max_chars);

    core::Result<std::string> summarize(const SummaryRequest& request) override;

private:
    size_t max_chars_;
};

} // namespace hierarchy
} // namespace engram

#endif // ENGRAM_HIERARCHY_SUMMARIZER_H_
