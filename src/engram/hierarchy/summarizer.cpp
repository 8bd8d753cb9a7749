#include "engram/hierarchy/summarizer.h"

#include <sstream>

namespace engram {
namespace hierarchy {

ConcatenatingSummarizer::ConcatenatingSummarizer(size_t max_chars)
    : max_chars_(max_chars) {}

core::Result<std::string> ConcatenatingSummarizer::summarize(const SummaryRequest& request) {
    if (request.sources.empty()) {
        return core::Result<std::string>::error("nothing to summarize", core::Error::Code::INVALID_ARGUMENT);
    }

    std::ostringstream out;
    out << core::level_name(request.target_level) << " summary of " << request.sources.size()
        << " memories from " << request.owner;
    for (const auto& source : request.sources) {
        out << "\n- " << source.content;
    }

    std::string text = out.str();
    if (max_chars_ > 0 && text.size() > max_chars_) {
        const std::string ellipsis = "...";
        text.resize(max_chars_ > ellipsis.size() ? max_chars_ - ellipsis.size() : 0);
        text += ellipsis;
    }
    return text;
}

} // namespace hierarchy
} // namespace engram
