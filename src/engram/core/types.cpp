#include "engram/core/types.h"
#include <algorithm>

namespace engram {
namespace core {

const char* level_name(Level level) {
    switch (level) {
        case Level::ATOMIC: return "atomic";
        case Level::DAILY: return "daily";
        case Level::WEEKLY: return "weekly";
        case Level::MONTHLY: return "monthly";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "atomic") return Level::ATOMIC;
    if (name == "daily") return Level::DAILY;
    if (name == "weekly") return Level::WEEKLY;
    if (name == "monthly") return Level::MONTHLY;
    return std::nullopt;
}

std::optional<Level> coarser_level(Level level) {
    switch (level) {
        case Level::ATOMIC: return Level::DAILY;
        case Level::DAILY: return Level::WEEKLY;
        case Level::WEEKLY: return Level::MONTHLY;
        case Level::MONTHLY: return std::nullopt;
    }
    return std::nullopt;
}

const char* consent_name(ConsentLevel consent) {
    switch (consent) {
        case ConsentLevel::PRIVATE: return "private";
        case ConsentLevel::RESTRICTED: return "restricted";
        case ConsentLevel::SHARED: return "shared";
        case ConsentLevel::PUBLIC: return "public";
    }
    return "unknown";
}

std::optional<ConsentLevel> parse_consent(const std::string& name) {
    if (name == "private") return ConsentLevel::PRIVATE;
    if (name == "restricted") return ConsentLevel::RESTRICTED;
    if (name == "shared") return ConsentLevel::SHARED;
    if (name == "public") return ConsentLevel::PUBLIC;
    return std::nullopt;
}

ConsentLevel most_restrictive(ConsentLevel a, ConsentLevel b) {
    return static_cast<uint8_t>(a) <= static_cast<uint8_t>(b) ? a : b;
}

bool MemoryNode::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace core
} // namespace engram
