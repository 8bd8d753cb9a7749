#include "engram/index/embedder.h"

#include <cctype>
#include <cmath>

namespace engram {
namespace index {

HashingEmbedder::HashingEmbedder(size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::vector<std::string> HashingEmbedder::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

void HashingEmbedder::add_feature(core::SimilarityKey& key, const std::string& token, float weight) const {
    // FNV-1a, stable across runs and platforms
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    const size_t bucket = hash % dimensions_;
    const float sign = ((hash >> 63) & 1) ? -1.0f : 1.0f;
    key[bucket] += sign * weight;
}

core::SimilarityKey HashingEmbedder::embed(const std::string& content,
                                           const std::vector<std::string>& tags) const {
    core::SimilarityKey key(dimensions_, 0.0f);
    for (const auto& token : tokenize(content)) {
        add_feature(key, token, 1.0f);
    }
    for (const auto& tag : tags) {
        for (const auto& token : tokenize(tag)) {
            add_feature(key, token, 2.0f);
        }
    }

    double norm = 0.0;
    for (float v : key) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : key) {
            v *= inv;
        }
    }
    return key;
}

} // namespace index
} // namespace engram
