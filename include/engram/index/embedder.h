#ifndef ENGRAM_INDEX_EMBEDDER_H_
#define ENGRAM_INDEX_EMBEDDER_H_

#include <string>
#include <vector>

#include "engram/core/types.h"

namespace engram {
namespace index {

/**
 * @brief Turns node content into a similarity key
 *
 * Implementations must be deterministic and thread safe; the key is derived
 * once at creation and queries are embedded with the same instance.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual core::SimilarityKey embed(const std::string& content,
                                      const std::vector<std::string>& tags) const = 0;
    virtual size_t dimensions() const = 0;
};

/**
 * @brief Feature-hashing embedder over lowercase word tokens and tags
 *
 * Each token lands in one of dimensions() buckets with a hash-derived sign;
 * tags count double. The vector is L2-normalized, so identical texts score
 * 1.0 and texts with no shared token score close to 0.
 */
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimensions);

    core::SimilarityKey embed(const std::string& content,
                              const std::vector<std::string>& tags) const override;
    size_t dimensions() const override { return dimensions_; }

    static std::vector<std::string> tokenize(const std::string& text);

private:
    size_t dimensions_;

    void add_feature(core::SimilarityKey& key, const std::string& token, float weight) const;
};

} // namespace index
} // namespace engram

#endif // ENGRAM_INDEX_EMBEDDER_H_
