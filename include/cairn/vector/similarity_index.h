#pragma once

#include <cairn/core/types.h>
#include <cairn/metadata/graph_types.h>

#include <array>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace cairn::metadata {
class GraphStore;
}

namespace cairn::vector {

using metadata::EmbeddingType;

struct SimilarityIndexConfig {
    // Brute-force scan is the only strategy. Past this many vectors per type a warning
    // is logged once; an ANN index would plug in behind findSimilar().
    std::size_t corpusCeiling = 50'000;
};

struct SimilarityMatch {
    NodeId nodeId;
    double score = 0.0; // cosine similarity
};

/**
 * In-memory cosine index over node embeddings, one flat collection per embedding type.
 * Reconstructible at any time from the graph store (rebuild()).
 * Thread-safe: many concurrent readers, one writer.
 */
class SimilarityIndex {
public:
    explicit SimilarityIndex(SimilarityIndexConfig config = {});

    /**
     * @brief Append a vector. The first vector of a type fixes that type's dimension.
     * InvalidArgument for an empty vector or a dimension mismatch,
     * ValidationError when the node already has a vector of this type.
     */
    Result<void> insert(const NodeId& nodeId, EmbeddingType type, const std::vector<float>& vec);

    /**
     * @brief All stored vectors of `type` with cosine >= threshold, best first.
     * Zero-norm vectors (stored or query) never match. limit 0 means unlimited.
     */
    Result<std::vector<SimilarityMatch>> findSimilar(const std::vector<float>& query,
                                                     EmbeddingType type, double threshold,
                                                     std::size_t limit = 0) const;

    /**
     * @brief Replace the contents with all persisted embeddings from the store.
     * CorruptedData when the stored rows cannot be indexed; the old contents stay.
     */
    Result<void> rebuild(metadata::GraphStore& store);

    void clear();

    std::size_t size(EmbeddingType type) const;
    bool contains(const NodeId& nodeId, EmbeddingType type) const;

    // Empty until the first insert of that type
    std::optional<std::size_t> dimension(EmbeddingType type) const;

    const SimilarityIndexConfig& config() const { return config_; }

private:
    struct Entry {
        NodeId nodeId;
        std::vector<float> unit; // L2-normalised copy
        double norm = 0.0;       // norm of the raw vector
    };

    struct Bucket {
        std::vector<Entry> entries;
        std::unordered_set<NodeId> ids;
        std::size_t dim = 0;
        bool ceilingWarned = false;
    };

    static constexpr std::size_t kTypeCount = 4;

    Result<void> insertInto(Bucket& b, const NodeId& nodeId, EmbeddingType type,
                            const std::vector<float>& vec) const;
    Bucket& bucket(EmbeddingType type) { return buckets_[static_cast<std::size_t>(type)]; }
    const Bucket& bucket(EmbeddingType type) const {
        return buckets_[static_cast<std::size_t>(type)];
    }

    SimilarityIndexConfig config_;
    mutable std::shared_mutex mutex_;
    std::array<Bucket, kTypeCount> buckets_;
};

/**
 * Cosine similarity in double precision; 0.0 for mismatched sizes or a zero norm.
 */
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

double l2Norm(const std::vector<float>& vec);

// Unit-length copy; a zero vector is returned unchanged
std::vector<float> normalizeVector(const std::vector<float>& vec);

} // namespace cairn::vector
