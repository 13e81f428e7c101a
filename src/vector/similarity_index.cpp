#include <spdlog/spdlog.h>
#include <cairn/metadata/graph_store.h>
#include <cairn/vector/similarity_index.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace cairn::vector {

double l2Norm(const std::vector<float>& vec) {
    double norm = 0.0;
    for (float val : vec) {
        norm += static_cast<double>(val) * static_cast<double>(val);
    }
    return std::sqrt(norm);
}

std::vector<float> normalizeVector(const std::vector<float>& vec) {
    const double norm = l2Norm(vec);
    if (norm == 0.0) {
        return vec;
    }

    std::vector<float> normalized;
    normalized.reserve(vec.size());
    for (float val : vec) {
        normalized.push_back(static_cast<float>(static_cast<double>(val) / norm));
    }
    return normalized;
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return std::clamp(dot_product / (norm_a * norm_b), -1.0, 1.0);
}

SimilarityIndex::SimilarityIndex(SimilarityIndexConfig config) : config_(config) {}

Result<void> SimilarityIndex::insert(const NodeId& nodeId, EmbeddingType type,
                                     const std::vector<float>& vec) {
    std::unique_lock lock(mutex_);
    return insertInto(bucket(type), nodeId, type, vec);
}

Result<void> SimilarityIndex::insertInto(Bucket& b, const NodeId& nodeId, EmbeddingType type,
                                         const std::vector<float>& vec) const {
    if (vec.empty()) {
        return Error{ErrorCode::InvalidArgument, "Cannot index an empty vector"};
    }
    if (b.dim != 0 && vec.size() != b.dim) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{} vector has dimension {}, index expects {}",
                                 metadata::toString(type), vec.size(), b.dim)};
    }
    if (b.ids.count(nodeId) != 0) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Node {} already has a {} vector in the index", nodeId,
                                 metadata::toString(type))};
    }

    Entry entry;
    entry.nodeId = nodeId;
    entry.norm = l2Norm(vec);
    entry.unit = normalizeVector(vec);
    if (entry.norm == 0.0) {
        spdlog::debug("Indexed zero-norm {} vector for node {}; it will never match",
                      metadata::toString(type), nodeId);
    }

    if (b.dim == 0)
        b.dim = vec.size();
    b.ids.insert(nodeId);
    b.entries.push_back(std::move(entry));

    if (!b.ceilingWarned && b.entries.size() > config_.corpusCeiling) {
        b.ceilingWarned = true;
        spdlog::warn("Similarity index holds {} {} vectors, above the brute-force ceiling of {}; "
                     "lookups will slow down linearly",
                     b.entries.size(), metadata::toString(type), config_.corpusCeiling);
    }
    return {};
}

Result<std::vector<SimilarityMatch>> SimilarityIndex::findSimilar(const std::vector<float>& query,
                                                                  EmbeddingType type,
                                                                  double threshold,
                                                                  std::size_t limit) const {
    std::shared_lock lock(mutex_);
    const auto& b = bucket(type);
    std::vector<SimilarityMatch> matches;
    if (b.entries.empty())
        return matches;

    if (query.size() != b.dim) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Query has dimension {}, {} index expects {}", query.size(),
                                 metadata::toString(type), b.dim)};
    }

    const double queryNorm = l2Norm(query);
    if (queryNorm == 0.0)
        return matches;

    for (const auto& entry : b.entries) {
        if (entry.norm == 0.0)
            continue;
        double dot = 0.0;
        for (std::size_t i = 0; i < query.size(); ++i) {
            dot += static_cast<double>(query[i]) * static_cast<double>(entry.unit[i]);
        }
        const double score = std::clamp(dot / queryNorm, -1.0, 1.0);
        if (score >= threshold) {
            matches.push_back(SimilarityMatch{entry.nodeId, score});
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const SimilarityMatch& a, const SimilarityMatch& b) {
                         return a.score > b.score;
                     });
    if (limit > 0 && matches.size() > limit)
        matches.resize(limit);
    return matches;
}

Result<void> SimilarityIndex::rebuild(metadata::GraphStore& store) {
    constexpr std::array<EmbeddingType, kTypeCount> kTypes{
        EmbeddingType::Content, EmbeddingType::Title, EmbeddingType::Context,
        EmbeddingType::Query};

    // Load outside the lock; readers keep the old contents until the swap
    std::array<std::vector<metadata::NodeEmbedding>, kTypeCount> loaded;
    for (auto type : kTypes) {
        auto rows = store.loadEmbeddings(type);
        if (!rows)
            return rows.error();
        loaded[static_cast<std::size_t>(type)] = std::move(rows).value();
    }

    // Built aside and swapped in whole; a failed rebuild keeps the previous contents
    std::array<Bucket, kTypeCount> fresh;
    std::size_t total = 0;
    for (auto type : kTypes) {
        const auto slot = static_cast<std::size_t>(type);
        for (const auto& row : loaded[slot]) {
            auto r = insertInto(fresh[slot], row.nodeId, type, row.vector);
            if (!r) {
                return Error{ErrorCode::CorruptedData,
                             "Rebuilding similarity index failed: " + r.error().message};
            }
            ++total;
        }
    }

    std::unique_lock lock(mutex_);
    buckets_.swap(fresh);
    lock.unlock();
    spdlog::debug("Similarity index rebuilt with {} vectors", total);
    return {};
}

void SimilarityIndex::clear() {
    std::unique_lock lock(mutex_);
    for (auto& b : buckets_)
        b = Bucket{};
}

std::size_t SimilarityIndex::size(EmbeddingType type) const {
    std::shared_lock lock(mutex_);
    return bucket(type).entries.size();
}

bool SimilarityIndex::contains(const NodeId& nodeId, EmbeddingType type) const {
    std::shared_lock lock(mutex_);
    return bucket(type).ids.count(nodeId) != 0;
}

std::optional<std::size_t> SimilarityIndex::dimension(EmbeddingType type) const {
    std::shared_lock lock(mutex_);
    const auto& b = bucket(type);
    if (b.dim == 0)
        return std::nullopt;
    return b.dim;
}

} // namespace cairn::vector
