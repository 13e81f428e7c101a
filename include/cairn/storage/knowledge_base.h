#pragma once

#include <cairn/core/types.h>
#include <cairn/metadata/graph_store.h>
#include <cairn/vector/similarity_index.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cairn::ml {
class IEmbeddingProvider;
}

namespace cairn::storage {

struct KnowledgeBaseConfig {
    std::string dbPath = ":memory:";
    metadata::GraphStoreConfig store;
    vector::SimilarityIndexConfig index;

    // Refuse to open when a Leaf lacks its content embedding
    bool verifyOnOpen = true;
};

/**
 * A knowledge base is one SQLite graph store plus the in-memory similarity index
 * derived from it.
 *
 * Writes go to the store first (node row, then embedding row, one transaction) and
 * are appended to the index only after the commit; the index can always be rebuilt
 * from the store. One writer at a time: hold acquireWriter() across a unit of work.
 */
class KnowledgeBase {
public:
    static Result<std::unique_ptr<KnowledgeBase>> open(const KnowledgeBaseConfig& config);

    // Adopt an already opened store (rebuilds the index, then verifies if configured)
    static Result<std::unique_ptr<KnowledgeBase>>
    create(std::unique_ptr<metadata::GraphStore> store, const KnowledgeBaseConfig& config = {});

    KnowledgeBase(const KnowledgeBase&) = delete;
    KnowledgeBase& operator=(const KnowledgeBase&) = delete;

    metadata::GraphStore& store() { return *store_; }
    const vector::SimilarityIndex& index() const { return index_; }
    const KnowledgeBaseConfig& config() const { return config_; }

    /**
     * @brief Two-phase write: durable node+embedding, then index append.
     * InvalidData when the vector width disagrees with what the index already holds.
     */
    Result<metadata::Node> storeNodeWithEmbedding(const metadata::NodeDraft& draft,
                                                  metadata::EmbeddingType type,
                                                  const std::vector<float>& vector,
                                                  const std::string& model);

    Result<std::vector<vector::SimilarityMatch>> findSimilar(const std::vector<float>& query,
                                                             metadata::EmbeddingType type,
                                                             double threshold,
                                                             std::size_t limit = 0) const;

    Result<void> rebuildIndex();

    /**
     * @brief CorruptedData when any Leaf has no content embedding.
     * Rebuilds the index when its size disagrees with the store.
     */
    Result<void> verifyInvariants();

    /**
     * @brief Embed and store the content vector of every Leaf that lacks one.
     * @return number of leaves repaired
     */
    Result<std::size_t> backfillEmbeddings(ml::IEmbeddingProvider& embedder);

    [[nodiscard]] std::unique_lock<std::mutex> acquireWriter() {
        return std::unique_lock<std::mutex>(writerMutex_);
    }

private:
    KnowledgeBase(std::unique_ptr<metadata::GraphStore> store, KnowledgeBaseConfig config);

    KnowledgeBaseConfig config_;
    std::unique_ptr<metadata::GraphStore> store_;
    vector::SimilarityIndex index_;
    std::mutex writerMutex_;
};

} // namespace cairn::storage
