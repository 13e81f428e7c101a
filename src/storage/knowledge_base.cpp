#include <cairn/ml/provider.h>
#include <cairn/storage/knowledge_base.h>

#include <spdlog/spdlog.h>

namespace cairn::storage {

using metadata::EmbeddingType;

KnowledgeBase::KnowledgeBase(std::unique_ptr<metadata::GraphStore> store,
                             KnowledgeBaseConfig config)
    : config_(std::move(config)), store_(std::move(store)), index_(config_.index) {}

Result<std::unique_ptr<KnowledgeBase>> KnowledgeBase::open(const KnowledgeBaseConfig& config) {
    auto store = metadata::makeSqliteGraphStore(config.dbPath, config.store);
    if (!store)
        return store.error();
    return create(std::move(store).value(), config);
}

Result<std::unique_ptr<KnowledgeBase>>
KnowledgeBase::create(std::unique_ptr<metadata::GraphStore> store,
                      const KnowledgeBaseConfig& config) {
    if (!store) {
        return Error{ErrorCode::InvalidArgument, "KnowledgeBase needs a graph store"};
    }
    auto kb = std::unique_ptr<KnowledgeBase>(new KnowledgeBase(std::move(store), config));

    auto rebuilt = kb->rebuildIndex();
    if (!rebuilt)
        return rebuilt.error();

    if (config.verifyOnOpen) {
        auto verified = kb->verifyInvariants();
        if (!verified)
            return verified.error();
    }
    spdlog::debug("Knowledge base open at {} ({} content vectors)", config.dbPath,
                  kb->index_.size(EmbeddingType::Content));
    return kb;
}

Result<metadata::Node> KnowledgeBase::storeNodeWithEmbedding(const metadata::NodeDraft& draft,
                                                             EmbeddingType type,
                                                             const std::vector<float>& vector,
                                                             const std::string& model) {
    if (auto dim = index_.dimension(type); dim && *dim != vector.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Embedding has {} dimensions but the {} index holds {}",
                                 vector.size(), metadata::toString(type), *dim)};
    }

    auto node = store_->createNodeWithEmbedding(draft, type, vector, model);
    if (!node)
        return node.error();

    auto indexed = index_.insert(node.value().id, type, vector);
    if (!indexed) {
        spdlog::error("Node {} stored but not indexed ({}); rebuilding similarity index",
                      node.value().id, indexed.error().message);
        auto rebuilt = rebuildIndex();
        if (!rebuilt)
            return rebuilt.error();
    }
    return node;
}

Result<std::vector<vector::SimilarityMatch>>
KnowledgeBase::findSimilar(const std::vector<float>& query, EmbeddingType type, double threshold,
                           std::size_t limit) const {
    return index_.findSimilar(query, type, threshold, limit);
}

Result<void> KnowledgeBase::rebuildIndex() {
    return index_.rebuild(*store_);
}

Result<void> KnowledgeBase::verifyInvariants() {
    auto missing = store_->findLeavesMissingEmbedding(EmbeddingType::Content);
    if (!missing)
        return missing.error();
    if (!missing.value().empty()) {
        spdlog::error("{} leaf node(s) have no content embedding, first: {}",
                      missing.value().size(), missing.value().front());
        return Error{ErrorCode::CorruptedData,
                     fmt::format("{} leaf node(s) have no content embedding (first: {})",
                                 missing.value().size(), missing.value().front())};
    }

    auto stored = store_->countEmbeddings(EmbeddingType::Content);
    if (!stored)
        return stored.error();
    const auto indexed = index_.size(EmbeddingType::Content);
    if (static_cast<std::size_t>(stored.value()) != indexed) {
        spdlog::warn("Similarity index holds {} content vectors, store has {}; rebuilding",
                     indexed, stored.value());
        return rebuildIndex();
    }
    return {};
}

Result<std::size_t> KnowledgeBase::backfillEmbeddings(ml::IEmbeddingProvider& embedder) {
    auto missing = store_->findLeavesMissingEmbedding(EmbeddingType::Content);
    if (!missing)
        return missing.error();

    std::size_t repaired = 0;
    for (const auto& id : missing.value()) {
        auto node = store_->getNode(id);
        if (!node)
            return node.error();
        if (!node.value())
            continue;

        auto vec = embedder.generateEmbedding(node.value()->content);
        if (!vec)
            return vec.error();
        if (auto dim = index_.dimension(EmbeddingType::Content);
            dim && *dim != vec.value().size()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("{} returned {} dimensions for leaf {}, content index "
                                     "holds {}",
                                     embedder.getModelName(), vec.value().size(), id, *dim)};
        }

        metadata::NodeEmbedding embedding;
        embedding.nodeId = id;
        embedding.type = EmbeddingType::Content;
        embedding.vector = vec.value();
        embedding.model = embedder.getModelName();
        auto stored = store_->storeEmbedding(embedding);
        if (!stored)
            return stored.error();

        auto indexed = index_.insert(id, EmbeddingType::Content, embedding.vector);
        if (!indexed)
            return indexed.error();
        ++repaired;
    }
    if (repaired > 0)
        spdlog::info("Backfilled content embeddings for {} leaf node(s)", repaired);
    return repaired;
}

} // namespace cairn::storage
