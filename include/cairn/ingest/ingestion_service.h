#pragma once

#include <cairn/core/types.h>
#include <cairn/extraction/proposition.h>
#include <cairn/ingest/conversation.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cairn::extraction {
class IExtractionProvider;
}
namespace cairn::ml {
class IEmbeddingProvider;
}
namespace cairn::storage {
class KnowledgeBase;
}

namespace cairn::ingest {

struct IngestionConfig {
    double dedupThreshold = 0.95;   // cosine at or above: same claim, not stored
    double relatedThreshold = 0.85; // cosine at or above (and below dedup): SIMILAR_TO edge
    std::size_t maxLinksPerNode = 5;
    std::size_t titleWords = 5;
    std::string source = "conversation";
};

// Provenance attached to every Leaf created from one message
struct SessionMetadata {
    std::optional<std::string> sessionId;
    std::optional<std::int64_t> messageIndex;
    std::optional<std::int64_t> charStart;
    std::optional<std::int64_t> charEnd;
    std::optional<std::string> sourceFile;
    std::optional<std::string> source; // overrides IngestionConfig::source
};

struct IngestionResult {
    std::vector<NodeId> nodeIds; // stored leaves, extraction order
    std::vector<extraction::Proposition> propositions;
    std::size_t propositionsExtracted = 0;
    std::size_t propositionsStored = 0;
    std::size_t duplicatesFound = 0;
    std::size_t edgesCreated = 0;
    std::optional<std::string> sessionId;
};

struct IngestionError {
    std::optional<std::int64_t> messageIndex;
    std::optional<std::string> sourceFile;
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

struct BatchIngestionResult {
    std::size_t totalMessages = 0; // messages extracted (user turns only)
    std::size_t totalExtracted = 0;
    std::size_t totalStored = 0;
    std::size_t totalDuplicates = 0;
    std::size_t totalEdges = 0;
    std::set<std::string> sessionsProcessed; // every session with an attempted user turn
    std::vector<IngestionError> errors;
};

/**
 * Leaf-first ingestion: extract -> embed -> dedup -> store -> link.
 *
 * Everything runs sequentially; later propositions see earlier ones from the same
 * message and from earlier messages of the same batch. The knowledge base writer lock
 * is held for one message at a time.
 */
class IngestionService {
public:
    IngestionService(storage::KnowledgeBase& kb,
                     std::shared_ptr<extraction::IExtractionProvider> extractor,
                     std::shared_ptr<ml::IEmbeddingProvider> embedder,
                     IngestionConfig config = {});

    Result<IngestionResult> ingestMessage(const std::string& text,
                                          const SessionMetadata& meta = {});

    Result<IngestionResult> ingestMessage(const ConversationMessage& message);

    /**
     * @brief Ingest the user turns of a conversation.
     * A failing message is recorded in errors and the batch continues.
     */
    BatchIngestionResult ingestBatch(const std::vector<ConversationMessage>& messages);

    /**
     * @brief Parse and ingest every *.md export under dir, in file name order.
     * IoError when dir is not a directory; per-file failures land in errors.
     */
    Result<BatchIngestionResult> ingestDirectory(const std::filesystem::path& dir);

    const IngestionConfig& config() const { return config_; }

private:
    struct Candidate {
        extraction::Proposition proposition;
        std::vector<float> vector;
    };

    Result<std::vector<Candidate>> classify(std::vector<extraction::Proposition> propositions,
                                            IngestionResult& result);
    std::size_t linkSimilar(const NodeId& id, const std::vector<float>& vector);

    storage::KnowledgeBase& kb_;
    std::shared_ptr<extraction::IExtractionProvider> extractor_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    IngestionConfig config_;
    ConversationParser parser_;
};

} // namespace cairn::ingest
