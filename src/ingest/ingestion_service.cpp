#include <cairn/extraction/extraction_provider.h>
#include <cairn/ingest/ingestion_service.h>
#include <cairn/ingest/title_util.h>
#include <cairn/ml/provider.h>
#include <cairn/storage/knowledge_base.h>
#include <cairn/vector/similarity_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace cairn::ingest {

using metadata::EdgeProperties;
using metadata::EdgeType;
using metadata::EmbeddingType;

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::optional<std::string> nonEmpty(const std::string& s) {
    if (s.empty())
        return std::nullopt;
    return s;
}

} // namespace

IngestionService::IngestionService(storage::KnowledgeBase& kb,
                                   std::shared_ptr<extraction::IExtractionProvider> extractor,
                                   std::shared_ptr<ml::IEmbeddingProvider> embedder,
                                   IngestionConfig config)
    : kb_(kb), extractor_(std::move(extractor)), embedder_(std::move(embedder)),
      config_(std::move(config)) {}

Result<IngestionResult> IngestionService::ingestMessage(const std::string& text,
                                                        const SessionMetadata& meta) {
    if (!extractor_ || !embedder_) {
        return Error{ErrorCode::NotInitialized, "Ingestion needs an extractor and an embedder"};
    }

    IngestionResult result;
    result.sessionId = meta.sessionId;
    if (isBlank(text)) {
        spdlog::debug("Skipping blank message");
        return result;
    }

    auto writer = kb_.acquireWriter();

    auto extracted = extractor_->extract(text);
    if (!extracted) {
        spdlog::warn("Extraction failed: {}", extracted.error().message);
        return extracted.error();
    }
    result.propositionsExtracted = extracted.value().size();

    // Reject the whole message before anything is written
    for (std::size_t i = 0; i < extracted.value().size(); ++i) {
        auto valid = extraction::validateProposition(extracted.value()[i], i);
        if (!valid) {
            spdlog::warn("Extraction returned an unusable proposition: {}",
                         valid.error().message);
            return valid.error();
        }
    }

    auto staged = classify(std::move(extracted).value(), result);
    if (!staged)
        return staged.error();

    // Store every unique proposition before linking so they can link to each other
    const std::string model = embedder_->getModelName();
    std::vector<std::pair<NodeId, const std::vector<float>*>> stored;
    for (auto& candidate : staged.value()) {
        const auto& prop = candidate.proposition;

        metadata::LeafPayload leaf;
        leaf.source = meta.source.value_or(config_.source);
        leaf.confidence = prop.confidence;
        leaf.purpose = prop.purpose;
        leaf.sourceType = prop.sourceType;
        leaf.structuredData = prop.structuredData;
        leaf.provenance.sessionId = meta.sessionId;
        leaf.provenance.messageIndex = meta.messageIndex;
        leaf.provenance.charStart = meta.charStart;
        leaf.provenance.charEnd = meta.charEnd;
        leaf.provenance.sourceFile = meta.sourceFile;

        metadata::NodeDraft draft;
        draft.title = util::slugify(prop.text, config_.titleWords);
        draft.content = prop.text;
        draft.payload = std::move(leaf);

        auto node = kb_.storeNodeWithEmbedding(draft, EmbeddingType::Content, candidate.vector,
                                               model);
        if (!node) {
            spdlog::error("Failed to store proposition '{}' ({} of {} already stored): {}",
                          draft.title, stored.size(), staged.value().size(),
                          node.error().message);
            for (const auto& [id, vec] : stored)
                linkSimilar(id, *vec);
            return node.error();
        }
        result.nodeIds.push_back(node.value().id);
        result.propositions.push_back(prop);
        ++result.propositionsStored;
        stored.emplace_back(node.value().id, &candidate.vector);
    }

    for (const auto& [id, vec] : stored) {
        result.edgesCreated += linkSimilar(id, *vec);
    }

    spdlog::info("Ingested message: {} extracted, {} stored, {} duplicate(s), {} edge(s)",
                 result.propositionsExtracted, result.propositionsStored,
                 result.duplicatesFound, result.edgesCreated);
    return result;
}

Result<IngestionResult> IngestionService::ingestMessage(const ConversationMessage& message) {
    SessionMetadata meta;
    meta.sessionId = nonEmpty(message.sessionId);
    meta.messageIndex = message.messageIndex;
    meta.charStart = message.charStart;
    meta.charEnd = message.charEnd;
    meta.sourceFile = nonEmpty(message.sourceFile);
    return ingestMessage(message.text, meta);
}

Result<std::vector<IngestionService::Candidate>>
IngestionService::classify(std::vector<extraction::Proposition> propositions,
                           IngestionResult& result) {
    std::vector<Candidate> unique;
    for (auto& prop : propositions) {
        auto embedding = embedder_->generateEmbedding(prop.text);
        if (!embedding) {
            spdlog::warn("Embedding failed for '{}': {}", prop.text, embedding.error().message);
            return embedding.error();
        }

        auto hits = kb_.findSimilar(embedding.value(), EmbeddingType::Content,
                                    config_.dedupThreshold, 1);
        if (!hits)
            return hits.error();

        bool duplicate = !hits.value().empty();
        if (duplicate) {
            spdlog::debug("Duplicate of {} ({:.3f}): {}", hits.value().front().nodeId,
                          hits.value().front().score, prop.text);
        } else {
            // Not yet indexed: propositions kept earlier in this message
            for (const auto& earlier : unique) {
                if (vector::cosineSimilarity(embedding.value(), earlier.vector) >=
                    config_.dedupThreshold) {
                    spdlog::debug("Duplicate within message: {}", prop.text);
                    duplicate = true;
                    break;
                }
            }
        }

        if (duplicate) {
            ++result.duplicatesFound;
            continue;
        }
        unique.push_back(Candidate{std::move(prop), std::move(embedding).value()});
    }
    return unique;
}

std::size_t IngestionService::linkSimilar(const NodeId& id, const std::vector<float>& vector) {
    auto matches = kb_.findSimilar(vector, EmbeddingType::Content, config_.relatedThreshold);
    if (!matches) {
        spdlog::debug("Similarity search for {} failed: {}", id, matches.error().message);
        return 0;
    }

    auto& store = kb_.store();
    std::size_t created = 0;
    for (const auto& match : matches.value()) {
        if (created >= config_.maxLinksPerNode)
            break;
        if (match.nodeId == id || match.score >= config_.dedupThreshold)
            continue;

        auto forward = store.edgeExists(id, match.nodeId, EdgeType::SimilarTo);
        auto backward = store.edgeExists(match.nodeId, id, EdgeType::SimilarTo);
        if (!forward || !backward) {
            spdlog::debug("Edge lookup {} <-> {} failed", id, match.nodeId);
            continue;
        }
        if (forward.value() || backward.value())
            continue;

        EdgeProperties props;
        props.confidence = std::clamp(match.score, 0.0, 1.0);
        auto edge = store.createEdge(id, match.nodeId, EdgeType::SimilarTo, props);
        if (!edge) {
            spdlog::debug("SIMILAR_TO {} -> {} not created: {}", id, match.nodeId,
                          edge.error().message);
            continue;
        }
        ++created;
    }
    return created;
}

BatchIngestionResult
IngestionService::ingestBatch(const std::vector<ConversationMessage>& messages) {
    BatchIngestionResult batch;
    for (const auto& message : messages) {
        if (message.speaker != Speaker::User)
            continue;
        ++batch.totalMessages;
        // Attempted sessions count, whether or not the message succeeds
        if (!message.sessionId.empty())
            batch.sessionsProcessed.insert(message.sessionId);

        auto r = ingestMessage(message);
        if (!r) {
            spdlog::warn("Message {} of {} failed: {}", message.messageIndex,
                         message.sourceFile.empty() ? "<inline>" : message.sourceFile,
                         r.error().message);
            batch.errors.push_back(IngestionError{message.messageIndex,
                                                  nonEmpty(message.sourceFile), r.error().code,
                                                  r.error().message});
            continue;
        }

        const auto& res = r.value();
        batch.totalExtracted += res.propositionsExtracted;
        batch.totalStored += res.propositionsStored;
        batch.totalDuplicates += res.duplicatesFound;
        batch.totalEdges += res.edgesCreated;
    }
    return batch;
}

Result<BatchIngestionResult> IngestionService::ingestDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return Error{ErrorCode::IoError, "Not a directory: " + dir.string()};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".md")
            files.push_back(entry.path());
    }
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Cannot list " + dir.string() + ": " + ec.message()};
    }
    std::sort(files.begin(), files.end());

    BatchIngestionResult total;
    for (const auto& file : files) {
        auto messages = parser_.parseFile(file);
        if (!messages) {
            spdlog::warn("Skipping {}: {}", file.filename().string(), messages.error().message);
            total.errors.push_back(IngestionError{std::nullopt, file.filename().string(),
                                                  messages.error().code,
                                                  messages.error().message});
            continue;
        }

        auto batch = ingestBatch(messages.value());
        total.totalMessages += batch.totalMessages;
        total.totalExtracted += batch.totalExtracted;
        total.totalStored += batch.totalStored;
        total.totalDuplicates += batch.totalDuplicates;
        total.totalEdges += batch.totalEdges;
        total.sessionsProcessed.insert(batch.sessionsProcessed.begin(),
                                       batch.sessionsProcessed.end());
        total.errors.insert(total.errors.end(), batch.errors.begin(), batch.errors.end());
    }

    spdlog::info("Imported {} file(s): {} message(s), {} stored, {} error(s)", files.size(),
                 total.totalMessages, total.totalStored, total.errors.size());
    return total;
}

} // namespace cairn::ingest
