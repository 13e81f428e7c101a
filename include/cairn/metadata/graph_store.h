#pragma once

#include <cairn/core/types.h>
#include <cairn/metadata/graph_types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::metadata {

/**
 * GraphStoreConfig controls how the SQLite file is opened.
 */
struct GraphStoreConfig {
    // Use WAL mode (ignored for ":memory:")
    bool enable_wal = true;

    std::chrono::milliseconds busy_timeout{5000};

    // Upper bound for unbounded listings
    std::size_t default_limit = 1000;
};

/**
 * GraphStore is the typed node/edge/embedding store behind a knowledge base.
 *
 * Nodes are never deleted. Edges are validated against the static edge rule table
 * before anything is written. Organization nodes stay out of getChildren, the default
 * getRelated set and listNodes() without a variant.
 * Implementations serialize access internally and are safe to share between threads.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual const GraphStoreConfig& getConfig() const = 0;

    // -----------------------------------------------------------------------------
    // Nodes
    // -----------------------------------------------------------------------------

    // Assigns a UUID and timestamps. Confidence outside [0,1] is a ValidationError.
    virtual Result<Node> createNode(const NodeDraft& draft) = 0;

    // Node row and embedding row in one transaction; neither is written on failure.
    virtual Result<Node> createNodeWithEmbedding(const NodeDraft& draft, EmbeddingType type,
                                                 const std::vector<float>& vector,
                                                 const std::string& model) = 0;

    // Empty optional when the id is unknown
    virtual Result<std::optional<Node>> getNode(const NodeId& id) = 0;

    virtual Result<std::vector<Node>> listNodes(std::optional<NodeVariant> variant = std::nullopt,
                                                std::size_t limit = 100,
                                                std::size_t offset = 0) = 0;

    // Ordered by message index, then recorded time
    virtual Result<std::vector<Node>> findNodesBySession(std::string_view sessionId) = 0;

    // Half-open [from, to) on recorded_at
    virtual Result<std::vector<Node>> findNodesByRecordedRange(TimePoint from, TimePoint to) = 0;

    // Internal/Leaf only; NotFound for unknown ids, InvalidArgument for other variants
    virtual Result<void> updateNodeStatus(const NodeId& id, NodeStatus status) = 0;

    virtual Result<std::int64_t> countNodes(std::optional<NodeVariant> variant = std::nullopt) = 0;

    // -----------------------------------------------------------------------------
    // Edges
    // -----------------------------------------------------------------------------

    /**
     * @brief Create a typed edge.
     *
     * ValidationError for a forbidden variant pair ("cannot be created"), a property the
     * type does not carry, confidence outside [0,1] or a repeated (from, to, type).
     * NotFound when either endpoint is absent.
     */
    virtual Result<Edge> createEdge(const NodeId& fromId, const NodeId& toId, EdgeType type,
                                    const EdgeProperties& props = {}) = 0;

    // CONTAINS targets. Empty for Leaf/Organization, NotFound for an unknown id.
    virtual Result<std::vector<Node>> getChildren(const NodeId& id) = 0;

    // Both directions. Without a type, covers semanticEdgeTypes().
    virtual Result<std::vector<RelatedNode>>
    getRelated(const NodeId& id, std::optional<EdgeType> type = std::nullopt) = 0;

    virtual Result<std::vector<RelatedNode>> findContradictions(const NodeId& id) = 0;

    // CONTAINS hierarchy below rootId, depth-limited and cycle-safe
    virtual Result<ModuleTree> getModuleTree(const NodeId& rootId, int maxDepth = 3) = 0;

    virtual Result<bool> edgeExists(const NodeId& fromId, const NodeId& toId, EdgeType type) = 0;

    virtual Result<std::int64_t> countEdges(std::optional<EdgeType> type = std::nullopt) = 0;

    // -----------------------------------------------------------------------------
    // Embeddings
    // -----------------------------------------------------------------------------

    // Immutable per (node, type): a second write is a ValidationError
    virtual Result<void> storeEmbedding(const NodeEmbedding& embedding) = 0;

    virtual Result<std::vector<NodeEmbedding>> getEmbeddings(const NodeId& id) = 0;

    // Everything of one aspect, in insertion order; feeds the similarity index rebuild
    virtual Result<std::vector<NodeEmbedding>> loadEmbeddings(EmbeddingType type) = 0;

    virtual Result<std::vector<NodeId>>
    findLeavesMissingEmbedding(EmbeddingType type = EmbeddingType::Content) = 0;

    virtual Result<std::int64_t> countEmbeddings(EmbeddingType type) = 0;

    // -----------------------------------------------------------------------------
    // Maintenance
    // -----------------------------------------------------------------------------

    // PRAGMA integrity_check
    virtual Result<void> healthCheck() = 0;

    virtual Result<int> schemaVersion() = 0;
};

// Opens (creating if needed) and migrates a SQLite-backed store. ":memory:" is accepted.
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg = {});

} // namespace cairn::metadata
