#pragma once

#include <cairn/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cairn::metadata {

enum class NodeVariant { Module, Internal, Leaf, Organization };

enum class EdgeType { Contains, Supports, Contradicts, Enables, Supersedes, References, SimilarTo };

enum class NodeStatus { Confirmed, Suggested, Faded, Rejected };

enum class NodePurpose { Observation, Belief, Pattern, Intention, Decision };

enum class SourceType { Explicit, Inferred };

enum class Valence { Positive, Negative, Neutral };

enum class OrganizationKind { Compression, Priority, Pattern, Hypothesis, Keyword, Bridge };

enum class EdgeDirection { Outgoing, Incoming };

enum class EmbeddingType { Content, Title, Context, Query };

// Storage spellings. Variants/statuses are lowercase, edge types are upper snake case.
const char* toString(NodeVariant v);
const char* toString(EdgeType t);
const char* toString(NodeStatus s);
const char* toString(NodePurpose p);
const char* toString(SourceType s);
const char* toString(Valence v);
const char* toString(OrganizationKind k);
const char* toString(EdgeDirection d);
const char* toString(EmbeddingType t);

std::optional<NodeVariant> parseNodeVariant(std::string_view s);
std::optional<NodeStatus> parseNodeStatus(std::string_view s);
std::optional<NodePurpose> parseNodePurpose(std::string_view s);
std::optional<SourceType> parseSourceType(std::string_view s);
std::optional<Valence> parseValence(std::string_view s);
std::optional<OrganizationKind> parseOrganizationKind(std::string_view s);
std::optional<EmbeddingType> parseEmbeddingType(std::string_view s);

// Case-insensitive; accepts "similar_to" and "SIMILAR_TO". ValidationError for unknown names.
Result<EdgeType> parseEdgeType(std::string_view s);

// Unknown purposes fall back to Observation.
NodePurpose coercePurpose(std::string_view s);

struct ModuleIntentions {
    std::string primary;
    std::vector<std::string> secondary;
    std::string definitionOfDone;
    std::optional<double> declaredPriority;
};

struct ModulePayload {
    ModuleIntentions intentions;
    double priority = 0.0;
    int researchDepth = 5;
    bool active = true;
    TimePoint declaredAt{}; // epoch means "now" on create
};

/**
 * Where a proposition came from inside a conversation export.
 */
struct Provenance {
    std::optional<std::string> sessionId;
    std::optional<std::int64_t> messageIndex;
    std::optional<std::int64_t> charStart;
    std::optional<std::int64_t> charEnd;
    std::optional<std::string> sourceFile;
};

/**
 * Field set shared by Internal and Leaf nodes.
 */
struct BeliefFields {
    NodeStatus status = NodeStatus::Confirmed;
    std::string source = "conversation";
    double confidence = 1.0; // [0,1]
    NodePurpose purpose = NodePurpose::Observation;
    SourceType sourceType = SourceType::Explicit;
    std::optional<Valence> valence;
    std::optional<TimePoint> validFrom;
    std::optional<TimePoint> validTo;
    TimePoint recordedAt{}; // epoch means "now" on create
    std::optional<TimePoint> suggestedAt;
    Provenance provenance;
    nlohmann::json structuredData; // null when absent, object otherwise
};

struct InternalPayload : BeliefFields {};
struct LeafPayload : BeliefFields {};

struct OrganizationPayload {
    OrganizationKind kind = OrganizationKind::Compression;
    double confidence = 1.0;
    std::optional<TimePoint> validFrom;
    std::optional<TimePoint> validTo;
};

using NodePayload = std::variant<ModulePayload, InternalPayload, LeafPayload, OrganizationPayload>;

struct Node {
    NodeId id;
    std::string title;
    std::string content;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    NodePayload payload;

    NodeVariant variant() const;

    // Internal/Leaf fields; nullptr for Module and Organization nodes
    const BeliefFields* belief() const;
    BeliefFields* belief();
};

/**
 * Input to GraphStore::createNode. Id and timestamps are assigned by the store.
 */
struct NodeDraft {
    std::string title;
    std::string content;
    NodePayload payload;
};

NodeVariant variantOf(const NodePayload& payload);

struct EdgeProperties {
    std::optional<NodeStatus> status;
    std::optional<double> confidence;
    std::optional<std::string> rationale;
};

struct Edge {
    EdgeId id;
    NodeId fromId;
    NodeId toId;
    EdgeType type = EdgeType::Supports;
    EdgeProperties props;
    TimePoint createdAt{};
};

struct RelatedNode {
    Node node;
    Edge edge;
    EdgeDirection direction = EdgeDirection::Outgoing;
};

struct NodeEmbedding {
    NodeId nodeId;
    EmbeddingType type = EmbeddingType::Content;
    std::vector<float> vector;
    std::string model;
    TimePoint createdAt{};

    std::size_t dim() const { return vector.size(); }
};

struct ModuleTree {
    Node node;
    std::vector<ModuleTree> children;
};

/**
 * Static per-type edge rule: permitted endpoint variants and carried properties.
 * Every permitted pair set is a product of the from and to variant sets.
 */
struct EdgeRule {
    EdgeType type;
    std::uint8_t fromMask;
    std::uint8_t toMask;
    bool hasStatus;
    bool hasConfidence;
    bool hasRationale;
};

constexpr std::uint8_t variantBit(NodeVariant v) {
    return static_cast<std::uint8_t>(1u << static_cast<unsigned>(v));
}

const EdgeRule* findEdgeRule(EdgeType type);
bool isEdgePairAllowed(EdgeType type, NodeVariant from, NodeVariant to);

// Edge types covered by getRelated() without an explicit type
const std::vector<EdgeType>& semanticEdgeTypes();

/**
 * Checks type membership, the endpoint pair, the property set and the confidence range.
 * Endpoint existence is the store's job.
 */
Result<void> validateEdge(EdgeType type, NodeVariant from, NodeVariant to,
                          const EdgeProperties& props);

// Fill status/confidence defaults for types that carry them
EdgeProperties withEdgeDefaults(EdgeType type, EdgeProperties props);

nlohmann::json toJson(const Node& node);
nlohmann::json toJson(const Edge& edge);
nlohmann::json toJson(const RelatedNode& related);
nlohmann::json toJson(const ModuleTree& tree);

} // namespace cairn::metadata
