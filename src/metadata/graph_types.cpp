#include <spdlog/spdlog.h>
#include <cairn/core/time_util.h>
#include <cairn/metadata/graph_types.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace cairn::metadata {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup(std::string_view s, const std::array<Enum, N>& values) {
    const std::string key = lower(s);
    for (Enum v : values) {
        if (key == toString(v))
            return v;
    }
    return std::nullopt;
}

constexpr std::uint8_t kBeliefMask =
    variantBit(NodeVariant::Internal) | variantBit(NodeVariant::Leaf);

// clang-format off
constexpr std::array<EdgeRule, 7> kEdgeRules{{
    //  type                    from                                                          to                                           status confidence rationale
    {EdgeType::Contains,    static_cast<std::uint8_t>(variantBit(NodeVariant::Module) | variantBit(NodeVariant::Internal)), kBeliefMask, true,  true,  false},
    {EdgeType::Supports,    kBeliefMask, kBeliefMask, true,  true,  true},
    {EdgeType::Contradicts, kBeliefMask, kBeliefMask, true,  true,  true},
    {EdgeType::Enables,     kBeliefMask, kBeliefMask, true,  true,  false},
    {EdgeType::Supersedes,  kBeliefMask, kBeliefMask, false, false, false},
    {EdgeType::References,  variantBit(NodeVariant::Organization),
                            static_cast<std::uint8_t>(variantBit(NodeVariant::Module) | kBeliefMask),  false, false, false},
    {EdgeType::SimilarTo,   kBeliefMask, kBeliefMask, true,  true,  false},
}};
// clang-format on

nlohmann::json optionalTime(const std::optional<TimePoint>& tp) {
    if (!tp)
        return nullptr;
    return core::formatIso8601(*tp);
}

nlohmann::json beliefJson(const BeliefFields& b) {
    nlohmann::json j;
    j["status"] = toString(b.status);
    j["source"] = b.source;
    j["confidence"] = b.confidence;
    j["purpose"] = toString(b.purpose);
    j["source_type"] = toString(b.sourceType);
    j["valence"] = b.valence ? nlohmann::json(toString(*b.valence)) : nlohmann::json(nullptr);
    j["valid_from"] = optionalTime(b.validFrom);
    j["valid_to"] = optionalTime(b.validTo);
    j["recorded_at"] = core::formatIso8601(b.recordedAt);
    j["suggested_at"] = optionalTime(b.suggestedAt);
    j["structured_data"] = b.structuredData;

    const auto& p = b.provenance;
    if (p.sessionId || p.messageIndex || p.sourceFile) {
        nlohmann::json prov;
        prov["session_id"] = p.sessionId ? nlohmann::json(*p.sessionId) : nlohmann::json(nullptr);
        prov["message_index"] =
            p.messageIndex ? nlohmann::json(*p.messageIndex) : nlohmann::json(nullptr);
        prov["source_char_start"] =
            p.charStart ? nlohmann::json(*p.charStart) : nlohmann::json(nullptr);
        prov["source_char_end"] = p.charEnd ? nlohmann::json(*p.charEnd) : nlohmann::json(nullptr);
        prov["source_file"] =
            p.sourceFile ? nlohmann::json(*p.sourceFile) : nlohmann::json(nullptr);
        j["provenance"] = std::move(prov);
    }
    return j;
}

} // namespace

const char* toString(NodeVariant v) {
    switch (v) {
        case NodeVariant::Module: return "module";
        case NodeVariant::Internal: return "internal";
        case NodeVariant::Leaf: return "leaf";
        case NodeVariant::Organization: return "organization";
    }
    return "unknown";
}

const char* toString(EdgeType t) {
    switch (t) {
        case EdgeType::Contains: return "CONTAINS";
        case EdgeType::Supports: return "SUPPORTS";
        case EdgeType::Contradicts: return "CONTRADICTS";
        case EdgeType::Enables: return "ENABLES";
        case EdgeType::Supersedes: return "SUPERSEDES";
        case EdgeType::References: return "REFERENCES";
        case EdgeType::SimilarTo: return "SIMILAR_TO";
    }
    return "UNKNOWN";
}

const char* toString(NodeStatus s) {
    switch (s) {
        case NodeStatus::Confirmed: return "confirmed";
        case NodeStatus::Suggested: return "suggested";
        case NodeStatus::Faded: return "faded";
        case NodeStatus::Rejected: return "rejected";
    }
    return "unknown";
}

const char* toString(NodePurpose p) {
    switch (p) {
        case NodePurpose::Observation: return "observation";
        case NodePurpose::Belief: return "belief";
        case NodePurpose::Pattern: return "pattern";
        case NodePurpose::Intention: return "intention";
        case NodePurpose::Decision: return "decision";
    }
    return "unknown";
}

const char* toString(SourceType s) {
    switch (s) {
        case SourceType::Explicit: return "explicit";
        case SourceType::Inferred: return "inferred";
    }
    return "unknown";
}

const char* toString(Valence v) {
    switch (v) {
        case Valence::Positive: return "positive";
        case Valence::Negative: return "negative";
        case Valence::Neutral: return "neutral";
    }
    return "unknown";
}

const char* toString(OrganizationKind k) {
    switch (k) {
        case OrganizationKind::Compression: return "compression";
        case OrganizationKind::Priority: return "priority";
        case OrganizationKind::Pattern: return "pattern";
        case OrganizationKind::Hypothesis: return "hypothesis";
        case OrganizationKind::Keyword: return "keyword";
        case OrganizationKind::Bridge: return "bridge";
    }
    return "unknown";
}

const char* toString(EdgeDirection d) {
    return d == EdgeDirection::Outgoing ? "outgoing" : "incoming";
}

const char* toString(EmbeddingType t) {
    switch (t) {
        case EmbeddingType::Content: return "content";
        case EmbeddingType::Title: return "title";
        case EmbeddingType::Context: return "context";
        case EmbeddingType::Query: return "query";
    }
    return "unknown";
}

std::optional<NodeVariant> parseNodeVariant(std::string_view s) {
    return lookup(s, std::array{NodeVariant::Module, NodeVariant::Internal, NodeVariant::Leaf,
                                NodeVariant::Organization});
}

std::optional<NodeStatus> parseNodeStatus(std::string_view s) {
    return lookup(s, std::array{NodeStatus::Confirmed, NodeStatus::Suggested, NodeStatus::Faded,
                                NodeStatus::Rejected});
}

std::optional<NodePurpose> parseNodePurpose(std::string_view s) {
    return lookup(s, std::array{NodePurpose::Observation, NodePurpose::Belief,
                                NodePurpose::Pattern, NodePurpose::Intention,
                                NodePurpose::Decision});
}

std::optional<SourceType> parseSourceType(std::string_view s) {
    return lookup(s, std::array{SourceType::Explicit, SourceType::Inferred});
}

std::optional<Valence> parseValence(std::string_view s) {
    return lookup(s, std::array{Valence::Positive, Valence::Negative, Valence::Neutral});
}

std::optional<OrganizationKind> parseOrganizationKind(std::string_view s) {
    return lookup(s, std::array{OrganizationKind::Compression, OrganizationKind::Priority,
                                OrganizationKind::Pattern, OrganizationKind::Hypothesis,
                                OrganizationKind::Keyword, OrganizationKind::Bridge});
}

std::optional<EmbeddingType> parseEmbeddingType(std::string_view s) {
    return lookup(s, std::array{EmbeddingType::Content, EmbeddingType::Title,
                                EmbeddingType::Context, EmbeddingType::Query});
}

Result<EdgeType> parseEdgeType(std::string_view s) {
    std::string key(s);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& rule : kEdgeRules) {
        if (key == toString(rule.type))
            return rule.type;
    }
    return Error{ErrorCode::ValidationError, "Unknown edge type '" + std::string(s) + "'"};
}

NodePurpose coercePurpose(std::string_view s) {
    if (auto p = parseNodePurpose(s))
        return *p;
    spdlog::debug("Unknown node purpose '{}', using observation", s);
    return NodePurpose::Observation;
}

NodeVariant variantOf(const NodePayload& payload) {
    switch (payload.index()) {
        case 0: return NodeVariant::Module;
        case 1: return NodeVariant::Internal;
        case 2: return NodeVariant::Leaf;
        default: return NodeVariant::Organization;
    }
}

NodeVariant Node::variant() const {
    return variantOf(payload);
}

const BeliefFields* Node::belief() const {
    if (auto* internal = std::get_if<InternalPayload>(&payload))
        return internal;
    if (auto* leaf = std::get_if<LeafPayload>(&payload))
        return leaf;
    return nullptr;
}

BeliefFields* Node::belief() {
    if (auto* internal = std::get_if<InternalPayload>(&payload))
        return internal;
    if (auto* leaf = std::get_if<LeafPayload>(&payload))
        return leaf;
    return nullptr;
}

const EdgeRule* findEdgeRule(EdgeType type) {
    for (const auto& rule : kEdgeRules) {
        if (rule.type == type)
            return &rule;
    }
    return nullptr;
}

bool isEdgePairAllowed(EdgeType type, NodeVariant from, NodeVariant to) {
    const EdgeRule* rule = findEdgeRule(type);
    if (!rule)
        return false;
    return (rule->fromMask & variantBit(from)) != 0 && (rule->toMask & variantBit(to)) != 0;
}

const std::vector<EdgeType>& semanticEdgeTypes() {
    static const std::vector<EdgeType> kTypes{EdgeType::Supports, EdgeType::Contradicts,
                                              EdgeType::Enables, EdgeType::Supersedes,
                                              EdgeType::SimilarTo};
    return kTypes;
}

Result<void> validateEdge(EdgeType type, NodeVariant from, NodeVariant to,
                          const EdgeProperties& props) {
    const EdgeRule* rule = findEdgeRule(type);
    if (!rule) {
        return Error{ErrorCode::ValidationError,
                     "Unknown edge type " + std::to_string(static_cast<int>(type))};
    }
    if (!isEdgePairAllowed(type, from, to)) {
        return Error{ErrorCode::ValidationError, std::string(toString(type)) + " edge from " +
                                                     toString(from) + " to " + toString(to) +
                                                     " cannot be created"};
    }
    if (props.status && !rule->hasStatus) {
        return Error{ErrorCode::ValidationError,
                     std::string(toString(type)) + " edges do not carry a status"};
    }
    if (props.confidence && !rule->hasConfidence) {
        return Error{ErrorCode::ValidationError,
                     std::string(toString(type)) + " edges do not carry a confidence"};
    }
    if (props.rationale && !rule->hasRationale) {
        return Error{ErrorCode::ValidationError,
                     std::string(toString(type)) + " edges do not carry a rationale"};
    }
    if (props.confidence && (*props.confidence < 0.0 || *props.confidence > 1.0)) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Edge confidence {} outside [0,1]", *props.confidence)};
    }
    return {};
}

EdgeProperties withEdgeDefaults(EdgeType type, EdgeProperties props) {
    const EdgeRule* rule = findEdgeRule(type);
    if (!rule)
        return props;
    if (rule->hasStatus && !props.status)
        props.status = NodeStatus::Confirmed;
    if (rule->hasConfidence && !props.confidence)
        props.confidence = 1.0;
    return props;
}

nlohmann::json toJson(const Node& node) {
    nlohmann::json j;
    j["id"] = node.id;
    j["variant"] = toString(node.variant());
    j["title"] = node.title;
    j["content"] = node.content;
    j["created_at"] = core::formatIso8601(node.createdAt);
    j["updated_at"] = core::formatIso8601(node.updatedAt);

    if (const auto* module = std::get_if<ModulePayload>(&node.payload)) {
        nlohmann::json intentions;
        intentions["primary"] = module->intentions.primary;
        intentions["secondary"] = module->intentions.secondary;
        intentions["definition_of_done"] = module->intentions.definitionOfDone;
        intentions["declared_priority"] = module->intentions.declaredPriority
                                              ? nlohmann::json(*module->intentions.declaredPriority)
                                              : nlohmann::json(nullptr);
        j["intentions"] = std::move(intentions);
        j["priority"] = module->priority;
        j["research_depth"] = module->researchDepth;
        j["active"] = module->active;
        j["declared_at"] = core::formatIso8601(module->declaredAt);
    } else if (const auto* org = std::get_if<OrganizationPayload>(&node.payload)) {
        j["kind"] = toString(org->kind);
        j["confidence"] = org->confidence;
        j["valid_from"] = optionalTime(org->validFrom);
        j["valid_to"] = optionalTime(org->validTo);
    } else if (const auto* belief = node.belief()) {
        j.update(beliefJson(*belief));
    }
    return j;
}

nlohmann::json toJson(const Edge& edge) {
    nlohmann::json j;
    j["id"] = edge.id;
    j["from"] = edge.fromId;
    j["to"] = edge.toId;
    j["type"] = toString(edge.type);
    if (edge.props.status)
        j["status"] = toString(*edge.props.status);
    if (edge.props.confidence)
        j["confidence"] = *edge.props.confidence;
    if (edge.props.rationale)
        j["rationale"] = *edge.props.rationale;
    j["created_at"] = core::formatIso8601(edge.createdAt);
    return j;
}

nlohmann::json toJson(const RelatedNode& related) {
    return {{"direction", toString(related.direction)},
            {"edge", toJson(related.edge)},
            {"node", toJson(related.node)}};
}

nlohmann::json toJson(const ModuleTree& tree) {
    nlohmann::json j = toJson(tree.node);
    j["children"] = nlohmann::json::array();
    for (const auto& child : tree.children)
        j["children"].push_back(toJson(child));
    return j;
}

} // namespace cairn::metadata
