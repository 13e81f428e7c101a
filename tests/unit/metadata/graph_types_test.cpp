#include <cairn/metadata/graph_types.h>

#include <gtest/gtest.h>

using namespace cairn;
using namespace cairn::metadata;

TEST(EdgeRulesTest, EveryTypeHasARule) {
    for (auto t : {EdgeType::Contains, EdgeType::Supports, EdgeType::Contradicts,
                   EdgeType::Enables, EdgeType::Supersedes, EdgeType::References,
                   EdgeType::SimilarTo}) {
        EXPECT_NE(findEdgeRule(t), nullptr) << toString(t);
    }
}

TEST(EdgeRulesTest, ContainsOnlyFromModuleOrInternal) {
    EXPECT_TRUE(isEdgePairAllowed(EdgeType::Contains, NodeVariant::Module, NodeVariant::Leaf));
    EXPECT_TRUE(
        isEdgePairAllowed(EdgeType::Contains, NodeVariant::Internal, NodeVariant::Internal));
    EXPECT_FALSE(isEdgePairAllowed(EdgeType::Contains, NodeVariant::Leaf, NodeVariant::Leaf));
    EXPECT_FALSE(
        isEdgePairAllowed(EdgeType::Contains, NodeVariant::Module, NodeVariant::Module));
}

TEST(EdgeRulesTest, ReferencesLeavesOrganizationSpace) {
    EXPECT_TRUE(
        isEdgePairAllowed(EdgeType::References, NodeVariant::Organization, NodeVariant::Module));
    EXPECT_FALSE(
        isEdgePairAllowed(EdgeType::References, NodeVariant::Leaf, NodeVariant::Organization));
    EXPECT_FALSE(isEdgePairAllowed(EdgeType::Supports, NodeVariant::Organization,
                                   NodeVariant::Leaf));
}

TEST(ValidateEdgeTest, RejectedPairNamesTheEndpoints) {
    auto r = validateEdge(EdgeType::Contains, NodeVariant::Leaf, NodeVariant::Leaf, {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_NE(r.error().message.find("cannot be created"), std::string::npos);
    EXPECT_NE(r.error().message.find("CONTAINS"), std::string::npos);
}

TEST(ValidateEdgeTest, PropertiesMustBelongToTheType) {
    EdgeProperties withRationale;
    withRationale.rationale = "because";
    EXPECT_TRUE(
        validateEdge(EdgeType::Supports, NodeVariant::Leaf, NodeVariant::Leaf, withRationale));
    EXPECT_FALSE(
        validateEdge(EdgeType::Enables, NodeVariant::Leaf, NodeVariant::Leaf, withRationale));

    EdgeProperties withStatus;
    withStatus.status = NodeStatus::Suggested;
    EXPECT_FALSE(
        validateEdge(EdgeType::Supersedes, NodeVariant::Leaf, NodeVariant::Leaf, withStatus));
}

TEST(ValidateEdgeTest, ConfidenceRange) {
    EdgeProperties props;
    props.confidence = 1.5;
    auto r = validateEdge(EdgeType::SimilarTo, NodeVariant::Leaf, NodeVariant::Leaf, props);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    props.confidence = 0.0;
    EXPECT_TRUE(validateEdge(EdgeType::SimilarTo, NodeVariant::Leaf, NodeVariant::Leaf, props));
}

TEST(ValidateEdgeTest, DefaultsFollowTheRule) {
    auto similar = withEdgeDefaults(EdgeType::SimilarTo, {});
    ASSERT_TRUE(similar.status);
    EXPECT_EQ(*similar.status, NodeStatus::Confirmed);
    ASSERT_TRUE(similar.confidence);
    EXPECT_DOUBLE_EQ(*similar.confidence, 1.0);

    auto supersedes = withEdgeDefaults(EdgeType::Supersedes, {});
    EXPECT_FALSE(supersedes.status);
    EXPECT_FALSE(supersedes.confidence);
}

TEST(EnumNamesTest, EdgeTypeParsingIsCaseInsensitive) {
    auto a = parseEdgeType("similar_to");
    ASSERT_TRUE(a);
    EXPECT_EQ(a.value(), EdgeType::SimilarTo);
    auto b = parseEdgeType("Supports");
    ASSERT_TRUE(b);
    EXPECT_EQ(b.value(), EdgeType::Supports);

    auto bad = parseEdgeType("LIKES");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ValidationError);
}

TEST(EnumNamesTest, PurposeCoercionFallsBackToObservation) {
    EXPECT_EQ(coercePurpose("decision"), NodePurpose::Decision);
    EXPECT_EQ(coercePurpose("Belief"), NodePurpose::Belief);
    EXPECT_EQ(coercePurpose("musing"), NodePurpose::Observation);
    EXPECT_EQ(coercePurpose(""), NodePurpose::Observation);
}

TEST(EnumNamesTest, VariantRoundTrip) {
    for (auto v : {NodeVariant::Module, NodeVariant::Internal, NodeVariant::Leaf,
                   NodeVariant::Organization}) {
        auto parsed = parseNodeVariant(toString(v));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, v);
    }
    EXPECT_FALSE(parseNodeVariant("branch"));
}

TEST(NodeTest, BeliefAccessorOnlyForInternalAndLeaf) {
    Node leaf;
    leaf.payload = LeafPayload{};
    EXPECT_EQ(leaf.variant(), NodeVariant::Leaf);
    EXPECT_NE(leaf.belief(), nullptr);

    Node module;
    module.payload = ModulePayload{};
    EXPECT_EQ(module.variant(), NodeVariant::Module);
    EXPECT_EQ(module.belief(), nullptr);
}

TEST(NodeTest, JsonCarriesVariantFields) {
    Node node;
    node.id = "n1";
    node.title = "i-ran-5k";
    node.content = "I ran 5K";
    LeafPayload leaf;
    leaf.purpose = NodePurpose::Observation;
    leaf.structuredData = {{"distance_km", 5}};
    leaf.provenance.sessionId = "s1";
    node.payload = leaf;

    auto j = toJson(node);
    EXPECT_EQ(j["variant"], "leaf");
    EXPECT_EQ(j["purpose"], "observation");
    EXPECT_EQ(j["structured_data"]["distance_km"], 5);
    EXPECT_EQ(j["provenance"]["session_id"], "s1");
}
