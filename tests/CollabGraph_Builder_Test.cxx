// CollabGraph_Builder_Test.cxx

#include "CollabGraph_Builder.h"
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace CollabGraph;

namespace {

    Interaction record(const std::string& source, const std::string& target, InteractionType type) {
        Interaction interaction;
        interaction.source = source;
        interaction.target = target;
        interaction.type = type;
        interaction.context = "#42";
        return interaction;
    }

    void expectSameGraph(const Graph& a, const Graph& b) {
        ASSERT_EQ(a.getVertexCount(), b.getVertexCount());
        EXPECT_EQ(a.getEdgeCount(), b.getEdgeCount());
        for (int u = 0; u < a.getVertexCount(); ++u) {
            EXPECT_EQ(a.getVertexLabel(u), b.getVertexLabel(u));
            for (int v = 0; v < a.getVertexCount(); ++v) {
                EXPECT_EQ(a.hasEdge(u, v), b.hasEdge(u, v));
                EXPECT_DOUBLE_EQ(a.getEdgeWeight(u, v), b.getEdgeWeight(u, v));
            }
        }
    }

} // namespace

// Test fixture class for GraphBuilder tests
class GraphBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        contributors["alice"] = {0, "alice"};
        contributors["bob"] = {1, "bob"};
        contributors["carol"] = {2, "carol"};
        contributors["dave"] = {3, "dave"};

        interactions = {
            record("alice", "bob", InteractionType::CommentIssue),   // 2.0
            record("alice", "bob", InteractionType::PRReview),       // 4.0
            record("alice", "bob", InteractionType::PRMerge),        // 5.0
            record("bob", "alice", InteractionType::CommentPR),      // 2.0
            record("carol", "alice", InteractionType::PRApproval),   // 4.0
            record("carol", "alice", InteractionType::PRApproval),   // 4.0
            record("dave", "carol", InteractionType::IssueClose),    // 3.0
            record("dave", "dave", InteractionType::IssueOpened),    // self-interaction
        };
    }

    ContributorMap contributors;
    std::vector<Interaction> interactions;
};

TEST_F(GraphBuilderTest, InteractionWeights) {
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::CommentIssue), 2.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::CommentPR), 2.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::IssueOpened), 3.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::PRReview), 4.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::PRApproval), 4.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::PRMerge), 5.0);
    EXPECT_DOUBLE_EQ(interactionWeight(InteractionType::IssueClose), 3.0);
}

TEST_F(GraphBuilderTest, InteractionTypeNames) {
    for (InteractionType type : ALL_INTERACTION_TYPES) {
        EXPECT_EQ(parseInteractionType(interactionTypeName(type)), type);
        EXPECT_STRNE(interactionTypeDescription(type), "");
    }
    EXPECT_STREQ(interactionTypeName(InteractionType::PRMerge), "PR_MERGE");
    EXPECT_THROW(parseInteractionType("FORK"), std::invalid_argument);
}

TEST_F(GraphBuilderTest, IntegratedGraphSumsTypeWeights) {
    GraphBuilder builder;
    auto graph = builder.buildIntegratedGraph(interactions, contributors);

    EXPECT_EQ(graph->getVertexCount(), 4);
    EXPECT_EQ(graph->getEdgeCount(), 4);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(0, 1), 11.0);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(2, 0), 8.0);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(3, 2), 3.0);
    EXPECT_FALSE(graph->hasEdge(0, 2));
}

TEST_F(GraphBuilderTest, LabelsComeFromContributorMap) {
    GraphBuilder builder;
    auto graph = builder.buildIntegratedGraph(interactions, contributors);
    EXPECT_EQ(graph->getVertexLabel(0), "alice");
    EXPECT_EQ(graph->getVertexLabel(1), "bob");
    EXPECT_EQ(graph->getVertexLabel(2), "carol");
    EXPECT_EQ(graph->getVertexLabel(3), "dave");
}

TEST_F(GraphBuilderTest, SelfInteractionsAreSkipped) {
    GraphBuilder builder;
    auto graph = builder.buildIntegratedGraph(interactions, contributors);
    EXPECT_FALSE(graph->hasEdge(3, 3));

    const auto& stats = builder.lastStats();
    EXPECT_EQ(stats.recordsSeen, 8);
    EXPECT_EQ(stats.recordsUsed, 7);
    EXPECT_EQ(stats.selfInteractionsSkipped, 1);
    EXPECT_EQ(stats.edgesCreated, 4);
}

TEST_F(GraphBuilderTest, GraphByTypeCountsRecords) {
    GraphBuilder builder;
    auto graph = builder.buildGraphByType(interactions, contributors, InteractionType::PRApproval);

    EXPECT_EQ(graph->getVertexCount(), 4);
    EXPECT_EQ(graph->getEdgeCount(), 1);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(2, 0), 2.0);
    EXPECT_EQ(graph->getVertexLabel(2), "carol");
}

TEST_F(GraphBuilderTest, GraphByTypesCountsRecords) {
    GraphBuilder builder;
    std::set<InteractionType> types = {InteractionType::CommentIssue, InteractionType::CommentPR,
                                       InteractionType::PRReview};
    auto graph = builder.buildGraphByTypes(interactions, contributors, types);

    EXPECT_EQ(graph->getEdgeCount(), 2);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(graph->getEdgeWeight(1, 0), 1.0);
    EXPECT_EQ(builder.lastStats().recordsUsed, 3);
}

TEST_F(GraphBuilderTest, EmptyFilterKeepsVertices) {
    GraphBuilder builder;
    auto graph = builder.buildGraphByTypes(interactions, contributors, {});
    EXPECT_EQ(graph->getVertexCount(), 4);
    EXPECT_TRUE(graph->isEmptyGraph());
}

TEST_F(GraphBuilderTest, BuildIsIdempotent) {
    GraphBuilder builder;
    auto first = builder.buildIntegratedGraph(interactions, contributors);
    auto second = builder.buildIntegratedGraph(interactions, contributors);
    expectSameGraph(*first, *second);

    auto firstByType = builder.buildGraphByType(interactions, contributors, InteractionType::PRApproval);
    auto secondByType = builder.buildGraphByType(interactions, contributors, InteractionType::PRApproval);
    expectSameGraph(*firstByType, *secondByType);
}

TEST_F(GraphBuilderTest, RepresentationsAgree) {
    BuilderOptions matrixOptions;
    matrixOptions.representation = Representation::AdjacencyMatrix;

    GraphBuilder listBuilder;
    GraphBuilder matrixBuilder(matrixOptions);
    auto sparse = listBuilder.buildIntegratedGraph(interactions, contributors);
    auto dense = matrixBuilder.buildIntegratedGraph(interactions, contributors);

    EXPECT_EQ(sparse->getRepresentation(), Representation::AdjacencyList);
    EXPECT_EQ(dense->getRepresentation(), Representation::AdjacencyMatrix);
    expectSameGraph(*sparse, *dense);
}

TEST_F(GraphBuilderTest, UnknownContributorIsRejected) {
    GraphBuilder builder;
    interactions.push_back(record("mallory", "alice", InteractionType::CommentPR));
    EXPECT_THROW(builder.buildIntegratedGraph(interactions, contributors), InvalidConfigurationException);
}

TEST_F(GraphBuilderTest, MalformedContributorMapIsRejected) {
    GraphBuilder builder;
    EXPECT_THROW(builder.buildIntegratedGraph(interactions, ContributorMap()), InvalidConfigurationException);

    ContributorMap gap = contributors;
    gap["dave"].vertexId = 7;
    EXPECT_THROW(builder.buildIntegratedGraph(interactions, gap), InvalidConfigurationException);

    ContributorMap duplicate = contributors;
    duplicate["dave"].vertexId = 0;
    EXPECT_THROW(builder.buildIntegratedGraph(interactions, duplicate), InvalidConfigurationException);
}

TEST_F(GraphBuilderTest, LogsBuildSummary) {
    std::ostringstream log;
    BuilderOptions options;
    options.log = &log;

    GraphBuilder builder(options);
    builder.buildIntegratedGraph(interactions, contributors);

    EXPECT_NE(log.str().find("[CollabGraph] built weighted graph: 4 vertices, 4 edges"), std::string::npos);
    EXPECT_NE(log.str().find("1 self-interactions skipped"), std::string::npos);
}
