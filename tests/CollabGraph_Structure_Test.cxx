// CollabGraph_Structure_Test.cxx

#include "CollabGraph_Analysis.h"
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <utility>
#include <vector>

using namespace CollabGraph;

namespace {

    const double kEpsilon = 1e-9;

    std::unique_ptr<Graph> buildGraph(Representation representation, int numVertices,
                                      const std::vector<std::pair<int, int>>& edges) {
        auto graph = makeGraph(representation, numVertices);
        for (const auto& edge : edges) {
            graph->addEdge(edge.first, edge.second);
        }
        return graph;
    }

    std::unique_ptr<Graph> completeGraph(Representation representation, int numVertices) {
        auto graph = makeGraph(representation, numVertices);
        for (int u = 0; u < numVertices; ++u) {
            for (int v = 0; v < numVertices; ++v) {
                if (u != v) {
                    graph->addEdge(u, v);
                }
            }
        }
        return graph;
    }

} // namespace

// Test fixture class for StructuralAnalyzer tests
class StructuralAnalyzerTest : public ::testing::TestWithParam<Representation> {
protected:
    void SetUp() override {
        // Triangle 0 -> 1 -> 2 -> 0 with a tail 2 -> 3 -> 4
        graph = buildGraph(GetParam(), 5, {{0, 1}, {1, 2}, {2, 0}, {2, 3}, {3, 4}});
    }

    std::unique_ptr<Graph> graph;
};

TEST_P(StructuralAnalyzerTest, Density) {
    StructuralAnalyzer analyzer(*graph);
    EXPECT_DOUBLE_EQ(analyzer.density(), 0.25);
}

TEST_P(StructuralAnalyzerTest, DensityOfDegenerateAndCompleteGraphs) {
    auto single = makeGraph(GetParam(), 1);
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*single).density(), 0.0);

    auto complete = completeGraph(GetParam(), 6);
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*complete).density(), 1.0);
}

TEST_P(StructuralAnalyzerTest, LocalClusteringCoefficient) {
    StructuralAnalyzer analyzer(*graph);
    EXPECT_DOUBLE_EQ(analyzer.localClusteringCoefficient(0), 1.0);
    EXPECT_DOUBLE_EQ(analyzer.localClusteringCoefficient(1), 1.0);
    EXPECT_NEAR(analyzer.localClusteringCoefficient(2), 1.0 / 3.0, kEpsilon);
    EXPECT_DOUBLE_EQ(analyzer.localClusteringCoefficient(3), 0.0);
    EXPECT_DOUBLE_EQ(analyzer.localClusteringCoefficient(4), 0.0);
    EXPECT_THROW(analyzer.localClusteringCoefficient(5), InvalidVertexException);
}

TEST_P(StructuralAnalyzerTest, ClusteringIncludesLowDegreeVertices) {
    StructuralAnalyzer analyzer(*graph);
    EXPECT_NEAR(analyzer.clusteringCoefficient(), 7.0 / 15.0, kEpsilon);
}

TEST_P(StructuralAnalyzerTest, ReciprocalEdgesCountOnce) {
    // 1 and 2 are neighbors of 0 in both directions but only one pair exists
    auto reciprocal = buildGraph(GetParam(), 3, {{0, 1}, {1, 0}, {0, 2}, {2, 0}, {1, 2}, {2, 1}});
    StructuralAnalyzer analyzer(*reciprocal);
    EXPECT_DOUBLE_EQ(analyzer.localClusteringCoefficient(0), 1.0);
    EXPECT_DOUBLE_EQ(analyzer.clusteringCoefficient(), 1.0);
}

TEST_P(StructuralAnalyzerTest, DegreeDistribution) {
    StructuralAnalyzer analyzer(*graph);
    std::map<int, int> expected = {{1, 1}, {2, 3}, {3, 1}};
    EXPECT_EQ(analyzer.degreeDistribution(), expected);
}

TEST_P(StructuralAnalyzerTest, DiameterIgnoresUnreachablePairs) {
    StructuralAnalyzer analyzer(*graph);
    EXPECT_EQ(analyzer.diameter(), 4);

    auto edgeless = makeGraph(GetParam(), 4);
    EXPECT_EQ(StructuralAnalyzer(*edgeless).diameter(), 0);
}

TEST_P(StructuralAnalyzerTest, AverageDistance) {
    StructuralAnalyzer analyzer(*graph);
    EXPECT_NEAR(analyzer.averageDistance(), 25.0 / 13.0, kEpsilon);

    auto edgeless = makeGraph(GetParam(), 4);
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*edgeless).averageDistance(), 0.0);
}

TEST_P(StructuralAnalyzerTest, Assortativity) {
    auto mixed = buildGraph(GetParam(), 5, {{0, 1}, {0, 2}, {1, 2}, {2, 0}, {3, 2}});
    EXPECT_NEAR(StructuralAnalyzer(*mixed).assortativity(), -0.5393193716300061, kEpsilon);
}

TEST_P(StructuralAnalyzerTest, AssortativityOfSingleEdgeIsZero) {
    auto single = buildGraph(GetParam(), 3, {{0, 1}});
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*single).assortativity(), 0.0);

    auto edgeless = makeGraph(GetParam(), 3);
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*edgeless).assortativity(), 0.0);
}

TEST_P(StructuralAnalyzerTest, AssortativityOfRegularGraphIsZero) {
    // Every vertex has the same degree, so both variance terms vanish
    auto complete = completeGraph(GetParam(), 4);
    EXPECT_DOUBLE_EQ(StructuralAnalyzer(*complete).assortativity(), 0.0);
}

INSTANTIATE_TEST_SUITE_P(Representations, StructuralAnalyzerTest,
                         ::testing::Values(Representation::AdjacencyList,
                                           Representation::AdjacencyMatrix));
