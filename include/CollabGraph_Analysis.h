#ifndef COLLAB_GRAPH_ANALYSIS_H
#define COLLAB_GRAPH_ANALYSIS_H

#include <map>
#include <utility>
#include <vector>

#include "CollabGraph.h"

namespace CollabGraph {

    /// Per-vertex score, indexed by vertex id.
    using VertexMetric = std::vector<double>;

    /// Vertex id -> community id, indexed by vertex id.
    using CommunityAssignment = std::vector<int>;

    /**
     * @brief Whole-graph structural statistics.
     *
     * Distances are unweighted directed hop counts; unreachable pairs are left
     * out rather than treated as infinite. The analyzer only reads the graph.
     */
    class StructuralAnalyzer {
    public:
        explicit StructuralAnalyzer(const Graph& graph);

        /**
         * @brief |E| / (V (V - 1)), or 0.0 for a single vertex.
         */
        double density() const;

        /**
         * @brief Mean local clustering coefficient over every vertex.
         *
         * Vertices with fewer than two neighbors contribute 0.0.
         */
        double clusteringCoefficient() const;

        /**
         * @brief Fraction of neighbor pairs of v joined by an edge in either direction.
         *
         * Neighbors are the union of predecessors and successors.
         * @throws InvalidVertexException if v is out of range.
         */
        double localClusteringCoefficient(int v) const;

        /**
         * @brief Total degree (in + out) -> number of vertices with that degree.
         */
        std::map<int, int> degreeDistribution() const;

        /**
         * @brief Longest finite shortest directed path, 0 if no vertex reaches another.
         */
        int diameter() const;

        /**
         * @brief Mean of all finite positive directed distances, 0.0 if there are none.
         */
        double averageDistance() const;

        /**
         * @brief Degree assortativity: Pearson correlation of source and target
         * total degrees over the directed edges.
         * @return 0.0 if there are no edges or either degree sequence has no variance.
         */
        double assortativity() const;

    private:
        const Graph& graph;
        std::vector<int> degrees;
    };

    /**
     * @brief Per-vertex centrality scores.
     */
    class CentralityMetrics {
    public:
        explicit CentralityMetrics(const Graph& graph);

        /**
         * @brief (in + out) / (2 (V - 1)).
         */
        VertexMetric degreeCentrality() const;

        /**
         * @brief Brandes betweenness over directed shortest paths, normalized by (V - 1)(V - 2).
         */
        VertexMetric betweennessCentrality() const;

        /**
         * @brief Reachability-weighted closeness.
         *
         * With R vertices reachable from v at total distance S, the score is
         * (R / S) * (R / (V - 1)), so a vertex reaching few others scores low even
         * when they are close. Vertices reaching nothing score 0.0.
         */
        VertexMetric closenessCentrality() const;

        /**
         * @brief PageRank by synchronous power iteration.
         *
         * Every pass computes the new vector entirely from the previous one.
         * Dangling vertices keep their mass, so the total falls below 1 whenever
         * one exists.
         *
         * @param dampingFactor Probability of following an edge, in [0, 1].
         * @param maxIterations Number of passes to run.
         * @param tolerance If positive, stop after the first pass whose L1 change
         *        is below it. 0.0 always runs maxIterations passes.
         * @throws InvalidConfigurationException on an out-of-range parameter.
         */
        VertexMetric pageRank(double dampingFactor, int maxIterations, double tolerance = 0.0) const;

        /**
         * @brief The n highest-scoring vertices, best first, ties in vertex order.
         */
        static std::vector<std::pair<int, double>> getTopN(const VertexMetric& metric, int n);

    private:
        const Graph& graph;
        std::vector<int> inDegrees;
        std::vector<int> outDegrees;
    };

    /**
     * @brief Single-level greedy modularity optimization.
     *
     * Only the local-moving phase of Louvain is performed: vertices move between
     * communities until a pass makes no move, but communities are never merged
     * into super-vertices. Sparse graphs therefore tend to stay fragmented and
     * may end with negative modularity.
     *
     * Edges are treated as undirected links for modularity: k_v is the total
     * degree and 2m = sum of all k_v.
     */
    class CommunityDetector {
    public:
        static constexpr int DEFAULT_MAX_ITERATIONS = 100;
        static constexpr double DEFAULT_BRIDGING_THRESHOLD = 0.3;

        explicit CommunityDetector(const Graph& graph);

        /**
         * @brief Runs local-moving passes starting from singleton communities.
         * @param maxIterations Upper bound on the number of passes.
         * @return Community ids renumbered 0, 1, ... by first appearance.
         */
        CommunityAssignment detectCommunities(int maxIterations = DEFAULT_MAX_ITERATIONS) const;

        static int numberOfCommunities(const CommunityAssignment& communities);

        /**
         * @brief Community id -> ascending member vertex ids.
         */
        static std::map<int, std::vector<int>> communityMembers(const CommunityAssignment& communities);

        /**
         * @brief Newman-Girvan modularity of a partition, 0.0 for an edgeless graph.
         */
        double modularity(const CommunityAssignment& communities) const;

        /**
         * @brief Vertices linked to at least two foreign communities whose share of
         * inter-community edges is at least threshold.
         */
        std::vector<int> identifyBridgingTies(const CommunityAssignment& communities,
                                              double threshold = DEFAULT_BRIDGING_THRESHOLD) const;

        /**
         * @brief Number of foreign communities touched times the inter-community edge share.
         */
        VertexMetric bridgingStrength(const CommunityAssignment& communities) const;

    private:
        struct BridgeProfile {
            int foreignCommunities = 0;
            int totalConnections = 0;
            int interCommunityConnections = 0;
        };

        CommunityAssignment runPass(const CommunityAssignment& previous, bool& moved) const;
        BridgeProfile bridgeProfile(int v, const CommunityAssignment& communities) const;
        void validateAssignment(const CommunityAssignment& communities) const;

        const Graph& graph;
        std::vector<std::vector<int>> neighbors;  // successors then predecessors
        std::vector<int> degrees;
        int numEdges;
    };

} // namespace CollabGraph

#endif // COLLAB_GRAPH_ANALYSIS_H
