#ifndef COLLAB_GRAPH_ORCHESTRATOR_H
#define COLLAB_GRAPH_ORCHESTRATOR_H

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "CollabGraph.h"
#include "CollabGraph_Analysis.h"

namespace CollabGraph {

    /**
     * @brief Parameters of a complete analysis run.
     */
    struct AnalysisOptions {
        double damping = 0.85;
        int pageRankIterations = 100;

        /// 0.0 runs every PageRank iteration; a positive value allows an early stop.
        double pageRankTolerance = 0.0;

        int communityIterations = CommunityDetector::DEFAULT_MAX_ITERATIONS;
        double bridgingThreshold = CommunityDetector::DEFAULT_BRIDGING_THRESHOLD;

        /// ParallelCPU runs the three analyzers on separate threads.
        ExecutionMode mode = ExecutionMode::Sequential;

        /// Progress sink, nullptr keeps the run silent.
        std::ostream* log = nullptr;
    };

    /**
     * @brief Every metric computed for one graph snapshot.
     *
     * Built once by AnalysisOrchestrator::run() and never modified afterwards.
     */
    class AnalysisResult {
    public:
        int getVertexCount() const { return vertexCount; }
        int getEdgeCount() const { return edgeCount; }
        bool isConnected() const { return connected; }
        const std::vector<std::string>& getLabels() const { return labels; }

        double getDensity() const { return density; }
        double getClusteringCoefficient() const { return clusteringCoefficient; }
        int getDiameter() const { return diameter; }
        double getAverageDistance() const { return averageDistance; }
        const std::map<int, int>& getDegreeDistribution() const { return degreeDistribution; }
        double getAssortativity() const { return assortativity; }

        const VertexMetric& getDegreeCentrality() const { return degreeCentrality; }
        const VertexMetric& getBetweennessCentrality() const { return betweennessCentrality; }
        const VertexMetric& getClosenessCentrality() const { return closenessCentrality; }
        const VertexMetric& getPageRank() const { return pageRank; }

        const CommunityAssignment& getCommunities() const { return communities; }
        int getNumberOfCommunities() const { return numberOfCommunities; }
        const std::map<int, std::vector<int>>& getCommunityMembers() const { return communityMembers; }
        double getModularity() const { return modularity; }
        const std::vector<int>& getBridgingTies() const { return bridgingTies; }
        const VertexMetric& getBridgingStrength() const { return bridgingStrength; }

    private:
        friend class AnalysisOrchestrator;

        AnalysisResult() = default;

        int vertexCount = 0;
        int edgeCount = 0;
        bool connected = false;
        std::vector<std::string> labels;

        double density = 0.0;
        double clusteringCoefficient = 0.0;
        int diameter = 0;
        double averageDistance = 0.0;
        std::map<int, int> degreeDistribution;
        double assortativity = 0.0;

        VertexMetric degreeCentrality;
        VertexMetric betweennessCentrality;
        VertexMetric closenessCentrality;
        VertexMetric pageRank;

        CommunityAssignment communities;
        int numberOfCommunities = 0;
        std::map<int, std::vector<int>> communityMembers;
        double modularity = 0.0;
        std::vector<int> bridgingTies;
        VertexMetric bridgingStrength;
    };

    /**
     * @brief Runs the structural, centrality and community analyses over one graph.
     *
     * The graph must stay unmodified while run() executes. The analyzers only
     * read it, which is what allows ExecutionMode::ParallelCPU to share it
     * between threads without locking.
     */
    class AnalysisOrchestrator {
    public:
        /**
         * @throws InvalidConfigurationException if an option is out of range.
         */
        explicit AnalysisOrchestrator(const Graph& graph, AnalysisOptions options = AnalysisOptions());

        /**
         * @brief Performs the complete analysis.
         * @return The assembled result; identical for both execution modes.
         */
        AnalysisResult run() const;

    private:
        void runStructural(AnalysisResult& result) const;
        void runCentrality(AnalysisResult& result) const;
        void runCommunities(AnalysisResult& result) const;

        const Graph& graph;
        AnalysisOptions options;
    };

    /**
     * @brief Writes a plain-text summary: graph size, cohesion metrics with their
     * interpretation, top-N rankings and community structure.
     */
    void writeReport(std::ostream& out, const AnalysisResult& result, int topN = 10);

    /**
     * @brief "assortative", "disassortative" or "neutral" (thresholds +/-0.3).
     */
    const char* interpretAssortativity(double assortativity);

    /**
     * @brief "very strong", "significant" or "weak" (thresholds 0.7 and 0.3).
     */
    const char* interpretModularity(double modularity);

} // namespace CollabGraph

#endif // COLLAB_GRAPH_ORCHESTRATOR_H
