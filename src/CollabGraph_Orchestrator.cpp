// CollabGraph_Orchestrator.cpp

#include "CollabGraph_Orchestrator.h"
#include "CollabGraph_Internal.h"
#include <chrono>
#include <string>
#include <utility>

namespace CollabGraph {

    namespace {

        void validateOptions(const AnalysisOptions& options) {
            detail::validateDamping(options.damping);
            detail::validateIterations("PageRank", options.pageRankIterations);
            detail::validateTolerance(options.pageRankTolerance);
            detail::validateIterations("Community", options.communityIterations);
            detail::validateBridgingThreshold(options.bridgingThreshold);
            if (options.mode != ExecutionMode::Sequential && options.mode != ExecutionMode::ParallelCPU) {
                throw InvalidConfigurationException("Invalid ExecutionMode.");
            }
        }

        // Runs a phase and logs its wall-clock duration
        template <typename Phase>
        void timed(std::ostream* log, const char* name, Phase phase) {
            auto start = std::chrono::steady_clock::now();
            phase();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            detail::logLine(log, std::string(name) + " analysis finished in " +
                                 std::to_string(elapsed.count()) + " ms");
        }

    } // namespace

    // Constructor
    AnalysisOrchestrator::AnalysisOrchestrator(const Graph& graph, AnalysisOptions options)
        : graph(graph), options(options) {
        validateOptions(this->options);
    }

    AnalysisResult AnalysisOrchestrator::run() const {
        detail::logLine(options.log,
                        "analyzing " + std::to_string(graph.getVertexCount()) + " vertices, " +
                        std::to_string(graph.getEdgeCount()) + " edges (" +
                        representationName(graph.getRepresentation()) + ", " +
                        (options.mode == ExecutionMode::ParallelCPU ? "parallel" : "sequential") + ")");

        AnalysisResult result;
        result.vertexCount = graph.getVertexCount();
        result.edgeCount = graph.getEdgeCount();
        result.connected = graph.isConnected();
        result.labels.reserve(result.vertexCount);
        for (int v = 0; v < result.vertexCount; ++v) {
            result.labels.push_back(graph.getVertexLabel(v));
        }

        switch (options.mode) {
            case ExecutionMode::Sequential:
                timed(options.log, "structural", [&]() { runStructural(result); });
                timed(options.log, "centrality", [&]() { runCentrality(result); });
                timed(options.log, "community", [&]() { runCommunities(result); });
                break;

            case ExecutionMode::ParallelCPU: {
                // Each thread fills its own partial result; they are merged after join
                AnalysisResult structural;
                AnalysisResult centrality;
                AnalysisResult community;
                detail::runConcurrently({
                    [&]() { runStructural(structural); },
                    [&]() { runCentrality(centrality); },
                    [&]() { runCommunities(community); }
                });

                result.density = structural.density;
                result.clusteringCoefficient = structural.clusteringCoefficient;
                result.diameter = structural.diameter;
                result.averageDistance = structural.averageDistance;
                result.degreeDistribution = std::move(structural.degreeDistribution);
                result.assortativity = structural.assortativity;

                result.degreeCentrality = std::move(centrality.degreeCentrality);
                result.betweennessCentrality = std::move(centrality.betweennessCentrality);
                result.closenessCentrality = std::move(centrality.closenessCentrality);
                result.pageRank = std::move(centrality.pageRank);

                result.communities = std::move(community.communities);
                result.numberOfCommunities = community.numberOfCommunities;
                result.communityMembers = std::move(community.communityMembers);
                result.modularity = community.modularity;
                result.bridgingTies = std::move(community.bridgingTies);
                result.bridgingStrength = std::move(community.bridgingStrength);

                detail::logLine(options.log, "parallel analysis finished");
                break;
            }
        }

        return result;
    }

    void AnalysisOrchestrator::runStructural(AnalysisResult& result) const {
        StructuralAnalyzer analyzer(graph);
        result.density = analyzer.density();
        result.clusteringCoefficient = analyzer.clusteringCoefficient();
        result.diameter = analyzer.diameter();
        result.averageDistance = analyzer.averageDistance();
        result.degreeDistribution = analyzer.degreeDistribution();
        result.assortativity = analyzer.assortativity();
    }

    void AnalysisOrchestrator::runCentrality(AnalysisResult& result) const {
        CentralityMetrics centrality(graph);
        result.degreeCentrality = centrality.degreeCentrality();
        result.betweennessCentrality = centrality.betweennessCentrality();
        result.closenessCentrality = centrality.closenessCentrality();
        result.pageRank = centrality.pageRank(options.damping, options.pageRankIterations,
                                              options.pageRankTolerance);
    }

    void AnalysisOrchestrator::runCommunities(AnalysisResult& result) const {
        CommunityDetector detector(graph);
        result.communities = detector.detectCommunities(options.communityIterations);
        result.numberOfCommunities = CommunityDetector::numberOfCommunities(result.communities);
        result.communityMembers = CommunityDetector::communityMembers(result.communities);
        result.modularity = detector.modularity(result.communities);
        result.bridgingTies = detector.identifyBridgingTies(result.communities, options.bridgingThreshold);
        result.bridgingStrength = detector.bridgingStrength(result.communities);
    }

} // namespace CollabGraph
