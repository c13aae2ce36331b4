// CollabGraph_Report.cpp

#include "CollabGraph_Orchestrator.h"
#include <iomanip>
#include <ostream>
#include <string>

namespace CollabGraph {

    namespace {

        void writeRanking(std::ostream& out, const AnalysisResult& result, const char* title,
                          const VertexMetric& metric, int topN) {
            out << "\n> TOP " << topN << " BY " << title << "\n";
            int rank = 1;
            for (const auto& entry : CentralityMetrics::getTopN(metric, topN)) {
                out << "    " << std::setw(2) << rank++ << ". "
                    << std::left << std::setw(20) << result.getLabels()[entry.first] << std::right
                    << " " << std::fixed << std::setprecision(6) << entry.second << "\n";
            }
        }

    } // namespace

    const char* interpretAssortativity(double assortativity) {
        if (assortativity > 0.3) {
            return "assortative";
        }
        if (assortativity < -0.3) {
            return "disassortative";
        }
        return "neutral";
    }

    const char* interpretModularity(double modularity) {
        if (modularity > 0.7) {
            return "very strong";
        }
        if (modularity > 0.3) {
            return "significant";
        }
        return "weak";
    }

    void writeReport(std::ostream& out, const AnalysisResult& result, int topN) {
        const std::string rule(60, '=');
        const auto flags = out.flags();
        const auto precision = out.precision();

        out << rule << "\n  COLLABORATION GRAPH ANALYSIS\n" << rule << "\n";

        out << "\n> STRUCTURE\n"
            << "  Vertices: " << result.getVertexCount() << "\n"
            << "  Edges: " << result.getEdgeCount() << "\n"
            << std::fixed << std::setprecision(4)
            << "  Density: " << result.getDensity() << "\n"
            << "  Connected: " << (result.isConnected() ? "yes" : "no") << "\n";

        out << "\n> COHESION\n"
            << "  Clustering coefficient: " << result.getClusteringCoefficient() << "\n"
            << "  Diameter: " << result.getDiameter() << "\n"
            << "  Average distance: " << result.getAverageDistance() << "\n"
            << "  Assortativity: " << result.getAssortativity()
            << " (" << interpretAssortativity(result.getAssortativity()) << ")\n";

        if (topN > 0) {
            writeRanking(out, result, "DEGREE CENTRALITY", result.getDegreeCentrality(), topN);
            writeRanking(out, result, "BETWEENNESS CENTRALITY", result.getBetweennessCentrality(), topN);
            writeRanking(out, result, "CLOSENESS CENTRALITY", result.getClosenessCentrality(), topN);
            writeRanking(out, result, "PAGERANK", result.getPageRank(), topN);
        }

        out << "\n> COMMUNITIES\n"
            << "  Communities: " << result.getNumberOfCommunities() << "\n"
            << std::fixed << std::setprecision(4)
            << "  Modularity (Q): " << result.getModularity()
            << " (" << interpretModularity(result.getModularity()) << ")\n";
        for (const auto& entry : result.getCommunityMembers()) {
            out << "    Community " << entry.first << ": " << entry.second.size() << " members\n";
        }

        out << "\n> BRIDGING TIES\n"
            << "  Bridges: " << result.getBridgingTies().size() << "\n";
        if (topN > 0 && !result.getBridgingTies().empty()) {
            VertexMetric bridgeScores(result.getVertexCount(), -1.0);
            for (int v : result.getBridgingTies()) {
                bridgeScores[v] = result.getBridgingStrength()[v];
            }
            int rank = 1;
            for (const auto& entry : CentralityMetrics::getTopN(bridgeScores, topN)) {
                if (entry.second < 0.0) {
                    break;
                }
                out << "    " << std::setw(2) << rank++ << ". "
                    << std::left << std::setw(20) << result.getLabels()[entry.first] << std::right
                    << " (strength: " << std::setprecision(3) << entry.second << ")\n";
            }
        }

        out << "\n" << rule << "\n";
        out.flags(flags);
        out.precision(precision);
    }

} // namespace CollabGraph
