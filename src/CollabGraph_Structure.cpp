// CollabGraph_Structure.cpp

#include "CollabGraph_Analysis.h"
#include "CollabGraph_Internal.h"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace CollabGraph {

    // Constructor
    StructuralAnalyzer::StructuralAnalyzer(const Graph& graph)
        : graph(graph), degrees(detail::DegreeTable(graph).total) {}

    double StructuralAnalyzer::density() const {
        const int n = graph.getVertexCount();
        if (n <= 1) {
            return 0.0;
        }
        double maxEdges = static_cast<double>(n) * (n - 1);
        return graph.getEdgeCount() / maxEdges;
    }

    double StructuralAnalyzer::clusteringCoefficient() const {
        const int n = graph.getVertexCount();
        double totalCoefficient = 0.0;
        for (int v = 0; v < n; ++v) {
            totalCoefficient += localClusteringCoefficient(v);
        }
        return totalCoefficient / n;
    }

    double StructuralAnalyzer::localClusteringCoefficient(int v) const {
        std::vector<int> successors = graph.getSuccessors(v);
        std::vector<int> predecessors = graph.getPredecessors(v);

        // Both lists are ascending, so a sorted union removes two-way duplicates
        std::vector<int> neighbors;
        std::set_union(successors.begin(), successors.end(),
                       predecessors.begin(), predecessors.end(),
                       std::back_inserter(neighbors));

        const std::size_t k = neighbors.size();
        if (k < 2) {
            return 0.0;
        }

        long long connections = 0;
        for (std::size_t i = 0; i < k; ++i) {
            for (std::size_t j = i + 1; j < k; ++j) {
                int u = neighbors[i];
                int w = neighbors[j];
                if (graph.hasEdge(u, w) || graph.hasEdge(w, u)) {
                    ++connections;
                }
            }
        }

        double maxConnections = static_cast<double>(k) * (k - 1) / 2.0;
        return connections / maxConnections;
    }

    std::map<int, int> StructuralAnalyzer::degreeDistribution() const {
        std::map<int, int> distribution;
        for (int degree : degrees) {
            ++distribution[degree];
        }
        return distribution;
    }

    int StructuralAnalyzer::diameter() const {
        int longest = 0;
        for (int v = 0; v < graph.getVertexCount(); ++v) {
            for (int d : graph.bfsDistances(v)) {
                if (d != Graph::UNREACHABLE && d > longest) {
                    longest = d;
                }
            }
        }
        return longest;
    }

    double StructuralAnalyzer::averageDistance() const {
        double totalDistance = 0.0;
        long long count = 0;
        for (int v = 0; v < graph.getVertexCount(); ++v) {
            for (int d : graph.bfsDistances(v)) {
                if (d > 0 && d != Graph::UNREACHABLE) {
                    totalDistance += d;
                    ++count;
                }
            }
        }
        return count > 0 ? totalDistance / count : 0.0;
    }

    // r = [M Σjk - Σj Σk] / sqrt([M Σj² - (Σj)²] [M Σk² - (Σk)²]), one (j, k) per edge
    double StructuralAnalyzer::assortativity() const {
        if (graph.getEdgeCount() == 0) {
            return 0.0;
        }

        double sumJK = 0.0;
        double sumJ = 0.0;
        double sumK = 0.0;
        double sumJ2 = 0.0;
        double sumK2 = 0.0;
        double edgeCount = 0.0;

        for (int i = 0; i < graph.getVertexCount(); ++i) {
            const double degreeI = degrees[i];
            for (int j : graph.getSuccessors(i)) {
                const double degreeJ = degrees[j];
                sumJK += degreeI * degreeJ;
                sumJ += degreeI;
                sumK += degreeJ;
                sumJ2 += degreeI * degreeI;
                sumK2 += degreeJ * degreeJ;
                edgeCount += 1.0;
            }
        }

        double numerator = edgeCount * sumJK - sumJ * sumK;
        double denomJ = edgeCount * sumJ2 - sumJ * sumJ;
        double denomK = edgeCount * sumK2 - sumK * sumK;
        if (denomJ <= 0.0 || denomK <= 0.0) {
            return 0.0;
        }

        return numerator / std::sqrt(denomJ * denomK);
    }

} // namespace CollabGraph
