// CollabGraph_Centrality.cpp

#include "CollabGraph_Analysis.h"
#include "CollabGraph_Internal.h"
#include <algorithm>
#include <cmath>
#include <queue>
#include <stack>
#include <string>

namespace CollabGraph {

    // Constructor
    CentralityMetrics::CentralityMetrics(const Graph& graph)
        : graph(graph) {
        detail::DegreeTable table(graph);
        inDegrees = std::move(table.in);
        outDegrees = std::move(table.out);
    }

    VertexMetric CentralityMetrics::degreeCentrality() const {
        const int n = graph.getVertexCount();
        VertexMetric centrality(n, 0.0);
        if (n <= 1) {
            return centrality;
        }

        const double normalization = 2.0 * (n - 1);
        for (int v = 0; v < n; ++v) {
            centrality[v] = (inDegrees[v] + outDegrees[v]) / normalization;
        }
        return centrality;
    }

    // Brandes (2001): one BFS per source, then dependencies accumulated in reverse BFS order
    VertexMetric CentralityMetrics::betweennessCentrality() const {
        const int n = graph.getVertexCount();
        VertexMetric centrality(n, 0.0);

        std::vector<std::vector<int>> successors(n);
        for (int v = 0; v < n; ++v) {
            successors[v] = graph.getSuccessors(v);
        }

        std::vector<std::vector<int>> predecessors(n);
        std::vector<int> distance(n);
        std::vector<double> numPaths(n);
        std::vector<double> dependency(n);

        for (int s = 0; s < n; ++s) {
            for (int v = 0; v < n; ++v) {
                predecessors[v].clear();
                distance[v] = -1;
                numPaths[v] = 0.0;
                dependency[v] = 0.0;
            }

            std::stack<int> order;
            std::queue<int> q;

            distance[s] = 0;
            numPaths[s] = 1.0;
            q.push(s);

            while (!q.empty()) {
                int v = q.front();
                q.pop();
                order.push(v);

                for (int w : successors[v]) {
                    if (distance[w] < 0) {
                        distance[w] = distance[v] + 1;
                        q.push(w);
                    }
                    if (distance[w] == distance[v] + 1) {
                        numPaths[w] += numPaths[v];
                        predecessors[w].push_back(v);
                    }
                }
            }

            while (!order.empty()) {
                int w = order.top();
                order.pop();
                for (int v : predecessors[w]) {
                    dependency[v] += (numPaths[v] / numPaths[w]) * (1.0 + dependency[w]);
                }
                if (w != s) {
                    centrality[w] += dependency[w];
                }
            }
        }

        const double normalization = static_cast<double>(n - 1) * (n - 2);
        if (normalization > 0.0) {
            for (double& value : centrality) {
                value /= normalization;
            }
        }
        return centrality;
    }

    VertexMetric CentralityMetrics::closenessCentrality() const {
        const int n = graph.getVertexCount();
        VertexMetric centrality(n, 0.0);

        for (int v = 0; v < n; ++v) {
            long long reachableCount = 0;
            double totalDistance = 0.0;
            for (int d : graph.bfsDistances(v)) {
                if (d > 0 && d != Graph::UNREACHABLE) {
                    ++reachableCount;
                    totalDistance += d;
                }
            }

            if (totalDistance > 0.0) {
                double closeness = reachableCount / totalDistance;
                closeness *= reachableCount / static_cast<double>(n - 1);
                centrality[v] = closeness;
            }
        }
        return centrality;
    }

    VertexMetric CentralityMetrics::pageRank(double dampingFactor, int maxIterations, double tolerance) const {
        detail::validateDamping(dampingFactor);
        detail::validateIterations("PageRank", maxIterations);
        detail::validateTolerance(tolerance);

        const int n = graph.getVertexCount();
        std::vector<std::vector<int>> predecessors(n);
        for (int v = 0; v < n; ++v) {
            predecessors[v] = graph.getPredecessors(v);
        }

        const double teleport = (1.0 - dampingFactor) / n;
        VertexMetric rank(n, 1.0 / n);
        VertexMetric nextRank(n, 0.0);

        for (int iter = 0; iter < maxIterations; ++iter) {
            for (int v = 0; v < n; ++v) {
                double sum = 0.0;
                for (int u : predecessors[v]) {
                    // u has at least the edge u -> v, so outDegrees[u] > 0
                    sum += rank[u] / outDegrees[u];
                }
                nextRank[v] = teleport + dampingFactor * sum;
            }

            double change = 0.0;
            for (int v = 0; v < n; ++v) {
                change += std::fabs(nextRank[v] - rank[v]);
            }
            rank.swap(nextRank);

            if (tolerance > 0.0 && change < tolerance) {
                break;
            }
        }

        return rank;
    }

    std::vector<std::pair<int, double>> CentralityMetrics::getTopN(const VertexMetric& metric, int n) {
        std::vector<std::pair<int, double>> ranked;
        if (n <= 0) {
            return ranked;
        }

        ranked.reserve(metric.size());
        for (std::size_t v = 0; v < metric.size(); ++v) {
            ranked.emplace_back(static_cast<int>(v), metric[v]);
        }

        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const std::pair<int, double>& a, const std::pair<int, double>& b) {
                             return a.second > b.second;
                         });

        if (ranked.size() > static_cast<std::size_t>(n)) {
            ranked.resize(n);
        }
        return ranked;
    }

} // namespace CollabGraph
