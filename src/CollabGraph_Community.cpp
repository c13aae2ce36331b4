// CollabGraph_Community.cpp

#include "CollabGraph_Analysis.h"
#include "CollabGraph_Internal.h"
#include <algorithm>
#include <set>
#include <string>

namespace CollabGraph {

    // Constructor
    CommunityDetector::CommunityDetector(const Graph& graph)
        : graph(graph),
          neighbors(graph.getVertexCount()),
          degrees(detail::DegreeTable(graph).total),
          numEdges(graph.getEdgeCount()) {
        for (int v = 0; v < graph.getVertexCount(); ++v) {
            std::vector<int> successors = graph.getSuccessors(v);
            std::vector<int> predecessors = graph.getPredecessors(v);
            neighbors[v] = std::move(successors);
            neighbors[v].insert(neighbors[v].end(), predecessors.begin(), predecessors.end());
        }
    }

    CommunityAssignment CommunityDetector::detectCommunities(int maxIterations) const {
        detail::validateIterations("Community", maxIterations);

        const int n = graph.getVertexCount();
        CommunityAssignment communities(n);
        for (int v = 0; v < n; ++v) {
            communities[v] = v;
        }

        if (numEdges > 0) {
            bool moved = true;
            for (int iter = 0; iter < maxIterations && moved; ++iter) {
                communities = runPass(communities, moved);
            }
        }

        // Renumber by first appearance in vertex order
        std::vector<int> mapping(n, -1);
        int nextId = 0;
        for (int& community : communities) {
            if (mapping[community] < 0) {
                mapping[community] = nextId++;
            }
            community = mapping[community];
        }
        return communities;
    }

    // One local-moving pass over the vertices in id order.
    //
    // The pass works on its own copy of the previous assignment; a vertex that
    // moves is visible to the vertices visited after it in the same pass. For v
    // the gain of joining community c is
    //     k_in(c) / 2m - Σtot(c) * k_v / (2m)²
    // with v taken out of its current community first, so staying put competes
    // on equal terms with every neighboring community.
    CommunityAssignment CommunityDetector::runPass(const CommunityAssignment& previous, bool& moved) const {
        const int n = graph.getVertexCount();
        const double twoM = 2.0 * numEdges;

        CommunityAssignment communities = previous;
        std::vector<double> sigmaTot(n, 0.0);
        for (int v = 0; v < n; ++v) {
            sigmaTot[communities[v]] += degrees[v];
        }

        std::vector<int> candidates;
        std::vector<int> linksTo(n, 0);
        moved = false;

        for (int v = 0; v < n; ++v) {
            const int current = communities[v];
            const double kv = degrees[v];

            // Current community first, then neighbor communities as they are met
            candidates.clear();
            candidates.push_back(current);
            for (int u : neighbors[v]) {
                int community = communities[u];
                if (std::find(candidates.begin(), candidates.end(), community) == candidates.end()) {
                    candidates.push_back(community);
                }
                ++linksTo[community];
            }

            sigmaTot[current] -= kv;

            int bestCommunity = current;
            double bestGain = 0.0;
            for (int community : candidates) {
                double gain = linksTo[community] / twoM - (sigmaTot[community] * kv) / (twoM * twoM);
                if (gain > bestGain) {
                    bestGain = gain;
                    bestCommunity = community;
                }
            }

            for (int community : candidates) {
                linksTo[community] = 0;
            }

            sigmaTot[bestCommunity] += kv;
            if (bestCommunity != current) {
                communities[v] = bestCommunity;
                moved = true;
            }
        }

        return communities;
    }

    int CommunityDetector::numberOfCommunities(const CommunityAssignment& communities) {
        return static_cast<int>(std::set<int>(communities.begin(), communities.end()).size());
    }

    std::map<int, std::vector<int>> CommunityDetector::communityMembers(const CommunityAssignment& communities) {
        std::map<int, std::vector<int>> members;
        for (std::size_t v = 0; v < communities.size(); ++v) {
            members[communities[v]].push_back(static_cast<int>(v));
        }
        return members;
    }

    // Q = 1/2m Σ_ij [Â_ij - k_i k_j / 2m] δ(c_i, c_j), Â_ij = A_ij + A_ji
    double CommunityDetector::modularity(const CommunityAssignment& communities) const {
        validateAssignment(communities);
        if (numEdges == 0) {
            return 0.0;
        }

        const int n = graph.getVertexCount();
        const double twoM = 2.0 * numEdges;

        // Σ_ij k_i k_j over a community equals the square of its degree sum
        std::map<int, double> degreeSums;
        for (int v = 0; v < n; ++v) {
            degreeSums[communities[v]] += degrees[v];
        }

        // Each directed edge inside a community appears once as A_ij and once as A_ji
        double internalLinks = 0.0;
        for (int v = 0; v < n; ++v) {
            for (int u : graph.getSuccessors(v)) {
                if (communities[u] == communities[v]) {
                    internalLinks += 2.0;
                }
            }
        }

        double expected = 0.0;
        for (const auto& entry : degreeSums) {
            expected += entry.second * entry.second / twoM;
        }

        return (internalLinks - expected) / twoM;
    }

    std::vector<int> CommunityDetector::identifyBridgingTies(const CommunityAssignment& communities,
                                                            double threshold) const {
        validateAssignment(communities);
        detail::validateBridgingThreshold(threshold);

        std::vector<int> bridges;
        for (int v = 0; v < graph.getVertexCount(); ++v) {
            BridgeProfile profile = bridgeProfile(v, communities);
            if (profile.foreignCommunities >= 2 && profile.totalConnections > 0) {
                double ratio = static_cast<double>(profile.interCommunityConnections) / profile.totalConnections;
                if (ratio >= threshold) {
                    bridges.push_back(v);
                }
            }
        }
        return bridges;
    }

    VertexMetric CommunityDetector::bridgingStrength(const CommunityAssignment& communities) const {
        validateAssignment(communities);

        VertexMetric strength(graph.getVertexCount(), 0.0);
        for (int v = 0; v < graph.getVertexCount(); ++v) {
            BridgeProfile profile = bridgeProfile(v, communities);
            if (profile.totalConnections > 0) {
                double ratio = static_cast<double>(profile.interCommunityConnections) / profile.totalConnections;
                strength[v] = profile.foreignCommunities * ratio;
            }
        }
        return strength;
    }

    // Counts both edge directions; a two-way link to a neighbor counts twice
    CommunityDetector::BridgeProfile CommunityDetector::bridgeProfile(int v, const CommunityAssignment& communities) const {
        BridgeProfile profile;
        std::set<int> foreign;
        for (int u : neighbors[v]) {
            ++profile.totalConnections;
            if (communities[u] != communities[v]) {
                foreign.insert(communities[u]);
                ++profile.interCommunityConnections;
            }
        }
        profile.foreignCommunities = static_cast<int>(foreign.size());
        return profile;
    }

    void CommunityDetector::validateAssignment(const CommunityAssignment& communities) const {
        if (communities.size() != static_cast<std::size_t>(graph.getVertexCount())) {
            throw InvalidConfigurationException(
                "Community assignment covers " + std::to_string(communities.size()) +
                " vertices, graph has " + std::to_string(graph.getVertexCount()) + ".");
        }
    }

} // namespace CollabGraph
