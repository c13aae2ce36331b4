// CollabGraph_AdjacencyList.cpp

#include "CollabGraph.h"

namespace CollabGraph {

    // Constructor
    AdjacencyListGraph::AdjacencyListGraph(int numVertices)
        : Graph(numVertices), adjacencyList(numVertices) {}

    Representation AdjacencyListGraph::getRepresentation() const {
        return Representation::AdjacencyList;
    }

    bool AdjacencyListGraph::hasEdge(int u, int v) const {
        validateVertex(u);
        validateVertex(v);
        return adjacencyList[u].successors.count(v) > 0;
    }

    // Adds a directed edge from u to v with weight 0.0
    void AdjacencyListGraph::addEdge(int u, int v) {
        validateEdge(u, v);
        if (adjacencyList[u].successors.emplace(v, 0.0).second) {
            adjacencyList[v].predecessors.insert(u);
            ++numEdges;
        }
    }

    void AdjacencyListGraph::removeEdge(int u, int v) {
        validateEdge(u, v);
        if (adjacencyList[u].successors.erase(v) > 0) {
            adjacencyList[v].predecessors.erase(u);
            --numEdges;
        }
    }

    void AdjacencyListGraph::setEdgeWeight(int u, int v, double weight) {
        addEdge(u, v);
        adjacencyList[u].successors[v] = weight;
    }

    double AdjacencyListGraph::getEdgeWeight(int u, int v) const {
        validateVertex(u);
        validateVertex(v);
        const auto& successors = adjacencyList[u].successors;
        auto it = successors.find(v);
        return it == successors.end() ? 0.0 : it->second;
    }

    // In-degree is answered from the predecessor index instead of a scan
    int AdjacencyListGraph::getVertexInDegree(int u) const {
        validateVertex(u);
        return static_cast<int>(adjacencyList[u].predecessors.size());
    }

    int AdjacencyListGraph::getVertexOutDegree(int u) const {
        validateVertex(u);
        return static_cast<int>(adjacencyList[u].successors.size());
    }

    std::vector<int> AdjacencyListGraph::getSuccessors(int v) const {
        validateVertex(v);
        std::vector<int> successors;
        successors.reserve(adjacencyList[v].successors.size());
        for (const auto& entry : adjacencyList[v].successors) {
            successors.push_back(entry.first);
        }
        return successors;
    }

    std::vector<int> AdjacencyListGraph::getPredecessors(int v) const {
        validateVertex(v);
        const auto& predecessors = adjacencyList[v].predecessors;
        return std::vector<int>(predecessors.begin(), predecessors.end());
    }

} // namespace CollabGraph
