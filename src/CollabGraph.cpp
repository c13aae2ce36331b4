// CollabGraph.cpp

#include "CollabGraph.h"
#include <string>

namespace CollabGraph {

    namespace {

        int checkedVertexCount(int numVertices) {
            if (numVertices <= 0) {
                throw InvalidConfigurationException(
                    "Vertex count must be positive, got " + std::to_string(numVertices) + ".");
            }
            return numVertices;
        }

    } // namespace

    // Constructor
    Graph::Graph(int numVertices)
        : numVertices(checkedVertexCount(numVertices)),
          numEdges(0),
          vertexLabels(numVertices),
          vertexWeights(numVertices, 0.0) {
        for (int v = 0; v < numVertices; ++v) {
            vertexLabels[v] = "V" + std::to_string(v);
        }
    }

    // Retrieves the number of vertices in the graph
    int Graph::getVertexCount() const {
        return numVertices;
    }

    // Retrieves the number of edges in the graph
    int Graph::getEdgeCount() const {
        return numEdges;
    }

    int Graph::getVertexDegree(int u) const {
        return getVertexInDegree(u) + getVertexOutDegree(u);
    }

    bool Graph::isSuccessor(int u, int v) const {
        return hasEdge(u, v);
    }

    bool Graph::isPredecessor(int u, int v) const {
        return hasEdge(v, u);
    }

    bool Graph::isDivergent(int u1, int v1, int u2, int v2) const {
        validateVertex(u1);
        validateVertex(v1);
        validateVertex(u2);
        validateVertex(v2);
        return u1 == u2 && v1 != v2 && hasEdge(u1, v1) && hasEdge(u2, v2);
    }

    bool Graph::isConvergent(int u1, int v1, int u2, int v2) const {
        validateVertex(u1);
        validateVertex(v1);
        validateVertex(u2);
        validateVertex(v2);
        return v1 == v2 && u1 != u2 && hasEdge(u1, v1) && hasEdge(u2, v2);
    }

    bool Graph::isIncident(int u, int v, int x) const {
        validateVertex(x);
        return hasEdge(u, v) && (u == x || v == x);
    }

    bool Graph::isEmptyGraph() const {
        return numEdges == 0;
    }

    bool Graph::isCompleteGraph() const {
        long long maxEdges = static_cast<long long>(numVertices) * (numVertices - 1);
        return numEdges == maxEdges;
    }

    void Graph::setVertexLabel(int v, const std::string& label) {
        validateVertex(v);
        vertexLabels[v] = label;
    }

    const std::string& Graph::getVertexLabel(int v) const {
        validateVertex(v);
        return vertexLabels[v];
    }

    void Graph::setVertexWeight(int v, double weight) {
        validateVertex(v);
        vertexWeights[v] = weight;
    }

    double Graph::getVertexWeight(int v) const {
        validateVertex(v);
        return vertexWeights[v];
    }

    // Rejects ids outside [0, numVertices)
    void Graph::validateVertex(int v) const {
        if (v < 0 || v >= numVertices) {
            throw InvalidVertexException(
                "Invalid vertex " + std::to_string(v) + ": must be between 0 and " +
                std::to_string(numVertices - 1) + ".");
        }
    }

    // Vertex checks come first so an out-of-range self-loop reports the vertex
    void Graph::validateEdge(int u, int v) const {
        validateVertex(u);
        validateVertex(v);
        if (u == v) {
            throw InvalidEdgeException(
                "Self-loop on vertex " + std::to_string(u) + " is not allowed in a simple graph.");
        }
    }

    std::unique_ptr<Graph> makeGraph(Representation representation, int numVertices) {
        switch (representation) {
            case Representation::AdjacencyList:
                return std::make_unique<AdjacencyListGraph>(numVertices);
            case Representation::AdjacencyMatrix:
                return std::make_unique<AdjacencyMatrixGraph>(numVertices);
            default:
                throw InvalidConfigurationException("Invalid Representation.");
        }
    }

    const char* representationName(Representation representation) {
        switch (representation) {
            case Representation::AdjacencyList:
                return "adjacency-list";
            case Representation::AdjacencyMatrix:
                return "adjacency-matrix";
        }
        return "unknown";
    }

} // namespace CollabGraph
