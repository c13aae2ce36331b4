// CollabGraph_AdjacencyMatrix.cpp

#include "CollabGraph.h"

namespace CollabGraph {

    // Constructor
    AdjacencyMatrixGraph::AdjacencyMatrixGraph(int numVertices)
        : Graph(numVertices),
          adjacencyMatrix(static_cast<std::size_t>(numVertices) * numVertices, 0),
          edgeWeights(static_cast<std::size_t>(numVertices) * numVertices, 0.0) {}

    Representation AdjacencyMatrixGraph::getRepresentation() const {
        return Representation::AdjacencyMatrix;
    }

    std::size_t AdjacencyMatrixGraph::index(int u, int v) const {
        return static_cast<std::size_t>(u) * numVertices + v;
    }

    bool AdjacencyMatrixGraph::hasEdge(int u, int v) const {
        validateVertex(u);
        validateVertex(v);
        return adjacencyMatrix[index(u, v)] != 0;
    }

    void AdjacencyMatrixGraph::addEdge(int u, int v) {
        validateEdge(u, v);
        char& cell = adjacencyMatrix[index(u, v)];
        if (!cell) {
            cell = 1;
            ++numEdges;
        }
    }

    // Clears the weight together with the edge so a re-added edge starts at 0.0
    void AdjacencyMatrixGraph::removeEdge(int u, int v) {
        validateEdge(u, v);
        char& cell = adjacencyMatrix[index(u, v)];
        if (cell) {
            cell = 0;
            edgeWeights[index(u, v)] = 0.0;
            --numEdges;
        }
    }

    void AdjacencyMatrixGraph::setEdgeWeight(int u, int v, double weight) {
        addEdge(u, v);
        edgeWeights[index(u, v)] = weight;
    }

    double AdjacencyMatrixGraph::getEdgeWeight(int u, int v) const {
        if (!hasEdge(u, v)) {
            return 0.0;
        }
        return edgeWeights[index(u, v)];
    }

    int AdjacencyMatrixGraph::getVertexInDegree(int u) const {
        validateVertex(u);
        int degree = 0;
        for (int i = 0; i < numVertices; ++i) {
            if (adjacencyMatrix[index(i, u)]) {
                ++degree;
            }
        }
        return degree;
    }

    int AdjacencyMatrixGraph::getVertexOutDegree(int u) const {
        validateVertex(u);
        int degree = 0;
        for (int i = 0; i < numVertices; ++i) {
            if (adjacencyMatrix[index(u, i)]) {
                ++degree;
            }
        }
        return degree;
    }

    std::vector<int> AdjacencyMatrixGraph::getSuccessors(int v) const {
        validateVertex(v);
        std::vector<int> successors;
        for (int i = 0; i < numVertices; ++i) {
            if (adjacencyMatrix[index(v, i)]) {
                successors.push_back(i);
            }
        }
        return successors;
    }

    std::vector<int> AdjacencyMatrixGraph::getPredecessors(int v) const {
        validateVertex(v);
        std::vector<int> predecessors;
        for (int i = 0; i < numVertices; ++i) {
            if (adjacencyMatrix[index(i, v)]) {
                predecessors.push_back(i);
            }
        }
        return predecessors;
    }

} // namespace CollabGraph
