#ifndef COLLAB_GRAPH_H
#define COLLAB_GRAPH_H

#include <cstddef>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "CollabGraph_Errors.h"

namespace CollabGraph {

    /**
     * @brief Enumeration to specify execution mode for the analysis run.
     */
    enum class ExecutionMode {
        Sequential,
        ParallelCPU
    };

    /**
     * @brief Storage layout chosen when a graph is constructed.
     */
    enum class Representation {
        AdjacencyList,
        AdjacencyMatrix
    };

    /**
     * @brief Directed, weighted, simple graph over a fixed set of vertices.
     *
     * Vertices are the dense ids [0, vertexCount). At most one edge exists per
     * ordered pair and self-loops are rejected. Every edge carries a weight that
     * defaults to 0.0. Algorithms only use this interface, so both storage
     * layouts are interchangeable.
     */
    class Graph {
    public:
        /// Distance reported by bfsDistances() for vertices the source cannot reach.
        static constexpr int UNREACHABLE = std::numeric_limits<int>::max();

        /**
         * @brief Constructs a graph with a given number of vertices.
         * @param numVertices Number of vertices in the graph, must be positive.
         * @throws InvalidConfigurationException if numVertices <= 0.
         */
        explicit Graph(int numVertices);

        virtual ~Graph() = default;

        Graph(const Graph&) = delete;
        Graph& operator=(const Graph&) = delete;

        /**
         * @brief Retrieves the number of vertices in the graph.
         */
        int getVertexCount() const;

        /**
         * @brief Retrieves the number of distinct directed edges.
         */
        int getEdgeCount() const;

        virtual Representation getRepresentation() const = 0;

        /**
         * @brief Checks whether the edge u -> v exists.
         * @throws InvalidVertexException if either id is out of range.
         */
        virtual bool hasEdge(int u, int v) const = 0;

        /**
         * @brief Adds the edge u -> v with weight 0.0. Does nothing if it already exists.
         * @throws InvalidVertexException if either id is out of range.
         * @throws InvalidEdgeException if u == v.
         */
        virtual void addEdge(int u, int v) = 0;

        /**
         * @brief Removes the edge u -> v and its weight. Does nothing if it is absent.
         * @throws InvalidVertexException if either id is out of range.
         * @throws InvalidEdgeException if u == v.
         */
        virtual void removeEdge(int u, int v) = 0;

        /**
         * @brief Sets the weight of u -> v, creating the edge if it is absent.
         * @throws InvalidVertexException if either id is out of range.
         * @throws InvalidEdgeException if u == v.
         */
        virtual void setEdgeWeight(int u, int v, double weight) = 0;

        /**
         * @brief Retrieves the weight of u -> v.
         * @return The stored weight, or 0.0 if the edge does not exist.
         * @throws InvalidVertexException if either id is out of range.
         */
        virtual double getEdgeWeight(int u, int v) const = 0;

        virtual int getVertexInDegree(int u) const = 0;
        virtual int getVertexOutDegree(int u) const = 0;

        /**
         * @brief Total degree (in + out) of a vertex.
         */
        int getVertexDegree(int u) const;

        /**
         * @brief Targets of the edges leaving v, in ascending order.
         */
        virtual std::vector<int> getSuccessors(int v) const = 0;

        /**
         * @brief Sources of the edges entering v, in ascending order.
         */
        virtual std::vector<int> getPredecessors(int v) const = 0;

        // Structural predicates

        bool isSuccessor(int u, int v) const;
        bool isPredecessor(int u, int v) const;

        /**
         * @brief True if both edges exist, share their source and have different targets.
         */
        bool isDivergent(int u1, int v1, int u2, int v2) const;

        /**
         * @brief True if both edges exist, share their target and have different sources.
         */
        bool isConvergent(int u1, int v1, int u2, int v2) const;

        /**
         * @brief True if the edge u -> v exists and x is one of its endpoints.
         */
        bool isIncident(int u, int v, int x) const;

        /**
         * @brief Weak connectivity, following edges in both directions from vertex 0.
         *
         * An edgeless graph is reported as connected.
         */
        bool isConnected() const;

        bool isEmptyGraph() const;
        bool isCompleteGraph() const;

        // Vertex attributes

        void setVertexLabel(int v, const std::string& label);

        /**
         * @brief Display label of a vertex, "V<id>" unless one was set.
         */
        const std::string& getVertexLabel(int v) const;

        void setVertexWeight(int v, double weight);
        double getVertexWeight(int v) const;

        /**
         * @brief Unweighted directed Breadth-First Search distances from a source.
         * @param startVertex Source vertex.
         * @return Hop count to every vertex, UNREACHABLE where no directed path exists.
         */
        std::vector<int> bfsDistances(int startVertex) const;

    protected:
        void validateVertex(int v) const;
        void validateEdge(int u, int v) const;

        int numVertices;
        int numEdges;

    private:
        std::vector<std::string> vertexLabels;
        std::vector<double> vertexWeights;
    };

    /**
     * @brief Sparse storage: one ordered successor map per vertex plus a
     * predecessor index. O(V + E) space.
     */
    class AdjacencyListGraph : public Graph {
    public:
        explicit AdjacencyListGraph(int numVertices);

        Representation getRepresentation() const override;

        bool hasEdge(int u, int v) const override;
        void addEdge(int u, int v) override;
        void removeEdge(int u, int v) override;
        void setEdgeWeight(int u, int v, double weight) override;
        double getEdgeWeight(int u, int v) const override;

        int getVertexInDegree(int u) const override;
        int getVertexOutDegree(int u) const override;

        std::vector<int> getSuccessors(int v) const override;
        std::vector<int> getPredecessors(int v) const override;

    private:
        struct Adjacency {
            std::map<int, double> successors;   // target -> weight
            std::set<int> predecessors;
        };

        std::vector<Adjacency> adjacencyList;
    };

    /**
     * @brief Dense storage: V x V presence and weight matrices. O(V^2) space,
     * constant-time edge lookup.
     */
    class AdjacencyMatrixGraph : public Graph {
    public:
        explicit AdjacencyMatrixGraph(int numVertices);

        Representation getRepresentation() const override;

        bool hasEdge(int u, int v) const override;
        void addEdge(int u, int v) override;
        void removeEdge(int u, int v) override;
        void setEdgeWeight(int u, int v, double weight) override;
        double getEdgeWeight(int u, int v) const override;

        int getVertexInDegree(int u) const override;
        int getVertexOutDegree(int u) const override;

        std::vector<int> getSuccessors(int v) const override;
        std::vector<int> getPredecessors(int v) const override;

    private:
        std::size_t index(int u, int v) const;

        // Row-major, entry u * V + v describes u -> v
        std::vector<char> adjacencyMatrix;
        std::vector<double> edgeWeights;
    };

    /**
     * @brief Creates an empty graph with the requested storage layout.
     * @throws InvalidConfigurationException if numVertices <= 0.
     */
    std::unique_ptr<Graph> makeGraph(Representation representation, int numVertices);

    const char* representationName(Representation representation);

} // namespace CollabGraph

#endif // COLLAB_GRAPH_H
