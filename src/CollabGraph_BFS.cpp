// CollabGraph_BFS.cpp

#include "CollabGraph.h"
#include <queue>
#include <vector>

namespace CollabGraph {

    // Directed Breadth-First Search over successor edges, recording hop counts
    std::vector<int> Graph::bfsDistances(int startVertex) const {
        validateVertex(startVertex);

        std::vector<int> distances(numVertices, UNREACHABLE);
        std::queue<int> q;

        distances[startVertex] = 0;
        q.push(startVertex);

        while (!q.empty()) {
            int current = q.front();
            q.pop();

            for (int neighborVertex : getSuccessors(current)) {
                if (distances[neighborVertex] == UNREACHABLE) {
                    distances[neighborVertex] = distances[current] + 1;
                    q.push(neighborVertex);
                }
            }
        }

        return distances;
    }

    // Undirected-equivalent Breadth-First Search from vertex 0
    bool Graph::isConnected() const {
        if (numEdges == 0) {
            return true;
        }

        std::vector<bool> visited(numVertices, false);
        std::queue<int> q;
        int visitedCount = 1;

        visited[0] = true;
        q.push(0);

        while (!q.empty()) {
            int current = q.front();
            q.pop();

            for (const auto& neighbors : {getSuccessors(current), getPredecessors(current)}) {
                for (int neighborVertex : neighbors) {
                    if (!visited[neighborVertex]) {
                        visited[neighborVertex] = true;
                        ++visitedCount;
                        q.push(neighborVertex);
                    }
                }
            }
        }

        return visitedCount == numVertices;
    }

} // namespace CollabGraph
