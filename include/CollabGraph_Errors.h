#ifndef COLLAB_GRAPH_ERRORS_H
#define COLLAB_GRAPH_ERRORS_H

#include <stdexcept>
#include <string>

namespace CollabGraph {

    /**
     * @brief Thrown when a graph, builder input or analysis option is unusable.
     *
     * Covers a non-positive vertex count, a malformed contributor map and
     * out-of-range analysis parameters.
     */
    class InvalidConfigurationException : public std::invalid_argument {
    public:
        explicit InvalidConfigurationException(const std::string& message)
            : std::invalid_argument(message) {}
    };

    /**
     * @brief Thrown when a vertex id falls outside [0, vertexCount).
     */
    class InvalidVertexException : public std::out_of_range {
    public:
        explicit InvalidVertexException(const std::string& message)
            : std::out_of_range(message) {}
    };

    /**
     * @brief Thrown when an edge-mutating call would create a self-loop.
     */
    class InvalidEdgeException : public std::invalid_argument {
    public:
        explicit InvalidEdgeException(const std::string& message)
            : std::invalid_argument(message) {}
    };

} // namespace CollabGraph

#endif // COLLAB_GRAPH_ERRORS_H
