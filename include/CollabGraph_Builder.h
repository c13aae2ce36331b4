#ifndef COLLAB_GRAPH_BUILDER_H
#define COLLAB_GRAPH_BUILDER_H

#include <functional>
#include <iosfwd>
#include <memory>
#include <set>
#include <vector>

#include "CollabGraph.h"
#include "CollabGraph_Interaction.h"

namespace CollabGraph {

    /**
     * @brief Settings for GraphBuilder.
     */
    struct BuilderOptions {
        Representation representation = Representation::AdjacencyList;

        /// Progress sink, nullptr keeps the builder silent.
        std::ostream* log = nullptr;
    };

    /**
     * @brief Aggregates interaction records into a populated collaboration graph.
     *
     * One vertex is created per contributor, labelled with its login. Records
     * between the same ordered pair of contributors collapse into one edge.
     * Identical input always yields an identical graph.
     */
    class GraphBuilder {
    public:
        /**
         * @brief Counters describing the most recent build.
         */
        struct Stats {
            int recordsSeen = 0;
            int recordsUsed = 0;
            int selfInteractionsSkipped = 0;
            int edgesCreated = 0;
        };

        explicit GraphBuilder(BuilderOptions options = BuilderOptions());

        /**
         * @brief Builds the weighted graph over every interaction type.
         *
         * Edge weight is the sum of the type weights of all records for the pair.
         * @throws InvalidConfigurationException on a malformed contributor map or
         *         a record naming an unknown contributor.
         */
        std::unique_ptr<Graph> buildIntegratedGraph(const std::vector<Interaction>& interactions,
                                                    const ContributorMap& contributors);

        /**
         * @brief Builds the graph of a single interaction type.
         *
         * Edge weight is the number of matching records for the pair.
         */
        std::unique_ptr<Graph> buildGraphByType(const std::vector<Interaction>& interactions,
                                                const ContributorMap& contributors,
                                                InteractionType type);

        /**
         * @brief Builds the graph of a set of interaction types, weighted by record count.
         */
        std::unique_ptr<Graph> buildGraphByTypes(const std::vector<Interaction>& interactions,
                                                 const ContributorMap& contributors,
                                                 const std::set<InteractionType>& types);

        const Stats& lastStats() const;

    private:
        std::unique_ptr<Graph> buildGraph(const std::vector<Interaction>& interactions,
                                          const ContributorMap& contributors,
                                          const std::function<bool(InteractionType)>& accept,
                                          bool weighted);

        BuilderOptions options;
        Stats stats;
    };

} // namespace CollabGraph

#endif // COLLAB_GRAPH_BUILDER_H
