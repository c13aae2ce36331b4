// CollabGraph_Builder.cpp

#include "CollabGraph_Builder.h"
#include "CollabGraph_Internal.h"
#include <map>
#include <string>
#include <utility>

namespace CollabGraph {

    namespace {

        // Ids must be unique and cover [0, contributors.size())
        void validateContributors(const ContributorMap& contributors) {
            if (contributors.empty()) {
                throw InvalidConfigurationException("Contributor map is empty.");
            }

            const int count = static_cast<int>(contributors.size());
            std::vector<bool> seen(count, false);
            for (const auto& entry : contributors) {
                int id = entry.second.vertexId;
                if (id < 0 || id >= count) {
                    throw InvalidConfigurationException(
                        "Contributor '" + entry.first + "' has vertex id " + std::to_string(id) +
                        " outside [0, " + std::to_string(count - 1) + "].");
                }
                if (seen[id]) {
                    throw InvalidConfigurationException(
                        "Vertex id " + std::to_string(id) + " is assigned to more than one contributor.");
                }
                seen[id] = true;
            }
        }

        int vertexOf(const ContributorMap& contributors, const std::string& login) {
            auto it = contributors.find(login);
            if (it == contributors.end()) {
                throw InvalidConfigurationException("Unknown contributor '" + login + "'.");
            }
            return it->second.vertexId;
        }

    } // namespace

    // Constructor
    GraphBuilder::GraphBuilder(BuilderOptions options)
        : options(options) {}

    std::unique_ptr<Graph> GraphBuilder::buildIntegratedGraph(const std::vector<Interaction>& interactions,
                                                              const ContributorMap& contributors) {
        return buildGraph(interactions, contributors, [](InteractionType) { return true; }, true);
    }

    std::unique_ptr<Graph> GraphBuilder::buildGraphByType(const std::vector<Interaction>& interactions,
                                                          const ContributorMap& contributors,
                                                          InteractionType type) {
        return buildGraph(interactions, contributors,
                          [type](InteractionType candidate) { return candidate == type; }, false);
    }

    std::unique_ptr<Graph> GraphBuilder::buildGraphByTypes(const std::vector<Interaction>& interactions,
                                                           const ContributorMap& contributors,
                                                           const std::set<InteractionType>& types) {
        return buildGraph(interactions, contributors,
                          [&types](InteractionType candidate) { return types.count(candidate) > 0; }, false);
    }

    const GraphBuilder::Stats& GraphBuilder::lastStats() const {
        return stats;
    }

    // Aggregates per ordered pair, then writes edges in ascending (source, target) order
    std::unique_ptr<Graph> GraphBuilder::buildGraph(const std::vector<Interaction>& interactions,
                                                    const ContributorMap& contributors,
                                                    const std::function<bool(InteractionType)>& accept,
                                                    bool weighted) {
        validateContributors(contributors);

        Stats current;
        std::map<std::pair<int, int>, double> edgeWeights;

        for (const auto& interaction : interactions) {
            ++current.recordsSeen;
            if (!accept(interaction.type)) {
                continue;
            }

            int source = vertexOf(contributors, interaction.source);
            int target = vertexOf(contributors, interaction.target);
            if (source == target) {
                ++current.selfInteractionsSkipped;
                continue;
            }

            ++current.recordsUsed;
            edgeWeights[{source, target}] += weighted ? interaction.getWeight() : 1.0;
        }

        auto graph = makeGraph(options.representation, static_cast<int>(contributors.size()));
        for (const auto& entry : contributors) {
            graph->setVertexLabel(entry.second.vertexId, entry.second.login);
        }

        for (const auto& entry : edgeWeights) {
            graph->setEdgeWeight(entry.first.first, entry.first.second, entry.second);
        }
        current.edgesCreated = graph->getEdgeCount();
        stats = current;

        detail::logLine(options.log,
                        std::string("built ") + (weighted ? "weighted" : "count") + " graph: " +
                        std::to_string(graph->getVertexCount()) + " vertices, " +
                        std::to_string(stats.edgesCreated) + " edges from " +
                        std::to_string(stats.recordsUsed) + "/" + std::to_string(stats.recordsSeen) +
                        " records (" + std::to_string(stats.selfInteractionsSkipped) +
                        " self-interactions skipped)");

        return graph;
    }

} // namespace CollabGraph
