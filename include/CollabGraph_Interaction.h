#ifndef COLLAB_GRAPH_INTERACTION_H
#define COLLAB_GRAPH_INTERACTION_H

#include <array>
#include <chrono>
#include <map>
#include <string>

namespace CollabGraph {

    /**
     * @brief Kinds of developer interaction, each with a fixed collaboration weight.
     */
    enum class InteractionType {
        CommentIssue,
        CommentPR,
        IssueOpened,
        PRReview,
        PRApproval,
        PRMerge,
        IssueClose
    };

    /// Every InteractionType, in declaration order.
    extern const std::array<InteractionType, 7> ALL_INTERACTION_TYPES;

    /**
     * @brief Collaboration weight of an interaction type.
     *
     * Comments weigh 2.0, opening or closing an issue 3.0, reviews and
     * approvals 4.0, merges 5.0.
     */
    double interactionWeight(InteractionType type);

    /**
     * @brief Stable upper-case name, e.g. "PR_MERGE".
     */
    const char* interactionTypeName(InteractionType type);

    /**
     * @brief Human-readable description, e.g. "Pull request merge".
     */
    const char* interactionTypeDescription(InteractionType type);

    /**
     * @brief Inverse of interactionTypeName().
     * @throws std::invalid_argument if the name is unknown.
     */
    InteractionType parseInteractionType(const std::string& name);

    /**
     * @brief One directed interaction: source acted on something owned by target.
     */
    struct Interaction {
        std::string source;
        std::string target;
        InteractionType type = InteractionType::CommentIssue;
        std::chrono::system_clock::time_point timestamp{};
        std::string context;

        double getWeight() const { return interactionWeight(type); }
    };

    /**
     * @brief A developer identity with its vertex id and display login.
     */
    struct Contributor {
        int vertexId = 0;
        std::string login;
    };

    /// Login -> contributor. Vertex ids must cover [0, size()) without gaps.
    using ContributorMap = std::map<std::string, Contributor>;

} // namespace CollabGraph

#endif // COLLAB_GRAPH_INTERACTION_H
