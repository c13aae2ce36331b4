// CollabGraph_Interaction.cpp

#include "CollabGraph_Interaction.h"
#include <stdexcept>

namespace CollabGraph {

    const std::array<InteractionType, 7> ALL_INTERACTION_TYPES = {
        InteractionType::CommentIssue,
        InteractionType::CommentPR,
        InteractionType::IssueOpened,
        InteractionType::PRReview,
        InteractionType::PRApproval,
        InteractionType::PRMerge,
        InteractionType::IssueClose
    };

    double interactionWeight(InteractionType type) {
        switch (type) {
            case InteractionType::CommentIssue:
            case InteractionType::CommentPR:
                return 2.0;
            case InteractionType::IssueOpened:
            case InteractionType::IssueClose:
                return 3.0;
            case InteractionType::PRReview:
            case InteractionType::PRApproval:
                return 4.0;
            case InteractionType::PRMerge:
                return 5.0;
        }
        throw std::invalid_argument("Invalid InteractionType.");
    }

    const char* interactionTypeName(InteractionType type) {
        switch (type) {
            case InteractionType::CommentIssue: return "COMMENT_ISSUE";
            case InteractionType::CommentPR:    return "COMMENT_PR";
            case InteractionType::IssueOpened:  return "ISSUE_OPENED";
            case InteractionType::PRReview:     return "PR_REVIEW";
            case InteractionType::PRApproval:   return "PR_APPROVAL";
            case InteractionType::PRMerge:      return "PR_MERGE";
            case InteractionType::IssueClose:   return "ISSUE_CLOSE";
        }
        throw std::invalid_argument("Invalid InteractionType.");
    }

    const char* interactionTypeDescription(InteractionType type) {
        switch (type) {
            case InteractionType::CommentIssue: return "Comment on issue";
            case InteractionType::CommentPR:    return "Comment on pull request";
            case InteractionType::IssueOpened:  return "Commented issue opening";
            case InteractionType::PRReview:     return "Pull request review";
            case InteractionType::PRApproval:   return "Pull request approval";
            case InteractionType::PRMerge:      return "Pull request merge";
            case InteractionType::IssueClose:   return "Issue closing";
        }
        throw std::invalid_argument("Invalid InteractionType.");
    }

    InteractionType parseInteractionType(const std::string& name) {
        for (InteractionType type : ALL_INTERACTION_TYPES) {
            if (name == interactionTypeName(type)) {
                return type;
            }
        }
        throw std::invalid_argument("Unknown interaction type '" + name + "'.");
    }

} // namespace CollabGraph
