/**
 * @file Plan.hpp
 * @brief Domain entities for a reviewable reorganization plan.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sortwell::domain {

/**
 * @enum ActionType
 * @brief Kind of filesystem operation a plan action performs.
 */
enum class ActionType {
    Move,       ///< Only the parent directory changes.
    Rename,     ///< Only the name changes.
    MoveRename, ///< Both change.
    Skip        ///< Nothing happens.
};

inline std::string ActionTypeToString(ActionType type) {
    switch (type) {
        case ActionType::Move: return "move";
        case ActionType::Rename: return "rename";
        case ActionType::MoveRename: return "move-rename";
        case ActionType::Skip: return "skip";
    }
    return "skip";
}

inline ActionType ActionTypeFromString(const std::string& value) {
    if (value == "move") return ActionType::Move;
    if (value == "rename") return ActionType::Rename;
    if (value == "move-rename") return ActionType::MoveRename;
    return ActionType::Skip;
}

/**
 * @enum NamingStyle
 * @brief Case transformation applied to destination file names.
 */
enum class NamingStyle {
    Original,
    TitleCase,
    LowerCase,
    CamelCase
};

inline std::string NamingStyleToString(NamingStyle style) {
    switch (style) {
        case NamingStyle::Original: return "original";
        case NamingStyle::TitleCase: return "titlecase";
        case NamingStyle::LowerCase: return "lowercase";
        case NamingStyle::CamelCase: return "camelcase";
    }
    return "original";
}

inline NamingStyle NamingStyleFromString(const std::string& value) {
    if (value == "titlecase") return NamingStyle::TitleCase;
    if (value == "lowercase") return NamingStyle::LowerCase;
    if (value == "camelcase") return NamingStyle::CamelCase;
    return NamingStyle::Original;
}

struct NamingPreference {
    NamingStyle style = NamingStyle::Original;
    bool removeSpecialChars = false;
};

struct ConfidenceThresholds {
    double autoApprove = 0.8;   ///< >= this, the action is approved without review.
    double requireReview = 0.5; ///< < this, the item is routed to the Inbox.
};

/**
 * @struct UserPreferences
 * @brief Naming, routing and threshold preferences echoed into every plan.
 */
struct UserPreferences {
    NamingPreference naming;
    ConfidenceThresholds confidenceThresholds;
    std::map<std::string, std::string> defaultFolders; ///< category -> folder name.
    std::vector<std::string> ignorePaths;

    static UserPreferences Defaults() {
        UserPreferences prefs;
        prefs.defaultFolders = {
            {"Documents", "Documents"},
            {"Images", "Images"},
            {"Videos", "Videos"},
            {"Audio", "Audio"},
            {"Archives", "Archives"},
            {"Code", "Code"},
            {"Projects", "Projects"},
            {"Unknown", "Inbox"}
        };
        prefs.ignorePaths = {"*.tmp", "*.temp", ".DS_Store", "Thumbs.db", "desktop.ini"};
        return prefs;
    }
};

/**
 * @struct PlanAction
 * @brief One proposed operation on one manifest entry.
 */
struct PlanAction {
    std::string id;
    std::string from;
    std::string fromRelative;
    std::string to;
    std::string toRelative;

    ActionType actionType = ActionType::Skip;
    std::string reason;
    double confidence = 0.0;

    std::optional<std::string> category;
    std::vector<std::string> tags;

    bool isProjectRoot = false;
    bool movesInsideProjectRoot = false; ///< Only ever true on a Skip action.
    bool hasCollision = false;
    bool approved = false;
};

/**
 * @struct SafetyCheck
 * @brief Verdict of the plan validation. Only project-root violations fail it.
 */
struct SafetyCheck {
    bool passed = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    int collisionsResolved = 0;
    std::vector<std::string> collisionDestinations;
    int lowConfidenceActions = 0;
    int skippedItems = 0;
    int projectRootViolations = 0;
};

struct PlanSummary {
    int totalActions = 0;
    int moves = 0; ///< Move and MoveRename.
    int renames = 0;
    int skips = 0;
    std::map<std::string, int> categoryCounts;

    int highConfidence = 0;   ///< >= 0.7
    int mediumConfidence = 0; ///< [0.4, 0.7)
    int lowConfidence = 0;    ///< < 0.4
};

/**
 * @struct Plan
 * @brief The unit of review. Immutable once built.
 */
struct Plan {
    std::string id;
    std::string manifestId;
    std::string createdAt;
    std::string destRoot;
    std::vector<PlanAction> actions;
    SafetyCheck safetyCheck;
    PlanSummary summary;
    UserPreferences userPreferences;

    const PlanAction* findAction(const std::string& actionId) const {
        for (const auto& action : actions) {
            if (action.id == actionId) return &action;
        }
        return nullptr;
    }
};

} // namespace sortwell::domain
