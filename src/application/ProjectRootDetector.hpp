/**
 * @file ProjectRootDetector.hpp
 * @brief Detection of software project roots that must never be split apart.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include "domain/ProjectRoot.hpp"

namespace sortwell::application {

/**
 * @class ProjectRootDetector
 * @brief Decides from marker files whether a directory is the top of a software project.
 *
 * Detection reads only the immediate child names of a directory. Unreadable
 * directories are reported as "not a project root" and never raise.
 */
class ProjectRootDetector {
public:
    /** @brief Map of project root path to its detection, ordered by path. */
    using ProjectRootMap = std::map<std::string, domain::ProjectRootDetection>;

    /**
     * @brief Inspects one directory.
     * @param dirPath Directory to inspect.
     * @return Detection; isProjectRoot is false when no marker is present or the directory is unreadable.
     */
    domain::ProjectRootDetection detect(const std::string& dirPath) const;

    /**
     * @brief Depth-first search for project roots below (and including) root.
     *
     * Stops descending at every detected project root. Other directories are
     * entered exactly when shouldDescend() allows it.
     * @param root Directory to start from.
     * @param maxDepth Maximum depth below root that is inspected.
     * @param includeHidden Also enter dot-directories (never VCS metadata).
     */
    ProjectRootMap findProjectRoots(const std::string& root, int maxDepth = 10, bool includeHidden = false) const;

    /**
     * @brief Descent rule shared by every tree walk.
     *
     * Generated folders and version-control metadata are never entered;
     * other dot-directories only with includeHidden.
     */
    static bool shouldDescend(const std::string& dirName, bool includeHidden);

    /** @brief True if the directory name is on the generated-folder denylist. */
    static bool isGeneratedFolder(const std::string& dirName);

    /** @brief True if the name is a version-control metadata directory. */
    static bool isVersionControlMarker(const std::string& name);

    /** @brief Human-readable description, e.g. "Project (node): .git, package.json". */
    static std::string describeProject(const domain::ProjectRootDetection& detection);

    /**
     * @brief Finds the project root containing (or equal to) path.
     * @return The project root path, or nullopt if path is outside all of them.
     */
    static std::optional<std::string> findContainingRoot(const std::string& path, const ProjectRootMap& roots);

    /**
     * @brief Checks a proposed move against every known project root.
     *
     * Moving out of a project root (unless the source is the root itself) and
     * moving into any project root are both violations.
     * @return Error text for a violation, nullopt if the move is allowed.
     */
    static std::optional<std::string> validateMove(const std::string& source,
                                                   const std::string& destination,
                                                   const ProjectRootMap& roots);

private:
    static domain::ProjectType inferProjectType(const std::set<std::string>& signals);
    static double calculateConfidence(const std::set<std::string>& signals, domain::ProjectType type);
};

} // namespace sortwell::application
