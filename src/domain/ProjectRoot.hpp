/**
 * @file ProjectRoot.hpp
 * @brief Domain types describing software project roots and generated folders.
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sortwell::domain {

/**
 * @enum ProjectType
 * @brief Ecosystem inferred from the marker files of a project root.
 */
enum class ProjectType {
    Node,
    Python,
    Rust,
    Go,
    Java,
    DotNet,
    Ruby,
    Php,
    Mixed
};

inline std::string ProjectTypeToString(ProjectType type) {
    switch (type) {
        case ProjectType::Node: return "node";
        case ProjectType::Python: return "python";
        case ProjectType::Rust: return "rust";
        case ProjectType::Go: return "go";
        case ProjectType::Java: return "java";
        case ProjectType::DotNet: return "dotnet";
        case ProjectType::Ruby: return "ruby";
        case ProjectType::Php: return "php";
        case ProjectType::Mixed: return "mixed";
    }
    return "mixed";
}

inline std::optional<ProjectType> ProjectTypeFromString(const std::string& value) {
    if (value == "node") return ProjectType::Node;
    if (value == "python") return ProjectType::Python;
    if (value == "rust") return ProjectType::Rust;
    if (value == "go") return ProjectType::Go;
    if (value == "java") return ProjectType::Java;
    if (value == "dotnet") return ProjectType::DotNet;
    if (value == "ruby") return ProjectType::Ruby;
    if (value == "php") return ProjectType::Php;
    if (value == "mixed") return ProjectType::Mixed;
    return std::nullopt;
}

/**
 * @struct ProjectRootDetection
 * @brief Result of inspecting the immediate children of one directory.
 */
struct ProjectRootDetection {
    bool isProjectRoot = false;
    std::set<std::string> signals;          ///< Matched marker names.
    std::optional<ProjectType> projectType; ///< Empty when not a project root.
    double confidence = 0.0;                ///< In [0,1], rounded to 2 decimals.
};

/** @brief Marker names whose presence makes a directory a project root. */
inline const std::vector<std::string>& ProjectRootSignals() {
    static const std::vector<std::string> kSignals = {
        // Version control
        ".git", ".svn", ".hg",
        // Node.js / JavaScript
        "package.json", "pnpm-lock.yaml", "yarn.lock", "package-lock.json", "tsconfig.json",
        "next.config.js", "next.config.mjs", "vite.config.js", "webpack.config.js",
        // Python
        "pyproject.toml", "requirements.txt", "Pipfile", "setup.py", "poetry.lock",
        // Rust
        "Cargo.toml", "Cargo.lock",
        // Go
        "go.mod", "go.sum",
        // Java
        "pom.xml", "build.gradle", "build.gradle.kts",
        // .NET (matched by extension)
        ".sln", ".csproj",
        // Ruby
        "Gemfile", "Gemfile.lock",
        // PHP
        "composer.json", "composer.lock"
    };
    return kSignals;
}

/** @brief Signals that on their own make a detection trustworthy. */
inline const std::vector<std::string>& StrongProjectSignals() {
    static const std::vector<std::string> kStrong = {
        ".git", "package.json", "Cargo.toml", "go.mod", "pom.xml", "pyproject.toml"
    };
    return kStrong;
}

/** @brief Version-control metadata directory names. */
inline const std::vector<std::string>& VersionControlMarkers() {
    static const std::vector<std::string> kMarkers = {".git", ".svn", ".hg"};
    return kMarkers;
}

/** @brief Build/dependency output folder names that are never descended into. */
inline const std::vector<std::string>& GeneratedFolderNames() {
    static const std::vector<std::string> kGenerated = {
        "node_modules", ".next", "dist", "build", "target", "__pycache__",
        ".venv", "venv", ".pytest_cache", ".gradle", "out"
    };
    return kGenerated;
}

} // namespace sortwell::domain
