/**
 * @file ProjectRootDetector.cpp
 * @brief Implementation of ProjectRootDetector.
 */

#include "application/ProjectRootDetector.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sortwell::application {

namespace {

bool Contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

// ".sln" and ".csproj" are extensions, every other signal is an exact name.
bool MatchesSignal(const std::string& childName, const std::string& signal) {
    if (signal == ".sln" || signal == ".csproj") {
        return childName.size() > signal.size() &&
               childName.compare(childName.size() - signal.size(), signal.size(), signal) == 0;
    }
    return childName == signal;
}

} // namespace

domain::ProjectRootDetection ProjectRootDetector::detect(const std::string& dirPath) const {
    domain::ProjectRootDetection detection;

    std::error_code ec;
    fs::directory_iterator it(dirPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return detection;
    }

    std::vector<std::string> childNames;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[ProjectRootDetector] Error listing " << dirPath << ": " << ec.message() << std::endl;
            return domain::ProjectRootDetection{};
        }
        childNames.push_back(it->path().filename().string());
    }

    for (const auto& signal : domain::ProjectRootSignals()) {
        for (const auto& child : childNames) {
            if (MatchesSignal(child, signal)) {
                detection.signals.insert(signal);
                break;
            }
        }
    }

    if (detection.signals.empty()) {
        return detection;
    }

    auto type = inferProjectType(detection.signals);
    detection.isProjectRoot = true;
    detection.projectType = type;
    detection.confidence = calculateConfidence(detection.signals, type);
    return detection;
}

domain::ProjectType ProjectRootDetector::inferProjectType(const std::set<std::string>& signals) {
    auto has = [&signals](const char* name) { return signals.count(name) > 0; };

    if (has("package.json")) return domain::ProjectType::Node;
    if (has("pyproject.toml") || has("requirements.txt") || has("Pipfile") || has("setup.py")) {
        return domain::ProjectType::Python;
    }
    if (has("Cargo.toml")) return domain::ProjectType::Rust;
    if (has("go.mod")) return domain::ProjectType::Go;
    if (has("pom.xml") || has("build.gradle") || has("build.gradle.kts")) return domain::ProjectType::Java;
    if (has(".sln") || has(".csproj")) return domain::ProjectType::DotNet;
    if (has("Gemfile")) return domain::ProjectType::Ruby;
    if (has("composer.json")) return domain::ProjectType::Php;

    // Lockfiles, bare version control and anything else without a primary manifest.
    return domain::ProjectType::Mixed;
}

double ProjectRootDetector::calculateConfidence(const std::set<std::string>& signals, domain::ProjectType type) {
    double confidence = std::min(0.5 + 0.1 * static_cast<double>(signals.size()), 1.0);

    const auto& strong = domain::StrongProjectSignals();
    bool hasStrong = std::any_of(signals.begin(), signals.end(),
                                 [&strong](const std::string& s) { return Contains(strong, s); });
    if (hasStrong) {
        confidence = std::min(confidence + 0.2, 1.0);
    }
    if (type != domain::ProjectType::Mixed) {
        confidence = std::min(confidence + 0.1, 1.0);
    }
    return std::round(confidence * 100.0) / 100.0;
}

ProjectRootDetector::ProjectRootMap ProjectRootDetector::findProjectRoots(const std::string& root, int maxDepth,
                                                                          bool includeHidden) const {
    ProjectRootMap roots;
    std::set<std::string> visited;

    std::vector<std::pair<fs::path, int>> stack;
    stack.emplace_back(infrastructure::PathUtils::Normalize(root), 0);

    while (!stack.empty()) {
        auto [current, depth] = stack.back();
        stack.pop_back();

        if (depth > maxDepth) continue;

        std::error_code ec;
        fs::path real = fs::canonical(current, ec);
        std::string realKey = ec ? current.string() : real.string();
        if (!visited.insert(realKey).second) {
            std::cerr << "[ProjectRootDetector] Skipping already visited directory (symlink cycle?): "
                      << current.string() << std::endl;
            continue;
        }

        auto detection = detect(current.string());
        if (detection.isProjectRoot) {
            roots.emplace(current.string(), detection);
            continue;
        }

        fs::directory_iterator it(current, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[ProjectRootDetector] Cannot read " << current.string() << ": " << ec.message() << std::endl;
            continue;
        }

        std::vector<fs::path> children;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code typeEc;
            if (!it->is_directory(typeEc) || typeEc) continue;

            if (!shouldDescend(it->path().filename().string(), includeHidden)) continue;
            children.push_back(it->path());
        }
        if (ec) {
            std::cerr << "[ProjectRootDetector] Error listing " << current.string() << ": " << ec.message() << std::endl;
        }

        // Reverse-sorted push keeps the walk in name order.
        std::sort(children.begin(), children.end(), std::greater<fs::path>());
        for (const auto& child : children) {
            stack.emplace_back(child, depth + 1);
        }
    }

    return roots;
}

bool ProjectRootDetector::shouldDescend(const std::string& dirName, bool includeHidden) {
    if (isGeneratedFolder(dirName) || isVersionControlMarker(dirName)) return false;
    if (!includeHidden && !dirName.empty() && dirName.front() == '.') return false;
    return true;
}

bool ProjectRootDetector::isGeneratedFolder(const std::string& dirName) {
    return Contains(domain::GeneratedFolderNames(), dirName);
}

bool ProjectRootDetector::isVersionControlMarker(const std::string& name) {
    return Contains(domain::VersionControlMarkers(), name);
}

std::string ProjectRootDetector::describeProject(const domain::ProjectRootDetection& detection) {
    if (!detection.isProjectRoot) {
        return "Not a project";
    }

    std::ostringstream ss;
    ss << "Project";
    if (detection.projectType) {
        ss << " (" << domain::ProjectTypeToString(*detection.projectType) << ")";
    }
    ss << ": ";
    int shown = 0;
    for (const auto& signal : detection.signals) {
        if (shown == 3) {
            ss << "...";
            break;
        }
        if (shown > 0) ss << ", ";
        ss << signal;
        ++shown;
    }
    return ss.str();
}

std::optional<std::string> ProjectRootDetector::findContainingRoot(const std::string& path, const ProjectRootMap& roots) {
    for (const auto& [rootPath, detection] : roots) {
        (void)detection;
        if (infrastructure::PathUtils::IsSameOrInside(path, rootPath)) {
            return rootPath;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ProjectRootDetector::validateMove(const std::string& source,
                                                             const std::string& destination,
                                                             const ProjectRootMap& roots) {
    auto sourceRoot = findContainingRoot(source, roots);
    if (sourceRoot && infrastructure::PathUtils::Normalize(source).string() != *sourceRoot) {
        return "Cannot move file " + source + " from inside project root " + *sourceRoot +
               ". Move the entire project instead.";
    }

    auto destRoot = findContainingRoot(destination, roots);
    if (destRoot) {
        return "Cannot move file into project root " + *destRoot + ".";
    }
    return std::nullopt;
}

} // namespace sortwell::application
