/**
 * @file ManifestBuilder.cpp
 * @brief Implementation of ManifestBuilder.
 */

#include "application/ManifestBuilder.hpp"
#include "application/ClassificationPool.hpp"
#include "application/IdGenerator.hpp"
#include "application/Naming.hpp"
#include "domain/CategoryTable.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace sortwell::application {

namespace {

const std::vector<std::string>& DocumentExtensions() {
    static const std::vector<std::string> kExtensions = {".pdf", ".doc", ".docx", ".txt", ".md"};
    return kExtensions;
}

const std::vector<std::string>& CodeExtensions() {
    static const std::vector<std::string> kExtensions = {".js", ".ts", ".py", ".java", ".cpp", ".c", ".h"};
    return kExtensions;
}

bool IsOneOf(const std::string& value, const std::vector<std::string>& list) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::string ModifiedAt(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) return domain::NowIso8601();
    return domain::ToIso8601(ftime);
}

// Fills the fields the extractor left empty from the filename heuristics.
void MergeFilenameMetadata(domain::DocumentMetadata& metadata, const domain::DocumentMetadata& fromName) {
    bool extractedAnything = metadata.hasTitle() || metadata.author || metadata.hasSubject() ||
                             !metadata.keywords.empty() || metadata.pageCount || metadata.firstPageSnippet;
    if (!metadata.hasTitle()) metadata.title = fromName.title;
    if (!metadata.author) metadata.author = fromName.author;
    if (!metadata.hasSubject()) metadata.subject = fromName.subject;
    if (!metadata.creationDate) metadata.creationDate = fromName.creationDate;
    if (!extractedAnything) metadata.extractionMethod = fromName.extractionMethod;
}

} // namespace

ManifestBuilder::ManifestBuilder(std::shared_ptr<domain::ClassifierService> classifier,
                                 std::shared_ptr<domain::MetadataExtractor> extractor)
    : m_classifier(std::move(classifier)), m_extractor(std::move(extractor)) {}

domain::Manifest ManifestBuilder::build(const domain::ScanOptions& options,
                                        std::function<void(std::string)> statusCallback) {
    auto startTime = std::chrono::steady_clock::now();

    domain::Manifest manifest;
    manifest.id = GenerateId();
    manifest.createdAt = domain::NowIso8601();
    manifest.scanOptions = options;

    fs::path root = infrastructure::PathUtils::Normalize(options.rootPath);
    manifest.scanRoot = root.string();

    std::cout << "[ManifestBuilder] Starting scan of " << manifest.scanRoot << std::endl;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        std::cerr << "[ManifestBuilder] Scan root is not a readable directory: " << manifest.scanRoot << std::endl;
        manifest.summary = summarize(manifest.entries);
        return manifest;
    }

    // Pass 1: project roots.
    if (statusCallback) statusCallback("Detecting project roots...");
    auto roots = m_detector.findProjectRoots(root.string(), options.maxDepth, options.includeHidden);
    std::cout << "[ManifestBuilder] Found " << roots.size() << " project roots" << std::endl;
    for (const auto& [rootPath, detection] : roots) {
        std::cout << "  - " << rootPath << ": " << ProjectRootDetector::describeProject(detection) << std::endl;
    }

    // Pass 2: walk and classify.
    if (statusCallback) statusCallback("Scanning files...");
    std::vector<size_t> pendingClassification;
    std::set<std::string> visited;
    std::vector<std::pair<fs::path, int>> stack;
    stack.emplace_back(root, 0);

    while (!stack.empty()) {
        auto [current, depth] = stack.back();
        stack.pop_back();

        if (depth > options.maxDepth) continue;

        fs::path real = fs::canonical(current, ec);
        if (!visited.insert(ec ? current.string() : real.string()).second) {
            std::cerr << "[ManifestBuilder] Skipping already visited directory: " << current.string() << std::endl;
            continue;
        }

        std::vector<fs::directory_entry> children;
        fs::directory_iterator it(current, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[ManifestBuilder] Error scanning " << current.string() << ": " << ec.message() << std::endl;
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            children.push_back(*it);
        }
        if (ec) {
            std::cerr << "[ManifestBuilder] Error scanning " << current.string() << ": " << ec.message() << std::endl;
            continue;
        }
        std::sort(children.begin(), children.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename() < b.path().filename();
                  });

        std::vector<fs::path> subdirs;
        for (const auto& child : children) {
            std::string name = child.path().filename().string();
            std::string childPath = child.path().string();
            std::string relativePath = infrastructure::PathUtils::RelativeTo(child.path(), root);

            if (!options.includeHidden && !name.empty() && name.front() == '.' &&
                !ProjectRootDetector::isVersionControlMarker(name)) {
                continue;
            }
            if (isIgnored(relativePath, name, options.ignorePatterns)) {
                continue;
            }

            std::error_code typeEc;
            if (child.is_directory(typeEc)) {
                auto rootIt = roots.find(childPath);
                if (rootIt == roots.end() &&
                    ProjectRootDetector::shouldDescend(name, options.includeHidden)) {
                    // Every directory about to be entered is checked, even if pass 1 never reached it.
                    auto detection = m_detector.detect(childPath);
                    if (detection.isProjectRoot) {
                        std::cout << "[ManifestBuilder] Late project root: " << childPath << std::endl;
                        rootIt = roots.emplace(childPath, detection).first;
                    }
                }
                if (rootIt != roots.end()) {
                    manifest.entries.push_back(createProjectRootEntry(childPath, relativePath, rootIt->second));
                } else if (ProjectRootDetector::isVersionControlMarker(name)) {
                    manifest.entries.push_back(
                        createGeneratedEntry(childPath, relativePath, "Version control metadata", roots));
                } else if (ProjectRootDetector::isGeneratedFolder(name)) {
                    manifest.entries.push_back(createGeneratedEntry(
                        childPath, relativePath, "Generated folder (node_modules, dist, etc.)", roots));
                } else {
                    subdirs.push_back(child.path());
                }
                continue;
            }

            if (!child.is_regular_file(typeEc)) {
                // Broken symlinks, sockets, devices.
                continue;
            }

            auto entry = createFileEntry(childPath, relativePath, roots);
            if (!entry.insideProjectRoot && classifyFile(entry, options)) {
                pendingClassification.push_back(manifest.entries.size());
            }
            manifest.entries.push_back(std::move(entry));
        }

        for (auto sub = subdirs.rbegin(); sub != subdirs.rend(); ++sub) {
            stack.emplace_back(*sub, depth + 1);
        }
    }

    std::cout << "[ManifestBuilder] Scanned " << manifest.entries.size() << " items" << std::endl;

    // Pass 3: external classifier, one independent call per document.
    if (!pendingClassification.empty()) {
        if (statusCallback) {
            statusCallback("Classifying " + std::to_string(pendingClassification.size()) + " documents...");
        }
        std::cout << "[ManifestBuilder] Classifying " << pendingClassification.size() << " documents with "
                  << m_classifier->providerName() << std::endl;

        int workers = std::min<int>(std::max(1, options.classifierConcurrency),
                                    static_cast<int>(pendingClassification.size()));
        if (workers <= 1) {
            for (size_t index : pendingClassification) {
                applyClassifier(manifest.entries[index], options.reviewThreshold);
            }
        } else {
            ClassificationPool pool(workers);
            for (size_t index : pendingClassification) {
                domain::ManifestEntry* entry = &manifest.entries[index];
                double threshold = options.reviewThreshold;
                pool.submit([this, entry, threshold]() { applyClassifier(*entry, threshold); });
            }
            pool.drain();
        }
    }

    manifest.summary = summarize(manifest.entries);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
    std::cout << "[ManifestBuilder] Completed in " << elapsed << " ms" << std::endl;
    if (statusCallback) statusCallback("Scan complete: " + std::to_string(manifest.entries.size()) + " items");

    return manifest;
}

domain::ManifestEntry ManifestBuilder::createProjectRootEntry(const std::string& path,
                                                              const std::string& relativePath,
                                                              const domain::ProjectRootDetection& detection) const {
    domain::ManifestEntry entry;
    entry.path = path;
    entry.relativePath = relativePath;
    entry.name = fs::path(path).filename().string();
    entry.modifiedAt = ModifiedAt(path);

    entry.kind = domain::ItemKind::ProjectRoot;
    entry.confidence = detection.confidence;
    for (const auto& signal : detection.signals) {
        entry.signals.push_back("Project signal: " + signal);
    }
    entry.projectRoot = detection;
    entry.suggestedCategory = "Projects";
    entry.suggestedTags.push_back(detection.projectType ? domain::ProjectTypeToString(*detection.projectType)
                                                        : "project");
    entry.recommendedHandling = domain::RecommendedHandling::Keep;
    return entry;
}

domain::ManifestEntry ManifestBuilder::createGeneratedEntry(const std::string& path,
                                                            const std::string& relativePath,
                                                            const std::string& signal,
                                                            const ProjectRootDetector::ProjectRootMap& roots) const {
    domain::ManifestEntry entry;
    entry.path = path;
    entry.relativePath = relativePath;
    entry.name = fs::path(path).filename().string();
    entry.modifiedAt = ModifiedAt(path);

    entry.kind = domain::ItemKind::Generated;
    entry.confidence = 1.0;
    entry.signals.push_back(signal);

    auto containing = ProjectRootDetector::findContainingRoot(path, roots);
    if (containing) {
        entry.insideProjectRoot = true;
        entry.parentProjectRoot = containing;
    }
    entry.recommendedHandling = domain::RecommendedHandling::Keep;
    return entry;
}

domain::ManifestEntry ManifestBuilder::createFileEntry(const std::string& path,
                                                       const std::string& relativePath,
                                                       const ProjectRootDetector::ProjectRootMap& roots) const {
    domain::ManifestEntry entry;
    entry.path = path;
    entry.relativePath = relativePath;
    entry.name = fs::path(path).filename().string();
    entry.extension = domain::NormalizeExtension(Naming::SplitExtension(entry.name).second);
    if (!entry.extension.empty()) entry.extension = "." + entry.extension;

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    entry.size = ec ? 0 : size;
    entry.modifiedAt = ModifiedAt(path);

    auto containing = ProjectRootDetector::findContainingRoot(path, roots);
    if (containing) {
        entry.insideProjectRoot = true;
        entry.parentProjectRoot = containing;
        entry.signals.push_back("Inside project root: " + *containing);
        entry.recommendedHandling = domain::RecommendedHandling::Keep;
        entry.confidence = 1.0;
    }
    return entry;
}

bool ManifestBuilder::classifyFile(domain::ManifestEntry& entry, const domain::ScanOptions& options) const {
    auto basicCategory = domain::CategoryFromExtension(entry.extension);
    if (basicCategory) {
        entry.signals.push_back("Extension match: " + *basicCategory);
    }
    if (domain::IsGenericFilename(Naming::SplitExtension(entry.name).first)) {
        entry.signals.push_back("Generic filename");
    }

    if (IsOneOf(entry.extension, DocumentExtensions())) {
        entry.kind = domain::ItemKind::Document;

        domain::DocumentMetadata metadata;
        if (options.extractMetadata && m_extractor && m_extractor->supports(entry.extension)) {
            try {
                auto extracted = m_extractor->extract(entry.path);
                if (extracted) {
                    metadata = *extracted;
                    if (metadata.hasTitle()) entry.signals.push_back("Document title: " + *metadata.title);
                    if (metadata.hasSubject()) entry.signals.push_back("Document subject: " + *metadata.subject);
                }
            } catch (const std::exception& e) {
                std::cerr << "[ManifestBuilder] Failed to extract metadata: " << entry.path << ": " << e.what()
                          << std::endl;
            }
        }
        if (!metadata.hasTitle()) {
            MergeFilenameMetadata(metadata, Naming::MetadataFromFilename(entry.name));
        }
        entry.documentMetadata = metadata;

        // Fallback classification; the classifier may overwrite it.
        entry.confidence = metadata.hasTitle() ? 0.6 : 0.4;
        entry.suggestedCategory = basicCategory.value_or("Documents");
        entry.recommendedHandling = handlingFor(entry.confidence, options.reviewThreshold);

        return options.useClassifier && m_classifier != nullptr;
    }

    if (basicCategory == "Images" || basicCategory == "Video" || basicCategory == "Audio") {
        entry.kind = domain::ItemKind::Media;
        entry.confidence = 0.8;
        if (*basicCategory == "Images") {
            entry.suggestedCategory = "Images";
            entry.signals.push_back("Image file");
        } else if (*basicCategory == "Video") {
            entry.suggestedCategory = "Videos";
            entry.signals.push_back("Video file");
        } else {
            entry.suggestedCategory = "Audio";
            entry.signals.push_back("Audio file");
        }
    } else if (basicCategory == "Archives") {
        entry.kind = domain::ItemKind::Archive;
        entry.confidence = 0.9;
        entry.suggestedCategory = "Archives";
        entry.signals.push_back("Archive file");
    } else if (IsOneOf(entry.extension, CodeExtensions())) {
        entry.kind = domain::ItemKind::Code;
        entry.confidence = 0.7;
        entry.suggestedCategory = "Code";
        entry.signals.push_back("Source code file");
        // Loose code needs a human look even at high confidence.
        entry.recommendedHandling = domain::RecommendedHandling::Review;
        return false;
    } else {
        entry.kind = domain::ItemKind::Unknown;
        entry.confidence = 0.3;
        if (basicCategory) entry.suggestedCategory = basicCategory;
        entry.signals.push_back("Unknown file type");
    }

    entry.recommendedHandling = handlingFor(entry.confidence, options.reviewThreshold);
    return false;
}

void ManifestBuilder::applyClassifier(domain::ManifestEntry& entry, double reviewThreshold) const {
    domain::ClassificationRequest request;
    request.filename = entry.name;
    request.extension = entry.extension;
    request.size = entry.size;
    request.metadata = entry.documentMetadata;
    request.folderContext = Naming::FolderContext(entry.path);

    std::optional<domain::ClassificationResponse> response;
    try {
        response = m_classifier->classify(request);
    } catch (const std::exception& e) {
        std::cerr << "[ManifestBuilder] Classification failed for " << entry.name << ": " << e.what() << std::endl;
    }

    if (!response) {
        entry.signals.push_back("AI classification failed, using fallback");
        return;
    }

    auto result = domain::SanitizeClassification(*response);
    entry.suggestedCategory = result.category;
    entry.confidence = result.confidence;
    entry.signals.push_back("AI classification: " + result.reasoning);

    if (!entry.documentMetadata) entry.documentMetadata = domain::DocumentMetadata{};
    if (result.subject) {
        entry.documentMetadata->subject = result.subject;
    }
    if (result.title && !entry.documentMetadata->hasTitle()) {
        entry.documentMetadata->title = result.title;
    }

    entry.recommendedHandling = handlingFor(entry.confidence, reviewThreshold);
}

bool ManifestBuilder::isIgnored(const std::string& relativePath, const std::string& name,
                                const std::vector<std::string>& patterns) const {
    for (const auto& pattern : patterns) {
        if (matchesIgnorePattern(relativePath, pattern)) return true;
        // Patterns without a '/' also apply to the bare name at any depth.
        if (pattern.find('/') == std::string::npos && matchesIgnorePattern(name, pattern)) return true;
    }
    return false;
}

bool ManifestBuilder::matchesIgnorePattern(const std::string& text, const std::string& pattern) {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string::npos;
    size_t matchPos = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (starPos != std::string::npos) {
            p = starPos + 1;
            t = ++matchPos;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

domain::ManifestSummary ManifestBuilder::summarize(const std::vector<domain::ManifestEntry>& entries) {
    domain::ManifestSummary summary;
    summary.totalItems = static_cast<int>(entries.size());

    for (const auto& entry : entries) {
        switch (entry.kind) {
            case domain::ItemKind::ProjectRoot: summary.projectRoots++; break;
            case domain::ItemKind::Document: summary.documents++; break;
            case domain::ItemKind::Media: summary.media++; break;
            case domain::ItemKind::Archive: summary.archives++; break;
            case domain::ItemKind::Code: summary.code++; break;
            case domain::ItemKind::Generated: summary.generated++; break;
            case domain::ItemKind::Unknown: summary.unknown++; break;
        }

        if (entry.confidence >= 0.8) {
            summary.highConfidence++;
        } else if (entry.confidence >= 0.5) {
            summary.mediumConfidence++;
        } else {
            summary.lowConfidence++;
        }
    }
    return summary;
}

domain::RecommendedHandling ManifestBuilder::handlingFor(double confidence, double reviewThreshold) {
    return confidence >= std::max(0.7, reviewThreshold) ? domain::RecommendedHandling::Group
                                                        : domain::RecommendedHandling::Review;
}

} // namespace sortwell::application
