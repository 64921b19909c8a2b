/**
 * @file ManifestBuilder.hpp
 * @brief Builds the classified inventory (manifest) of a directory tree.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/ProjectRootDetector.hpp"
#include "domain/ClassifierService.hpp"
#include "domain/Manifest.hpp"
#include "domain/MetadataExtractor.hpp"

namespace sortwell::application {

/**
 * @class ManifestBuilder
 * @brief Walks a tree once and turns every leaf item into a typed, scored ManifestEntry.
 *
 * Project roots and generated folders become single entries and are never
 * descended. Documents may be handed to an external classifier; a failing
 * classifier never aborts the scan. The walk itself is read-only.
 */
class ManifestBuilder {
public:
    /**
     * @param classifier Optional external classifier (may be null).
     * @param extractor Optional document metadata extractor (may be null).
     */
    ManifestBuilder(std::shared_ptr<domain::ClassifierService> classifier = nullptr,
                    std::shared_ptr<domain::MetadataExtractor> extractor = nullptr);

    /**
     * @brief Scans options.rootPath and returns the manifest.
     * @param options Scan options, echoed into the manifest.
     * @param statusCallback UI feedback.
     */
    domain::Manifest build(const domain::ScanOptions& options,
                           std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Glob match where '*' matches any character sequence (including '/'). */
    static bool matchesIgnorePattern(const std::string& text, const std::string& pattern);

    /** @brief Counts entries by kind and confidence band (>= 0.8, >= 0.5, below). */
    static domain::ManifestSummary summarize(const std::vector<domain::ManifestEntry>& entries);

    /** @brief Group iff confidence >= max(0.7, reviewThreshold), otherwise Review. */
    static domain::RecommendedHandling handlingFor(double confidence, double reviewThreshold);

private:
    domain::ManifestEntry createProjectRootEntry(const std::string& path, const std::string& relativePath,
                                                 const domain::ProjectRootDetection& detection) const;
    domain::ManifestEntry createGeneratedEntry(const std::string& path, const std::string& relativePath,
                                               const std::string& signal,
                                               const ProjectRootDetector::ProjectRootMap& roots) const;
    domain::ManifestEntry createFileEntry(const std::string& path, const std::string& relativePath,
                                          const ProjectRootDetector::ProjectRootMap& roots) const;

    /**
     * @brief Extension, metadata and filename based classification.
     * @return True if the entry should additionally be sent to the classifier.
     */
    bool classifyFile(domain::ManifestEntry& entry, const domain::ScanOptions& options) const;

    /** @brief Asks the external classifier; on failure leaves the fallback classification in place. */
    void applyClassifier(domain::ManifestEntry& entry, double reviewThreshold) const;

    bool isIgnored(const std::string& relativePath, const std::string& name,
                   const std::vector<std::string>& patterns) const;

    std::shared_ptr<domain::ClassifierService> m_classifier;
    std::shared_ptr<domain::MetadataExtractor> m_extractor;
    ProjectRootDetector m_detector;
};

} // namespace sortwell::application
