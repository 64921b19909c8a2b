/**
 * @file Manifest.hpp
 * @brief Domain entities for the classified inventory of a scanned tree.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ProjectRoot.hpp"

namespace sortwell::domain {

/**
 * @enum ItemKind
 * @brief Classification of a manifest entry.
 */
enum class ItemKind {
    ProjectRoot,
    Document,
    Media,
    Archive,
    Code,
    Generated,
    Unknown
};

/**
 * @enum RecommendedHandling
 * @brief What later stages should do with an entry.
 */
enum class RecommendedHandling {
    Keep,   ///< Leave in place (project roots, generated folders).
    Group,  ///< Group with similar items.
    Review  ///< Low confidence, route for manual review.
};

inline std::string ItemKindToString(ItemKind kind) {
    switch (kind) {
        case ItemKind::ProjectRoot: return "ProjectRoot";
        case ItemKind::Document: return "Document";
        case ItemKind::Media: return "Media";
        case ItemKind::Archive: return "Archive";
        case ItemKind::Code: return "Code";
        case ItemKind::Generated: return "Generated";
        case ItemKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline ItemKind ItemKindFromString(const std::string& value) {
    if (value == "ProjectRoot") return ItemKind::ProjectRoot;
    if (value == "Document") return ItemKind::Document;
    if (value == "Media") return ItemKind::Media;
    if (value == "Archive") return ItemKind::Archive;
    if (value == "Code") return ItemKind::Code;
    if (value == "Generated") return ItemKind::Generated;
    return ItemKind::Unknown;
}

inline std::string HandlingToString(RecommendedHandling handling) {
    switch (handling) {
        case RecommendedHandling::Keep: return "keep";
        case RecommendedHandling::Group: return "group";
        case RecommendedHandling::Review: return "review";
    }
    return "review";
}

inline RecommendedHandling HandlingFromString(const std::string& value) {
    if (value == "keep") return RecommendedHandling::Keep;
    if (value == "group") return RecommendedHandling::Group;
    return RecommendedHandling::Review;
}

/**
 * @struct DocumentMetadata
 * @brief Best-effort metadata of a document. Every field may be absent.
 */
struct DocumentMetadata {
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::optional<std::string> subject;
    std::vector<std::string> keywords;
    std::optional<std::string> creationDate;
    std::optional<int> pageCount;
    std::optional<std::string> firstPageSnippet; ///< At most 500 characters.
    std::string extractionMethod = "none";       ///< "pdfinfo", "pdf-dictionary", "filename", "none".

    bool hasTitle() const { return title && !title->empty(); }
    bool hasSubject() const { return subject && !subject->empty(); }
};

/**
 * @struct ManifestEntry
 * @brief One leaf item of the scanned tree: a file, a project root or a generated folder.
 */
struct ManifestEntry {
    // Identity
    std::string path;         ///< Absolute path.
    std::string relativePath; ///< Relative to the scan root, '/' separated.
    std::string name;
    std::string extension;    ///< Lower-case, with leading dot; empty for directories.
    std::uintmax_t size = 0;
    std::string modifiedAt;   ///< ISO-8601 UTC.

    // Classification
    ItemKind kind = ItemKind::Unknown;
    double confidence = 0.5;
    std::vector<std::string> signals; ///< Human-readable evidence trail.
    std::optional<std::string> suggestedCategory;
    std::vector<std::string> suggestedTags;

    std::optional<DocumentMetadata> documentMetadata;

    // Project linkage
    std::optional<ProjectRootDetection> projectRoot; ///< Set on ProjectRoot entries.
    bool insideProjectRoot = false;
    std::optional<std::string> parentProjectRoot;

    RecommendedHandling recommendedHandling = RecommendedHandling::Review;
};

/**
 * @struct ScanOptions
 * @brief Options of a single scan, echoed into the manifest.
 */
struct ScanOptions {
    std::string rootPath;
    std::vector<std::string> ignorePatterns; ///< '*' matches any sequence, against the relative path.
    bool includeHidden = false;
    int maxDepth = 10;

    bool useClassifier = false;
    int classifierConcurrency = 1;  ///< Upper bound on parallel classifier calls.
    bool extractMetadata = true;
    double reviewThreshold = 0.5;   ///< Below this an entry is never grouped.
};

/**
 * @struct ManifestSummary
 * @brief Aggregate counters of a manifest.
 */
struct ManifestSummary {
    int totalItems = 0;
    int projectRoots = 0;
    int documents = 0;
    int media = 0;
    int archives = 0;
    int code = 0;
    int generated = 0;
    int unknown = 0;

    int highConfidence = 0;   ///< >= 0.8
    int mediumConfidence = 0; ///< [0.5, 0.8)
    int lowConfidence = 0;    ///< < 0.5
};

/**
 * @struct Manifest
 * @brief Classified inventory of a scan. Immutable once built.
 */
struct Manifest {
    std::string id;
    std::string scanRoot;
    std::string createdAt;
    ScanOptions scanOptions;
    std::vector<ManifestEntry> entries;
    ManifestSummary summary;
};

} // namespace sortwell::domain
