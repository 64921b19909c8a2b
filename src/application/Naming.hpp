/**
 * @file Naming.hpp
 * @brief Filename and folder-name rules shared by the manifest and plan stages.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include "domain/Manifest.hpp"
#include "domain/Plan.hpp"

namespace sortwell::application {

/**
 * @class Naming
 * @brief Pure string transformations. None of them touch the filesystem.
 */
class Naming {
public:
    /**
     * @brief Splits "name.ext" into ("name", ".ext").
     *
     * A leading dot does not start an extension (".bashrc" has none).
     */
    static std::pair<std::string, std::string> SplitExtension(const std::string& filename);

    /**
     * @brief Applies case style and special-character stripping to the base name.
     * The extension is preserved verbatim.
     */
    static std::string ApplyNamingPreferences(const std::string& filename, const domain::NamingPreference& naming);

    /** @brief Separators to spaces, collapsed whitespace, non-word characters dropped, title case. */
    static std::string CleanTitle(const std::string& title);

    /**
     * @brief Infers title/subject/author/date from common filename patterns.
     *
     * Recognized: "YYYY-MM-DD Title", "Subject - Title", "Title (Author)".
     * Otherwise the title is the base name with '_' and '-' turned into spaces.
     */
    static domain::DocumentMetadata MetadataFromFilename(const std::string& filename);

    /** @brief Title used for the destination of a document: metadata title, filename title, or base name. */
    static std::string GenerateCleanTitle(const domain::DocumentMetadata& metadata, const std::string& filename);

    /**
     * @brief The last (up to three) parent folder names, generic ones removed, joined with " / ".
     * @return nullopt when nothing meaningful is left.
     */
    static std::optional<std::string> FolderContext(const std::string& path);

    /** @brief Makes a category/subject usable as a single path segment. Falls back to "Other". */
    static std::string SanitizeFolderName(const std::string& name);
};

} // namespace sortwell::application
