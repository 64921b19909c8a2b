/**
 * @file MetadataExtractor.hpp
 * @brief Interface for best-effort document metadata extraction.
 */

#pragma once
#include <optional>
#include <string>
#include "Manifest.hpp"

namespace sortwell::domain {

/**
 * @class MetadataExtractor
 * @brief Reads title/author/subject/keywords/page count/first-page text from a document.
 *
 * Absence of any field is valid. Implementations never throw.
 */
class MetadataExtractor {
public:
    virtual ~MetadataExtractor() = default;

    /** @brief True if this extractor understands files with the given lower-case extension. */
    virtual bool supports(const std::string& extension) const = 0;

    /**
     * @brief Extracts metadata from a file.
     * @return nullopt when the file could not be read at all.
     */
    virtual std::optional<DocumentMetadata> extract(const std::string& path) = 0;
};

} // namespace sortwell::domain
