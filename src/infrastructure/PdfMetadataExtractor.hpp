/**
 * @file PdfMetadataExtractor.hpp
 * @brief Best-effort PDF metadata via poppler tools, with a raw dictionary scan as fallback.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/MetadataExtractor.hpp"

namespace sortwell::infrastructure {

class PdfMetadataExtractor : public domain::MetadataExtractor {
public:
    PdfMetadataExtractor();

    bool supports(const std::string& extension) const override;
    std::optional<domain::DocumentMetadata> extract(const std::string& path) override;

    /**
     * @brief Parses the info dictionary of a raw PDF prefix (no external tools).
     *
     * Reads /Title, /Author, /Subject, /Keywords and /CreationDate literal strings,
     * counts "/Type /Page" objects and collects text shown with Tj/TJ.
     */
    static domain::DocumentMetadata ParseDictionary(const std::string& raw);

    /** @brief Parses "Key: value" lines printed by pdfinfo. */
    static domain::DocumentMetadata ParsePdfInfo(const std::string& output);

    /** @brief Decodes the escapes of a PDF literal string body. */
    static std::string DecodeLiteral(const std::string& body);

private:
    static std::string RunCommand(const std::string& cmd);
    static bool HasTool(const std::string& tool);
    static std::string ShellQuote(const std::string& path);

    std::optional<domain::DocumentMetadata> extractWithPoppler(const std::string& path) const;
    std::optional<domain::DocumentMetadata> extractFromDictionary(const std::string& path) const;

    bool m_hasPdfInfo = false;
    bool m_hasPdfToText = false;
};

} // namespace sortwell::infrastructure
