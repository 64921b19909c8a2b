#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/PdfMetadataExtractor.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/Utf8.hpp"

namespace fs = std::filesystem;
using sortwell::infrastructure::IsValidUtf8;
using sortwell::infrastructure::PdfMetadataExtractor;
using sortwell::infrastructure::PromptCatalog;
using sortwell::infrastructure::TruncateUtf8;

namespace {

const char* kMinimalPdf =
    "%PDF-1.4\n"
    "1 0 obj << /Type /Catalog /Pages 2 0 R >> endobj\n"
    "2 0 obj << /Type /Pages /Kids [3 0 R 5 0 R] /Count 2 >> endobj\n"
    "3 0 obj << /Type /Page /Parent 2 0 R /Contents 4 0 R >> endobj\n"
    "4 0 obj << /Length 60 >> stream\n"
    "BT /F1 12 Tf (Hello) Tj [(Wor) -20 (ld)] TJ ET\n"
    "endstream endobj\n"
    "5 0 obj << /Type /Page /Parent 2 0 R >> endobj\n"
    "6 0 obj << /Title (The Art of War \\(Annotated\\)) /Author (Sun Tzu)\n"
    "/Subject (Strategy) /Keywords (war; strategy, classics)\n"
    "/CreationDate (D:20230415120000Z) >> endobj\n"
    "trailer << /Root 1 0 R /Info 6 0 R >>\n"
    "%%EOF\n";

} // namespace

int main() {
    std::cout << "[Test] Starting PdfMetadataExtractor Test..." << std::endl;

    // Literal decoding
    assert(PdfMetadataExtractor::DecodeLiteral("a\\(b\\)") == "a(b)");
    assert(PdfMetadataExtractor::DecodeLiteral("line\\nbreak") == "line\nbreak");
    assert(PdfMetadataExtractor::DecodeLiteral("\\101\\102") == "AB");
    assert(PdfMetadataExtractor::DecodeLiteral("back\\\\slash") == "back\\slash");
    assert(PdfMetadataExtractor::DecodeLiteral("split\\\nword") == "splitword");
    std::cout << "[PASS] Literal decoding" << std::endl;

    // Document information dictionary
    auto meta = PdfMetadataExtractor::ParseDictionary(kMinimalPdf);
    assert(meta.title && *meta.title == "The Art of War (Annotated)");
    assert(meta.author && *meta.author == "Sun Tzu");
    assert(meta.subject && *meta.subject == "Strategy");
    assert(meta.keywords.size() == 3 && meta.keywords[2] == "classics");
    assert(meta.creationDate && *meta.creationDate == "2023-04-15T00:00:00Z");
    assert(meta.pageCount == std::optional<int>(2));
    assert(meta.firstPageSnippet && *meta.firstPageSnippet == "Hello Wor ld");
    std::cout << "[PASS] Dictionary scan" << std::endl;

    auto empty = PdfMetadataExtractor::ParseDictionary("%PDF-1.4\n/TitleFont (Nope)\n");
    assert(!empty.title && "Longer key names do not match.");
    assert(!empty.pageCount);
    assert(!empty.firstPageSnippet);

    // Snippets are cut on character boundaries
    {
        std::string accents;
        for (int i = 0; i < 300; ++i) accents += "\xc3\xa9";
        auto wide = PdfMetadataExtractor::ParseDictionary("%PDF-1.4\nBT (a" + accents + ") Tj ET\n");
        assert(wide.firstPageSnippet && wide.firstPageSnippet->size() == 499);
        assert(IsValidUtf8(*wide.firstPageSnippet));
        nlohmann::json j = {{"snippet", *wide.firstPageSnippet}};
        assert(!j.dump().empty());

        sortwell::domain::ClassificationRequest request;
        request.filename = "essay.pdf";
        request.extension = ".pdf";
        request.metadata = wide;
        assert(IsValidUtf8(PromptCatalog::BuildClassificationPrompt(request)));

        assert(TruncateUtf8("ab\xe2\x82\xac", 3) == "ab");
        assert(TruncateUtf8("ab\xe2\x82\xac", 5) == "ab\xe2\x82\xac");
        assert(TruncateUtf8("abcdef", 3) == "abc");
        assert(!IsValidUtf8("caf\xe9"));
        assert(!IsValidUtf8("\xed\xa0\x80"));
        std::cout << "[PASS] UTF-8 snippet cut" << std::endl;
    }

    // pdfinfo output
    auto info = PdfMetadataExtractor::ParsePdfInfo(
        "Title:          Quarterly Report\n"
        "Author:         \n"
        "Keywords:       sales, q3\n"
        "Pages:          14\n"
        "Page size:      612 x 792 pts (letter)\n");
    assert(info.title && *info.title == "Quarterly Report");
    assert(!info.author);
    assert(info.keywords.size() == 2);
    assert(info.pageCount == std::optional<int>(14));
    std::cout << "[PASS] pdfinfo parsing" << std::endl;

    // Extraction from a file on disk
    fs::path dir = fs::temp_directory_path() / "sortwell_pdf_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path pdf = dir / "war.pdf";
    std::ofstream(pdf, std::ios::binary) << kMinimalPdf;

    PdfMetadataExtractor extractor;
    assert(extractor.supports(".pdf"));
    assert(!extractor.supports(".docx"));
    auto extracted = extractor.extract(pdf.string());
    assert(extracted);
    assert(extracted->extractionMethod == "pdfinfo" || extracted->extractionMethod == "pdf-dictionary");
    if (extracted->extractionMethod == "pdf-dictionary") {
        assert(extracted->title && *extracted->title == "The Art of War (Annotated)");
    }
    assert(!extractor.extract((dir / "missing.pdf").string()));
    std::cout << "[PASS] File extraction" << std::endl;

    fs::remove_all(dir);
    std::cout << "[PASS] PdfMetadataExtractor Test completed." << std::endl;
    return 0;
}
