#include <cassert>
#include <iostream>

#include "application/Naming.hpp"
#include "domain/CategoryTable.hpp"

using namespace sortwell;
using application::Naming;

namespace {

std::string Styled(const std::string& name, domain::NamingStyle style, bool removeSpecial = false) {
    domain::NamingPreference naming;
    naming.style = style;
    naming.removeSpecialChars = removeSpecial;
    return Naming::ApplyNamingPreferences(name, naming);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Naming Test..." << std::endl;

    // Extensions
    assert(Naming::SplitExtension("report.pdf").second == ".pdf");
    assert(Naming::SplitExtension("archive.tar.gz").first == "archive.tar");
    assert(Naming::SplitExtension(".bashrc").second.empty() && "A leading dot is not an extension.");
    assert(Naming::SplitExtension("README").second.empty());

    assert(domain::CategoryFromExtension(".JPG") == std::optional<std::string>("Images"));
    assert(domain::CategoryFromExtension("zip") == std::optional<std::string>("Archives"));
    assert(!domain::CategoryFromExtension(".xyz"));
    assert(!domain::CategoryFromExtension(""));
    assert(domain::IsGenericFilename("Untitled 3"));
    assert(!domain::IsGenericFilename("tax return"));
    std::cout << "[PASS] Extensions and categories" << std::endl;

    // Naming styles
    assert(Styled("My File-name.PDF", domain::NamingStyle::Original) == "My File-name.PDF");
    assert(Styled("My File-name.PDF", domain::NamingStyle::LowerCase) == "my file-name.PDF");
    assert(Styled("hello world.txt", domain::NamingStyle::TitleCase) == "Hello World.txt");
    assert(Styled("my file-name.txt", domain::NamingStyle::CamelCase) == "myFileName.txt");
    assert(Styled("a&b!c.txt", domain::NamingStyle::Original, true) == "abc.txt");
    assert(Styled("!!!.txt", domain::NamingStyle::Original, true) == "!!!.txt" &&
           "Stripping never leaves an empty name.");
    std::cout << "[PASS] Naming styles" << std::endl;

    // Filename heuristics
    auto dated = Naming::MetadataFromFilename("2023-04-15 Annual Report.pdf");
    assert(dated.creationDate == std::optional<std::string>("2023-04-15T00:00:00Z"));
    assert(dated.title == std::optional<std::string>("Annual Report"));
    assert(dated.extractionMethod == "filename");

    auto subject = Naming::MetadataFromFilename("Biology - Cell Structure.pdf");
    assert(subject.subject == std::optional<std::string>("Biology"));
    assert(subject.title == std::optional<std::string>("Cell Structure"));

    auto authored = Naming::MetadataFromFilename("Dune (Frank Herbert).pdf");
    assert(authored.title == std::optional<std::string>("Dune"));
    assert(authored.author == std::optional<std::string>("Frank Herbert"));

    auto plain = Naming::MetadataFromFilename("my_lecture_notes.pdf");
    assert(plain.title == std::optional<std::string>("my lecture notes"));
    assert(!plain.subject && !plain.author);
    std::cout << "[PASS] Filename metadata" << std::endl;

    // Clean titles
    domain::DocumentMetadata metadata;
    metadata.title = "the_art of-war!";
    assert(Naming::GenerateCleanTitle(metadata, "x.pdf") == "The Art Of War");

    domain::DocumentMetadata shortTitle;
    shortTitle.title = "Hi";
    assert(Naming::GenerateCleanTitle(shortTitle, "quarterly_sales_report.pdf") == "Quarterly Sales Report" &&
           "Titles of three characters or fewer fall back to the filename.");
    std::cout << "[PASS] Clean titles" << std::endl;

    // Folder context and folder names
    assert(Naming::FolderContext("/home/user/Downloads/Biology/Lectures/file.pdf") ==
           std::optional<std::string>("Biology / Lectures"));
    assert(!Naming::FolderContext("/Downloads/file.pdf"));

    assert(Naming::SanitizeFolderName("a/b:c") == "a b c");
    assert(Naming::SanitizeFolderName("..hidden") == "hidden");
    assert(Naming::SanitizeFolderName("") == "Other");
    std::cout << "[PASS] Folder names" << std::endl;

    std::cout << "[PASS] Naming Test completed." << std::endl;
    return 0;
}
