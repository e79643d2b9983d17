#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "test_support.hpp"
#include "../libmetawipe/include/logger.hpp"
#include "../libmetawipe/include/ooxml_strategy.hpp"

namespace metawipe {
namespace {

namespace fs = std::filesystem;
using test::TempDir;
using test::list_dir;
using test::read_file;
using test::write_file;

using Entries = std::vector<std::pair<std::string, std::string>>;

void write_zip(const fs::path& path, const Entries& entries) {
    archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    ASSERT_EQ(archive_write_open_filename(a, path.c_str()), ARCHIVE_OK);
    for (const auto& [name, data] : entries) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_write_header(a, e);
        archive_write_data(a, data.data(), data.size());
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
}

Entries read_zip(const fs::path& path) {
    Entries entries;
    archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, path.c_str(), 10240) != ARCHIVE_OK) {
        archive_read_free(a);
        return entries;
    }
    archive_entry* e = nullptr;
    while (archive_read_next_header(a, &e) == ARCHIVE_OK) {
        std::string data;
        char buf[4096];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<std::size_t>(n));
        }
        entries.emplace_back(archive_entry_pathname(e), data);
    }
    archive_read_free(a);
    return entries;
}

const std::string kContentTypes =
    "<?xml version=\"1.0\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>";
const std::string kDocument = "<w:document><w:body><w:p>Quarterly numbers</w:p></w:body></w:document>";

Entries sample_docx() {
    return {
        {"word/document.xml", kDocument},
        {"[Content_Types].xml", kContentTypes},
        {"docProps/core.xml",
         "<cp:coreProperties><dc:creator>Jane Doe</dc:creator>"
         "<cp:lastModifiedBy>Jane Doe</cp:lastModifiedBy></cp:coreProperties>"},
        {"docProps/app.xml",
         "<Properties><Company>Acme Corp</Company><Manager>John Roe</Manager>"
         "<Template>Normal.dotm</Template><Pages>3</Pages></Properties>"},
        {"docProps/custom.xml", "<Properties><property name=\"Client\">Initech</property></Properties>"},
    };
}

std::map<std::string, std::string> as_map(const Entries& entries) {
    return {entries.begin(), entries.end()};
}

TEST(OoxmlStrategyTest, ScrubsDocumentProperties) {
    TempDir dir;
    const fs::path docx = dir / "report.docx";
    write_zip(docx, sample_docx());

    Logger logger;
    OoxmlStrategy strategy(logger);
    ASSERT_TRUE(strategy.attempt(docx, {}));

    const Entries entries = read_zip(docx);
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries.front().first, "[Content_Types].xml");

    const auto parts = as_map(entries);
    EXPECT_EQ(parts.at("docProps/core.xml"), OoxmlStrategy::empty_core_properties());
    EXPECT_EQ(parts.at("docProps/core.xml").find("Jane Doe"), std::string::npos);
    EXPECT_EQ(parts.at("docProps/app.xml").find("Acme Corp"), std::string::npos);
    EXPECT_NE(parts.at("docProps/app.xml").find("<Pages>3</Pages>"), std::string::npos);
    EXPECT_EQ(parts.at("docProps/custom.xml").find("Initech"), std::string::npos);
    EXPECT_EQ(parts.at("word/document.xml"), kDocument);
    EXPECT_EQ(parts.at("[Content_Types].xml"), kContentTypes);
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(OoxmlStrategyTest, PackageWithoutPropertiesStillRewrites) {
    TempDir dir;
    const fs::path xlsx = dir / "sheet.xlsx";
    write_zip(xlsx, {{"[Content_Types].xml", kContentTypes}, {"xl/workbook.xml", "<workbook/>"}});

    Logger logger;
    OoxmlStrategy strategy(logger);
    ASSERT_TRUE(strategy.attempt(xlsx, {}));
    const auto parts = as_map(read_zip(xlsx));
    EXPECT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts.at("xl/workbook.xml"), "<workbook/>");
}

TEST(OoxmlStrategyTest, PlainZipIsNotAPackage) {
    TempDir dir;
    const fs::path pptx = dir / "fake.pptx";
    write_zip(pptx, {{"readme.txt", "hello"}});
    const std::string before = read_file(pptx);

    Logger logger;
    OoxmlStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(pptx, {}));
    EXPECT_EQ(read_file(pptx), before);
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(OoxmlStrategyTest, LegacyBinaryFormatsAreDeclined) {
    TempDir dir;
    const fs::path doc = dir / "old.doc";
    write_file(doc, "compound file");

    Logger logger;
    OoxmlStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(doc, {}));
    EXPECT_EQ(read_file(doc), "compound file");
}

TEST(OoxmlStrategyTest, GarbageFileFails) {
    TempDir dir;
    const fs::path docx = dir / "broken.docx";
    write_file(docx, "definitely not a zip");

    Logger logger;
    OoxmlStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(docx, {}));
    EXPECT_EQ(read_file(docx), "definitely not a zip");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ScrubAppPropertiesTest, BlanksIdentifyingElementsOnly) {
    const std::string scrubbed = OoxmlStrategy::scrub_app_properties(
        "<Properties><Application>Microsoft Office Word</Application>"
        "<Company>Acme\nCorp</Company><Manager>John Roe</Manager><Template>Secret.dotm</Template>"
        "</Properties>");
    EXPECT_EQ(scrubbed,
              "<Properties><Application>Microsoft Office Word</Application>"
              "<Company></Company><Manager></Manager><Template></Template>"
              "</Properties>");
}

TEST(ScrubAppPropertiesTest, LeavesDocumentsWithoutThemUnchanged) {
    const std::string xml = "<Properties><Pages>1</Pages></Properties>";
    EXPECT_EQ(OoxmlStrategy::scrub_app_properties(xml), xml);
}

} // namespace
} // namespace metawipe
