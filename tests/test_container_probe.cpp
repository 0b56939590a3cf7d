//
// test_container_probe.cpp
//

#include "test_helpers.hpp"
#include "../libdocscrub/include/container_probe.hpp"
#include "../libdocscrub/include/errors.hpp"
#include <gtest/gtest.h>

using namespace docscrub;
using namespace docscrub::test;

namespace {

const std::string cfb_signature("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8);

void write_cfb(const fs::path& path) {
    write_file(path, cfb_signature + std::string(504, '\0'));
}

} // namespace

TEST(ContainerProbe, ZipWithWordPartsIsWordProcessing) {
    const TempDir dir;
    const auto path = dir / "report.docx";
    write_zip(path, docx_parts(true, false));

    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::OoxmlZip);
    EXPECT_EQ(doc.kind, DocumentKind::WordProcessing);
    EXPECT_FALSE(doc.encrypted);
}

TEST(ContainerProbe, MemberNamesWinOverTheExtension) {
    const TempDir dir;
    const auto path = dir / "misnamed.zip";
    write_zip(path, {{"[Content_Types].xml", content_types}, {"xl/workbook.xml", "<workbook/>"}});

    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::OoxmlZip);
    EXPECT_EQ(doc.kind, DocumentKind::Spreadsheet);
}

TEST(ContainerProbe, PlainZipIsUnknown) {
    const TempDir dir;
    const auto path = dir / "photos.zip";
    write_zip(path, {{"a.txt", "hello"}});
    EXPECT_EQ(ContainerProbe::classify(path).format, ContainerFormat::Unknown);
}

TEST(ContainerProbe, PdfSignatureMayFollowLeadingGarbage) {
    const TempDir dir;
    const auto path = dir / "scan.bin";
    write_file(path, std::string(100, ' ') + "%PDF-1.7\n%\xE2\xE3\xCF\xD3\n");

    EXPECT_TRUE(ContainerProbe::has_pdf_signature(path));
    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::Pdf);
    EXPECT_EQ(doc.kind, DocumentKind::Pdf);
}

TEST(ContainerProbe, OoxmlExtensionWithoutZipSignatureIsEncrypted) {
    const TempDir dir;
    const auto path = dir / "locked.xlsx";
    write_cfb(path);

    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::OoxmlZip);
    EXPECT_EQ(doc.kind, DocumentKind::Spreadsheet);
    EXPECT_TRUE(doc.encrypted);

    try {
        ContainerProbe::ensure_not_encrypted(doc);
        FAIL() << "expected SanitizeError";
    } catch (const SanitizeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EncryptedDocument);
    }
}

TEST(ContainerProbe, CompoundFileWithLegacyExtensionIsLegacyBinary) {
    const TempDir dir;
    const auto path = dir / "old.DOC";
    write_cfb(path);

    EXPECT_TRUE(ContainerProbe::has_cfb_signature(path));
    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::LegacyBinary);
    EXPECT_EQ(doc.kind, DocumentKind::WordProcessing);
}

TEST(ContainerProbe, TextFileIsUnknown) {
    const TempDir dir;
    const auto path = dir / "notes.txt";
    write_file(path, "just some text\n");
    const auto doc = ContainerProbe::classify(path);
    EXPECT_EQ(doc.format, ContainerFormat::Unknown);
    EXPECT_FALSE(ContainerProbe::has_zip_signature(path));
}

TEST(ContainerProbe, MissingFileIsAnIoFailure) {
    const TempDir dir;
    try {
        (void)ContainerProbe::classify(dir / "absent.pdf");
        FAIL() << "expected SanitizeError";
    } catch (const SanitizeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
    }
}
