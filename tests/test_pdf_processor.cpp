//
// test_pdf_processor.cpp
//

#include "test_helpers.hpp"
#include "../libdocscrub/include/container_probe.hpp"
#include "../libdocscrub/include/errors.hpp"
#include "../libdocscrub/include/pdf_processor.hpp"
#include <gtest/gtest.h>

using namespace docscrub;
using namespace docscrub::test;

namespace {

const std::string body_text = "BT /F1 12 Tf 72 720 Td (Quarterly report) Tj ET\n";
const std::string rotated_mark = "BT /F1 60 Tf 1 1 -1 1 150 300 Tm (DRAFT) Tj ET\n";

ProcessResult run(const fs::path& input, const fs::path& output, const SanitizeOptions& options) {
    PdfProcessor processor;
    return processor.process(ContainerProbe::classify(input), output, options, {});
}

ErrorKind failure_kind(const fs::path& input, const fs::path& output) {
    try {
        (void)run(input, output, SanitizeOptions{});
    } catch (const SanitizeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SanitizeError";
    return ErrorKind::IOFailure;
}

} // namespace

TEST(PdfProcessor, RemovesRotatedTextAndKeepsBody) {
    const TempDir dir;
    const auto input = dir / "report.pdf";
    const auto output = dir / "report_sanitized.pdf";
    write_pdf(input, {body_text + rotated_mark, body_text});

    const auto result = run(input, output, SanitizeOptions{});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_EQ(result.page_count, 2u);
    EXPECT_EQ(result.scanned_count, 3u);
    EXPECT_TRUE(result.detected_patterns.contains("rotated(45.0°)"));

    const auto pages = read_pdf_pages(output);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].find("DRAFT"), std::string::npos);
    EXPECT_NE(pages[0].find("Quarterly report"), std::string::npos);
    EXPECT_NE(pages[1].find("Quarterly report"), std::string::npos);
}

TEST(PdfProcessor, SecondApplyFindsNothing) {
    const TempDir dir;
    const auto input = dir / "report.pdf";
    const auto once = dir / "once.pdf";
    const auto twice = dir / "twice.pdf";
    write_pdf(input, {rotated_mark + body_text});

    ASSERT_EQ(run(input, once, SanitizeOptions{}).removed_count, 1u);
    const auto second = run(once, twice, SanitizeOptions{});
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.removed_count, 0u);
}

TEST(PdfProcessor, ScanModeCountsBlocksAndWritesNothing) {
    const TempDir dir;
    const auto input = dir / "marked.pdf";
    const auto output = dir / "marked_sanitized.pdf";
    write_pdf(input, {rotated_mark + rotated_mark + body_text, rotated_mark});
    const auto original = read_file(input);

    SanitizeOptions options;
    options.mode = RunMode::Scan;
    const auto result = run(input, output, options);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.removed_count, 3u);
    EXPECT_FALSE(result.output_path.has_value());
    EXPECT_FALSE(fs::exists(output));
    EXPECT_EQ(read_file(input), original);
}

TEST(PdfProcessor, KeywordsMatchUnrotatedText) {
    const TempDir dir;
    const auto input = dir / "memo.pdf";
    const auto output = dir / "memo_sanitized.pdf";
    write_pdf(input, {body_text + "BT /F1 40 Tf 100 100 Td (INTERNAL USE ONLY) Tj ET\n"});

    SanitizeOptions options;
    options.keywords = {"INTERNAL USE"};
    const auto result = run(input, output, options);

    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_TRUE(result.detected_patterns.contains("keyword(INTERNAL USE)"));
    EXPECT_EQ(read_pdf_pages(output).at(0).find("INTERNAL"), std::string::npos);
}

TEST(PdfProcessor, ProtectionTargetLeavesContentAlone) {
    const TempDir dir;
    const auto input = dir / "report.pdf";
    const auto output = dir / "out.pdf";
    write_pdf(input, {rotated_mark});

    SanitizeOptions options;
    options.targets = TargetSet::Protection;
    const auto result = run(input, output, options);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.removed_count, 0u);
    EXPECT_EQ(read_file(output), read_file(input));
}

TEST(PdfProcessor, OwnerRestrictionsAreDropped) {
    const TempDir dir;
    const auto input = dir / "restricted.pdf";
    const auto output = dir / "restricted_sanitized.pdf";
    write_pdf(input, {body_text}, "owner-secret");
    ASSERT_TRUE(pdf_is_encrypted(input));

    const auto result = run(input, output, SanitizeOptions{});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_TRUE(result.detected_patterns.contains("pdf-owner-restrictions"));
    EXPECT_FALSE(pdf_is_encrypted(output));
    EXPECT_NE(read_pdf_pages(output).at(0).find("Quarterly report"), std::string::npos);

    EXPECT_EQ(run(output, dir / "again.pdf", SanitizeOptions{}).removed_count, 0u);
}

TEST(PdfProcessor, WatermarkTargetKeepsOwnerRestrictions) {
    const TempDir dir;
    const auto input = dir / "restricted.pdf";
    const auto output = dir / "restricted_sanitized.pdf";
    write_pdf(input, {body_text + rotated_mark}, "owner-secret");

    SanitizeOptions options;
    options.targets = TargetSet::Watermark;
    const auto result = run(input, output, options);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.removed_count, 1u);
    EXPECT_FALSE(result.detected_patterns.contains("pdf-owner-restrictions"));
    EXPECT_TRUE(pdf_is_encrypted(output));

    const auto page = read_pdf_pages(output).at(0);
    EXPECT_NE(page.find("Quarterly report"), std::string::npos);
    EXPECT_EQ(page.find("DRAFT"), std::string::npos);
}

TEST(PdfProcessor, UserPasswordIsAnEncryptedDocument) {
    const TempDir dir;
    const auto input = dir / "secret.pdf";
    write_pdf(input, {body_text}, "owner-secret", "user-secret");

    EXPECT_EQ(failure_kind(input, dir / "out.pdf"), ErrorKind::EncryptedDocument);
    EXPECT_FALSE(fs::exists(dir / "out.pdf"));
}

TEST(PdfProcessor, DamagedFileIsCorrupt) {
    const TempDir dir;
    const auto input = dir / "broken.pdf";
    write_file(input, "%PDF-1.7\nthis is not a pdf body\n");

    EXPECT_EQ(failure_kind(input, dir / "out.pdf"), ErrorKind::CorruptContainer);
}
