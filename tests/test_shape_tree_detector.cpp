//
// test_shape_tree_detector.cpp
//

#include "test_helpers.hpp"
#include "../libdocscrub/include/errors.hpp"
#include "../libdocscrub/include/shape_tree_detector.hpp"
#include <gtest/gtest.h>

using namespace docscrub;
using namespace docscrub::test;

TEST(ShapeTreeDetector, SlideIndexParsesTheNumericSuffix) {
    EXPECT_EQ(ShapeTreeDetector::slide_index("ppt/slides/slide1.xml"), 1u);
    EXPECT_EQ(ShapeTreeDetector::slide_index("ppt/slides/slide10.xml"), 10u);
    EXPECT_FALSE(ShapeTreeDetector::slide_index("ppt/slides/_rels/slide1.xml.rels").has_value());
    EXPECT_FALSE(ShapeTreeDetector::slide_index("ppt/slideLayouts/slideLayout1.xml").has_value());
    EXPECT_FALSE(ShapeTreeDetector::slide_index("ppt/slides/slideX.xml").has_value());
}

TEST(ShapeTreeDetector, SlidesAreOrderedNumerically) {
    const std::vector<std::string> parts = {
        "ppt/slides/slide10.xml", "ppt/presentation.xml", "ppt/slides/slide2.xml",
        "ppt/slides/slide9.xml", "ppt/slides/slide1.xml"
    };
    const auto ordered = ShapeTreeDetector::order_slides(parts);
    const std::vector<std::string> expected = {
        "ppt/slides/slide1.xml", "ppt/slides/slide2.xml", "ppt/slides/slide9.xml", "ppt/slides/slide10.xml"
    };
    EXPECT_EQ(ordered, expected);
}

TEST(ShapeTreeDetector, NamePatternMatchesCaseInsensitiveSubstring) {
    const SanitizeOptions options;
    const ShapeTreeDetector detector(options);
    const auto xml = slide_xml(text_shape(2, "Title 1", "Revenue") +
                               text_shape(3, "公司水印_v2", "Internal") +
                               text_shape(4, "my wordart 5", "Draft"));

    const auto scan = detector.scan_slide(xml, "ppt/slides/slide4.xml", 4, false);
    EXPECT_EQ(scan.shapes_scanned, 3u);
    ASSERT_EQ(scan.candidates.size(), 2u);

    const auto& first = std::get<NamedShape>(scan.candidates[0].kind);
    EXPECT_EQ(first.pattern, "水印");
    EXPECT_EQ(first.shape_name, "公司水印_v2");
    EXPECT_EQ(scan.candidates[0].location.unit, 4u);
    EXPECT_EQ(scan.candidates[0].location.part, "ppt/slides/slide4.xml");
    EXPECT_EQ(scan.candidates[0].location.offset, 2u);

    EXPECT_EQ(std::get<NamedShape>(scan.candidates[1].kind).pattern, "WordArt");
    EXPECT_FALSE(scan.changed);
}

TEST(ShapeTreeDetector, NameMatchingIsNotFuzzy) {
    const SanitizeOptions options;
    const ShapeTreeDetector detector(options);
    const auto scan = detector.scan_slide(slide_xml(text_shape(2, "Word Art", "x")), "ppt/slides/slide1.xml", 1, false);
    EXPECT_TRUE(scan.candidates.empty());
}

TEST(ShapeTreeDetector, TransparentWordArtBelowThreshold) {
    const SanitizeOptions options;
    const ShapeTreeDetector detector(options);
    const auto xml = slide_xml(wordart_shape(2, "Shape 1", 30000) + wordart_shape(3, "Shape 2", 90000));

    const auto scan = detector.scan_slide(xml, "ppt/slides/slide1.xml", 1, false);
    ASSERT_EQ(scan.candidates.size(), 1u);
    const auto& art = std::get<TransparentWordArt>(scan.candidates[0].kind);
    EXPECT_EQ(art.alpha, 30000);
}

TEST(ShapeTreeDetector, WordArtDetectionCanBeDisabled) {
    SanitizeOptions options;
    options.detect_wordart = false;
    const ShapeTreeDetector detector(options);
    const auto scan = detector.scan_slide(slide_xml(wordart_shape(2, "Shape 1", 10000)),
                                          "ppt/slides/slide1.xml", 1, false);
    EXPECT_TRUE(scan.candidates.empty());
}

TEST(ShapeTreeDetector, ExcisionRemovesOnlyMatchingShapes) {
    const SanitizeOptions options;
    const ShapeTreeDetector detector(options);
    const auto xml = slide_xml(text_shape(2, "Title 1", "Revenue") + text_shape(3, "水印", "Internal"));

    const auto scan = detector.scan_slide(xml, "ppt/slides/slide1.xml", 1, true);
    ASSERT_TRUE(scan.changed);
    EXPECT_NE(scan.rewritten.find("Revenue"), std::string::npos);
    EXPECT_EQ(scan.rewritten.find("Internal"), std::string::npos);

    const auto again = detector.scan_slide(scan.rewritten, "ppt/slides/slide1.xml", 1, true);
    EXPECT_EQ(again.shapes_scanned, 1u);
    EXPECT_TRUE(again.candidates.empty());
    EXPECT_FALSE(again.changed);
}

TEST(ShapeTreeDetector, CustomPrefixesAreResolvedFromNamespaces) {
    const std::string xml =
        R"(<pr:sld xmlns:d="http://schemas.openxmlformats.org/drawingml/2006/main" )"
        R"(xmlns:pr="http://schemas.openxmlformats.org/presentationml/2006/main">)"
        R"(<pr:cSld><pr:spTree><pr:sp><pr:nvSpPr><pr:cNvPr id="2" name="Watermark"/></pr:nvSpPr></pr:sp>)"
        R"(<pr:sp><pr:nvSpPr><pr:cNvPr id="3" name="Body"/></pr:nvSpPr><pr:txBody><d:bodyPr fromWordArt="1"/>)"
        R"(<d:p><d:r><d:rPr><d:solidFill><d:srgbClr val="000000"><d:alpha val="20000"/></d:srgbClr>)"
        R"(</d:solidFill></d:rPr></d:r></d:p></pr:txBody></pr:sp></pr:spTree></pr:cSld></pr:sld>)";

    SanitizeOptions named;
    named.name_patterns = {"watermark"};
    const ShapeTreeDetector by_name(named);
    const auto scan = by_name.scan_slide(xml, "ppt/slides/slide1.xml", 1, false);
    ASSERT_EQ(scan.candidates.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<NamedShape>(scan.candidates[0].kind));
    EXPECT_TRUE(std::holds_alternative<TransparentWordArt>(scan.candidates[1].kind));
}

TEST(ShapeTreeDetector, MalformedSlideIsCorrupt) {
    const SanitizeOptions options;
    const ShapeTreeDetector detector(options);
    try {
        (void)detector.scan_slide("<p:sld><p:cSld>", "ppt/slides/slide1.xml", 1, false);
        FAIL() << "expected SanitizeError";
    } catch (const SanitizeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptContainer);
    }
}
