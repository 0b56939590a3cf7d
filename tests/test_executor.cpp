//
// test_executor.cpp
//

#include "test_helpers.hpp"
#include "../libdocscrub/include/docscrub.hpp"
#include "../libdocscrub/include/event_bus.hpp"
#include "../libdocscrub/include/events.hpp"
#include "../libdocscrub/include/logger.hpp"
#include "../libdocscrub/include/processor_executor.hpp"
#include "../libdocscrub/include/processor_registry.hpp"
#include <gtest/gtest.h>

using namespace docscrub;
using namespace docscrub::test;

namespace {

struct Recorder {
    std::vector<fs::path> started;
    std::vector<fs::path> completed;
    std::vector<std::pair<fs::path, ErrorKind>> failed;
    std::vector<fs::path> skipped;
    std::size_t progress = 0;

    explicit Recorder(EventBus& bus) {
        bus.subscribe<DocumentStartEvent>([this](const DocumentStartEvent& e) { started.push_back(e.path); });
        bus.subscribe<DocumentCompleteEvent>([this](const DocumentCompleteEvent& e) { completed.push_back(e.path); });
        bus.subscribe<DocumentErrorEvent>([this](const DocumentErrorEvent& e) { failed.emplace_back(e.path, e.kind); });
        bus.subscribe<DocumentSkippedEvent>([this](const DocumentSkippedEvent& e) { skipped.push_back(e.path); });
        bus.subscribe<DocumentProgressEvent>([this](const DocumentProgressEvent&) { ++progress; });
    }
};

} // namespace

TEST(ProcessorExecutor, DefaultOutputPathInsertsTheSuffix) {
    EXPECT_EQ(ProcessorExecutor::default_output_path("/data/report.pdf", "_sanitized"),
              fs::path("/data/report_sanitized.pdf"));
    EXPECT_EQ(ProcessorExecutor::default_output_path("deck.v2.pptx", "_clean"), fs::path("deck.v2_clean.pptx"));
}

TEST(ProcessorExecutor, OneBadDocumentDoesNotAbortTheBatch) {
    const TempDir dir;
    const auto good = dir / "report.docx";
    const auto text = dir / "notes.txt";
    const auto locked = dir / "locked.xlsx";
    write_zip(good, docx_parts(true, false));
    write_file(text, "plain text\n");
    write_file(locked, std::string("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8) + std::string(504, '\0'));

    ProcessorRegistry registry;
    EventBus bus;
    const Recorder recorder(bus);
    ProcessorExecutor executor(registry, SanitizeOptions{}, {}, bus);

    const auto results = executor.process({text, good, locked});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, ErrorKind::UnsupportedFormat);
    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(results[1].removed_count, 1u);
    EXPECT_EQ(results[1].output_path, dir / "report_sanitized.docx");
    EXPECT_FALSE(results[2].success);
    EXPECT_EQ(results[2].error, ErrorKind::EncryptedDocument);

    EXPECT_EQ(recorder.started.size(), 3u);
    EXPECT_EQ(recorder.completed, std::vector<fs::path>{good});
    ASSERT_EQ(recorder.failed.size(), 2u);
    EXPECT_EQ(recorder.failed[1].second, ErrorKind::EncryptedDocument);
    EXPECT_GT(recorder.progress, 0u);
    EXPECT_TRUE(fs::exists(dir / "report_sanitized.docx"));
    EXPECT_FALSE(fs::exists(dir / "locked_sanitized.xlsx"));
}

TEST(ProcessorExecutor, ExplicitOutputIsUsedForASingleDocument) {
    const TempDir dir;
    const auto input = dir / "report.docx";
    const auto output = dir / "nested" / "clean.docx";
    write_zip(input, docx_parts(true, false));

    ProcessorRegistry registry;
    EventBus bus;
    ProcessorExecutor executor(registry, SanitizeOptions{}, output, bus);

    const auto results = executor.process({input});
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].success) << results[0].message;
    EXPECT_EQ(results[0].output_path, output);
    EXPECT_TRUE(fs::exists(output));
}

TEST(ProcessorExecutor, OutputMayNotOverwriteTheInput) {
    const TempDir dir;
    const auto input = dir / "report.docx";
    write_zip(input, docx_parts(true, false));
    const auto original = read_file(input);

    ProcessorRegistry registry;
    EventBus bus;
    ProcessorExecutor executor(registry, SanitizeOptions{}, input, bus);

    const auto results = executor.process({input});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorKind::IOFailure);
    EXPECT_EQ(read_file(input), original);
}

TEST(ProcessorExecutor, StopRequestSkipsDocumentsNotYetStarted) {
    const TempDir dir;
    const auto a = dir / "a.docx";
    const auto b = dir / "b.docx";
    write_zip(a, docx_parts(true, false));
    write_zip(b, docx_parts(true, false));

    ProcessorRegistry registry;
    EventBus bus;
    const Recorder recorder(bus);
    ProcessorExecutor executor(registry, SanitizeOptions{}, {}, bus);

    // stop as soon as the first document finishes
    bus.subscribe<DocumentCompleteEvent>([&executor](const DocumentCompleteEvent&) { executor.request_stop(); });

    const auto results = executor.process({a, b});
    EXPECT_EQ(results.size(), 1u);
    EXPECT_TRUE(executor.is_stopped());
    EXPECT_EQ(recorder.skipped, std::vector<fs::path>{b});
    EXPECT_FALSE(fs::exists(dir / "b_sanitized.docx"));
}

TEST(ProcessorExecutor, ScanModeLeavesNoFilesBehind) {
    const TempDir dir;
    const auto input = dir / "report.pdf";
    write_pdf(input, {"BT /F1 50 Tf 1 1 -1 1 100 100 Tm (DRAFT) Tj ET\n"});

    SanitizeOptions options;
    options.mode = RunMode::Scan;
    ProcessorRegistry registry;
    EventBus bus;
    ProcessorExecutor executor(registry, options, {}, bus);

    const auto results = executor.process({input});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].removed_count, 1u);

    std::size_t files = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(dir.path())) ++files;
    EXPECT_EQ(files, 1u);
}

TEST(ProcessorRegistry, ResolvesByFormatMimeAndExtension) {
    ProcessorRegistry registry;
    ASSERT_EQ(registry.all().size(), 3u);

    const auto* pdf = registry.find_by_format(ContainerFormat::Pdf);
    ASSERT_NE(pdf, nullptr);
    EXPECT_EQ(pdf->get_name(), "PdfProcessor");
    EXPECT_EQ(registry.find_by_format(ContainerFormat::Unknown), nullptr);

    const auto by_mime = registry.find_by_mime("application/pdf");
    ASSERT_EQ(by_mime.size(), 1u);
    EXPECT_EQ(by_mime[0], pdf);
    EXPECT_TRUE(registry.find_by_mime("text/plain").empty());

    EXPECT_EQ(registry.find_by_extension(".PPTX").size(), 1u);
    EXPECT_EQ(registry.find_by_extension(".doc").size(), 1u);
    EXPECT_TRUE(registry.find_by_extension("pdf").empty());
    EXPECT_TRUE(registry.find_by_extension(".txt").empty());
}

TEST(EventBus, DeliversOnlyToSubscribersOfThatEvent) {
    EventBus bus;
    int starts = 0;
    int skips = 0;
    bus.subscribe<DocumentStartEvent>([&starts](const DocumentStartEvent&) { ++starts; });
    bus.subscribe<DocumentStartEvent>([&starts](const DocumentStartEvent&) { ++starts; });
    bus.subscribe<DocumentSkippedEvent>([&skips](const DocumentSkippedEvent&) { ++skips; });

    bus.publish(DocumentStartEvent{"a.pdf", 1, 1});
    EXPECT_EQ(starts, 2);
    EXPECT_EQ(skips, 0);
    EXPECT_EQ(bus.subscriber_count<DocumentStartEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<DocumentErrorEvent>(), 0u);
}

namespace {

class CountingObserver final : public DocScrubObserver {
public:
    void onDocumentStart(const fs::path&, std::size_t, std::size_t total) override {
        ++starts;
        last_total = total;
    }
    void onDocumentFinish(const fs::path&, const ProcessResult& result) override {
        removed += result.removed_count;
    }
    void onDocumentError(const fs::path&, const ErrorKind kind, const std::string&) override {
        errors.push_back(kind);
    }
    void onLog(int, const std::string&, const std::string&) override { ++logs; }

    int starts = 0;
    std::size_t last_total = 0;
    std::size_t removed = 0;
    std::size_t logs = 0;
    std::vector<ErrorKind> errors;
};

} // namespace

TEST(DocScrub, FacadeRunsABatchAndNotifiesTheObserver) {
    const TempDir dir;
    const auto docx = dir / "report.docx";
    const auto pdf = dir / "report.pdf";
    write_zip(docx, docx_parts(true, true));
    write_pdf(pdf, {"BT /F1 12 Tf 72 700 Td (Do not copy) Tj ET\n"});

    CountingObserver observer;
    DocScrub scrub;
    scrub.addKeyword("Do not copy").outputSuffix("_clean").setObserver(&observer);

    const auto results = scrub.sanitize(std::vector<fs::path>{docx, pdf, dir / "missing.pdf"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(results[2].error, ErrorKind::IOFailure);
    EXPECT_EQ(observer.starts, 3);
    EXPECT_EQ(observer.last_total, 3u);
    EXPECT_EQ(observer.removed, 3u);
    EXPECT_EQ(observer.errors, std::vector<ErrorKind>{ErrorKind::IOFailure});
    EXPECT_GT(observer.logs, 0u);
    EXPECT_TRUE(fs::exists(dir / "report_clean.docx"));
    EXPECT_TRUE(fs::exists(dir / "report_clean.pdf"));

    // the log bridge lives only for the duration of a call
    const auto logs_after = observer.logs;
    Logger::log(LogLevel::Error, "outside of any run", "test");
    EXPECT_EQ(observer.logs, logs_after);
}

TEST(DocScrub, OptionsReflectTheBuilder) {
    DocScrub scrub;
    scrub.mode(RunMode::Scan)
         .targets(TargetSet::Watermark)
         .angleRange(10.0, 80.0)
         .rotationThreshold(0.2)
         .namePatterns({"stamp"})
         .detectWordArt(false)
         .alphaThreshold(50000);

    const auto& o = scrub.options();
    EXPECT_EQ(o.mode, RunMode::Scan);
    EXPECT_EQ(o.targets, TargetSet::Watermark);
    EXPECT_DOUBLE_EQ(o.angle_min, 10.0);
    EXPECT_DOUBLE_EQ(o.angle_max, 80.0);
    EXPECT_DOUBLE_EQ(o.rotation_threshold, 0.2);
    EXPECT_EQ(o.name_patterns, std::vector<std::string>{"stamp"});
    EXPECT_FALSE(o.detect_wordart);
    EXPECT_EQ(o.alpha_threshold, 50000);
}
