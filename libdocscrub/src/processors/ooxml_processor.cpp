//
// ooxml_processor.cpp
//

#include "../../include/ooxml_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/shape_tree_detector.hpp"
#include "../../include/xml_patch_engine.hpp"
#include "../../include/zip_container.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <vector>

namespace docscrub {

namespace fs = std::filesystem;

/**
 * @brief Returns the tag used for logging by this processor.
 * @return A constant string identifier.
 */
static const char* processor_tag() {
    return "OOXMLProcessor";
}

static bool in_scope(const RuleSet& rules, const std::string& part) {
    return std::ranges::any_of(rules, [&part](const PatchRule& r) {
        return XmlPatchEngine::part_matches(r.part_glob, part);
    });
}

static void report(const ProgressCallback& progress, const std::size_t current, const std::size_t total,
                   const std::string& what) {
    if (progress) progress(current, total, what);
}

ProcessResult OOXMLProcessor::process(const Document& doc,
                                      const fs::path& output_path,
                                      const SanitizeOptions& options,
                                      const ProgressCallback& progress) {
    ContainerProbe::ensure_not_encrypted(doc);

    Logger::log(LogLevel::Info,
                "Processing " + document_kind_to_string(doc.kind) + " package: " + doc.path.filename().string(),
                processor_tag());

    const ScopedWorkspace workspace(doc.path, "ooxml");
    auto parts = ZipContainer::extract(doc.path, workspace.root());
    std::ranges::sort(parts);

    const bool apply = options.is_apply();
    const RuleSet rules = XmlPatchEngine::default_rules(doc.kind, options.targets);
    ArtifactTally tally;

    // rule pass
    std::vector<std::string> targeted;
    std::ranges::copy_if(parts, std::back_inserter(targeted),
                         [&rules](const std::string& p) { return in_scope(rules, p); });

    for (std::size_t i = 0; i < targeted.size(); ++i) {
        const auto& part = targeted[i];
        const fs::path file = workspace.root() / fs::path(part);

        const std::string content = read_file(file);
        const auto outcome = XmlPatchEngine::apply_rules(part, content, rules);
        tally.add_scanned(1);

        for (const auto& match : outcome.matches) {
            if (match.rule->artifact_class == ArtifactClass::Protection) {
                tally.add(ProtectionMarker{part, match.rule->element});
            } else {
                tally.add(WatermarkCandidate{match.rule->watermark, ArtifactLocation{0, part, match.offset}});
            }
        }
        if (outcome.changed) {
            Logger::log(LogLevel::Debug,
                        part + ": " + std::to_string(outcome.removed_count) + " element(s) matched",
                        processor_tag());
            if (apply) {
                write_file(file, outcome.content);
            }
        }
        if (doc.kind != DocumentKind::Presentation) {
            report(progress, i + 1, targeted.size(), part);
        }
    }

    std::size_t page_count = 0;

    if (doc.kind == DocumentKind::Presentation) {
        const auto slides = ShapeTreeDetector::order_slides(parts);
        page_count = slides.size();

        if (options.wants_watermarks()) {
            const ShapeTreeDetector detector(options);
            for (std::size_t i = 0; i < slides.size(); ++i) {
                const auto& part = slides[i];
                const fs::path file = workspace.root() / fs::path(part);
                report(progress, i + 1, slides.size(), "slide " + std::to_string(i + 1) + " (" + part + ")");

                const auto idx = ShapeTreeDetector::slide_index(part).value_or(i + 1);
                const auto scan = detector.scan_slide(read_file(file), part, idx, apply);
                tally.add_scanned(scan.shapes_scanned);
                for (const auto& candidate : scan.candidates) {
                    tally.add(candidate);
                }
                if (scan.changed) {
                    write_file(file, scan.rewritten);
                }
            }
        }
    } else if (doc.kind == DocumentKind::Spreadsheet) {
        page_count = static_cast<std::size_t>(std::ranges::count_if(parts, [](const std::string& p) {
            return XmlPatchEngine::part_matches("xl/worksheets/sheet*.xml", p);
        }));
    }

    std::optional<fs::path> written;
    if (apply) {
        if (tally.removed_count() > 0) {
            ZipContainer::rebuild(workspace.root(), output_path);
        } else {
            Logger::log(LogLevel::Info, "Nothing to remove, copying input unchanged", processor_tag());
            copy_to_output(doc.path, output_path);
        }
        written = output_path;
    }

    auto result = tally.to_result(options.mode, written, page_count);
    Logger::log(LogLevel::Info, doc.path.filename().string() + ": " + result.message, processor_tag());
    return result;
}

} // namespace docscrub
