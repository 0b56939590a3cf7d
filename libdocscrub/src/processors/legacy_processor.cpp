//
// legacy_processor.cpp
//

#include "../../include/legacy_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace docscrub {

namespace fs = std::filesystem;

static const char* processor_tag() {
    return "LegacyProcessor";
}

ProcessResult LegacyProcessor::process(const Document& doc,
                                       const fs::path& output_path,
                                       const SanitizeOptions& options,
                                       const ProgressCallback& progress) {
    Logger::log(LogLevel::Info, "Processing legacy document: " + doc.path.filename().string(), processor_tag());

    const ScopedWorkspace workspace(doc.path, "legacy");

    std::optional<fs::path> converted;
    if (converter_) {
        converted = converter_->convert(doc.path, doc.kind, workspace.root());
    } else {
        SofficeConverter soffice("soffice", options.legacy_timeout);
        converted = soffice.convert(doc.path, doc.kind, workspace.root());
    }

    if (converted) {
        const Document successor = ContainerProbe::classify(*converted);
        if (successor.format == ContainerFormat::OoxmlZip) {
            auto successor_output = output_path;
            successor_output.replace_extension(successor_extension(doc.kind));
            return ooxml_.process(successor, successor_output, options, progress);
        }
        Logger::log(LogLevel::Warning,
                    "Conversion of " + doc.path.filename().string() + " produced an unreadable file",
                    processor_tag());
    }

    if (doc.kind == DocumentKind::Spreadsheet && options.wants_protection()) {
        Logger::log(LogLevel::Warning,
                    "Conversion unavailable, falling back to binary protection patch (watermarks are not handled)",
                    processor_tag());
        return binary_fallback(doc, output_path, options);
    }

    throw SanitizeError(ErrorKind::ConversionUnavailable,
                        "cannot convert " + doc.path.filename().string() + " to " +
                        successor_extension(doc.kind) + " and no fallback exists");
}

ProcessResult LegacyProcessor::binary_fallback(const Document& doc,
                                               const fs::path& output_path,
                                               const SanitizeOptions& options) const {
    std::string bytes = read_file(doc.path);
    const std::size_t patched = binary_protection_patch(bytes);

    ArtifactTally tally;
    for (std::size_t i = 0; i < patched; ++i) {
        tally.add_label("binary-protection-patch");
    }

    std::optional<fs::path> written;
    if (options.is_apply()) {
        if (patched > 0) {
            const auto staged = staging_path_for(output_path);
            try {
                write_file(staged, bytes);
            } catch (const SanitizeError&) {
                std::error_code ec;
                fs::remove(staged, ec);
                throw;
            }
            commit_staged_file(staged, output_path);
        } else {
            copy_to_output(doc.path, output_path);
        }
        written = output_path;
    }
    return tally.to_result(options.mode, written, 0);
}

} // namespace docscrub
