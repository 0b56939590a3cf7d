//
// ooxml_processor.hpp
//

/**
 * @file ooxml_processor.hpp
 * @brief Defines the IProcessor implementation for Office Open XML (OOXML) files.
 */

#ifndef DOCSCRUB_OOXML_PROCESSOR_HPP
#define DOCSCRUB_OOXML_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <string_view>
#include <span>

namespace docscrub {

/**
 * @brief Implements IProcessor for Office Open XML (OOXML) files.
 *
 * @details This processor handles word-processing, spreadsheet and
 * presentation packages. It extracts the package into a scoped workspace,
 * runs the rule catalog for the document kind over the matching parts,
 * runs the shape-tree detector over presentation slides, and in apply mode
 * repackages the workspace with libarchive.
 */
class OOXMLProcessor final : public IProcessor {
public:
    // --- self-description ---
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "OOXMLProcessor";
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 6> kMimes = {
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
            "application/vnd.openxmlformats-officedocument.presentationml.presentation",
            "application/vnd.ms-word.document.macroEnabled.12",
            "application/vnd.ms-excel.sheet.macroEnabled.12",
            "application/vnd.ms-powerpoint.presentation.macroEnabled.12"
        };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 12> kExts = {
            ".docx", ".docm", ".dotx", ".dotm",
            ".xlsx", ".xlsm", ".xltx", ".xltm",
            ".pptx", ".pptm", ".potx", ".potm"
        };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] bool handles(const ContainerFormat format) const noexcept override {
        return format == ContainerFormat::OoxmlZip;
    }

    // --- operations ---

    /**
     * @brief Sanitizes one OOXML package.
     *
     * Parts are visited in sorted order; slides in numeric order. Parts
     * that no rule touches are written back byte for byte. In apply mode
     * with nothing found the input is copied to @p output_path.
     *
     * @throws SanitizeError (EncryptedDocument) when the package is wrapped
     *         in an encrypted compound file.
     */
    ProcessResult process(const Document& doc,
                          const std::filesystem::path& output_path,
                          const SanitizeOptions& options,
                          const ProgressCallback& progress) override;
};

} // namespace docscrub

#endif // DOCSCRUB_OOXML_PROCESSOR_HPP
