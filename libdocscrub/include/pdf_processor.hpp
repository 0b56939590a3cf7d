//
// pdf_processor.hpp
//

/**
 * @file pdf_processor.hpp
 * @brief Defines the IProcessor implementation for PDF files using qpdf.
 */

#ifndef DOCSCRUB_PDF_PROCESSOR_HPP
#define DOCSCRUB_PDF_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <string_view>
#include <span>

namespace docscrub {

/**
 * @brief Implements IProcessor for PDF files using qpdf.
 *
 * @details Every content stream of every page is handed to the
 * ContentStreamDetector as decoded bytes. Streams with removals are
 * replaced in the document; untouched streams keep their original
 * encoding. Output is written with deterministic IDs and without
 * encryption.
 *
 * Password handling: a document that needs a user password is retried
 * once with an explicit empty password and otherwise fails with
 * EncryptedDocument. Other qpdf open errors are CorruptContainer.
 */
class PdfProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "PdfProcessor";
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view,1> kMimes = { "application/pdf" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view,1> kExts = { ".pdf" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] bool handles(const ContainerFormat format) const noexcept override {
        return format == ContainerFormat::Pdf;
    }

    /**
     * @brief Scans (and in apply mode strips) watermark text blocks and
     * owner restrictions.
     *
     * @throws SanitizeError (EncryptedDocument) if a user password is required,
     *         (CorruptContainer) if qpdf cannot parse the file.
     */
    ProcessResult process(const Document& doc,
                          const std::filesystem::path& output_path,
                          const SanitizeOptions& options,
                          const ProgressCallback& progress) override;
};

} // namespace docscrub

#endif // DOCSCRUB_PDF_PROCESSOR_HPP
