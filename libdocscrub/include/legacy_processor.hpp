//
// legacy_processor.hpp
//

/**
 * @file legacy_processor.hpp
 * @brief IProcessor for legacy binary documents (.doc, .xls, .ppt).
 */

#ifndef DOCSCRUB_LEGACY_PROCESSOR_HPP
#define DOCSCRUB_LEGACY_PROCESSOR_HPP

#include "legacy_bridge.hpp"
#include "ooxml_processor.hpp"
#include "processor.hpp"
#include <array>
#include <memory>
#include <span>
#include <string_view>

namespace docscrub {

/**
 * @brief Converts a legacy document to its ZIP-based successor and runs the
 * OOXML pipeline on the result.
 *
 * @details The output takes the successor extension (.xls -> .xlsx). When
 * conversion is unavailable, spreadsheets fall back to a byte-level patch
 * of the BIFF protection records and keep their original format; other
 * kinds fail with ConversionUnavailable. The fallback never touches
 * watermarks.
 */
class LegacyProcessor final : public IProcessor {
public:
    /**
     * @brief Uses a SofficeConverter built from the run's legacy_timeout.
     */
    LegacyProcessor() = default;

    /**
     * @brief Uses the given converter for every document.
     */
    explicit LegacyProcessor(std::unique_ptr<ILegacyConverter> converter)
        : converter_(std::move(converter)) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "LegacyProcessor";
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 3> kMimes = {
            "application/msword",
            "application/vnd.ms-excel",
            "application/vnd.ms-powerpoint"
        };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 3> kExts = { ".doc", ".xls", ".ppt" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] bool handles(const ContainerFormat format) const noexcept override {
        return format == ContainerFormat::LegacyBinary;
    }

    /**
     * @throws SanitizeError (ConversionUnavailable) when conversion fails and
     *         no binary fallback applies.
     */
    ProcessResult process(const Document& doc,
                          const std::filesystem::path& output_path,
                          const SanitizeOptions& options,
                          const ProgressCallback& progress) override;

private:
    ProcessResult binary_fallback(const Document& doc,
                                  const std::filesystem::path& output_path,
                                  const SanitizeOptions& options) const;

    std::unique_ptr<ILegacyConverter> converter_;
    OOXMLProcessor ooxml_;
};

} // namespace docscrub

#endif // DOCSCRUB_LEGACY_PROCESSOR_HPP
