//
// legacy_bridge.hpp
//

/**
 * @file legacy_bridge.hpp
 * @brief Conversion of legacy binary documents to their ZIP-based successors.
 */

#ifndef DOCSCRUB_LEGACY_BRIDGE_HPP
#define DOCSCRUB_LEGACY_BRIDGE_HPP

#include "file_type.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace docscrub {

/**
 * @brief Converts .doc/.xls/.ppt into .docx/.xlsx/.pptx.
 *
 * Implementations must not throw for an unavailable or failing converter;
 * they return nullopt and the caller decides what to do.
 */
class ILegacyConverter {
public:
    virtual ~ILegacyConverter() = default;

    /**
     * @param legacy_path Input document.
     * @param kind Document kind, selects the target format.
     * @param out_dir Directory that receives the converted file.
     * @return Path of the converted file, or nullopt if conversion failed.
     */
    virtual std::optional<std::filesystem::path> convert(const std::filesystem::path& legacy_path,
                                                         DocumentKind kind,
                                                         const std::filesystem::path& out_dir) = 0;
};

/**
 * @brief Runs a headless office suite in a child process.
 *
 * Equivalent to `soffice --headless --convert-to xlsx --outdir DIR FILE`.
 * The child is killed if it does not finish within the timeout.
 */
class SofficeConverter final : public ILegacyConverter {
public:
    explicit SofficeConverter(std::string program = "soffice",
                              std::chrono::seconds timeout = std::chrono::seconds(60));

    std::optional<std::filesystem::path> convert(const std::filesystem::path& legacy_path,
                                                 DocumentKind kind,
                                                 const std::filesystem::path& out_dir) override;

private:
    std::string program_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Clears BIFF sheet/workbook protection flags in raw .xls bytes.
 *
 * Rewrites the PROTECT (0x0012) and PASSWORD (0x0013) record patterns
 * "12 02 01 00" and "13 02 01 00" to "12 02 00 00".
 *
 * @return Number of patterns rewritten.
 */
std::size_t binary_protection_patch(std::string& bytes);

} // namespace docscrub

#endif // DOCSCRUB_LEGACY_BRIDGE_HPP
