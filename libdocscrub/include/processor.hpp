//
// processor.hpp
//

#ifndef DOCSCRUB_PROCESSOR_HPP
#define DOCSCRUB_PROCESSOR_HPP

#include "container_probe.hpp"
#include "process_result.hpp"
#include "sanitize_options.hpp"
#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace docscrub
 * @brief The main namespace for the docscrub library.
 *
 * @details This namespace encapsulates the document sanitization engine:
 * the abstract IProcessor interface, the concrete container processors
 * (OOXML, PDF, legacy binary), the detectors they drive, the execution
 * engine (ProcessorExecutor) and the utility helpers.
 */
namespace docscrub {

/**
 * @brief Interface for a container processor.
 *
 * Each implementation targets one container family. It must be
 * self-descriptive about the formats it handles (MIME types, extensions)
 * and is resolved once per document from the classified ContainerFormat.
 *
 * Implementations keep no per-document state between calls; everything a
 * run needs lives on the stack of process() and in its scoped workspace.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    // --- self-description ---

    /// @return Human-readable name of the processor (e.g. "PdfProcessor").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types.
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".pdf").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    /// @return True if this processor handles documents of @p format.
    [[nodiscard]] virtual bool handles(ContainerFormat format) const noexcept = 0;

    // --- operations ---

    /**
     * @brief Detects artifacts and, in apply mode, writes the sanitized copy.
     *
     * @param doc Classified input document.
     * @param output_path Where the sanitized document goes (ignored in scan mode).
     * @param options Thresholds, targets and mode.
     * @param progress Optional per-unit progress callback.
     * @return Successful result; failures are thrown.
     * @throws SanitizeError for every expected failure.
     */
    virtual ProcessResult process(const Document& doc,
                                  const std::filesystem::path& output_path,
                                  const SanitizeOptions& options,
                                  const ProgressCallback& progress) = 0;
};

} // namespace docscrub

#endif // DOCSCRUB_PROCESSOR_HPP
