//
// docscrub.hpp
//

/**
 * @file docscrub.hpp
 * @brief Public API for the docscrub library.
 */

#ifndef DOCSCRUB_HPP
#define DOCSCRUB_HPP

#include "errors.hpp"
#include "legacy_bridge.hpp"
#include "process_result.hpp"
#include "sanitize_options.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace docscrub {

/**
 * @brief Interface for receiving progress and status events during execution.
 *
 * Callbacks run synchronously on the thread that called DocScrub::sanitize().
 */
struct DocScrubObserver {
    virtual ~DocScrubObserver() = default;

    virtual void onDocumentStart(const std::filesystem::path& path, std::size_t index, std::size_t total) {}

    virtual void onProgress(const std::filesystem::path& path,
                            std::size_t current,
                            std::size_t total,
                            const std::string& description) {}

    virtual void onDocumentFinish(const std::filesystem::path& path, const ProcessResult& result) {}

    virtual void onDocumentError(const std::filesystem::path& path,
                                 ErrorKind kind,
                                 const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the docscrub library.
 *
 * @details Wraps the sanitization pipeline into a simple, blocking API.
 * Uses PIMPL idiom to hide internal dependencies.
 *
 * @code
 * docscrub::DocScrub scrub;
 * scrub.mode(docscrub::RunMode::Scan).addKeyword("CONFIDENTIAL");
 * const auto results = scrub.sanitize("report.pdf");
 * @endcode
 */
class DocScrub {
public:
    DocScrub();
    ~DocScrub();

    DocScrub(const DocScrub&) = delete;
    DocScrub& operator=(const DocScrub&) = delete;
    DocScrub(DocScrub&&) noexcept;
    DocScrub& operator=(DocScrub&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Scan (report only) or apply (write sanitized copies).
     * Default: Apply.
     */
    DocScrub& mode(RunMode m);

    /**
     * @brief Artifact classes to target.
     * Default: All.
     */
    DocScrub& targets(TargetSet t);

    /**
     * @brief Replace the PDF watermark keyword list.
     * Default: empty.
     */
    DocScrub& keywords(std::vector<std::string> kws);
    DocScrub& addKeyword(const std::string& kw);

    /**
     * @brief Minimum |b| or |c| of a text matrix to consider rotation.
     * Default: 0.1.
     */
    DocScrub& rotationThreshold(double val);

    /**
     * @brief Inclusive rotation band in degrees.
     * Default: 5 to 85.
     */
    DocScrub& angleRange(double min_deg, double max_deg);

    /**
     * @brief Shape-name patterns for presentation watermarks.
     * Default: "艺术字", "WordArt", "水印".
     */
    DocScrub& namePatterns(std::vector<std::string> patterns);

    /**
     * @brief Enable or disable transparent WordArt detection.
     * Default: true.
     */
    DocScrub& detectWordArt(bool val);

    /**
     * @brief Alpha (0..100000) below which WordArt counts as transparent.
     * Default: 80000.
     */
    DocScrub& alphaThreshold(int val);

    /**
     * @brief Suffix inserted before the extension of derived output names.
     * Default: "_sanitized".
     */
    DocScrub& outputSuffix(const std::string& suffix);

    /**
     * @brief Explicit output path, used only when sanitizing a single document.
     * Default: empty (derived from the input).
     */
    DocScrub& outputPath(const std::filesystem::path& path);

    /**
     * @brief Maximum wait for the legacy format converter.
     * Default: 60 seconds.
     */
    DocScrub& legacyTimeout(std::chrono::seconds timeout);

    /**
     * @brief Replace the legacy format converter (soffice by default).
     */
    DocScrub& legacyConverter(std::unique_ptr<ILegacyConverter> converter);

    /**
     * @brief The configuration the next sanitize() call will use.
     */
    [[nodiscard]] const SanitizeOptions& options() const;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(DocScrubObserver* observer);

    // --- Execution ---

    /**
     * @brief Sanitizes a list of documents. Blocks until completion.
     * @return One result per document that was started.
     */
    std::vector<ProcessResult> sanitize(const std::vector<std::filesystem::path>& paths);

    std::vector<ProcessResult> sanitize(const std::filesystem::path& path);
    std::vector<ProcessResult> sanitize(const std::vector<std::string>& paths);

    // --- Control ---

    /**
     * @brief Requests cancellation before the next document. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docscrub

#endif // DOCSCRUB_HPP
