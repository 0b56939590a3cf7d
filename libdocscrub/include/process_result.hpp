//
// process_result.hpp
//

/**
 * @file process_result.hpp
 * @brief Artifact descriptions and the per-document result.
 */

#ifndef DOCSCRUB_PROCESS_RESULT_HPP
#define DOCSCRUB_PROCESS_RESULT_HPP

#include "errors.hpp"
#include "sanitize_options.hpp"
#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace docscrub {

/**
 * @brief A located protection element: the part it lives in and its tag.
 */
struct ProtectionMarker {
    std::string part_name; ///< e.g. "word/settings.xml"
    std::string tag;       ///< e.g. "w:documentProtection"
};

///< Six-component affine transform (a b c d e f) of a text matrix.
using Matrix = std::array<double, 6>;

struct RotatedText {
    double angle = 0.0; ///< degrees, |atan2(b, 1)|
    Matrix matrix{};
};

struct KeywordMatch {
    std::string keyword;
};

struct NamedShape {
    std::string pattern;    ///< configured pattern that matched
    std::string shape_name; ///< accessible name of the shape
};

struct TransparentWordArt {
    int alpha = 0; ///< 0..100000
};

struct BackgroundFill {};

/**
 * @brief VML watermark in a word-processing header.
 */
struct VmlWatermark {
    std::string signature; ///< the content predicate that identified it
};

/**
 * @brief Background picture of a worksheet.
 */
struct BackgroundPicture {};

using WatermarkKind = std::variant<RotatedText,
                                   KeywordMatch,
                                   NamedShape,
                                   TransparentWordArt,
                                   BackgroundFill,
                                   VmlWatermark,
                                   BackgroundPicture>;

/**
 * @brief Where an artifact was found.
 */
struct ArtifactLocation {
    std::size_t unit = 0;   ///< 1-based page or slide index, 0 when not paged
    std::string part;       ///< container part name, empty for PDF
    std::size_t offset = 0; ///< byte offset inside the part or content stream
};

struct WatermarkCandidate {
    WatermarkKind kind;
    ArtifactLocation location;
};

/**
 * @brief Human-readable label for a detected watermark kind.
 */
std::string describe(const WatermarkKind& kind);

/**
 * @brief Human-readable label for a protection marker.
 */
std::string describe(const ProtectionMarker& marker);

/**
 * @brief Terminal output of one processing run.
 */
struct ProcessResult {
    bool success = false;
    std::optional<std::filesystem::path> output_path;
    std::string message;
    std::size_t removed_count = 0;
    std::size_t page_count = 0;
    std::size_t scanned_count = 0;
    std::set<std::string> detected_patterns;
    std::optional<ErrorKind> error; ///< set only when success is false

    static ProcessResult failure(ErrorKind kind, const std::string& message);
};

/**
 * @brief Accumulates artifacts while a processor walks a document.
 */
class ArtifactTally {
public:
    void add(const WatermarkCandidate& candidate);
    void add(const ProtectionMarker& marker);

    /// Records an artifact that has no structured description (e.g. PDF encryption).
    void add_label(const std::string& label);

    void add_scanned(std::size_t n) { scanned_ += n; }

    [[nodiscard]] std::size_t removed_count() const { return removed_; }
    [[nodiscard]] std::size_t scanned_count() const { return scanned_; }
    [[nodiscard]] const std::set<std::string>& labels() const { return labels_; }
    [[nodiscard]] const std::vector<WatermarkCandidate>& watermarks() const { return watermarks_; }
    [[nodiscard]] const std::vector<ProtectionMarker>& markers() const { return markers_; }

    /**
     * @brief Builds the successful result for this tally.
     * @param mode Scan or apply; changes the wording of the message.
     * @param output_path Written output, or nullopt in scan mode.
     * @param page_count Pages or slides visited.
     */
    [[nodiscard]] ProcessResult to_result(RunMode mode,
                                          std::optional<std::filesystem::path> output_path,
                                          std::size_t page_count) const;

private:
    std::size_t removed_ = 0;
    std::size_t scanned_ = 0;
    std::set<std::string> labels_;
    std::vector<WatermarkCandidate> watermarks_;
    std::vector<ProtectionMarker> markers_;
};

/**
 * @brief "apply complete: removed 3 artifact(s) [a, b]" style summary.
 */
std::string summarize(RunMode mode, std::size_t removed, const std::set<std::string>& labels);

} // namespace docscrub

#endif // DOCSCRUB_PROCESS_RESULT_HPP
