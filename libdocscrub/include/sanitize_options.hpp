//
// sanitize_options.hpp
//

/**
 * @file sanitize_options.hpp
 * @brief Run configuration shared by all processors.
 */

#ifndef DOCSCRUB_SANITIZE_OPTIONS_HPP
#define DOCSCRUB_SANITIZE_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace docscrub {

/**
 * @brief Scan reports what would be removed; Apply removes it and writes output.
 */
enum class RunMode {
    Scan,
    Apply
};

/**
 * @brief Which artifact classes a run targets.
 */
enum class TargetSet {
    Protection, ///< edit/workbook/sheet/presentation locks only
    Watermark,  ///< visual watermark artifacts only
    All
};

/**
 * @brief Detection thresholds and behaviour switches for one run.
 *
 * Defaults match the values the tool has always shipped with.
 */
struct SanitizeOptions {
    RunMode mode = RunMode::Apply;
    TargetSet targets = TargetSet::All;

    // PDF content streams
    std::vector<std::string> keywords;  ///< substrings that mark a text block as watermark
    double rotation_threshold = 0.1;    ///< minimum |b| or |c| of the text matrix
    double angle_min = 5.0;             ///< inclusive lower bound, degrees
    double angle_max = 85.0;            ///< inclusive upper bound, degrees

    // presentation shape trees
    std::vector<std::string> name_patterns = {"艺术字", "WordArt", "水印"};
    bool detect_wordart = true;
    int alpha_threshold = 80000;        ///< 0..100000, below means transparent

    // output
    std::string output_suffix = "_sanitized";

    // legacy conversion
    std::chrono::seconds legacy_timeout{60};

    [[nodiscard]] bool wants_protection() const noexcept {
        return targets != TargetSet::Watermark;
    }

    [[nodiscard]] bool wants_watermarks() const noexcept {
        return targets != TargetSet::Protection;
    }

    [[nodiscard]] bool is_apply() const noexcept {
        return mode == RunMode::Apply;
    }
};

/**
 * @brief Progress callback: (current unit, total units, description).
 *
 * Invoked synchronously from the thread running the document pipeline.
 */
using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string&)>;

inline const char* run_mode_to_string(const RunMode mode) {
    return mode == RunMode::Scan ? "scan" : "apply";
}

inline const char* target_set_to_string(const TargetSet targets) {
    switch (targets) {
        case TargetSet::Protection: return "protection";
        case TargetSet::Watermark:  return "watermark";
        case TargetSet::All:        return "all";
    }
    return "all";
}

} // namespace docscrub

#endif // DOCSCRUB_SANITIZE_OPTIONS_HPP
