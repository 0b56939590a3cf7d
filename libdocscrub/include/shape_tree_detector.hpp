//
// shape_tree_detector.hpp
//

/**
 * @file shape_tree_detector.hpp
 * @brief Watermark detection over presentation slide shape trees.
 */

#ifndef DOCSCRUB_SHAPE_TREE_DETECTOR_HPP
#define DOCSCRUB_SHAPE_TREE_DETECTOR_HPP

#include "process_result.hpp"
#include "sanitize_options.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docscrub {

/**
 * @brief Result of scanning one slide part.
 */
struct SlideScan {
    std::vector<WatermarkCandidate> candidates;
    std::size_t shapes_scanned = 0;
    std::string rewritten; ///< serialized slide, set only when changed
    bool changed = false;
};

/**
 * @brief Classifies the direct p:sp children of a slide's p:spTree.
 *
 * A shape is a watermark when its accessible name contains one of the
 * configured patterns, or, failing that, when it is WordArt with an alpha
 * below the configured threshold. Namespace prefixes are resolved from the
 * slide's declarations, so documents that bind PresentationML or DrawingML
 * to unusual prefixes are still recognized.
 */
class ShapeTreeDetector {
public:
    explicit ShapeTreeDetector(const SanitizeOptions& options);

    /**
     * @brief Scans a slide and optionally excises the confirmed shapes.
     *
     * @param slide_xml Slide part content.
     * @param part_name Part name used in candidate locations.
     * @param slide_index 1-based slide number.
     * @param excise Remove confirmed shapes and serialize the result.
     * @throws SanitizeError (CorruptContainer) if the slide does not parse.
     */
    [[nodiscard]] SlideScan scan_slide(std::string_view slide_xml,
                                       const std::string& part_name,
                                       std::size_t slide_index,
                                       bool excise) const;

    /**
     * @brief Numeric index of a slide part ("ppt/slides/slide12.xml" -> 12).
     * @return nullopt for anything that is not a slide part.
     */
    [[nodiscard]] static std::optional<std::size_t> slide_index(std::string_view part_name);

    /**
     * @brief Keeps only slide parts and sorts them by numeric index.
     */
    [[nodiscard]] static std::vector<std::string> order_slides(const std::vector<std::string>& part_names);

private:
    const SanitizeOptions& options_;
};

} // namespace docscrub

#endif // DOCSCRUB_SHAPE_TREE_DETECTOR_HPP
