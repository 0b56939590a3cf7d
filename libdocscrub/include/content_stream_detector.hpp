//
// content_stream_detector.hpp
//

/**
 * @file content_stream_detector.hpp
 * @brief Classifies text objects of PDF content streams as watermark stamps.
 */

#ifndef DOCSCRUB_CONTENT_STREAM_DETECTOR_HPP
#define DOCSCRUB_CONTENT_STREAM_DETECTOR_HPP

#include "process_result.hpp"
#include "sanitize_options.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docscrub {

/**
 * @brief Byte range of a text object, from the 'B' of BT to past the 'T' of ET.
 */
struct TextBlock {
    std::size_t begin = 0;
    std::size_t end = 0;
};

/**
 * @brief Result of scanning one content stream.
 */
struct StreamScan {
    std::vector<WatermarkCandidate> candidates;
    std::size_t blocks_scanned = 0;
    std::string rewritten; ///< set only when changed
    bool changed = false;
};

/**
 * @brief Geometric and keyword watermark classification for content streams.
 *
 * Streams are treated as opaque bytes: the tokenizer only needs to know
 * where strings, comments and inline images start and stop so that BT, ET
 * and Tm are recognized as whole operator tokens. Everything outside a
 * removed block is emitted byte for byte.
 */
class ContentStreamDetector {
public:
    explicit ContentStreamDetector(const SanitizeOptions& options);

    /**
     * @brief Finds BT ... ET blocks. A BT inside an open block is ignored;
     * a block without ET is not reported.
     */
    [[nodiscard]] static std::vector<TextBlock> find_text_blocks(std::string_view stream);

    /**
     * @brief The last Tm in @p block whose six operands are all numbers.
     */
    [[nodiscard]] static std::optional<Matrix> last_text_matrix(std::string_view block);

    /**
     * @brief |atan2(b, 1)| in degrees.
     */
    [[nodiscard]] static double rotation_angle(const Matrix& m);

    /**
     * @brief Classifies one text block; rotation is tested before keywords.
     * @return nullopt if the block is not a watermark.
     */
    [[nodiscard]] std::optional<WatermarkKind> classify(std::string_view block) const;

    /**
     * @brief Classifies every text block of a stream and, if @p remove is
     * set, drops the classified blocks from a rewritten copy.
     * @param page_index 1-based page number used in candidate locations.
     */
    [[nodiscard]] StreamScan scan(std::string_view stream, std::size_t page_index, bool remove) const;

private:
    const SanitizeOptions& options_;
};

} // namespace docscrub

#endif // DOCSCRUB_CONTENT_STREAM_DETECTOR_HPP
