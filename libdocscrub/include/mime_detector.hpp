//
// mime_detector.hpp
//

#ifndef DOCSCRUB_MIME_DETECTOR_HPP
#define DOCSCRUB_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace docscrub {

    /**
     * @brief Content-based file type detection.
     *
     * This class abstracts the underlying mechanism for detecting MIME types.
     * The container probe uses it as a secondary signal next to magic bytes.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g., "application/pdf"),
         * or an empty string when detection is unavailable.
         *
         * @note On Linux/macOS, this uses libmagic with the system database.
         * @note On Windows, this falls back to a map of file extensions.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Long textual description of a file ("Composite Document File V2 ...").
         *
         * Used to make UnsupportedFormat messages readable. Empty when
         * unavailable.
         */
        static std::string describe(const std::filesystem::path& path);
    };

} // namespace docscrub
#endif //DOCSCRUB_MIME_DETECTOR_HPP
