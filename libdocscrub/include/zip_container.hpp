//
// zip_container.hpp
//

/**
 * @file zip_container.hpp
 * @brief Part-level access to ZIP-based containers and their deterministic rebuild.
 */

#ifndef DOCSCRUB_ZIP_CONTAINER_HPP
#define DOCSCRUB_ZIP_CONTAINER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace docscrub {

/**
 * @brief Reads and writes OOXML packages through libarchive.
 *
 * @details Parts are materialized as files under a workspace directory so
 * that processors can patch them in place. rebuild() is the repackager:
 * it writes every file of the workspace back into a new archive in a
 * fixed order with fixed timestamps, so identical workspaces produce
 * byte-identical archives.
 */
class ZipContainer {
public:
    /**
     * @brief Lists member names without extracting anything.
     * @throws SanitizeError (CorruptContainer) if the archive cannot be read.
     */
    static std::vector<std::string> list_members(const std::filesystem::path& archive_path);

    /**
     * @brief Extracts every member into @p workspace_root.
     *
     * Member names that are absolute or climb out of the workspace are
     * rejected.
     *
     * @return Relative member names (generic form) in archive order.
     * @throws SanitizeError (CorruptContainer) on malformed archives,
     *         (IOFailure) on filesystem errors.
     */
    static std::vector<std::string> extract(const std::filesystem::path& archive_path,
                                            const std::filesystem::path& workspace_root);

    /**
     * @brief Rebuilds an archive from a workspace.
     *
     * The archive is staged next to @p output_path and moved into place
     * only after it has been closed successfully.
     *
     * @throws SanitizeError (IOFailure) if the archive cannot be written.
     */
    static void rebuild(const std::filesystem::path& workspace_root,
                        const std::filesystem::path& output_path);

    /**
     * @brief Member order used by rebuild(): "[Content_Types].xml" first,
     * then all other files sorted by their generic relative path.
     */
    static std::vector<std::string> ordered_members(const std::filesystem::path& workspace_root);
};

} // namespace docscrub

#endif // DOCSCRUB_ZIP_CONTAINER_HPP
