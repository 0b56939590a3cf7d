//
// file_utils.hpp
//

#ifndef DOCSCRUB_FILE_UTILS_HPP
#define DOCSCRUB_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace docscrub {

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Creates a directory inside the system temp path using a
     * "docscrub-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g., "docx", "pdf").
     * @return Filesystem path to the newly created temporary directory.
     * @throws SanitizeError (IOFailure) if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Reads a whole file as bytes.
     * @throws SanitizeError (IOFailure) on open or read failure.
     */
    std::string read_file(const std::filesystem::path &path);

    /**
     * @brief Writes bytes to a file, truncating it.
     * @throws SanitizeError (IOFailure) on open or write failure.
     */
    void write_file(const std::filesystem::path &path, std::string_view data);

    /**
     * @brief Moves a staged file onto its destination, replacing it.
     *
     * Falls back to copy+remove when rename fails (different devices).
     * @throws SanitizeError (IOFailure) if neither works.
     */
    void commit_staged_file(const std::filesystem::path &staged,
                            const std::filesystem::path &destination);

    /**
     * @brief Path next to @p destination used to stage a write before commit.
     */
    std::filesystem::path staging_path_for(const std::filesystem::path &destination);

    /**
     * @brief Copies @p input to @p destination unchanged, through a staging file.
     * @throws SanitizeError (IOFailure) on copy failure.
     */
    void copy_to_output(const std::filesystem::path &input,
                        const std::filesystem::path &destination);

    /**
     * @brief Owns a temporary workspace directory for the duration of a run.
     *
     * The directory is removed in the destructor, so every exit path of the
     * owning scope (success, SanitizeError, any other exception) cleans up.
     */
    class ScopedWorkspace {
    public:
        ScopedWorkspace(const std::filesystem::path &input_path, const std::string &prefix);
        ~ScopedWorkspace();

        ScopedWorkspace(const ScopedWorkspace&) = delete;
        ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    private:
        std::filesystem::path root_;
    };

} // namespace docscrub

#endif // DOCSCRUB_FILE_UTILS_HPP
