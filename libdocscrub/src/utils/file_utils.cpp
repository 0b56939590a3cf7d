//
// file_utils.cpp
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace docscrub {

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        // use a common base dir inside temp
        const auto base_tmp = std::filesystem::temp_directory_path() /
            ("docscrub-" + prefix);

        std::error_code ec;
        std::filesystem::create_directories(base_tmp, ec);

        const std::string stem = input_path.stem().string();
        const std::string dir_name = prefix + "_" + stem + "_" + RandomUtils::random_suffix();
        auto dir = base_tmp / dir_name;

        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw SanitizeError(ErrorKind::IOFailure,
                                "cannot create workspace " + dir.string() + ": " + ec.message());
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            throw SanitizeError(ErrorKind::IOFailure, "cannot open for reading: " + path.string());
        }
        std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (ifs.bad()) {
            throw SanitizeError(ErrorKind::IOFailure, "read failed: " + path.string());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::string_view data) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw SanitizeError(ErrorKind::IOFailure, "cannot open for writing: " + path.string());
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.close();
        if (!ofs) {
            throw SanitizeError(ErrorKind::IOFailure, "write failed: " + path.string());
        }
    }

    std::filesystem::path staging_path_for(const std::filesystem::path& destination) {
        auto staged = destination;
        staged += ".tmp" + RandomUtils::random_suffix();
        return staged;
    }

    void commit_staged_file(const std::filesystem::path& staged, const std::filesystem::path& destination) {
        std::error_code ec;
        std::filesystem::rename(staged, destination, ec);
        if (!ec) {
            return;
        }

        Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), falling back to copy", "file_utils");
        std::error_code copy_ec;
        std::filesystem::copy_file(staged, destination,
                                   std::filesystem::copy_options::overwrite_existing, copy_ec);
        std::error_code rm_ec;
        std::filesystem::remove(staged, rm_ec);
        if (copy_ec) {
            throw SanitizeError(ErrorKind::IOFailure,
                                "cannot write " + destination.string() + ": " + copy_ec.message());
        }
    }

    void copy_to_output(const std::filesystem::path& input, const std::filesystem::path& destination) {
        const auto staged = staging_path_for(destination);
        std::error_code ec;
        std::filesystem::copy_file(input, staged, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(staged, rm_ec);
            throw SanitizeError(ErrorKind::IOFailure,
                                "cannot copy " + input.string() + " to " + destination.string() + ": " + ec.message());
        }
        commit_staged_file(staged, destination);
    }

    ScopedWorkspace::ScopedWorkspace(const std::filesystem::path& input_path, const std::string& prefix)
        : root_(make_temp_dir_for(input_path, prefix)) {
        Logger::log(LogLevel::Debug, "Workspace created: " + root_.string(), "workspace");
    }

    ScopedWorkspace::~ScopedWorkspace() {
        cleanup_temp_dir(root_, "workspace");
    }

} // namespace docscrub
