//
// zip_container.cpp
//

#include "../../include/zip_container.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace docscrub {

namespace fs = std::filesystem;

namespace {

const char* container_tag() {
    return "ZipContainer";
}

using ReadHandle = std::unique_ptr<archive, decltype(&archive_read_free)>;
using WriteHandle = std::unique_ptr<archive, decltype(&archive_write_free)>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

ReadHandle open_for_reading(const fs::path& archive_path) {
    ReadHandle in(archive_read_new(), &archive_read_free);
    if (!in) {
        throw SanitizeError(ErrorKind::IOFailure, "archive_read_new failed");
    }
    archive_read_support_format_zip(in.get());

    const int open_r = archive_read_open_filename(in.get(), archive_path.string().c_str(), 10240);
    if (open_r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
    }
    if (open_r != ARCHIVE_OK && open_r != ARCHIVE_WARN) {
        throw SanitizeError(ErrorKind::CorruptContainer,
                            "cannot open ZIP container " + archive_path.filename().string() +
                            ": " + archive_message(in.get()));
    }
    return in;
}

// rejects absolute names and any ".." component
bool is_safe_member_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') return false;
    const fs::path p(name);
    if (p.has_root_name() || p.has_root_directory()) return false;
    return std::ranges::none_of(p, [](const fs::path& part) { return part == ".."; });
}

} // namespace

std::vector<std::string> ZipContainer::list_members(const fs::path& archive_path) {
    auto in = open_for_reading(archive_path);

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (const char* ename = archive_entry_pathname(entry)) {
            names.emplace_back(ename);
        }
        archive_read_data_skip(in.get());
    }
    if (r != ARCHIVE_EOF) {
        throw SanitizeError(ErrorKind::CorruptContainer,
                            "iteration error in " + archive_path.filename().string() + ": " + archive_message(in.get()));
    }
    return names;
}

std::vector<std::string> ZipContainer::extract(const fs::path& archive_path, const fs::path& workspace_root) {
    Logger::log(LogLevel::Debug, "Extracting: " + archive_path.filename().string(), container_tag());

    auto in = open_for_reading(archive_path);

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
        }

        const char* ename = archive_entry_pathname(entry);
        if (!ename) {
            Logger::log(LogLevel::Warning, "Entry with null name skipped", container_tag());
            archive_read_data_skip(in.get());
            continue;
        }

        const std::string name = ename;
        if (!is_safe_member_name(name)) {
            throw SanitizeError(ErrorKind::CorruptContainer, "unsafe member name in container: " + name);
        }

        const fs::path out_path = workspace_root / fs::path(name);
        std::error_code ec;

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(out_path, ec);
            if (ec) {
                throw SanitizeError(ErrorKind::IOFailure,
                                    "cannot create directory " + out_path.string() + ": " + ec.message());
            }
            archive_read_data_skip(in.get());
            continue;
        }

        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            throw SanitizeError(ErrorKind::IOFailure,
                                "cannot create directory " + out_path.parent_path().string() + ": " + ec.message());
        }

        std::ofstream ofs(out_path, std::ios::binary);
        if (!ofs) {
            throw SanitizeError(ErrorKind::IOFailure, "cannot create part file " + out_path.string());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rb = archive_read_data_block(in.get(), &buff, &size, &offset);
            if (rb == ARCHIVE_EOF) break;
            if (rb == ARCHIVE_WARN) {
                Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
            } else if (rb != ARCHIVE_OK) {
                throw SanitizeError(ErrorKind::CorruptContainer,
                                    "error reading part " + name + ": " + archive_message(in.get()));
            }
            ofs.write(static_cast<const char*>(buff), static_cast<std::streamsize>(size));
        }
        ofs.close();
        if (!ofs) {
            throw SanitizeError(ErrorKind::IOFailure, "write failed for part file " + out_path.string());
        }

        names.push_back(fs::path(name).generic_string());
    }

    if (r != ARCHIVE_EOF) {
        throw SanitizeError(ErrorKind::CorruptContainer,
                            "iteration error in " + archive_path.filename().string() + ": " + archive_message(in.get()));
    }

    Logger::log(LogLevel::Debug,
                "Extraction complete: " + std::to_string(names.size()) + " parts",
                container_tag());
    return names;
}

std::vector<std::string> ZipContainer::ordered_members(const fs::path& workspace_root) {
    std::vector<std::string> members;
    for (const auto& e : fs::recursive_directory_iterator(workspace_root)) {
        if (!e.is_regular_file()) continue;
        members.push_back(fs::relative(e.path(), workspace_root).generic_string());
    }
    std::ranges::sort(members);

    // [Content_Types].xml must be the first entry of an OPC package
    const auto it = std::ranges::find(members, std::string("[Content_Types].xml"));
    if (it != members.end()) {
        std::rotate(members.begin(), it, it + 1);
    }
    return members;
}

void ZipContainer::rebuild(const fs::path& workspace_root, const fs::path& output_path) {
    Logger::log(LogLevel::Info, "Repackaging into: " + output_path.filename().string(), container_tag());

    const fs::path staged = staging_path_for(output_path);

    WriteHandle out(archive_write_new(), &archive_write_free);
    if (!out) {
        throw SanitizeError(ErrorKind::IOFailure, "archive_write_new failed");
    }

    // set ZIP format and force deflate compression
    const int set_fmt = archive_write_set_format_zip(out.get());
    if (set_fmt == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out.get()), container_tag());
    } else if (set_fmt != ARCHIVE_OK) {
        throw SanitizeError(ErrorKind::IOFailure, "set_format_zip failed: " + archive_message(out.get()));
    }
    if (archive_write_set_options(out.get(), "compression=deflate") != ARCHIVE_OK) {
        Logger::log(LogLevel::Warning, "Deflate option rejected: " + archive_message(out.get()), container_tag());
    }

    const int open_w = archive_write_open_filename(out.get(), staged.string().c_str());
    if (open_w == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out.get()), container_tag());
    } else if (open_w != ARCHIVE_OK) {
        throw SanitizeError(ErrorKind::IOFailure,
                            "cannot open " + staged.string() + " for writing: " + archive_message(out.get()));
    }

    try {
        for (const auto& rel : ordered_members(workspace_root)) {
            const std::string data = read_file(workspace_root / fs::path(rel));

            std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(),
                                                                                &archive_entry_free);
            if (!entry) {
                throw SanitizeError(ErrorKind::IOFailure, "archive_entry_new failed");
            }
            archive_entry_set_pathname(entry.get(), rel.c_str());
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_mtime(entry.get(), 0, 0); // determinism

            const int wh = archive_write_header(out.get(), entry.get());
            if (wh == ARCHIVE_WARN) {
                Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out.get()), container_tag());
            } else if (wh != ARCHIVE_OK) {
                throw SanitizeError(ErrorKind::IOFailure,
                                    "write_header failed for " + rel + ": " + archive_message(out.get()));
            }

            if (!data.empty()) {
                const la_ssize_t wrote = archive_write_data(out.get(), data.data(), data.size());
                if (wrote < 0) {
                    throw SanitizeError(ErrorKind::IOFailure,
                                        "write_data failed for " + rel + ": " + archive_message(out.get()));
                }
            }
            Logger::log(LogLevel::Debug, "Packed: " + rel, container_tag());
        }

        if (archive_write_close(out.get()) != ARCHIVE_OK) {
            throw SanitizeError(ErrorKind::IOFailure, "write_close failed: " + archive_message(out.get()));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Failed to repackage " + output_path.filename().string() + ": " + e.what(),
                    container_tag());
        out.reset();
        std::error_code ec;
        fs::remove(staged, ec);
        throw;
    }

    out.reset();
    commit_staged_file(staged, output_path);
}

} // namespace docscrub
