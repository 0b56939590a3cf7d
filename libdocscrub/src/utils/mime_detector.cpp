//
// mime_detector.cpp
//
#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/file_type.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace {

#ifndef _WIN32
std::string magic_query(const std::filesystem::path& path, const int flags) {
    const magic_t magic = magic_open(flags | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* res = magic_file(magic, path.string().c_str());
    std::string result = res ? res : "";
    magic_close(magic);
    return result;
}
#else
const std::unordered_map<std::string, std::string> ext_to_mime = {
    { ".pdf",  "application/pdf" },
    { ".doc",  "application/msword" },
    { ".xls",  "application/vnd.ms-excel" },
    { ".ppt",  "application/vnd.ms-powerpoint" },
    { ".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document" },
    { ".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet" },
    { ".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation" },
};
#endif

} // namespace

std::string docscrub::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    return magic_query(path, MAGIC_MIME_TYPE);
#else
    const auto ext = normalize_extension(path.extension().string());
    const auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
#endif
}

std::string docscrub::MimeDetector::describe(const std::filesystem::path& path)
{
#ifndef _WIN32
    return magic_query(path, MAGIC_NONE);
#else
    return {};
#endif
}
