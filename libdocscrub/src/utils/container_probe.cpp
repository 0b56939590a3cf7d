//
// container_probe.cpp
//

#include "../../include/container_probe.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/zip_container.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>
#include <system_error>

namespace docscrub {

namespace fs = std::filesystem;

namespace {

const char* probe_tag() {
    return "ContainerProbe";
}

constexpr std::array<unsigned char, 4> zip_magic = {0x50, 0x4B, 0x03, 0x04};
constexpr std::array<unsigned char, 8> cfb_magic = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
constexpr std::size_t pdf_header_window = 1024;

std::string read_head(const fs::path& path, const std::size_t n) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw SanitizeError(ErrorKind::IOFailure, "cannot open for reading: " + path.string());
    }
    std::string buf(n, '\0');
    ifs.read(buf.data(), static_cast<std::streamsize>(n));
    buf.resize(static_cast<std::size_t>(ifs.gcount()));
    return buf;
}

template <std::size_t N>
bool starts_with_bytes(const std::string& head, const std::array<unsigned char, N>& magic) {
    if (head.size() < N) return false;
    return std::equal(magic.begin(), magic.end(), head.begin(),
                      [](const unsigned char m, const char c) { return m == static_cast<unsigned char>(c); });
}

} // namespace

bool ContainerProbe::has_zip_signature(const fs::path& path) {
    return starts_with_bytes(read_head(path, zip_magic.size()), zip_magic);
}

bool ContainerProbe::has_cfb_signature(const fs::path& path) {
    return starts_with_bytes(read_head(path, cfb_magic.size()), cfb_magic);
}

bool ContainerProbe::has_pdf_signature(const fs::path& path) {
    return read_head(path, pdf_header_window).find("%PDF-") != std::string::npos;
}

DocumentKind ContainerProbe::resolve_ooxml_kind(const fs::path& path) {
    bool word = false, sheet = false, pres = false;
    for (const auto& name : ZipContainer::list_members(path)) {
        const std::string_view n(name);
        if (n.starts_with("word/")) word = true;
        else if (n.starts_with("xl/")) sheet = true;
        else if (n.starts_with("ppt/")) pres = true;
    }
    if (word) return DocumentKind::WordProcessing;
    if (sheet) return DocumentKind::Spreadsheet;
    if (pres) return DocumentKind::Presentation;
    return DocumentKind::Unknown;
}

Document ContainerProbe::classify(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw SanitizeError(ErrorKind::IOFailure, "input does not exist or is not a file: " + path.string());
    }

    Document doc;
    doc.path = path;
    doc.mime = MimeDetector::detect(path);

    const std::string ext = normalize_extension(path.extension().string());
    const auto ooxml_kind = ooxml_kind_from_extension(ext);

    if (has_zip_signature(path)) {
        doc.kind = resolve_ooxml_kind(path);
        if (doc.kind == DocumentKind::Unknown && ooxml_kind) {
            Logger::log(LogLevel::Warning,
                        "No word/, xl/ or ppt/ parts in " + path.filename().string() +
                        ", trusting extension " + ext, probe_tag());
            doc.kind = *ooxml_kind;
        }
        if (doc.kind != DocumentKind::Unknown) {
            doc.format = ContainerFormat::OoxmlZip;
        }
    } else if (has_pdf_signature(path)) {
        doc.format = ContainerFormat::Pdf;
        doc.kind = DocumentKind::Pdf;
    } else if (ooxml_kind) {
        // OOXML name, no ZIP header: the package is wrapped in an encrypted OLE container
        doc.format = ContainerFormat::OoxmlZip;
        doc.kind = *ooxml_kind;
        doc.encrypted = true;
    } else if (has_cfb_signature(path)) {
        if (const auto legacy_kind = legacy_kind_from_extension(ext)) {
            doc.format = ContainerFormat::LegacyBinary;
            doc.kind = *legacy_kind;
        } else if (const auto it = legacy_mime_to_kind.find(doc.mime); it != legacy_mime_to_kind.end()) {
            doc.format = ContainerFormat::LegacyBinary;
            doc.kind = it->second;
        }
    }

    Logger::log(LogLevel::Debug,
                path.filename().string() + " -> " + container_format_to_string(doc.format) +
                " (" + document_kind_to_string(doc.kind) + (doc.encrypted ? ", encrypted" : "") +
                (doc.mime.empty() ? "" : ", " + doc.mime) + ")",
                probe_tag());
    return doc;
}

void ContainerProbe::ensure_not_encrypted(const Document& doc) {
    if (doc.encrypted) {
        throw SanitizeError(ErrorKind::EncryptedDocument,
                            doc.path.filename().string() + " is password-protected (no ZIP signature)");
    }
}

} // namespace docscrub
