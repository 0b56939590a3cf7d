//
// file_type.hpp
//

/**
 * @file file_type.hpp
 * @brief Container format and document kind enumerations.
 *
 * ContainerFormat is the classification produced by the container probe
 * and drives processor dispatch. DocumentKind tells the OOXML processor
 * which rule catalog and detectors apply to a package.
 */

#ifndef DOCSCRUB_FILE_TYPE_HPP
#define DOCSCRUB_FILE_TYPE_HPP

#include <string>
#include <unordered_map>
#include <optional>
#include <algorithm>
#include <cctype>

/**
 * @brief Physical container families the engine understands.
 */
enum class ContainerFormat {
    OoxmlZip,     ///< ZIP package (docx/xlsx/pptx and their variants)
    LegacyBinary, ///< OLE compound file (doc/xls/ppt)
    Pdf,
    Unknown
};

/**
 * @brief Logical document kinds; independent of the physical container.
 */
enum class DocumentKind {
    WordProcessing,
    Spreadsheet,
    Presentation,
    Pdf,
    Unknown
};

/**
 * @brief Converts a ContainerFormat to its tag ("ooxml-zip", "legacy-binary", "pdf").
 */
inline std::string container_format_to_string(const ContainerFormat fmt) {
    switch (fmt) {
        case ContainerFormat::OoxmlZip:     return "ooxml-zip";
        case ContainerFormat::LegacyBinary: return "legacy-binary";
        case ContainerFormat::Pdf:          return "pdf";
        default:                            return "unknown";
    }
}

inline std::string document_kind_to_string(const DocumentKind kind) {
    switch (kind) {
        case DocumentKind::WordProcessing: return "word-processing";
        case DocumentKind::Spreadsheet:    return "spreadsheet";
        case DocumentKind::Presentation:   return "presentation";
        case DocumentKind::Pdf:            return "pdf";
        default:                           return "unknown";
    }
}

/**
 * @brief Lowercases an extension (".DOCX" -> ".docx").
 */
inline std::string normalize_extension(std::string ext) {
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ext;
}

///< OOXML package extensions, including macro-enabled and template variants.
inline const std::unordered_map<std::string, DocumentKind> ooxml_extensions = {
    { ".docx", DocumentKind::WordProcessing },
    { ".docm", DocumentKind::WordProcessing },
    { ".dotx", DocumentKind::WordProcessing },
    { ".dotm", DocumentKind::WordProcessing },
    { ".xlsx", DocumentKind::Spreadsheet },
    { ".xlsm", DocumentKind::Spreadsheet },
    { ".xltx", DocumentKind::Spreadsheet },
    { ".xltm", DocumentKind::Spreadsheet },
    { ".pptx", DocumentKind::Presentation },
    { ".pptm", DocumentKind::Presentation },
    { ".potx", DocumentKind::Presentation },
    { ".potm", DocumentKind::Presentation },
};

///< Legacy binary extensions handled through the conversion bridge.
inline const std::unordered_map<std::string, DocumentKind> legacy_extensions = {
    { ".doc", DocumentKind::WordProcessing },
    { ".xls", DocumentKind::Spreadsheet },
    { ".ppt", DocumentKind::Presentation },
};

///< libmagic MIME types that identify a legacy binary document.
inline const std::unordered_map<std::string, DocumentKind> legacy_mime_to_kind = {
    { "application/msword",            DocumentKind::WordProcessing },
    { "application/vnd.ms-excel",      DocumentKind::Spreadsheet },
    { "application/vnd.ms-powerpoint", DocumentKind::Presentation },
};

/**
 * @brief Returns the OOXML kind claimed by an extension, if any.
 */
inline std::optional<DocumentKind> ooxml_kind_from_extension(const std::string& ext) {
    const auto it = ooxml_extensions.find(normalize_extension(ext));
    if (it == ooxml_extensions.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Returns the legacy kind claimed by an extension, if any.
 */
inline std::optional<DocumentKind> legacy_kind_from_extension(const std::string& ext) {
    const auto it = legacy_extensions.find(normalize_extension(ext));
    if (it == legacy_extensions.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Extension of the ZIP-based successor of a legacy kind (".docx" for
 * word processing, and so on).
 */
inline std::string successor_extension(const DocumentKind kind) {
    switch (kind) {
        case DocumentKind::WordProcessing: return ".docx";
        case DocumentKind::Spreadsheet:    return ".xlsx";
        case DocumentKind::Presentation:   return ".pptx";
        default:                           return "";
    }
}

#endif // DOCSCRUB_FILE_TYPE_HPP
