//
// container_probe.hpp
//

/**
 * @file container_probe.hpp
 * @brief Format classification and encryption gating for input documents.
 */

#ifndef DOCSCRUB_CONTAINER_PROBE_HPP
#define DOCSCRUB_CONTAINER_PROBE_HPP

#include "file_type.hpp"
#include <filesystem>
#include <string>

namespace docscrub {

/**
 * @brief An input document as classified by ContainerProbe.
 *
 * Constructed once per run and read-only afterwards.
 */
struct Document {
    std::filesystem::path path;
    ContainerFormat format = ContainerFormat::Unknown;
    DocumentKind kind = DocumentKind::Unknown;
    bool encrypted = false; ///< OOXML extension without a ZIP signature
    std::string mime;       ///< libmagic MIME type, may be empty
};

/**
 * @brief Classifies containers from their leading bytes, member names and
 * libmagic, in that order of authority.
 */
class ContainerProbe {
public:
    /**
     * @brief Classify a path.
     *
     * Unknown content yields format Unknown; the caller decides whether
     * that is an error.
     *
     * @throws SanitizeError (IOFailure) if the path is missing or unreadable,
     *         (CorruptContainer) if a ZIP signature is present but the
     *         archive directory cannot be read.
     */
    static Document classify(const std::filesystem::path& path);

    /// @return True if the file starts with "PK\x03\x04".
    static bool has_zip_signature(const std::filesystem::path& path);

    /// @return True if "%PDF-" occurs within the first 1024 bytes.
    static bool has_pdf_signature(const std::filesystem::path& path);

    /// @return True if the file starts with the OLE compound-file signature.
    static bool has_cfb_signature(const std::filesystem::path& path);

    /**
     * @brief Resolves the OOXML kind of a ZIP package from its member names.
     * @return Unknown if no word/, xl/ or ppt/ part is present.
     */
    static DocumentKind resolve_ooxml_kind(const std::filesystem::path& path);

    /**
     * @brief Throws EncryptedDocument if the probe flagged @p doc as encrypted.
     */
    static void ensure_not_encrypted(const Document& doc);
};

} // namespace docscrub

#endif // DOCSCRUB_CONTAINER_PROBE_HPP
