//
// errors.hpp
//

/**
 * @file errors.hpp
 * @brief Error kinds and the exception type used throughout the engine.
 */

#ifndef DOCSCRUB_ERRORS_HPP
#define DOCSCRUB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace docscrub {

/**
 * @brief Typed reasons for a failed document.
 */
enum class ErrorKind {
    UnsupportedFormat,     ///< No processor recognizes the content
    EncryptedDocument,     ///< Password-protected and the empty-password retry failed
    ConversionUnavailable, ///< Legacy bridge failed and no binary fallback applies
    CorruptContainer,      ///< Archive or content-stream structure is unusable
    IOFailure              ///< Filesystem read/write failed
};

inline const char* error_kind_to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:     return "UnsupportedFormat";
        case ErrorKind::EncryptedDocument:     return "EncryptedDocument";
        case ErrorKind::ConversionUnavailable: return "ConversionUnavailable";
        case ErrorKind::CorruptContainer:      return "CorruptContainer";
        case ErrorKind::IOFailure:             return "IOFailure";
    }
    return "Unknown";
}

/**
 * @brief Exception carrying an ErrorKind.
 *
 * Components throw it; ProcessorExecutor catches it at the per-document
 * boundary and turns it into a failed ProcessResult.
 */
class SanitizeError : public std::runtime_error {
public:
    SanitizeError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace docscrub

#endif // DOCSCRUB_ERRORS_HPP
