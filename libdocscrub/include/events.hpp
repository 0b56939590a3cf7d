//
// events.hpp
//

#ifndef DOCSCRUB_EVENTS_HPP
#define DOCSCRUB_EVENTS_HPP

#include "errors.hpp"
#include "process_result.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace docscrub {

/**
 * @brief Events published while a batch of documents is sanitized.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (e.g. CLI, report generator, the public facade) about progress, errors,
 * and results. They are simple data carriers without behavior.
 */

/**
 * @brief Emitted when work on a document begins.
 */
struct DocumentStartEvent {
    std::filesystem::path path; ///< Input document
    std::size_t index = 0;      ///< 1-based position in the batch
    std::size_t total = 0;      ///< Batch size
};

/**
 * @brief Emitted for each page or slide (or patched part) of a document.
 */
struct DocumentProgressEvent {
    std::filesystem::path path;
    std::size_t current = 0;
    std::size_t total = 0;
    std::string description;
};

/**
 * @brief Emitted when a document was processed successfully.
 */
struct DocumentCompleteEvent {
    std::filesystem::path path;
    ProcessResult result;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a document failed.
 */
struct DocumentErrorEvent {
    std::filesystem::path path;
    ErrorKind kind = ErrorKind::IOFailure;
    std::string error_message;
};

/**
 * @brief Emitted for documents that were never started (stop requested).
 */
struct DocumentSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

} // namespace docscrub

#endif // DOCSCRUB_EVENTS_HPP
