//
// log_sink.hpp
//

#ifndef DOCSCRUB_LOG_SINK_HPP
#define DOCSCRUB_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter and format what they print.
 */
enum class LogLevel {
    Debug,   ///< Per-part and per-block diagnostics
    Info,    ///< Document-level progress (opened, patched, written)
    Warning, ///< Recoverable oddities (archive warnings, undecodable streams)
    Error    ///< A document failed or a write did not complete
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink decide where log lines go (console, file,
 * an embedding application's observer). The Logger fans every message
 * out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "PdfProcessor").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // DOCSCRUB_LOG_SINK_HPP
