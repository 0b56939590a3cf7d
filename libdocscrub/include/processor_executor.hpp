//
// processor_executor.hpp
//

/**
 * @file processor_executor.hpp
 * @brief Defines the orchestrator that runs documents through the engine.
 */

#ifndef DOCSCRUB_PROCESSOR_EXECUTOR_HPP
#define DOCSCRUB_PROCESSOR_EXECUTOR_HPP

#include "event_bus.hpp"
#include "process_result.hpp"
#include "processor_registry.hpp"
#include "sanitize_options.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace docscrub {

/**
 * @brief Runs a batch of documents through classify, dispatch and process.
 *
 * @details Documents are handled strictly one after another. Each one is
 * classified by the ContainerProbe, dispatched to the processor registered
 * for its format and processed. Every failure is caught at the document
 * boundary and turned into a failed ProcessResult plus a DocumentErrorEvent,
 * so one bad document never aborts the batch.
 */
class ProcessorExecutor {
public:
    /**
     * @brief Construct a ProcessorExecutor.
     *
     * @param registry Registry with the available processors.
     * @param options Run configuration, copied.
     * @param output_path Explicit output path; honoured only for a
     *        single-document batch, empty for the derived default.
     * @param bus EventBus used to publish progress and results.
     */
    ProcessorExecutor(ProcessorRegistry& registry,
                      SanitizeOptions options,
                      std::filesystem::path output_path,
                      EventBus& bus);

    /**
     * @brief Processes every input in order.
     * @return One result per input, in input order. Inputs never started
     *         because of a stop request are reported as skipped and have
     *         no entry.
     */
    std::vector<ProcessResult> process(const std::vector<std::filesystem::path>& inputs);

    /**
     * @brief Processes one document. Never throws for document errors.
     */
    ProcessResult process_one(const std::filesystem::path& input,
                              const std::filesystem::path& output_path);

    /**
     * @brief "report.pdf" -> "report_sanitized.pdf" (suffix before the extension).
     */
    [[nodiscard]] static std::filesystem::path default_output_path(const std::filesystem::path& input,
                                                                   const std::string& suffix);

    /**
     * @brief Checks if a stop has been requested.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Prevents the next queued document from starting.
     *
     * The document currently being processed runs to completion. Safe to
     * call from another thread or from a signal handler.
     */
    void request_stop();

private:
    ProcessResult run_document(const std::filesystem::path& input,
                               const std::filesystem::path& output_path);

    ProcessorRegistry& registry_;         ///< Reference to the processor registry
    SanitizeOptions options_;             ///< Run configuration
    std::filesystem::path output_path_;   ///< Optional explicit output
    EventBus& event_bus_;                 ///< Bus for publishing events
    std::atomic<bool> stop_flag_{false};  ///< Flag to signal interruption
};

} // namespace docscrub

#endif // DOCSCRUB_PROCESSOR_EXECUTOR_HPP
