//
// processor_executor.cpp
//

#include "../../include/processor_executor.hpp"
#include "../../include/container_probe.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace docscrub {

    ProcessorExecutor::ProcessorExecutor(ProcessorRegistry& registry,
                                         SanitizeOptions options,
                                         fs::path output_path,
                                         EventBus& bus)
        : registry_(registry),
          options_(std::move(options)),
          output_path_(std::move(output_path)),
          event_bus_(bus) {}

    std::vector<ProcessResult> ProcessorExecutor::process(const std::vector<fs::path>& inputs) {
        if (!output_path_.empty() && inputs.size() > 1) {
            Logger::log(LogLevel::Warning,
                        "Explicit output path ignored for a batch of " + std::to_string(inputs.size()) + " documents",
                        "Executor");
        }

        std::vector<ProcessResult> results;
        results.reserve(inputs.size());

        for (std::size_t i = 0; i < inputs.size(); ++i) {
            const auto& input = inputs[i];
            if (is_stopped()) {
                for (std::size_t j = i; j < inputs.size(); ++j) {
                    event_bus_.publish(DocumentSkippedEvent{inputs[j], "Stop requested"});
                }
                Logger::log(LogLevel::Info,
                            "Stop requested, " + std::to_string(inputs.size() - i) + " document(s) not started",
                            "Executor");
                break;
            }

            const fs::path output = (!output_path_.empty() && inputs.size() == 1)
                                        ? output_path_
                                        : default_output_path(input, options_.output_suffix);

            event_bus_.publish(DocumentStartEvent{input, i + 1, inputs.size()});
            results.push_back(process_one(input, output));
        }
        return results;
    }

    ProcessResult ProcessorExecutor::process_one(const fs::path& input, const fs::path& output_path) {
        const auto start = std::chrono::steady_clock::now();

        ProcessResult result;
        try {
            result = run_document(input, output_path);
        } catch (const SanitizeError& e) {
            result = ProcessResult::failure(e.kind(), e.what());
        } catch (const fs::filesystem_error& e) {
            result = ProcessResult::failure(ErrorKind::IOFailure, e.what());
        } catch (const std::exception& e) {
            // anything a library throws past the component boundary
            result = ProcessResult::failure(ErrorKind::CorruptContainer, e.what());
        }

        if (result.success) {
            const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            event_bus_.publish(DocumentCompleteEvent{input, result, duration});
        } else {
            Logger::log(LogLevel::Error,
                        input.filename().string() + ": " + error_kind_to_string(*result.error) + ": " + result.message,
                        "Executor");
            event_bus_.publish(DocumentErrorEvent{input, *result.error, result.message});
        }
        return result;
    }

    ProcessResult ProcessorExecutor::run_document(const fs::path& input, const fs::path& output_path) {
        const Document doc = ContainerProbe::classify(input);

        IProcessor* processor = registry_.find_by_format(doc.format);
        if (doc.format == ContainerFormat::Unknown || !processor) {
            const auto description = MimeDetector::describe(input);
            throw SanitizeError(ErrorKind::UnsupportedFormat,
                                "unsupported format: " + input.filename().string() +
                                (description.empty() ? "" : " (" + description + ")"));
        }

        if (options_.is_apply()) {
            std::error_code ec;
            if (fs::exists(output_path, ec) && fs::equivalent(input, output_path, ec)) {
                throw SanitizeError(ErrorKind::IOFailure, "output path would overwrite the input: " + output_path.string());
            }
            if (const auto parent = output_path.parent_path(); !parent.empty()) {
                fs::create_directories(parent, ec);
                if (ec) {
                    throw SanitizeError(ErrorKind::IOFailure,
                                        "cannot create output directory " + parent.string() + ": " + ec.message());
                }
            }
        }

        Logger::log(LogLevel::Debug,
                    "Dispatching " + input.filename().string() + " to " + std::string(processor->get_name()),
                    "Executor");

        const ProgressCallback progress = [this, &input](const std::size_t current, const std::size_t total,
                                                         const std::string& description) {
            event_bus_.publish(DocumentProgressEvent{input, current, total, description});
        };
        return processor->process(doc, output_path, options_, progress);
    }

    fs::path ProcessorExecutor::default_output_path(const fs::path& input, const std::string& suffix) {
        auto out = input.parent_path() / input.stem();
        out += suffix;
        out += input.extension();
        return out;
    }

    void ProcessorExecutor::request_stop() {
        stop_flag_.store(true, std::memory_order_relaxed);
    }

} // namespace docscrub
