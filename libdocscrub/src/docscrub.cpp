//
// docscrub.cpp
//

/**
 * @file docscrub.cpp
 * @brief Implementation of the public DocScrub API.
 */

#include "../include/docscrub.hpp"

#include "../include/event_bus.hpp"
#include "../include/events.hpp"
#include "../include/log_sink.hpp"
#include "../include/logger.hpp"
#include "../include/processor_executor.hpp"
#include "../include/processor_registry.hpp"

#include <atomic>

namespace docscrub {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    DocScrubObserver* observer_;
public:
    explicit BridgeLogSink(DocScrubObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct DocScrub::Impl {
    std::unique_ptr<ProcessorRegistry> registry = std::make_unique<ProcessorRegistry>();
    SanitizeOptions options;
    std::filesystem::path outputPath;

    DocScrubObserver* observer = nullptr;
    std::atomic<ProcessorExecutor*> currentExecutor = nullptr;

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;
        DocScrubObserver* obs = observer;

        bus.subscribe<DocumentStartEvent>([obs](const DocumentStartEvent& e) {
            obs->onDocumentStart(e.path, e.index, e.total);
        });

        bus.subscribe<DocumentProgressEvent>([obs](const DocumentProgressEvent& e) {
            obs->onProgress(e.path, e.current, e.total, e.description);
        });

        bus.subscribe<DocumentCompleteEvent>([obs](const DocumentCompleteEvent& e) {
            obs->onDocumentFinish(e.path, e.result);
        });

        bus.subscribe<DocumentErrorEvent>([obs](const DocumentErrorEvent& e) {
            obs->onDocumentError(e.path, e.kind, e.error_message);
        });
    }
};

DocScrub::DocScrub() : impl_(std::make_unique<Impl>()) {}

DocScrub::~DocScrub() {
    if (impl_) stop();
}

DocScrub::DocScrub(DocScrub&&) noexcept = default;
DocScrub& DocScrub::operator=(DocScrub&&) noexcept = default;

DocScrub& DocScrub::mode(const RunMode m) {
    impl_->options.mode = m;
    return *this;
}

DocScrub& DocScrub::targets(const TargetSet t) {
    impl_->options.targets = t;
    return *this;
}

DocScrub& DocScrub::keywords(std::vector<std::string> kws) {
    impl_->options.keywords = std::move(kws);
    return *this;
}

DocScrub& DocScrub::addKeyword(const std::string& kw) {
    impl_->options.keywords.push_back(kw);
    return *this;
}

DocScrub& DocScrub::rotationThreshold(const double val) {
    impl_->options.rotation_threshold = val;
    return *this;
}

DocScrub& DocScrub::angleRange(const double min_deg, const double max_deg) {
    impl_->options.angle_min = min_deg;
    impl_->options.angle_max = max_deg;
    return *this;
}

DocScrub& DocScrub::namePatterns(std::vector<std::string> patterns) {
    impl_->options.name_patterns = std::move(patterns);
    return *this;
}

DocScrub& DocScrub::detectWordArt(const bool val) {
    impl_->options.detect_wordart = val;
    return *this;
}

DocScrub& DocScrub::alphaThreshold(const int val) {
    impl_->options.alpha_threshold = val;
    return *this;
}

DocScrub& DocScrub::outputSuffix(const std::string& suffix) {
    impl_->options.output_suffix = suffix;
    return *this;
}

DocScrub& DocScrub::outputPath(const std::filesystem::path& path) {
    impl_->outputPath = path;
    return *this;
}

DocScrub& DocScrub::legacyTimeout(const std::chrono::seconds timeout) {
    impl_->options.legacy_timeout = timeout;
    return *this;
}

DocScrub& DocScrub::legacyConverter(std::unique_ptr<ILegacyConverter> converter) {
    impl_->registry = std::make_unique<ProcessorRegistry>(std::move(converter));
    return *this;
}

const SanitizeOptions& DocScrub::options() const {
    return impl_->options;
}

void DocScrub::setObserver(DocScrubObserver* observer) {
    impl_->observer = observer;
}

std::vector<ProcessResult> DocScrub::sanitize(const std::vector<std::filesystem::path>& paths) {
    // a fresh bus per run so observers are never subscribed twice
    EventBus bus;
    impl_->setupEventBridging(bus);

    // bridge sink lives for the duration of this call only
    const ILogSink* bridge = nullptr;
    if (impl_->observer) {
        auto sink = std::make_unique<BridgeLogSink>(impl_->observer);
        bridge = sink.get();
        Logger::add_sink(std::move(sink));
    }

    ProcessorExecutor executor(*impl_->registry, impl_->options, impl_->outputPath, bus);

    impl_->currentExecutor.store(&executor);
    std::vector<ProcessResult> results;
    try {
        results = executor.process(paths);
    } catch (const std::exception&) {
        impl_->currentExecutor.store(nullptr);
        Logger::remove_sink(bridge);
        throw;
    }
    impl_->currentExecutor.store(nullptr);
    Logger::remove_sink(bridge);
    return results;
}

std::vector<ProcessResult> DocScrub::sanitize(const std::filesystem::path& path) {
    return sanitize(std::vector<std::filesystem::path>{path});
}

std::vector<ProcessResult> DocScrub::sanitize(const std::vector<std::string>& paths) {
    std::vector<std::filesystem::path> fs_paths;
    fs_paths.reserve(paths.size());
    for (const auto& p : paths) {
        fs_paths.emplace_back(p);
    }
    return sanitize(fs_paths);
}

void DocScrub::stop() {
    auto* exec = impl_->currentExecutor.load();
    if (exec) {
        exec->request_stop();
    }
}

} // namespace docscrub
