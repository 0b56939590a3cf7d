//
// main.cpp
//

#include <algorithm>
#include <cctype>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libdocscrub/include/event_bus.hpp"
#include "../../libdocscrub/include/events.hpp"
#include "../../libdocscrub/include/logger.hpp"
#include "../../libdocscrub/include/mime_detector.hpp"
#include "../../libdocscrub/include/processor_executor.hpp"
#include "../../libdocscrub/include/processor_registry.hpp"

// per-page progress bar for the document being processed
inline void print_progress_bar(const std::string& name, const size_t done, const size_t total) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const auto pos = static_cast<unsigned>(bar_width * progress);

    std::string shown = name;
    if (shown.size() > 24) {
        shown = shown.substr(0, 21) + "...";
    }

    std::cerr << "\r" << std::left << std::setw(25) << shown << "[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::right << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << ")"
              << std::flush;
}

using namespace docscrub;
namespace fs = std::filesystem;

static volatile std::sig_atomic_t interrupted = 0;
static ProcessorExecutor* g_executor = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_executor) {
            g_executor->request_stop();
        }
        interrupted = 1;
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}


int main(int argc, char* argv[]) {

    CLI::App app{"docscrub: removes edit protection and watermarks from OOXML and PDF documents."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (settings.log_level != "NONE" && settings.log_level != "none") {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        std::string level = settings.log_level;
        std::ranges::transform(level, level.begin(), ::toupper);
        consoleSink->log_level = Logger::string_to_level(level);
        Logger::add_sink(std::move(consoleSink));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    init_utf8_locale();

    const SanitizeOptions options = settings.to_options();

    // registry of processors and event bus
    ProcessorRegistry registry;
    EventBus bus;

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings, registry);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No supported documents found.", "main");
        std::cerr << RED << "No supported documents found." << RESET << std::endl;
        return 1;
    }

    // results collected for reporting
    std::vector<Result> results;
    std::map<fs::path, std::chrono::steady_clock::time_point> started;
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<DocumentStartEvent>([&](const DocumentStartEvent& e) {
        started[e.path] = std::chrono::steady_clock::now();
        if (!settings.quiet) {
            std::cerr << "[" << e.index << "/" << e.total << "] " << e.path.filename().string() << std::endl;
        }
    });

    bus.subscribe<DocumentProgressEvent>([&](const DocumentProgressEvent& e) {
        if (!settings.quiet) {
            print_progress_bar(e.path.filename().string(), e.current, e.total);
        }
    });

    bus.subscribe<DocumentCompleteEvent>([&](const DocumentCompleteEvent& e) {
        const auto& res = e.result;
        if (!settings.quiet) {
            std::cerr
                << (res.removed_count ? GREEN : YELLOW)
                << "\n[DONE] " << e.path.filename().string() << ": " << res.message
                << (res.output_path ? " -> " + res.output_path->string() : std::string())
                << RESET << std::endl;
        }
        Result r;
        r.path = e.path;
        r.kind = MimeDetector::detect(e.path);
        r.success = true;
        r.removed = res.removed_count;
        r.pages = res.page_count;
        r.scanned = res.scanned_count;
        r.labels = res.detected_patterns;
        r.output = res.output_path;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
    });

    bus.subscribe<DocumentErrorEvent>([&](const DocumentErrorEvent& e) {
        if (!settings.quiet) {
            std::cerr << RED << "\n[FAIL] " << e.path.filename().string() << ": "
                      << error_kind_to_string(e.kind) << ": " << e.error_message
                      << RESET << std::endl;
        }
        Result r;
        r.path = e.path;
        r.kind = MimeDetector::detect(e.path);
        r.success = false;
        r.error_kind = error_kind_to_string(e.kind);
        r.error_msg = e.error_message;
        if (const auto it = started.find(e.path); it != started.end()) {
            r.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - it->second).count();
        }
        results.push_back(std::move(r));
    });

    bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent& e) {
        Result r;
        r.path = e.path;
        r.skipped = true;
        r.error_msg = e.reason;
        results.push_back(std::move(r));
    });

    // build executor
    ProcessorExecutor executor(registry, options, settings.output_path, bus);
    g_executor = &executor;
    // run processing
    const auto processed = executor.process(inputs);
    g_executor = nullptr;

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (interrupted) {
        std::cerr << CYAN << "\n[INTERRUPT] Stopped after the current document." << RESET << std::endl;
    }

    if (!settings.quiet) {
        print_console_report(results, total_seconds, options.mode);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, options.mode)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
            std::cerr << RED << "Cannot write report: " << settings.report_path.string() << RESET << std::endl;
        }
    }

    if (interrupted) {
        return 130; // standard exit code for SIGINT
    }
    const bool all_ok = processed.size() == inputs.size() &&
                        std::ranges::all_of(processed, [](const ProcessResult& r) { return r.success; });
    return all_ok ? 0 : 1;
}
