//
// cli_parser.cpp
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <map>

docscrub::SanitizeOptions Settings::to_options() const {
    docscrub::SanitizeOptions opts;
    opts.mode = scan ? docscrub::RunMode::Scan : docscrub::RunMode::Apply;
    opts.targets = targets;
    opts.keywords = keywords;
    opts.rotation_threshold = rotation_threshold;
    opts.angle_min = angle_min;
    opts.angle_max = angle_max;
    if (!name_patterns.empty()) {
        opts.name_patterns = name_patterns;
    }
    opts.detect_wordart = !no_wordart;
    opts.alpha_threshold = alpha_threshold;
    opts.output_suffix = suffix;
    opts.legacy_timeout = std::chrono::seconds(legacy_timeout);
    return opts;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("--scan", settings.scan,
                 "Report artifacts without writing any output.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, results).");

    app.add_flag("--no-wordart", settings.no_wordart,
                 "Do not treat transparent WordArt as a watermark.");

    // --- Output ---
    app.add_option("-o,--output", settings.output_path,
                   "Write the sanitized document to PATH (single input only).");

    app.add_option("--suffix", settings.suffix,
                   "Suffix inserted before the extension of derived output names.")
                   ->default_val("_sanitized")
                   ->check([](const std::string& s) {
                       return s.empty() ? std::string("Suffix must not be empty.") : std::string();
                   });

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Detection ---
    app.add_option("-k,--keyword", settings.keywords,
                   "Text that marks a PDF text block as watermark. (Can be used multiple times).");

    app.add_option("--name-pattern", settings.name_patterns,
                   "Shape-name substring that marks a slide shape as watermark.\n"
                   "(Can be used multiple times; replaces the defaults).");

    app.add_option("--angle-min", settings.angle_min,
                   "Lower bound of the watermark rotation band, degrees.")
                   ->default_val(5.0)
                   ->check(CLI::Range(0.0, 90.0));

    app.add_option("--angle-max", settings.angle_max,
                   "Upper bound of the watermark rotation band, degrees.")
                   ->default_val(85.0)
                   ->check(CLI::Range(0.0, 90.0));

    app.add_option("--rotation-threshold", settings.rotation_threshold,
                   "Minimum |b| or |c| of a text matrix to consider it rotated.")
                   ->default_val(0.1)
                   ->check(CLI::NonNegativeNumber);

    app.add_option("--alpha", settings.alpha_threshold,
                   "WordArt alpha (0-100000) below which it counts as transparent.")
                   ->default_val(80000)
                   ->check(CLI::Range(0, 100000));

    app.add_option("--targets", settings.targets, "Artifacts to remove: 'protection', 'watermark' or 'all'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, docscrub::TargetSet>{
                {"protection", docscrub::TargetSet::Protection},
                {"watermark", docscrub::TargetSet::Watermark},
                {"all", docscrub::TargetSet::All}
            }, CLI::ignore_case));

    app.add_option("--legacy-timeout", settings.legacy_timeout,
                   "Seconds to wait for the .doc/.xls/.ppt converter.")
                   ->default_val(60)
                   ->check(CLI::PositiveNumber);

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Input selection ---
    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more documents or directories")
        ->required()
        ->check([](const std::string& str) {
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.angle_min > settings.angle_max) {
            throw CLI::ValidationError("--angle-min must not exceed --angle-max.");
        }

        if (settings.scan && !settings.output_path.empty()) {
            throw CLI::ValidationError("--scan and -o, --output cannot be used together.");
        }

        if (!settings.output_path.empty() &&
            (settings.inputs.size() > 1 || std::filesystem::is_directory(settings.inputs.front()))) {
            throw CLI::ValidationError("Option '-o, --output' requires a single input file.");
        }
    });
}
