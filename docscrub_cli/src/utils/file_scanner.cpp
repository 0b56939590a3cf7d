//
// file_scanner.cpp
//

#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libdocscrub/include/logger.hpp"
#include "../../../libdocscrub/include/processor_registry.hpp"
#include "../../../libdocscrub/include/text_utils.hpp"
#include <algorithm>
#include <regex>

namespace fs = std::filesystem;

namespace {

bool is_junk(const fs::path& p) {
    const auto name = docscrub::ascii_lower(p.filename().string());
    // "~$report.docx" is an office lock file, "._x" is macOS resource fork
    return name.starts_with("._") || name.starts_with("~$") ||
           name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();

    for (const auto& pattern : settings.exclude_patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, "Invalid exclude regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }

    if (!settings.include_patterns.empty()) {
        for (const auto& pattern : settings.include_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return false;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid include regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return true;
    }

    return false;
}

bool is_previous_output(const fs::path& p, const std::string& suffix) {
    return !suffix.empty() && p.stem().string().ends_with(suffix);
}

bool is_candidate(const fs::path& p,
                  const Settings& settings,
                  const docscrub::ProcessorRegistry& registry) {
    if (is_junk(p) || is_filtered(p, settings) || is_previous_output(p, settings.suffix)) {
        return false;
    }
    return !registry.find_by_extension(p.extension().string()).empty();
}

template <typename Iterator>
void walk(const fs::path& dir,
          const Settings& settings,
          const docscrub::ProcessorRegistry& registry,
          std::vector<fs::path>& result) {
    std::error_code ec;
    for (Iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Cannot read " + dir.string() + ": " + ec.message(), "scanner");
            break;
        }
        if (it->is_regular_file(ec) && is_candidate(it->path(), settings, registry)) {
            result.push_back(it->path());
        }
    }
}

} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings,
                    const docscrub::ProcessorRegistry& registry) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        if (!fs::exists(in)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in)) {
            if (settings.recursive) {
                walk<fs::recursive_directory_iterator>(in, settings, registry, result);
            } else {
                walk<fs::directory_iterator>(in, settings, registry, result);
            }
        } else if (!is_junk(in) && !is_filtered(in, settings)) {
            result.push_back(in);
        }
    }

    std::ranges::sort(result);
    const auto dup = std::ranges::unique(result);
    result.erase(dup.begin(), dup.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
