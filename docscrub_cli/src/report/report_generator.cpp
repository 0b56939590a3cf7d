//
// report_generator.cpp
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string join_labels(const std::set<std::string>& labels, const std::string_view sep) {
    std::string out;
    for (const auto& l : labels) {
        if (!out.empty()) out += sep;
        out += l;
    }
    return out;
}

std::string outcome_of(const Result& r, const docscrub::RunMode mode) {
    if (r.skipped) return "SKIPPED";
    if (!r.success) return "FAIL";
    if (r.removed == 0) return "OK (clean)";
    return mode == docscrub::RunMode::Scan ? "OK (found)" : "OK (removed)";
}

const char* outcome_color(const Result& r) {
    if (r.skipped) return CYAN;
    if (!r.success) return RED;
    return r.removed == 0 ? YELLOW : GREEN;
}

} // namespace

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

void print_console_report(const std::vector<Result>& results,
                          const double total_seconds,
                          const docscrub::RunMode mode) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_kind = 12;
    size_t max_removed = 9;
    size_t max_pages = 7;
    size_t max_time = 9;
    size_t max_result = 14;
    size_t max_error = 6;
    #ifdef max
    #undef max
    #endif
    for (const auto& r : results) {
        max_kind    = std::max(max_kind,    r.kind.size() + 2);
        max_removed = std::max(max_removed, std::to_string(r.removed).size() + 2);
        max_pages   = std::max(max_pages,   std::to_string(r.pages).size() + 2);
        max_time    = std::max(max_time,    std::format("{:.2f}", r.seconds).size() + 2);
        max_result  = std::max(max_result,  outcome_of(r, mode).size() + 2);
        max_error   = std::max(max_error,   r.error_kind.size() + 2);
    }

    const size_t fixed_cols_width = max_kind + max_removed + max_pages + max_time + max_result + max_error;
    const size_t file_col_width = term_width > fixed_cols_width + 10
                                      ? term_width - fixed_cols_width
                                      : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len > 4 ? max_len - 4 : 0) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_kind))    << "Kind"
              << std::setw(static_cast<int>(max_removed)) << "Removed"
              << std::setw(static_cast<int>(max_pages))   << "Pages"
              << std::setw(static_cast<int>(max_time))    << "Time(s)"
              << std::setw(static_cast<int>(max_result))  << "Result"
              << "Error"
              << "\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    size_t total_removed = 0;
    size_t failures = 0;
    for (const auto& r : sorted) {
        total_removed += r.removed;
        if (!r.success && !r.skipped) ++failures;

        const std::string outcome = outcome_of(r, mode);
        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(static_cast<int>(max_kind))    << r.kind
                  << std::setw(static_cast<int>(max_removed)) << r.removed
                  << std::setw(static_cast<int>(max_pages))   << r.pages
                  << std::setw(static_cast<int>(max_time))    << std::format("{:.2f}", r.seconds);
        if (use_colors) {
            std::cerr << outcome_color(r) << std::setw(static_cast<int>(max_result)) << outcome << RESET;
        } else {
            std::cerr << std::setw(static_cast<int>(max_result)) << outcome;
        }
        std::cerr << r.error_kind << "\n";

        if (!r.labels.empty()) {
            std::cerr << "    Found: " << join_labels(r.labels, "; ") << "\n";
        }
        if (!r.success && !r.error_msg.empty()) {
            std::cerr << "    " << r.error_msg << "\n";
        }
    }

    std::cerr << "\nDocuments: " << results.size()
              << " (" << failures << " failed)\n";
    std::cerr << (mode == docscrub::RunMode::Scan ? "Artifacts found: " : "Artifacts removed: ")
              << total_removed << "\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const docscrub::RunMode mode) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Kind,Mode,Result,Removed,Pages,Scanned,Labels,Output,Time(s),ErrorKind,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.kind) << ","
            << docscrub::run_mode_to_string(mode) << ","
            << outcome_of(r, mode) << ","
            << r.removed << ","
            << r.pages << ","
            << r.scanned << ","
            << csv_escape(join_labels(r.labels, ";")) << ","
            << csv_escape(r.output ? r.output->string() : std::string()) << ","
            << std::format("{:.3f}", r.seconds) << ","
            << r.error_kind << ","
            << csv_escape(r.error_msg) << "\n";
    }
    out.close();
    return static_cast<bool>(out);
}
