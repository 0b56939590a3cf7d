//
// report_generator.hpp
//

#ifndef DOCSCRUB_REPORT_GENERATOR_HPP
#define DOCSCRUB_REPORT_GENERATOR_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../../../libdocscrub/include/sanitize_options.hpp"

struct Result {
    std::filesystem::path path;         // input document
    std::string kind;                   // detected MIME type
    bool success{};                     // document processed without error
    bool skipped{};                     // never started (interrupted)
    std::size_t removed{};              // artifacts removed, or that would be in scan mode
    std::size_t pages{};                // pages or slides visited
    std::size_t scanned{};              // text blocks or shapes inspected
    std::set<std::string> labels;       // distinct artifact labels
    std::optional<std::filesystem::path> output; // written file
    double seconds{};                   // processing time
    std::string error_kind;             // if !success, typed reason
    std::string error_msg;              // if !success, reason of failure
};

void print_console_report(const std::vector<Result>& results,
                          double total_seconds,
                          docscrub::RunMode mode);

/**
 * @brief Writes one CSV row per document.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       docscrub::RunMode mode);

unsigned get_terminal_width();

#endif //DOCSCRUB_REPORT_GENERATOR_HPP
