//
// file_scanner.hpp
//

#ifndef DOCSCRUB_FILE_SCANNER_HPP
#define DOCSCRUB_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

struct Settings;

namespace docscrub { class ProcessorRegistry; }

/**
 * @brief Expands the command-line inputs into the list of documents to process.
 *
 * Files named explicitly are always kept (unless junk or filtered), so an
 * unsupported one is reported by the engine. Files found inside a
 * directory are kept only if a registered processor claims their
 * extension, and outputs of earlier runs (stem ending with the output
 * suffix) are skipped. The result is sorted and free of duplicates.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings,
                    const docscrub::ProcessorRegistry& registry);

#endif //DOCSCRUB_FILE_SCANNER_HPP
