//
// cli_parser.hpp
//

#ifndef DOCSCRUB_CLI_PARSER_HPP
#define DOCSCRUB_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libdocscrub/include/sanitize_options.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool scan = false;
    bool quiet = false;
    bool no_wordart = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    // detection
    std::vector<std::string> keywords;
    std::vector<std::string> name_patterns;
    double angle_min = 5.0;
    double angle_max = 85.0;
    double rotation_threshold = 0.1;
    int alpha_threshold = 80000;
    docscrub::TargetSet targets = docscrub::TargetSet::All;
    std::string suffix = "_sanitized";
    unsigned legacy_timeout = 60;

    std::vector<std::filesystem::path> inputs;

    /**
     * @brief Engine configuration for these settings. Name patterns fall
     * back to the built-in defaults when none were given.
     */
    [[nodiscard]] docscrub::SanitizeOptions to_options() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //DOCSCRUB_CLI_PARSER_HPP
