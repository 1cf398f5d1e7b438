#ifndef TOCSPLIT_CLI_PARSER_HPP
#define TOCSPLIT_CLI_PARSER_HPP

#include "archiver.hpp"
#include "toc.hpp"
#include <filesystem>
#include <optional>
#include <string>

// forward declaration
namespace CLI { class App; }

enum class Command {
    Info,
    Toc,
    Split
};

struct Settings {
    Command command = Command::Split;

    bool quiet = false;
    bool no_archive = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file = "tocsplit.log";

    std::filesystem::path input;
    std::filesystem::path toc_path;      ///< split: edited TOC to use instead of the bookmarks
    std::optional<int> content_start;    ///< split: overrides content_start_page of --toc
    std::filesystem::path output_path;   ///< toc: JSON file; split: work directory
    std::filesystem::path report_path;   ///< split: CSV manifest
    std::string fallback_title;

    tocsplit::ArchiveFormat archive_format = tocsplit::ArchiveFormat::Zip;
    tocsplit::NumberingStyle numbering = tocsplit::NumberingStyle::Dotted;
};

/**
 * @brief Configures the CLI11 parser with the info, toc and split subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // TOCSPLIT_CLI_PARSER_HPP
