#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <map>
#include <thread>

namespace {

void add_input(CLI::App& sub, Settings& settings) {
    sub.add_option("input", settings.input, "PDF document.")
        ->required()
        ->check(CLI::ExistingFile);
}

void add_extraction_options(CLI::App& sub, Settings& settings) {
    sub.add_option("--fallback-title", settings.fallback_title,
                   "Title of the single chapter used when the document has no bookmarks.");

    sub.add_option("--numbering", settings.numbering, "Section numbering: 'dotted' (default) or 'sibling'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, tocsplit::NumberingStyle>{
                {"dotted", tocsplit::NumberingStyle::Dotted},
                {"sibling", tocsplit::NumberingStyle::SiblingOnly}
            }, CLI::ignore_case));
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
        ->default_val("ERROR")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: tocsplit.log).");

    // --- info ---
    auto* info = app.add_subcommand("info", "Print document metadata and page count.");
    add_input(*info, settings);
    info->callback([&settings] { settings.command = Command::Info; });

    // --- toc ---
    auto* toc = app.add_subcommand("toc", "Extract the table of contents as JSON.");
    add_input(*toc, settings);
    add_extraction_options(*toc, settings);
    toc->add_option("-o,--output", settings.output_path,
                    "Write the TOC to PATH instead of standard output.");
    toc->callback([&settings] { settings.command = Command::Toc; });

    // --- split ---
    auto* split = app.add_subcommand("split", "Split the document into one PDF per TOC section.");
    add_input(*split, settings);
    add_extraction_options(*split, settings);

    split->add_option("--toc", settings.toc_path,
                      "Edited TOC (JSON) to split along instead of the document's bookmarks.")
        ->check(CLI::ExistingFile);

    split->add_option("--content-start", settings.content_start,
                      "PDF page on which page 1 of the --toc page numbers falls.")
        ->check(CLI::PositiveNumber);

    split->add_option("-o,--output", settings.output_path,
                      "Work directory receiving the job output (default: current directory).");

    split->add_option("--format", settings.archive_format, "Archive format: zip (default) or tar.gz.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, tocsplit::ArchiveFormat>{
                {"zip", tocsplit::ArchiveFormat::Zip},
                {"tar.gz", tocsplit::ArchiveFormat::TarGz},
                {"tgz", tocsplit::ArchiveFormat::TarGz}
            }, CLI::ignore_case));

    split->add_flag("--no-archive", settings.no_archive,
                    "Leave the output as a directory tree instead of an archive.");

    split->add_option("--report", settings.report_path,
                      "CSV manifest export filename.")
        ->take_last(); // if used multiple times, take the last one

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    split->add_option("--threads", settings.num_threads,
                      "Jobs allowed to run at the same time.")
        ->default_val(settings.num_threads)
        ->check(CLI::PositiveNumber);

    split->callback([&settings, split] {
        settings.command = Command::Split;
        if (settings.content_start && settings.toc_path.empty()) {
            throw CLI::ValidationError("--content-start requires --toc.");
        }
        if (settings.no_archive && split->count("--format") > 0) {
            throw CLI::ValidationError("--no-archive and --format cannot be used together.");
        }
    });
}
