#include <algorithm>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "toc_json.hpp"
#include "tocsplit.hpp"

using namespace tocsplit;
namespace fs = std::filesystem;

// simple progress bar printer
inline void print_progress_bar(const int percent, const size_t sections, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const int clamped = std::clamp(percent, 0, 100);
    const unsigned pos = bar_width * static_cast<unsigned>(clamped) / 100u;

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && clamped < 100) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(3) << clamped << "%"
              << " (" << sections << " files)"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII titles may be problematic.",
                "LocaleInit");
}

// drives the progress bar from engine worker threads
class ProgressObserver final : public TocsplitObserver {
public:
    explicit ProgressObserver(const bool quiet) : quiet_(quiet) {}

    void onJobProgress(const std::string&, const int progress) override {
        std::lock_guard lock(mtx_);
        last_progress_ = progress;
        draw();
    }

    void onSectionWritten(const std::string&, const fs::path&, int, int) override {
        std::lock_guard lock(mtx_);
        ++sections_;
    }

    void onJobCompleted(const std::string&, const fs::path& output_path) override {
        std::lock_guard lock(mtx_);
        if (!quiet_) {
            std::cerr << GREEN << "\n[DONE] " << output_path.string() << RESET << std::endl;
        }
    }

    void onJobFailed(const std::string&, const std::string& error) override {
        std::lock_guard lock(mtx_);
        std::cerr << RED << "\n[FAILED] " << error << RESET << std::endl;
    }

private:
    void draw() const {
        if (quiet_) return;
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        print_progress_bar(last_progress_, sections_, elapsed);
    }

    const bool quiet_;
    const std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
    std::mutex mtx_;
    int last_progress_ = 0;
    size_t sections_ = 0;
};

static void configure_extraction(Tocsplit& api, const Settings& settings) {
    api.numbering(settings.numbering);
    if (!settings.fallback_title.empty()) {
        api.fallbackTitle(settings.fallback_title);
    }
}

static int run_info(const Settings& settings) {
    const Tocsplit api;
    const DocumentInfo info = api.document_info(settings.input);

    auto row = [](const std::string& key, const std::string& value) {
        if (!value.empty()) {
            std::cout << std::left << std::setw(18) << key << value << "\n";
        }
    };
    row("File:", info.source_name);
    row("Title:", info.title);
    row("Author:", info.author);
    row("Subject:", info.subject);
    row("Keywords:", info.keywords);
    row("Creator:", info.creator);
    row("Producer:", info.producer);
    row("Created:", info.creation_date);
    row("Modified:", info.modification_date);
    row("PDF version:", info.pdf_version);
    row("Pages:", std::to_string(info.page_count));
    row("Size (bytes):", std::to_string(info.file_size));
    row("Encrypted:", info.encrypted ? "yes" : "no");

    auto allowed = [](const bool flag) { return flag ? "allowed" : "denied"; };
    row("Print:", allowed(info.permissions.print));
    row("Copy:", allowed(info.permissions.copy));
    row("Modify:", allowed(info.permissions.modify));
    row("Annotate:", allowed(info.permissions.annotate));
    return 0;
}

static int run_toc(const Settings& settings) {
    Tocsplit api;
    configure_extraction(api, settings);
    const TocTree tree = api.extract_toc(settings.input);

    if (settings.output_path.empty()) {
        std::cout << toc_to_json(tree).dump(2) << std::endl;
    } else {
        save_toc_file(tree, settings.output_path);
        if (!settings.quiet) {
            std::cerr << GREEN << "TOC with " << count_nodes(tree) << " sections written to "
                      << settings.output_path.string() << RESET << std::endl;
        }
    }
    return 0;
}

static int run_split(const Settings& settings) {
    // outlives api, which may still log through it while shutting down
    ProgressObserver observer(settings.quiet);

    Tocsplit api;
    configure_extraction(api, settings);
    api.workDirectory(settings.output_path.empty() ? fs::current_path() : settings.output_path)
       .threads(settings.num_threads)
       .archive(!settings.no_archive)
       .archiveFormat(settings.archive_format);

    api.setObserver(&observer);

    std::optional<TocTree> toc;
    if (!settings.toc_path.empty()) {
        toc = load_toc_file(settings.toc_path);
        if (settings.content_start) {
            toc->content_start_page = *settings.content_start;
        }
    }

    const auto start_total = std::chrono::steady_clock::now();
    const std::string job_id = api.submit_split(settings.input, toc);
    Logger::log(LogLevel::Info, "Submitted job " + job_id, "main");
    api.wait_idle();
    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    const SplitJob job = api.poll_job(job_id);
    api.setObserver(nullptr);

    if (!settings.quiet) {
        print_console_report(job, settings.num_threads, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(job, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
    }

    return job.status == JobStatus::Completed ? 0 : 1;
}

int main(int argc, char* argv[]) {

    CLI::App app{"tocsplit: split PDF documents along their table of contents."};
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

    // set file logger
    Logger::clear_sinks();
    auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
    if (!fileSink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(fileSink));

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    try {
        switch (settings.command) {
            case Command::Info: return run_info(settings);
            case Command::Toc: return run_toc(settings);
            case Command::Split: return run_split(settings);
        }
    } catch (const TocsplitError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << RED << "Unexpected error: " << e.what() << RESET << std::endl;
        return 2;
    }
    return 0;
}
