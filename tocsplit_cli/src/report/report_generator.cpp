#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
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

static std::string page_range(const tocsplit::SplitOutput& o) {
    return std::to_string(o.start_page) + "-" + std::to_string(o.end_page);
}

void print_console_report(const tocsplit::SplitJob& job,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_number = 8;
    size_t max_pages = 8;
    size_t max_title = 10;
    for (const auto& o : job.outputs) {
        max_number = std::max(max_number, o.number.size() + 2);
        max_pages  = std::max(max_pages, page_range(o).size() + 2);
        max_title  = std::min<size_t>(std::max(max_title, o.title.size() + 2), 40);
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(max_number + max_pages + max_title);
    const unsigned file_col_width = term_width > fixed_cols_width + 10
                                ? term_width - fixed_cols_width
                                : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(max_number)) << "Section"
              << std::setw(static_cast<int>(max_title)) << "Title"
              << std::setw(static_cast<int>(max_pages)) << "Pages"
              << "File"
              << "\n";

    int total_pages = 0;
    for (const auto& o : job.outputs) {
        std::string indent(o.depth * 2, ' ');
        std::cerr << std::left << std::setw(static_cast<int>(max_number)) << o.number
                  << std::setw(static_cast<int>(max_title)) << truncate(indent + o.title, max_title - 1)
                  << std::setw(static_cast<int>(max_pages)) << page_range(o)
                  << truncate(o.relative_path.generic_string(), file_col_width)
                  << "\n";
        if (!o.whole_chapter) {
            total_pages += o.page_span();
        }
    }

    std::string outcome;
    switch (job.status) {
        case tocsplit::JobStatus::Completed:
            outcome = use_colors ? "\033[1;32mOK\033[0m" : "OK";
            break;
        case tocsplit::JobStatus::Failed:
            outcome = use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
            break;
        default:
            outcome = tocsplit::job_status_to_string(job.status);
            break;
    }

    std::cerr << "\nJob " << job.id << ": " << outcome;
    if (job.error) {
        std::cerr << " (" << *job.error << ")";
    }
    std::cerr << "\nFiles written: " << job.outputs.size()
              << "\nPages in leaf sections: " << total_pages << "\n";
    if (job.output_path) {
        std::cerr << "Output: " << job.output_path->string() << "\n";
    } else if (job.output_root) {
        std::cerr << "Unarchived output: " << job.output_root->string() << "\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const tocsplit::SplitJob& job,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Section,Title,Depth,Start page,End page,Pages,Whole chapter,File\n";

    for (const auto& o : job.outputs) {
        out << csv_escape(o.number) << ","
            << csv_escape(o.title) << ","
            << o.depth << ","
            << o.start_page << ","
            << o.end_page << ","
            << o.page_span() << ","
            << (o.whole_chapter ? "yes" : "no") << ","
            << csv_escape(o.relative_path.generic_string()) << "\n";
    }

    out << "\n\nJob,Document,Status,Output,Error,Total time (s)\n";
    out << csv_escape(job.id) << ","
        << csv_escape(job.document_name) << ","
        << tocsplit::job_status_to_string(job.status) << ","
        << csv_escape(job.output_path ? job.output_path->string() : "") << ","
        << csv_escape(job.error.value_or("")) << ",";
    std::ostringstream osstime;
    osstime << std::fixed << std::setprecision(2) << total_seconds;
    out << osstime.str() << "\n";

    return static_cast<bool>(out);
}
