#ifndef TOCSPLIT_REPORT_GENERATOR_HPP
#define TOCSPLIT_REPORT_GENERATOR_HPP

#include "split_job.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Prints the sections written by a job as a table on stderr.
 */
void print_console_report(const tocsplit::SplitJob& job,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes one CSV row per section written by a job.
 * @return false if the file could not be written.
 */
bool export_csv_report(const tocsplit::SplitJob& job,
                       const std::filesystem::path& output_path,
                       double total_seconds);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif // TOCSPLIT_REPORT_GENERATOR_HPP
