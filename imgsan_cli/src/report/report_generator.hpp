#ifndef IMGSAN_REPORT_GENERATOR_HPP
#define IMGSAN_REPORT_GENERATOR_HPP

#include "../../../libimgsan/include/report.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Prints one row per file followed by the run summary (stderr).
 */
void print_console_report(const imgsan::Report& report);

/**
 * @brief Writes the report as CSV: one row per file, then the summary.
 * @return false if the file could not be written.
 */
bool export_csv_report(const imgsan::Report& report, const std::filesystem::path& output_path);

/**
 * @brief Formats the findings of a file as "tag=category/sensitivity; ...".
 */
std::string format_findings(const imgsan::FileResult& result);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif // IMGSAN_REPORT_GENERATOR_HPP
