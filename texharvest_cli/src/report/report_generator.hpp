#ifndef TEXHARVEST_REPORT_GENERATOR_HPP
#define TEXHARVEST_REPORT_GENERATOR_HPP

#include "../../../libtexharvest/include/pipeline.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Prints a per-item table and totals to stderr.
 */
void print_console_report(const std::vector<texharvest::ProcessingResult>& results,
                          const texharvest::OrchestratorStatus& status,
                          double total_seconds);

/**
 * @brief Writes one CSV row per item.
 * @return false if @p output_path can't be written.
 */
bool export_csv_report(const std::vector<texharvest::ProcessingResult>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

/**
 * @brief Serialises results (and optionally the run status) as JSON.
 */
std::string results_to_json(const std::vector<texharvest::ProcessingResult>& results,
                            const texharvest::OrchestratorStatus* status);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif // TEXHARVEST_REPORT_GENERATOR_HPP
