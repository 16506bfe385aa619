#ifndef TEXHARVEST_CLI_PARSER_HPP
#define TEXHARVEST_CLI_PARSER_HPP

#include "../../../libtexharvest/include/pipeline_config.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::vector<std::string> ids;
    std::filesystem::path ids_file;

    bool include_pdf = false;
    bool json = false;
    bool quiet = false;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    // durations are taken as plain numbers and converted in the callback
    unsigned download_timeout_s = 60;
    unsigned compilation_timeout_s = 300;
    unsigned retry_delay_ms = 1000;
    bool no_sandbox = false;
    bool no_read_pdf = false;

    texharvest::PipelineConfig pipeline;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * Every pipeline option can also come from a TEXHARVEST_* environment
 * variable or from the file given with --config. The parse callback fills
 * settings.pipeline and validates it.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // TEXHARVEST_CLI_PARSER_HPP
