/**
 * @file pipeline_config.hpp
 * @brief Tunables for the processing pipeline.
 */

#ifndef TEXHARVEST_PIPELINE_CONFIG_HPP
#define TEXHARVEST_PIPELINE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace texharvest {

/**
 * @brief All settings consumed by PipelineOrchestrator and its stages.
 *
 * @details Defaults match the production deployment. The CLI maps every
 * field to an option (with a TEXHARVEST_* environment variable and config
 * file key); library users fill the struct directly.
 */
struct PipelineConfig {
    // --- concurrency budget ---
    unsigned max_downloads = 5;      ///< Concurrent downloads
    unsigned max_extractions = 3;    ///< Concurrent archive extractions
    unsigned max_compilations = 2;   ///< Concurrent typesetter runs
    unsigned scheduler_threads = 0;  ///< Item tasks in flight; 0 = sum of the three bounds
    unsigned worker_threads = 0;     ///< Blocking-stage workers; 0 = extractions + compilations

    // --- rate limiting ---
    double requests_per_second = 2.0;
    unsigned burst_size = 5;         ///< Downloader's own concurrency bound

    // --- timeouts ---
    std::chrono::seconds download_timeout{60};
    std::chrono::seconds compilation_timeout{300}; ///< Per typesetter pass

    // --- download retry (orchestrator only) ---
    unsigned download_retries = 0;
    std::chrono::milliseconds retry_delay{1000};
    double retry_backoff = 2.0;

    // --- limits ---
    size_t max_files_per_archive = 1000;
    size_t max_archive_size = 100u * 1024u * 1024u;
    bool accept_bare_source = false; ///< Accept a lone (gzipped) .tex file as a one-entry archive

    // --- remote ---
    std::string base_url = "https://arxiv.org/e-print/";
    std::string user_agent = "texharvest/1.0";

    // --- compilation ---
    std::string typesetter = "pdflatex";
    bool enable_sandboxing = true;
    bool preserve_intermediates = false;
    std::filesystem::path output_directory = "./output";
    std::filesystem::path work_root;  ///< Parent of temp dirs; empty = system temp

    // --- rendered artifact ---
    bool read_rendered_artifacts = true; ///< false selects the null reader

    /**
     * @brief Check every bound and timeout.
     * @throws ConfigError describing the first invalid field.
     */
    void validate() const;

    /// @return scheduler_threads, or the derived default when 0.
    [[nodiscard]] unsigned effective_scheduler_threads() const noexcept;

    /// @return worker_threads, or the derived default when 0.
    [[nodiscard]] unsigned effective_worker_threads() const noexcept;
};

} // namespace texharvest

#endif // TEXHARVEST_PIPELINE_CONFIG_HPP
