#include "cli_parser.hpp"
#include "../../../libtexharvest/include/errors.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    auto& cfg = settings.pipeline;

    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");
    app.set_config("--config", "", "Read options from a TOML or INI file.")
        ->envname("TEXHARVEST_CONFIG");

    // --- Inputs ---
    app.add_option("ids", settings.ids, "Paper identifiers (e.g. 2404.04895, hep-th/9901001).");

    app.add_option("--ids-file", settings.ids_file,
                   "Read identifiers from FILE, one per line ('-' for stdin).")
        ->envname("TEXHARVEST_IDS_FILE");

    app.add_flag("--pdf", settings.include_pdf,
                 "Also compile each paper and extract text from the rendered PDF.")
        ->envname("TEXHARVEST_PDF");

    // --- Output ---
    app.add_flag("--json", settings.json, "Print results as JSON on stdout.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--report", settings.report_path, "CSV report export filename.")
        ->take_last();

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("WARNING")
        ->envname("TEXHARVEST_LOG_LEVEL")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).")
        ->envname("TEXHARVEST_LOG_FILE");

    // --- Concurrency ---
    app.add_option("--max-downloads", cfg.max_downloads, "Concurrent downloads.")
        ->default_val(cfg.max_downloads)->envname("TEXHARVEST_MAX_DOWNLOADS")->check(CLI::PositiveNumber);
    app.add_option("--max-extractions", cfg.max_extractions, "Concurrent archive extractions.")
        ->default_val(cfg.max_extractions)->envname("TEXHARVEST_MAX_EXTRACTIONS")->check(CLI::PositiveNumber);
    app.add_option("--max-compilations", cfg.max_compilations, "Concurrent typesetter runs.")
        ->default_val(cfg.max_compilations)->envname("TEXHARVEST_MAX_COMPILATIONS")->check(CLI::PositiveNumber);
    app.add_option("--scheduler-threads", cfg.scheduler_threads, "Items in flight (0 = derived).")
        ->envname("TEXHARVEST_SCHEDULER_THREADS")->check(CLI::NonNegativeNumber);
    app.add_option("--worker-threads", cfg.worker_threads, "Threads for blocking stages (0 = derived).")
        ->envname("TEXHARVEST_WORKER_THREADS")->check(CLI::NonNegativeNumber);

    // --- Network ---
    app.add_option("--rate", cfg.requests_per_second, "Maximum download requests per second.")
        ->default_val(cfg.requests_per_second)->envname("TEXHARVEST_REQUESTS_PER_SECOND")->check(CLI::PositiveNumber);
    app.add_option("--burst", cfg.burst_size, "Downloads allowed through the downloader at once.")
        ->default_val(cfg.burst_size)->envname("TEXHARVEST_BURST_SIZE")->check(CLI::PositiveNumber);
    app.add_option("--download-timeout", settings.download_timeout_s, "Seconds allowed per download.")
        ->default_val(settings.download_timeout_s)->envname("TEXHARVEST_DOWNLOAD_TIMEOUT")->check(CLI::PositiveNumber);
    app.add_option("--retries", cfg.download_retries, "Extra download attempts after a failure.")
        ->default_val(cfg.download_retries)->envname("TEXHARVEST_DOWNLOAD_RETRIES")->check(CLI::NonNegativeNumber);
    app.add_option("--retry-delay", settings.retry_delay_ms, "Milliseconds before the first retry.")
        ->default_val(settings.retry_delay_ms)->envname("TEXHARVEST_RETRY_DELAY");
    app.add_option("--retry-backoff", cfg.retry_backoff, "Multiplier applied to the delay after each retry.")
        ->default_val(cfg.retry_backoff)->envname("TEXHARVEST_RETRY_BACKOFF");
    app.add_option("--base-url", cfg.base_url, "Prefix the identifier is appended to.")
        ->default_val(cfg.base_url)->envname("TEXHARVEST_BASE_URL");
    app.add_option("--user-agent", cfg.user_agent, "HTTP User-Agent header.")
        ->default_val(cfg.user_agent)->envname("TEXHARVEST_USER_AGENT");

    // --- Archives ---
    app.add_option("--max-files", cfg.max_files_per_archive, "Maximum members per archive.")
        ->default_val(cfg.max_files_per_archive)->envname("TEXHARVEST_MAX_FILES")->check(CLI::PositiveNumber);
    app.add_option("--max-archive-size", cfg.max_archive_size, "Maximum archive size in bytes.")
        ->default_val(cfg.max_archive_size)->envname("TEXHARVEST_MAX_ARCHIVE_SIZE")->check(CLI::PositiveNumber);
    app.add_flag("--accept-bare-source", cfg.accept_bare_source,
                 "Accept a single (gzipped) source file when the download is not an archive.")
        ->envname("TEXHARVEST_ACCEPT_BARE_SOURCE");

    // --- Compilation ---
    app.add_option("--typesetter", cfg.typesetter, "Typesetting program.")
        ->default_val(cfg.typesetter)->envname("TEXHARVEST_TYPESETTER");
    app.add_option("--compile-timeout", settings.compilation_timeout_s, "Seconds allowed per typesetter pass.")
        ->default_val(settings.compilation_timeout_s)->envname("TEXHARVEST_COMPILATION_TIMEOUT")->check(CLI::PositiveNumber);
    app.add_flag("--no-sandbox", settings.no_sandbox,
                 "Allow shell escape and unrestricted file access in the typesetter.")
        ->envname("TEXHARVEST_NO_SANDBOX");
    app.add_flag("--keep-intermediates", cfg.preserve_intermediates,
                 "Copy each compilation workspace to the output directory.")
        ->envname("TEXHARVEST_KEEP_INTERMEDIATES");
    app.add_option("--output-dir", cfg.output_directory, "Where preserved workspaces go.")
        ->default_val(cfg.output_directory.string())->envname("TEXHARVEST_OUTPUT_DIR");
    app.add_option("--work-root", cfg.work_root, "Parent directory for temporary workspaces.")
        ->envname("TEXHARVEST_WORK_ROOT");
    app.add_flag("--no-read-pdf", settings.no_read_pdf,
                 "Compile but don't extract text from the rendered PDF.")
        ->envname("TEXHARVEST_NO_READ_PDF");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.ids.empty() && settings.ids_file.empty()) {
            throw CLI::ValidationError("At least one identifier or --ids-file is required.");
        }

        auto& pipeline = settings.pipeline;
        pipeline.download_timeout = std::chrono::seconds(settings.download_timeout_s);
        pipeline.compilation_timeout = std::chrono::seconds(settings.compilation_timeout_s);
        pipeline.retry_delay = std::chrono::milliseconds(settings.retry_delay_ms);
        pipeline.enable_sandboxing = !settings.no_sandbox;
        pipeline.read_rendered_artifacts = !settings.no_read_pdf;

        try {
            pipeline.validate();
        } catch (const texharvest::ConfigError& e) {
            throw CLI::ValidationError(e.what());
        }
    });
}
