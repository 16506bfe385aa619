/**
 * @file pipeline.hpp
 * @brief Defines the PipelineOrchestrator, which drives identifiers through
 * download, extraction, text recovery and optional compilation.
 */

#ifndef TEXHARVEST_PIPELINE_HPP
#define TEXHARVEST_PIPELINE_HPP

#include "archive_extractor.hpp"
#include "artifact_reader.hpp"
#include "clock.hpp"
#include "compiler.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "http_transport.hpp"
#include "metrics.hpp"
#include "pipeline_config.hpp"
#include "rate_limiter.hpp"
#include "stage_semaphore.hpp"
#include "thread_pool.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace texharvest {

struct ProcessingRequest {
    std::string id;
    bool include_rendered_artifact = false;
};

/**
 * @brief Outcome of one pipeline run.
 *
 * @details When success is false, main_file is empty, extracted_text is ""
 * and error / error_kind describe the failing stage. A compile or read
 * failure does not fail the item: it leaves rendered_artifact_produced false
 * and fills compilation_error instead. When rendered_artifact_produced is
 * true, rendered_text is always set.
 */
struct ProcessingResult {
    std::string id;
    bool success = false;
    std::optional<std::string> main_file;
    std::string extracted_text;
    size_t file_count = 0;

    bool rendered_artifact_produced = false;
    std::optional<std::string> rendered_text;
    std::optional<std::map<std::string, std::string>> rendered_metadata;
    size_t rendered_size = 0;                 ///< Bytes of the rendered artifact
    std::optional<std::string> compilation_error;
    std::optional<CompileFailureKind> compilation_failure;

    std::optional<std::string> error;
    std::optional<ErrorKind> error_kind;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] static ProcessingResult failure(std::string id, const PipelineError& err);
};

/**
 * @brief Replaceable collaborators. Null members get production defaults:
 * CurlTransport, SteadyClock, and the reader chosen by the configuration.
 */
struct PipelineDependencies {
    std::unique_ptr<IHttpTransport> transport;
    IClock* clock = nullptr;  ///< Not owned; must outlive the orchestrator
    std::unique_ptr<IRenderedArtifactReader> reader;
};

struct StageStatus {
    std::string name;
    unsigned capacity = 0;
    unsigned available = 0;
    unsigned peak = 0;      ///< Most slots held at once so far
};

/**
 * @brief Point-in-time view of the orchestrator.
 */
struct OrchestratorStatus {
    std::vector<StageStatus> stages;   ///< download, extract, compile, burst
    double requests_per_second = 0.0;
    size_t recent_requests = 0;        ///< Requests in the trailing second
    size_t items_in_flight = 0;        ///< Items queued or running
    std::string reader;                ///< Name of the selected artifact reader
    MetricsSnapshot metrics;
};

/**
 * @brief Runs ProcessingRequests through the pipeline.
 *
 * @details Per item the stages run strictly in order:
 * validating, downloading, extracting, resolving, extracting text and,
 * when requested, compiling and reading the artifact. Any failure before
 * compilation ends the item with success == false.
 *
 * Items run on a scheduler pool. Archive parsing, typesetting and artifact
 * reading are handed to a separate worker pool so scheduler threads only
 * wait. Three StageSemaphores bound how many items download, extract and
 * compile at once; the Downloader adds its own burst bound and the shared
 * RateLimiter.
 *
 * Lifecycle events go to the EventBus, counters and stage timers to the
 * orchestrator's MetricsCollector.
 *
 * After request_stop() the orchestrator is spent: running items end as
 * Cancelled, queued ones are dropped, and later calls return Cancelled
 * results.
 */
class PipelineOrchestrator {
public:
    /**
     * @param config Validated on construction.
     * @param bus EventBus used to publish item events; must outlive the orchestrator.
     * @param deps Optional replacements for the network, clock and reader.
     * @throws ConfigError if @p config is invalid.
     */
    PipelineOrchestrator(PipelineConfig config, EventBus& bus, PipelineDependencies deps = {});

    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /**
     * @brief Process one item on the calling thread.
     * @param stop Stops this item in addition to request_stop().
     */
    ProcessingResult process(const ProcessingRequest& request, std::stop_token stop = {});

    /**
     * @brief Queue one item on the scheduler pool.
     */
    std::future<ProcessingResult> submit(ProcessingRequest request);

    /**
     * @brief Process all @p ids concurrently.
     * @return One result per id, in input order. Never throws for item failures.
     */
    std::vector<ProcessingResult> process_many(const std::vector<std::string>& ids,
                                               bool include_rendered_artifact);

    [[nodiscard]] OrchestratorStatus status() const;

    /**
     * @brief Cancel queued and running items. Thread-safe.
     */
    void request_stop();

    [[nodiscard]] bool is_stopped() const { return stop_.stop_requested(); }

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }
    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }

private:
    ProcessingResult run(const ProcessingRequest& request, std::stop_token st);
    ProcessingResult run_guarded(const ProcessingRequest& request, std::stop_token st);

    Outcome<Bytes> download(const std::string& id, std::stop_token st);
    Outcome<FileSet> extract(const std::string& id, const Bytes& archive, std::stop_token st);
    void render(ProcessingResult& result, const FileSet& files, std::stop_token st);

    template<class F>
    auto offload(F&& fn, std::stop_token st) -> std::optional<std::invoke_result_t<F>>;

    void enter(const std::string& id, Stage stage);

    PipelineConfig config_;
    EventBus& event_bus_;
    MetricsCollector metrics_;
    IClock& clock_;
    std::unique_ptr<IHttpTransport> transport_;
    std::unique_ptr<IRenderedArtifactReader> reader_;
    RateLimiter limiter_;
    Downloader downloader_;
    ArchiveExtractor extractor_;
    Compiler compiler_;

    StageSemaphore download_slots_;
    StageSemaphore extract_slots_;
    StageSemaphore compile_slots_;

    std::stop_source stop_;
    ThreadPool workers_;    ///< Blocking stages
    ThreadPool scheduler_;  ///< Item tasks; destroyed before workers_
};

} // namespace texharvest

#endif // TEXHARVEST_PIPELINE_HPP
