#include "../include/pipeline.hpp"
#include "../include/identifier.hpp"
#include "../include/logger.hpp"
#include "../include/main_file_resolver.hpp"
#include "../include/markup_text_extractor.hpp"

#include <algorithm>

namespace texharvest {

namespace {

constexpr const char* kTag = "Pipeline";

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(const Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

PipelineConfig validated(PipelineConfig config) {
    config.validate();
    return config;
}

// Old-style identifiers contain '/', which must not become a directory.
std::string file_stem_for(std::string id) {
    for (auto& c : id) {
        if (c == '/') c = '_';
    }
    return id;
}

} // namespace

ProcessingResult ProcessingResult::failure(std::string id, const PipelineError& err) {
    ProcessingResult r;
    r.id = std::move(id);
    r.success = false;
    r.error = err.message;
    r.error_kind = err.kind;
    return r;
}

PipelineOrchestrator::PipelineOrchestrator(PipelineConfig config, EventBus& bus, PipelineDependencies deps)
    : config_(validated(std::move(config))),
      event_bus_(bus),
      clock_(deps.clock ? *deps.clock : SteadyClock::instance()),
      transport_(deps.transport ? std::move(deps.transport)
                                : std::make_unique<CurlTransport>(config_.user_agent, config_.max_archive_size)),
      reader_(deps.reader ? std::move(deps.reader) : make_artifact_reader(config_.read_rendered_artifacts)),
      limiter_(config_.requests_per_second, clock_),
      downloader_(*transport_, limiter_, metrics_, config_.base_url, config_.burst_size),
      extractor_(config_.accept_bare_source),
      compiler_(CompilerOptions{config_.typesetter,
                                config_.enable_sandboxing,
                                config_.preserve_intermediates,
                                config_.output_directory,
                                config_.work_root}),
      download_slots_("download", config_.max_downloads),
      extract_slots_("extract", config_.max_extractions),
      compile_slots_("compile", config_.max_compilations),
      workers_(config_.effective_worker_threads(), "workers"),
      scheduler_(config_.effective_scheduler_threads(), "scheduler") {
    Logger::log(LogLevel::Debug,
                "Orchestrator ready: downloads=" + std::to_string(config_.max_downloads)
                    + " extractions=" + std::to_string(config_.max_extractions)
                    + " compilations=" + std::to_string(config_.max_compilations)
                    + " reader=" + std::string(reader_->name()),
                kTag);
}

PipelineOrchestrator::~PipelineOrchestrator() {
    stop_.request_stop();
}

void PipelineOrchestrator::request_stop() {
    if (stop_.request_stop()) {
        Logger::log(LogLevel::Warning, "Stop requested, cancelling pending items", kTag);
    }
    scheduler_.request_stop();
    workers_.request_stop();
}

void PipelineOrchestrator::enter(const std::string& id, const Stage stage) {
    Logger::log(LogLevel::Debug, id + ": " + std::string(to_string(stage)), kTag);
    event_bus_.publish(StageChangeEvent{id, stage});
}

template<class F>
auto PipelineOrchestrator::offload(F&& fn, std::stop_token st) -> std::optional<std::invoke_result_t<F>> {
    if (st.stop_requested()) return std::nullopt;
    auto fut = workers_.enqueue([&fn](std::stop_token) { return fn(); });
    try {
        return fut.get();
    } catch (const std::future_error&) {
        // Dropped from the queue by request_stop().
        return std::nullopt;
    }
}

Outcome<Bytes> PipelineOrchestrator::download(const std::string& id, std::stop_token st) {
    auto delay = std::chrono::duration<double, std::milli>(config_.retry_delay);
    for (unsigned attempt = 0;; ++attempt) {
        Outcome<Bytes> outcome = [&]() -> Outcome<Bytes> {
            SlotGuard slot(download_slots_, st);
            if (!slot.acquired()) {
                return PipelineError::cancelled("download of " + id + " cancelled");
            }
            const auto started = Clock::now();
            auto fetched = downloader_.fetch(id, config_.download_timeout, st);
            metrics_.observe("stage.download", since(started));
            return fetched;
        }();

        if (auto* bytes = std::get_if<Bytes>(&outcome)) {
            if (bytes->size() > config_.max_archive_size) {
                return PipelineError::download("Archive for " + id + " exceeds "
                                               + std::to_string(config_.max_archive_size) + " bytes");
            }
            return outcome;
        }

        const auto& err = std::get<PipelineError>(outcome);
        if (err.kind == ErrorKind::Cancelled || attempt >= config_.download_retries) {
            return outcome;
        }

        const auto wait = std::chrono::duration_cast<IClock::duration>(delay);
        Logger::log(LogLevel::Warning,
                    "Retrying " + id + " (attempt " + std::to_string(attempt + 2) + ") in "
                        + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + "ms",
                    kTag);
        metrics_.increment("download_retries");
        if (!clock_.sleep_for(wait, st)) {
            return PipelineError::cancelled("download of " + id + " cancelled");
        }
        delay *= config_.retry_backoff;
    }
}

Outcome<FileSet> PipelineOrchestrator::extract(const std::string& id, const Bytes& archive, std::stop_token st) {
    SlotGuard slot(extract_slots_, st);
    if (!slot.acquired()) {
        return PipelineError::cancelled("extraction of " + id + " cancelled");
    }
    const auto started = Clock::now();
    const std::string fallback = file_stem_for(id);
    auto outcome = offload([&] { return extractor_.extract(archive, config_.max_files_per_archive, fallback); }, st);
    metrics_.observe("stage.extract", since(started));
    if (!outcome) {
        return PipelineError::cancelled("extraction of " + id + " cancelled");
    }
    return std::move(*outcome);
}

void PipelineOrchestrator::render(ProcessingResult& result, const FileSet& files, std::stop_token st) {
    enter(result.id, Stage::Compiling);
    std::optional<CompilationOutcome> compiled;
    {
        SlotGuard slot(compile_slots_, st);
        if (slot.acquired()) {
            const auto started = Clock::now();
            compiled = offload([&] {
                return compiler_.compile(files, *result.main_file, config_.compilation_timeout, st);
            }, st);
            metrics_.observe("stage.compile", since(started));
        }
    }
    if (!compiled) {
        compiled = CompilationFailure{CompileFailureKind::Cancelled, "Compilation cancelled"};
    }

    if (const auto* failure = std::get_if<CompilationFailure>(&*compiled)) {
        metrics_.increment("compilations", {{"status", "error"}, {"kind", std::string(to_string(failure->kind))}});
        Logger::log(LogLevel::Warning, result.id + ": " + std::string(to_string(failure->kind)) + ": "
                    + failure->message, kTag);
        result.compilation_error = std::string(to_string(failure->kind)) + ": " + failure->message;
        result.compilation_failure = failure->kind;
        return;
    }
    metrics_.increment("compilations", {{"status", "success"}});

    const Bytes& pdf = std::get<CompiledArtifact>(*compiled).pdf;
    enter(result.id, Stage::ReadingArtifact);
    auto document = offload([&] { return reader_->read(pdf); }, st);
    if (!document) {
        result.compilation_error = "Reading the rendered artifact was cancelled";
        return;
    }
    if (const auto* err = std::get_if<PipelineError>(&*document)) {
        result.compilation_error = err->message;
        return;
    }

    auto& doc = std::get<RenderedDocument>(*document);
    result.rendered_artifact_produced = true;
    result.rendered_size = pdf.size();
    result.rendered_text = std::move(doc.text);
    result.rendered_metadata = std::move(doc.metadata);
}

ProcessingResult PipelineOrchestrator::run(const ProcessingRequest& request, std::stop_token st) {
    const auto started = Clock::now();
    event_bus_.publish(ItemStartEvent{request.id, request.include_rendered_artifact});
    metrics_.gauge("items_in_flight", static_cast<double>(scheduler_.pending()));

    const auto fail = [&](const PipelineError& err) {
        auto result = ProcessingResult::failure(request.id, err);
        result.elapsed = since(started);
        metrics_.increment("pipeline_error", {{"kind", std::string(to_string(err.kind))}});
        metrics_.observe("pipeline.item", result.elapsed);
        Logger::log(err.kind == ErrorKind::Cancelled ? LogLevel::Warning : LogLevel::Error,
                    request.id + ": " + err.message, kTag);
        event_bus_.publish(ItemErrorEvent{request.id, err.kind, err.message, result.elapsed});
        return result;
    };

    enter(request.id, Stage::Validating);
    auto validated_id = validate_identifier(request.id);
    if (auto* err = std::get_if<PipelineError>(&validated_id)) {
        return fail(*err);
    }
    const std::string id = std::move(std::get<std::string>(validated_id));

    enter(request.id, Stage::Downloading);
    auto archive = download(id, st);
    if (auto* err = std::get_if<PipelineError>(&archive)) {
        return fail(*err);
    }

    enter(request.id, Stage::Extracting);
    auto extracted = extract(id, std::get<Bytes>(archive), st);
    if (auto* err = std::get_if<PipelineError>(&extracted)) {
        return fail(*err);
    }
    const FileSet& files = std::get<FileSet>(extracted);

    Logger::log(LogLevel::Debug, id + ": extracted " + std::to_string(files.size()) + " files, "
                + std::to_string(files.total_bytes()) + " bytes", kTag);

    enter(request.id, Stage::Resolving);
    auto main_file = MainFileResolver::resolve(files);
    if (!main_file) {
        return fail(PipelineError::processing("No main .tex file found in " + id));
    }

    enter(request.id, Stage::ExtractingText);
    ProcessingResult result;
    result.id = request.id;
    result.main_file = *main_file;
    result.file_count = files.size();
    result.extracted_text = MarkupTextExtractor::to_text(as_text(*files.find(*main_file)));

    if (request.include_rendered_artifact) {
        render(result, files, st);
        if (result.compilation_failure == CompileFailureKind::Cancelled || st.stop_requested()) {
            return fail(PipelineError::cancelled("processing of " + id + " cancelled"));
        }
    }

    enter(request.id, Stage::Done);
    result.success = true;
    result.elapsed = since(started);
    metrics_.increment("pipeline_success");
    metrics_.observe("pipeline.item", result.elapsed);
    Logger::log(LogLevel::Info, id + ": " + std::to_string(result.file_count) + " files, main "
                + *result.main_file + (result.rendered_artifact_produced ? ", rendered" : ""), kTag);

    event_bus_.publish(ItemCompleteEvent{request.id,
                                         *result.main_file,
                                         result.file_count,
                                         result.extracted_text.size(),
                                         result.rendered_artifact_produced,
                                         result.compilation_error.value_or(""),
                                         result.elapsed});
    return result;
}

ProcessingResult PipelineOrchestrator::run_guarded(const ProcessingRequest& request, std::stop_token st) {
    try {
        return run(request, st);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, request.id + ": unexpected exception: " + e.what(), kTag);
        auto err = st.stop_requested() ? PipelineError::cancelled(e.what()) : PipelineError::internal(e.what());
        metrics_.increment("pipeline_error", {{"kind", std::string(to_string(err.kind))}});
        event_bus_.publish(ItemErrorEvent{request.id, err.kind, err.message, {}});
        return ProcessingResult::failure(request.id, err);
    }
}

ProcessingResult PipelineOrchestrator::process(const ProcessingRequest& request, std::stop_token stop) {
    std::stop_source local;
    std::stop_callback forward_caller(stop, [&local] { local.request_stop(); });
    std::stop_callback forward_owner(stop_.get_token(), [&local] { local.request_stop(); });
    return run_guarded(request, local.get_token());
}

std::future<ProcessingResult> PipelineOrchestrator::submit(ProcessingRequest request) {
    return scheduler_.enqueue([this, request = std::move(request)](std::stop_token) {
        return run_guarded(request, stop_.get_token());
    });
}

std::vector<ProcessingResult> PipelineOrchestrator::process_many(const std::vector<std::string>& ids,
                                                                 const bool include_rendered_artifact) {
    Logger::log(LogLevel::Info, "Processing " + std::to_string(ids.size()) + " items", kTag);

    std::vector<std::future<ProcessingResult>> futures;
    futures.reserve(ids.size());
    std::vector<std::optional<PipelineError>> rejected(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        try {
            futures.push_back(submit({ids[i], include_rendered_artifact}));
        } catch (const std::runtime_error& e) {
            // The scheduler refuses work once stopped.
            rejected[i] = PipelineError::cancelled(e.what());
            futures.emplace_back();
        }
    }

    std::vector<ProcessingResult> results;
    results.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        if (rejected[i]) {
            results.push_back(ProcessingResult::failure(ids[i], *rejected[i]));
            continue;
        }
        try {
            results.push_back(futures[i].get());
        } catch (const std::future_error&) {
            results.push_back(ProcessingResult::failure(ids[i], PipelineError::cancelled("item was cancelled before it started")));
        } catch (const std::exception& e) {
            results.push_back(ProcessingResult::failure(ids[i], PipelineError::internal(e.what())));
        }
    }

    const auto ok = std::count_if(results.begin(), results.end(), [](const auto& r) { return r.success; });
    Logger::log(LogLevel::Info, "Finished " + std::to_string(ids.size()) + " items, "
                + std::to_string(ok) + " succeeded", kTag);
    return results;
}

OrchestratorStatus PipelineOrchestrator::status() const {
    OrchestratorStatus s;
    for (const StageSemaphore* sem : {&download_slots_, &extract_slots_, &compile_slots_, &downloader_.burst()}) {
        s.stages.push_back({sem->name(), sem->capacity(), sem->available(), sem->peak()});
    }
    s.requests_per_second = limiter_.requests_per_second();
    s.recent_requests = limiter_.recent_requests();
    s.items_in_flight = scheduler_.pending();
    s.reader = std::string(reader_->name());
    s.metrics = metrics_.snapshot();
    return s;
}

} // namespace texharvest
