#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <thread>

#include <CLI/CLI.hpp>

#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/id_scanner.hpp"
#include "../../libtexharvest/include/event_bus.hpp"
#include "../../libtexharvest/include/events.hpp"
#include "../../libtexharvest/include/logger.hpp"
#include "../../libtexharvest/include/pipeline.hpp"

using namespace texharvest;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitPartial = 2;
constexpr int kExitInterrupted = 130;

volatile std::sig_atomic_t g_signal = 0;

void signal_handler(const int sig) {
    g_signal = sig;
}

// simple progress bar printer
void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const auto pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

void install_sinks(const Settings& settings) {
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file.string(), true);
        if (!file_sink->is_open()) {
            std::cerr << "Can't open log file " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }
    if (!settings.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(console_sink));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"texharvest: fetch paper sources, extract their text and optionally typeset them."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    } catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitOk : kExitUsage;
    }

    install_sinks(settings);

    auto ids = collect_identifiers(settings.ids, settings.ids_file);
    if (!ids) {
        return kExitUsage;
    }
    if (ids->empty()) {
        Logger::log(LogLevel::Error, "No identifiers to process.", "main");
        return kExitUsage;
    }

    EventBus bus;
    const size_t total = ids->size();
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();
    const bool show_progress = !settings.quiet && !settings.json;

    // handlers run under the bus mutex, one at a time
    auto on_finish = [&](auto&&) {
        ++done;
        if (show_progress) {
            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(done, total, elapsed);
        }
    };
    bus.subscribe<ItemCompleteEvent>(on_finish);
    bus.subscribe<ItemErrorEvent>([&](const ItemErrorEvent& e) {
        Logger::log(LogLevel::Debug, e.id + " failed after " + std::to_string(e.duration.count()) + "ms", "main");
        on_finish(e);
    });

    std::optional<PipelineOrchestrator> orchestrator;
    try {
        orchestrator.emplace(settings.pipeline, bus);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // the handler only records the signal; stopping happens here
    std::atomic<bool> interrupted{false};
    std::jthread watcher([&](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (g_signal != 0) {
                std::cerr << "\n[INTERRUPT] Stop detected. Cancelling running items..." << std::endl;
                interrupted.store(true);
                orchestrator->request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto results = orchestrator->process_many(*ids, settings.include_pdf);
    watcher.request_stop();
    watcher.join();

    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    const auto status = orchestrator->status();
    if (show_progress) {
        std::cerr << std::endl;
    }

    if (settings.json) {
        std::cout << results_to_json(results, &status) << std::endl;
    } else if (!settings.quiet) {
        print_console_report(results, status, total_seconds);
    }

    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Can't write report to " + settings.report_path.string(), "main");
    }

    if (interrupted.load()) {
        return kExitInterrupted;
    }
    const bool all_ok = std::all_of(results.begin(), results.end(), [](const auto& r) { return r.success; });
    return all_ok ? kExitOk : kExitPartial;
}
