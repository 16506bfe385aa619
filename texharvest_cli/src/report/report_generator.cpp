#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

using namespace texharvest;
using json = nlohmann::json;

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

std::string first_line(const std::string& s) {
    return s.substr(0, s.find('\n'));
}

std::string outcome_of(const ProcessingResult& r, const bool use_colors) {
    if (!r.success) {
        const std::string kind = r.error_kind ? std::string(to_string(*r.error_kind)) : "FAIL";
        return use_colors ? "\033[1;31m" + kind + "\033[0m" : kind;
    }
    if (r.compilation_error) {
        return use_colors ? "\033[1;33mOK (no pdf)\033[0m" : "OK (no pdf)";
    }
    if (r.rendered_artifact_produced) {
        return use_colors ? "\033[1;32mOK (pdf)\033[0m" : "OK (pdf)";
    }
    return use_colors ? "\033[1;32mOK\033[0m" : "OK";
}

std::string error_of(const ProcessingResult& r) {
    if (r.error) return first_line(*r.error);
    if (r.compilation_error) return first_line(*r.compilation_error);
    return {};
}

std::string seconds_of(const ProcessingResult& r) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(r.elapsed.count()) / 1000.0;
    return oss.str();
}

} // namespace

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

void print_console_report(const std::vector<ProcessingResult>& results,
                          const OrchestratorStatus& status,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_id = 12;
    size_t max_main = 10;
    size_t max_files = 7;
    size_t max_chars = 7;
    size_t max_time = 9;
    size_t max_result = 8;
    for (const auto& r : results) {
        max_id     = std::max(max_id, r.id.size() + 2);
        max_main   = std::max(max_main, r.main_file.value_or("-").size() + 2);
        max_files  = std::max(max_files, std::to_string(r.file_count).size() + 2);
        max_chars  = std::max(max_chars, std::to_string(r.extracted_text.size()).size() + 2);
        max_time   = std::max(max_time, seconds_of(r).size() + 2);
        max_result = std::max(max_result, strip_ansi(outcome_of(r, false)).size() + 2);
    }

    const size_t fixed_cols_width = max_id + max_main + max_files + max_chars + max_time + max_result;
    const size_t error_col_width = term_width > fixed_cols_width + 10 ? term_width - fixed_cols_width : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(max_id) << "Identifier"
              << std::setw(max_main)   << "Main file"
              << std::setw(max_files)  << "Files"
              << std::setw(max_chars)  << "Chars"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << "Error"
              << "\n";

    size_t succeeded = 0;
    size_t rendered = 0;
    for (const auto& r : results) {
        if (r.success) ++succeeded;
        if (r.rendered_artifact_produced) ++rendered;

        const std::string outcome = outcome_of(r, use_colors);
        // setw counts escape bytes, so pad on the visible width
        const size_t padding = max_result - std::min(max_result, strip_ansi(outcome).size());

        std::cerr << std::left << std::setw(max_id) << r.id
                  << std::setw(max_main)  << r.main_file.value_or("-")
                  << std::setw(max_files) << r.file_count
                  << std::setw(max_chars) << r.extracted_text.size()
                  << std::setw(max_time)  << seconds_of(r)
                  << outcome << std::string(padding, ' ')
                  << truncate(error_of(r), error_col_width)
                  << "\n";
    }

    std::cerr << "\nSucceeded: " << succeeded << "/" << results.size();
    if (rendered > 0) {
        std::cerr << " (" << rendered << " rendered)";
    }
    std::cerr << "\nTotal time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";

    std::cerr << "Stages:";
    for (const auto& stage : status.stages) {
        std::cerr << " " << stage.name << "=" << stage.peak << "/" << stage.capacity;
    }
    std::cerr << ", " << status.requests_per_second << " req/s\n";
}

bool export_csv_report(const std::vector<ProcessingResult>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Identifier,Success,MainFile,Files,TextChars,Rendered,RenderedBytes,Time(s),ErrorKind,Error\n";

    for (const auto& r : results) {
        const std::string kind = r.error_kind ? std::string(to_string(*r.error_kind))
                               : r.compilation_failure ? std::string(to_string(*r.compilation_failure))
                               : "";
        out << csv_escape(r.id) << ","
            << (r.success ? "true" : "false") << ","
            << csv_escape(r.main_file.value_or("")) << ","
            << r.file_count << ","
            << r.extracted_text.size() << ","
            << (r.rendered_artifact_produced ? "true" : "false") << ","
            << r.rendered_size << ","
            << seconds_of(r) << ","
            << kind << ","
            << csv_escape(error_of(r))
            << "\n";
    }

    out << "\nTotal time (s)," << std::fixed << std::setprecision(2) << total_seconds << "\n";
    return static_cast<bool>(out);
}

std::string results_to_json(const std::vector<ProcessingResult>& results,
                            const OrchestratorStatus* status) {
    json items = json::array();
    for (const auto& r : results) {
        json j;
        j["id"] = r.id;
        j["success"] = r.success;
        j["main_file"] = r.main_file ? json(*r.main_file) : json(nullptr);
        j["extracted_text"] = r.extracted_text;
        j["file_count"] = r.file_count;
        j["rendered_artifact_produced"] = r.rendered_artifact_produced;
        j["rendered_text"] = r.rendered_text ? json(*r.rendered_text) : json(nullptr);
        j["rendered_metadata"] = r.rendered_metadata ? json(*r.rendered_metadata) : json(nullptr);
        j["rendered_size"] = r.rendered_size;
        j["compilation_error"] = r.compilation_error ? json(*r.compilation_error) : json(nullptr);
        j["error"] = r.error ? json(*r.error) : json(nullptr);
        j["error_kind"] = r.error_kind ? json(std::string(to_string(*r.error_kind))) : json(nullptr);
        j["elapsed_ms"] = r.elapsed.count();
        items.push_back(std::move(j));
    }

    json root;
    root["results"] = std::move(items);
    if (status) {
        json counters = json::object();
        for (const auto& [name, value] : status->metrics.counters) {
            counters[name] = value;
        }
        json timers = json::object();
        for (const auto& [name, t] : status->metrics.timers) {
            timers[name] = {{"count", t.count}, {"avg_ms", t.avg_ms}, {"min_ms", t.min_ms}, {"max_ms", t.max_ms}};
        }
        root["metrics"] = {{"counters", counters}, {"timers", timers}};
    }
    return root.dump(2);
}
