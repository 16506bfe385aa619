#ifndef TEXHARVEST_TEST_SUPPORT_HPP
#define TEXHARVEST_TEST_SUPPORT_HPP

#include "clock.hpp"
#include "file_set.hpp"
#include "file_utils.hpp"
#include "http_transport.hpp"
#include "log_sink.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace texharvest::test_support {

Bytes to_bytes(std::string_view s);

// --- archives ---

struct ArchiveMember {
    std::string path;
    std::string content;
    bool directory = false;
};

enum class ArchiveKind { Zip, Tar, TarGz };

/// Builds an archive in memory with libarchive.
Bytes make_archive(ArchiveKind kind, const std::vector<ArchiveMember>& members);

/// Gzip-compresses a single stream (no container).
Bytes gzip_bytes(std::string_view content);

// --- rendered documents ---

/// Builds a one-page PDF with qpdf showing @p text, with /Info /Title @p title.
Bytes make_pdf(const std::string& title, const std::string& text);

// --- filesystem ---

/// A fresh directory removed at scope exit.
TempDir make_test_dir(std::string_view name);

/// Writes an executable shell script.
std::filesystem::path write_script(const std::filesystem::path& dir,
                                   const std::string& name,
                                   const std::string& body);

// --- logging ---

/**
 * @brief Installs a capturing sink for the lifetime of the object.
 */
class ScopedLogCapture {
public:
    struct Entry {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    ScopedLogCapture();
    ~ScopedLogCapture();

    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] bool contains(std::string_view tag, std::string_view fragment) const;

private:
    struct State {
        mutable std::mutex mtx;
        std::vector<Entry> entries;
    };
    std::shared_ptr<State> state_;
};

// --- time ---

/**
 * @brief Simulated clock: sleeping advances time instantly.
 */
class FakeClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override;
    bool sleep_for(duration d, std::stop_token st) override;

    void advance(duration d);
    [[nodiscard]] size_t sleeps() const;
    [[nodiscard]] duration slept() const;

private:
    mutable std::mutex mtx_;
    time_point now_{std::chrono::hours(1)};
    size_t sleeps_ = 0;
    duration slept_{};
};

// --- network ---

/**
 * @brief In-memory transport with scripted responses per URL.
 *
 * Unknown URLs answer 404. Tracks how many requests run at once.
 */
class FakeTransport final : public IHttpTransport {
public:
    using Handler = std::function<Outcome<HttpResponse>(const std::string& url)>;

    void respond(const std::string& url, long status, Bytes body);
    void respond_with(const std::string& url, Handler handler);
    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

    Outcome<HttpResponse> get(const std::string& url,
                              std::chrono::milliseconds timeout,
                              std::stop_token st) override;

    [[nodiscard]] size_t calls() const { return calls_.load(); }
    [[nodiscard]] size_t max_in_flight() const { return max_in_flight_.load(); }
    [[nodiscard]] size_t calls_for(const std::string& url) const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, size_t> per_url_;
    std::chrono::milliseconds latency_{0};
    std::atomic<size_t> calls_{0};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> max_in_flight_{0};
};

} // namespace texharvest::test_support

#endif // TEXHARVEST_TEST_SUPPORT_HPP
