#include "test_support.hpp"
#include "logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace texharvest::test_support {

namespace {

la_ssize_t append_cb(archive*, void* client, const void* buffer, size_t length) {
    auto* out = static_cast<Bytes*>(client);
    const auto* p = static_cast<const unsigned char*>(buffer);
    out->insert(out->end(), p, p + length);
    return static_cast<la_ssize_t>(length);
}

void check(archive* a, const int r, const char* what) {
    if (r < ARCHIVE_WARN) {
        const char* msg = archive_error_string(a);
        throw std::runtime_error(std::string(what) + ": " + (msg ? msg : "libarchive error"));
    }
}

void write_member(archive* a, const ArchiveMember& m) {
    archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, m.path.c_str());
    archive_entry_set_mtime(entry, 0, 0);
    if (m.directory) {
        archive_entry_set_filetype(entry, AE_IFDIR);
        archive_entry_set_perm(entry, 0755);
        archive_entry_set_size(entry, 0);
    } else {
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(m.content.size()));
    }
    const int r = archive_write_header(a, entry);
    archive_entry_free(entry);
    check(a, r, "archive_write_header");
    if (!m.directory && !m.content.empty()) {
        if (archive_write_data(a, m.content.data(), m.content.size()) < 0) {
            check(a, ARCHIVE_FATAL, "archive_write_data");
        }
    }
}

struct WriterDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
using WriterPtr = std::unique_ptr<archive, WriterDeleter>;

} // namespace

Bytes to_bytes(const std::string_view s) {
    return {s.begin(), s.end()};
}

Bytes make_archive(const ArchiveKind kind, const std::vector<ArchiveMember>& members) {
    Bytes out;
    WriterPtr a(archive_write_new());
    switch (kind) {
        case ArchiveKind::Zip:
            archive_write_set_format_zip(a.get());
            break;
        case ArchiveKind::Tar:
            archive_write_set_format_pax_restricted(a.get());
            break;
        case ArchiveKind::TarGz:
            archive_write_set_format_pax_restricted(a.get());
            archive_write_add_filter_gzip(a.get());
            break;
    }
    archive_write_set_bytes_in_last_block(a.get(), 1);
    check(a.get(), archive_write_open(a.get(), &out, nullptr, append_cb, nullptr), "archive_write_open");
    for (const auto& m : members) {
        write_member(a.get(), m);
    }
    check(a.get(), archive_write_close(a.get()), "archive_write_close");
    return out;
}

Bytes gzip_bytes(const std::string_view content) {
    Bytes out;
    WriterPtr a(archive_write_new());
    archive_write_set_format_raw(a.get());
    archive_write_add_filter_gzip(a.get());
    check(a.get(), archive_write_open(a.get(), &out, nullptr, append_cb, nullptr), "archive_write_open");
    write_member(a.get(), ArchiveMember{"source", std::string(content)});
    check(a.get(), archive_write_close(a.get()), "archive_write_close");
    return out;
}

Bytes make_pdf(const std::string& title, const std::string& text) {
    QPDF pdf;
    pdf.emptyPDF();

    QPDFObjectHandle font = pdf.makeIndirectObject(
        QPDFObjectHandle::parse("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"));
    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);

    QPDFObjectHandle contents =
        QPDFObjectHandle::newStream(&pdf, "BT /F1 12 Tf 72 720 Td (" + text + ") Tj ET\n");

    QPDFObjectHandle page = pdf.makeIndirectObject(
        QPDFObjectHandle::parse("<< /Type /Page /MediaBox [0 0 612 792] >>"));
    page.replaceKey("/Contents", contents);
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(page), false);

    QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
    info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(title));
    info.replaceKey("/Producer", QPDFObjectHandle::newUnicodeString("texharvest tests"));
    pdf.getTrailer().replaceKey("/Info", pdf.makeIndirectObject(info));

    QPDFWriter writer(pdf);
    writer.setOutputMemory();
    writer.write();
    auto buffer = writer.getBufferSharedPointer();
    return {buffer->getBuffer(), buffer->getBuffer() + buffer->getSize()};
}

TempDir make_test_dir(const std::string_view name) {
    std::error_code ec;
    auto dir = make_temp_dir_for(name, "test", {}, ec);
    if (ec) {
        throw std::runtime_error("can't create test dir: " + ec.message());
    }
    return TempDir(std::move(dir), "tests");
}

std::filesystem::path write_script(const std::filesystem::path& dir,
                                   const std::string& name,
                                   const std::string& body) {
    const auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all
                                     | std::filesystem::perms::group_read | std::filesystem::perms::group_exec
                                     | std::filesystem::perms::others_read | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

// --- ScopedLogCapture ---

namespace {

class CaptureSink final : public ILogSink {
public:
    using Sink = std::function<void(LogLevel, std::string_view, std::string_view)>;
    explicit CaptureSink(Sink sink) : sink_(std::move(sink)) {}
    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        sink_(level, message, tag);
    }

private:
    Sink sink_;
};

} // namespace

ScopedLogCapture::ScopedLogCapture() : state_(std::make_shared<State>()) {
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<CaptureSink>(
        [state = state_](const LogLevel level, const std::string_view message, const std::string_view tag) {
            std::lock_guard lock(state->mtx);
            state->entries.push_back({level, std::string(tag), std::string(message)});
        }));
}

ScopedLogCapture::~ScopedLogCapture() {
    Logger::clear_sinks();
}

std::vector<ScopedLogCapture::Entry> ScopedLogCapture::entries() const {
    std::lock_guard lock(state_->mtx);
    return state_->entries;
}

bool ScopedLogCapture::contains(const std::string_view tag, const std::string_view fragment) const {
    std::lock_guard lock(state_->mtx);
    for (const auto& e : state_->entries) {
        if (e.tag == tag && e.message.find(fragment) != std::string::npos) return true;
    }
    return false;
}

// --- FakeClock ---

IClock::time_point FakeClock::now() const {
    std::lock_guard lock(mtx_);
    return now_;
}

bool FakeClock::sleep_for(const duration d, std::stop_token st) {
    if (st.stop_requested()) return false;
    std::lock_guard lock(mtx_);
    ++sleeps_;
    if (d > duration::zero()) {
        now_ += d;
        slept_ += d;
    }
    return true;
}

void FakeClock::advance(const duration d) {
    std::lock_guard lock(mtx_);
    now_ += d;
}

size_t FakeClock::sleeps() const {
    std::lock_guard lock(mtx_);
    return sleeps_;
}

IClock::duration FakeClock::slept() const {
    std::lock_guard lock(mtx_);
    return slept_;
}

// --- FakeTransport ---

void FakeTransport::respond(const std::string& url, const long status, Bytes body) {
    respond_with(url, [status, body = std::move(body)](const std::string&) -> Outcome<HttpResponse> {
        return HttpResponse{status, body};
    });
}

void FakeTransport::respond_with(const std::string& url, Handler handler) {
    std::lock_guard lock(mtx_);
    handlers_[url] = std::move(handler);
}

size_t FakeTransport::calls_for(const std::string& url) const {
    std::lock_guard lock(mtx_);
    const auto it = per_url_.find(url);
    return it == per_url_.end() ? 0 : it->second;
}

Outcome<HttpResponse> FakeTransport::get(const std::string& url,
                                         std::chrono::milliseconds,
                                         std::stop_token st) {
    ++calls_;
    const size_t now_in_flight = ++in_flight_;
    size_t seen = max_in_flight_.load();
    while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {}

    Handler handler;
    {
        std::lock_guard lock(mtx_);
        ++per_url_[url];
        if (const auto it = handlers_.find(url); it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }

    Outcome<HttpResponse> result = st.stop_requested()
        ? Outcome<HttpResponse>(PipelineError::cancelled("request cancelled"))
        : handler ? handler(url) : Outcome<HttpResponse>(HttpResponse{404, {}});
    --in_flight_;
    return result;
}

} // namespace texharvest::test_support
