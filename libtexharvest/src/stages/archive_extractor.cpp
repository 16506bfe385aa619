#include "../../include/archive_extractor.hpp"
#include "../../include/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace texharvest {

namespace {

constexpr const char* kTag = "ArchiveExtractor";

enum class Container { Zip, Tar, Bare };

const char* container_name(const Container c) {
    switch (c) {
        case Container::Zip: return "zip";
        case Container::Tar: return "tar";
        case Container::Bare: return "bare source";
    }
    return "unknown";
}

struct ArchiveDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};
using ArchivePtr = std::unique_ptr<archive, ArchiveDeleter>;

// NotThisFormat lets the caller try the next container; Fatal ends extraction.
struct ReadFailure {
    bool fatal;
    std::string message;
};

using ReadResult = std::variant<FileSet, ReadFailure>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

ArchivePtr open_reader(const Bytes& data, const Container kind) {
    ArchivePtr a(archive_read_new());
    if (!a) return a;

    switch (kind) {
        case Container::Zip:
            archive_read_support_filter_none(a.get());
            archive_read_support_format_zip(a.get());
            break;
        case Container::Tar:
            archive_read_support_filter_all(a.get());
            archive_read_support_format_tar(a.get());
            break;
        case Container::Bare:
            archive_read_support_filter_gzip(a.get());
            archive_read_support_format_raw(a.get());
            break;
    }
    archive_read_set_options(a.get(), "hdrcharset=UTF-8");

    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        Logger::log(LogLevel::Debug,
                    std::string("Not a ") + container_name(kind) + " container: " + archive_message(a.get()),
                    kTag);
        return nullptr;
    }
    return a;
}

bool read_member(archive* a, Bytes& out) {
    std::vector<unsigned char> buffer(64 * 1024);
    la_ssize_t n = 0;
    while ((n = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
        out.insert(out.end(), buffer.begin(), buffer.begin() + n);
    }
    return n == 0;
}

ReadResult read_members(const Bytes& data, const Container kind, const size_t max_files) {
    ArchivePtr a = open_reader(data, kind);
    if (!a) {
        return ReadFailure{false, std::string("not a ") + container_name(kind) + " archive"};
    }

    FileSet files;
    size_t members = 0;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (++members > max_files) {
            return ReadFailure{true, "Archive contains more than " + std::to_string(max_files) + " files"};
        }

        const char* raw_name = archive_entry_pathname(entry);
        const auto name = ArchiveExtractor::safe_relative_path(raw_name ? raw_name : "");
        if (!name) {
            return ReadFailure{true, "Archive member escapes extraction root: "
                                         + std::string(raw_name ? raw_name : "")};
        }

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR || archive_entry_hardlink(entry) != nullptr) {
            archive_read_data_skip(a.get());
            continue;
        }
        if (type != AE_IFREG) {
            Logger::log(LogLevel::Debug, "Skipping non-regular member: " + *name, kTag);
            archive_read_data_skip(a.get());
            continue;
        }
        if (*name == ".") {
            return ReadFailure{true, "Archive file member names the extraction root: "
                                         + std::string(raw_name ? raw_name : "")};
        }

        Bytes content;
        if (!read_member(a.get(), content)) {
            return ReadFailure{true, "Corrupt " + std::string(container_name(kind)) + " member " + *name
                                         + ": " + archive_message(a.get())};
        }
        files.insert_or_assign(*name, std::move(content));
    }

    if (r != ARCHIVE_EOF) {
        // A reader that fails before the first member has not recognised the data.
        const bool fatal = members > 0;
        return ReadFailure{fatal, std::string("Corrupt ") + container_name(kind) + " archive: "
                                      + archive_message(a.get())};
    }
    return files;
}

bool looks_like_source(const Bytes& content) {
    const auto text = as_text(content);
    return text.find("\\documentclass") != std::string_view::npos
        || text.find("\\begin{document}") != std::string_view::npos;
}

} // namespace

std::optional<std::string> ArchiveExtractor::safe_relative_path(const std::string_view entry_name) {
    if (entry_name.empty()) return std::nullopt;
    if (entry_name.find('\0') != std::string_view::npos) return std::nullopt;

    std::string s(entry_name);
    for (auto& c : s) { if (c == '\\') c = '/'; }
    if (s.front() == '/') return std::nullopt;
    if (s.size() >= 2 && s[1] == ':') return std::nullopt;

    const fs::path normalized = fs::path(s).lexically_normal();
    if (normalized.empty() || normalized.is_absolute()) return std::nullopt;

    const auto first = *normalized.begin();
    if (first == "..") return std::nullopt;

    std::string out = normalized.generic_string();
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (out.empty() || out == ".") {
        // "./" names the root itself; only directories may carry it.
        return std::string(".");
    }
    return out;
}

Outcome<FileSet> ArchiveExtractor::extract(const Bytes& data,
                                           const size_t max_files,
                                           const std::string_view fallback_name) const {
    if (data.empty()) {
        return PipelineError::extraction("Empty archive");
    }

    for (const auto kind : {Container::Zip, Container::Tar}) {
        auto result = read_members(data, kind, max_files);
        if (auto* files = std::get_if<FileSet>(&result)) {
            Logger::log(LogLevel::Debug,
                        "Extracted " + std::to_string(files->size()) + " files from "
                            + container_name(kind) + " archive",
                        kTag);
            return std::move(*files);
        }
        const auto& failure = std::get<ReadFailure>(result);
        if (failure.fatal) {
            Logger::log(LogLevel::Error, failure.message, kTag);
            return PipelineError::extraction(failure.message);
        }
    }

    if (accept_bare_source_) {
        if (ArchivePtr a = open_reader(data, Container::Bare)) {
            archive_entry* entry = nullptr;
            Bytes content;
            if (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK
                && read_member(a.get(), content) && looks_like_source(content)) {
                FileSet files;
                files.insert_or_assign(std::string(fallback_name) + ".tex", std::move(content));
                Logger::log(LogLevel::Info, "Accepted bare source file as " + std::string(fallback_name) + ".tex",
                            kTag);
                return files;
            }
        }
    }

    Logger::log(LogLevel::Error, "Unrecognised archive format", kTag);
    return PipelineError::extraction("Failed to extract archive: neither zip nor tar");
}

} // namespace texharvest
