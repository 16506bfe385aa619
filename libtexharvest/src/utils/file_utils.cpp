#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <exception>
#include <memory>

namespace texharvest {

    namespace {
        struct FileCloser {
            void operator()(FILE* f) const noexcept { std::fclose(f); }
        };
        using FilePtr = std::unique_ptr<FILE, FileCloser>;

        constexpr int kMaxNameAttempts = 16;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    std::filesystem::path make_temp_dir_for(const std::string_view stem,
                                            const std::string_view prefix,
                                            const std::filesystem::path& work_root,
                                            std::error_code& ec) {
        ec.clear();
        std::filesystem::path base = work_root;
        if (base.empty()) {
            base = std::filesystem::temp_directory_path(ec) / "texharvest";
            if (ec) return {};
        }

        std::filesystem::create_directories(base, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create work root: " + base.string() + " (" + ec.message() + ")",
                "file_utils");
            return {};
        }

        for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
            auto dir = base / (std::string(prefix) + "_" + std::string(stem) + "_" + RandomUtils::random_suffix());
            // create_directory reports false, without error, when the name is taken
            if (std::filesystem::create_directory(dir, ec)) {
                return dir;
            }
            if (ec) {
                Logger::log(LogLevel::Error,
                    "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                    "file_utils");
                return {};
            }
        }
        ec = std::make_error_code(std::errc::file_exists);
        return {};
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) noexcept {
        try {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
            } else {
                Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
            }
        } catch (const std::exception& e) {
            // Runs from destructors: report without allocating.
            std::fputs("texharvest: temp dir cleanup failed: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
    }

    bool write_file_set(const std::filesystem::path& root, const FileSet& files, std::error_code& ec) {
        ec.clear();
        for (const auto& [relative, content] : files) {
            const auto target = root / std::filesystem::path(relative);
            if (target.has_parent_path()) {
                std::filesystem::create_directories(target.parent_path(), ec);
                if (ec) return false;
            }

            FilePtr f(open_file(target, "wb"));
            if (!f) {
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            if (!content.empty() && std::fwrite(content.data(), 1, content.size(), f.get()) != content.size()) {
                ec = std::make_error_code(std::errc::io_error);
                return false;
            }
        }
        return true;
    }

    std::optional<Bytes> read_file(const std::filesystem::path& path) {
        FilePtr f(open_file(path, "rb"));
        if (!f) return std::nullopt;

        Bytes out;
        unsigned char buffer[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), f.get())) > 0) {
            out.insert(out.end(), buffer, buffer + n);
        }
        if (std::ferror(f.get())) return std::nullopt;
        return out;
    }

    bool copy_tree(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
        if (to.has_parent_path()) {
            std::filesystem::create_directories(to.parent_path(), ec);
            if (ec) return false;
        }
        std::filesystem::copy(from, to, std::filesystem::copy_options::recursive, ec);
        return !ec;
    }

} // namespace texharvest
