/**
 * @file file_utils.hpp
 * @brief Temporary workspaces and FileSet materialisation.
 */

#ifndef TEXHARVEST_FILE_UTILS_HPP
#define TEXHARVEST_FILE_UTILS_HPP

#include "file_set.hpp"
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace texharvest {

    /**
     * @brief Opens a file with the C stdio API.
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Creates a fresh, exclusive temporary directory.
     *
     * The directory is named "{prefix}_{stem}_{random_suffix}" and lives in
     * @p work_root, or in "<system temp>/texharvest" when @p work_root is empty.
     * A name that already exists is never reused.
     *
     * @param ec Set on failure; the returned path is then empty.
     */
    std::filesystem::path make_temp_dir_for(std::string_view stem,
                                            std::string_view prefix,
                                            const std::filesystem::path& work_root,
                                            std::error_code& ec);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param tag The logger tag of the caller.
     * @details Never throws; a failure while logging is written to stderr.
     */
    void cleanup_temp_dir(const std::filesystem::path& dir,
                          std::string_view tag = "file_utils") noexcept;

    /**
     * @brief Writes every entry of @p files below @p root, creating
     * intermediate directories for nested paths.
     * @return false (with @p ec set) on the first failure.
     */
    bool write_file_set(const std::filesystem::path& root, const FileSet& files, std::error_code& ec);

    /**
     * @brief Reads a whole file.
     * @return The content, or std::nullopt if the file cannot be read.
     */
    std::optional<Bytes> read_file(const std::filesystem::path& path);

    /**
     * @brief Recursively copies @p from into a new directory @p to.
     */
    bool copy_tree(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec);

    /**
     * @brief Owns a temporary directory and removes it on destruction.
     */
    class TempDir {
    public:
        TempDir() = default;
        TempDir(std::filesystem::path path, std::string tag) : path_(std::move(path)), tag_(std::move(tag)) {}
        ~TempDir() { reset(); }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;
        TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)), tag_(std::move(other.tag_)) {
            other.path_.clear();
        }
        TempDir& operator=(TempDir&& other) noexcept {
            if (this != &other) {
                reset();
                path_ = std::move(other.path_);
                tag_ = std::move(other.tag_);
                other.path_.clear();
            }
            return *this;
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
        [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }

        void reset() noexcept {
            if (!path_.empty()) {
                cleanup_temp_dir(path_, tag_);
                path_.clear();
            }
        }

    private:
        std::filesystem::path path_;
        std::string tag_ = "file_utils";
    };

} // namespace texharvest

#endif // TEXHARVEST_FILE_UTILS_HPP
