/**
 * @file file_set.hpp
 * @brief In-memory mapping of relative archive paths to their contents.
 */

#ifndef TEXHARVEST_FILE_SET_HPP
#define TEXHARVEST_FILE_SET_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace texharvest {

using Bytes = std::vector<unsigned char>;

/**
 * @brief Relative path → content mapping produced by ArchiveExtractor.
 *
 * @details Iteration follows insertion order, which for extracted archives is
 * the member order inside the archive, so identical archive bytes always give
 * identical iteration. Assigning an existing path replaces its content but
 * keeps its original position.
 *
 * A FileSet is owned by exactly one pipeline run and is never shared between
 * concurrent runs.
 */
class FileSet {
public:
    using Entry = std::pair<std::string, Bytes>;
    using const_iterator = std::vector<Entry>::const_iterator;

    FileSet() = default;

    /**
     * @brief Insert or replace the content stored at @p path.
     */
    void insert_or_assign(std::string path, Bytes content);

    /// @return Pointer to the content for @p path, or nullptr if absent.
    [[nodiscard]] const Bytes* find(std::string_view path) const;

    [[nodiscard]] bool contains(std::string_view path) const { return find(path) != nullptr; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @return Sum of all content sizes in bytes.
    [[nodiscard]] size_t total_bytes() const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * @brief View raw bytes as text without any decoding.
 */
[[nodiscard]] inline std::string_view as_text(const Bytes& bytes) noexcept {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

} // namespace texharvest

#endif // TEXHARVEST_FILE_SET_HPP
