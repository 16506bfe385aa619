/**
 * @file archive_extractor.hpp
 * @brief Decodes downloaded archives (zip, tar with any compression) into a FileSet.
 */

#ifndef TEXHARVEST_ARCHIVE_EXTRACTOR_HPP
#define TEXHARVEST_ARCHIVE_EXTRACTOR_HPP

#include "errors.hpp"
#include "file_set.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Extracts archive members into memory using libarchive.
 *
 * @details Formats are tried in a fixed order: zip, then tar under any
 * compression filter libarchive knows (gzip, bzip2, xz, zstd, ...).
 * Directory entries are not stored; links and special files are skipped.
 *
 * Extraction fails with an Extraction error when:
 * - the archive holds more than @p max_files members (directories included);
 * - neither format can be read;
 * - any member path is absolute or normalises to a location outside the
 *   extraction root (e.g. "../x.tex"), whatever the member type.
 *
 * Identical input bytes always yield an identical FileSet, in member order.
 *
 * When constructed with accept_bare_source, input that is neither zip nor
 * tar is also tried as a single (optionally gzip-compressed) source file;
 * it is accepted when it contains a document-class or begin-document
 * marker and stored as `<fallback_name>.tex`.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(bool accept_bare_source = false) noexcept
        : accept_bare_source_(accept_bare_source) {}

    /**
     * @brief Extract all regular-file members of @p data.
     * @param data Archive bytes.
     * @param max_files Maximum number of members.
     * @param fallback_name Stem used for a bare source file.
     */
    [[nodiscard]] Outcome<FileSet> extract(const Bytes& data,
                                           size_t max_files,
                                           std::string_view fallback_name = "main") const;

    /**
     * @brief Normalise an archive member name to a safe relative path.
     * @return The generic relative path, or std::nullopt if the name is
     * empty, absolute, or escapes the extraction root.
     */
    [[nodiscard]] static std::optional<std::string> safe_relative_path(std::string_view entry_name);

private:
    bool accept_bare_source_;
};

} // namespace texharvest

#endif // TEXHARVEST_ARCHIVE_EXTRACTOR_HPP
