/**
 * @file artifact_reader.hpp
 * @brief Text and metadata recovery from rendered documents.
 */

#ifndef TEXHARVEST_ARTIFACT_READER_HPP
#define TEXHARVEST_ARTIFACT_READER_HPP

#include "errors.hpp"
#include "file_set.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Text and document information recovered from a rendered artifact.
 */
struct RenderedDocument {
    std::string text;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Reads a rendered artifact (PDF) produced by the Compiler.
 *
 * An implementation is chosen once, when the orchestrator is built.
 */
class IRenderedArtifactReader {
public:
    virtual ~IRenderedArtifactReader() = default;

    [[nodiscard]] virtual Outcome<RenderedDocument> read(const Bytes& artifact) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief qpdf-backed reader.
 *
 * @details Text comes from the text-showing operators (Tj, TJ, ', ") of each
 * page's content streams, pages separated by a blank line. Metadata keys
 * `title`, `author`, `subject`, `creator`, `producer` are copied from the
 * document information dictionary when present; `pages` is always set.
 * Text in custom font encodings is returned as raw bytes.
 */
class QpdfArtifactReader final : public IRenderedArtifactReader {
public:
    [[nodiscard]] Outcome<RenderedDocument> read(const Bytes& artifact) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "qpdf"; }
};

/**
 * @brief Reader used when rendered text extraction is disabled. Never fails.
 */
class NullArtifactReader final : public IRenderedArtifactReader {
public:
    static constexpr std::string_view kUnavailableText = "[rendered text extraction unavailable]";

    [[nodiscard]] Outcome<RenderedDocument> read(const Bytes&) const override {
        return RenderedDocument{std::string(kUnavailableText), {}};
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "null"; }
};

/**
 * @brief Selects the reader for a configuration.
 * @param read_rendered_artifacts true for the qpdf reader, false for the null reader.
 */
[[nodiscard]] std::unique_ptr<IRenderedArtifactReader> make_artifact_reader(bool read_rendered_artifacts);

} // namespace texharvest

#endif // TEXHARVEST_ARTIFACT_READER_HPP
