/**
 * @file markup_text_extractor.hpp
 * @brief Plain-text approximation of typesetting source.
 */

#ifndef TEXHARVEST_MARKUP_TEXT_EXTRACTOR_HPP
#define TEXHARVEST_MARKUP_TEXT_EXTRACTOR_HPP

#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Converts markup source into readable text.
 *
 * @details Transformations, applied in this order:
 * - line comments are removed; an escaped `\%` survives as a literal `%`;
 * - display math (`equation`, `align`, `gather`, `multline`, `eqnarray`,
 *   `displaymath`, their starred forms, `\[..\]` and `$$..$$`) becomes
 *   " [EQUATION] ";
 * - inline math (`$..$`, `\(..\)`) becomes " [MATH] ";
 * - `\begin{..}` / `\end{..}` markers are dropped, their content kept;
 * - `\cmd{x}` and `\cmd[opt]{x}` become `x` (single pass, so nested
 *   commands keep their inner markup);
 * - whitespace runs collapse to one space and the result is trimmed.
 *
 * Unterminated math is left untouched. The function never fails.
 */
class MarkupTextExtractor {
public:
    [[nodiscard]] static std::string to_text(std::string_view source);

    [[nodiscard]] static std::string strip_comments(std::string_view source);
    [[nodiscard]] static std::string replace_math(std::string_view source);
};

} // namespace texharvest

#endif // TEXHARVEST_MARKUP_TEXT_EXTRACTOR_HPP
