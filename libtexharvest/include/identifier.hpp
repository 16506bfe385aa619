/**
 * @file identifier.hpp
 * @brief Paper identifier validation.
 */

#ifndef TEXHARVEST_IDENTIFIER_HPP
#define TEXHARVEST_IDENTIFIER_HPP

#include "errors.hpp"
#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Check that @p raw is a well-formed paper identifier.
 *
 * Accepted shapes, surrounding whitespace ignored:
 * - new style: `YYMM.NNNN` or `YYMM.NNNNN`, optional `vN` suffix
 *   (e.g. "2404.04895v2");
 * - old style: `subject-class/YYMMNNN`, optional `vN` suffix, where the
 *   subject class may contain '.' and '-' (e.g. "hep-th/9901001",
 *   "cond-mat.mes-hall/0401001v3").
 *
 * @return The trimmed identifier, or a Validation error.
 */
[[nodiscard]] Outcome<std::string> validate_identifier(std::string_view raw);

} // namespace texharvest

#endif // TEXHARVEST_IDENTIFIER_HPP
