/**
 * @file main_file_resolver.hpp
 * @brief Picks the compilation entry point of an extracted source tree.
 */

#ifndef TEXHARVEST_MAIN_FILE_RESOLVER_HPP
#define TEXHARVEST_MAIN_FILE_RESOLVER_HPP

#include "file_set.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Deterministic main-file heuristic.
 *
 * @details Rules, first match wins:
 * 1. a file whose basename equals (case-insensitively) one of
 *    main.tex, paper.tex, manuscript.tex, article.tex, in that priority;
 * 2. the first .tex file, in FileSet order, containing `\documentclass`
 *    in any letter case (files containing NUL bytes are not examined);
 * 3. the first .tex file;
 * 4. none.
 */
class MainFileResolver {
public:
    [[nodiscard]] static std::optional<std::string> resolve(const FileSet& files);

    /// @return true if @p path has a .tex extension (any case).
    [[nodiscard]] static bool is_tex_path(std::string_view path);
};

} // namespace texharvest

#endif // TEXHARVEST_MAIN_FILE_RESOLVER_HPP
