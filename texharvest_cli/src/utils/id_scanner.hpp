#ifndef TEXHARVEST_ID_SCANNER_HPP
#define TEXHARVEST_ID_SCANNER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Merges positional identifiers with those listed in @p ids_file.
 *
 * The file holds one identifier per line; blank lines and text after '#'
 * are ignored. "-" reads the list from stdin. Duplicates are dropped,
 * keeping the first occurrence. Identifiers are not validated here.
 *
 * @return The identifiers, or std::nullopt if @p ids_file can't be read.
 */
std::optional<std::vector<std::string>>
collect_identifiers(const std::vector<std::string>& positional,
                    const std::filesystem::path& ids_file);

#endif // TEXHARVEST_ID_SCANNER_HPP
