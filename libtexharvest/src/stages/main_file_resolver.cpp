#include "../../include/main_file_resolver.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace texharvest {

namespace {

constexpr std::array<std::string_view, 4> kPreferredNames = {
    "main.tex", "paper.tex", "manuscript.tex", "article.tex"
};

std::string to_lower_copy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view basename_of(std::string_view path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

bool declares_document_class(const Bytes& content) {
    const auto text = as_text(content);
    if (text.find('\0') != std::string_view::npos) return false;
    return to_lower_copy(text).find("\\documentclass") != std::string::npos;
}

} // namespace

bool MainFileResolver::is_tex_path(const std::string_view path) {
    const auto name = basename_of(path);
    if (name.size() < 4) return false;
    return to_lower_copy(name.substr(name.size() - 4)) == ".tex";
}

std::optional<std::string> MainFileResolver::resolve(const FileSet& files) {
    for (const auto preferred : kPreferredNames) {
        for (const auto& [path, content] : files) {
            if (to_lower_copy(basename_of(path)) == preferred) {
                Logger::log(LogLevel::Debug, "Main file by name: " + path, "MainFileResolver");
                return path;
            }
        }
    }

    for (const auto& [path, content] : files) {
        if (is_tex_path(path) && declares_document_class(content)) {
            Logger::log(LogLevel::Debug, "Main file by document class: " + path, "MainFileResolver");
            return path;
        }
    }

    for (const auto& [path, content] : files) {
        if (is_tex_path(path)) {
            Logger::log(LogLevel::Debug, "Main file by extension: " + path, "MainFileResolver");
            return path;
        }
    }
    return std::nullopt;
}

} // namespace texharvest
