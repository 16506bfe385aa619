#include "../../include/identifier.hpp"
#include <regex>

namespace texharvest {

namespace {

// Longer than any real identifier; keeps the regex matcher's recursion shallow.
constexpr size_t kMaxIdentifierLength = 64;

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

Outcome<std::string> validate_identifier(const std::string_view raw) {
    static const std::regex new_style(R"(^\d{4}\.\d{4,5}(v\d+)?$)");
    static const std::regex old_style(R"(^[A-Za-z][A-Za-z0-9]*([.-][A-Za-z0-9]+)*/\d{7}(v\d+)?$)");

    const auto trimmed = trim(raw);
    if (trimmed.empty()) {
        return PipelineError::validation("empty identifier");
    }
    if (trimmed.size() > kMaxIdentifierLength) {
        return PipelineError::validation("Invalid identifier format: " + std::to_string(trimmed.size())
                                         + " characters is too long");
    }
    std::string id(trimmed);
    if (std::regex_match(id, new_style) || std::regex_match(id, old_style)) {
        return id;
    }
    return PipelineError::validation("Invalid identifier format: " + std::string(raw));
}

} // namespace texharvest
