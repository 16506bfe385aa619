#include "../../include/markup_text_extractor.hpp"

#include <array>
#include <cctype>

namespace texharvest {

namespace {

constexpr std::string_view kEquation = " [EQUATION] ";
constexpr std::string_view kMath = " [MATH] ";

constexpr std::array<std::string_view, 6> kDisplayEnvironments = {
    "equation", "align", "gather", "multline", "eqnarray", "displaymath"
};

// A character is escaped when an odd number of backslashes precede it.
bool is_escaped(std::string_view text, size_t pos) {
    size_t backslashes = 0;
    while (pos > 0 && text[pos - 1] == '\\') {
        ++backslashes;
        --pos;
    }
    return backslashes % 2 == 1;
}

size_t find_unescaped(std::string_view text, std::string_view needle, size_t from) {
    for (size_t pos = text.find(needle, from); pos != std::string_view::npos; pos = text.find(needle, pos + 1)) {
        if (!is_escaped(text, pos)) return pos;
    }
    return std::string_view::npos;
}

bool is_display_environment(std::string_view name) {
    if (!name.empty() && name.back() == '*') name.remove_suffix(1);
    for (const auto env : kDisplayEnvironments) {
        if (name == env) return true;
    }
    return false;
}

// Environment name at text[pos] == '\\' when it starts "\begin{name}".
std::string_view begin_environment_at(std::string_view text, size_t pos, size_t& after) {
    constexpr std::string_view begin = "\\begin{";
    if (text.compare(pos, begin.size(), begin) != 0) return {};
    const size_t name_start = pos + begin.size();
    const size_t close = text.find('}', name_start);
    if (close == std::string_view::npos) return {};
    after = close + 1;
    return text.substr(name_start, close - name_start);
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string unescape_literals(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && (text[i + 1] == '%' || text[i + 1] == '$')) {
            out.push_back(text[++i]);
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

bool is_ascii_letter(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Memoised forward search for one character. Callers only move forward, so
// a hit at or after the new start is still the first one.
class ForwardFind {
public:
    ForwardFind(std::string_view text, char c) : text_(text), c_(c) {}

    size_t from(size_t pos) {
        if (!searched_ || pos > hit_) {
            hit_ = text_.find(c_, pos);
            searched_ = true;
        }
        return hit_;
    }

private:
    std::string_view text_;
    char c_;
    size_t hit_ = std::string_view::npos;
    bool searched_ = false;
};

// Drops "\begin{..}" and "\end{..}" markers.
std::string drop_environment_markers(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    ForwardFind close_brace(text, '}');
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\\') {
            size_t name = std::string_view::npos;
            if (text.compare(i + 1, 6, "begin{") == 0) name = i + 7;
            else if (text.compare(i + 1, 4, "end{") == 0) name = i + 5;
            if (name != std::string_view::npos) {
                const size_t close = close_brace.from(name);
                if (close != std::string_view::npos) {
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

// Replaces "\cmd{x}" and "\cmd[opt]{x}" with x.
std::string unwrap_commands(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    ForwardFind close_brace(text, '}');
    ForwardFind close_bracket(text, ']');
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\\') {
            size_t pos = i + 1;
            while (pos < text.size() && is_ascii_letter(text[pos])) ++pos;
            if (pos > i + 1 && pos < text.size() && text[pos] == '[') {
                const size_t close = close_bracket.from(pos + 1);
                pos = close == std::string_view::npos ? text.size() : close + 1;
            }
            if (pos > i + 1 && pos < text.size() && text[pos] == '{') {
                const size_t close = close_brace.from(pos + 1);
                if (close != std::string_view::npos) {
                    out.append(text.substr(pos + 1, close - pos - 1));
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

} // namespace

std::string MarkupTextExtractor::strip_comments(std::string_view source) {
    std::string out;
    out.reserve(source.size());
    size_t i = 0;
    while (i < source.size()) {
        if (source[i] == '%' && !is_escaped(source, i)) {
            const size_t eol = source.find('\n', i);
            if (eol == std::string_view::npos) break;
            i = eol;
            continue;
        }
        out.push_back(source[i++]);
    }
    return out;
}

std::string MarkupTextExtractor::replace_math(std::string_view source) {
    std::string display;
    display.reserve(source.size());

    // Display math first, so "$$" is never read as two inline delimiters.
    size_t i = 0;
    while (i < source.size()) {
        if (source[i] == '\\' && !is_escaped(source, i)) {
            size_t after = 0;
            const auto env = begin_environment_at(source, i, after);
            if (!env.empty() && is_display_environment(env)) {
                const std::string end_marker = "\\end{" + std::string(env) + "}";
                const size_t end = source.find(end_marker, after);
                if (end != std::string_view::npos) {
                    display += kEquation;
                    i = end + end_marker.size();
                    continue;
                }
            }
            if (source.compare(i, 2, "\\[") == 0) {
                const size_t end = find_unescaped(source, "\\]", i + 2);
                if (end != std::string_view::npos) {
                    display += kEquation;
                    i = end + 2;
                    continue;
                }
            }
        }
        if (source.compare(i, 2, "$$") == 0 && !is_escaped(source, i)) {
            const size_t end = find_unescaped(source, "$$", i + 2);
            if (end != std::string_view::npos) {
                display += kEquation;
                i = end + 2;
                continue;
            }
        }
        display.push_back(source[i++]);
    }

    const std::string_view text = display;
    std::string out;
    out.reserve(text.size());
    i = 0;
    while (i < text.size()) {
        if (text[i] == '$' && !is_escaped(text, i)) {
            const size_t end = find_unescaped(text, "$", i + 1);
            if (end != std::string_view::npos) {
                out += kMath;
                i = end + 1;
                continue;
            }
        }
        if (text.compare(i, 2, "\\(") == 0 && !is_escaped(text, i)) {
            const size_t end = find_unescaped(text, "\\)", i + 2);
            if (end != std::string_view::npos) {
                out += kMath;
                i = end + 2;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string MarkupTextExtractor::to_text(std::string_view source) {
    const std::string text = replace_math(strip_comments(source));
    return collapse_whitespace(unescape_literals(unwrap_commands(drop_environment_markers(text))));
}

} // namespace texharvest
