#include "ckg/extraction/lexical.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace ckg::extraction::lexical {

    namespace {

        /**
         * Skips a quoted literal starting at @p pos. Single- and double-quoted
         * literals also end at a newline so that an apostrophe in a comment
         * or a Rust lifetime does not swallow the rest of the file.
         */
        std::size_t skip_literal(const std::string_view content, std::size_t pos) {
            const char quote = content[pos];
            const bool multiline = quote == '`';
            ++pos;
            while (pos < content.size()) {
                const char c = content[pos];
                if (c == '\\') {
                    pos += 2;
                    continue;
                }
                if (c == quote) {
                    return pos + 1;
                }
                if (c == '\n' && !multiline) {
                    return pos;
                }
                ++pos;
            }
            return content.size();
        }

        std::size_t indentation_of_line(const std::string_view content, const std::size_t line_start) {
            std::size_t width = 0;
            for (std::size_t i = line_start; i < content.size(); ++i) {
                if (content[i] == ' ') {
                    ++width;
                } else if (content[i] == '\t') {
                    width += 4;
                } else {
                    break;
                }
            }
            return width;
        }

    }  // namespace

    std::optional<std::size_t> match_brace(const std::string_view content, const std::size_t open) {
        if (open >= content.size() || content[open] != '{') {
            return std::nullopt;
        }

        std::size_t depth = 0;
        std::size_t pos = open;
        while (pos < content.size()) {
            const char c = content[pos];

            if (c == '/' && pos + 1 < content.size()) {
                if (content[pos + 1] == '/') {
                    const auto eol = content.find('\n', pos);
                    pos = eol == std::string_view::npos ? content.size() : eol;
                    continue;
                }
                if (content[pos + 1] == '*') {
                    const auto close = content.find("*/", pos + 2);
                    pos = close == std::string_view::npos ? content.size() : close + 2;
                    continue;
                }
            }

            if (c == '"' || c == '\'' || c == '`') {
                pos = skip_literal(content, pos);
                continue;
            }

            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    return pos;
                }
            }
            ++pos;
        }

        return std::nullopt;
    }

    std::optional<std::size_t> find_body_open(const std::string_view content, const std::size_t from) {
        for (std::size_t pos = from; pos < content.size(); ++pos) {
            if (content[pos] == '{') {
                return pos;
            }
            if (content[pos] == ';') {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::size_t indented_block_end(const std::string_view content, const std::size_t header_offset) {
        const auto header_line_start = content.rfind('\n', header_offset == 0 ? 0 : header_offset - 1);
        const std::size_t header_start = header_line_start == std::string_view::npos ? 0 : header_line_start + 1;
        const std::size_t header_indent = indentation_of_line(content, header_start);

        auto line_start = content.find('\n', header_offset);
        while (line_start != std::string_view::npos) {
            ++line_start;
            const auto line_end = std::min(content.find('\n', line_start), content.size());
            const auto line = string_utils::trim(content.substr(line_start, line_end - line_start));
            if (!line.empty() && !string_utils::starts_with(line, "#") &&
                indentation_of_line(content, line_start) <= header_indent) {
                return line_start;
            }
            if (line_end >= content.size()) {
                break;
            }
            line_start = line_end;
        }
        return content.size();
    }

    std::size_t count_keywords(
        const std::string_view text,
        const std::unordered_set<std::string_view>& keywords
    ) {
        std::size_t count = 0;
        std::size_t pos = 0;
        while (pos < text.size()) {
            if (!string_utils::is_identifier_char(text[pos])) {
                ++pos;
                continue;
            }
            const std::size_t start = pos;
            while (pos < text.size() && string_utils::is_identifier_char(text[pos])) {
                ++pos;
            }
            if (keywords.contains(text.substr(start, pos - start))) {
                ++count;
            }
        }
        return count;
    }

    const std::unordered_set<std::string_view>& conditional_keywords() {
        static const std::unordered_set<std::string_view> keywords = {
            "if", "else", "switch", "case", "while", "for"
        };
        return keywords;
    }

    double function_complexity(const std::string_view body) {
        const auto conditionals = static_cast<double>(count_keywords(body, conditional_keywords()));
        const auto lines = static_cast<double>(file_utils::count_lines(body));
        return std::min(10.0, conditionals + lines / 10.0);
    }

    std::string_view previous_word(const std::string_view content, std::size_t offset) {
        offset = std::min(offset, content.size());
        while (offset > 0 && std::isspace(static_cast<unsigned char>(content[offset - 1]))) {
            --offset;
        }
        const std::size_t end = offset;
        while (offset > 0 && string_utils::is_identifier_char(content[offset - 1])) {
            --offset;
        }
        return content.substr(offset, end - offset);
    }

    std::size_t longest_line(const std::string_view content) {
        std::size_t longest = 0;
        std::size_t start = 0;
        while (start <= content.size()) {
            const auto eol = std::min(content.find('\n', start), content.size());
            longest = std::max(longest, eol - start);
            start = eol + 1;
        }
        return longest;
    }

    bool is_valid_identifier(const std::string_view name) {
        if (name.empty()) {
            return false;
        }
        const auto first = static_cast<unsigned char>(name.front());
        if (!std::isalpha(first) && name.front() != '_' && name.front() != '$') {
            return false;
        }
        return std::ranges::all_of(name, string_utils::is_identifier_char);
    }

}  // namespace ckg::extraction::lexical
