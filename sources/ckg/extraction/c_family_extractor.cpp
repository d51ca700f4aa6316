#include "ckg/extraction/c_family_extractor.hpp"
#include "ckg/extraction/lexical.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace ckg::extraction {

    namespace {

        constexpr double FUNCTION_IMPORTANCE = 0.7;
        constexpr double CLASS_IMPORTANCE = 0.8;
        constexpr double INTERFACE_IMPORTANCE = 0.6;

        using Iterator = std::sregex_iterator;

        std::size_t position_of(const std::smatch& match, const int group) {
            return static_cast<std::size_t>(match.position(group));
        }

        const std::unordered_set<std::string_view>& control_keywords() {
            static const std::unordered_set<std::string_view> keywords = {
                "if", "for", "while", "switch", "catch", "foreach", "using", "lock",
                "fixed", "synchronized", "return", "sizeof", "defined", "do", "else",
                "try", "new", "delete", "throw", "static_assert", "decltype", "alignas"
            };
            return keywords;
        }

        const std::unordered_set<std::string_view>& trailing_qualifiers() {
            static const std::unordered_set<std::string_view> words = {
                "const", "noexcept", "override", "final", "volatile", "mutable", "try"
            };
            return words;
        }

        const std::unordered_set<std::string_view>& access_words() {
            static const std::unordered_set<std::string_view> words = {
                "public", "protected", "private", "internal", "virtual", "final"
            };
            return words;
        }

        bool is_space(const char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        std::size_t skip_space_back(const std::string_view content, std::size_t pos) {
            while (pos > 0 && is_space(content[pos - 1])) {
                --pos;
            }
            return pos;
        }

        /**
         * Offsets of every '{' outside comments and string literals.
         */
        std::vector<std::size_t> code_braces(const std::string_view content) {
            std::vector<std::size_t> braces;
            std::size_t pos = 0;
            while (pos < content.size()) {
                const char c = content[pos];
                if (c == '/' && pos + 1 < content.size() && content[pos + 1] == '/') {
                    const auto eol = content.find('\n', pos);
                    pos = eol == std::string_view::npos ? content.size() : eol;
                    continue;
                }
                if (c == '/' && pos + 1 < content.size() && content[pos + 1] == '*') {
                    const auto close = content.find("*/", pos + 2);
                    pos = close == std::string_view::npos ? content.size() : close + 2;
                    continue;
                }
                if (c == '"' || c == '\'') {
                    ++pos;
                    while (pos < content.size() && content[pos] != c && content[pos] != '\n') {
                        pos += content[pos] == '\\' ? 2 : 1;
                    }
                    ++pos;
                    continue;
                }
                if (c == '{') {
                    braces.push_back(pos);
                }
                ++pos;
            }
            return braces;
        }

        /**
         * Finds the '(' matching the ')' at @p close, scanning backwards.
         */
        std::optional<std::size_t> match_paren_back(const std::string_view content, const std::size_t close) {
            std::size_t depth = 0;
            std::size_t pos = close + 1;
            while (pos > 0) {
                --pos;
                if (content[pos] == ')') {
                    ++depth;
                } else if (content[pos] == '(') {
                    if (--depth == 0) {
                        return pos;
                    }
                } else if (content[pos] == ';' || content[pos] == '}' || content[pos] == '{') {
                    return std::nullopt;
                }
            }
            return std::nullopt;
        }

        /**
         * Checks the text between a parameter list and its body: trailing
         * qualifiers, a Java throws clause, or a trailing return type.
         */
        bool is_function_suffix(const std::string_view suffix) {
            const auto trimmed = string_utils::trim(suffix);
            if (trimmed.empty() || string_utils::starts_with(trimmed, "->")) {
                return true;
            }

            std::vector<std::string_view> words;
            std::size_t pos = 0;
            while (pos < trimmed.size()) {
                const char c = trimmed[pos];
                if (string_utils::is_identifier_char(c)) {
                    const std::size_t start = pos;
                    while (pos < trimmed.size() && string_utils::is_identifier_char(trimmed[pos])) {
                        ++pos;
                    }
                    words.push_back(trimmed.substr(start, pos - start));
                } else if (is_space(c) || c == ',' || c == '.') {
                    ++pos;
                } else {
                    return false;
                }
            }

            if (!words.empty() && words.front() == "throws") {
                return true;
            }
            return std::ranges::all_of(words, [](const std::string_view w) {
                return trailing_qualifiers().contains(w);
            });
        }

        /**
         * Text of the declaration ending at @p offset, back to the previous
         * statement or block boundary.
         */
        std::string_view declaration_prefix(const std::string_view content, const std::size_t offset) {
            std::size_t start = offset;
            while (start > 0) {
                const char c = content[start - 1];
                if (c == ';' || c == '{' || c == '}') {
                    break;
                }
                --start;
            }
            return content.substr(start, offset - start);
        }

        bool has_word(const std::string_view text, const std::string_view word) {
            return lexical::count_keywords(text, {word}) > 0;
        }

        void extract_functions(const std::string_view content, LanguageExtraction& out) {
            for (const std::size_t open : code_braces(content)) {
                const std::size_t before_brace = skip_space_back(content, open);

                // walk back over qualifiers to the closing parenthesis
                std::size_t close = before_brace;
                while (close > 0 && content[close - 1] != ')') {
                    const char c = content[close - 1];
                    if (c == ';' || c == '{' || c == '}' || c == '=' || c == '(' || c == '#') {
                        break;
                    }
                    --close;
                }
                if (close == 0 || content[close - 1] != ')') {
                    continue;
                }
                if (!is_function_suffix(content.substr(close, before_brace - close))) {
                    continue;
                }

                const auto paren = match_paren_back(content, close - 1);
                if (!paren) {
                    continue;
                }

                const std::size_t name_end = skip_space_back(content, *paren);
                std::size_t name_start = name_end;
                while (name_start > 0 && string_utils::is_identifier_char(content[name_start - 1])) {
                    --name_start;
                }
                if (name_start == name_end) {
                    continue;
                }

                const std::string_view name = content.substr(name_start, name_end - name_start);
                if (control_keywords().contains(name)) {
                    continue;
                }

                // member initializer lists and destructors are not captured
                const std::size_t before_name = skip_space_back(content, name_start);
                if (before_name > 0) {
                    const char prev = content[before_name - 1];
                    if (prev == ',' || prev == '~' || prev == '.' ||
                        (prev == ':' && (before_name < 2 || content[before_name - 2] != ':'))) {
                        continue;
                    }
                }

                const auto prefix = declaration_prefix(content, name_start);
                std::string_view body = content.substr(open);
                if (const auto end = lexical::match_brace(content, open)) {
                    body = content.substr(open, *end - open + 1);
                }

                EntityCandidate candidate;
                candidate.type = NodeType::Function;
                candidate.name = std::string(name);
                candidate.name_offset = name_start;
                candidate.line = file_utils::line_at(content, name_start);
                candidate.importance = FUNCTION_IMPORTANCE;
                candidate.function = FunctionMetadata{
                    candidate.line,
                    has_word(prefix, "async"),
                    lexical::function_complexity(body)
                };
                add_candidate(out, std::move(candidate));
            }
        }

        std::vector<std::string> split_bases(const std::string_view text) {
            std::vector<std::string> bases;
            int depth = 0;
            std::string current;
            auto flush = [&] {
                std::string name;
                std::size_t pos = 0;
                const auto trimmed = string_utils::trim(current);
                // keep the last word that is not an access specifier
                while (pos < trimmed.size()) {
                    if (!string_utils::is_identifier_char(trimmed[pos]) && trimmed[pos] != ':' && trimmed[pos] != '.') {
                        ++pos;
                        continue;
                    }
                    const std::size_t start = pos;
                    while (pos < trimmed.size() &&
                           (string_utils::is_identifier_char(trimmed[pos]) || trimmed[pos] == ':' || trimmed[pos] == '.')) {
                        ++pos;
                    }
                    const auto word = trimmed.substr(start, pos - start);
                    if (!access_words().contains(word)) {
                        name = std::string(word);
                    }
                }
                if (const auto sep = name.find_last_of(":."); sep != std::string::npos) {
                    name = name.substr(sep + 1);
                }
                if (!name.empty()) {
                    bases.push_back(std::move(name));
                }
                current.clear();
            };
            for (const char c : text) {
                if (c == '<') {
                    ++depth;
                } else if (c == '>') {
                    --depth;
                } else if (depth == 0) {
                    if (c == ',') {
                        flush();
                    } else {
                        current += c;
                    }
                }
            }
            flush();
            return bases;
        }

        bool looks_like_interface_name(const std::string_view name) {
            return name.size() > 1 && name[0] == 'I' &&
                std::isupper(static_cast<unsigned char>(name[1]));
        }

        /**
         * Splits the text between a class name and its body into superclass
         * and implemented interfaces. Handles `extends A implements B, C`
         * (Java) and `: public A, B` (C++, C#).
         */
        void parse_heritage(std::string_view heritage, const std::string_view language, ClassMetadata& meta) {
            heritage = string_utils::trim(heritage);
            if (string_utils::starts_with(heritage, "<")) {
                int depth = 0;
                std::size_t pos = 0;
                for (; pos < heritage.size(); ++pos) {
                    if (heritage[pos] == '<') ++depth;
                    if (heritage[pos] == '>' && --depth == 0) break;
                }
                heritage = string_utils::trim(heritage.substr(std::min(pos + 1, heritage.size())));
            }

            const auto extends_pos = heritage.find("extends");
            const auto implements_pos = heritage.find("implements");
            if (extends_pos != std::string_view::npos || implements_pos != std::string_view::npos) {
                if (extends_pos != std::string_view::npos) {
                    const auto end = implements_pos != std::string_view::npos && implements_pos > extends_pos
                        ? implements_pos : heritage.size();
                    const auto bases = split_bases(heritage.substr(extends_pos + 7, end - extends_pos - 7));
                    if (!bases.empty()) {
                        meta.extends = bases.front();
                    }
                }
                if (implements_pos != std::string_view::npos) {
                    meta.implements = split_bases(heritage.substr(implements_pos + 10));
                }
                return;
            }

            const auto colon = heritage.find(':');
            if (colon == std::string_view::npos) {
                return;
            }
            for (auto& base : split_bases(heritage.substr(colon + 1))) {
                if (language == "csharp" && looks_like_interface_name(base)) {
                    meta.implements.push_back(std::move(base));
                } else if (meta.extends.empty()) {
                    meta.extends = std::move(base);
                } else {
                    meta.implements.push_back(std::move(base));
                }
            }
        }

        void extract_types(const std::string& text, const std::string_view language, LanguageExtraction& out) {
            static const std::regex type_regex(
                R"(\b(class|struct|interface|enum)\s+(?:[A-Z][A-Z0-9_]+\s+)?([A-Za-z_]\w*)([^;{}()=]{0,512})\{)");
            static const std::regex pure_virtual_regex(R"(\)\s*(?:const\s*)?=\s*0\s*;)");
            static const std::regex instance_regex(
                R"(\bstatic\s+[\w:<>&*\s]{0,256}\b(?:getInstance|[iI]nstance)\s*\()");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), type_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const std::string keyword = match[1].str();
                if (keyword == "enum") {
                    continue;
                }

                const auto open = position_of(match, 0) + static_cast<std::size_t>(match.length(0)) - 1;
                std::string_view body = content.substr(open);
                if (const auto close = lexical::match_brace(content, open)) {
                    body = content.substr(open, *close - open + 1);
                }

                EntityCandidate candidate;
                candidate.name = match[2].str();
                candidate.name_offset = position_of(match, 2);
                candidate.line = file_utils::line_at(content, candidate.name_offset);

                if (keyword == "interface") {
                    candidate.type = NodeType::Interface;
                    candidate.importance = INTERFACE_IMPORTANCE;
                    add_candidate(out, std::move(candidate));
                    continue;
                }

                candidate.type = NodeType::Class;
                candidate.importance = CLASS_IMPORTANCE;

                ClassMetadata meta;
                meta.line = candidate.line;
                meta.line_count = file_utils::count_lines(body);
                parse_heritage(match[3].str(), language, meta);

                const std::string body_text(body);
                const auto prefix = declaration_prefix(content, position_of(match, 0));
                meta.is_abstract = has_word(prefix, "abstract") || std::regex_search(body_text, pure_virtual_regex);

                const std::regex private_ctor_regex(
                    "private\\s+" + candidate.name + "\\s*\\(|private\\s*:[^}]{0,4096}?\\b" + candidate.name + "\\s*\\(");
                meta.has_private_constructor = std::regex_search(body_text, private_ctor_regex) ||
                    std::regex_search(body_text, instance_regex);

                candidate.class_info = std::move(meta);
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_dependencies(const std::string_view content, const std::string_view language, LanguageExtraction& out) {
            static const std::regex include_regex(R"(^\s*#\s*include\s*([<"])([^>"\n]+)[>"])");
            static const std::regex java_import_regex(R"(^\s*import\s+(?:static\s+)?([\w.]+?)(?:\.\*)?\s*;)");
            static const std::regex using_regex(R"(^\s*using\s+(?:static\s+)?([\w.]+)\s*;)");

            std::size_t line_start = 0;
            std::size_t line_number = 0;
            while (line_start < content.size()) {
                const auto line_end = std::min(content.find('\n', line_start), content.size());
                const std::string line(content.substr(line_start, line_end - line_start));
                ++line_number;
                line_start = line_end + 1;

                std::smatch match;
                DependencyRecord record;
                record.line = line_number;

                if (std::regex_search(line, match, include_regex)) {
                    record.import_type = "include";
                    record.specifier = match[2].str();
                    record.relative = match[1].str() == "\"";
                    if (record.relative && !string_utils::starts_with(record.specifier, ".")) {
                        record.specifier = "./" + record.specifier;
                    }
                } else if (language == "java" && std::regex_search(line, match, java_import_regex)) {
                    record.import_type = "import";
                    record.specifier = match[1].str();
                } else if (language == "csharp" && std::regex_search(line, match, using_regex)) {
                    record.import_type = "using";
                    record.specifier = match[1].str();
                } else {
                    continue;
                }

                if (string_utils::trim(record.specifier).empty()) {
                    ++out.ambiguous;
                    continue;
                }
                out.dependencies.push_back(std::move(record));
            }
        }

    }  // namespace

    std::string_view CFamilyExtractor::name() const noexcept {
        return "c_family";
    }

    std::vector<std::string> CFamilyExtractor::languages() const {
        return {"c", "cpp", "java", "csharp"};
    }

    LanguageExtraction CFamilyExtractor::extract(
        const std::string_view content,
        const std::string_view language
    ) const {
        LanguageExtraction out;
        const std::string text(content);

        extract_types(text, language, out);
        extract_functions(content, out);
        extract_dependencies(content, language, out);

        std::ranges::sort(out.entities, {}, &EntityCandidate::name_offset);
        return out;
    }

}  // namespace ckg::extraction
