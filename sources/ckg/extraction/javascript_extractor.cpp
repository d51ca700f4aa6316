#include "ckg/extraction/javascript_extractor.hpp"
#include "ckg/extraction/lexical.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace ckg::extraction {

    namespace {

        constexpr double FUNCTION_IMPORTANCE = 0.7;
        constexpr double CLASS_IMPORTANCE = 0.8;
        constexpr double INTERFACE_IMPORTANCE = 0.6;
        constexpr double VARIABLE_IMPORTANCE = 0.3;

        using Iterator = std::sregex_iterator;

        std::size_t position_of(const std::smatch& match, const int group) {
            return static_cast<std::size_t>(match.position(group));
        }

        /**
         * Body of a function whose header ends at @p header_end: the braced
         * block, or the rest of the line for an expression-bodied arrow.
         */
        std::string_view function_body(const std::string_view content, const std::size_t header_end, const bool arrow) {
            std::optional<std::size_t> open;
            if (arrow) {
                std::size_t pos = header_end;
                while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) {
                    ++pos;
                }
                if (pos < content.size() && content[pos] == '{') {
                    open = pos;
                }
            } else {
                open = lexical::find_body_open(content, header_end);
            }

            if (open) {
                if (const auto close = lexical::match_brace(content, *open)) {
                    return content.substr(*open, *close - *open + 1);
                }
            }

            const auto eol = std::min(content.find('\n', header_end), content.size());
            return content.substr(header_end, eol - header_end);
        }

        std::vector<std::string> parse_type_list(const std::string_view text) {
            std::vector<std::string> names;
            int depth = 0;
            std::string current;
            auto flush = [&] {
                const auto trimmed = string_utils::trim(current);
                if (!trimmed.empty()) {
                    names.emplace_back(trimmed);
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
            return names;
        }

        void extract_functions(const std::string& text, LanguageExtraction& out) {
            static const std::regex declaration_regex(
                R"(\b(async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()");
            static const std::regex expression_regex(
                R"(\b(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=;]{1,256})?=\s*(async\s+)?(function\b|\([^)]{0,512}\)\s*(?::\s*[\w$<>\[\]|. ]+)?\s*=>|[A-Za-z_$][\w$]*\s*=>))");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), declaration_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const auto header_end = position_of(match, 0) + static_cast<std::size_t>(match.length(0));

                EntityCandidate candidate;
                candidate.type = NodeType::Function;
                candidate.name = match[2].str();
                candidate.name_offset = position_of(match, 2);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = FUNCTION_IMPORTANCE;
                candidate.function = FunctionMetadata{
                    candidate.line,
                    match[1].matched,
                    lexical::function_complexity(function_body(content, header_end, false))
                };
                add_candidate(out, std::move(candidate));
            }

            for (auto it = Iterator(text.begin(), text.end(), expression_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const auto header_end = position_of(match, 0) + static_cast<std::size_t>(match.length(0));
                const bool arrow = match[3].str() != "function";

                EntityCandidate candidate;
                candidate.type = NodeType::Function;
                candidate.name = match[1].str();
                candidate.name_offset = position_of(match, 1);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = FUNCTION_IMPORTANCE;
                candidate.function = FunctionMetadata{
                    candidate.line,
                    match[2].matched,
                    lexical::function_complexity(function_body(content, header_end, arrow))
                };
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_classes(const std::string& text, LanguageExtraction& out) {
            static const std::regex class_regex(
                R"(\b(?:(abstract)\s+)?class\s+([A-Za-z_$][\w$]*)(?:\s*<[^>{]{0,256}>)?(?:\s+extends\s+([\w$.]+)(?:\s*<[^>{]{0,256}>)?)?(?:\s+implements\s+([^{]{1,512}))?\s*\{)");
            static const std::regex private_constructor_regex(
                R"(private\s+constructor\s*\(|static\s+(?:get\s+)?(?:getInstance|instance)\s*\()");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), class_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const auto open = position_of(match, 0) + static_cast<std::size_t>(match.length(0)) - 1;

                EntityCandidate candidate;
                candidate.type = NodeType::Class;
                candidate.name = match[2].str();
                candidate.name_offset = position_of(match, 2);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = CLASS_IMPORTANCE;

                ClassMetadata meta;
                meta.line = candidate.line;
                meta.extends = match[3].str();
                if (match[4].matched) {
                    meta.implements = parse_type_list(match[4].str());
                }
                meta.is_abstract = match[1].matched;

                std::string_view body = content.substr(open);
                if (const auto close = lexical::match_brace(content, open)) {
                    body = content.substr(open, *close - open + 1);
                    meta.line_count = file_utils::count_lines(body);
                } else {
                    meta.line_count = file_utils::count_lines(body);
                }

                const std::string body_text(body);
                meta.has_private_constructor = std::regex_search(body_text, private_constructor_regex);

                candidate.class_info = std::move(meta);
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_interfaces(const std::string& text, LanguageExtraction& out) {
            static const std::regex interface_regex(
                R"(\binterface\s+([A-Za-z_$][\w$]*)[^{;=]{0,512}\{)");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), interface_regex); it != Iterator(); ++it) {
                const auto& match = *it;

                EntityCandidate candidate;
                candidate.type = NodeType::Interface;
                candidate.name = match[1].str();
                candidate.name_offset = position_of(match, 1);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = INTERFACE_IMPORTANCE;
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_variables(const std::string& text, LanguageExtraction& out) {
            static const std::regex variable_regex(
                R"(\b(const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=;]{1,256})?=)");

            std::unordered_set<std::string> function_names;
            for (const auto& entity : out.entities) {
                if (entity.type == NodeType::Function) {
                    function_names.insert(entity.name);
                }
            }

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), variable_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                std::string name = match[2].str();
                if (function_names.contains(name)) {
                    continue;
                }

                EntityCandidate candidate;
                candidate.type = NodeType::Variable;
                candidate.name = std::move(name);
                candidate.name_offset = position_of(match, 2);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = VARIABLE_IMPORTANCE;
                candidate.declaration_kind = match[1].str();
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_dependencies(const std::string& text, LanguageExtraction& out) {
            struct Rule {
                const std::regex* regex;
                const char* import_type;
            };

            static const std::regex import_from_regex(
                R"(\bimport\s+(?:type\s+)?(?:[\w$]+\s*,\s*)?(?:\{[^}]{0,2048}\}|\*\s+as\s+[\w$]+|[\w$]+)\s+from\s+['"]([^'"\n]+)['"])");
            static const std::regex import_bare_regex(R"(\bimport\s+['"]([^'"\n]+)['"])");
            static const std::regex import_dynamic_regex(R"(\bimport\s*\(\s*['"]([^'"\n]+)['"]\s*\))");
            static const std::regex require_regex(R"(\brequire\s*\(\s*['"]([^'"\n]+)['"]\s*\))");
            static const std::regex export_from_regex(
                R"(\bexport\s+(?:type\s+)?(?:\*(?:\s+as\s+[\w$]+)?|\{[^}]{0,2048}\})\s+from\s+['"]([^'"\n]+)['"])");

            static const Rule rules[] = {
                {&import_from_regex, "import"},
                {&import_bare_regex, "import"},
                {&import_dynamic_regex, "import"},
                {&require_regex, "require"},
                {&export_from_regex, "export"},
            };

            const std::string_view content(text);
            std::vector<std::pair<std::size_t, DependencyRecord>> found;

            for (const auto& [regex, import_type] : rules) {
                for (auto it = Iterator(text.begin(), text.end(), *regex); it != Iterator(); ++it) {
                    const auto& match = *it;
                    std::string specifier = match[1].str();
                    if (specifier.empty()) {
                        ++out.ambiguous;
                        continue;
                    }

                    DependencyRecord record;
                    record.relative = string_utils::starts_with(specifier, ".");
                    record.specifier = std::move(specifier);
                    record.import_type = import_type;
                    record.line = file_utils::line_at(content, position_of(match, 0));
                    found.emplace_back(position_of(match, 0), std::move(record));
                }
            }

            std::ranges::stable_sort(found, {}, &std::pair<std::size_t, DependencyRecord>::first);
            for (auto& entry : found) {
                out.dependencies.push_back(std::move(entry.second));
            }
        }

    }  // namespace

    std::string_view JavaScriptExtractor::name() const noexcept {
        return "javascript";
    }

    std::vector<std::string> JavaScriptExtractor::languages() const {
        return {"javascript", "typescript"};
    }

    LanguageExtraction JavaScriptExtractor::extract(
        const std::string_view content,
        [[maybe_unused]] const std::string_view language
    ) const {
        LanguageExtraction out;
        const std::string text(content);

        extract_functions(text, out);
        extract_classes(text, out);
        extract_interfaces(text, out);
        extract_variables(text, out);
        extract_dependencies(text, out);

        std::ranges::sort(out.entities, {}, &EntityCandidate::name_offset);
        return out;
    }

}  // namespace ckg::extraction
