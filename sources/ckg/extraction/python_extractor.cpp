#include "ckg/extraction/python_extractor.hpp"
#include "ckg/extraction/lexical.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <regex>

namespace ckg::extraction {

    namespace {

        constexpr double FUNCTION_IMPORTANCE = 0.7;
        constexpr double CLASS_IMPORTANCE = 0.8;
        constexpr double VARIABLE_IMPORTANCE = 0.3;

        using Iterator = std::sregex_iterator;

        std::size_t position_of(const std::smatch& match, const int group) {
            return static_cast<std::size_t>(match.position(group));
        }

        /**
         * Turns a relative module path into a path-like specifier:
         * ".models" -> "./models", "..core.db" -> "../core/db".
         */
        std::string relative_module_path(const std::string_view module) {
            std::size_t dots = 0;
            while (dots < module.size() && module[dots] == '.') {
                ++dots;
            }

            std::string path = dots <= 1 ? "./" : "";
            for (std::size_t i = 1; i < dots; ++i) {
                path += "../";
            }

            for (const char c : module.substr(dots)) {
                path += c == '.' ? '/' : c;
            }
            return path;
        }

        void extract_functions(const std::string& text, LanguageExtraction& out) {
            static const std::regex def_regex(R"(\b(async\s+)?def\s+([A-Za-z_]\w*)\s*\()");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), def_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const auto start = position_of(match, 0);
                const auto end = lexical::indented_block_end(content, start);

                EntityCandidate candidate;
                candidate.type = NodeType::Function;
                candidate.name = match[2].str();
                candidate.name_offset = position_of(match, 2);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = FUNCTION_IMPORTANCE;
                candidate.function = FunctionMetadata{
                    candidate.line,
                    match[1].matched,
                    lexical::function_complexity(content.substr(start, end - start))
                };
                add_candidate(out, std::move(candidate));
            }
        }

        void extract_classes(const std::string& text, LanguageExtraction& out) {
            static const std::regex class_regex(R"(\bclass\s+([A-Za-z_]\w*)\s*(?:\(([^)]{0,512})\))?\s*:)");

            const std::string_view content(text);

            for (auto it = Iterator(text.begin(), text.end(), class_regex); it != Iterator(); ++it) {
                const auto& match = *it;
                const auto start = position_of(match, 0);
                const auto end = lexical::indented_block_end(content, start);
                const auto body = content.substr(start, end - start);

                EntityCandidate candidate;
                candidate.type = NodeType::Class;
                candidate.name = match[1].str();
                candidate.name_offset = position_of(match, 1);
                candidate.line = file_utils::line_at(content, candidate.name_offset);
                candidate.importance = CLASS_IMPORTANCE;

                ClassMetadata meta;
                meta.line = candidate.line;
                meta.line_count = file_utils::count_lines(string_utils::trim_right(body));

                const std::string bases = match[2].str();
                for (const auto base_view : string_utils::split(bases, ',')) {
                    const auto base = string_utils::trim(base_view);
                    if (base.empty()) {
                        continue;
                    }
                    if (string_utils::starts_with(base, "metaclass")) {
                        meta.is_abstract = meta.is_abstract || string_utils::contains(base, "ABCMeta");
                        continue;
                    }
                    if (base == "ABC" || base == "abc.ABC") {
                        meta.is_abstract = true;
                        continue;
                    }
                    if (base == "object") {
                        continue;
                    }
                    if (meta.extends.empty()) {
                        meta.extends = std::string(base);
                    } else {
                        meta.implements.emplace_back(base);
                    }
                }

                // a class guarding construction through __new__ and a cached _instance
                meta.has_private_constructor = string_utils::contains(body, "def __new__") &&
                    string_utils::contains(body, "_instance");

                candidate.class_info = std::move(meta);
                add_candidate(out, std::move(candidate));
            }
        }

        /**
         * Module-level assignments (no indentation) become variables.
         */
        void extract_variables(const std::string& text, LanguageExtraction& out) {
            static const std::regex assignment_regex(R"(^([A-Za-z_]\w*)\s*(?::[^=\n]+)?=[^=])");

            const std::string_view content(text);
            std::size_t line_start = 0;
            std::size_t line_number = 1;
            while (line_start < content.size()) {
                const auto line_end = std::min(content.find('\n', line_start), content.size());
                const std::string line(content.substr(line_start, line_end - line_start));

                if (std::smatch match; std::regex_search(line, match, assignment_regex)) {
                    EntityCandidate candidate;
                    candidate.type = NodeType::Variable;
                    candidate.name = match[1].str();
                    candidate.name_offset = line_start + position_of(match, 1);
                    candidate.line = line_number;
                    candidate.importance = VARIABLE_IMPORTANCE;
                    candidate.declaration_kind = "assignment";
                    add_candidate(out, std::move(candidate));
                }

                line_start = line_end + 1;
                ++line_number;
            }
        }

        void extract_dependencies(const std::string& text, LanguageExtraction& out) {
            static const std::regex from_regex(R"(^\s*from\s+([\w.]+)\s+import\s+\(?([^#\n)]+))");
            static const std::regex import_regex(R"(^\s*import\s+([^#\n]+))");

            const std::string_view content(text);
            std::size_t line_start = 0;
            std::size_t line_number = 0;
            while (line_start < content.size()) {
                const auto line_end = std::min(content.find('\n', line_start), content.size());
                const std::string line(content.substr(line_start, line_end - line_start));
                ++line_number;

                auto add = [&](std::string specifier, const bool relative) {
                    if (specifier.empty()) {
                        ++out.ambiguous;
                        return;
                    }
                    DependencyRecord record;
                    record.specifier = std::move(specifier);
                    record.import_type = "import";
                    record.line = line_number;
                    record.relative = relative;
                    out.dependencies.push_back(std::move(record));
                };

                if (std::smatch match; std::regex_search(line, match, from_regex)) {
                    const std::string module = match[1].str();
                    const std::string names = match[2].str();
                    if (module.find_first_not_of('.') == std::string::npos) {
                        // "from . import a, b" names sibling modules
                        for (const auto name : string_utils::split(names, ',')) {
                            const auto parts = string_utils::split(string_utils::trim(name), ' ');
                            if (!parts.empty() && !string_utils::trim(parts.front()).empty()) {
                                add(relative_module_path(module + std::string(string_utils::trim(parts.front()))), true);
                            }
                        }
                    } else if (string_utils::starts_with(module, ".")) {
                        add(relative_module_path(module), true);
                    } else {
                        add(module, false);
                    }
                } else if (std::regex_search(line, match, import_regex)) {
                    const std::string modules = match[1].str();
                    for (const auto item : string_utils::split(modules, ',')) {
                        const auto parts = string_utils::split(string_utils::trim(item), ' ');
                        if (parts.empty()) {
                            continue;
                        }
                        add(std::string(string_utils::trim(parts.front())), false);
                    }
                }

                line_start = line_end + 1;
            }
        }

    }  // namespace

    std::string_view PythonExtractor::name() const noexcept {
        return "python";
    }

    std::vector<std::string> PythonExtractor::languages() const {
        return {"python"};
    }

    LanguageExtraction PythonExtractor::extract(
        const std::string_view content,
        [[maybe_unused]] const std::string_view language
    ) const {
        LanguageExtraction out;
        const std::string text(content);

        extract_functions(text, out);
        extract_classes(text, out);
        extract_variables(text, out);
        extract_dependencies(text, out);

        std::ranges::sort(out.entities, {}, &EntityCandidate::name_offset);
        return out;
    }

}  // namespace ckg::extraction
