#include "ckg/extraction/language_extractor.hpp"
#include "ckg/extraction/javascript_extractor.hpp"
#include "ckg/extraction/python_extractor.hpp"
#include "ckg/extraction/c_family_extractor.hpp"
#include "ckg/extraction/lexical.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace ckg::extraction {

    namespace {

        const std::unordered_set<std::string_view>& call_keywords() {
            static const std::unordered_set<std::string_view> keywords = {
                "if", "for", "while", "switch", "catch", "return", "function", "def",
                "fn", "func", "typeof", "sizeof", "alignof", "decltype", "new", "delete",
                "await", "yield", "throw", "elif", "with", "assert", "print", "lambda",
                "and", "or", "not", "in", "is", "super", "this", "self", "import",
                "require", "constructor", "foreach", "using", "lock", "match", "loop",
                "static_cast", "dynamic_cast", "const_cast", "reinterpret_cast",
                "noexcept", "defined", "class", "struct", "interface", "else", "do",
                "try", "case", "throws", "extends", "implements"
            };
            return keywords;
        }

        const std::unordered_set<std::string_view>& declaration_keywords() {
            static const std::unordered_set<std::string_view> keywords = {
                "function", "def", "fn", "func", "class", "struct", "interface", "new"
            };
            return keywords;
        }

    }  // namespace

    ExtractorRegistry ExtractorRegistry::with_builtin() {
        ExtractorRegistry registry;
        registry.register_extractor(std::make_shared<JavaScriptExtractor>());
        registry.register_extractor(std::make_shared<PythonExtractor>());
        registry.register_extractor(std::make_shared<CFamilyExtractor>());
        return registry;
    }

    void ExtractorRegistry::register_extractor(std::shared_ptr<const ILanguageExtractor> extractor) {
        if (extractor) {
            extractors_.push_back(std::move(extractor));
        }
    }

    const ILanguageExtractor* ExtractorRegistry::find(const std::string_view language) const {
        for (auto it = extractors_.rbegin(); it != extractors_.rend(); ++it) {
            const auto langs = (*it)->languages();
            if (std::ranges::find(langs, language) != langs.end()) {
                return it->get();
            }
        }
        return nullptr;
    }

    std::vector<const ILanguageExtractor*> ExtractorRegistry::list_extractors() const {
        std::vector<const ILanguageExtractor*> result;
        result.reserve(extractors_.size());
        for (const auto& extractor : extractors_) {
            result.push_back(extractor.get());
        }
        return result;
    }

    bool add_candidate(LanguageExtraction& extraction, EntityCandidate candidate) {
        if (!lexical::is_valid_identifier(candidate.name)) {
            ++extraction.ambiguous;
            return false;
        }

        const bool duplicate = std::ranges::any_of(extraction.entities, [&](const EntityCandidate& existing) {
            return existing.type == candidate.type && existing.name == candidate.name;
        });
        if (duplicate) {
            ++extraction.ambiguous;
            return false;
        }

        extraction.entities.push_back(std::move(candidate));
        return true;
    }

    std::vector<UsageRecord> extract_usages(
        const std::string_view content,
        const std::vector<EntityCandidate>& declarations
    ) {
        std::unordered_set<std::size_t> declaration_offsets;
        for (const auto& decl : declarations) {
            declaration_offsets.insert(decl.name_offset);
        }

        std::vector<UsageRecord> usages;
        std::unordered_set<std::string> seen;

        std::size_t pos = 0;
        while (pos < content.size()) {
            if (!string_utils::is_identifier_char(content[pos])) {
                ++pos;
                continue;
            }

            const std::size_t start = pos;
            while (pos < content.size() && string_utils::is_identifier_char(content[pos])) {
                ++pos;
            }

            std::size_t next = pos;
            while (next < content.size() && std::isspace(static_cast<unsigned char>(content[next]))) {
                ++next;
            }
            if (next >= content.size() || content[next] != '(') {
                continue;
            }

            const auto name = content.substr(start, pos - start);
            if (!lexical::is_valid_identifier(name)) {
                continue;
            }
            if (call_keywords().contains(name) || declaration_offsets.contains(start)) {
                continue;
            }
            if (declaration_keywords().contains(lexical::previous_word(content, start))) {
                continue;
            }

            if (seen.emplace(name).second) {
                usages.push_back(UsageRecord{std::string(name), file_utils::line_at(content, start)});
            }
        }

        return usages;
    }

}  // namespace ckg::extraction
