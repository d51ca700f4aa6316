#ifndef CKG_LANGUAGE_EXTRACTOR_HPP
#define CKG_LANGUAGE_EXTRACTOR_HPP

/**
 * @file language_extractor.hpp
 * @brief Per-language lexical extraction interface.
 *
 * Extraction is pattern based, not a parser: each extractor scans raw text
 * with regular expressions and brace or indentation matching. It finds most
 * declarations in conventionally formatted code and misses or over-matches
 * in unusual layouts. A real parser can be plugged in by implementing
 * ILanguageExtractor for the same languages.
 *
 * Extractor types:
 * - JavaScriptExtractor: javascript, typescript
 * - PythonExtractor: python
 * - CFamilyExtractor: c, cpp, java, csharp
 */

#include "ckg/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckg::extraction {

    /**
     * A declaration found in a file, before it becomes a Node.
     */
    struct EntityCandidate {
        NodeType type = NodeType::Function;
        std::string name;
        std::size_t line = 0;
        std::size_t name_offset = 0;  ///< byte offset of the name in the content
        double importance = 0.5;

        std::optional<FunctionMetadata> function;
        std::optional<ClassMetadata> class_info;
        std::string declaration_kind;  ///< variables only: const, let, var, ...
    };

    /**
     * An import-like statement.
     */
    struct DependencyRecord {
        std::string specifier;    ///< module name or path as written
        std::string import_type;  ///< import, require, export, include, using
        std::size_t line = 0;
        bool relative = false;    ///< resolve against the importing file
    };

    /**
     * A potential call site: `identifier(`.
     */
    struct UsageRecord {
        std::string name;
        std::size_t line = 0;
    };

    /**
     * Output of one extractor over one file.
     */
    struct LanguageExtraction {
        std::vector<EntityCandidate> entities;
        std::vector<DependencyRecord> dependencies;
        std::size_t ambiguous = 0;  ///< matches skipped for an unusable identifier
    };

    /**
     * Base interface for all language extractors.
     */
    class ILanguageExtractor {
    public:
        virtual ~ILanguageExtractor() = default;

        /**
         * Returns the extractor name.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns the language names (as produced by detect_language) this
         * extractor handles.
         */
        [[nodiscard]] virtual std::vector<std::string> languages() const = 0;

        /**
         * Extracts declarations and dependencies from file content.
         *
         * @param content The file content.
         * @param language The detected language of the file.
         */
        [[nodiscard]] virtual LanguageExtraction extract(
            std::string_view content,
            std::string_view language
        ) const = 0;
    };

    /**
     * Maps languages to extractors. Owned by an EntityExtractor; later
     * registrations win for a language.
     */
    class ExtractorRegistry {
    public:
        ExtractorRegistry() = default;

        /**
         * Registry with the JavaScript, Python and C-family extractors.
         */
        static ExtractorRegistry with_builtin();

        void register_extractor(std::shared_ptr<const ILanguageExtractor> extractor);

        /**
         * Returns the extractor for a language, or nullptr.
         */
        [[nodiscard]] const ILanguageExtractor* find(std::string_view language) const;

        [[nodiscard]] std::vector<const ILanguageExtractor*> list_extractors() const;

    private:
        std::vector<std::shared_ptr<const ILanguageExtractor>> extractors_;
    };

    /**
     * Appends a candidate to an extraction. A name that is not a usable
     * identifier, or a (type, name) pair already present, is skipped and
     * counted as ambiguous.
     *
     * @return true if the candidate was added.
     */
    bool add_candidate(LanguageExtraction& extraction, EntityCandidate candidate);

    /**
     * Finds potential call sites. Identifiers at an entity's name offset,
     * language keywords, and names directly after a declaration keyword
     * (function, def, fn, func, ...) are not calls. Each name is reported
     * once, at its first occurrence.
     */
    [[nodiscard]] std::vector<UsageRecord> extract_usages(
        std::string_view content,
        const std::vector<EntityCandidate>& declarations
    );

}  // namespace ckg::extraction

#endif //CKG_LANGUAGE_EXTRACTOR_HPP
