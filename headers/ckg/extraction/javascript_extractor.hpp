#ifndef CKG_JAVASCRIPT_EXTRACTOR_HPP
#define CKG_JAVASCRIPT_EXTRACTOR_HPP

/**
 * @file javascript_extractor.hpp
 * @brief Lexical extractor for JavaScript and TypeScript.
 */

#include "ckg/extraction/language_extractor.hpp"

namespace ckg::extraction {

    class JavaScriptExtractor : public ILanguageExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::vector<std::string> languages() const override;
        [[nodiscard]] LanguageExtraction extract(
            std::string_view content,
            std::string_view language
        ) const override;
    };

}  // namespace ckg::extraction

#endif //CKG_JAVASCRIPT_EXTRACTOR_HPP
