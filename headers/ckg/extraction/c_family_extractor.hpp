#ifndef CKG_C_FAMILY_EXTRACTOR_HPP
#define CKG_C_FAMILY_EXTRACTOR_HPP

/**
 * @file c_family_extractor.hpp
 * @brief Lexical extractor for C, C++, Java and C#.
 */

#include "ckg/extraction/language_extractor.hpp"

namespace ckg::extraction {

    class CFamilyExtractor : public ILanguageExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::vector<std::string> languages() const override;
        [[nodiscard]] LanguageExtraction extract(
            std::string_view content,
            std::string_view language
        ) const override;
    };

}  // namespace ckg::extraction

#endif //CKG_C_FAMILY_EXTRACTOR_HPP
