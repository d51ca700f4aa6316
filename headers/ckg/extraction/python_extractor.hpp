#ifndef CKG_PYTHON_EXTRACTOR_HPP
#define CKG_PYTHON_EXTRACTOR_HPP

/**
 * @file python_extractor.hpp
 * @brief Lexical extractor for Python.
 */

#include "ckg/extraction/language_extractor.hpp"

namespace ckg::extraction {

    class PythonExtractor : public ILanguageExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::vector<std::string> languages() const override;
        [[nodiscard]] LanguageExtraction extract(
            std::string_view content,
            std::string_view language
        ) const override;
    };

}  // namespace ckg::extraction

#endif //CKG_PYTHON_EXTRACTOR_HPP
