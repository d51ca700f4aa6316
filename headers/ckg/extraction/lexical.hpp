#ifndef CKG_LEXICAL_HPP
#define CKG_LEXICAL_HPP

/**
 * @file lexical.hpp
 * @brief Text scanning helpers shared by the language extractors.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace ckg::extraction::lexical {

    /**
     * Finds the brace closing the one at @p open. String and character
     * literals and comments are skipped.
     *
     * @return Offset of the closing brace, or nullopt if unbalanced.
     */
    [[nodiscard]] std::optional<std::size_t> match_brace(std::string_view content, std::size_t open);

    /**
     * Finds the first '{' at or after @p from that comes before any ';'.
     */
    [[nodiscard]] std::optional<std::size_t> find_body_open(std::string_view content, std::size_t from);

    /**
     * Returns the end offset of an indentation block whose header line
     * contains @p header_offset: the start of the first non-blank line
     * indented no deeper than the header, or the content size.
     */
    [[nodiscard]] std::size_t indented_block_end(std::string_view content, std::size_t header_offset);

    /**
     * Counts keyword occurrences as whole identifiers.
     */
    [[nodiscard]] std::size_t count_keywords(
        std::string_view text,
        const std::unordered_set<std::string_view>& keywords
    );

    /**
     * Conditional keywords: if, else, switch, case, while, for.
     */
    [[nodiscard]] const std::unordered_set<std::string_view>& conditional_keywords();

    /**
     * Function complexity: min(10, conditionals + lines / 10).
     */
    [[nodiscard]] double function_complexity(std::string_view body);

    /**
     * Returns the identifier ending right before @p offset, skipping
     * whitespace, or "" if there is none.
     */
    [[nodiscard]] std::string_view previous_word(std::string_view content, std::size_t offset);

    /**
     * Length of the longest line, not counting the newline.
     */
    [[nodiscard]] std::size_t longest_line(std::string_view content);

    /**
     * A name usable as an entity identifier: non-empty, starts with a
     * letter, '_' or '$', and contains only identifier characters.
     */
    [[nodiscard]] bool is_valid_identifier(std::string_view name);

}  // namespace ckg::extraction::lexical

#endif //CKG_LEXICAL_HPP
