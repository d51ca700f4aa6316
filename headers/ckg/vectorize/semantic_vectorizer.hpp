#ifndef CKG_SEMANTIC_VECTORIZER_HPP
#define CKG_SEMANTIC_VECTORIZER_HPP

/**
 * @file semantic_vectorizer.hpp
 * @brief Term-frequency projection of text into fixed-dimension vectors.
 *
 * Not an embedding model. Text is tokenized on non-alphanumeric boundaries,
 * lower-cased, and tokens shorter than the minimum length are dropped. The
 * D most frequent terms (ties broken by the term) are hashed into slot
 * fnv1a(term) % D with weight count / total_tokens. Two texts are close when
 * they share words, nothing more.
 *
 * Vectors are cached by the SHA-256 of the text, up to max_cache_entries;
 * the least recently used entry is evicted first. The cache is shared by the
 * build and by concurrent queries.
 */

#include "ckg/core/config.hpp"
#include "ckg/types.hpp"

#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace ckg::vectorize {

    class SemanticVectorizer {
    public:
        explicit SemanticVectorizer(VectorizerConfig config = {});

        SemanticVectorizer(const SemanticVectorizer&) = delete;
        SemanticVectorizer& operator=(const SemanticVectorizer&) = delete;

        /**
         * Vectorizes text. Deterministic: the same text always yields a
         * bit-identical vector, cached or not. Text without usable tokens
         * yields the zero vector.
         */
        [[nodiscard]] SemanticVector vectorize(std::string_view text) const;

        /**
         * Vectorizes the synthesized text of a node (see node_text()).
         */
        [[nodiscard]] SemanticVector vectorize_node(const Node& node) const;

        /**
         * Lower-cased words of the text plus the parts of camelCase and
         * snake_case identifiers, each at least min_token_length long.
         * Hashed slots collide, so a query match must also share one of
         * these terms with the node text.
         */
        [[nodiscard]] std::unordered_set<std::string> terms(std::string_view text) const;

        [[nodiscard]] std::size_t dimensions() const noexcept {
            return config_.dimensions;
        }

        [[nodiscard]] std::size_t cache_size() const;

        void clear_cache();

    private:
        [[nodiscard]] SemanticVector compute(std::string_view text) const;

        using CacheEntry = std::pair<std::string, SemanticVector>;

        VectorizerConfig config_;
        mutable std::mutex cache_mutex_;
        mutable std::list<CacheEntry> lru_;  ///< most recently used first
        mutable std::unordered_map<std::string, std::list<CacheEntry>::iterator> cache_;
    };

    /**
     * Text describing a node: its name plus type-specific context.
     *
     * - File: file name, language
     * - Function: "function", complexity, enclosing file name
     * - Class: "class", superclass, enclosing file name
     * - Interface: "interface", enclosing file name
     * - Variable: "variable", declaration kind, enclosing file name
     * - Module: "module", import type
     */
    [[nodiscard]] std::string node_text(const Node& node);

    /**
     * Cosine similarity. Symmetric; 0 when either vector is zero or the
     * lengths differ.
     */
    [[nodiscard]] double cosine_similarity(const SemanticVector& a, const SemanticVector& b);

}  // namespace ckg::vectorize

#endif //CKG_SEMANTIC_VECTORIZER_HPP
