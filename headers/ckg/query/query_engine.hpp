#ifndef CKG_QUERY_ENGINE_HPP
#define CKG_QUERY_ENGINE_HPP

/**
 * @file query_engine.hpp
 * @brief Semantic search over a built graph.
 *
 * A query is vectorized with the same vectorizer as the nodes and scored
 * against the similarity index. Filters are hard excludes applied before
 * the result cap. The engine never mutates the graph; the same request
 * against the same graph always produces the same result.
 */

#include "ckg/core/config.hpp"
#include "ckg/graph/graph_store.hpp"
#include "ckg/insights/insight_extractor.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"
#include "ckg/vectorize/semantic_vectorizer.hpp"
#include "ckg/vectorize/similarity_index.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckg::query {

    enum class QueryIntent {
        Search,
        Analysis,
        Suggestion,
        PatternRecognition
    };

    [[nodiscard]] const char* to_string(QueryIntent intent) noexcept;
    [[nodiscard]] std::optional<QueryIntent> query_intent_from_string(std::string_view name) noexcept;

    /**
     * Hard excludes. An empty list does not filter.
     */
    struct QueryFilters {
        std::vector<std::string> node_types;  ///< node type names, "function", "class", ...
        std::vector<std::string> file_paths;  ///< substrings of the node's path
        std::vector<std::string> concepts;    ///< concept ids or names; the node name must contain a keyword
    };

    struct QueryRequest {
        std::string text;
        QueryIntent intent = QueryIntent::Search;
        QueryFilters filters;
    };

    struct QueryResult {
        std::vector<Node> nodes;
        std::vector<double> similarities;  ///< parallel to nodes
        std::vector<Relationship> relationships;
        double relevance_score = 0.0;
        std::vector<std::string> suggestions;
        std::vector<insights::Insight> insights;
        Duration duration = Duration::zero();
        std::optional<Error> error;  ///< set when the request was rejected

        [[nodiscard]] bool empty() const noexcept { return nodes.empty(); }
    };

    /**
     * (mean importance + distinct types / count) / 2, or 0 for no nodes.
     */
    [[nodiscard]] double relevance_score(const std::vector<Node>& nodes);

    /**
     * Checks a request before it runs.
     *
     * @return QueryError for empty text, an unknown node type name or an
     *         unknown concept.
     */
    [[nodiscard]] Result<void, Error> validate_request(
        const QueryRequest& request,
        const graph::GraphStore& store
    );

    class QueryEngine {
    public:
        QueryEngine(QueryConfig config, InsightConfig insight_config);

        /**
         * Runs a request against one graph. A rejected request yields an
         * empty result whose suggestions carry the diagnostic; nothing is
         * thrown.
         */
        [[nodiscard]] QueryResult execute(
            const QueryRequest& request,
            const graph::GraphStore& store,
            const vectorize::ISimilarityIndex& index,
            const vectorize::SemanticVectorizer& vectorizer
        ) const;

        /**
         * Suggestions for a finished search, capped and de-duplicated:
         * broadening hints for no results, trigger-word hints, then
         * related concepts of concepts whose keyword appears in a result
         * name.
         */
        [[nodiscard]] std::vector<std::string> suggest(
            const QueryRequest& request,
            const std::vector<Node>& nodes,
            const graph::GraphStore& store
        ) const;

    private:
        [[nodiscard]] bool passes_filters(
            const Node& node,
            const QueryFilters& filters,
            const std::vector<const Concept*>& concepts
        ) const;

        QueryConfig config_;
        insights::InsightExtractor insight_extractor_;
    };

}  // namespace ckg::query

#endif //CKG_QUERY_ENGINE_HPP
