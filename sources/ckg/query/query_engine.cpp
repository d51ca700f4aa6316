#include "ckg/query/query_engine.hpp"

#include "ckg/core/logging.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <set>
#include <unordered_set>
#include <utility>

namespace ckg::query {

    namespace {

        constexpr std::array<std::pair<QueryIntent, const char*>, 4> kIntentNames{{
            {QueryIntent::Search, "search"},
            {QueryIntent::Analysis, "analysis"},
            {QueryIntent::Suggestion, "suggestion"},
            {QueryIntent::PatternRecognition, "pattern_recognition"},
        }};

        const Concept* find_concept_by_id_or_name(const graph::GraphStore& store, const std::string& key) {
            if (const Concept* found = store.find_concept(key)) {
                return found;
            }
            for (const auto& concept_value : store.concepts()) {
                if (concept_value.name == key) {
                    return &concept_value;
                }
            }
            return nullptr;
        }

        void add_unique(std::vector<std::string>& out, std::string suggestion) {
            if (std::ranges::find(out, suggestion) == out.end()) {
                out.push_back(std::move(suggestion));
            }
        }

    }  // namespace

    const char* to_string(const QueryIntent intent) noexcept {
        for (const auto& [value, name] : kIntentNames) {
            if (value == intent) {
                return name;
            }
        }
        return "unknown";
    }

    std::optional<QueryIntent> query_intent_from_string(const std::string_view name) noexcept {
        for (const auto& [value, intent_name] : kIntentNames) {
            if (name == intent_name) {
                return value;
            }
        }
        return std::nullopt;
    }

    double relevance_score(const std::vector<Node>& nodes) {
        if (nodes.empty()) {
            return 0.0;
        }

        double importance_sum = 0.0;
        std::set<NodeType> types;
        for (const auto& node : nodes) {
            importance_sum += node.importance;
            types.insert(node.type);
        }

        const auto count = static_cast<double>(nodes.size());
        const double mean_importance = importance_sum / count;
        const double diversity = static_cast<double>(types.size()) / count;
        return (mean_importance + diversity) / 2.0;
    }

    Result<void, Error> validate_request(const QueryRequest& request, const graph::GraphStore& store) {
        if (string_utils::trim(request.text).empty()) {
            return Result<void, Error>::failure(Error::query_error("Query text is empty"));
        }

        for (const auto& type_name : request.filters.node_types) {
            if (!node_type_from_string(type_name)) {
                return Result<void, Error>::failure(
                    Error::query_error("Unknown node type in filter", type_name)
                );
            }
        }

        for (const auto& concept_key : request.filters.concepts) {
            if (find_concept_by_id_or_name(store, concept_key) == nullptr) {
                return Result<void, Error>::failure(
                    Error::query_error("Unknown concept in filter", concept_key)
                );
            }
        }

        return Result<void, Error>::success();
    }

    QueryEngine::QueryEngine(QueryConfig config, InsightConfig insight_config)
        : config_(std::move(config))
        , insight_extractor_(std::move(insight_config)) {}

    bool QueryEngine::passes_filters(
        const Node& node,
        const QueryFilters& filters,
        const std::vector<const Concept*>& concepts
    ) const {
        if (!filters.node_types.empty()) {
            const bool type_match = std::ranges::any_of(filters.node_types, [&](const std::string& name) {
                return node_type_from_string(name) == node.type;
            });
            if (!type_match) {
                return false;
            }
        }

        if (!filters.file_paths.empty()) {
            const std::string path = node.path();
            const bool path_match = std::ranges::any_of(filters.file_paths, [&](const std::string& fragment) {
                return !path.empty() && string_utils::contains(path, fragment);
            });
            if (!path_match) {
                return false;
            }
        }

        if (!concepts.empty()) {
            const std::string lower_name = string_utils::to_lower(node.name);
            const bool concept_match = std::ranges::any_of(concepts, [&](const Concept* concept_value) {
                return std::ranges::any_of(concept_value->keywords, [&](const std::string& keyword) {
                    return string_utils::contains(lower_name, keyword);
                });
            });
            if (!concept_match) {
                return false;
            }
        }

        return true;
    }

    std::vector<std::string> QueryEngine::suggest(
        const QueryRequest& request,
        const std::vector<Node>& nodes,
        const graph::GraphStore& store
    ) const {
        std::vector<std::string> suggestions;

        if (nodes.empty()) {
            add_unique(suggestions, "Try a broader search term");
            add_unique(suggestions, "Check spelling and try synonyms");
        }

        std::unordered_set<std::string> words;
        std::string word;
        for (const char c : string_utils::to_lower(request.text)) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!word.empty()) {
                    words.insert(std::move(word));
                    word.clear();
                }
            } else {
                word += c;
            }
        }
        if (!word.empty()) {
            words.insert(std::move(word));
        }
        if (words.contains("function") || words.contains("method")) {
            add_unique(suggestions, "Search for related functions");
        }
        if (words.contains("class") || words.contains("component")) {
            add_unique(suggestions, "Find similar classes");
        }
        if (words.contains("pattern")) {
            add_unique(suggestions, "Explore design patterns");
        }

        for (const auto& concept_value : store.concepts()) {
            const bool relevant = std::ranges::any_of(nodes, [&](const Node& node) {
                const std::string lower_name = string_utils::to_lower(node.name);
                return std::ranges::any_of(concept_value.keywords, [&](const std::string& keyword) {
                    return string_utils::contains(lower_name, keyword);
                });
            });
            if (!relevant) {
                continue;
            }
            for (const auto& related : concept_value.related_concepts) {
                add_unique(suggestions, "Search for: " + related);
            }
        }

        if (suggestions.size() > config_.max_suggestions) {
            suggestions.resize(config_.max_suggestions);
        }
        return suggestions;
    }

    QueryResult QueryEngine::execute(
        const QueryRequest& request,
        const graph::GraphStore& store,
        const vectorize::ISimilarityIndex& index,
        const vectorize::SemanticVectorizer& vectorizer
    ) const {
        const auto start = std::chrono::steady_clock::now();
        QueryResult result;

        if (auto valid = validate_request(request, store); valid.is_err()) {
            logging::get()->debug("Rejected query '{}': {}", request.text, valid.error().to_string());
            result.suggestions.push_back("Invalid query: " + valid.error().to_string());
            result.error = valid.error();
            result.duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
            return result;
        }

        std::vector<const Concept*> concepts;
        for (const auto& key : request.filters.concepts) {
            concepts.push_back(find_concept_by_id_or_name(store, key));
        }

        const SemanticVector query_vector = vectorizer.vectorize(request.text);
        const auto query_terms = vectorizer.terms(request.text);
        for (const auto& match : index.search(query_vector, config_.min_similarity)) {
            if (result.nodes.size() >= config_.max_results) {
                break;
            }
            const Node* node = store.node(match.id);
            if (node == nullptr || !passes_filters(*node, request.filters, concepts)) {
                continue;
            }
            const auto node_terms = vectorizer.terms(vectorize::node_text(*node));
            if (std::ranges::none_of(query_terms, [&](const std::string& term) { return node_terms.contains(term); })) {
                continue;
            }
            result.nodes.push_back(*node);
            result.similarities.push_back(match.similarity);
        }

        std::unordered_set<std::string> result_ids;
        for (const auto& node : result.nodes) {
            result_ids.insert(node.id);
        }
        for (const auto& rel : store.relationships()) {
            if (result_ids.contains(rel.from) || result_ids.contains(rel.to)) {
                result.relationships.push_back(rel);
            }
        }

        result.relevance_score = relevance_score(result.nodes);
        result.suggestions = suggest(request, result.nodes, store);
        result.insights = insight_extractor_.extract(result.nodes, result.relationships);
        result.duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        return result;
    }

}  // namespace ckg::query
