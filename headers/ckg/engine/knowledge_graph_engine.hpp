#ifndef CKG_KNOWLEDGE_GRAPH_ENGINE_HPP
#define CKG_KNOWLEDGE_GRAPH_ENGINE_HPP

/**
 * @file knowledge_graph_engine.hpp
 * @brief Library entry point: build a graph from a source tree, then query it.
 *
 * A build runs its phases strictly in sequence:
 * 1. discovery
 * 2. per-file extraction (on the engine's thread pool)
 * 3. merge into a fresh GraphStore
 * 4. vectorization
 * 5. similarity edges
 * 6. pattern recognition
 *
 * The finished store and its similarity index are published together by
 * swapping a shared_ptr. Queries, exports and stats read whatever graph is
 * published when they start, so they run concurrently with each other and
 * with a build. A failed or cancelled build leaves the previous graph live.
 *
 * Usage:
 * @code
 *     auto engine = engine::KnowledgeGraphEngine::create(EngineConfig::default_config());
 *     if (engine.is_err()) { ... }
 *
 *     auto summary = engine.value()->build_graph("./src");
 *     auto result = engine.value()->query({"user service", query::QueryIntent::Search, {}});
 * @endcode
 */

#include "ckg/core/config.hpp"
#include "ckg/engine/graph_observer.hpp"
#include "ckg/extraction/entity_extractor.hpp"
#include "ckg/graph/graph_store.hpp"
#include "ckg/patterns/pattern_recognizer.hpp"
#include "ckg/query/query_engine.hpp"
#include "ckg/relationships/relationship_builder.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"
#include "ckg/utils/cancellation.hpp"
#include "ckg/vectorize/semantic_vectorizer.hpp"
#include "ckg/vectorize/similarity_index.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ckg::parallel {
    class ThreadPool;
}

namespace ckg::engine {

    /**
     * Outcome of one successful build.
     */
    struct BuildSummary {
        fs::path root;
        std::size_t files_discovered = 0;
        std::size_t files_extracted = 0;
        std::size_t files_skipped = 0;     ///< unreadable files
        std::size_t dirs_skipped = 0;      ///< unlistable subdirectories
        std::size_t entities_skipped = 0;  ///< ambiguous matches
        std::size_t unresolved_dependencies = 0;
        std::size_t similarity_edges = 0;
        std::size_t node_count = 0;
        std::size_t relationship_count = 0;
        std::size_t concept_count = 0;
        Duration duration = Duration::zero();
        Timestamp built_at;
    };

    struct SnapshotMetadata {
        Timestamp export_date;
        std::string version;
    };

    /**
     * Everything a persistence collaborator needs to store a graph.
     */
    struct GraphSnapshot {
        std::vector<Node> nodes;
        std::vector<Relationship> relationships;
        std::vector<Concept> concepts;
        SnapshotMetadata metadata;
    };

    struct VisualizationNode {
        std::string id;
        std::string label;
        NodeType type = NodeType::File;
        double size = 0.0;
        std::string color;
    };

    struct VisualizationEdge {
        std::string id;
        std::string source;
        std::string target;
        RelationshipType label = RelationshipType::Uses;
        double weight = 0.0;
    };

    struct VisualizationData {
        std::vector<VisualizationNode> nodes;
        std::vector<VisualizationEdge> edges;
    };

    struct HealthReport {
        std::string status;  ///< "empty" before the first build, then "healthy"
        std::size_t node_count = 0;
        std::size_t relationship_count = 0;
        std::size_t concept_count = 0;
        std::optional<Timestamp> last_build;
        std::size_t similarity_index_size = 0;
        std::size_t vector_cache_size = 0;
        std::size_t observer_count = 0;
    };

    /**
     * Display colour of a node type, as a #rrggbb string.
     */
    [[nodiscard]] const char* node_color(NodeType type) noexcept;

    class KnowledgeGraphEngine {
    public:
        /**
         * Validates the config and configures logging before building the
         * engine.
         *
         * @return ConfigError for an invalid config or logging setup.
         */
        static Result<std::unique_ptr<KnowledgeGraphEngine>, Error> create(EngineConfig config);

        /**
         * Builds an engine from a config that is assumed valid. Logging is
         * left as it is.
         */
        explicit KnowledgeGraphEngine(EngineConfig config = EngineConfig::default_config());
        ~KnowledgeGraphEngine();

        KnowledgeGraphEngine(const KnowledgeGraphEngine&) = delete;
        KnowledgeGraphEngine& operator=(const KnowledgeGraphEngine&) = delete;

        /**
         * Rebuilds the graph from @p root and publishes it on success.
         * Concurrent builds run one after another.
         *
         * @return NotFound, InvalidArgument or IoError for an unusable root,
         *         Cancelled if the token fires. Per-file failures are
         *         logged and counted in the summary.
         */
        [[nodiscard]] Result<BuildSummary, Error> build_graph(
            const fs::path& root,
            const CancellationToken& cancel = {}
        );

        /**
         * Runs a query against the published graph. An empty graph gives
         * an empty result.
         */
        [[nodiscard]] query::QueryResult query(const query::QueryRequest& request) const;

        [[nodiscard]] GraphSnapshot export_snapshot() const;

        /**
         * Serializes export_snapshot() as pretty-printed JSON.
         */
        [[nodiscard]] Result<void, Error> write_snapshot(const fs::path& path) const;

        [[nodiscard]] VisualizationData visualize() const;

        [[nodiscard]] graph::GraphStats stats() const;

        [[nodiscard]] HealthReport health() const;

        /**
         * The published graph, or an empty store before the first build.
         */
        [[nodiscard]] std::shared_ptr<const graph::GraphStore> graph() const;

        [[nodiscard]] std::optional<BuildSummary> last_build() const;

        void add_observer(std::shared_ptr<IGraphObserver> observer);
        void remove_observer(const std::shared_ptr<IGraphObserver>& observer);

        [[nodiscard]] const EngineConfig& config() const noexcept {
            return config_;
        }

    private:
        struct PublishedGraph {
            std::shared_ptr<const graph::GraphStore> store;
            std::shared_ptr<const vectorize::ISimilarityIndex> index;
        };

        [[nodiscard]] PublishedGraph published() const;

        [[nodiscard]] Result<std::vector<extraction::FileExtraction>, Error> extract_all(
            const fs::path& root,
            const std::vector<fs::path>& files,
            const CancellationToken& cancel,
            BuildSummary& summary
        ) const;

        [[nodiscard]] Result<void, Error> vectorize_nodes(
            graph::GraphStore& store,
            const CancellationToken& cancel
        ) const;

        [[nodiscard]] std::vector<std::shared_ptr<IGraphObserver>> observers() const;

        EngineConfig config_;
        std::unique_ptr<parallel::ThreadPool> pool_;
        extraction::EntityExtractor extractor_;
        std::unique_ptr<vectorize::SemanticVectorizer> vectorizer_;
        relationships::RelationshipBuilder builder_;
        patterns::PatternRecognizer recognizer_;
        query::QueryEngine query_engine_;

        std::mutex build_mutex_;

        mutable std::mutex state_mutex_;
        PublishedGraph graph_;
        std::optional<BuildSummary> last_build_;

        mutable std::mutex observer_mutex_;
        std::vector<std::shared_ptr<IGraphObserver>> observers_;
    };

}  // namespace ckg::engine

#endif //CKG_KNOWLEDGE_GRAPH_ENGINE_HPP
