#include "ckg/engine/knowledge_graph_engine.hpp"

#include "ckg/core/logging.hpp"
#include "ckg/export/graph_exporter.hpp"
#include "ckg/utils/parallel.hpp"
#include "ckg/version.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace ckg::engine {

    namespace {

        Duration elapsed_since(const std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        }

        Error build_cancelled(const std::string& phase) {
            return Error::cancelled("Build cancelled during " + phase);
        }

    }  // namespace

    const char* node_color(const NodeType type) noexcept {
        switch (type) {
            case NodeType::File: return "#3498db";
            case NodeType::Function: return "#2ecc71";
            case NodeType::Class: return "#e74c3c";
            case NodeType::Interface: return "#f39c12";
            case NodeType::Variable: return "#9b59b6";
            case NodeType::Module: return "#1abc9c";
            case NodeType::Concept: return "#e67e22";
        }
        return "#95a5a6";
    }

    Result<std::unique_ptr<KnowledgeGraphEngine>, Error> KnowledgeGraphEngine::create(EngineConfig config) {
        if (auto valid = config.validate(); valid.is_err()) {
            return Result<std::unique_ptr<KnowledgeGraphEngine>, Error>::failure(valid.error());
        }
        if (auto logged = logging::configure(config.logging); logged.is_err()) {
            return Result<std::unique_ptr<KnowledgeGraphEngine>, Error>::failure(logged.error());
        }
        return Result<std::unique_ptr<KnowledgeGraphEngine>, Error>::success(
            std::make_unique<KnowledgeGraphEngine>(std::move(config))
        );
    }

    KnowledgeGraphEngine::KnowledgeGraphEngine(EngineConfig config)
        : config_(std::move(config))
        , pool_(std::make_unique<parallel::ThreadPool>(config_.performance.num_threads))
        , extractor_(extraction::ExtractorRegistry::with_builtin(), config_.discovery.max_line_length)
        , vectorizer_(std::make_unique<vectorize::SemanticVectorizer>(config_.vectorizer))
        , builder_(config_.relationships, config_.discovery)
        , recognizer_(config_.patterns)
        , query_engine_(config_.query, config_.insights) {
        graph_.store = std::make_shared<const graph::GraphStore>();
        graph_.index = std::make_shared<const vectorize::ExactSimilarityIndex>();
        logging::get()->debug("Knowledge graph engine {} ready with {} worker threads", VERSION_STRING, pool_->size());
    }

    KnowledgeGraphEngine::~KnowledgeGraphEngine() = default;

    KnowledgeGraphEngine::PublishedGraph KnowledgeGraphEngine::published() const {
        std::lock_guard lock(state_mutex_);
        return graph_;
    }

    std::shared_ptr<const graph::GraphStore> KnowledgeGraphEngine::graph() const {
        return published().store;
    }

    std::optional<BuildSummary> KnowledgeGraphEngine::last_build() const {
        std::lock_guard lock(state_mutex_);
        return last_build_;
    }

    Result<std::vector<extraction::FileExtraction>, Error> KnowledgeGraphEngine::extract_all(
        const fs::path& root,
        const std::vector<fs::path>& files,
        const CancellationToken& cancel,
        BuildSummary& summary
    ) const {
        using FileResult = std::optional<Result<extraction::FileExtraction, Error>>;

        auto outcomes = parallel::map(files, [&](const fs::path& path) -> FileResult {
            if (cancel.is_cancelled()) {
                return std::nullopt;
            }
            try {
                return extractor_.extract_file(root, path);
            } catch (const std::exception& e) {
                return Result<extraction::FileExtraction, Error>::failure(
                    Error::extraction_error(std::string("Extraction failed: ") + e.what(), path.string())
                );
            }
        }, *pool_);

        if (cancel.is_cancelled()) {
            return Result<std::vector<extraction::FileExtraction>, Error>::failure(build_cancelled("extraction"));
        }

        std::vector<extraction::FileExtraction> extractions;
        extractions.reserve(outcomes.size());
        for (auto& outcome : outcomes) {
            if (!outcome) {
                continue;
            }
            if (outcome->is_err()) {
                logging::get()->warn("Skipping file: {}", outcome->error().to_string());
                ++summary.files_skipped;
                continue;
            }
            extractions.push_back(std::move(outcome->value()));
        }

        summary.files_extracted = extractions.size();
        return Result<std::vector<extraction::FileExtraction>, Error>::success(std::move(extractions));
    }

    Result<void, Error> KnowledgeGraphEngine::vectorize_nodes(
        graph::GraphStore& store,
        const CancellationToken& cancel
    ) const {
        auto& nodes = store.mutable_nodes();

        auto vectors = parallel::map_chunks(nodes.size(), [&](const std::size_t begin, const std::size_t end) {
            std::vector<SemanticVector> chunk;
            chunk.reserve(end - begin);
            for (std::size_t i = begin; i < end && !cancel.is_cancelled(); ++i) {
                chunk.push_back(vectorizer_->vectorize_node(nodes[i]));
            }
            return chunk;
        }, *pool_);

        if (cancel.is_cancelled()) {
            return Result<void, Error>::failure(build_cancelled("vectorization"));
        }

        std::size_t i = 0;
        for (auto& chunk : vectors) {
            for (auto& vector : chunk) {
                nodes[i++].semantic_vector = std::move(vector);
            }
        }
        return Result<void, Error>::success();
    }

    Result<BuildSummary, Error> KnowledgeGraphEngine::build_graph(
        const fs::path& root,
        const CancellationToken& cancel
    ) {
        std::lock_guard build_lock(build_mutex_);

        const auto start = std::chrono::steady_clock::now();
        auto log = logging::get();

        BuildSummary summary;
        summary.root = root;

        log->info("Building knowledge graph from {}", root.string());

        auto discovered = extraction::discover_files(root, config_.discovery, cancel);
        if (discovered.is_err()) {
            log->error("Discovery failed: {}", discovered.error().to_string());
            return Result<BuildSummary, Error>::failure(discovered.error());
        }
        const auto& files = discovered.value().files;
        summary.files_discovered = files.size();
        summary.dirs_skipped = discovered.value().skipped_dirs;
        log->info("Discovered {} files", files.size());

        auto extractions = extract_all(root, files, cancel, summary);
        if (extractions.is_err()) {
            log->info("{}", extractions.error().message());
            return Result<BuildSummary, Error>::failure(extractions.error());
        }

        auto store = std::make_shared<graph::GraphStore>();
        const auto applied = builder_.apply(*store, extractions.value(), files);
        summary.entities_skipped = applied.entities_skipped;
        summary.unresolved_dependencies = applied.unresolved_dependencies;
        log->info("Extracted {} nodes and {} relationships from {} files",
                  store->node_count(), store->relationship_count(), summary.files_extracted);

        if (auto vectorized = vectorize_nodes(*store, cancel); vectorized.is_err()) {
            log->info("{}", vectorized.error().message());
            return Result<BuildSummary, Error>::failure(vectorized.error());
        }

        auto index = std::make_shared<vectorize::ExactSimilarityIndex>(pool_.get());
        index->build(store->nodes());

        if (config_.relationships.discover_similarities) {
            auto similar = builder_.discover_similarities(*store, *index, cancel);
            if (similar.is_err()) {
                log->info("{}", similar.error().message());
                return Result<BuildSummary, Error>::failure(similar.error());
            }
            summary.similarity_edges = similar.value();
            log->info("Added {} similarity relationships", summary.similarity_edges);
        }

        auto recognized = recognizer_.recognize(*store, cancel);
        if (recognized.is_err()) {
            log->info("{}", recognized.error().message());
            return Result<BuildSummary, Error>::failure(recognized.error());
        }

        if (cancel.is_cancelled()) {
            return Result<BuildSummary, Error>::failure(build_cancelled("publishing"));
        }

        summary.node_count = store->node_count();
        summary.relationship_count = store->relationship_count();
        summary.concept_count = store->concept_count();
        summary.duration = elapsed_since(start);
        summary.built_at = std::chrono::system_clock::now();

        {
            std::lock_guard lock(state_mutex_);
            graph_.store = std::move(store);
            graph_.index = std::move(index);
            last_build_ = summary;
        }
        // node vectors now live on the published store
        vectorizer_->clear_cache();

        log->info("Knowledge graph built: {} nodes, {} relationships, {} concepts in {} ms",
                  summary.node_count, summary.relationship_count, summary.concept_count,
                  std::chrono::duration_cast<std::chrono::milliseconds>(summary.duration).count());

        const GraphBuiltEvent event{
            summary.root,
            summary.node_count,
            summary.relationship_count,
            summary.concept_count,
            summary.duration
        };
        for (const auto& observer : observers()) {
            observer->on_graph_built(event);
        }

        return Result<BuildSummary, Error>::success(std::move(summary));
    }

    query::QueryResult KnowledgeGraphEngine::query(const query::QueryRequest& request) const {
        const auto current = published();
        auto result = query_engine_.execute(request, *current.store, *current.index, *vectorizer_);

        logging::get()->debug("Query '{}' returned {} nodes", request.text, result.nodes.size());

        const QueryExecutedEvent event{
            request.text,
            result.nodes.size(),
            result.duration,
            result.relevance_score
        };
        for (const auto& observer : observers()) {
            observer->on_query_executed(event);
        }

        return result;
    }

    GraphSnapshot KnowledgeGraphEngine::export_snapshot() const {
        const auto store = graph();

        GraphSnapshot snapshot;
        snapshot.nodes = store->nodes();
        snapshot.relationships = store->relationships();
        snapshot.concepts = store->concepts();
        snapshot.metadata.export_date = std::chrono::system_clock::now();
        snapshot.metadata.version = VERSION_STRING;
        return snapshot;
    }

    Result<void, Error> KnowledgeGraphEngine::write_snapshot(const fs::path& path) const {
        return export_module::write_snapshot(export_snapshot(), path);
    }

    VisualizationData KnowledgeGraphEngine::visualize() const {
        const auto store = graph();

        VisualizationData data;
        data.nodes.reserve(store->node_count());
        for (const auto& node : store->nodes()) {
            data.nodes.push_back(VisualizationNode{
                node.id,
                node.name,
                node.type,
                node.importance * 20.0,
                node_color(node.type)
            });
        }

        data.edges.reserve(store->relationship_count());
        for (const auto& rel : store->relationships()) {
            data.edges.push_back(VisualizationEdge{
                rel.id,
                rel.from,
                rel.to,
                rel.type,
                rel.weight
            });
        }
        return data;
    }

    graph::GraphStats KnowledgeGraphEngine::stats() const {
        return graph()->stats();
    }

    HealthReport KnowledgeGraphEngine::health() const {
        const auto current = published();
        const auto last = last_build();

        HealthReport report;
        report.status = last ? "healthy" : "empty";
        report.node_count = current.store->node_count();
        report.relationship_count = current.store->relationship_count();
        report.concept_count = current.store->concept_count();
        if (last) {
            report.last_build = last->built_at;
        }
        report.similarity_index_size = current.index->size();
        report.vector_cache_size = vectorizer_->cache_size();
        {
            std::lock_guard lock(observer_mutex_);
            report.observer_count = observers_.size();
        }
        return report;
    }

    void KnowledgeGraphEngine::add_observer(std::shared_ptr<IGraphObserver> observer) {
        if (!observer) {
            return;
        }
        std::lock_guard lock(observer_mutex_);
        observers_.push_back(std::move(observer));
    }

    void KnowledgeGraphEngine::remove_observer(const std::shared_ptr<IGraphObserver>& observer) {
        std::lock_guard lock(observer_mutex_);
        std::erase(observers_, observer);
    }

    std::vector<std::shared_ptr<IGraphObserver>> KnowledgeGraphEngine::observers() const {
        std::lock_guard lock(observer_mutex_);
        return observers_;
    }

}  // namespace ckg::engine
