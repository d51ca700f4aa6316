#include "ckg/relationships/relationship_builder.hpp"

#include "ckg/core/logging.hpp"
#include "ckg/utils/hash_utils.hpp"

namespace ckg::relationships {

    namespace {

        constexpr double MODULE_IMPORTANCE = 0.4;

    }  // namespace

    std::optional<std::string> resolve_relative(
        const fs::path& importing_file,
        const std::string& specifier,
        const std::set<std::string>& known,
        const std::vector<std::string>& extensions
    ) {
        const fs::path base = (importing_file.parent_path() / specifier).lexically_normal();
        const std::string base_string = base.generic_string();

        if (known.contains(base_string)) {
            return base_string;
        }

        for (const auto& ext : extensions) {
            if (std::string candidate = base_string + ext; known.contains(candidate)) {
                return candidate;
            }
        }

        for (const auto& ext : extensions) {
            if (std::string candidate = (base / ("index" + ext)).generic_string(); known.contains(candidate)) {
                return candidate;
            }
        }

        return std::nullopt;
    }

    RelationshipBuilder::RelationshipBuilder(RelationshipConfig config, DiscoveryConfig discovery)
        : config_(std::move(config))
        , discovery_(std::move(discovery)) {}

    Node RelationshipBuilder::make_entity_node(
        const extraction::FileExtraction& file,
        const extraction::EntityCandidate& candidate
    ) const {
        const std::string path = file.path.generic_string();

        Node node;
        node.id = hash_utils::make_node_id(candidate.type, path + ":" + candidate.name);
        node.type = candidate.type;
        node.name = candidate.name;
        node.location = SourceLocation{file.path, candidate.line};
        node.importance = candidate.importance;
        node.last_updated = file.file_node.last_updated;

        node.metadata[meta::LINE] = static_cast<std::int64_t>(candidate.line);
        if (candidate.function) {
            candidate.function->apply_to(node);
        }
        if (candidate.class_info) {
            candidate.class_info->apply_to(node);
        }
        if (!candidate.declaration_kind.empty()) {
            node.metadata[meta::DECLARATION_KIND] = candidate.declaration_kind;
        }

        return node;
    }

    std::size_t RelationshipBuilder::add_dependencies(
        graph::GraphStore& store,
        const extraction::FileExtraction& file,
        const std::set<std::string>& known,
        ApplyStats& stats
    ) const {
        std::size_t added = 0;
        const std::string& from = file.file_node.id;

        for (const auto& dependency : file.dependencies) {
            std::string target;

            if (dependency.relative) {
                if (auto resolved = resolve_relative(file.path, dependency.specifier, known, discovery_.extensions)) {
                    target = hash_utils::make_node_id(NodeType::File, *resolved);
                } else {
                    // edge to the id the file would have if it existed
                    const auto would_be = (file.path.parent_path() / dependency.specifier).lexically_normal();
                    target = hash_utils::make_node_id(NodeType::File, would_be.generic_string());
                    ++stats.unresolved_dependencies;
                    logging::get()->debug("Unresolved reference '{}' in {}", dependency.specifier,
                                          file.path.generic_string());
                }
            } else {
                target = hash_utils::make_node_id(NodeType::Module, dependency.specifier);
                if (!store.has_node(target)) {
                    Node module;
                    module.id = target;
                    module.type = NodeType::Module;
                    module.name = dependency.specifier;
                    module.importance = MODULE_IMPORTANCE;
                    module.last_updated = file.file_node.last_updated;
                    module.metadata[meta::IS_EXTERNAL] = true;
                    module.metadata[meta::IMPORT_TYPE] = dependency.import_type;
                    store.add_node(std::move(module));
                    ++stats.modules;
                }
            }

            if (target == from) {
                continue;
            }
            if (store.add_relationship(from, target, RelationshipType::DependsOn,
                                       config_.depends_on_weight, config_.default_confidence)) {
                ++added;
            }
        }

        return added;
    }

    ApplyStats RelationshipBuilder::apply(
        graph::GraphStore& store,
        const std::vector<extraction::FileExtraction>& extractions,
        const std::vector<fs::path>& discovered
    ) const {
        ApplyStats stats;

        std::set<std::string> known;
        for (const auto& path : discovered) {
            known.insert(path.lexically_normal().generic_string());
        }

        // Nodes and part_of edges first, so name lookups below see every file.
        for (const auto& file : extractions) {
            if (store.add_node(file.file_node)) {
                ++stats.files;
            }
            stats.entities_skipped += file.ambiguous;

            for (const auto& candidate : file.entities) {
                Node node = make_entity_node(file, candidate);
                const std::string id = node.id;
                if (store.add_node(std::move(node))) {
                    ++stats.entities;
                }
                if (store.add_relationship(id, file.file_node.id, RelationshipType::PartOf,
                                           config_.part_of_weight, config_.default_confidence)) {
                    ++stats.relationships;
                }
            }
        }

        for (const auto& file : extractions) {
            stats.relationships += add_dependencies(store, file, known, stats);

            const std::string path = file.path.generic_string();
            for (const auto& candidate : file.entities) {
                if (!candidate.class_info) {
                    continue;
                }
                const std::string from = hash_utils::make_node_id(candidate.type, path + ":" + candidate.name);

                if (!candidate.class_info->extends.empty()) {
                    for (const auto& target : store.find_by_name(NodeType::Class, candidate.class_info->extends)) {
                        if (target != from && store.add_relationship(from, target, RelationshipType::Extends,
                                                                     config_.inheritance_weight,
                                                                     config_.default_confidence)) {
                            ++stats.relationships;
                        }
                    }
                }

                for (const auto& interface_name : candidate.class_info->implements) {
                    for (const auto& target : store.find_by_name(NodeType::Interface, interface_name)) {
                        if (store.add_relationship(from, target, RelationshipType::Implements,
                                                   config_.inheritance_weight, config_.default_confidence)) {
                            ++stats.relationships;
                        }
                    }
                }
            }

            for (const auto& usage : file.usages) {
                for (const auto& target : store.find_by_name(NodeType::Function, usage.name)) {
                    if (store.add_relationship(file.file_node.id, target, RelationshipType::Calls,
                                               config_.calls_weight, config_.default_confidence)) {
                        ++stats.relationships;
                    }
                }
            }
        }

        logging::get()->debug("Merged {} files: {} entities, {} modules, {} relationships ({} entities skipped)",
                              stats.files, stats.entities, stats.modules, stats.relationships,
                              stats.entities_skipped);
        return stats;
    }

    Result<std::size_t, Error> RelationshipBuilder::discover_similarities(
        graph::GraphStore& store,
        const vectorize::ISimilarityIndex& index,
        const CancellationToken& cancel
    ) const {
        auto pairs = index.pairs_above(config_.similarity_threshold, cancel);
        if (pairs.is_err()) {
            return Result<std::size_t, Error>::failure(pairs.error());
        }

        std::size_t added = 0;
        for (const auto& pair : pairs.value()) {
            if (store.add_relationship(pair.first, pair.second, RelationshipType::SimilarTo,
                                       pair.similarity, config_.default_confidence, true)) {
                ++added;
            }
        }

        logging::get()->debug("Similarity pass over {} vectors added {} edges using the {} index",
                              index.size(), added, index.name());
        return Result<std::size_t, Error>::success(added);
    }

}  // namespace ckg::relationships
