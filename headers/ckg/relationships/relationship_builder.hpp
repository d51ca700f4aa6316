#ifndef CKG_RELATIONSHIP_BUILDER_HPP
#define CKG_RELATIONSHIP_BUILDER_HPP

/**
 * @file relationship_builder.hpp
 * @brief Turns extractor output into graph nodes and typed edges.
 *
 * Edges created by apply():
 * - part_of: entity -> file
 * - depends_on: file -> file (relative reference) or file -> module
 * - calls: file -> every Function with the called name
 * - extends / implements: class -> named superclass / interface
 *
 * discover_similarities() adds bidirectional similar_to edges between
 * vectorized nodes whose cosine similarity exceeds the threshold.
 */

#include "ckg/core/config.hpp"
#include "ckg/extraction/entity_extractor.hpp"
#include "ckg/graph/graph_store.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/utils/cancellation.hpp"
#include "ckg/vectorize/similarity_index.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ckg::relationships {

    /**
     * Counters of one apply() run.
     */
    struct ApplyStats {
        std::size_t files = 0;
        std::size_t entities = 0;
        std::size_t modules = 0;
        std::size_t relationships = 0;
        std::size_t entities_skipped = 0;
        std::size_t unresolved_dependencies = 0;
    };

    /**
     * Resolves a relative reference against the importing file.
     *
     * Tries the joined path itself, then the path with each allow-listed
     * extension appended, then index.<ext> inside it.
     *
     * @param known Generic strings of all discovered files.
     * @return The matching generic path, or nullopt if nothing matched.
     */
    [[nodiscard]] std::optional<std::string> resolve_relative(
        const fs::path& importing_file,
        const std::string& specifier,
        const std::set<std::string>& known,
        const std::vector<std::string>& extensions
    );

    class RelationshipBuilder {
    public:
        explicit RelationshipBuilder(RelationshipConfig config = {}, DiscoveryConfig discovery = {});

        /**
         * Adds the file nodes, entity nodes and structural edges of all
         * extractions, in the given order. All nodes are inserted before
         * any call or inheritance edge is resolved, so a call may target a
         * function from a later file.
         *
         * @param discovered Every file found by discovery, including those
         *        whose extraction failed; relative references resolve
         *        against this list.
         */
        ApplyStats apply(
            graph::GraphStore& store,
            const std::vector<extraction::FileExtraction>& extractions,
            const std::vector<fs::path>& discovered
        ) const;

        /**
         * Adds a bidirectional similar_to edge, weight = similarity, for
         * every pair the index reports above the configured threshold.
         *
         * @return Number of edges added, or Cancelled.
         */
        [[nodiscard]] Result<std::size_t, Error> discover_similarities(
            graph::GraphStore& store,
            const vectorize::ISimilarityIndex& index,
            const CancellationToken& cancel = {}
        ) const;

    private:
        [[nodiscard]] Node make_entity_node(
            const extraction::FileExtraction& file,
            const extraction::EntityCandidate& candidate
        ) const;

        std::size_t add_dependencies(
            graph::GraphStore& store,
            const extraction::FileExtraction& file,
            const std::set<std::string>& known,
            ApplyStats& stats
        ) const;

        RelationshipConfig config_;
        DiscoveryConfig discovery_;
    };

}  // namespace ckg::relationships

#endif //CKG_RELATIONSHIP_BUILDER_HPP
