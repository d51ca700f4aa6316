#ifndef CKG_GRAPH_STORE_HPP
#define CKG_GRAPH_STORE_HPP

/**
 * @file graph_store.hpp
 * @brief Owner of all nodes, relationships and concepts of one build.
 *
 * A build fills a private GraphStore phase by phase; once complete it is
 * frozen behind a std::shared_ptr<const GraphStore> and only read from then
 * on. Entities are kept in insertion order so exports and queries are
 * stable across identical builds.
 */

#include "ckg/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace ckg::graph {

    /**
     * Aggregate counts over a graph.
     */
    struct GraphStats {
        std::size_t node_count = 0;
        std::size_t relationship_count = 0;
        std::size_t concept_count = 0;
        std::map<std::string, std::size_t> node_type_distribution;
        std::map<std::string, std::size_t> relationship_type_distribution;
    };

    class GraphStore {
    public:
        GraphStore() = default;

        /**
         * Inserts a node, or replaces the node with the same id in place.
         * Importance is clamped to [0, 1].
         *
         * @return true if the id was new.
         */
        bool add_node(Node node);

        /**
         * Inserts a relationship keyed by (from, type, to). The id is derived
         * from that key; weight and confidence are clamped to [0, 1].
         *
         * @return true if inserted, false if the key already existed.
         */
        bool add_relationship(Relationship relationship);

        /**
         * Convenience overload building the relationship from its parts.
         */
        bool add_relationship(
            const std::string& from,
            const std::string& to,
            RelationshipType type,
            double weight,
            double confidence,
            bool bidirectional = false
        );

        /**
         * Inserts a concept, or replaces the concept with the same id.
         *
         * @return true if the id was new.
         */
        bool add_concept(Concept concept_value);

        [[nodiscard]] bool has_node(const std::string& id) const;
        [[nodiscard]] bool has_relationship(const std::string& id) const;
        [[nodiscard]] bool has_concept(const std::string& id) const;

        [[nodiscard]] const Node* node(const std::string& id) const;
        [[nodiscard]] Node* mutable_node(const std::string& id);
        [[nodiscard]] const Relationship* relationship(const std::string& id) const;
        [[nodiscard]] const Concept* find_concept(const std::string& id) const;

        [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return nodes_; }
        [[nodiscard]] std::vector<Node>& mutable_nodes() noexcept { return nodes_; }
        [[nodiscard]] const std::vector<Relationship>& relationships() const noexcept { return relationships_; }
        [[nodiscard]] const std::vector<Concept>& concepts() const noexcept { return concepts_; }

        [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
        [[nodiscard]] std::size_t relationship_count() const noexcept { return relationships_.size(); }
        [[nodiscard]] std::size_t concept_count() const noexcept { return concepts_.size(); }

        /**
         * Ids of all nodes of the given type with exactly this name, in
         * insertion order.
         */
        [[nodiscard]] std::vector<std::string> find_by_name(NodeType type, const std::string& name) const;

        /**
         * Relationships with the node at either end, in insertion order.
         */
        [[nodiscard]] std::vector<const Relationship*> relationships_for(const std::string& node_id) const;

        [[nodiscard]] GraphStats stats() const;

    private:
        static std::string name_key(NodeType type, const std::string& name);

        std::vector<Node> nodes_;
        std::vector<Relationship> relationships_;
        std::vector<Concept> concepts_;

        std::unordered_map<std::string, std::size_t> node_index_;
        std::unordered_map<std::string, std::size_t> relationship_index_;
        std::unordered_map<std::string, std::size_t> concept_index_;
        std::unordered_map<std::string, std::vector<std::size_t>> name_index_;
        std::unordered_map<std::string, std::vector<std::size_t>> incident_index_;
    };

}  // namespace ckg::graph

#endif //CKG_GRAPH_STORE_HPP
