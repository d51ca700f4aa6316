#include "ckg/graph/graph_store.hpp"

#include <algorithm>

namespace ckg::graph {

    std::string GraphStore::name_key(const NodeType type, const std::string& name) {
        std::string key = to_string(type);
        key += '|';
        key += name;
        return key;
    }

    bool GraphStore::add_node(Node node) {
        node.importance = clamp_unit(node.importance);

        if (const auto it = node_index_.find(node.id); it != node_index_.end()) {
            Node& existing = nodes_[it->second];
            if (existing.type != node.type || existing.name != node.name) {
                auto& old_bucket = name_index_[name_key(existing.type, existing.name)];
                std::erase(old_bucket, it->second);
                name_index_[name_key(node.type, node.name)].push_back(it->second);
            }
            existing = std::move(node);
            return false;
        }

        const std::size_t index = nodes_.size();
        node_index_.emplace(node.id, index);
        name_index_[name_key(node.type, node.name)].push_back(index);
        nodes_.push_back(std::move(node));
        return true;
    }

    bool GraphStore::add_relationship(Relationship relationship) {
        relationship.id = Relationship::make_id(relationship.from, relationship.type, relationship.to);
        if (relationship_index_.contains(relationship.id)) {
            return false;
        }

        relationship.weight = clamp_unit(relationship.weight);
        relationship.confidence = clamp_unit(relationship.confidence);

        const std::size_t index = relationships_.size();
        relationship_index_.emplace(relationship.id, index);
        incident_index_[relationship.from].push_back(index);
        if (relationship.to != relationship.from) {
            incident_index_[relationship.to].push_back(index);
        }
        relationships_.push_back(std::move(relationship));
        return true;
    }

    bool GraphStore::add_relationship(
        const std::string& from,
        const std::string& to,
        const RelationshipType type,
        const double weight,
        const double confidence,
        const bool bidirectional
    ) {
        Relationship relationship;
        relationship.from = from;
        relationship.to = to;
        relationship.type = type;
        relationship.weight = weight;
        relationship.confidence = confidence;
        relationship.bidirectional = bidirectional;
        return add_relationship(std::move(relationship));
    }

    bool GraphStore::add_concept(Concept concept_value) {
        concept_value.confidence = clamp_unit(concept_value.confidence);

        if (const auto it = concept_index_.find(concept_value.id); it != concept_index_.end()) {
            concepts_[it->second] = std::move(concept_value);
            return false;
        }

        concept_index_.emplace(concept_value.id, concepts_.size());
        concepts_.push_back(std::move(concept_value));
        return true;
    }

    bool GraphStore::has_node(const std::string& id) const {
        return node_index_.contains(id);
    }

    bool GraphStore::has_relationship(const std::string& id) const {
        return relationship_index_.contains(id);
    }

    bool GraphStore::has_concept(const std::string& id) const {
        return concept_index_.contains(id);
    }

    const Node* GraphStore::node(const std::string& id) const {
        const auto it = node_index_.find(id);
        return it == node_index_.end() ? nullptr : &nodes_[it->second];
    }

    const Relationship* GraphStore::relationship(const std::string& id) const {
        const auto it = relationship_index_.find(id);
        return it == relationship_index_.end() ? nullptr : &relationships_[it->second];
    }

    Node* GraphStore::mutable_node(const std::string& id) {
        const auto it = node_index_.find(id);
        return it == node_index_.end() ? nullptr : &nodes_[it->second];
    }

    const Concept* GraphStore::find_concept(const std::string& id) const {
        const auto it = concept_index_.find(id);
        return it == concept_index_.end() ? nullptr : &concepts_[it->second];
    }

    std::vector<std::string> GraphStore::find_by_name(const NodeType type, const std::string& name) const {
        std::vector<std::string> ids;
        if (const auto it = name_index_.find(name_key(type, name)); it != name_index_.end()) {
            ids.reserve(it->second.size());
            for (const std::size_t index : it->second) {
                ids.push_back(nodes_[index].id);
            }
        }
        return ids;
    }

    std::vector<const Relationship*> GraphStore::relationships_for(const std::string& node_id) const {
        std::vector<const Relationship*> result;
        if (const auto it = incident_index_.find(node_id); it != incident_index_.end()) {
            result.reserve(it->second.size());
            for (const std::size_t index : it->second) {
                result.push_back(&relationships_[index]);
            }
        }
        return result;
    }

    GraphStats GraphStore::stats() const {
        GraphStats stats;
        stats.node_count = nodes_.size();
        stats.relationship_count = relationships_.size();
        stats.concept_count = concepts_.size();

        for (const auto& node : nodes_) {
            ++stats.node_type_distribution[to_string(node.type)];
        }
        for (const auto& rel : relationships_) {
            ++stats.relationship_type_distribution[to_string(rel.type)];
        }

        return stats;
    }

}  // namespace ckg::graph
