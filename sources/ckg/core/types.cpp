#include "ckg/types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace ckg {

    namespace {

        constexpr std::array<std::pair<NodeType, const char*>, 7> kNodeTypeNames{{
            {NodeType::File, "file"},
            {NodeType::Function, "function"},
            {NodeType::Class, "class"},
            {NodeType::Interface, "interface"},
            {NodeType::Variable, "variable"},
            {NodeType::Module, "module"},
            {NodeType::Concept, "concept"},
        }};

        constexpr std::array<std::pair<RelationshipType, const char*>, 9> kRelationshipTypeNames{{
            {RelationshipType::Imports, "imports"},
            {RelationshipType::Exports, "exports"},
            {RelationshipType::Calls, "calls"},
            {RelationshipType::Extends, "extends"},
            {RelationshipType::Implements, "implements"},
            {RelationshipType::Uses, "uses"},
            {RelationshipType::DependsOn, "depends_on"},
            {RelationshipType::SimilarTo, "similar_to"},
            {RelationshipType::PartOf, "part_of"},
        }};

        constexpr std::array<std::pair<ConceptCategory, const char*>, 5> kCategoryNames{{
            {ConceptCategory::DesignPattern, "design_pattern"},
            {ConceptCategory::Architecture, "architecture"},
            {ConceptCategory::Algorithm, "algorithm"},
            {ConceptCategory::DataStructure, "data_structure"},
            {ConceptCategory::BusinessLogic, "business_logic"},
        }};

        template<typename Enum, std::size_t N>
        const char* lookup_name(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) noexcept {
            for (const auto& [key, name] : table) {
                if (key == value) {
                    return name;
                }
            }
            return "unknown";
        }

        template<typename Enum, std::size_t N>
        std::optional<Enum> lookup_value(const std::array<std::pair<Enum, const char*>, N>& table,
                                         const std::string_view name) noexcept {
            for (const auto& [key, key_name] : table) {
                if (name == key_name) {
                    return key;
                }
            }
            return std::nullopt;
        }

        const ScalarValue* find_entry(const Node& node, const std::string& key) {
            if (const auto it = node.metadata.find(key); it != node.metadata.end()) {
                return &it->second;
            }
            if (const auto it = node.attributes.find(key); it != node.attributes.end()) {
                return &it->second;
            }
            return nullptr;
        }

    }  // namespace

    double clamp_unit(const double value) noexcept {
        if (!(value > 0.0)) {
            return 0.0;
        }
        return std::min(value, 1.0);
    }

    const char* to_string(const NodeType type) noexcept {
        return lookup_name(kNodeTypeNames, type);
    }

    const char* to_string(const RelationshipType type) noexcept {
        return lookup_name(kRelationshipTypeNames, type);
    }

    const char* to_string(const ConceptCategory category) noexcept {
        return lookup_name(kCategoryNames, category);
    }

    std::optional<NodeType> node_type_from_string(const std::string_view name) noexcept {
        return lookup_value(kNodeTypeNames, name);
    }

    std::optional<RelationshipType> relationship_type_from_string(const std::string_view name) noexcept {
        return lookup_value(kRelationshipTypeNames, name);
    }

    std::optional<ConceptCategory> concept_category_from_string(const std::string_view name) noexcept {
        return lookup_value(kCategoryNames, name);
    }

    // ============================================================================
    // Node
    // ============================================================================

    std::string Node::path() const {
        if (location.has_value()) {
            return location->file.generic_string();
        }
        return "";
    }

    std::optional<double> Node::number(const std::string& key) const {
        const ScalarValue* value = find_entry(*this, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (const auto* d = std::get_if<double>(value)) {
            return *d;
        }
        if (const auto* i = std::get_if<std::int64_t>(value)) {
            return static_cast<double>(*i);
        }
        return std::nullopt;
    }

    std::optional<std::string> Node::text(const std::string& key) const {
        const ScalarValue* value = find_entry(*this, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (const auto* s = std::get_if<std::string>(value)) {
            return *s;
        }
        return std::nullopt;
    }

    bool Node::flag(const std::string& key) const {
        const ScalarValue* value = find_entry(*this, key);
        if (value == nullptr) {
            return false;
        }
        if (const auto* b = std::get_if<bool>(value)) {
            return *b;
        }
        return false;
    }

    std::string Relationship::make_id(const std::string& from, const RelationshipType type,
                                      const std::string& to) {
        std::string id;
        id.reserve(from.size() + to.size() + 16);
        id += from;
        id += '_';
        id += to_string(type);
        id += '_';
        id += to;
        return id;
    }

    // ============================================================================
    // Typed Metadata
    // ============================================================================

    void FileMetadata::apply_to(Node& node) const {
        node.metadata[meta::SIZE] = static_cast<std::int64_t>(size_bytes);
        node.metadata[meta::EXTENSION] = extension;
        node.metadata[meta::LAST_MODIFIED] = modified;
        node.metadata[meta::LINE_COUNT] = static_cast<std::int64_t>(line_count);
        node.attributes[meta::LANGUAGE] = language;
        node.attributes[meta::COMPLEXITY] = complexity;
    }

    void FunctionMetadata::apply_to(Node& node) const {
        node.metadata[meta::LINE] = static_cast<std::int64_t>(line);
        node.metadata[meta::IS_ASYNC] = is_async;
        node.attributes[meta::COMPLEXITY] = complexity;
    }

    void ClassMetadata::apply_to(Node& node) const {
        node.metadata[meta::LINE] = static_cast<std::int64_t>(line);
        node.metadata[meta::LINE_COUNT] = static_cast<std::int64_t>(line_count);
        if (!extends.empty()) {
            node.metadata[meta::EXTENDS] = extends;
        }
        if (!implements.empty()) {
            std::string joined;
            for (const auto& name : implements) {
                if (!joined.empty()) {
                    joined += ',';
                }
                joined += name;
            }
            node.metadata[meta::IMPLEMENTS] = joined;
        }
        node.attributes[meta::IS_ABSTRACT] = is_abstract;
        node.metadata[meta::HAS_PRIVATE_CONSTRUCTOR] = has_private_constructor;
    }

}  // namespace ckg
