#ifndef CKG_TYPES_HPP
#define CKG_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures of the code knowledge graph.
 *
 * - Basic Types: Duration, Timestamp, SourceLocation, ScalarValue
 * - Graph entities: Node, Relationship, Concept
 * - Typed metadata: FileMetadata, FunctionMetadata, ClassMetadata
 *
 * Node and relationship ids are content-addressed (see hash_utils), so the
 * same input always produces the same id and re-insertion is idempotent.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ckg {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Fixed-dimension term-frequency projection of a piece of text.
     * An empty vector means "not vectorized".
     */
    using SemanticVector = std::vector<float>;

    /**
     * Value of a metadata or attribute entry.
     */
    using ScalarValue = std::variant<std::string, double, std::int64_t, bool, Timestamp>;

    /**
     * Ordered so that exports and comparisons are stable.
     */
    using AttributeMap = std::map<std::string, ScalarValue>;

    /**
     * Source code location.
     */
    struct SourceLocation {
        fs::path file;
        std::size_t line = 0;

        [[nodiscard]] bool has_location() const noexcept {
            return !file.empty() && line > 0;
        }
    };

    /**
     * Clamps weights, confidences and importances into [0, 1].
     */
    [[nodiscard]] double clamp_unit(double value) noexcept;

    // ============================================================================
    // Enumerations
    // ============================================================================

    enum class NodeType {
        File,
        Function,
        Class,
        Interface,
        Variable,
        Module,
        Concept
    };

    enum class RelationshipType {
        Imports,
        Exports,
        Calls,
        Extends,
        Implements,
        Uses,
        DependsOn,
        SimilarTo,
        PartOf
    };

    enum class ConceptCategory {
        DesignPattern,
        Architecture,
        Algorithm,
        DataStructure,
        BusinessLogic
    };

    [[nodiscard]] const char* to_string(NodeType type) noexcept;
    [[nodiscard]] const char* to_string(RelationshipType type) noexcept;
    [[nodiscard]] const char* to_string(ConceptCategory category) noexcept;

    [[nodiscard]] std::optional<NodeType> node_type_from_string(std::string_view name) noexcept;
    [[nodiscard]] std::optional<RelationshipType> relationship_type_from_string(std::string_view name) noexcept;
    [[nodiscard]] std::optional<ConceptCategory> concept_category_from_string(std::string_view name) noexcept;

    // ============================================================================
    // Graph Entities
    // ============================================================================

    /**
     * A typed graph entity.
     */
    struct Node {
        std::string id;
        NodeType type = NodeType::File;
        std::string name;
        std::optional<SourceLocation> location;
        AttributeMap metadata;
        AttributeMap attributes;
        SemanticVector semantic_vector;
        double importance = 0.5;
        Timestamp last_updated;

        /**
         * Path of the file this node lives in, or "" for modules and concepts.
         */
        [[nodiscard]] std::string path() const;

        /**
         * Looks up a numeric entry in metadata, then attributes.
         * Integers are widened to double.
         */
        [[nodiscard]] std::optional<double> number(const std::string& key) const;

        /**
         * Looks up a string entry in metadata, then attributes.
         */
        [[nodiscard]] std::optional<std::string> text(const std::string& key) const;

        /**
         * Returns the boolean entry, or false when absent.
         */
        [[nodiscard]] bool flag(const std::string& key) const;

        [[nodiscard]] bool is_vectorized() const noexcept {
            return !semantic_vector.empty();
        }
    };

    /**
     * A typed, weighted edge. Identified by (from, type, to).
     */
    struct Relationship {
        std::string id;
        std::string from;
        std::string to;
        RelationshipType type = RelationshipType::Uses;
        double weight = 0.5;
        double confidence = 0.8;
        bool bidirectional = false;

        [[nodiscard]] static std::string make_id(
            const std::string& from, RelationshipType type, const std::string& to);
    };

    /**
     * A named pattern or domain term detected across the graph.
     */
    struct Concept {
        std::string id;
        std::string name;
        std::string description;
        ConceptCategory category = ConceptCategory::DesignPattern;
        std::set<std::string> keywords;
        std::set<std::string> related_concepts;
        std::set<std::string> code_patterns;
        double confidence = 0.8;
        std::vector<std::string> related_nodes;
    };

    // ============================================================================
    // Typed Metadata
    // ============================================================================

    namespace meta {
        inline constexpr auto SIZE = "size";
        inline constexpr auto EXTENSION = "extension";
        inline constexpr auto LAST_MODIFIED = "last_modified";
        inline constexpr auto LINE_COUNT = "line_count";
        inline constexpr auto LINE = "line";
        inline constexpr auto IS_ASYNC = "is_async";
        inline constexpr auto EXTENDS = "extends";
        inline constexpr auto IMPLEMENTS = "implements";
        inline constexpr auto IS_ABSTRACT = "is_abstract";
        inline constexpr auto HAS_PRIVATE_CONSTRUCTOR = "has_private_constructor";
        inline constexpr auto DECLARATION_KIND = "declaration_kind";
        inline constexpr auto IS_EXTERNAL = "is_external";
        inline constexpr auto IMPORT_TYPE = "import_type";
        inline constexpr auto LANGUAGE = "language";
        inline constexpr auto COMPLEXITY = "complexity";
    }  // namespace meta

    struct FileMetadata {
        std::uintmax_t size_bytes = 0;
        std::string extension;
        Timestamp modified;
        std::size_t line_count = 0;
        std::string language;
        double complexity = 0.0;

        void apply_to(Node& node) const;
    };

    struct FunctionMetadata {
        std::size_t line = 0;
        bool is_async = false;
        double complexity = 0.0;

        void apply_to(Node& node) const;
    };

    struct ClassMetadata {
        std::size_t line = 0;
        std::string extends;
        std::vector<std::string> implements;
        std::size_t line_count = 0;
        bool is_abstract = false;
        bool has_private_constructor = false;

        void apply_to(Node& node) const;
    };

}  // namespace ckg

#endif //CKG_TYPES_HPP
