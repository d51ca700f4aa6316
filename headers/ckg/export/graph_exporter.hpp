#ifndef CKG_GRAPH_EXPORTER_HPP
#define CKG_GRAPH_EXPORTER_HPP

/**
 * @file graph_exporter.hpp
 * @brief JSON serialization of graphs, query results and reports.
 *
 * Scalar metadata keeps its JSON type (string, number, integer, boolean);
 * timestamps become ISO 8601 UTC strings. Maps are ordered, so exporting
 * the same graph twice gives identical documents apart from export_date.
 */

#include "ckg/engine/knowledge_graph_engine.hpp"
#include "ckg/insights/insight_extractor.hpp"
#include "ckg/query/query_engine.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ckg::export_module {

    using json = nlohmann::json;

    /**
     * Formats a timestamp as ISO 8601 UTC, "2026-01-31T12:00:00Z".
     */
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    [[nodiscard]] json to_json(const ScalarValue& value);
    [[nodiscard]] json to_json(const AttributeMap& values);
    [[nodiscard]] json to_json(const Node& node);
    [[nodiscard]] json to_json(const Relationship& relationship);
    [[nodiscard]] json to_json(const Concept& concept_value);
    [[nodiscard]] json to_json(const insights::Insight& insight);
    [[nodiscard]] json to_json(const graph::GraphStats& stats);
    [[nodiscard]] json to_json(const engine::BuildSummary& summary);
    [[nodiscard]] json to_json(const engine::HealthReport& report);
    [[nodiscard]] json to_json(const engine::VisualizationData& data);
    [[nodiscard]] json to_json(const query::QueryResult& result);

    /**
     * {nodes, relationships, concepts, metadata {export_date, version}}.
     */
    [[nodiscard]] json export_to_json(const engine::GraphSnapshot& snapshot);

    /**
     * Writes export_to_json(snapshot) to a file, pretty-printed.
     *
     * @return IoError if the file cannot be written.
     */
    [[nodiscard]] Result<void, Error> write_snapshot(
        const engine::GraphSnapshot& snapshot,
        const fs::path& path
    );

}  // namespace ckg::export_module

#endif //CKG_GRAPH_EXPORTER_HPP
