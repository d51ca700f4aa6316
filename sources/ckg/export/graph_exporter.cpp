#include "ckg/export/graph_exporter.hpp"

#include "ckg/utils/json_utils.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>
#include <type_traits>
#include <variant>

namespace ckg::export_module {

    namespace {

        double to_milliseconds(const Duration d) {
            return std::chrono::duration<double, std::milli>(d).count();
        }

        json string_list(const std::set<std::string>& values) {
            json list = json::array();
            for (const auto& value : values) {
                list.push_back(value);
            }
            return list;
        }

    }  // namespace

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::ostringstream ss;

#ifdef _WIN32
        std::tm time_info{};
        gmtime_s(&time_info, &time_t_val);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#else
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#endif

        return ss.str();
    }

    json to_json(const ScalarValue& value) {
        return std::visit([](const auto& v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return v;
            }
        }, value);
    }

    json to_json(const AttributeMap& values) {
        json object = json::object();
        for (const auto& [key, value] : values) {
            object[key] = to_json(value);
        }
        return object;
    }

    json to_json(const Node& node) {
        json j;
        j["id"] = node.id;
        j["type"] = to_string(node.type);
        j["name"] = node.name;
        if (node.location) {
            j["location"] = {
                {"file", node.location->file.generic_string()},
                {"line", node.location->line}
            };
        } else {
            j["location"] = nullptr;
        }
        j["metadata"] = to_json(node.metadata);
        j["attributes"] = to_json(node.attributes);
        j["semantic_vector"] = node.semantic_vector;
        j["importance"] = node.importance;
        j["last_updated"] = format_timestamp(node.last_updated);
        return j;
    }

    json to_json(const Relationship& relationship) {
        return {
            {"id", relationship.id},
            {"from", relationship.from},
            {"to", relationship.to},
            {"type", to_string(relationship.type)},
            {"weight", relationship.weight},
            {"confidence", relationship.confidence},
            {"bidirectional", relationship.bidirectional}
        };
    }

    json to_json(const Concept& concept_value) {
        return {
            {"id", concept_value.id},
            {"name", concept_value.name},
            {"description", concept_value.description},
            {"category", to_string(concept_value.category)},
            {"keywords", string_list(concept_value.keywords)},
            {"related_concepts", string_list(concept_value.related_concepts)},
            {"code_patterns", string_list(concept_value.code_patterns)},
            {"confidence", concept_value.confidence},
            {"related_nodes", concept_value.related_nodes}
        };
    }

    json to_json(const insights::Insight& insight) {
        return {
            {"id", insight.id},
            {"type", insights::to_string(insight.type)},
            {"title", insight.title},
            {"description", insight.description},
            {"confidence", insight.confidence},
            {"actionable", insight.actionable},
            {"suggestion", insight.suggestion},
            {"affected_nodes", insight.affected_nodes}
        };
    }

    json to_json(const graph::GraphStats& stats) {
        return {
            {"node_count", stats.node_count},
            {"relationship_count", stats.relationship_count},
            {"concept_count", stats.concept_count},
            {"node_type_distribution", stats.node_type_distribution},
            {"relationship_type_distribution", stats.relationship_type_distribution}
        };
    }

    json to_json(const engine::BuildSummary& summary) {
        return {
            {"root", summary.root.generic_string()},
            {"files_discovered", summary.files_discovered},
            {"files_extracted", summary.files_extracted},
            {"files_skipped", summary.files_skipped},
            {"dirs_skipped", summary.dirs_skipped},
            {"entities_skipped", summary.entities_skipped},
            {"unresolved_dependencies", summary.unresolved_dependencies},
            {"similarity_edges", summary.similarity_edges},
            {"node_count", summary.node_count},
            {"relationship_count", summary.relationship_count},
            {"concept_count", summary.concept_count},
            {"duration_ms", to_milliseconds(summary.duration)},
            {"built_at", format_timestamp(summary.built_at)}
        };
    }

    json to_json(const engine::HealthReport& report) {
        json j;
        j["status"] = report.status;
        j["node_count"] = report.node_count;
        j["relationship_count"] = report.relationship_count;
        j["concept_count"] = report.concept_count;
        j["last_build"] = report.last_build ? json(format_timestamp(*report.last_build)) : json(nullptr);
        j["performance"] = {
            {"similarity_index_size", report.similarity_index_size},
            {"vector_cache_size", report.vector_cache_size},
            {"observer_count", report.observer_count}
        };
        return j;
    }

    json to_json(const engine::VisualizationData& data) {
        json nodes = json::array();
        for (const auto& node : data.nodes) {
            nodes.push_back({
                {"id", node.id},
                {"label", node.label},
                {"type", to_string(node.type)},
                {"size", node.size},
                {"color", node.color}
            });
        }

        json edges = json::array();
        for (const auto& edge : data.edges) {
            edges.push_back({
                {"id", edge.id},
                {"source", edge.source},
                {"target", edge.target},
                {"label", to_string(edge.label)},
                {"weight", edge.weight}
            });
        }

        return {{"nodes", nodes}, {"edges", edges}};
    }

    json to_json(const query::QueryResult& result) {
        json nodes = json::array();
        for (std::size_t i = 0; i < result.nodes.size(); ++i) {
            json node = to_json(result.nodes[i]);
            // vectors are internal to scoring
            node.erase("semantic_vector");
            if (i < result.similarities.size()) {
                node["similarity"] = result.similarities[i];
            }
            nodes.push_back(std::move(node));
        }

        json relationships = json::array();
        for (const auto& rel : result.relationships) {
            relationships.push_back(to_json(rel));
        }

        json insights = json::array();
        for (const auto& insight : result.insights) {
            insights.push_back(to_json(insight));
        }

        json j;
        j["nodes"] = std::move(nodes);
        j["relationships"] = std::move(relationships);
        j["relevance_score"] = result.relevance_score;
        j["suggestions"] = result.suggestions;
        j["insights"] = std::move(insights);
        j["duration_ms"] = to_milliseconds(result.duration);
        if (result.error) {
            j["error"] = result.error->to_string();
        }
        return j;
    }

    json export_to_json(const engine::GraphSnapshot& snapshot) {
        json nodes = json::array();
        for (const auto& node : snapshot.nodes) {
            nodes.push_back(to_json(node));
        }

        json relationships = json::array();
        for (const auto& rel : snapshot.relationships) {
            relationships.push_back(to_json(rel));
        }

        json concepts = json::array();
        for (const auto& concept_value : snapshot.concepts) {
            concepts.push_back(to_json(concept_value));
        }

        json j;
        j["nodes"] = std::move(nodes);
        j["relationships"] = std::move(relationships);
        j["concepts"] = std::move(concepts);
        j["metadata"] = {
            {"export_date", format_timestamp(snapshot.metadata.export_date)},
            {"version", snapshot.metadata.version}
        };
        return j;
    }

    Result<void, Error> write_snapshot(const engine::GraphSnapshot& snapshot, const fs::path& path) {
        return json_utils::write_file(path, export_to_json(snapshot), 2);
    }

}  // namespace ckg::export_module
