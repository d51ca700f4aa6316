#include "ckg/insights/insight_extractor.hpp"

#include "ckg/graph/graph.hpp"
#include "ckg/utils/hash_utils.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace ckg::insights {

    namespace {

        std::string make_insight_id(const InsightType type, const std::vector<std::string>& affected) {
            std::string key = to_string(type);
            for (const auto& node : affected) {
                key += '|';
                key += node;
            }
            return std::string("insight_") + to_string(type) + "_" +
                hash_utils::to_hex_string(hash_utils::fnv1a_hash(key));
        }

        std::unordered_map<std::string, std::size_t> incident_counts(
            const std::vector<Relationship>& relationships
        ) {
            std::unordered_map<std::string, std::size_t> counts;
            for (const auto& rel : relationships) {
                ++counts[rel.from];
                if (rel.to != rel.from) {
                    ++counts[rel.to];
                }
            }
            return counts;
        }

    }  // namespace

    const char* to_string(const InsightType type) noexcept {
        switch (type) {
            case InsightType::Architecture: return "architecture";
            case InsightType::Vulnerability: return "vulnerability";
            case InsightType::Anomaly: return "anomaly";
        }
        return "unknown";
    }

    std::vector<Insight> ConnectivityDetector::detect(
        const std::vector<Node>& nodes,
        const std::vector<Relationship>& relationships
    ) const {
        const auto counts = incident_counts(relationships);

        std::vector<Insight> insights;
        for (const auto& node : nodes) {
            const auto it = counts.find(node.id);
            if (it == counts.end() || it->second <= threshold_) {
                continue;
            }
            const std::size_t count = it->second;

            Insight insight;
            insight.type = InsightType::Architecture;
            insight.title = "Highly Connected Component";
            insight.description = node.name + " has " + std::to_string(count) +
                " connections and may be a central architectural component";
            insight.confidence = std::min(0.9, static_cast<double>(count) / 20.0);
            insight.suggestion = "Consider reviewing for single responsibility principle";
            insight.affected_nodes = {node.id};
            insight.id = make_insight_id(insight.type, insight.affected_nodes);
            insights.push_back(std::move(insight));
        }
        return insights;
    }

    std::vector<Insight> CycleDetector::detect(
        const std::vector<Node>& /*nodes*/,
        const std::vector<Relationship>& relationships
    ) const {
        graph::DirectedGraph graph;
        for (const auto& rel : relationships) {
            if (rel.bidirectional || rel.type == RelationshipType::PartOf) {
                continue;
            }
            graph.add_edge(rel.from, rel.to);
        }

        const auto result = graph::detect_cycles(graph, max_cycles_);

        std::vector<Insight> insights;
        for (const auto& cycle : result.cycles) {
            // the first node closes the cycle and is repeated at the end
            std::vector<std::string> members(cycle.nodes.begin(), cycle.nodes.end() - 1);

            Insight insight;
            insight.type = InsightType::Vulnerability;
            insight.title = "Circular Dependency Detected";
            insight.description = "Found a circular dependency between " +
                std::to_string(members.size()) + " components";
            insight.confidence = 0.8;
            insight.suggestion = "Refactor to break circular dependencies";
            insight.affected_nodes = std::move(members);
            insight.id = make_insight_id(insight.type, insight.affected_nodes);
            insights.push_back(std::move(insight));
        }
        return insights;
    }

    std::vector<Insight> IsolationDetector::detect(
        const std::vector<Node>& nodes,
        const std::vector<Relationship>& relationships
    ) const {
        std::unordered_set<std::string> connected;
        for (const auto& rel : relationships) {
            connected.insert(rel.from);
            connected.insert(rel.to);
        }

        std::vector<std::string> isolated;
        for (const auto& node : nodes) {
            if (!connected.contains(node.id)) {
                isolated.push_back(node.id);
            }
        }
        if (isolated.empty()) {
            return {};
        }

        Insight insight;
        insight.type = InsightType::Anomaly;
        insight.title = "Isolated Components";
        insight.description = "Found " + std::to_string(isolated.size()) + " components with no relationships";
        insight.confidence = 0.7;
        insight.suggestion = "Review if these components are still needed";
        insight.affected_nodes = std::move(isolated);
        insight.id = make_insight_id(insight.type, insight.affected_nodes);
        return {insight};
    }

    InsightExtractor::InsightExtractor(InsightConfig config) {
        detectors_.push_back(std::make_unique<ConnectivityDetector>(config.hub_connection_threshold));
        detectors_.push_back(std::make_unique<CycleDetector>(config.max_cycles));
        detectors_.push_back(std::make_unique<IsolationDetector>());
    }

    void InsightExtractor::add_detector(std::unique_ptr<IInsightDetector> detector) {
        if (detector) {
            detectors_.push_back(std::move(detector));
        }
    }

    std::vector<Insight> InsightExtractor::extract(
        const std::vector<Node>& nodes,
        const std::vector<Relationship>& relationships
    ) const {
        std::vector<Insight> insights;
        for (const auto& detector : detectors_) {
            auto found = detector->detect(nodes, relationships);
            insights.insert(insights.end(),
                            std::make_move_iterator(found.begin()),
                            std::make_move_iterator(found.end()));
        }
        return insights;
    }

}  // namespace ckg::insights
