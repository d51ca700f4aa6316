#include "ckg/insights/insight_extractor.hpp"

#include <gtest/gtest.h>

#include <set>

namespace ckg::insights
{
    namespace {
        Node make_node(const std::string& id) {
            Node node;
            node.id = id;
            node.name = id;
            node.type = NodeType::File;
            return node;
        }

        Relationship make_edge(const std::string& from, const std::string& to,
                               const RelationshipType type = RelationshipType::DependsOn,
                               const bool bidirectional = false) {
            Relationship rel;
            rel.id = Relationship::make_id(from, type, to);
            rel.from = from;
            rel.to = to;
            rel.type = type;
            rel.weight = 0.8;
            rel.bidirectional = bidirectional;
            return rel;
        }

        std::vector<Relationship> hub_edges(const std::string& hub, const int count) {
            std::vector<Relationship> edges;
            for (int i = 0; i < count; ++i) {
                edges.push_back(make_edge(hub, "leaf" + std::to_string(i)));
            }
            return edges;
        }
    }

    TEST(InsightTypeTest, Names) {
        EXPECT_STREQ(to_string(InsightType::Architecture), "architecture");
        EXPECT_STREQ(to_string(InsightType::Vulnerability), "vulnerability");
        EXPECT_STREQ(to_string(InsightType::Anomaly), "anomaly");
    }

    TEST(ConnectivityDetectorTest, AboveThreshold) {
        const auto insights = ConnectivityDetector{}.detect({make_node("hub")}, hub_edges("hub", 6));

        ASSERT_EQ(insights.size(), 1u);
        EXPECT_EQ(insights[0].title, "Highly Connected Component");
        EXPECT_EQ(insights[0].type, InsightType::Architecture);
        EXPECT_DOUBLE_EQ(insights[0].confidence, 0.3);
        EXPECT_EQ(insights[0].affected_nodes, std::vector<std::string>{"hub"});
        EXPECT_EQ(insights[0].description, "hub has 6 connections and may be a central architectural component");
        EXPECT_TRUE(insights[0].id.starts_with("insight_architecture_"));
    }

    TEST(ConnectivityDetectorTest, ThresholdIsExclusive) {
        EXPECT_TRUE(ConnectivityDetector{}.detect({make_node("hub")}, hub_edges("hub", 5)).empty());
        EXPECT_EQ(ConnectivityDetector{4}.detect({make_node("hub")}, hub_edges("hub", 5)).size(), 1u);
    }

    TEST(ConnectivityDetectorTest, ConfidenceIsCapped) {
        const auto insights = ConnectivityDetector{}.detect({make_node("hub")}, hub_edges("hub", 30));

        ASSERT_EQ(insights.size(), 1u);
        EXPECT_DOUBLE_EQ(insights[0].confidence, 0.9);
    }

    TEST(ConnectivityDetectorTest, OnlyResultNodesAreReported) {
        EXPECT_TRUE(ConnectivityDetector{}.detect({make_node("leaf0")}, hub_edges("hub", 10)).empty());
    }

    TEST(CycleDetectorTest, DependencyCycle) {
        const std::vector<Relationship> edges = {
            make_edge("a", "b"), make_edge("b", "c"), make_edge("c", "a")
        };

        const auto insights = CycleDetector{}.detect({}, edges);

        ASSERT_EQ(insights.size(), 1u);
        EXPECT_EQ(insights[0].title, "Circular Dependency Detected");
        EXPECT_EQ(insights[0].type, InsightType::Vulnerability);
        EXPECT_DOUBLE_EQ(insights[0].confidence, 0.8);
        EXPECT_EQ(insights[0].affected_nodes, (std::vector<std::string>{"a", "b", "c"}));
        EXPECT_EQ(insights[0].suggestion, "Refactor to break circular dependencies");
    }

    TEST(CycleDetectorTest, SimilarityAndContainmentAreIgnored) {
        const std::vector<Relationship> edges = {
            make_edge("a", "b", RelationshipType::SimilarTo, true),
            make_edge("b", "a", RelationshipType::SimilarTo, true),
            make_edge("f", "file", RelationshipType::PartOf),
            make_edge("file", "f", RelationshipType::Calls)
        };

        EXPECT_TRUE(CycleDetector{}.detect({}, edges).empty());
    }

    TEST(CycleDetectorTest, MaxCycles) {
        const std::vector<Relationship> edges = {
            make_edge("a", "b"), make_edge("b", "a"),
            make_edge("c", "d"), make_edge("d", "c")
        };

        EXPECT_EQ(CycleDetector{}.detect({}, edges).size(), 2u);
        EXPECT_EQ(CycleDetector{1}.detect({}, edges).size(), 1u);
    }

    TEST(IsolationDetectorTest, SingleInsightForAllIsolatedNodes) {
        const std::vector<Node> nodes = {make_node("x"), make_node("y"), make_node("z")};
        const std::vector<Relationship> edges = {make_edge("y", "other")};

        const auto insights = IsolationDetector{}.detect(nodes, edges);

        ASSERT_EQ(insights.size(), 1u);
        EXPECT_EQ(insights[0].title, "Isolated Components");
        EXPECT_EQ(insights[0].type, InsightType::Anomaly);
        EXPECT_DOUBLE_EQ(insights[0].confidence, 0.7);
        EXPECT_EQ(insights[0].affected_nodes, (std::vector<std::string>{"x", "z"}));
    }

    TEST(IsolationDetectorTest, NothingIsolated) {
        EXPECT_TRUE(IsolationDetector{}.detect({make_node("a")}, {make_edge("a", "b")}).empty());
        EXPECT_TRUE(IsolationDetector{}.detect({}, {}).empty());
    }

    TEST(InsightExtractorTest, RunsDetectorsInOrder) {
        const std::vector<Node> nodes = {make_node("hub"), make_node("lonely")};
        auto edges = hub_edges("hub", 6);
        edges.push_back(make_edge("leaf0", "hub"));

        const InsightExtractor extractor;
        const auto insights = extractor.extract(nodes, edges);

        ASSERT_EQ(insights.size(), 3u);
        EXPECT_EQ(insights[0].type, InsightType::Architecture);
        EXPECT_EQ(insights[1].type, InsightType::Vulnerability);
        EXPECT_EQ(insights[2].type, InsightType::Anomaly);
    }

    TEST(InsightExtractorTest, Deterministic) {
        const std::vector<Node> nodes = {make_node("a"), make_node("b"), make_node("c"), make_node("d")};
        const std::vector<Relationship> edges = {
            make_edge("a", "b"), make_edge("b", "c"), make_edge("c", "a")
        };

        const InsightExtractor extractor;
        const auto first = extractor.extract(nodes, edges);
        const auto second = extractor.extract(nodes, edges);

        ASSERT_EQ(first.size(), second.size());
        std::set<std::string> ids;
        for (std::size_t i = 0; i < first.size(); ++i) {
            EXPECT_EQ(first[i].id, second[i].id);
            ids.insert(first[i].id);
        }
        EXPECT_EQ(ids.size(), first.size());
    }

    TEST(InsightExtractorTest, ConfiguredThresholds) {
        InsightConfig config;
        config.hub_connection_threshold = 1;

        const InsightExtractor extractor(config);
        const auto insights = extractor.extract({make_node("a")}, {make_edge("a", "b"), make_edge("a", "c")});

        ASSERT_EQ(insights.size(), 1u);
        EXPECT_EQ(insights[0].title, "Highly Connected Component");
    }
}
