#include "ckg/graph/graph.hpp"

#include <gtest/gtest.h>

namespace ckg::graph
{
    class DirectedGraphTest : public ::testing::Test {
    protected:
        DirectedGraph graph_;
    };

    TEST_F(DirectedGraphTest, EdgesCreateNodesInOrder) {
        EXPECT_EQ(graph_.node_count(), 0u);

        graph_.add_edge("A", "B");
        graph_.add_edge("C", "A");

        EXPECT_EQ(graph_.nodes(), (std::vector<std::string>{"A", "B", "C"}));
    }

    TEST_F(DirectedGraphTest, RepeatedEdgeIsIgnored) {
        graph_.add_edge("A", "C");
        graph_.add_edge("A", "B");
        graph_.add_edge("A", "C");

        EXPECT_EQ(graph_.successors("A"), (std::vector<std::string>{"C", "B"}));
        EXPECT_TRUE(graph_.successors("B").empty());
        EXPECT_TRUE(graph_.successors("missing").empty());
    }

    class CycleDetectionTest : public ::testing::Test {
    protected:
        DirectedGraph graph_;
    };

    TEST_F(CycleDetectionTest, AcyclicGraph) {
        graph_.add_edge("A", "B");
        graph_.add_edge("B", "C");
        graph_.add_edge("A", "C");

        const auto result = detect_cycles(graph_);
        EXPECT_FALSE(result.has_cycles);
        EXPECT_TRUE(result.cycles.empty());
    }

    TEST_F(CycleDetectionTest, ThreeNodeCycleRepeatsFirstNode) {
        graph_.add_edge("A", "B");
        graph_.add_edge("B", "C");
        graph_.add_edge("C", "A");

        const auto result = detect_cycles(graph_);
        ASSERT_TRUE(result.has_cycles);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"A", "B", "C", "A"}));
    }

    TEST_F(CycleDetectionTest, SelfLoop) {
        graph_.add_edge("A", "A");

        const auto result = detect_cycles(graph_);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"A", "A"}));
    }

    TEST_F(CycleDetectionTest, CycleReportedFromEntryPoint) {
        graph_.add_edge("root", "X");
        graph_.add_edge("X", "Y");
        graph_.add_edge("Y", "X");

        const auto result = detect_cycles(graph_);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"X", "Y", "X"}));
    }

    TEST_F(CycleDetectionTest, FinishedNodesAreNotRevisited) {
        graph_.add_edge("A", "B");
        graph_.add_edge("B", "C");
        graph_.add_edge("D", "B");
        graph_.add_edge("C", "B");

        const auto result = detect_cycles(graph_);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"B", "C", "B"}));
    }

    TEST_F(CycleDetectionTest, MaxCyclesCaps) {
        graph_.add_edge("A", "B");
        graph_.add_edge("B", "A");
        graph_.add_edge("C", "D");
        graph_.add_edge("D", "C");
        graph_.add_edge("E", "E");

        EXPECT_EQ(detect_cycles(graph_, 2).cycles.size(), 2u);
        EXPECT_EQ(detect_cycles(graph_, 10).cycles.size(), 3u);
        EXPECT_FALSE(detect_cycles(graph_, 0).has_cycles);
    }

    TEST_F(CycleDetectionTest, LongChainDoesNotRecurse) {
        constexpr int kLength = 200000;
        for (int i = 0; i < kLength; ++i) {
            graph_.add_edge("n" + std::to_string(i), "n" + std::to_string(i + 1));
        }
        graph_.add_edge("n" + std::to_string(kLength), "n0");

        const auto result = detect_cycles(graph_);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes.size(), static_cast<std::size_t>(kLength) + 2);
        EXPECT_EQ(result.cycles[0].nodes.front(), "n0");
        EXPECT_EQ(result.cycles[0].nodes.back(), "n0");
    }
}
