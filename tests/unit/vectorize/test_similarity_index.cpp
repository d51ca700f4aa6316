#include "ckg/vectorize/similarity_index.hpp"
#include "ckg/utils/parallel.hpp"

#include <gtest/gtest.h>

namespace ckg::vectorize
{
    namespace {
        Node make_node(const std::string& id, SemanticVector vector) {
            Node node;
            node.id = id;
            node.semantic_vector = std::move(vector);
            return node;
        }
    }

    class SimilarityIndexTest : public ::testing::Test {
    protected:
        void SetUp() override {
            nodes_ = {
                make_node("a", {1.0f, 0.0f, 0.0f}),
                make_node("b", {1.0f, 0.1f, 0.0f}),
                make_node("c", {0.0f, 1.0f, 0.0f}),
                make_node("d", {}),
                make_node("e", {1.0f, 0.0f, 0.0f})
            };
        }

        std::vector<Node> nodes_;
    };

    TEST_F(SimilarityIndexTest, UnvectorizedNodesAreSkipped) {
        ExactSimilarityIndex index;
        index.build(nodes_);

        EXPECT_EQ(index.name(), "exact");
        EXPECT_EQ(index.size(), 4u);
    }

    TEST_F(SimilarityIndexTest, SearchOrdersBySimilarityThenId) {
        ExactSimilarityIndex index;
        index.build(nodes_);

        const auto matches = index.search({1.0f, 0.0f, 0.0f}, 0.3);
        ASSERT_EQ(matches.size(), 3u);
        EXPECT_EQ(matches[0].id, "a");
        EXPECT_EQ(matches[1].id, "e");
        EXPECT_EQ(matches[2].id, "b");
        EXPECT_NEAR(matches[0].similarity, 1.0, 1e-6);
    }

    TEST_F(SimilarityIndexTest, SearchLimit) {
        ExactSimilarityIndex index;
        index.build(nodes_);

        EXPECT_EQ(index.search({1.0f, 0.0f, 0.0f}, 0.3, 1).size(), 1u);
        EXPECT_TRUE(index.search({0.0f, 0.0f, 1.0f}, 0.3).empty());
    }

    TEST_F(SimilarityIndexTest, PairsAboveThreshold) {
        ExactSimilarityIndex index;
        index.build(nodes_);

        auto pairs = index.pairs_above(0.7, {});
        ASSERT_TRUE(pairs.is_ok());
        ASSERT_EQ(pairs.value().size(), 3u);
        EXPECT_EQ(pairs.value()[0].first, "a");
        EXPECT_EQ(pairs.value()[0].second, "b");
        EXPECT_EQ(pairs.value()[1].first, "a");
        EXPECT_EQ(pairs.value()[1].second, "e");
        EXPECT_EQ(pairs.value()[2].first, "b");
        EXPECT_EQ(pairs.value()[2].second, "e");
    }

    TEST_F(SimilarityIndexTest, PairsWithThreadPoolMatchSerial) {
        parallel::ThreadPool pool(3);
        ExactSimilarityIndex parallel_index(&pool);
        ExactSimilarityIndex serial_index;
        parallel_index.build(nodes_);
        serial_index.build(nodes_);

        auto parallel_pairs = parallel_index.pairs_above(0.5, {});
        auto serial_pairs = serial_index.pairs_above(0.5, {});
        ASSERT_TRUE(parallel_pairs.is_ok());
        ASSERT_TRUE(serial_pairs.is_ok());
        ASSERT_EQ(parallel_pairs.value().size(), serial_pairs.value().size());
        for (std::size_t i = 0; i < serial_pairs.value().size(); ++i) {
            EXPECT_EQ(parallel_pairs.value()[i].first, serial_pairs.value()[i].first);
            EXPECT_EQ(parallel_pairs.value()[i].second, serial_pairs.value()[i].second);
        }
    }

    TEST_F(SimilarityIndexTest, PairsCancelled) {
        ExactSimilarityIndex index;
        index.build(nodes_);
        const auto token = CancellationToken::create();
        token.cancel();

        auto pairs = index.pairs_above(0.7, token);
        ASSERT_TRUE(pairs.is_err());
        EXPECT_EQ(pairs.error().code(), ErrorCode::Cancelled);
    }

    TEST_F(SimilarityIndexTest, RebuildReplacesContents) {
        ExactSimilarityIndex index;
        index.build(nodes_);
        index.build({make_node("z", {0.0f, 0.0f, 1.0f})});

        EXPECT_EQ(index.size(), 1u);
        EXPECT_EQ(index.search({0.0f, 0.0f, 1.0f}, 0.3)[0].id, "z");
    }
}
