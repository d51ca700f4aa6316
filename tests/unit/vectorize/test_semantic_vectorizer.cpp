#include "ckg/vectorize/semantic_vectorizer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <string>

namespace ckg::vectorize
{
    namespace {
        // fnv1a(term) % 100 for the terms used below
        constexpr std::size_t kUserSlot = 54;
        constexpr std::size_t kServiceSlot = 56;
    }

    TEST(SemanticVectorizerTest, TermFrequencyProjection) {
        const SemanticVectorizer vectorizer;
        const auto vector = vectorizer.vectorize("User user SERVICE");

        ASSERT_EQ(vector.size(), 100u);
        EXPECT_FLOAT_EQ(vector[kUserSlot], 2.0f / 3.0f);
        EXPECT_FLOAT_EQ(vector[kServiceSlot], 1.0f / 3.0f);
        EXPECT_FLOAT_EQ(std::accumulate(vector.begin(), vector.end(), 0.0f), 1.0f);
    }

    TEST(SemanticVectorizerTest, ShortTokensAreDropped) {
        const SemanticVectorizer vectorizer;
        const auto vector = vectorizer.vectorize("a bb user");

        EXPECT_FLOAT_EQ(vector[kUserSlot], 1.0f);
    }

    TEST(SemanticVectorizerTest, TextWithoutTokensIsZero) {
        const SemanticVectorizer vectorizer;

        for (const auto* text : {"", "a b", "-- ++ ()"}) {
            const auto vector = vectorizer.vectorize(text);
            ASSERT_EQ(vector.size(), 100u);
            EXPECT_TRUE(std::all_of(vector.begin(), vector.end(), [](const float v) { return v == 0.0f; })) << text;
        }
    }

    TEST(SemanticVectorizerTest, OnlyTopTermsAreKept) {
        VectorizerConfig config;
        config.dimensions = 2;
        const SemanticVectorizer vectorizer(config);

        // alpha and beta tie at two occurrences; gamma is dropped
        const auto vector = vectorizer.vectorize("gamma alpha beta alpha beta");

        ASSERT_EQ(vector.size(), 2u);
        EXPECT_FLOAT_EQ(vector[0] + vector[1], 0.8f);
    }

    TEST(SemanticVectorizerTest, Deterministic) {
        const SemanticVectorizer cached;
        VectorizerConfig config;
        config.cache_enabled = false;
        const SemanticVectorizer uncached(config);

        const std::string text = "order payment service order";
        EXPECT_EQ(cached.vectorize(text), cached.vectorize(text));
        EXPECT_EQ(cached.vectorize(text), uncached.vectorize(text));
    }

    TEST(SemanticVectorizerTest, CacheKeyedByText) {
        SemanticVectorizer vectorizer;

        (void)vectorizer.vectorize("order service");
        (void)vectorizer.vectorize("order service");
        EXPECT_EQ(vectorizer.cache_size(), 1u);

        (void)vectorizer.vectorize("payment service");
        EXPECT_EQ(vectorizer.cache_size(), 2u);

        vectorizer.clear_cache();
        EXPECT_EQ(vectorizer.cache_size(), 0u);
    }

    TEST(SemanticVectorizerTest, DisabledCacheStaysEmpty) {
        VectorizerConfig config;
        config.cache_enabled = false;
        const SemanticVectorizer vectorizer(config);

        (void)vectorizer.vectorize("order service");
        EXPECT_EQ(vectorizer.cache_size(), 0u);
    }

    TEST(SemanticVectorizerTest, CacheIsBounded) {
        VectorizerConfig config;
        config.max_cache_entries = 2;
        const SemanticVectorizer vectorizer(config);

        const auto first = vectorizer.vectorize("order service");
        (void)vectorizer.vectorize("user service");
        (void)vectorizer.vectorize("order service");
        (void)vectorizer.vectorize("payment gateway");
        EXPECT_EQ(vectorizer.cache_size(), 2u);

        for (int i = 0; i < 50; ++i) {
            (void)vectorizer.vectorize("query number " + std::to_string(i));
        }
        EXPECT_EQ(vectorizer.cache_size(), 2u);
        EXPECT_EQ(vectorizer.vectorize("order service"), first);
    }

    TEST(SemanticVectorizerTest, TermsIncludeIdentifierParts) {
        const SemanticVectorizer vectorizer;
        const auto terms = vectorizer.terms("loadUserProfile function user_repository.ts");

        EXPECT_TRUE(terms.contains("loaduserprofile"));
        EXPECT_TRUE(terms.contains("load"));
        EXPECT_TRUE(terms.contains("user"));
        EXPECT_TRUE(terms.contains("profile"));
        EXPECT_TRUE(terms.contains("repository"));
        EXPECT_TRUE(terms.contains("function"));
        EXPECT_FALSE(terms.contains("ts"));
    }

    TEST(SemanticVectorizerTest, UnrelatedWordsCanShareASlot) {
        const SemanticVectorizer vectorizer;

        // "qxaabb" hashes to the same slot as "user"
        EXPECT_NEAR(cosine_similarity(vectorizer.vectorize("qxaabb"), vectorizer.vectorize("user")), 1.0, 1e-6);
        EXPECT_FALSE(vectorizer.terms("qxaabb").contains("user"));
    }

    TEST(NodeTextTest, FileNode) {
        Node node;
        node.type = NodeType::File;
        node.name = "app.ts";
        node.location = SourceLocation{"src/app.ts", 1};
        node.metadata[meta::LANGUAGE] = std::string("typescript");

        EXPECT_EQ(node_text(node), "app.ts app.ts typescript");
    }

    TEST(NodeTextTest, FunctionNode) {
        Node node;
        node.type = NodeType::Function;
        node.name = "run";
        node.location = SourceLocation{"src/app.ts", 4};
        node.metadata[meta::COMPLEXITY] = 1.5;

        EXPECT_EQ(node_text(node), "run function 1.5 app.ts");
    }

    TEST(NodeTextTest, ClassNode) {
        Node node;
        node.type = NodeType::Class;
        node.name = "UserRepository";
        node.location = SourceLocation{"src/repo.ts", 2};
        node.metadata[meta::EXTENDS] = std::string("BaseRepository");

        EXPECT_EQ(node_text(node), "UserRepository class BaseRepository repo.ts");
    }

    TEST(CosineSimilarityTest, IdenticalAndOrthogonal) {
        const SemanticVector a = {1.0f, 2.0f, 0.0f};
        const SemanticVector b = {0.0f, 0.0f, 3.0f};

        EXPECT_NEAR(cosine_similarity(a, a), 1.0, 1e-9);
        EXPECT_DOUBLE_EQ(cosine_similarity(a, b), 0.0);
    }

    TEST(CosineSimilarityTest, Symmetric) {
        const SemanticVector a = {0.2f, 0.5f, 0.1f};
        const SemanticVector b = {0.4f, 0.1f, 0.3f};

        EXPECT_DOUBLE_EQ(cosine_similarity(a, b), cosine_similarity(b, a));
    }

    TEST(CosineSimilarityTest, ZeroOrMismatchedVectors) {
        const SemanticVector a = {1.0f, 1.0f};
        const SemanticVector zero = {0.0f, 0.0f};
        const SemanticVector longer = {1.0f, 1.0f, 1.0f};

        EXPECT_DOUBLE_EQ(cosine_similarity(a, zero), 0.0);
        EXPECT_DOUBLE_EQ(cosine_similarity(a, longer), 0.0);
        EXPECT_DOUBLE_EQ(cosine_similarity({}, {}), 0.0);
    }
}
