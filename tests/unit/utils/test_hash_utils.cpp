#include "ckg/utils/hash_utils.hpp"

#include <gtest/gtest.h>

namespace ckg::hash_utils
{
    TEST(HashUtilsTest, Fnv1aKnownValues) {
        EXPECT_EQ(fnv1a_hash(""), 0xcbf29ce484222325ULL);
        EXPECT_EQ(fnv1a_hash("a"), 0xaf63dc4c8601ec8cULL);
        EXPECT_EQ(fnv1a_hash("foobar"), 0x85944171f73967e8ULL);
    }

    TEST(HashUtilsTest, HexStringIsZeroPadded) {
        EXPECT_EQ(to_hex_string(0), "0000000000000000");
        EXPECT_EQ(to_hex_string(0xabcULL), "0000000000000abc");
        EXPECT_EQ(to_hex_string(0xcbf29ce484222325ULL), "cbf29ce484222325");
    }

    TEST(HashUtilsTest, Sha256KnownValues) {
        EXPECT_EQ(compute_sha256(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        EXPECT_EQ(compute_sha256("abc"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST(HashUtilsTest, NodeIdIsDeterministic) {
        EXPECT_EQ(make_node_id(NodeType::File, "src/app.ts"), "file_2b055b5eadf82800");
        EXPECT_EQ(make_node_id(NodeType::File, "src/app.ts"), make_node_id(NodeType::File, "src/app.ts"));
    }

    TEST(HashUtilsTest, NodeIdDependsOnType) {
        EXPECT_NE(make_node_id(NodeType::Function, "a.ts:run"), make_node_id(NodeType::Class, "a.ts:run"));
        EXPECT_EQ(make_node_id(NodeType::Module, "react").rfind("module_", 0), 0u);
    }
}
