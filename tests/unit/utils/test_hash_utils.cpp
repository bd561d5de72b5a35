#include "cca/utils/hash_utils.hpp"

#include <gtest/gtest.h>

namespace cca::hash_utils
{
    TEST(HashUtilsTest, EmptyInputIsOffsetBasis) {
        EXPECT_EQ(fnv1a_hash(""), 0xcbf29ce484222325ULL);
        EXPECT_EQ(content_hash(""), "cbf29ce484222325");
    }

    TEST(HashUtilsTest, KnownValue) {
        EXPECT_EQ(fnv1a_hash("a"), 0xaf63dc4c8601ec8cULL);
    }

    TEST(HashUtilsTest, HexIsFixedWidth) {
        EXPECT_EQ(to_hex_string(0), "0000000000000000");
        EXPECT_EQ(to_hex_string(0xABCULL), "0000000000000abc");
        EXPECT_EQ(content_hash("fn main() {}").size(), 16u);
    }

    TEST(HashUtilsTest, StableAndSensitive) {
        EXPECT_EQ(content_hash("fn main() {}"), content_hash("fn main() {}"));
        EXPECT_NE(content_hash("fn main() {}"), content_hash("fn main() { }"));
    }

}  // namespace cca::hash_utils
