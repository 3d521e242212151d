#include "StringUtils.hpp"

#include <gtest/gtest.h>

using namespace locus;

TEST(StringUtils, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  Berlin \t\n"), "Berlin");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringUtils, LowerCaseHandlesUmlauts) {
    EXPECT_EQ(to_lower("MÜNCHEN"), "münchen");
    EXPECT_EQ(to_lower("Köln"), "köln");
    EXPECT_EQ(to_lower("ÄÖÜ"), "äöü");
}

TEST(StringUtils, NormalizeQuery) {
    EXPECT_EQ(normalize_query("  BERLIN "), "berlin");
}

TEST(StringUtils, UrlEncode) {
    EXPECT_EQ(url_encode("Frankfurt am Main"), "Frankfurt+am+Main");
    EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(url_encode("abc-_.~"), "abc-_.~");
}

TEST(StringUtils, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ", "), "");
}
