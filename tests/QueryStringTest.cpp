#include "networking/QueryString.h"

#include <gtest/gtest.h>

using namespace cloudbridge::networking;

TEST(QueryString, SplitsPathFromQuery) {
    EXPECT_EQ(target_path("/?sessionId=A"), "/");
    EXPECT_EQ(target_path("/api/session/ABC"), "/api/session/ABC");
    EXPECT_EQ(target_path("/health?x=1"), "/health");
}

TEST(QueryString, ParsesHandshakeParameters) {
    const auto p = parse_query("/?sessionId=ABC12345&role=host&secret=s3cr3t");

    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p.at("sessionId"), "ABC12345");
    EXPECT_EQ(p.at("role"), "host");
    EXPECT_EQ(p.at("secret"), "s3cr3t");
}

TEST(QueryString, DecodesEscapesAndPlus) {
    const auto p = parse_query("/ws?name=a%20b+c&sym=%2F%3d");
    EXPECT_EQ(p.at("name"), "a b c");
    EXPECT_EQ(p.at("sym"), "/=");
}

TEST(QueryString, HandlesEmptyAndValuelessPairs) {
    const auto p = parse_query("/?&role&sessionId=&&x=1#frag");
    EXPECT_EQ(p.at("role"), "");
    EXPECT_EQ(p.at("sessionId"), "");
    EXPECT_EQ(p.at("x"), "1");
    EXPECT_EQ(p.count(""), 0u);
}

TEST(QueryString, FirstValueWinsOnRepeat) {
    const auto p = parse_query("/?role=guest&role=host");
    EXPECT_EQ(p.at("role"), "guest");
}

TEST(QueryString, NoQueryMeansNoParameters) {
    EXPECT_TRUE(parse_query("/").empty());
    EXPECT_TRUE(parse_query("").empty());
}

TEST(QueryString, MalformedEscapesStayLiteral) {
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode("%4"), "%4");
}
