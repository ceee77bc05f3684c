/**
 * @file UrlPatternTests.cpp
 *
 * This module contains the unit tests of the
 * LiveRocket::UrlPattern class.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <LiveRocket/UrlPattern.hpp>

TEST(UrlPatternTests, Has_Placeholders) {
    EXPECT_TRUE(LiveRocket::UrlPattern::HasPlaceholders("/greet/<name>"));
    EXPECT_TRUE(LiveRocket::UrlPattern::HasPlaceholders("/users/<int:id>"));
    EXPECT_FALSE(LiveRocket::UrlPattern::HasPlaceholders("/health"));
    EXPECT_FALSE(LiveRocket::UrlPattern::HasPlaceholders("/a<b"));
}

TEST(UrlPatternTests, Literal_Pattern_Matches_Exactly) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/health"));
    LiveRocket::PathParameters parameters;
    EXPECT_TRUE(pattern.Match("/health", parameters));
    EXPECT_TRUE(parameters.empty());
    EXPECT_FALSE(pattern.Match("/health/", parameters));
    EXPECT_FALSE(pattern.Match("/healthy", parameters));
}

TEST(UrlPatternTests, String_Placeholder) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/greet/<name>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/greet/Ada", parameters));
    ASSERT_EQ(1u, parameters.size());
    EXPECT_EQ(LiveRocket::PathParameter::Type::String, parameters["name"].type);
    EXPECT_EQ("Ada", parameters["name"].text);
    EXPECT_FALSE(pattern.Match("/greet/Ada/Lovelace", parameters));
    EXPECT_FALSE(pattern.Match("/greet/", parameters));
}

TEST(UrlPatternTests, Int_Placeholder) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/users/<int:id>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/users/42", parameters));
    EXPECT_EQ(LiveRocket::PathParameter::Type::Int, parameters["id"].type);
    EXPECT_EQ(42, parameters["id"].integer);
    EXPECT_EQ("42", parameters["id"].text);
    EXPECT_FALSE(pattern.Match("/users/abc", parameters));
    EXPECT_FALSE(pattern.Match("/users/-1", parameters));
}

TEST(UrlPatternTests, Int_Placeholder_Overflow_Does_Not_Match) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/users/<int:id>"));
    LiveRocket::PathParameters parameters;
    EXPECT_FALSE(pattern.Match("/users/99999999999999999999999999", parameters));
}

TEST(UrlPatternTests, Float_Placeholder) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/price/<float:amount>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/price/3.25", parameters));
    EXPECT_EQ(LiveRocket::PathParameter::Type::Float, parameters["amount"].type);
    EXPECT_DOUBLE_EQ(3.25, parameters["amount"].real);
    ASSERT_TRUE(pattern.Match("/price/7", parameters));
    EXPECT_DOUBLE_EQ(7.0, parameters["amount"].real);
    EXPECT_FALSE(pattern.Match("/price/.5", parameters));
    EXPECT_FALSE(pattern.Match("/price/cheap", parameters));
}

TEST(UrlPatternTests, Path_Placeholder_Spans_Segments) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/files/<path:rest>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/files/docs/2024/report.pdf", parameters));
    EXPECT_EQ(LiveRocket::PathParameter::Type::Path, parameters["rest"].type);
    EXPECT_EQ("docs/2024/report.pdf", parameters["rest"].text);
}

TEST(UrlPatternTests, Uuid_Placeholder) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/items/<uuid:key>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/items/123e4567-e89b-12d3-a456-426614174000", parameters));
    EXPECT_EQ(LiveRocket::PathParameter::Type::Uuid, parameters["key"].type);
    EXPECT_EQ("123e4567-e89b-12d3-a456-426614174000", parameters["key"].text);
    EXPECT_TRUE(pattern.Match("/items/123E4567-E89B-12D3-A456-426614174000", parameters));
    EXPECT_FALSE(pattern.Match("/items/123e4567", parameters));
}

TEST(UrlPatternTests, Unknown_Type_Treated_As_String) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/tags/<slug:tag>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/tags/cpp", parameters));
    EXPECT_EQ(LiveRocket::PathParameter::Type::String, parameters["tag"].type);
    EXPECT_EQ("cpp", parameters["tag"].text);
}

TEST(UrlPatternTests, Multiple_Placeholders) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/users/<int:id>/posts/<slug>"));
    LiveRocket::PathParameters parameters;
    ASSERT_TRUE(pattern.Match("/users/7/posts/hello-world", parameters));
    ASSERT_EQ(2u, parameters.size());
    EXPECT_EQ(7, parameters["id"].integer);
    EXPECT_EQ("hello-world", parameters["slug"].text);
    ASSERT_EQ(2u, pattern.GetPlaceholders().size());
    EXPECT_EQ("id", pattern.GetPlaceholders()[0].name);
    EXPECT_EQ("slug", pattern.GetPlaceholders()[1].name);
}

TEST(UrlPatternTests, Literal_Regex_Characters_Are_Escaped) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/v1.0/<name>+info"));
    LiveRocket::PathParameters parameters;
    EXPECT_TRUE(pattern.Match("/v1.0/ada+info", parameters));
    EXPECT_FALSE(pattern.Match("/v1x0/ada+info", parameters));
    EXPECT_FALSE(pattern.Match("/v1.0/adaaainfo", parameters));
}

TEST(UrlPatternTests, Duplicate_Placeholder_Names_Rejected) {
    LiveRocket::UrlPattern pattern;
    EXPECT_FALSE(pattern.Compile("/<id>/<int:id>"));
}

TEST(UrlPatternTests, Build_Path) {
    LiveRocket::UrlPattern pattern;
    ASSERT_TRUE(pattern.Compile("/users/<int:id>/posts/<slug>"));
    EXPECT_EQ(
        "/users/5/posts/intro",
        pattern.BuildPath({{"id", "5"}, {"slug", "intro"}})
    );
    EXPECT_EQ(
        "/users/5/posts/<slug>",
        pattern.BuildPath({{"id", "5"}})
    );
}
