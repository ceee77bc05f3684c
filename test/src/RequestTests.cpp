/**
 * @file RequestTests.cpp
 *
 * This module contains the unit tests of the
 * LiveRocket::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <LiveRocket/Request.hpp>

TEST(RequestTests, Is_Complete_Or_Error) {
    LiveRocket::Request request;
    request.state = LiveRocket::Request::State::Complete;
    EXPECT_TRUE(request.IsCompleteOrError());
    request.state = LiveRocket::Request::State::Error;
    EXPECT_TRUE(request.IsCompleteOrError());
    request.state = LiveRocket::Request::State::Headers;
    EXPECT_FALSE(request.IsCompleteOrError());
    request.state = LiveRocket::Request::State::RequestLine;
    EXPECT_FALSE(request.IsCompleteOrError());
    request.state = LiveRocket::Request::State::Body;
    EXPECT_FALSE(request.IsCompleteOrError());
}

TEST(RequestTests, Get_Query_Param) {
    LiveRocket::Request request;
    request.query["q"] = "rocket";
    EXPECT_EQ("rocket", request.GetQueryParam("q"));
    EXPECT_EQ("", request.GetQueryParam("missing"));
    EXPECT_EQ("fallback", request.GetQueryParam("missing", "fallback"));
}

TEST(RequestTests, Get_Body_Param) {
    LiveRocket::Request request;
    request.data = nlohmann::json::parse("{\"name\": \"Ada\", \"age\": 36}");
    EXPECT_EQ(nlohmann::json("Ada"), request.GetBodyParam("name"));
    EXPECT_EQ(nlohmann::json(36), request.GetBodyParam("age"));
    EXPECT_TRUE(request.GetBodyParam("missing").is_null());
    EXPECT_EQ(nlohmann::json(42), request.GetBodyParam("missing", 42));
}

TEST(RequestTests, Get_Body_Param_When_Body_Is_Not_An_Object) {
    LiveRocket::Request request;
    request.data = nlohmann::json::parse("[1, 2, 3]");
    EXPECT_EQ(nlohmann::json("none"), request.GetBodyParam("name", "none"));
}

TEST(RequestTests, Normalize_Header_Name) {
    EXPECT_EQ("USER_AGENT", LiveRocket::Request::NormalizeHeaderName("User-Agent"));
    EXPECT_EQ("X_API_KEY", LiveRocket::Request::NormalizeHeaderName("x-api-key"));
    EXPECT_EQ("HOST", LiveRocket::Request::NormalizeHeaderName("Host"));
}

TEST(RequestTests, Get_Header) {
    LiveRocket::Request request;
    request.environment["USER_AGENT"] = "curl/7.58.0";
    EXPECT_EQ("curl/7.58.0", request.GetHeader("USER_AGENT"));
    EXPECT_EQ("", request.GetHeader("ACCEPT"));
    EXPECT_EQ("*/*", request.GetHeader("ACCEPT", "*/*"));
}
