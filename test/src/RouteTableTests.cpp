/**
 * @file RouteTableTests.cpp
 *
 * This module contains the unit tests of the
 * LiveRocket::RouteTable class.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <LiveRocket/RouteTable.hpp>
#include <string>
#include <vector>

namespace {

    /**
     * This builds a route whose handler records the given tag
     * in the response body.
     *
     * @param[in] pattern
     *     This is the route template.
     *
     * @param[in] method
     *     This is the request method handled by the route.
     *
     * @param[in] tag
     *     This is the text the handler puts in the response body.
     *
     * @return
     *     The route is returned.
     */
    LiveRocket::RouteTable::Route MakeRoute(
        const std::string& pattern,
        const std::string& method,
        const std::string& tag
    ) {
        LiveRocket::RouteTable::Route route;
        route.pattern = pattern;
        route.method = method;
        route.handler = [tag](
            const LiveRocket::Request&,
            LiveRocket::Response& response,
            const LiveRocket::PathParameters&
        ){
            response.Send(tag);
        };
        return route;
    }

    /**
     * This runs the handler of the given resolution and returns
     * what it put in the response body.
     *
     * @param[in] resolution
     *     This is the resolution whose handler should be run.
     *
     * @return
     *     The body of the response produced by the handler is returned.
     */
    std::string RunHandler(const LiveRocket::RouteTable::Resolution& resolution) {
        LiveRocket::Request request;
        LiveRocket::Response response;
        resolution.route->handler(request, response, resolution.parameters);
        return response.body;
    }

}

TEST(RouteTableTests, Resolve_Exact_Route) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/health", "GET", "healthy")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/health", "GET", resolution));
    EXPECT_EQ("healthy", RunHandler(resolution));
    EXPECT_TRUE(resolution.parameters.empty());
}

TEST(RouteTableTests, Resolve_Requires_Matching_Method) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/health", "GET", "healthy")));
    ASSERT_TRUE(routes.Register(MakeRoute("/users/<int:id>", "GET", "user")));
    LiveRocket::RouteTable::Resolution resolution;
    EXPECT_FALSE(routes.Resolve("/health", "POST", resolution));
    EXPECT_FALSE(routes.Resolve("/users/1", "DELETE", resolution));
}

TEST(RouteTableTests, Resolve_Pattern_Route_With_Parameters) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/users/<int:id>", "GET", "user")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/users/42", "GET", resolution));
    EXPECT_EQ("user", RunHandler(resolution));
    EXPECT_EQ(42, resolution.parameters["id"].integer);
}

TEST(RouteTableTests, Exact_Route_Takes_Precedence_Over_Pattern) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/users/<name>", "GET", "pattern")));
    ASSERT_TRUE(routes.Register(MakeRoute("/users/me", "GET", "exact")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/users/me", "GET", resolution));
    EXPECT_EQ("exact", RunHandler(resolution));
    ASSERT_TRUE(routes.Resolve("/users/ada", "GET", resolution));
    EXPECT_EQ("pattern", RunHandler(resolution));
}

TEST(RouteTableTests, Pattern_Routes_Tried_In_Registration_Order) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/items/<int:id>", "GET", "first")));
    ASSERT_TRUE(routes.Register(MakeRoute("/items/<name>", "GET", "second")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/items/12", "GET", resolution));
    EXPECT_EQ("first", RunHandler(resolution));
    ASSERT_TRUE(routes.Resolve("/items/twelve", "GET", resolution));
    EXPECT_EQ("second", RunHandler(resolution));
}

TEST(RouteTableTests, Failed_Conversion_Falls_Through_To_Later_Route) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/n/<int:value>", "GET", "int")));
    ASSERT_TRUE(routes.Register(MakeRoute("/n/<value>", "GET", "string")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/n/99999999999999999999999999", "GET", resolution));
    EXPECT_EQ("string", RunHandler(resolution));
}

TEST(RouteTableTests, Exact_Route_Registered_Again_Replaces_Handler) {
    LiveRocket::RouteTable routes;
    ASSERT_TRUE(routes.Register(MakeRoute("/", "GET", "old")));
    ASSERT_TRUE(routes.Register(MakeRoute("/", "GET", "new")));
    LiveRocket::RouteTable::Resolution resolution;
    ASSERT_TRUE(routes.Resolve("/", "GET", resolution));
    EXPECT_EQ("new", RunHandler(resolution));
}

TEST(RouteTableTests, Register_Rejects_Unsupported_Method) {
    LiveRocket::RouteTable routes;
    EXPECT_FALSE(routes.Register(MakeRoute("/", "TRACE", "trace")));
    EXPECT_FALSE(routes.Register(MakeRoute("/", "get", "lower")));
    EXPECT_TRUE(LiveRocket::RouteTable::IsSupportedMethod("PATCH"));
    EXPECT_FALSE(LiveRocket::RouteTable::IsSupportedMethod("HEAD"));
}

TEST(RouteTableTests, Register_Rejects_Missing_Handler_Or_Middleware) {
    LiveRocket::RouteTable routes;
    auto route = MakeRoute("/", "GET", "root");
    route.handler = nullptr;
    EXPECT_FALSE(routes.Register(route));
    route = MakeRoute("/", "GET", "root");
    route.middlewares.push_back(nullptr);
    EXPECT_FALSE(routes.Register(route));
}

TEST(RouteTableTests, Register_Rejects_Duplicate_Placeholder_Names) {
    LiveRocket::RouteTable routes;
    EXPECT_FALSE(routes.Register(MakeRoute("/<id>/<id>", "GET", "dup")));
}

TEST(RouteTableTests, Url_For_Named_Route) {
    LiveRocket::RouteTable routes;
    auto route = MakeRoute("/users/<int:id>", "GET", "user");
    route.name = "user_detail";
    ASSERT_TRUE(routes.Register(route));
    EXPECT_EQ("/users/9", routes.UrlFor("user_detail", {{"id", "9"}}));
    EXPECT_EQ("", routes.UrlFor("unknown"));
}

TEST(RouteTableTests, Url_For_Named_Exact_Route) {
    LiveRocket::RouteTable routes;
    auto route = MakeRoute("/about", "GET", "about");
    route.name = "about";
    ASSERT_TRUE(routes.Register(route));
    EXPECT_EQ("/about", routes.UrlFor("about"));
}
