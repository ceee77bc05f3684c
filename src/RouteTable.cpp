/**
 * @file RouteTable.cpp
 *
 * This module contains the implementation of the LiveRocket::RouteTable class.
 *
 * © 2018 by Richard Walters
 */

#include <LiveRocket/RouteTable.hpp>
#include <set>

namespace {

    /**
     * These are the request methods for which routes may be registered.
     */
    const std::set< std::string > SUPPORTED_METHODS{
        "GET", "POST", "PUT", "DELETE", "PATCH",
    };

    /**
     * This holds a route whose template has placeholders,
     * along with the compiled form of its template.
     */
    struct PatternRoute {
        /**
         * This is the compiled form of the route template.
         */
        LiveRocket::UrlPattern urlPattern;

        /**
         * This is the route itself.
         */
        std::shared_ptr< const LiveRocket::RouteTable::Route > route;
    };

}

namespace LiveRocket {

    /**
     * This contains the private properties of a RouteTable instance.
     */
    struct RouteTable::Impl {
        /**
         * These are the routes whose templates have no placeholders,
         * keyed by template and then method.
         */
        std::map<
            std::pair< std::string, std::string >,
            std::shared_ptr< const Route >
        > exactRoutes;

        /**
         * These are the routes whose templates have placeholders,
         * in the order they were registered.
         */
        std::vector< PatternRoute > patternRoutes;

        /**
         * These are the routes which were given names, keyed by name.
         */
        std::map< std::string, std::shared_ptr< const Route > > namedRoutes;
    };

    RouteTable::~RouteTable() = default;

    RouteTable::RouteTable()
        : impl_(new Impl)
    {
    }

    bool RouteTable::IsSupportedMethod(const std::string& method) {
        return (SUPPORTED_METHODS.find(method) != SUPPORTED_METHODS.end());
    }

    bool RouteTable::Register(const Route& route) {
        if (
            !IsSupportedMethod(route.method)
            || (route.handler == nullptr)
        ) {
            return false;
        }
        for (const auto& middleware: route.middlewares) {
            if (middleware == nullptr) {
                return false;
            }
        }
        const std::shared_ptr< const Route > storedRoute = std::make_shared< Route >(route);
        if (UrlPattern::HasPlaceholders(route.pattern)) {
            PatternRoute patternRoute;
            if (!patternRoute.urlPattern.Compile(route.pattern)) {
                return false;
            }
            patternRoute.route = storedRoute;
            impl_->patternRoutes.push_back(std::move(patternRoute));
        } else {
            impl_->exactRoutes[std::make_pair(route.pattern, route.method)] = storedRoute;
        }
        if (!route.name.empty()) {
            impl_->namedRoutes[route.name] = storedRoute;
        }
        return true;
    }

    bool RouteTable::Resolve(
        const std::string& path,
        const std::string& method,
        Resolution& resolution
    ) const {
        const auto exactRoute = impl_->exactRoutes.find(std::make_pair(path, method));
        if (exactRoute != impl_->exactRoutes.end()) {
            resolution.route = exactRoute->second;
            resolution.parameters.clear();
            return true;
        }
        for (const auto& patternRoute: impl_->patternRoutes) {
            if (patternRoute.route->method != method) {
                continue;
            }
            PathParameters parameters;
            if (patternRoute.urlPattern.Match(path, parameters)) {
                resolution.route = patternRoute.route;
                resolution.parameters = std::move(parameters);
                return true;
            }
        }
        return false;
    }

    std::string RouteTable::UrlFor(
        const std::string& name,
        const std::map< std::string, std::string >& values
    ) const {
        const auto namedRoute = impl_->namedRoutes.find(name);
        if (namedRoute == impl_->namedRoutes.end()) {
            return "";
        }
        UrlPattern urlPattern;
        if (!urlPattern.Compile(namedRoute->second->pattern)) {
            return namedRoute->second->pattern;
        }
        return urlPattern.BuildPath(values);
    }

}
