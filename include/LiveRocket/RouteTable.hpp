#ifndef LIVE_ROCKET_ROUTE_TABLE_HPP
#define LIVE_ROCKET_ROUTE_TABLE_HPP

/**
 * @file RouteTable.hpp
 *
 * This module declares the LiveRocket::RouteTable class.
 *
 * © 2018 by Richard Walters
 */

#include "Request.hpp"
#include "Response.hpp"
#include "UrlPattern.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace LiveRocket {

    /**
     * This is the index of all routes known to the server.  Routes
     * whose templates have no placeholders are found by exact lookup;
     * the rest are tried in the order they were registered.
     *
     * Routes are only added, never removed.  Once all routes are
     * registered, the table may be read from any number of threads.
     */
    class RouteTable {
        // Types
    public:
        /**
         * This is the type of function which may be run on a request
         * before it's given to its handler.  Middleware may modify the
         * request, for example to annotate it, but doesn't produce
         * a response.
         *
         * @param[in,out] request
         *     This is the request being served.
         */
        typedef std::function< void(Request& request) > Middleware;

        /**
         * This is the type of function which can be registered to handle
         * requests for a route.
         *
         * @param[in] request
         *     This is the request being served.
         *
         * @param[in,out] response
         *     This is the response to fill in.  It's sent back to the
         *     client once the handler returns.
         *
         * @param[in] parameters
         *     These are the values extracted from the request path
         *     for the placeholders of the route template.
         */
        typedef std::function<
            void(
                const Request& request,
                Response& response,
                const PathParameters& parameters
            )
        > Handler;

        /**
         * This holds everything known about one route.
         */
        struct Route {
            /**
             * This is the template of paths handled by the route.
             */
            std::string pattern;

            /**
             * This is the request method handled by the route.
             */
            std::string method;

            /**
             * This is the function which handles requests for the route.
             */
            Handler handler;

            /**
             * These are the functions to run, in order, on requests
             * for the route before they're given to the handler.
             */
            std::vector< Middleware > middlewares;

            /**
             * This is an optional name by which the route
             * may be looked up.
             */
            std::string name;
        };

        /**
         * This is the outcome of finding the route for a request.
         */
        struct Resolution {
            /**
             * This is the route which matched.
             */
            std::shared_ptr< const Route > route;

            /**
             * These are the values extracted from the request path
             * for the placeholders of the route template.
             */
            PathParameters parameters;
        };

        // Lifecycle management
    public:
        ~RouteTable();
        RouteTable(const RouteTable&) = delete;
        RouteTable(RouteTable&&) = delete;
        RouteTable& operator=(const RouteTable&) = delete;
        RouteTable& operator=(RouteTable&&) = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        RouteTable();

        /**
         * This function determines whether or not the given request
         * method is one for which routes may be registered.
         *
         * @param[in] method
         *     This is the request method to check.
         *
         * @return
         *     An indication of whether or not routes may be registered
         *     for the request method is returned.
         */
        static bool IsSupportedMethod(const std::string& method);

        /**
         * This method adds the given route to the table.  If the route
         * template has no placeholders, it replaces any route previously
         * registered for the same template and method.  Otherwise, it's
         * tried after all routes with placeholders registered before it.
         *
         * @param[in] route
         *     This is the route to add.
         *
         * @return
         *     An indication of whether or not the route was added
         *     is returned.  It isn't added if its method is not
         *     supported, it has no handler, one of its middlewares is
         *     missing, or its template could not be compiled.
         */
        bool Register(const Route& route);

        /**
         * This method finds the route which should handle a request
         * with the given path and method.
         *
         * @param[in] path
         *     This is the decoded path of the request.
         *
         * @param[in] method
         *     This is the method of the request.
         *
         * @param[out] resolution
         *     This is where to store the route found, and the values
         *     extracted for its placeholders.
         *
         * @return
         *     An indication of whether or not a route was found
         *     is returned.
         */
        bool Resolve(
            const std::string& path,
            const std::string& method,
            Resolution& resolution
        ) const;

        /**
         * This method builds the path of the named route, substituting
         * the given values for its placeholders.
         *
         * @param[in] name
         *     This is the name of the route.
         *
         * @param[in] values
         *     These are the values to substitute, keyed by
         *     placeholder name.
         *
         * @return
         *     The path built is returned.
         *
         * @retval ""
         *     This is returned if there is no route with the given name.
         */
        std::string UrlFor(
            const std::string& name,
            const std::map< std::string, std::string >& values = {}
        ) const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< struct Impl > impl_;
    };

}

#endif /* LIVE_ROCKET_ROUTE_TABLE_HPP */
