#ifndef LIVE_ROCKET_I_SERVER_HPP
#define LIVE_ROCKET_I_SERVER_HPP

/**
 * @file IServer.hpp
 *
 * This module declares the LiveRocket::IServer interface.
 *
 * © 2018 by Richard Walters
 */

#include "Request.hpp"
#include "Response.hpp"
#include "RouteTable.hpp"

#include <map>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace LiveRocket {

    /**
     * This is public interface to the application server from
     * application code and other modules that are outside of the server.
     */
    class IServer {
    public:
        // Types

        /**
         * This is the type of function which can be registered to handle
         * requests for a route.
         */
        typedef RouteTable::Handler Handler;

        /**
         * This is the type of function which may be run on a request
         * before it's given to its handler.
         */
        typedef RouteTable::Middleware Middleware;

        /**
         * This maps request methods to the functions which handle
         * them for a single resource.
         */
        typedef std::map< std::string, Handler > ResourceHandlers;

        // Methods

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the sender.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to this subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        virtual SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        ) = 0;

        /**
         * This method returns the value of the given server
         * configuration item.
         *
         * @param[in] key
         *     This is the key identifying the configuration item
         *     whose value should be returned.
         *
         * @return
         *     The value of the configuration item is returned.
         */
        virtual std::string GetConfigurationItem(const std::string& key) = 0;

        /**
         * This method sets the value of the given server configuration item.
         *
         * @param[in] key
         *     This is the key identifying the configuration item
         *     whose value should be set.
         *
         * @param[in] value
         *     This is the value to set for the configuration item.
         */
        virtual void SetConfigurationItem(
            const std::string& key,
            const std::string& value
        ) = 0;

        /**
         * This method adds the given middleware to the end of the
         * list of middleware run on every request, before the route
         * for the request is looked up.
         *
         * @param[in] middleware
         *     This is the middleware to add.
         *
         * @return
         *     An indication of whether or not the middleware was added
         *     is returned.  It isn't added if it's empty, or if the
         *     server is already mobilized.
         */
        virtual bool AddMiddleware(Middleware middleware) = 0;

        /**
         * This method registers the given handler to be called in order
         * to fill in the response to any request with the given method
         * whose path matches the given route template.
         *
         * @param[in] path
         *     This is the route template, which may contain placeholders
         *     of the form "<name>" or "<type:name>", where type is one of
         *     "string", "int", "float", "path", or "uuid".
         *
         * @param[in] method
         *     This is the request method handled ("GET", "POST", "PUT",
         *     "DELETE", or "PATCH").
         *
         * @param[in] handler
         *     This is the function to call to handle matching requests.
         *
         * @param[in] middlewares
         *     These are functions to run, in order, on matching requests
         *     before they're given to the handler.
         *
         * @param[in] name
         *     This is an optional name for the route, which may be given
         *     to UrlFor in order to build paths to the route.
         *
         * @return
         *     An indication of whether or not the route was registered
         *     is returned.
         */
        virtual bool RegisterRoute(
            const std::string& path,
            const std::string& method,
            Handler handler,
            const std::vector< Middleware >& middlewares = {},
            const std::string& name = ""
        ) = 0;

        /**
         * This method registers each of the given handlers for the
         * request method with which it's paired, all under the same
         * route template and middleware.
         *
         * @param[in] path
         *     This is the route template.
         *
         * @param[in] handlers
         *     These are the handlers to register, keyed by request method.
         *
         * @param[in] middlewares
         *     These are functions to run, in order, on matching requests
         *     before they're given to a handler.
         *
         * @return
         *     An indication of whether or not every handler was
         *     registered is returned.
         */
        virtual bool RegisterResource(
            const std::string& path,
            const ResourceHandlers& handlers,
            const std::vector< Middleware >& middlewares = {}
        ) = 0;

        /**
         * This method builds the path of the named route, substituting
         * the given values for its placeholders.
         *
         * @param[in] name
         *     This is the name given to the route when it was registered.
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
        virtual std::string UrlFor(
            const std::string& name,
            const std::map< std::string, std::string >& values = {}
        ) = 0;
    };

}

#endif /* LIVE_ROCKET_I_SERVER_HPP */
