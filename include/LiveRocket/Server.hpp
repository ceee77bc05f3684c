#ifndef LIVE_ROCKET_SERVER_HPP
#define LIVE_ROCKET_SERVER_HPP

/**
 * @file Server.hpp
 *
 * This module declares the LiveRocket::Server class.
 *
 * © 2018 by Richard Walters
 */

#include "IServer.hpp"
#include "ServerTransport.hpp"

#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace LiveRocket {

    /**
     * This class is used to parse incoming HTTP requests, run them
     * through middleware, route them to handlers, and then return the
     * responses the handlers produce back to the clients.
     *
     * Each connection carries exactly one request.  Once the response
     * has been sent, the server closes the connection.
     *
     * Routes and middleware must be registered before the server
     * is mobilized.
     */
    class Server
        : public IServer
    {
        // Types
    public:
        /**
         * This structure holds all of the configuration items
         * and dependency objects needed by the server when it's
         * mobilized.
         */
        struct MobilizationDependencies {
            /**
             * This is the transport layer implementation to use.
             */
            std::shared_ptr< ServerTransport > transport;
        };

        // Lifecycle management
    public:
        ~Server();
        Server(const Server&) = delete;
        Server(Server&&) = delete;
        Server& operator=(const Server&) = delete;
        Server& operator=(Server&&) = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Server();

        /**
         * This method will cause the server to bind to the given transport
         * layer and start accepting and processing connections from clients.
         *
         * @param[in] deps
         *     These are all of the configuration items and dependency objects
         *     needed by the server when it's mobilized.
         *
         * @return
         *     An indication of whether or not the method was successful
         *     is returned.
         */
        bool Mobilize(const MobilizationDependencies& deps);

        /**
         * This method stops any accepting or processing of client connections,
         * and releases the transport layer, returning the server back to the
         * state it was in before Mobilize was called.
         */
        void Demobilize();

        /**
         * This method parses the given string as a raw HTTP request message.
         * If the string parses correctly, the equivalent Request is returned.
         * Otherwise, nullptr is returned.
         *
         * @param[in] rawRequest
         *     This is the raw HTTP request message as a single string.
         *
         * @return
         *     The Request equivalent to the given raw HTTP request string
         *     is returned.
         *
         * @retval nullptr
         *     This is returned if the given rawRequest is incomplete.
         */
        std::shared_ptr< Request > ParseRequest(const std::string& rawRequest);

        /**
         * This method parses the given string as a raw HTTP request message.
         * If the string parses correctly, the equivalent Request is returned.
         * Otherwise, nullptr is returned.
         *
         * @param[in] rawRequest
         *     This is the raw HTTP request message as a single string.
         *
         * @param[out] messageEnd
         *     This is where to store a count of the number of characters
         *     that actually made up the request message.  Presumably,
         *     any characters past this point belong to another message or
         *     are outside the scope of HTTP.
         *
         * @return
         *     The Request equivalent to the given raw HTTP request string
         *     is returned.
         *
         * @retval nullptr
         *     This is returned if the given rawRequest is incomplete.
         */
        std::shared_ptr< Request > ParseRequest(
            const std::string& rawRequest,
            size_t& messageEnd
        );

        // IServer
    public:
        virtual SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        ) override;
        virtual std::string GetConfigurationItem(const std::string& key) override;
        virtual void SetConfigurationItem(
            const std::string& key,
            const std::string& value
        ) override;
        virtual bool AddMiddleware(Middleware middleware) override;
        virtual bool RegisterRoute(
            const std::string& path,
            const std::string& method,
            Handler handler,
            const std::vector< Middleware >& middlewares = {},
            const std::string& name = ""
        ) override;
        virtual bool RegisterResource(
            const std::string& path,
            const ResourceHandlers& handlers,
            const std::vector< Middleware >& middlewares = {}
        ) override;
        virtual std::string UrlFor(
            const std::string& name,
            const std::map< std::string, std::string >& values = {}
        ) override;

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

#endif /* LIVE_ROCKET_SERVER_HPP */
