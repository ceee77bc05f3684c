#ifndef LIVE_ROCKET_TCP_SERVER_TRANSPORT_HPP
#define LIVE_ROCKET_TCP_SERVER_TRANSPORT_HPP

/**
 * @file TcpServerTransport.hpp
 *
 * This module declares the LiveRocket::TcpServerTransport class.
 *
 * © 2018 by Richard Walters
 */

#include "ServerTransport.hpp"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace LiveRocket {

    /**
     * This is the server transport which accepts TCP connections
     * on a network interface of the local host.
     *
     * A single thread accepts connections.  Each connection is then
     * served by a thread of its own, which delivers all of the
     * connection's events.  Finished connection threads are joined
     * by a separate reaper thread.
     */
    class TcpServerTransport
        : public ServerTransport
    {
        // Lifecycle management
    public:
        ~TcpServerTransport();
        TcpServerTransport(const TcpServerTransport&) = delete;
        TcpServerTransport(TcpServerTransport&&) = delete;
        TcpServerTransport& operator=(const TcpServerTransport&) = delete;
        TcpServerTransport& operator=(TcpServerTransport&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor for the class.
         *
         * @param[in] maxConnections
         *     This is the maximum number of connections to serve at once.
         *     While this many are being served, no more are accepted.
         *     Zero means there is no limit.
         */
        explicit TcpServerTransport(size_t maxConnections = 0);

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the transport.
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
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        // ServerTransport
    public:
        virtual bool BindNetwork(
            const std::string& host,
            uint16_t port,
            NewConnectionDelegate newConnectionDelegate
        ) override;
        virtual uint16_t GetBoundPort() override;
        virtual void ReleaseNetwork() override;

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

#endif /* LIVE_ROCKET_TCP_SERVER_TRANSPORT_HPP */
