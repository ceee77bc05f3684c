/**
 * @file TcpServerTransport.cpp
 *
 * This module contains the implementation of the
 * LiveRocket::TcpServerTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <arpa/inet.h>
#include <condition_variable>
#include <errno.h>
#include <inttypes.h>
#include <LiveRocket/TcpServerTransport.hpp>
#include <map>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

    /**
     * This is the number of bytes to try to receive from a connection
     * at a time.
     */
    constexpr size_t RECEIVE_BUFFER_SIZE = 4096;

    /**
     * This is a TCP connection accepted by the transport.
     */
    class TcpConnection
        : public LiveRocket::Connection
    {
        // Lifecycle management
    public:
        ~TcpConnection() {
            (void)close(sock_);
        }
        TcpConnection(const TcpConnection&) = delete;
        TcpConnection(TcpConnection&&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;
        TcpConnection& operator=(TcpConnection&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor for the class.
         *
         * @param[in] sock
         *     This is the socket of the connection, which the
         *     connection takes over.
         *
         * @param[in] peerAddress
         *     This is the IPv4 address of the peer, in dotted notation.
         *
         * @param[in] peerPort
         *     This is the port number of the peer.
         */
        TcpConnection(
            int sock,
            const std::string& peerAddress,
            uint16_t peerPort
        )
            : sock_(sock)
            , peerAddress_(peerAddress)
            , peerId_(SystemAbstractions::sprintf("%s:%" PRIu16, peerAddress.c_str(), peerPort))
        {
        }

        /**
         * This method receives data from the connection until the peer
         * closes it, it fails, or it's broken on this end, delivering
         * each piece received to the data received delegate.
         */
        void Serve() {
            std::vector< uint8_t > buffer(RECEIVE_BUFFER_SIZE);
            for (;;) {
                if (IsBroken()) {
                    return;
                }
                const auto amountReceived = recv(sock_, buffer.data(), buffer.size(), 0);
                if (amountReceived < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    ReportBroken(false);
                    return;
                } else if (amountReceived == 0) {
                    ReportBroken(true);
                    return;
                }
                DataReceivedDelegate dataReceivedDelegate;
                {
                    std::lock_guard< decltype(mutex_) > lock(mutex_);
                    dataReceivedDelegate = dataReceivedDelegate_;
                }
                if (dataReceivedDelegate != nullptr) {
                    dataReceivedDelegate(
                        std::vector< uint8_t >(
                            buffer.begin(),
                            buffer.begin() + amountReceived
                        )
                    );
                }
            }
        }

        /**
         * This method shuts down the receiving side of the connection,
         * causing Serve to return once any data delivery in progress
         * is finished.  Sending still works.
         */
        void StopReceiving() {
            (void)shutdown(sock_, SHUT_RD);
        }

        // LiveRocket::Connection
    public:
        virtual std::string GetPeerId() override {
            return peerId_;
        }

        virtual std::string GetPeerAddress() override {
            return peerAddress_;
        }

        virtual void SetDataReceivedDelegate(DataReceivedDelegate dataReceivedDelegate) override {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            dataReceivedDelegate_ = dataReceivedDelegate;
        }

        virtual void SetBrokenDelegate(BrokenDelegate brokenDelegate) override {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            brokenDelegate_ = brokenDelegate;
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            size_t amountSent = 0;
            while (amountSent < data.size()) {
                const auto result = send(
                    sock_,
                    data.data() + amountSent,
                    data.size() - amountSent,
                    MSG_NOSIGNAL
                );
                if (result < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    Break(false);
                    return;
                }
                amountSent += (size_t)result;
            }
        }

        virtual void Break(bool clean) override {
            {
                std::lock_guard< decltype(mutex_) > lock(mutex_);
                broken_ = true;
            }
            (void)shutdown(sock_, clean ? SHUT_WR : SHUT_RDWR);
        }

        // Private methods
    private:
        /**
         * This method indicates whether or not the connection has been
         * broken on this end.
         *
         * @return
         *     An indication of whether or not the connection has been
         *     broken on this end is returned.
         */
        bool IsBroken() {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            return broken_;
        }

        /**
         * This method calls the broken delegate, unless the connection
         * was broken on this end.
         *
         * @param[in] graceful
         *     This indicates whether or not the peer closed
         *     the connection gracefully.
         */
        void ReportBroken(bool graceful) {
            BrokenDelegate brokenDelegate;
            {
                std::lock_guard< decltype(mutex_) > lock(mutex_);
                if (broken_) {
                    return;
                }
                broken_ = true;
                brokenDelegate = brokenDelegate_;
            }
            if (brokenDelegate != nullptr) {
                brokenDelegate(graceful);
            }
        }

        // Private properties
    private:
        /**
         * This is the socket of the connection.
         */
        const int sock_;

        /**
         * This is the IPv4 address of the peer.
         */
        const std::string peerAddress_;

        /**
         * This identifies the peer in diagnostic messages.
         */
        const std::string peerId_;

        /**
         * This is used to synchronize access to the delegates
         * and the broken flag.
         */
        std::mutex mutex_;

        /**
         * This is the function to call whenever data is received.
         */
        DataReceivedDelegate dataReceivedDelegate_;

        /**
         * This is the function to call if the peer breaks the connection.
         */
        BrokenDelegate brokenDelegate_;

        /**
         * This flag indicates whether or not the connection is broken.
         */
        bool broken_ = false;
    };

    /**
     * This holds onto a connection being served and the thread serving it.
     */
    struct Worker {
        /**
         * This is the connection being served.
         */
        std::shared_ptr< TcpConnection > connection;

        /**
         * This is the thread serving the connection.
         */
        std::thread thread;
    };

}

namespace LiveRocket {

    /**
     * This contains the private properties of a TcpServerTransport instance.
     */
    struct TcpServerTransport::Impl {
        // Properties

        /**
         * This is the maximum number of connections to serve at once,
         * or zero if there is no limit.
         */
        size_t maxConnections = 0;

        /**
         * This is the socket listening for new connections, or -1
         * if the transport isn't bound.
         */
        int listenSocket = -1;

        /**
         * This is the port number to which the listening socket is bound.
         */
        uint16_t boundPort = 0;

        /**
         * This is the function to call to deliver new connections.
         */
        NewConnectionDelegate newConnectionDelegate;

        /**
         * This is the thread which accepts new connections.
         */
        std::thread acceptor;

        /**
         * This is the thread which joins finished worker threads.
         */
        std::thread reaper;

        /**
         * These are the connections currently being served,
         * keyed by worker identifier.
         */
        std::map< unsigned int, Worker > workers;

        /**
         * These are the threads of workers which have finished
         * and need to be joined.
         */
        std::vector< std::thread > finishedWorkers;

        /**
         * This is the identifier to assign to the next worker.
         */
        unsigned int nextWorkerId = 1;

        /**
         * This flag indicates whether or not the transport
         * is being released.
         */
        bool stopping = false;

        /**
         * This is used to synchronize access to the workers,
         * and the stopping flag.
         */
        std::mutex mutex;

        /**
         * This is used to wake up the acceptor and reaper threads,
         * as well as ReleaseNetwork, when the set of workers changes.
         */
        std::condition_variable workersChanged;

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("LiveRocket::TcpServerTransport")
        {
        }

        /**
         * This method is called by a worker thread when it has finished
         * serving its connection.
         *
         * @param[in] workerId
         *     This identifies the worker which has finished.
         */
        void WorkerFinished(unsigned int workerId) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            const auto worker = workers.find(workerId);
            if (worker == workers.end()) {
                return;
            }
            finishedWorkers.push_back(std::move(worker->second.thread));
            (void)workers.erase(worker);
            workersChanged.notify_all();
        }

        /**
         * This method is the body of a worker thread, which serves
         * a single connection.
         *
         * @param[in] workerId
         *     This identifies the worker.
         *
         * @param[in] connection
         *     This is the connection to serve.
         *
         * @param[in] connectionReadyDelegate
         *     This is the function to call, if any, before the connection
         *     starts receiving data.
         */
        void Work(
            unsigned int workerId,
            std::shared_ptr< TcpConnection > connection,
            ConnectionReadyDelegate connectionReadyDelegate
        ) {
            if (connectionReadyDelegate != nullptr) {
                connectionReadyDelegate();
            }
            connection->Serve();
            WorkerFinished(workerId);
        }

        /**
         * This method is the body of the reaper thread, which joins
         * worker threads once they have finished.
         */
        void Reap() {
            std::unique_lock< decltype(mutex) > lock(mutex);
            for (;;) {
                workersChanged.wait(
                    lock,
                    [this]{
                        return (
                            stopping
                            && workers.empty()
                        ) || !finishedWorkers.empty();
                    }
                );
                if (finishedWorkers.empty()) {
                    return;
                }
                auto threadsToJoin = std::move(finishedWorkers);
                finishedWorkers.clear();
                lock.unlock();
                for (auto& thread: threadsToJoin) {
                    thread.join();
                }
                lock.lock();
            }
        }

        /**
         * This method is the body of the acceptor thread, which accepts
         * new connections and starts a worker for each one.
         */
        void Accept() {
            for (;;) {
                {
                    std::unique_lock< decltype(mutex) > lock(mutex);
                    workersChanged.wait(
                        lock,
                        [this]{
                            return (
                                stopping
                                || (maxConnections == 0)
                                || (workers.size() < maxConnections)
                            );
                        }
                    );
                    if (stopping) {
                        return;
                    }
                }
                struct sockaddr_in peerAddress;
                socklen_t peerAddressLength = sizeof(peerAddress);
                const int sock = accept(
                    listenSocket,
                    (struct sockaddr*)&peerAddress,
                    &peerAddressLength
                );
                if (sock < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    {
                        std::lock_guard< decltype(mutex) > lock(mutex);
                        if (stopping) {
                            return;
                        }
                    }
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                        "accept() failed: %s",
                        strerror(errno)
                    );
                    return;
                }
                char peerAddressText[INET_ADDRSTRLEN];
                if (
                    inet_ntop(
                        AF_INET,
                        &peerAddress.sin_addr,
                        peerAddressText,
                        sizeof(peerAddressText)
                    ) == nullptr
                ) {
                    peerAddressText[0] = '\0';
                }
                const auto connection = std::make_shared< TcpConnection >(
                    sock,
                    peerAddressText,
                    ntohs(peerAddress.sin_port)
                );
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    0, "Accepted connection from %s",
                    connection->GetPeerId().c_str()
                );
                const auto connectionReadyDelegate = newConnectionDelegate(connection);
                std::lock_guard< decltype(mutex) > lock(mutex);
                const auto workerId = nextWorkerId++;
                auto& worker = workers[workerId];
                worker.connection = connection;
                worker.thread = std::thread(
                    &Impl::Work,
                    this,
                    workerId,
                    connection,
                    connectionReadyDelegate
                );
            }
        }
    };

    TcpServerTransport::~TcpServerTransport() {
        ReleaseNetwork();
    }

    TcpServerTransport::TcpServerTransport(size_t maxConnections)
        : impl_(new Impl)
    {
        impl_->maxConnections = maxConnections;
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate TcpServerTransport::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    bool TcpServerTransport::BindNetwork(
        const std::string& host,
        uint16_t port,
        NewConnectionDelegate newConnectionDelegate
    ) {
        if (impl_->listenSocket >= 0) {
            return false;
        }
        struct addrinfo hints;
        (void)memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE;
        struct addrinfo* addresses = nullptr;
        const auto lookupResult = getaddrinfo(
            (host.empty() ? nullptr : host.c_str()),
            nullptr,
            &hints,
            &addresses
        );
        if (lookupResult != 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "unable to resolve '%s': %s",
                host.c_str(),
                gai_strerror(lookupResult)
            );
            return false;
        }
        struct sockaddr_in address;
        (void)memcpy(&address, addresses->ai_addr, sizeof(address));
        freeaddrinfo(addresses);
        address.sin_port = htons(port);
        const int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "socket() failed: %s",
                strerror(errno)
            );
            return false;
        }
        int option = 1;
        (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &option, sizeof(option));
        if (bind(sock, (const struct sockaddr*)&address, sizeof(address)) != 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "unable to bind to %s port %" PRIu16 ": %s",
                host.c_str(),
                port,
                strerror(errno)
            );
            (void)close(sock);
            return false;
        }
        if (listen(sock, SOMAXCONN) != 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "listen() failed: %s",
                strerror(errno)
            );
            (void)close(sock);
            return false;
        }
        socklen_t addressLength = sizeof(address);
        if (getsockname(sock, (struct sockaddr*)&address, &addressLength) != 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "getsockname() failed: %s",
                strerror(errno)
            );
            (void)close(sock);
            return false;
        }
        impl_->listenSocket = sock;
        impl_->boundPort = ntohs(address.sin_port);
        impl_->newConnectionDelegate = newConnectionDelegate;
        impl_->stopping = false;
        impl_->reaper = std::thread(&Impl::Reap, impl_.get());
        impl_->acceptor = std::thread(&Impl::Accept, impl_.get());
        return true;
    }

    uint16_t TcpServerTransport::GetBoundPort() {
        return impl_->boundPort;
    }

    void TcpServerTransport::ReleaseNetwork() {
        if (impl_->listenSocket < 0) {
            return;
        }
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stopping = true;
            impl_->workersChanged.notify_all();
        }
        (void)shutdown(impl_->listenSocket, SHUT_RDWR);
        impl_->acceptor.join();
        (void)close(impl_->listenSocket);
        impl_->listenSocket = -1;
        {
            std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
            for (auto& worker: impl_->workers) {
                worker.second.connection->StopReceiving();
            }
            impl_->workersChanged.wait(
                lock,
                [this]{ return impl_->workers.empty(); }
            );
        }
        impl_->reaper.join();
        impl_->newConnectionDelegate = nullptr;
        impl_->boundPort = 0;
    }

}
