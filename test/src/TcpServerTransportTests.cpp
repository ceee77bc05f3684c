/**
 * @file TcpServerTransportTests.cpp
 *
 * This module contains the unit tests of the
 * LiveRocket::TcpServerTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <LiveRocket/Server.hpp>
#include <LiveRocket/TcpServerTransport.hpp>
#include <memory>
#include <netinet/in.h>
#include <string.h>
#include <string>
#include <sys/socket.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

    /**
     * This connects to the given port on the loopback interface,
     * sends the given request, and then reads everything sent back
     * until the server closes the connection.
     *
     * @param[in] port
     *     This is the port number to which to connect.
     *
     * @param[in] rawRequest
     *     This is the request to send.
     *
     * @return
     *     Everything sent back by the server is returned.
     */
    std::string SendRequest(
        uint16_t port,
        const std::string& rawRequest
    ) {
        const int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) {
            return "";
        }
        struct sockaddr_in address;
        (void)memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_port = htons(port);
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (connect(sock, (const struct sockaddr*)&address, sizeof(address)) != 0) {
            (void)close(sock);
            return "";
        }
        size_t amountSent = 0;
        while (amountSent < rawRequest.length()) {
            const auto result = send(
                sock,
                rawRequest.data() + amountSent,
                rawRequest.length() - amountSent,
                MSG_NOSIGNAL
            );
            if (result <= 0) {
                break;
            }
            amountSent += (size_t)result;
        }
        std::string response;
        std::vector< char > buffer(1024);
        for (;;) {
            const auto result = recv(sock, buffer.data(), buffer.size(), 0);
            if (result <= 0) {
                break;
            }
            response.append(buffer.data(), (size_t)result);
        }
        (void)close(sock);
        return response;
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct TcpServerTransportTests
    : public ::testing::Test
{
    // Properties

    /**
     * This is the server which uses the transport.
     */
    LiveRocket::Server server;

    /**
     * This is the unit under test.
     */
    std::shared_ptr< LiveRocket::TcpServerTransport > transport = std::make_shared< LiveRocket::TcpServerTransport >();

    /**
     * These are the diagnostic messages that have been
     * received from the unit under test.
     */
    std::vector< std::string > diagnosticMessages;

    /**
     * This is the delegate obtained when subscribing
     * to receive diagnostic messages from the unit under test.
     * It's called to terminate the subscription.
     */
    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;

    // Methods

    /**
     * This method mobilizes the server on an ephemeral port of
     * the loopback interface.
     */
    void Mobilize() {
        server.SetConfigurationItem("Host", "127.0.0.1");
        server.SetConfigurationItem("Port", "0");
        LiveRocket::Server::MobilizationDependencies deps;
        deps.transport = transport;
        ASSERT_TRUE(server.Mobilize(deps));
        ASSERT_NE(0, transport->GetBoundPort());
    }

    // ::testing::Test

    virtual void SetUp() {
        diagnosticsUnsubscribeDelegate = transport->SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                diagnosticMessages.push_back(
                    SystemAbstractions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            1
        );
        ASSERT_TRUE(
            server.RegisterRoute(
                "/greet/<name>",
                "GET",
                [](
                    const LiveRocket::Request&,
                    LiveRocket::Response& response,
                    const LiveRocket::PathParameters& parameters
                ){
                    response.Send("Hello, " + parameters.at("name").text + "!");
                }
            )
        );
        ASSERT_TRUE(
            server.RegisterRoute(
                "/whoami",
                "GET",
                [](
                    const LiveRocket::Request& request,
                    LiveRocket::Response& response,
                    const LiveRocket::PathParameters&
                ){
                    response.Send(request.remoteAddress);
                }
            )
        );
    }

    virtual void TearDown() {
        server.Demobilize();
        diagnosticsUnsubscribeDelegate();
    }
};

TEST_F(TcpServerTransportTests, BindToEphemeralPort) {
    Mobilize();
    EXPECT_EQ(
        SystemAbstractions::sprintf("%u", (unsigned int)transport->GetBoundPort()),
        server.GetConfigurationItem("Port")
    );
    EXPECT_TRUE(diagnosticMessages.empty());
}

TEST_F(TcpServerTransportTests, ServeRequestOverLoopback) {
    Mobilize();
    EXPECT_EQ(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 11\r\n"
        "Connection: close\r\n"
        "\r\n"
        "Hello, Ada!",
        SendRequest(
            transport->GetBoundPort(),
            "GET /greet/Ada HTTP/1.1\r\n"
            "Host: 127.0.0.1\r\n"
            "\r\n"
        )
    );
}

TEST_F(TcpServerTransportTests, PeerAddressReported) {
    Mobilize();
    const auto response = SendRequest(
        transport->GetBoundPort(),
        "GET /whoami HTTP/1.1\r\n\r\n"
    );
    EXPECT_NE(std::string::npos, response.find("\r\n\r\n127.0.0.1"));
}

TEST_F(TcpServerTransportTests, ServeConcurrentClients) {
    Mobilize();
    const auto port = transport->GetBoundPort();
    constexpr size_t numClients = 8;
    std::vector< std::string > responses(numClients);
    std::vector< std::thread > clients;
    for (size_t i = 0; i < numClients; ++i) {
        clients.emplace_back(
            [i, port, &responses]{
                responses[i] = SendRequest(
                    port,
                    SystemAbstractions::sprintf(
                        "GET /greet/client%zu HTTP/1.1\r\n\r\n",
                        i
                    )
                );
            }
        );
    }
    for (auto& client: clients) {
        client.join();
    }
    for (size_t i = 0; i < numClients; ++i) {
        EXPECT_NE(
            std::string::npos,
            responses[i].find(SystemAbstractions::sprintf("Hello, client%zu!", i))
        ) << responses[i];
    }
}

TEST_F(TcpServerTransportTests, ServeRequestSentInPieces) {
    Mobilize();
    const int sock = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(sock, 0);
    struct sockaddr_in address;
    (void)memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(transport->GetBoundPort());
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(0, connect(sock, (const struct sockaddr*)&address, sizeof(address)));
    const std::string firstPiece = "GET /greet/Bo";
    const std::string secondPiece = "b HTTP/1.1\r\n\r\n";
    ASSERT_EQ((ssize_t)firstPiece.length(), send(sock, firstPiece.data(), firstPiece.length(), MSG_NOSIGNAL));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ((ssize_t)secondPiece.length(), send(sock, secondPiece.data(), secondPiece.length(), MSG_NOSIGNAL));
    std::string response;
    std::vector< char > buffer(1024);
    for (;;) {
        const auto result = recv(sock, buffer.data(), buffer.size(), 0);
        if (result <= 0) {
            break;
        }
        response.append(buffer.data(), (size_t)result);
    }
    (void)close(sock);
    EXPECT_NE(std::string::npos, response.find("Hello, Bob!"));
}

TEST_F(TcpServerTransportTests, DemobilizeWithIdleClientConnected) {
    Mobilize();
    const int sock = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(sock, 0);
    struct sockaddr_in address;
    (void)memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(transport->GetBoundPort());
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(0, connect(sock, (const struct sockaddr*)&address, sizeof(address)));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    server.Demobilize();
    EXPECT_EQ(0, transport->GetBoundPort());
    (void)close(sock);
}

TEST(TcpServerTransportLimitTests, LimitedConnectionsStillServed) {
    LiveRocket::Server server;
    ASSERT_TRUE(
        server.RegisterRoute(
            "/greet/<name>",
            "GET",
            [](
                const LiveRocket::Request&,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                response.Send("Hello, " + parameters.at("name").text + "!");
            }
        )
    );
    server.SetConfigurationItem("Host", "127.0.0.1");
    server.SetConfigurationItem("Port", "0");
    const auto transport = std::make_shared< LiveRocket::TcpServerTransport >(1);
    LiveRocket::Server::MobilizationDependencies deps;
    deps.transport = transport;
    ASSERT_TRUE(server.Mobilize(deps));
    const auto port = transport->GetBoundPort();
    EXPECT_NE(std::string::npos, SendRequest(port, "GET /greet/one HTTP/1.1\r\n\r\n").find("Hello, one!"));
    EXPECT_NE(std::string::npos, SendRequest(port, "GET /greet/two HTTP/1.1\r\n\r\n").find("Hello, two!"));
    server.Demobilize();
}

TEST_F(TcpServerTransportTests, BindToUnknownHostFails) {
    server.SetConfigurationItem("Host", "no-such-host.invalid");
    server.SetConfigurationItem("Port", "0");
    LiveRocket::Server::MobilizationDependencies deps;
    deps.transport = transport;
    EXPECT_FALSE(server.Mobilize(deps));
    EXPECT_FALSE(diagnosticMessages.empty());
}
