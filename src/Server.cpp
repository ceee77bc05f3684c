/**
 * @file Server.cpp
 *
 * This module contains the implementation of the LiveRocket::Server class.
 *
 * © 2018 by Richard Walters
 */

#include "FormDecoding.hpp"

#include <algorithm>
#include <inttypes.h>
#include <iomanip>
#include <LiveRocket/Server.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stddef.h>
#include <stdio.h>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This is the character sequence corresponding to a carriage return (CR)
     * followed by a line feed (LF), which officially delimits each
     * line of an HTTP request.
     */
    const std::string CRLF("\r\n");

    /**
     * This is the default maximum allowed request body size.
     *
     * Make sure this is never larger than the largest value
     * for the size_t type.
     */
    constexpr intmax_t DEFAULT_MAX_CONTENT_LENGTH = 10000000;

    /**
     * This is the default maximum length allowed for a request header line.
     */
    constexpr size_t DEFAULT_HEADER_LINE_LIMIT = 1000;

    /**
     * This is the default number of bytes of every bad request to
     * be reported in diagnostic messages.
     */
    constexpr size_t DEFAULT_BAD_REQUEST_REPORT_BYTES = 100;

    /**
     * This is the default host name or address of the network interface
     * on which the server listens for connections.
     */
    const std::string DEFAULT_HOST("localhost");

    /**
     * This is the default public port number to which clients may connect
     * to establish connections with this server.
     */
    constexpr uint16_t DEFAULT_PORT_NUMBER = 8000;

    /**
     * This is the media type of request bodies holding form fields.
     */
    const std::string FORM_CONTENT_TYPE("application/x-www-form-urlencoded");

    /**
     * This is the media type of request bodies holding JSON.
     */
    const std::string JSON_CONTENT_TYPE("application/json");

    /**
     * This holds the limits applied while parsing a request.
     */
    struct ParsingLimits {
        /**
         * This is the maximum number of characters allowed on any
         * header line of a request.
         */
        size_t headerLineLimit = DEFAULT_HEADER_LINE_LIMIT;

        /**
         * This is the maximum allowed request body size.
         */
        intmax_t maxContentLength = DEFAULT_MAX_CONTENT_LENGTH;
    };

    /**
     * This function joins the given path segments back together,
     * delimiting them with slashes.
     *
     * @param[in] segments
     *     These are the path segments to join.
     *
     * @return
     *     The joined path is returned.
     */
    std::string JoinPath(const std::vector< std::string >& segments) {
        std::string path;
        for (size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) {
                path += '/';
            }
            path += segments[i];
        }
        if (path.empty()) {
            path = "/";
        }
        return path;
    }

    /**
     * This method parses the method, target URI, and protocol identifier
     * from the given request line.
     *
     * @param[in] request
     *     This is the request in which to store the parsed method,
     *     target URI, path, query string, and protocol identifier.
     *
     * @param[in] requestLine
     *     This is the raw request line string to parse.
     *
     * @return
     *     An indication of whether or not the request line
     *     was successfully parsed is returned.
     */
    bool ParseRequestLine(
        LiveRocket::Request& request,
        const std::string& requestLine
    ) {
        // Parse the method.
        const auto methodDelimiter = requestLine.find(' ');
        if (methodDelimiter == std::string::npos) {
            return false;
        }
        request.method = requestLine.substr(0, methodDelimiter);
        if (request.method.empty()) {
            return false;
        }

        // Parse the target URI.
        const auto targetDelimiter = requestLine.find(' ', methodDelimiter + 1);
        if (targetDelimiter == std::string::npos) {
            return false;
        }
        const auto targetLength = targetDelimiter - methodDelimiter - 1;
        if (targetLength == 0) {
            return false;
        }
        const auto rawTarget = requestLine.substr(methodDelimiter + 1, targetLength);
        if (!request.target.ParseFromString(rawTarget)) {
            return false;
        }
        request.path = JoinPath(request.target.GetPath());
        const auto queryDelimiter = rawTarget.find('?');
        if (queryDelimiter != std::string::npos) {
            const auto fragmentDelimiter = rawTarget.find('#', queryDelimiter);
            request.queryString = rawTarget.substr(
                queryDelimiter + 1,
                (
                    (fragmentDelimiter == std::string::npos)
                    ? std::string::npos
                    : fragmentDelimiter - queryDelimiter - 1
                )
            );
        }

        // Parse the protocol.
        request.protocol = requestLine.substr(targetDelimiter + 1);
        return (
            (request.protocol.compare(0, 5, "HTTP/") == 0)
            && (request.protocol.find(' ') == std::string::npos)
        );
    }

    /**
     * This structure holds onto all state information the server has
     * about a single connection from a client.  It's only touched by
     * the thread delivering events for the connection.
     */
    struct ConnectionState {
        // Properties

        /**
         * This is the transport interface of the connection.
         */
        std::shared_ptr< LiveRocket::Connection > connection;

        /**
         * This buffer is used to reassemble fragmented HTTP requests
         * received from the client.
         */
        std::string reassemblyBuffer;

        /**
         * This holds the beginning of the request, used to
         * report the bytes received for a bad request.
         */
        std::vector< uint8_t > requestExtract;

        /**
         * This is the state of the request, while it's still
         * being received and parsed.
         */
        std::shared_ptr< LiveRocket::Request > nextRequest = std::make_shared< LiveRocket::Request >();

        /**
         * This flag indicates whether or not the server is still
         * accepting a request from the client.
         */
        bool acceptingRequests = true;

        /**
         * This flag indicates whether or not the server has closed
         * its end of the connection.
         */
        bool closed = false;
    };

}

namespace LiveRocket {

    /**
     * This contains the private properties of a Server instance.
     */
    struct Server::Impl {
        // Properties

        /**
         * This refers back to the server whose private properties
         * are stored here.
         */
        Server* server = nullptr;

        /**
         * This holds all configuration items for the server.
         */
        std::map< std::string, std::string > configuration;

        /**
         * These are the limits applied while parsing requests.
         */
        ParsingLimits parsingLimits;

        /**
         * This is the number of bytes of every bad request to
         * be reported in diagnostic messages.
         */
        size_t badRequestReportBytes = DEFAULT_BAD_REQUEST_REPORT_BYTES;

        /**
         * This is the host name or address of the network interface
         * on which the server listens for connections.
         */
        std::string host = DEFAULT_HOST;

        /**
         * This is the public port number to which clients may connect
         * to establish connections with this server.
         */
        uint16_t port = DEFAULT_PORT_NUMBER;

        /**
         * This flag indicates whether or not the server is running.
         * Routes and middleware can't be registered while it is.
         */
        bool mobilized = false;

        /**
         * This is the transport layer currently bound.
         */
        std::shared_ptr< ServerTransport > transport;

        /**
         * These are the currently active client connections.
         */
        std::set< std::shared_ptr< ConnectionState > > activeConnections;

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * These are the routes registered with the server.
         */
        RouteTable routes;

        /**
         * These are the middleware run on every request, in order,
         * before its route is looked up.
         */
        std::vector< Middleware > middlewares;

        /**
         * This is used to synchronize access to the configuration
         * and the set of active connections.
         */
        std::mutex mutex;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("LiveRocket::Server")
        {
        }

        /**
         * This is the template of a helper function which is used to
         * parse a configuration item and set it if the parsing is successful.
         *
         * @param ItemType
         *     This is the type of the configuration item.
         *
         * @param[in,out] item
         *     This is the configuration item to set.
         *
         * @param[in] scanFormat
         *     This is the scanf-style format specification for parsing
         *     the configuration item.
         *
         * @param[in] printFormat
         *     This is the printf-style format specification for printing
         *     the configuration item.
         *
         * @param[in] description
         *     This is the string to display in diagnostic messages about
         *     the configuration item.
         *
         * @param[in] value
         *     This is the value to parse to be the new value of the item.
         */
        template<
            typename ItemType
        > void ParseConfigurationItem(
            ItemType& item,
            const char* const scanFormat,
            const char* const printFormat,
            const char* const description,
            const std::string& value
        ) {
            ItemType newItem;
            if (
                sscanf(
                    value.c_str(),
                    scanFormat,
                    &newItem
                ) == 1
            ) {
                if (item != newItem) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        0,
                        SystemAbstractions::sprintf(
                            "%s changed from %s to %s",
                            description,
                            printFormat,
                            printFormat
                        ).c_str(),
                        item,
                        newItem
                    );
                    item = newItem;
                }
            }
        }

        /**
         * This method returns a copy of the limits currently applied
         * while parsing requests.
         *
         * @return
         *     A copy of the limits currently applied while parsing
         *     requests is returned.
         */
        ParsingLimits GetParsingLimits() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            return parsingLimits;
        }

        /**
         * This method decodes the query string of the given request
         * into its query parameters.
         *
         * @param[in,out] request
         *     This is the request whose query string should be decoded.
         */
        void DecodeQuery(Request& request) {
            for (const auto& field: DecodeFormFields(request.queryString)) {
                request.query[field.first] = field.second;
            }
        }

        /**
         * This method interprets the body of the given request according
         * to its Content-Type header.
         *
         * @param[in,out] request
         *     This is the request whose body should be interpreted.
         */
        void DecodeBody(Request& request) {
            request.data = nlohmann::json::object();
            if (request.body.empty()) {
                request.bodyType = Request::BodyType::None;
                return;
            }
            const auto contentType = (
                request.headers.HasHeader("Content-Type")
                ? request.headers.GetHeaderValue("Content-Type")
                : ""
            );
            if (contentType.find(FORM_CONTENT_TYPE) != std::string::npos) {
                request.bodyType = Request::BodyType::Form;
                for (const auto& field: DecodeFormFields(request.body)) {
                    auto& entry = request.data[field.first];
                    if (entry.is_null()) {
                        entry = field.second;
                    } else if (entry.is_array()) {
                        entry.push_back(field.second);
                    } else {
                        auto values = nlohmann::json::array();
                        values.push_back(entry);
                        values.push_back(field.second);
                        entry = values;
                    }
                }
            } else if (contentType.find(JSON_CONTENT_TYPE) != std::string::npos) {
                request.bodyType = Request::BodyType::Json;
                auto parsed = nlohmann::json::parse(request.body, nullptr, false);
                if (parsed.is_discarded()) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        1, "Request: %s '%s' has a malformed JSON body (%zu bytes); treating it as empty",
                        request.method.c_str(),
                        request.path.c_str(),
                        request.body.length()
                    );
                } else {
                    request.data = std::move(parsed);
                }
            } else {
                request.bodyType = Request::BodyType::Raw;
            }
        }

        /**
         * This method is called one or more times to incrementally parse
         * a raw HTTP request message.  For the first call, pass in a newly-
         * constructed request object, and the beginning of the raw
         * HTTP request message.  Contine calling with the same request
         * object and subsequent pieces of the raw HTTP request message,
         * until the request is fully parsed, as indicated by its
         * state transitioning to Request::State::Complete or
         * Request::State::Error.
         *
         * @param[in,out] request
         *     This is the request being parsed.
         *
         * @param[in] nextRawRequestPart
         *     This is the next part of the raw HTTP request message.
         *
         * @return
         *     A count of the number of characters that were taken from
         *     the given input string is returned. Presumably,
         *     any characters past this point belong to another message or
         *     are outside the scope of HTTP.
         */
        size_t ParseRequest(
            Request& request,
            const std::string& nextRawRequestPart
        ) {
            const auto limits = GetParsingLimits();

            // Count the number of characters incorporated into
            // the request object.
            size_t messageEnd = 0;

            // First, extract and parse the request line.
            if (request.state == Request::State::RequestLine) {
                const auto requestLineEnd = nextRawRequestPart.find(CRLF);
                if (requestLineEnd == std::string::npos) {
                    if (nextRawRequestPart.length() > limits.headerLineLimit) {
                        request.state = Request::State::Error;
                    }
                    return messageEnd;
                }
                const auto requestLineLength = requestLineEnd;
                if (requestLineLength > limits.headerLineLimit) {
                    request.state = Request::State::Error;
                    return messageEnd;
                }
                const auto requestLine = nextRawRequestPart.substr(0, requestLineLength);
                messageEnd = requestLineEnd + CRLF.length();
                request.state = Request::State::Headers;
                request.valid = ParseRequestLine(request, requestLine);
            }

            // Second, parse the message headers and identify where the body begins.
            if (request.state == Request::State::Headers) {
                request.headers.SetLineLimit(limits.headerLineLimit);
                size_t bodyOffset;
                const auto headersState = request.headers.ParseRawMessage(
                    nextRawRequestPart.substr(messageEnd),
                    bodyOffset
                );
                messageEnd += bodyOffset;
                switch (headersState) {
                    case MessageHeaders::MessageHeaders::State::Complete: {
                        // Done with parsing headers; next will be body.
                        if (!request.headers.IsValid()) {
                            request.valid = false;
                        }
                        request.state = Request::State::Body;
                        for (const auto& header: request.headers.GetAll()) {
                            request.environment[
                                Request::NormalizeHeaderName(
                                    static_cast< const std::string& >(header.name)
                                )
                            ] = header.value;
                        }
                    } break;

                    case MessageHeaders::MessageHeaders::State::Incomplete: {
                    } return messageEnd;

                    case MessageHeaders::MessageHeaders::State::Error:
                    default: {
                        request.state = Request::State::Error;
                        return messageEnd;
                    }
                }
            }

            // Finally, extract the body.
            if (request.state == Request::State::Body) {
                const auto bytesAvailableForBody = nextRawRequestPart.length() - messageEnd;

                // If there is a "Content-Length" header, we carefully carve
                // exactly that number of characters out (and wait for more
                // if we don't have enough).  Otherwise, the body is
                // whatever we have after the headers.
                if (request.headers.HasHeader("Content-Length")) {
                    intmax_t contentLengthAsInt;
                    switch (
                        SystemAbstractions::ToInteger(
                            request.headers.GetHeaderValue("Content-Length"),
                            contentLengthAsInt
                        )
                    ) {
                        case SystemAbstractions::ToIntegerResult::NotANumber: {
                            request.state = Request::State::Error;
                        } return messageEnd;

                        case SystemAbstractions::ToIntegerResult::Overflow: {
                            request.state = Request::State::Error;
                            request.responseStatusCode = 413;
                        } return messageEnd;

                        default: break;
                    }
                    if (contentLengthAsInt < 0) {
                        request.state = Request::State::Error;
                        return messageEnd;
                    }
                    if (contentLengthAsInt > limits.maxContentLength) {
                        request.state = Request::State::Error;
                        request.responseStatusCode = 413;
                        return messageEnd;
                    }
                    const auto contentLength = (size_t)contentLengthAsInt;
                    if (contentLength > bytesAvailableForBody) {
                        return messageEnd;
                    }
                    request.body = nextRawRequestPart.substr(messageEnd, contentLength);
                    messageEnd += contentLength;
                } else {
                    request.body = nextRawRequestPart.substr(messageEnd);
                    messageEnd += bytesAvailableForBody;
                }
                request.state = Request::State::Complete;
                if (request.valid) {
                    DecodeQuery(request);
                    DecodeBody(request);
                }
            }
            return messageEnd;
        }

        /**
         * This method attempts to parse a request out of the
         * reassembly buffer of the given connection.
         *
         * @param[in] connectionState
         *     This is the state of the connection for which to attempt
         *     to assemble the request.
         *
         * @return
         *     The request parsed from the reassembly buffer is returned.
         *
         * @retval nullptr
         *     This is returned if no request could be parsed from the
         *     reassembly buffer.
         */
        std::shared_ptr< Request > TryRequestAssembly(
            ConnectionState& connectionState
        ) {
            const auto charactersAccepted = ParseRequest(
                *connectionState.nextRequest,
                connectionState.reassemblyBuffer
            );
            connectionState.reassemblyBuffer.erase(
                connectionState.reassemblyBuffer.begin(),
                connectionState.reassemblyBuffer.begin() + charactersAccepted
            );
            if (!connectionState.nextRequest->IsCompleteOrError()) {
                return nullptr;
            }
            return connectionState.nextRequest;
        }

        /**
         * This method runs the given request through the middleware,
         * finds its route, and has the route's handler produce
         * the response.  Any exception thrown along the way is turned
         * into an "Internal Server Error" response.
         *
         * @param[in,out] request
         *     This is the request to handle.
         *
         * @return
         *     The response to send back to the client is returned.
         */
        Response HandleRequest(Request& request) {
            try {
                for (const auto& middleware: middlewares) {
                    middleware(request);
                }
                RouteTable::Resolution resolution;
                if (!routes.Resolve(request.path, request.method, resolution)) {
                    Response response;
                    response.Send("Route not found", "404 Not Found");
                    return response;
                }
                for (const auto& middleware: resolution.route->middlewares) {
                    middleware(request);
                }
                Response response;
                resolution.route->handler(request, response, resolution.parameters);
                return response;
            } catch (const std::exception& e) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "Request: %s '%s' failed: %s",
                    request.method.c_str(),
                    request.path.c_str(),
                    e.what()
                );
                return Response::MakeError(500, e.what());
            } catch (...) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "Request: %s '%s' failed with an unknown error",
                    request.method.c_str(),
                    request.path.c_str()
                );
                return Response::MakeError(500, "unknown error");
            }
        }

        /**
         * This method sends the given response back to the given client,
         * and then closes the connection.
         *
         * @param[in] connectionState
         *     This is the state of the connection for which to issue
         *     the given response.
         *
         * @param[in] response
         *     This is the response to send back to the client.
         */
        void IssueResponse(
            std::shared_ptr< ConnectionState > connectionState,
            const Response& response
        ) {
            const auto responseText = response.Generate();
            connectionState->connection->SendData(
                std::vector< uint8_t >(
                    responseText.begin(),
                    responseText.end()
                )
            );
            connectionState->acceptingRequests = false;
            connectionState->closed = true;
            connectionState->connection->Break(true);
            OnConnectionBroken(connectionState, "closed by server");
        }

        /**
         * This method publishes a diagnostic message about a client request.
         *
         * @param[in] request
         *     This is the request from the client.
         *
         * @param[in] response
         *     This is the response that was constructed for the request.
         *
         * @param[in] peerId
         *     This is the identifier of the peer who sent the request.
         */
        void ReportRequest(
            const Request& request,
            const Response& response,
            const std::string& peerId
        ) {
            const auto requestBodyDescription = (
                request.headers.HasHeader("Content-Type")
                ? SystemAbstractions::sprintf(
                    "%s:%zu",
                    request.headers.GetHeaderValue("Content-Type").c_str(),
                    request.body.length()
                )
                : SystemAbstractions::sprintf(
                    "%zu",
                    request.body.length()
                )
            );
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1, "Request: %s '%s' (%s) from %s: %s",
                request.method.c_str(),
                request.target.GenerateString().c_str(),
                requestBodyDescription.c_str(),
                peerId.c_str(),
                response.status.c_str()
            );
        }

        /**
         * This method publishes a diagnostic message about a bad request.
         *
         * @param[in] connectionState
         *     This is the state of the connection on which the bad
         *     request was received.
         */
        void ReportBadRequest(const ConnectionState& connectionState) {
            std::ostringstream requestExtractStringBuilder;
            requestExtractStringBuilder << std::hex << std::setfill('0');
            for (auto ch: connectionState.requestExtract) {
                if ((ch <= 0x20) || (ch > 0x7E)) {
                    requestExtractStringBuilder << "\\x" << std::setw(2) << (int)ch;
                } else {
                    requestExtractStringBuilder << (char)ch;
                }
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1, "Request: Bad request from %s: %s",
                connectionState.connection->GetPeerId().c_str(),
                requestExtractStringBuilder.str().c_str()
            );
        }

        /**
         * This method is called when a connection is broken,
         * either on the server end or the client end.
         *
         * @param[in] connectionState
         *     This is the state of the connection which is broken.
         *
         * @param[in] reason
         *     This describes how the connection was broken.
         */
        void OnConnectionBroken(
            std::shared_ptr< ConnectionState > connectionState,
            const std::string& reason
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2, "Connection to %s %s",
                connectionState->connection->GetPeerId().c_str(),
                reason.c_str()
            );
            std::lock_guard< decltype(mutex) > lock(mutex);
            (void)activeConnections.erase(connectionState);
        }

        /**
         * This method is called when new data is received from a connection.
         *
         * @param[in] connectionState
         *     This is the state of the connection from which data was received.
         *
         * @param[in] data
         *     This is a copy of the data that was received from the connection.
         */
        void DataReceived(
            std::shared_ptr< ConnectionState > connectionState,
            const std::vector< uint8_t >& data
        ) {
            if (!connectionState->acceptingRequests) {
                return;
            }
            connectionState->reassemblyBuffer += std::string(data.begin(), data.end());
            size_t reportBytes;
            std::string serverName;
            uint16_t serverPort;
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                reportBytes = badRequestReportBytes;
                serverName = host;
                serverPort = port;
            }
            if (connectionState->requestExtract.size() < reportBytes) {
                connectionState->requestExtract.insert(
                    connectionState->requestExtract.end(),
                    data.begin(),
                    data.begin() + std::min(
                        data.size(),
                        reportBytes - connectionState->requestExtract.size()
                    )
                );
            }
            std::shared_ptr< Request > request;
            try {
                request = TryRequestAssembly(*connectionState);
            } catch (const std::exception& e) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "Request: Unable to parse request from %s: %s",
                    connectionState->connection->GetPeerId().c_str(),
                    e.what()
                );
                IssueResponse(connectionState, Response::MakeError(500, e.what()));
                return;
            }
            if (request == nullptr) {
                return;
            }
            connectionState->acceptingRequests = false;
            if (
                (request->state == Request::State::Complete)
                && request->valid
            ) {
                request->remoteAddress = connectionState->connection->GetPeerAddress();
                request->serverName = serverName;
                request->serverPort = SystemAbstractions::sprintf("%" PRIu16, serverPort);
                const auto response = HandleRequest(*request);
                ReportRequest(
                    *request,
                    response,
                    connectionState->connection->GetPeerId()
                );
                IssueResponse(connectionState, response);
            } else {
                ReportBadRequest(*connectionState);
                IssueResponse(
                    connectionState,
                    Response::MakeError(
                        request->responseStatusCode,
                        (
                            (request->responseStatusCode == 413)
                            ? "The request body is too large."
                            : "The request could not be understood."
                        )
                    )
                );
            }
        }

        /**
         * This method is called when a new connection has been
         * established for the server.
         *
         * @param[in] connection
         *     This is the new connection has been established for the server.
         *
         * @return
         *     A delegate to be called when the connection is ready to be used
         *     is returned.
         */
        ServerTransport::ConnectionReadyDelegate NewConnection(std::shared_ptr< Connection > connection) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2, "New connection from %s",
                connection->GetPeerId().c_str()
            );
            const auto connectionState = std::make_shared< ConnectionState >();
            connectionState->connection = connection;
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                (void)activeConnections.insert(connectionState);
            }
            std::weak_ptr< ConnectionState > connectionStateWeak(connectionState);
            connection->SetDataReceivedDelegate(
                [this, connectionStateWeak](const std::vector< uint8_t >& data){
                    const auto connectionState = connectionStateWeak.lock();
                    if (connectionState == nullptr) {
                        return;
                    }
                    DataReceived(connectionState, data);
                }
            );
            connection->SetBrokenDelegate(
                [this, connectionStateWeak](bool){
                    const auto connectionState = connectionStateWeak.lock();
                    if (
                        (connectionState == nullptr)
                        || connectionState->closed
                    ) {
                        return;
                    }
                    connectionState->acceptingRequests = false;
                    connectionState->closed = true;
                    OnConnectionBroken(connectionState, "broken by peer");
                }
            );
            return nullptr;
        }

        /**
         * This method registers the given route, unless the server
         * is already mobilized.
         *
         * @param[in] route
         *     This is the route to register.
         *
         * @return
         *     An indication of whether or not the route was registered
         *     is returned.
         */
        bool RegisterRoute(const RouteTable::Route& route) {
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (mobilized) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Unable to register %s '%s': server is already mobilized",
                        route.method.c_str(),
                        route.pattern.c_str()
                    );
                    return false;
                }
            }
            if (!routes.Register(route)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Unable to register %s '%s': invalid route",
                    route.method.c_str(),
                    route.pattern.c_str()
                );
                return false;
            }
            return true;
        }
    };

    Server::~Server() {
        Demobilize();
    }

    Server::Server()
        : impl_(new Impl)
    {
        impl_->server = this;
        impl_->configuration["Host"] = impl_->host;
        impl_->configuration["Port"] = SystemAbstractions::sprintf("%" PRIu16, impl_->port);
        impl_->configuration["HeaderLineLimit"] = SystemAbstractions::sprintf("%zu", impl_->parsingLimits.headerLineLimit);
        impl_->configuration["MaxContentLength"] = SystemAbstractions::sprintf("%" PRIdMAX, impl_->parsingLimits.maxContentLength);
        impl_->configuration["BadRequestReportBytes"] = SystemAbstractions::sprintf("%zu", impl_->badRequestReportBytes);
    }

    bool Server::Mobilize(const MobilizationDependencies& deps) {
        std::string host;
        uint16_t port;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (
                impl_->mobilized
                || (deps.transport == nullptr)
            ) {
                return false;
            }
            impl_->mobilized = true;
            host = impl_->host;
            port = impl_->port;
        }
        impl_->transport = deps.transport;
        if (
            !impl_->transport->BindNetwork(
                host,
                port,
                [this](std::shared_ptr< Connection > connection){
                    return impl_->NewConnection(connection);
                }
            )
        ) {
            impl_->transport = nullptr;
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->mobilized = false;
            return false;
        }
        port = impl_->transport->GetBoundPort();
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->port = port;
            impl_->configuration["Port"] = SystemAbstractions::sprintf("%" PRIu16, port);
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3, "Now listening on %s port %" PRIu16,
            host.c_str(),
            port
        );
        return true;
    }

    void Server::Demobilize() {
        if (impl_->transport != nullptr) {
            impl_->transport->ReleaseNetwork();
            impl_->transport = nullptr;
        }
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->activeConnections.clear();
        impl_->mobilized = false;
    }

    auto Server::ParseRequest(const std::string& rawRequest) -> std::shared_ptr< Request > {
        size_t messageEnd;
        return ParseRequest(rawRequest, messageEnd);
    }

    auto Server::ParseRequest(
        const std::string& rawRequest,
        size_t& messageEnd
    ) -> std::shared_ptr< Request > {
        auto request = std::make_shared< Request >();
        messageEnd = impl_->ParseRequest(*request, rawRequest);
        if (request->IsCompleteOrError()) {
            return request;
        } else {
            return nullptr;
        }
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Server::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    std::string Server::GetConfigurationItem(const std::string& key) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entry = impl_->configuration.find(key);
        if (entry == impl_->configuration.end()) {
            return "";
        } else {
            return entry->second;
        }
    }

    void Server::SetConfigurationItem(
        const std::string& key,
        const std::string& value
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->configuration[key] = value;
        if (key == "Host") {
            if (impl_->host != value) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    0, "Host changed from %s to %s",
                    impl_->host.c_str(),
                    value.c_str()
                );
                impl_->host = value;
            }
        } else if (key == "Port") {
            impl_->ParseConfigurationItem(impl_->port, "%" SCNu16, "%" PRIu16, "Port number", value);
        } else if (key == "HeaderLineLimit") {
            impl_->ParseConfigurationItem(impl_->parsingLimits.headerLineLimit, "%zu", "%zu", "Header line limit", value);
        } else if (key == "MaxContentLength") {
            impl_->ParseConfigurationItem(impl_->parsingLimits.maxContentLength, "%" SCNdMAX, "%" PRIdMAX, "Maximum content length", value);
        } else if (key == "BadRequestReportBytes") {
            impl_->ParseConfigurationItem(impl_->badRequestReportBytes, "%zu", "%zu", "Bad request report bytes", value);
        }
    }

    bool Server::AddMiddleware(Middleware middleware) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (middleware == nullptr) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Unable to add middleware: it is empty"
            );
            return false;
        }
        if (impl_->mobilized) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Unable to add middleware: server is already mobilized"
            );
            return false;
        }
        impl_->middlewares.push_back(middleware);
        return true;
    }

    bool Server::RegisterRoute(
        const std::string& path,
        const std::string& method,
        Handler handler,
        const std::vector< Middleware >& middlewares,
        const std::string& name
    ) {
        RouteTable::Route route;
        route.pattern = path;
        route.method = method;
        route.handler = handler;
        route.middlewares = middlewares;
        route.name = name;
        return impl_->RegisterRoute(route);
    }

    bool Server::RegisterResource(
        const std::string& path,
        const ResourceHandlers& handlers,
        const std::vector< Middleware >& middlewares
    ) {
        bool allRegistered = true;
        for (const auto& handler: handlers) {
            if (!RegisterRoute(path, handler.first, handler.second, middlewares)) {
                allRegistered = false;
            }
        }
        return allRegistered;
    }

    std::string Server::UrlFor(
        const std::string& name,
        const std::map< std::string, std::string >& values
    ) {
        return impl_->routes.UrlFor(name, values);
    }

}
