#ifndef LIVE_ROCKET_RESPONSE_HPP
#define LIVE_ROCKET_RESPONSE_HPP

/**
 * @file Response.hpp
 *
 * This module declares the LiveRocket::Response structure.
 *
 * © 2018 by Richard Walters
 */

#include <MessageHeaders/MessageHeaders.hpp>
#include <string>

namespace LiveRocket {

    /**
     * This represents an overall HTTP response given to a client,
     * decomposed into its various elements.  Handlers fill one in,
     * and the server turns it into the bytes sent back to the client.
     */
    struct Response {
        // Properties

        /**
         * This is the status of the response, in the form
         * "<code> <reason>", such as "200 OK".
         */
        std::string status = "200 OK";

        /**
         * These are the message headers to include in the response,
         * in the order they should be sent.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * This is the body of the response, if there is a body.
         */
        std::string body;

        // Methods

        /**
         * This is the default constructor.  The response starts out
         * as an empty "200 OK" plain text response.
         */
        Response();

        /**
         * This method sets the body and status of the response.
         *
         * @param[in] text
         *     This is the body of the response.
         *
         * @param[in] newStatus
         *     This is the status of the response, including the
         *     reason phrase, such as "201 Created".
         */
        void Send(
            const std::string& text,
            const std::string& newStatus = "200 OK"
        );

        /**
         * This method sets the body and status of the response.
         * The status is formed by appending " OK" to the code,
         * so callers wanting a different reason phrase should
         * use the other overload.
         *
         * @param[in] text
         *     This is the body of the response.
         *
         * @param[in] statusCode
         *     This is the numeric status code of the response.
         */
        void Send(
            const std::string& text,
            unsigned int statusCode
        );

        /**
         * This method sets the Content-Type header of the response,
         * replacing any value it had before.
         *
         * @param[in] contentType
         *     This is the new content type of the response.
         */
        void SetContentType(const std::string& contentType);

        /**
         * This method turns the response into a redirection
         * to the given location.
         *
         * @param[in] location
         *     This is where the client should go instead.
         *
         * @param[in] permanent
         *     This indicates whether to issue "301 Moved Permanently"
         *     rather than "302 Found".
         */
        void Redirect(
            const std::string& location,
            bool permanent = false
        );

        /**
         * This method returns the numeric code at the start of the status.
         *
         * @return
         *     The numeric status code is returned.
         *
         * @retval 0
         *     This is returned if the status doesn't start with a number.
         */
        unsigned int GetStatusCode() const;

        /**
         * This method generates the data to transmit to the client
         * to return this response to the client.  A Content-Length
         * header is added if the response doesn't have one, and
         * the connection is always marked to be closed.
         *
         * @return
         *     The data to transmit to the client to return
         *     this response to the client is returned.
         */
        std::string Generate() const;

        /**
         * This function constructs the response the server gives
         * when it can't let a handler answer a request.
         *
         * @param[in] statusCode
         *     This is the numeric status code of the response.
         *
         * @param[in] message
         *     This is the explanation to include in the body.
         *
         * @return
         *     The error response is returned.
         */
        static Response MakeError(
            unsigned int statusCode,
            const std::string& message
        );
    };

}

#endif /* LIVE_ROCKET_RESPONSE_HPP */
