#ifndef LIVE_ROCKET_REQUEST_HPP
#define LIVE_ROCKET_REQUEST_HPP

/**
 * @file Request.hpp
 *
 * This module declares the LiveRocket::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <MessageHeaders/MessageHeaders.hpp>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <Uri/Uri.hpp>

namespace LiveRocket {

    /**
     * This represents an overall HTTP request received by the server,
     * decomposed into its various elements.
     */
    struct Request {
        // Types

        /**
         * This type is used to track how much of the request
         * has been constructed so far.
         */
        enum class State {
            /**
             * In this state, we're still waiting to construct
             * the full request line.
             */
            RequestLine,

            /**
             * In this state, we've constructed the request
             * line, and possibly some header lines, but haven't yet
             * constructed all of the header lines.
             */
            Headers,

            /**
             * In this state, we've constructed the request
             * line and headers, and possibly some of the body, but
             * haven't yet constructed all of the body.
             */
            Body,

            /**
             * In this state, the request is either fully constructed
             * or is invalid in a way which still let us find its end.
             */
            Complete,

            /**
             * In this state, the request could not be constructed,
             * and it would be impossible or unlikely to find the end
             * of it.
             */
            Error,
        };

        /**
         * This identifies how the body of the request was interpreted.
         */
        enum class BodyType {
            /**
             * The request had no body.
             */
            None,

            /**
             * The body was decoded from
             * "application/x-www-form-urlencoded" into the data member.
             */
            Form,

            /**
             * The body was decoded from "application/json"
             * into the data member.
             */
            Json,

            /**
             * The body is only available in its raw form.
             */
            Raw,
        };

        // Properties

        /**
         * This flag indicates whether or not the request
         * has passed all validity checks.
         */
        bool valid = true;

        /**
         * This indicates the request method to be performed on the
         * target resource.
         */
        std::string method;

        /**
         * This identifies the target resource upon which to apply
         * the request.
         */
        Uri::Uri target;

        /**
         * This is the protocol identifier given on the request line.
         */
        std::string protocol;

        /**
         * This is the percent-decoded path of the target resource.
         */
        std::string path;

        /**
         * This is the query string portion of the request target,
         * exactly as it was received.
         */
        std::string queryString;

        /**
         * These are the decoded query parameters.  When a key appears
         * more than once, the last value wins.
         */
        std::map< std::string, std::string > query;

        /**
         * These are the message headers that were included
         * in the request.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * These are the message header values, keyed by the header
         * names converted to upper case with hyphens replaced by
         * underscores, such as "CONTENT_TYPE".
         */
        std::map< std::string, std::string > environment;

        /**
         * This is the address of the peer which sent the request.
         */
        std::string remoteAddress;

        /**
         * This is the host name of the server which received the request.
         */
        std::string serverName;

        /**
         * This is the port number of the server which received the request.
         */
        std::string serverPort;

        /**
         * This is the body of the request, if there is a body,
         * in its raw form.
         */
        std::string body;

        /**
         * This indicates how the body was interpreted.
         */
        BodyType bodyType = BodyType::None;

        /**
         * This holds the decoded form fields or JSON value of the body,
         * depending on bodyType.  Form fields which appear more than
         * once are held as arrays of strings.
         */
        nlohmann::json data = nlohmann::json::object();

        /**
         * These are annotations attached to the request by middleware.
         */
        std::map< std::string, std::string > attributes;

        /**
         * This indicates whether or not the request
         * passed all validity checks when it was parsed.
         */
        State state = State::RequestLine;

        /**
         * This is the status code to return if the request
         * could not be parsed.
         */
        unsigned int responseStatusCode = 400;

        // Methods

        /**
         * This method returns an indication of whether or not the request
         * has been fully constructed (valid or not).
         *
         * @return
         *     An indication of whether or not the request
         *     has been fully constructed (valid or not) is returned.
         */
        bool IsCompleteOrError() const;

        /**
         * This method returns the value of the given query parameter.
         *
         * @param[in] key
         *     This is the name of the query parameter to look up.
         *
         * @param[in] defaultValue
         *     This is the value to return if the query parameter
         *     is not present.
         *
         * @return
         *     The value of the query parameter is returned.
         */
        std::string GetQueryParam(
            const std::string& key,
            const std::string& defaultValue = ""
        ) const;

        /**
         * This method returns the value of the given field
         * of the decoded body.
         *
         * @param[in] key
         *     This is the name of the body field to look up.
         *
         * @param[in] defaultValue
         *     This is the value to return if the body was not decoded
         *     into an object or has no such field.
         *
         * @return
         *     The value of the body field is returned.
         */
        nlohmann::json GetBodyParam(
            const std::string& key,
            const nlohmann::json& defaultValue = nullptr
        ) const;

        /**
         * This method returns the value of the given header,
         * looked up by its normalized name (e.g. "USER_AGENT").
         *
         * @param[in] normalizedName
         *     This is the normalized name of the header to look up.
         *
         * @param[in] defaultValue
         *     This is the value to return if the header is not present.
         *
         * @return
         *     The value of the header is returned.
         */
        std::string GetHeader(
            const std::string& normalizedName,
            const std::string& defaultValue = ""
        ) const;

        /**
         * This function converts the given header name into the form
         * used as keys of the environment member.
         *
         * @param[in] headerName
         *     This is the header name to normalize.
         *
         * @return
         *     The normalized header name is returned.
         */
        static std::string NormalizeHeaderName(const std::string& headerName);
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Request::State class.
     *
     * @param[in] state
     *     This is the server request state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     server request state value.
     */
    void PrintTo(
        const Request::State& state,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Request::BodyType class.
     *
     * @param[in] bodyType
     *     This is the request body type value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     request body type value.
     */
    void PrintTo(
        const Request::BodyType& bodyType,
        std::ostream* os
    );

}

#endif /* LIVE_ROCKET_REQUEST_HPP */
