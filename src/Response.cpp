/**
 * @file Response.cpp
 *
 * This module contains the implementation of the LiveRocket::Response structure.
 *
 * © 2018 by Richard Walters
 */

#include <LiveRocket/Response.hpp>
#include <sstream>
#include <stdlib.h>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This returns the reason phrase the server uses for the given
     * status code in the error responses it makes itself.
     *
     * @param[in] statusCode
     *     This is the status code for which to find a reason phrase.
     *
     * @return
     *     The reason phrase for the status code is returned.
     */
    std::string ErrorReasonPhrase(unsigned int statusCode) {
        switch (statusCode) {
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 413: return "Payload Too Large";
            case 500: return "Internal Server Error";
            default: return "Error";
        }
    }

}

namespace LiveRocket {

    Response::Response() {
        headers.SetHeader("Content-Type", "text/plain");
    }

    void Response::Send(
        const std::string& text,
        const std::string& newStatus
    ) {
        body = text;
        status = newStatus;
    }

    void Response::Send(
        const std::string& text,
        unsigned int statusCode
    ) {
        Send(text, SystemAbstractions::sprintf("%u OK", statusCode));
    }

    void Response::SetContentType(const std::string& contentType) {
        headers.SetHeader("Content-Type", contentType);
    }

    void Response::Redirect(
        const std::string& location,
        bool permanent
    ) {
        status = (permanent ? "301 Moved Permanently" : "302 Found");
        headers = MessageHeaders::MessageHeaders();
        headers.SetHeader("Location", location);
        body = "Redirecting to " + location;
    }

    unsigned int Response::GetStatusCode() const {
        return (unsigned int)strtoul(status.c_str(), NULL, 10);
    }

    std::string Response::Generate() const {
        auto headersToSend = headers;
        if (!headersToSend.HasHeader("Content-Length")) {
            headersToSend.AddHeader(
                "Content-Length",
                SystemAbstractions::sprintf("%zu", body.length())
            );
        }
        if (headersToSend.HasHeader("Connection")) {
            headersToSend.SetHeader("Connection", "close");
        } else {
            headersToSend.AddHeader("Connection", "close");
        }
        std::ostringstream builder;
        builder << "HTTP/1.1 " << status << "\r\n";
        builder << headersToSend.GenerateRawHeaders();
        builder << body;
        return builder.str();
    }

    Response Response::MakeError(
        unsigned int statusCode,
        const std::string& message
    ) {
        Response response;
        response.status = SystemAbstractions::sprintf(
            "%u %s",
            statusCode,
            ErrorReasonPhrase(statusCode).c_str()
        );
        response.SetContentType("text/html");
        response.body = (
            "<h1>" + response.status + "</h1>\n"
            + "<p>" + message + "</p>"
        );
        return response;
    }

}
