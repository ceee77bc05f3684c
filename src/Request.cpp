/**
 * @file Request.cpp
 *
 * This module contains the implementation of the LiveRocket::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include <ctype.h>
#include <LiveRocket/Request.hpp>

namespace LiveRocket {

    bool Request::IsCompleteOrError() const {
        return (
            (state == State::Complete)
            || (state == State::Error)
        );
    }

    std::string Request::GetQueryParam(
        const std::string& key,
        const std::string& defaultValue
    ) const {
        const auto entry = query.find(key);
        if (entry == query.end()) {
            return defaultValue;
        } else {
            return entry->second;
        }
    }

    nlohmann::json Request::GetBodyParam(
        const std::string& key,
        const nlohmann::json& defaultValue
    ) const {
        if (!data.is_object()) {
            return defaultValue;
        }
        const auto entry = data.find(key);
        if (entry == data.end()) {
            return defaultValue;
        } else {
            return *entry;
        }
    }

    std::string Request::GetHeader(
        const std::string& normalizedName,
        const std::string& defaultValue
    ) const {
        const auto entry = environment.find(normalizedName);
        if (entry == environment.end()) {
            return defaultValue;
        } else {
            return entry->second;
        }
    }

    std::string Request::NormalizeHeaderName(const std::string& headerName) {
        std::string normalizedName;
        normalizedName.reserve(headerName.length());
        for (auto c: headerName) {
            if (c == '-') {
                normalizedName.push_back('_');
            } else {
                normalizedName.push_back((char)toupper((unsigned char)c));
            }
        }
        return normalizedName;
    }

    void PrintTo(
        const Request::State& state,
        std::ostream* os
    ) {
        switch (state) {
            case Request::State::RequestLine: {
                *os << "Constructing Request line";
            } break;
            case Request::State::Headers: {
                *os << "Constructing Headers";
            } break;
            case Request::State::Body: {
                *os << "Constructing Body";
            } break;
            case Request::State::Complete: {
                *os << "COMPLETE";
            } break;
            case Request::State::Error: {
                *os << "ERROR";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const Request::BodyType& bodyType,
        std::ostream* os
    ) {
        switch (bodyType) {
            case Request::BodyType::None: {
                *os << "None";
            } break;
            case Request::BodyType::Form: {
                *os << "Form";
            } break;
            case Request::BodyType::Json: {
                *os << "Json";
            } break;
            case Request::BodyType::Raw: {
                *os << "Raw";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
