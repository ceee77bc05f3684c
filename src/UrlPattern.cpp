/**
 * @file UrlPattern.cpp
 *
 * This module contains the implementation of the LiveRocket::UrlPattern class.
 *
 * © 2018 by Richard Walters
 */

#include <errno.h>
#include <functional>
#include <LiveRocket/UrlPattern.hpp>
#include <set>
#include <stdlib.h>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * These are the characters which have special meaning
     * in a regular expression.
     */
    const std::string REGEX_SPECIAL_CHARACTERS("\\^$.|?*+()[]{}");

    /**
     * This is the type of function called for each piece of literal
     * text found while scanning a route template.
     *
     * @param[in] literal
     *     This is the literal text.
     */
    typedef std::function< void(const std::string& literal) > LiteralDelegate;

    /**
     * This is the type of function called for each placeholder
     * found while scanning a route template.
     *
     * @param[in] placeholder
     *     This describes the placeholder.
     *
     * @param[in] token
     *     This is the placeholder exactly as it appears in the template.
     */
    typedef std::function<
        void(
            const LiveRocket::UrlPattern::Placeholder& placeholder,
            const std::string& token
        )
    > PlaceholderDelegate;

    /**
     * This function converts the given placeholder type name
     * into the equivalent type.  Unknown type names are
     * treated as "string".
     *
     * @param[in] typeName
     *     This is the placeholder type name to convert.
     *
     * @return
     *     The placeholder type is returned.
     */
    LiveRocket::PathParameter::Type ParseType(const std::string& typeName) {
        if (typeName == "int") {
            return LiveRocket::PathParameter::Type::Int;
        } else if (typeName == "float") {
            return LiveRocket::PathParameter::Type::Float;
        } else if (typeName == "path") {
            return LiveRocket::PathParameter::Type::Path;
        } else if (typeName == "uuid") {
            return LiveRocket::PathParameter::Type::Uuid;
        } else {
            return LiveRocket::PathParameter::Type::String;
        }
    }

    /**
     * This function returns the regular expression which captures
     * a value for a placeholder of the given type.
     *
     * @param[in] type
     *     This is the placeholder type.
     *
     * @return
     *     The capturing regular expression is returned.
     */
    std::string CaptureExpression(LiveRocket::PathParameter::Type type) {
        switch (type) {
            case LiveRocket::PathParameter::Type::Int: {
                return "([0-9]+)";
            }
            case LiveRocket::PathParameter::Type::Float: {
                return "([0-9]+\\.?[0-9]*)";
            }
            case LiveRocket::PathParameter::Type::Path: {
                return "(.+)";
            }
            case LiveRocket::PathParameter::Type::Uuid: {
                return (
                    "([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}"
                    "-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})"
                );
            }
            case LiveRocket::PathParameter::Type::String:
            default: {
                return "([^/]+)";
            }
        }
    }

    /**
     * This function escapes all characters in the given text
     * which would otherwise have special meaning in a regular
     * expression.
     *
     * @param[in] literal
     *     This is the text to escape.
     *
     * @return
     *     The escaped text is returned.
     */
    std::string EscapeLiteral(const std::string& literal) {
        std::string escaped;
        for (auto c: literal) {
            if (REGEX_SPECIAL_CHARACTERS.find(c) != std::string::npos) {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }

    /**
     * This function breaks the given route template into literal
     * text and placeholders, from left to right.
     *
     * @param[in] pattern
     *     This is the route template to scan.
     *
     * @param[in] literalDelegate
     *     This is the function to call for each piece of literal text.
     *
     * @param[in] placeholderDelegate
     *     This is the function to call for each placeholder.
     */
    void ScanPattern(
        const std::string& pattern,
        LiteralDelegate literalDelegate,
        PlaceholderDelegate placeholderDelegate
    ) {
        size_t offset = 0;
        std::string literal;
        while (offset < pattern.length()) {
            const auto open = pattern.find('<', offset);
            if (open == std::string::npos) {
                break;
            }
            const auto close = pattern.find('>', open + 1);
            if (close == std::string::npos) {
                break;
            }
            const auto content = pattern.substr(open + 1, close - open - 1);
            if (
                content.empty()
                || (content.find('<') != std::string::npos)
            ) {
                literal += pattern.substr(offset, open + 1 - offset);
                offset = open + 1;
                continue;
            }
            literal += pattern.substr(offset, open - offset);
            if (!literal.empty()) {
                literalDelegate(literal);
                literal.clear();
            }
            LiveRocket::UrlPattern::Placeholder placeholder;
            const auto typeDelimiter = content.find(':');
            if (
                (typeDelimiter != std::string::npos)
                && (typeDelimiter > 0)
                && (typeDelimiter + 1 < content.length())
            ) {
                placeholder.type = ParseType(content.substr(0, typeDelimiter));
                placeholder.name = content.substr(typeDelimiter + 1);
            } else {
                placeholder.type = LiveRocket::PathParameter::Type::String;
                placeholder.name = content;
            }
            placeholderDelegate(placeholder, pattern.substr(open, close - open + 1));
            offset = close + 1;
        }
        literal += pattern.substr(offset);
        if (!literal.empty()) {
            literalDelegate(literal);
        }
    }

    /**
     * This function converts the text captured for a placeholder
     * into a path parameter of the placeholder's type.
     *
     * @param[in] type
     *     This is the placeholder type.
     *
     * @param[in] text
     *     This is the text captured for the placeholder.
     *
     * @param[out] parameter
     *     This is where to store the converted value.
     *
     * @return
     *     An indication of whether or not the conversion
     *     succeeded is returned.
     */
    bool ConvertParameter(
        LiveRocket::PathParameter::Type type,
        const std::string& text,
        LiveRocket::PathParameter& parameter
    ) {
        parameter.type = type;
        parameter.text = text;
        switch (type) {
            case LiveRocket::PathParameter::Type::Int: {
                if (
                    SystemAbstractions::ToInteger(text, parameter.integer)
                    != SystemAbstractions::ToIntegerResult::Success
                ) {
                    return false;
                }
            } break;

            case LiveRocket::PathParameter::Type::Float: {
                if (text.empty()) {
                    return false;
                }
                char* end = nullptr;
                errno = 0;
                parameter.real = strtod(text.c_str(), &end);
                if (
                    (errno == ERANGE)
                    || (end != text.c_str() + text.length())
                ) {
                    return false;
                }
            } break;

            default: break;
        }
        return true;
    }

}

namespace LiveRocket {

    void PrintTo(
        const PathParameter::Type& type,
        std::ostream* os
    ) {
        switch (type) {
            case PathParameter::Type::String: {
                *os << "string";
            } break;
            case PathParameter::Type::Int: {
                *os << "int";
            } break;
            case PathParameter::Type::Float: {
                *os << "float";
            } break;
            case PathParameter::Type::Path: {
                *os << "path";
            } break;
            case PathParameter::Type::Uuid: {
                *os << "uuid";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    bool UrlPattern::HasPlaceholders(const std::string& pattern) {
        return (
            (pattern.find('<') != std::string::npos)
            && (pattern.find('>') != std::string::npos)
        );
    }

    bool UrlPattern::Compile(const std::string& pattern) {
        std::string expression("^");
        std::vector< Placeholder > placeholders;
        std::set< std::string > names;
        bool duplicateName = false;
        ScanPattern(
            pattern,
            [&expression](const std::string& literal){
                expression += EscapeLiteral(literal);
            },
            [&](const Placeholder& placeholder, const std::string&){
                if (!names.insert(placeholder.name).second) {
                    duplicateName = true;
                }
                expression += CaptureExpression(placeholder.type);
                placeholders.push_back(placeholder);
            }
        );
        if (duplicateName) {
            return false;
        }
        expression += "$";
        try {
            matcher_ = std::regex(expression);
        } catch (const std::regex_error&) {
            return false;
        }
        pattern_ = pattern;
        placeholders_ = std::move(placeholders);
        return true;
    }

    bool UrlPattern::Match(
        const std::string& path,
        PathParameters& parameters
    ) const {
        if (placeholders_.empty()) {
            if (path == pattern_) {
                parameters.clear();
                return true;
            }
            return false;
        }
        std::smatch groups;
        if (!std::regex_match(path, groups, matcher_)) {
            return false;
        }
        PathParameters extracted;
        for (size_t i = 0; i < placeholders_.size(); ++i) {
            PathParameter parameter;
            if (
                !ConvertParameter(
                    placeholders_[i].type,
                    groups[i + 1].str(),
                    parameter
                )
            ) {
                return false;
            }
            extracted[placeholders_[i].name] = parameter;
        }
        parameters = std::move(extracted);
        return true;
    }

    std::string UrlPattern::BuildPath(const std::map< std::string, std::string >& values) const {
        std::string path;
        ScanPattern(
            pattern_,
            [&path](const std::string& literal){
                path += literal;
            },
            [&path, &values](const Placeholder& placeholder, const std::string& token){
                const auto value = values.find(placeholder.name);
                if (value == values.end()) {
                    path += token;
                } else {
                    path += value->second;
                }
            }
        );
        return path;
    }

    const std::string& UrlPattern::GetPattern() const {
        return pattern_;
    }

    auto UrlPattern::GetPlaceholders() const -> const std::vector< Placeholder >& {
        return placeholders_;
    }

}
