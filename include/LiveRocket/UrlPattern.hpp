#ifndef LIVE_ROCKET_URL_PATTERN_HPP
#define LIVE_ROCKET_URL_PATTERN_HPP

/**
 * @file UrlPattern.hpp
 *
 * This module declares the LiveRocket::UrlPattern class.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <ostream>
#include <regex>
#include <stdint.h>
#include <string>
#include <vector>

namespace LiveRocket {

    /**
     * This holds the value of one parameter extracted from a request
     * path by a UrlPattern.
     */
    struct PathParameter {
        // Types

        /**
         * These are the kinds of placeholder a route template may contain.
         */
        enum class Type {
            /**
             * One or more characters other than '/'.
             */
            String,

            /**
             * One or more decimal digits, converted to an integer.
             */
            Int,

            /**
             * Decimal digits with an optional fractional part,
             * converted to a floating-point number.
             */
            Float,

            /**
             * One or more characters, including '/'.
             */
            Path,

            /**
             * A UUID in its canonical 8-4-4-4-12 hexadecimal form.
             */
            Uuid,
        };

        // Properties

        /**
         * This is the type of placeholder which captured the value.
         */
        Type type = Type::String;

        /**
         * This is the value exactly as it appeared in the path.
         */
        std::string text;

        /**
         * This is the value converted to an integer, if the type is Int.
         */
        intmax_t integer = 0;

        /**
         * This is the value converted to a floating-point number,
         * if the type is Float.
         */
        double real = 0.0;
    };

    /**
     * This maps the names of the placeholders of a route template
     * to the values extracted for them from a request path.
     */
    typedef std::map< std::string, PathParameter > PathParameters;

    /**
     * This is a support function for Google Test to print out
     * values of the PathParameter::Type class.
     *
     * @param[in] type
     *     This is the path parameter type value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     path parameter type value.
     */
    void PrintTo(
        const PathParameter::Type& type,
        std::ostream* os
    );

    /**
     * This represents a route template, such as "/users/<int:id>",
     * compiled into a form which can match request paths
     * and extract the values of the placeholders.
     */
    class UrlPattern {
        // Types
    public:
        /**
         * This describes one placeholder of the template.
         */
        struct Placeholder {
            /**
             * This is the name of the placeholder.
             */
            std::string name;

            /**
             * This is the type of the placeholder.
             */
            PathParameter::Type type;
        };

        // Public methods
    public:
        /**
         * This function determines whether or not the given route
         * template contains placeholder syntax.
         *
         * @param[in] pattern
         *     This is the route template to check.
         *
         * @return
         *     An indication of whether or not the route template
         *     contains placeholder syntax is returned.
         */
        static bool HasPlaceholders(const std::string& pattern);

        /**
         * This method compiles the given route template.
         * Each "<name>" or "<type:name>" placeholder is matched
         * according to its type (unknown types and a missing type
         * are treated as "string"), and everything else is
         * matched literally.  The whole path must match.
         *
         * @param[in] pattern
         *     This is the route template to compile.
         *
         * @return
         *     An indication of whether or not the route template
         *     was compiled successfully is returned.  It fails
         *     if two placeholders have the same name.
         */
        bool Compile(const std::string& pattern);

        /**
         * This method attempts to match the given request path.
         *
         * @param[in] path
         *     This is the decoded request path to match.
         *
         * @param[out] parameters
         *     This is where to store the values of the placeholders,
         *     if the path matches.
         *
         * @return
         *     An indication of whether or not the path matched
         *     is returned.
         */
        bool Match(
            const std::string& path,
            PathParameters& parameters
        ) const;

        /**
         * This method constructs a path by substituting the given values
         * for the placeholders of the template.  Placeholders for which
         * no value is given are left in place.
         *
         * @param[in] values
         *     These are the values to substitute, keyed by
         *     placeholder name.
         *
         * @return
         *     The constructed path is returned.
         */
        std::string BuildPath(const std::map< std::string, std::string >& values) const;

        /**
         * This method returns the route template which was compiled.
         *
         * @return
         *     The route template which was compiled is returned.
         */
        const std::string& GetPattern() const;

        /**
         * This method returns the placeholders of the template,
         * in the order they appear.
         *
         * @return
         *     The placeholders of the template are returned.
         */
        const std::vector< Placeholder >& GetPlaceholders() const;

        // Private properties
    private:
        /**
         * This is the route template which was compiled.
         */
        std::string pattern_;

        /**
         * These are the placeholders of the template, in the order
         * their capture groups appear in the matcher.
         */
        std::vector< Placeholder > placeholders_;

        /**
         * This is the regular expression equivalent to the template.
         */
        std::regex matcher_;
    };

}

#endif /* LIVE_ROCKET_URL_PATTERN_HPP */
