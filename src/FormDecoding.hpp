#ifndef LIVE_ROCKET_FORM_DECODING_HPP
#define LIVE_ROCKET_FORM_DECODING_HPP

/**
 * @file FormDecoding.hpp
 *
 * This module declares the LiveRocket::DecodeFormFields function
 * and its friends.
 *
 * © 2018 by Richard Walters
 */

#include <string>
#include <utility>
#include <vector>

namespace LiveRocket {

    /**
     * This is a single name/value pair decoded from a query string
     * or form body.
     */
    typedef std::pair< std::string, std::string > FormField;

    /**
     * This function replaces each percent-encoded octet in the given
     * string with the octet it encodes.  Malformed escapes are left
     * as they are.
     *
     * @param[in] encoded
     *     This is the string to decode.
     *
     * @param[in] plusIsSpace
     *     This indicates whether or not '+' characters should be
     *     decoded as spaces, as they are in forms.
     *
     * @return
     *     The decoded string is returned.
     */
    std::string PercentDecode(
        const std::string& encoded,
        bool plusIsSpace
    );

    /**
     * This function decodes the given "application/x-www-form-urlencoded"
     * string (which is also the format of query strings) into its fields,
     * in the order they appear.  Fields with empty values are dropped.
     *
     * @param[in] encoded
     *     This is the string to decode.
     *
     * @return
     *     The decoded fields are returned.
     */
    std::vector< FormField > DecodeFormFields(const std::string& encoded);

}

#endif /* LIVE_ROCKET_FORM_DECODING_HPP */
