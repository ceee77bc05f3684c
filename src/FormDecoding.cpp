/**
 * @file FormDecoding.cpp
 *
 * This module contains the implementation of the LiveRocket::DecodeFormFields
 * function and its friends.
 *
 * © 2018 by Richard Walters
 */

#include "FormDecoding.hpp"

namespace {

    /**
     * This function returns the value of the given hexadecimal digit.
     *
     * @param[in] c
     *     This is the character holding the hexadecimal digit.
     *
     * @return
     *     The value of the digit is returned.
     *
     * @retval -1
     *     This is returned if the character is not a hexadecimal digit.
     */
    int HexDigitValue(char c) {
        if ((c >= '0') && (c <= '9')) {
            return c - '0';
        } else if ((c >= 'a') && (c <= 'f')) {
            return c - 'a' + 10;
        } else if ((c >= 'A') && (c <= 'F')) {
            return c - 'A' + 10;
        } else {
            return -1;
        }
    }

}

namespace LiveRocket {

    std::string PercentDecode(
        const std::string& encoded,
        bool plusIsSpace
    ) {
        std::string decoded;
        decoded.reserve(encoded.length());
        for (size_t i = 0; i < encoded.length(); ++i) {
            const auto c = encoded[i];
            if (
                (c == '%')
                && (i + 2 < encoded.length())
            ) {
                const auto high = HexDigitValue(encoded[i + 1]);
                const auto low = HexDigitValue(encoded[i + 2]);
                if ((high >= 0) && (low >= 0)) {
                    decoded.push_back((char)((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            if (
                plusIsSpace
                && (c == '+')
            ) {
                decoded.push_back(' ');
            } else {
                decoded.push_back(c);
            }
        }
        return decoded;
    }

    std::vector< FormField > DecodeFormFields(const std::string& encoded) {
        std::vector< FormField > fields;
        size_t offset = 0;
        while (offset <= encoded.length()) {
            auto fieldEnd = encoded.find('&', offset);
            if (fieldEnd == std::string::npos) {
                fieldEnd = encoded.length();
            }
            const auto field = encoded.substr(offset, fieldEnd - offset);
            offset = fieldEnd + 1;
            const auto delimiter = field.find('=');
            if (delimiter == std::string::npos) {
                continue;
            }
            const auto value = PercentDecode(field.substr(delimiter + 1), true);
            if (value.empty()) {
                continue;
            }
            fields.emplace_back(
                PercentDecode(field.substr(0, delimiter), true),
                value
            );
        }
        return fields;
    }

}
