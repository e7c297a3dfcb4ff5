/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <random>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "libdepot/Error.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libdepot {
namespace string {

std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        auto randomCharacter = 'a' + dist(generator);
        string[i] = randomCharacter;
    }

    return string;
}

static int hexValue(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/**
 * Decodes the percent-encoded octets of a URI component (RFC 3986).
 * A '+' is decoded as a space, as done for form-encoded query strings.
 */
std::string percentDecode(const std::string& input) {
    auto output = std::string{};
    output.reserve(input.size());

    for(size_t i=0; i<input.size(); ++i) {
        if(input[i] == '%') {
            if(i+2 >= input.size() || hexValue(input[i+1]) < 0 || hexValue(input[i+2]) < 0) {
                auto message = boost::format("Failed to percent-decode '%s': malformed escape sequence at offset %d")
                    % input % i;
                DEPOT_THROW_ERROR(message.str(), libdepot::LogLevel::INFO);
            }
            output.push_back(static_cast<char>(hexValue(input[i+1]) * 16 + hexValue(input[i+2])));
            i += 2;
        }
        else if(input[i] == '+') {
            output.push_back(' ');
        }
        else {
            output.push_back(input[i]);
        }
    }

    return output;
}

std::string percentEncode(const std::string& input) {
    static const char* hexDigits = "0123456789ABCDEF";
    auto output = std::string{};

    for(auto c : input) {
        auto byte = static_cast<unsigned char>(c);
        if(std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/' || c == ':') {
            output.push_back(c);
        }
        else {
            output.push_back('%');
            output.push_back(hexDigits[byte >> 4]);
            output.push_back(hexDigits[byte & 0x0F]);
        }
    }

    return output;
}

std::string base64Decode(const std::string& input) {
    namespace bai = boost::archive::iterators;
    typedef std::string::const_iterator iterator_type;

    // Convert base64 characters to 6 bit integers
    // and retrieve a sequence of 8 bit bytes from them
    typedef bai::transform_width<bai::binary_from_base64<iterator_type>, 8, 6> base64_dec;

    auto trimmed = boost::algorithm::trim_copy(input);
    if(trimmed.size() % 4 != 0) {
        auto message = boost::format("Failed to decode base64 string '%s': length is not a multiple of 4") % trimmed;
        DEPOT_THROW_ERROR(message.str(), libdepot::LogLevel::INFO);
    }

    auto paddingSize = trimmed.size() - boost::algorithm::trim_right_copy_if(trimmed, boost::is_any_of("=")).size();
    if(paddingSize > 2) {
        auto message = boost::format("Failed to decode base64 string '%s': invalid padding") % trimmed;
        DEPOT_THROW_ERROR(message.str(), libdepot::LogLevel::INFO);
    }

    // binary_from_base64 doesn't accept the '=' padding character: replace it with
    // the character encoding zero and drop the corresponding bytes at the end
    std::replace(trimmed.begin(), trimmed.end(), '=', 'A');

    auto output = std::string{};
    try {
        output = std::string(base64_dec(trimmed.begin()), base64_dec(trimmed.end()));
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to decode base64 string '%s'") % input;
        DEPOT_RETHROW_ERROR(e, message.str(), libdepot::LogLevel::INFO);
    }
    output.erase(output.size() - paddingSize, paddingSize);
    return output;
}

}}
