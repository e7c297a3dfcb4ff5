/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "protocol/HttpMessage.hpp"

#include <boost/algorithm/string.hpp>

#include "libdepot/Error.hpp"
#include "libdepot/utility/string.hpp"


namespace depot {
namespace protocol {

namespace {

std::string decodeTargetComponent(const std::string& encoded) {
    try {
        return libdepot::string::percentDecode(encoded);
    }
    catch(const libdepot::Error&) {
        // malformed escape sequences are kept verbatim
        return encoded;
    }
}

}

HttpMethod parseHttpMethod(const std::string& method) {
    if(method == "GET") {
        return HttpMethod::Get;
    }
    if(method == "HEAD") {
        return HttpMethod::Head;
    }
    if(method == "POST") {
        return HttpMethod::Post;
    }
    if(method == "PUT") {
        return HttpMethod::Put;
    }
    if(method == "PATCH") {
        return HttpMethod::Patch;
    }
    if(method == "DELETE") {
        return HttpMethod::Delete;
    }
    return HttpMethod::Other;
}

std::string getHttpMethodString(HttpMethod method) {
    switch(method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Head:   return "HEAD";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
        case HttpMethod::Other:  return "OTHER";
    }
    return "OTHER";
}

HttpRequest::HttpRequest(HttpMethod method, const std::string& target, std::string body)
    : method{method}
    , body{std::move(body)}
{
    parseTarget(target);
}

void HttpRequest::setHeader(const std::string& name, const std::string& value) {
    headers[boost::algorithm::to_lower_copy(name)] = value;
}

boost::optional<std::string> HttpRequest::getHeader(const std::string& name) const {
    auto it = headers.find(boost::algorithm::to_lower_copy(name));
    if(it == headers.cend()) {
        return boost::none;
    }
    return it->second;
}

boost::optional<std::string> HttpRequest::getQueryParameter(const std::string& name) const {
    auto it = query.find(name);
    if(it == query.cend()) {
        return boost::none;
    }
    return it->second;
}

void HttpRequest::parseTarget(const std::string& target) {
    auto separator = target.find('?');
    path = decodeTargetComponent(target.substr(0, separator));
    query.clear();
    if(separator == std::string::npos) {
        return;
    }

    auto parameters = std::vector<std::string>{};
    auto queryString = target.substr(separator + 1);
    boost::algorithm::split(parameters, queryString, boost::algorithm::is_any_of("&"));
    for(const auto& parameter : parameters) {
        if(parameter.empty()) {
            continue;
        }
        auto equal = parameter.find('=');
        auto key = decodeTargetComponent(parameter.substr(0, equal));
        auto value = equal == std::string::npos ? std::string{} : decodeTargetComponent(parameter.substr(equal + 1));
        // the first occurrence wins
        query.emplace(key, value);
    }
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    for(auto& header : headers) {
        if(boost::algorithm::iequals(header.first, name)) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

boost::optional<std::string> HttpResponse::getHeader(const std::string& name) const {
    for(const auto& header : headers) {
        if(boost::algorithm::iequals(header.first, name)) {
            return header.second;
        }
    }
    return boost::none;
}

}
}
