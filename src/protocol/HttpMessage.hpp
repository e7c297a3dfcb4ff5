/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_protocol_HttpMessage_hpp
#define depot_protocol_HttpMessage_hpp

#include <string>
#include <map>
#include <vector>
#include <utility>
#include <cstddef>

#include <boost/optional.hpp>


namespace depot {
namespace protocol {

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Patch,
    Delete,
    Other
};

HttpMethod parseHttpMethod(const std::string& method);
std::string getHttpMethodString(HttpMethod method);

/**
 * A request as seen by the protocol handler, independent of the transport.
 * Header names are stored lowercase. The query string is decoded.
 */
class HttpRequest {
public:
    HttpRequest() = default;
    HttpRequest(HttpMethod method, const std::string& target, std::string body = "");

    HttpMethod getMethod() const { return method; }
    const std::string& getPath() const { return path; }
    const std::string& getBody() const { return body; }

    void setHeader(const std::string& name, const std::string& value);
    boost::optional<std::string> getHeader(const std::string& name) const;
    boost::optional<std::string> getQueryParameter(const std::string& name) const;

private:
    void parseTarget(const std::string& target);

private:
    HttpMethod method = HttpMethod::Get;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    unsigned status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    // Set for responses to HEAD requests, whose body is empty
    boost::optional<std::size_t> contentLength;

    void setHeader(const std::string& name, const std::string& value);
    boost::optional<std::string> getHeader(const std::string& name) const;
};

}
}

#endif
