#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include <charconv>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HttpRequest HttpRequest::fromUrl(Method method, string_view url)
// Split an absolute url into endpoint and path
{
    static constexpr string_view strHttp = "http://";
    static constexpr string_view strHttps = "https://";

    HttpRequest request;
    request.method = method;
    request.type = Type::HTTP_1_1;
    if (url.starts_with(strHttps)) {
        request.endpoint.tls = true;
        request.endpoint.port = 443;
        url = url.substr(strHttps.size());
    } else if (url.starts_with(strHttp)) {
        request.endpoint.tls = false;
        request.endpoint.port = 80;
        url = url.substr(strHttp.size());
    } else {
        throw runtime_error("Invalid url: Needs to start with http:// or https://!");
    }

    auto pathPos = url.find('/');
    auto authority = url.substr(0, pathPos);
    request.path = pathPos == url.npos ? "/" : string(url.substr(pathPos));
    if (authority.empty())
        throw runtime_error("Invalid url: Missing host!");

    if (auto colonPos = authority.find(':'); colonPos != authority.npos) {
        request.endpoint.host = authority.substr(0, colonPos);
        auto portString = authority.substr(colonPos + 1);
        uint32_t port = 0;
        auto result = from_chars(portString.data(), portString.data() + portString.size(), port);
        if (result.ec != errc() || result.ptr != portString.data() + portString.size() || !port || port > 65535)
            throw runtime_error("Invalid url: Bad port " + string(portString) + "!");
        request.endpoint.port = port;
    } else {
        request.endpoint.host = authority;
    }
    request.headers.emplace("Host", string(authority));
    return request;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path + " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace dumpsync
