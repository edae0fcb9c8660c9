#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync {
//---------------------------------------------------------------------------
namespace utils {
template <typename T>
class DataVector;
}
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// The remote endpoint of a request
struct Endpoint {
    /// The host name
    std::string host;
    /// The port
    uint32_t port = 443;
    /// Use tls
    bool tls = true;
};
//---------------------------------------------------------------------------
/// Implements an helper to serialize and deserialize http requests
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        PUT,
        POST,
        DELETE
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;
    /// The path - needs to be RFC 3986 conform
    std::string path = "/";
    /// The endpoint, not part of the serialized request
    Endpoint endpoint;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::PUT: return "PUT";
            case Method::POST: return "POST";
            case Method::DELETE: return "DELETE";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }
    /// Build a request for an absolute http(s) url, sets the endpoint, path and Host header
    [[nodiscard]] static HttpRequest fromUrl(Method method, std::string_view url);
    /// Serialize the request
    [[nodiscard]] static std::unique_ptr<utils::DataVector<uint8_t>> serialize(const HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace dumpsync
