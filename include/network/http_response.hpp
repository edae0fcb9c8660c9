#pragma once
#include <cstdint>
#include <map>
#include <optional>
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
namespace dumpsync::network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Status codes with special handling
    enum Code : uint16_t {
        OK_200 = 200,
        NO_CONTENT_204 = 204,
        NOT_MODIFIED_304 = 304,
        BAD_REQUEST_400 = 400,
        UNAUTHORIZED_401 = 401,
        FORBIDDEN_403 = 403,
        NOT_FOUND_404 = 404,
        REQUEST_TIMEOUT_408 = 408,
        TOO_MANY_REQUESTS_429 = 429,
        INTERNAL_SERVER_ERROR_500 = 500,
        SERVICE_UNAVAILABLE_503 = 503
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The status code
    uint16_t code = 0;
    /// The reason phrase
    std::string reason;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr bool checkSuccess(uint16_t code) {
        return code >= 200 && code < 300;
    }
    /// Check if the result has no content
    static constexpr bool withoutContent(uint16_t code) {
        return code == NO_CONTENT_204 || code == NOT_MODIFIED_304 || (code >= 100 && code < 200);
    }
    /// Find a header, the name is compared case-insensitive
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
    /// Deserialize the response
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::network
