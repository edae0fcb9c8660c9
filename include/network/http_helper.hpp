#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
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
namespace dumpsync {
namespace network {
//---------------------------------------------------------------------------
/// Implements an helper to resolve http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        ContentLength,
        ChunkedEncoding,
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The content length, only for ContentLength encoding
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::UntilClose;
    };

    private:
    /// Detect the protocol from a complete header
    [[nodiscard]] static Info detect(std::string_view header, uint32_t headerLength);
    /// Walk a chunked body, returns the decoded content once the final chunk arrived
    [[nodiscard]] static std::optional<std::string> decodeChunked(std::string_view body, bool collect);

    public:
    /// Retrieve the content without http meta info, requires a finished response or a closed connection
    [[nodiscard]] static std::string retrieveContent(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
    /// Detect end of the response, parses the header once it is complete
    [[nodiscard]] static bool finished(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace dumpsync
