#pragma once
#include "network/connection.hpp"
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include "network/tls_context.hpp"
#include <chrono>
#include <cstdint>
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
namespace dumpsync::network {
//---------------------------------------------------------------------------
/// The body of a request, either in memory or a segment of a local file
struct RequestBody {
    /// The in-memory data
    std::string data;
    /// The file, if the body is a file segment
    std::string filePath;
    /// The offset in the file
    uint64_t offset = 0;
    /// The length of the file segment
    uint64_t length = 0;

    /// No body
    [[nodiscard]] static RequestBody none() { return {}; }
    /// An in-memory body
    [[nodiscard]] static RequestBody memory(std::string data) {
        RequestBody body;
        body.data = std::move(data);
        return body;
    }
    /// A file segment body, streamed when sent
    [[nodiscard]] static RequestBody file(std::string filePath, uint64_t offset, uint64_t length) {
        RequestBody body;
        body.filePath = std::move(filePath);
        body.offset = offset;
        body.length = length;
        return body;
    }
    /// Is the body a file segment
    [[nodiscard]] bool isFile() const { return !filePath.empty(); }
    /// The number of bytes
    [[nodiscard]] uint64_t size() const { return isFile() ? length : data.size(); }
};
//---------------------------------------------------------------------------
/// The result of a http call
struct HttpResult {
    /// The response header
    HttpResponse response;
    /// The decoded content
    std::string content;
};
//---------------------------------------------------------------------------
/// Executes single http calls
class HttpClient {
    public:
    /// The destructor
    virtual ~HttpClient() = default;
    /// Execute a request, transport failures and timeouts throw TransportError
    [[nodiscard]] virtual HttpResult execute(const HttpRequest& request, const RequestBody& body) = 0;
};
//---------------------------------------------------------------------------
/// Executes http calls over a fresh blocking connection per call
class SocketHttpClient : public HttpClient {
    public:
    /// The settings
    struct Settings {
        /// The tcp settings
        Connection::TCPSettings tcpSettings;
        /// The deadline of a whole call
        std::chrono::seconds callTimeout{300};
        /// Verify the server certificates
        bool verifyPeer = true;
    };

    private:
    /// The settings
    Settings _settings;
    /// The tls context
    std::unique_ptr<TLSContext> _context;

    /// Stream a file segment to the connection
    void sendFile(Connection& connection, const RequestBody& body);

    public:
    /// The constructor
    explicit SocketHttpClient(Settings settings);
    /// Execute a request
    [[nodiscard]] HttpResult execute(const HttpRequest& request, const RequestBody& body) override;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::network
