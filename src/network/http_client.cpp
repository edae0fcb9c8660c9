#include "network/http_client.hpp"
#include "network/http_helper.hpp"
#include "utils/data_vector.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
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
using namespace std;
//---------------------------------------------------------------------------
/// The size of a single send or receive
static constexpr uint64_t transferSize = 64ull << 10;
//---------------------------------------------------------------------------
SocketHttpClient::SocketHttpClient(Settings settings) : _settings(move(settings)), _context(make_unique<TLSContext>(_settings.verifyPeer))
// The constructor
{}
//---------------------------------------------------------------------------
void SocketHttpClient::sendFile(Connection& connection, const RequestBody& body)
// Stream the file segment in pieces
{
    ifstream file(body.filePath, ios::binary);
    if (!file.is_open())
        throw IOError("Cannot open " + body.filePath + " for upload!");
    file.seekg(static_cast<streamoff>(body.offset));
    if (!file)
        throw IOError("Cannot seek in " + body.filePath + "!");

    auto buffer = make_unique<char[]>(transferSize);
    auto remaining = body.length;
    while (remaining) {
        auto request = min(remaining, transferSize);
        file.read(buffer.get(), static_cast<streamsize>(request));
        if (static_cast<uint64_t>(file.gcount()) != request)
            throw IOError("Unexpected end of file while uploading " + body.filePath + "!");
        connection.send(reinterpret_cast<const uint8_t*>(buffer.get()), request);
        remaining -= request;
    }
}
//---------------------------------------------------------------------------
HttpResult SocketHttpClient::execute(const HttpRequest& request, const RequestBody& body)
// Send the request and read the complete response
{
    auto deadline = Connection::Clock::now() + _settings.callTimeout;
    Connection connection(request.endpoint, _settings.tcpSettings, request.endpoint.tls ? _context.get() : nullptr, deadline);

    // One call per connection
    auto message = request;
    message.headers["Connection"] = "close";
    if (body.size() || message.method == HttpRequest::Method::POST || message.method == HttpRequest::Method::PUT)
        message.headers["Content-Length"] = to_string(body.size());
    auto header = HttpRequest::serialize(message);

    spdlog::trace("{} {}{}", HttpRequest::getRequestMethod(message.method), message.endpoint.host, message.path);
    connection.send(header->cdata(), header->size());
    if (body.isFile())
        sendFile(connection, body);
    else if (!body.data.empty())
        connection.send(reinterpret_cast<const uint8_t*>(body.data.data()), body.data.size());

    utils::DataVector<uint8_t> buffer;
    unique_ptr<HttpHelper::Info> info;
    while (true) {
        if (buffer.capacity() < buffer.size() + transferSize)
            buffer.reserve(max(buffer.size() + transferSize, buffer.capacity() << 1));
        auto received = connection.receive(buffer.data() + buffer.size(), transferSize);
        if (!received) {
            if (!info)
                static_cast<void>(HttpHelper::finished(buffer.cdata(), buffer.size(), info));
            if (!info)
                throw TransportError("Connection to " + message.endpoint.host + " closed before the response header!");
            if (info->encoding != HttpHelper::Encoding::UntilClose)
                throw TransportError("Connection to " + message.endpoint.host + " closed before the response ended!");
            break;
        }
        buffer.resize(buffer.size() + received);
        if (HttpHelper::finished(buffer.cdata(), buffer.size(), info))
            break;
    }

    HttpResult result;
    result.content = HttpHelper::retrieveContent(buffer.cdata(), buffer.size(), info);
    result.response = move(info->response);
    return result;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::network
