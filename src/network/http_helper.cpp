#include "network/http_helper.hpp"
#include <charconv>
#include <cstring>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, uint32_t headerLength)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);
    info.headerLength = headerLength;

    if (HttpResponse::withoutContent(info.response.code)) {
        info.encoding = Encoding::ContentLength;
        return info;
    }

    auto transferEncoding = info.response.header("Transfer-Encoding");
    auto contentLength = info.response.header("Content-Length");
    if (transferEncoding && transferEncoding->find("chunked") != string_view::npos) {
        info.encoding = Encoding::ChunkedEncoding;
    } else if (contentLength) {
        info.encoding = Encoding::ContentLength;
        auto result = from_chars(contentLength->data(), contentLength->data() + contentLength->size(), info.length);
        if (result.ec != errc() || result.ptr != contentLength->data() + contentLength->size())
            throw runtime_error("Invalid HttpResponse: Bad Content-Length!");
    } else {
        info.encoding = Encoding::UntilClose;
    }
    return info;
}
//---------------------------------------------------------------------------
optional<string> HttpHelper::decodeChunked(string_view body, bool collect)
// Walk the chunks
{
    static constexpr string_view strNewline = "\r\n";
    string content;
    while (true) {
        auto lineEnd = body.find(strNewline);
        if (lineEnd == body.npos)
            return nullopt;
        auto sizeField = body.substr(0, lineEnd);
        // strip chunk extensions
        if (auto ext = sizeField.find(';'); ext != sizeField.npos)
            sizeField = sizeField.substr(0, ext);
        uint64_t chunkSize = 0;
        auto result = from_chars(sizeField.data(), sizeField.data() + sizeField.size(), chunkSize, 16);
        if (result.ec != errc() || sizeField.empty())
            throw runtime_error("Invalid HttpResponse: Bad chunk size!");
        body = body.substr(lineEnd + strNewline.size());

        if (!chunkSize) {
            // trailers end with an empty line
            if (body.starts_with(strNewline) || body.find("\r\n\r\n") != body.npos)
                return content;
            return nullopt;
        }
        if (body.size() < chunkSize + strNewline.size())
            return nullopt;
        if (body.substr(chunkSize, strNewline.size()) != strNewline)
            throw runtime_error("Invalid HttpResponse: Chunk not terminated!");
        if (collect)
            content.append(body.substr(0, chunkSize));
        body = body.substr(chunkSize + strNewline.size());
    }
}
//---------------------------------------------------------------------------
string HttpHelper::retrieveContent(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Retrieve the content without http meta info
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info) {
        static_cast<void>(finished(data, length, info));
        if (!info)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");
    }
    auto body = sv.substr(info->headerLength);
    switch (info->encoding) {
        case Encoding::ContentLength:
            if (body.size() < info->length)
                throw runtime_error("Invalid HttpResponse: Incomplete content!");
            return string(body.substr(0, info->length));
        case Encoding::ChunkedEncoding: {
            auto content = decodeChunked(body, true);
            if (!content)
                throw runtime_error("Invalid HttpResponse: Incomplete chunked content!");
            return move(*content);
        }
        default:
            return string(body);
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Detect end / content
{
    static constexpr string_view headerEnd = "\r\n\r\n";
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info) {
        auto end = sv.find(headerEnd);
        if (end == sv.npos)
            return false;
        auto headerLength = static_cast<uint32_t>(end + headerEnd.size());
        info = make_unique<Info>(detect(sv.substr(0, headerLength), headerLength));
    }
    switch (info->encoding) {
        case Encoding::ContentLength:
            return length >= info->headerLength + info->length;
        case Encoding::ChunkedEncoding:
            return decodeChunked(sv.substr(info->headerLength), false).has_value();
        default:
            // ends when the peer closes the connection
            return false;
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace dumpsync
