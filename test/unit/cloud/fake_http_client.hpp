#pragma once
#include "network/http_client.hpp"
#include "utils/backoff.hpp"
#include "utils/errors.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::cloud::test {
//---------------------------------------------------------------------------
/// A scripted answer
struct Reply {
    /// The result, unset raises a transport error
    std::optional<network::HttpResult> result;

    /// A json answer
    static Reply json(uint16_t code, std::string content, std::map<std::string, std::string> headers = {}) {
        network::HttpResult result;
        result.response.code = code;
        result.response.reason = code < 300 ? "OK" : "Error";
        result.response.headers = std::move(headers);
        result.content = std::move(content);
        return {std::move(result)};
    }
    /// A b2 error answer
    static Reply error(uint16_t code, const std::string& b2Code, std::map<std::string, std::string> headers = {}) {
        return json(code, "{\"status\":" + std::to_string(code) + ",\"code\":\"" + b2Code + "\",\"message\":\"scripted\"}", std::move(headers));
    }
    /// A broken connection
    static Reply transportError() { return {std::nullopt}; }
};
//---------------------------------------------------------------------------
/// A recorded call
struct RecordedCall {
    /// The operation
    std::string operation;
    /// The request
    network::HttpRequest request;
    /// The body
    network::RequestBody body;

    /// A request header
    [[nodiscard]] std::string header(const std::string& name) const {
        auto it = request.headers.find(name);
        return it == request.headers.end() ? "" : it->second;
    }
};
//---------------------------------------------------------------------------
/// Answers with scripted replies per operation
class FakeHttpClient : public network::HttpClient {
    /// The scripted replies
    std::map<std::string, std::deque<Reply>> _replies;

    public:
    /// The recorded calls
    std::vector<RecordedCall> calls;

    /// The operation of a request, the last path segment of api calls
    static std::string operation(const network::HttpRequest& request) {
        if (request.path.starts_with("/file/"))
            return "download";
        return request.path.substr(request.path.rfind('/') + 1);
    }
    /// Queue a reply for an operation
    FakeHttpClient& script(const std::string& operation, Reply reply) {
        _replies[operation].push_back(std::move(reply));
        return *this;
    }
    /// Queue the same reply several times
    FakeHttpClient& script(const std::string& operation, const Reply& reply, unsigned count) {
        for (unsigned i = 0; i < count; i++)
            script(operation, reply);
        return *this;
    }
    /// The number of calls of an operation
    [[nodiscard]] unsigned count(const std::string& operation) const {
        unsigned result = 0;
        for (auto& call : calls)
            result += call.operation == operation;
        return result;
    }
    /// The calls of an operation
    [[nodiscard]] std::vector<RecordedCall> callsOf(const std::string& operation) const {
        std::vector<RecordedCall> result;
        for (auto& call : calls)
            if (call.operation == operation)
                result.push_back(call);
        return result;
    }
    /// Are all replies consumed
    [[nodiscard]] bool exhausted() const {
        for (auto& replies : _replies)
            if (!replies.second.empty())
                return false;
        return true;
    }

    /// Answer the next scripted reply
    [[nodiscard]] network::HttpResult execute(const network::HttpRequest& request, const network::RequestBody& body) override {
        auto name = operation(request);
        calls.push_back({name, request, body});
        auto& queue = _replies[name];
        if (queue.empty())
            throw std::logic_error("Unexpected request " + name);
        auto reply = std::move(queue.front());
        queue.pop_front();
        if (!reply.result)
            throw TransportError("Connection reset by peer");
        return std::move(*reply.result);
    }
};
//---------------------------------------------------------------------------
/// Records the delays instead of sleeping
class RecordingSleeper : public utils::Sleeper {
    public:
    /// The delays
    std::vector<std::chrono::milliseconds> delays;

    /// Record the delay
    void sleep(std::chrono::milliseconds duration) override { delays.push_back(duration); }
};
//---------------------------------------------------------------------------
/// An authorization answer restricted to the bucket
inline Reply authorization(const std::string& token, bool restricted = true) {
    std::string content = "{\"accountId\":\"account\",\"authorizationToken\":\"" + token + "\",\"apiUrl\":\"https://api001.backblazeb2.com\",\"downloadUrl\":\"https://f001.backblazeb2.com\",\"recommendedPartSize\":100000000";
    if (restricted)
        content += ",\"allowed\":{\"bucketId\":\"bucket-id\",\"bucketName\":\"bucket\",\"capabilities\":[\"listFiles\",\"writeFiles\"]}";
    content += "}";
    return Reply::json(200, content);
}
//---------------------------------------------------------------------------
/// A file info answer
inline Reply fileInfo(const std::string& name, uint64_t length, const std::string& sha1) {
    return Reply::json(200, "{\"fileId\":\"id-" + name + "\",\"fileName\":\"" + name + "\",\"contentLength\":" + std::to_string(length) + ",\"contentSha1\":\"" + sha1 + "\",\"uploadTimestamp\":1700000000000}");
}
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud::test
