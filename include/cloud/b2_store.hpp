#pragma once
#include "cloud/b2.hpp"
#include "cloud/remote_store.hpp"
#include "network/http_client.hpp"
#include "utils/backoff.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::cloud {
//---------------------------------------------------------------------------
// The B2 backed remote store.
// Every request is retried on transport errors, timeouts, rate limits and server errors
// with exponential backoff. An expired token triggers one re-authentication per call.
class B2Store : public RemoteStore {
    public:
    /// The upload settings
    struct Settings {
        /// Files up to this size are uploaded in one request
        uint64_t singleShotThreshold = 100ull << 20;
        /// The part size of large files
        uint64_t partSize = 100ull << 20;
        /// Check for an object with the same name before uploading
        bool skipExisting = true;
    };

    private:
    /// The request builder
    B2 _b2;
    /// The http client
    network::HttpClient& _client;
    /// The sleeper between retries
    utils::Sleeper& _sleeper;
    /// The backoff policy
    utils::BackoffPolicy _backoff;
    /// The settings
    Settings _settings;
    /// The session
    std::optional<AuthSession> _session;

    /// Get the session or throw NotAuthenticatedError
    [[nodiscard]] const AuthSession& session() const;
    /// Execute a call and throw B2::Error for non-2xx answers
    [[nodiscard]] network::HttpResult perform(const B2::Call& call);
    /// Run one attempt function with the retry policy, failures are raised as Error
    template <typename Error, typename Function>
    auto withRetry(const std::string& what, Function&& attempt);
    /// Upload with one request
    [[nodiscard]] RemoteObject uploadSingle(const std::string& localPath, uint64_t size, const std::string& remoteName);
    /// Upload in parts
    [[nodiscard]] RemoteObject uploadLarge(const std::string& localPath, uint64_t size, const std::string& remoteName);
    /// Cancel a large file, failures are only logged
    void cancelLargeFile(const std::string& fileId) noexcept;

    public:
    /// The constructor
    B2Store(B2::Settings b2Settings, network::HttpClient& client, utils::Sleeper& sleeper, utils::BackoffPolicy backoff, Settings settings);
    /// The constructor with default upload settings
    B2Store(B2::Settings b2Settings, network::HttpClient& client, utils::Sleeper& sleeper, utils::BackoffPolicy backoff) : B2Store(std::move(b2Settings), client, sleeper, std::move(backoff), Settings()) {}

    /// Authenticate and resolve the bucket
    void authenticate() override;
    /// Is a session present
    [[nodiscard]] bool isAuthenticated() const override { return _session.has_value(); }
    /// Use an existing session
    void setSession(AuthSession session);
    /// List all objects with the prefix
    [[nodiscard]] std::vector<RemoteObject> listObjects(const std::string& prefix = "") override;
    /// Find an object with exactly the name
    [[nodiscard]] std::optional<RemoteObject> findObject(const std::string& name) override;
    /// Upload a local file
    RemoteObject uploadObject(const std::string& localPath, const std::string& remoteName) override;
    /// Download an object
    void downloadObject(const std::string& remoteName, const std::string& localPath) override;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud
